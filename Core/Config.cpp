#include "Core/Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace
{
    const boost::json::value &RequireKey(const boost::json::object &o, const char *key)
    {
        const boost::json::value *v = o.if_contains(key);
        if (!v)
            throw std::runtime_error(std::string("missing required field '") + key + "'");
        return *v;
    }

    Logger::Severity RequireSeverity(const boost::json::object &o, const char *key)
    {
        const std::string name = Config::RequireString(o, key);
        Logger::Severity sev{};
        if (!Logger::ParseSeverity(name, sev))
            throw std::runtime_error(std::string("'") + key + "' must be one of "
                                     "trace|debug|info|warning|error|fatal, got '" + name + "'");
        return sev;
    }

    Process::Command RequireCommand(const boost::json::object &o, const char *key)
    {
        std::vector<std::string> argv = Config::RequireStringArray(o, key);
        if (argv.empty() || argv.front().empty())
            throw std::runtime_error(std::string("'") + key + "' must start with a program name");

        Process::Command c;
        c.program = argv.front();
        c.args.assign(argv.begin() + 1, argv.end());
        return c;
    }
}

std::string Config::RequireString(const boost::json::object &o, const char *key)
{
    const boost::json::value &v = RequireKey(o, key);
    if (!v.is_string())
        throw std::runtime_error(std::string("'") + key + "' must be a string");
    return boost::json::value_to<std::string>(v);
}

bool Config::RequireBool(const boost::json::object &o, const char *key)
{
    const boost::json::value &v = RequireKey(o, key);
    if (!v.is_bool())
        throw std::runtime_error(std::string("'") + key + "' must be a boolean");
    return v.as_bool();
}

std::vector<std::string> Config::RequireStringArray(const boost::json::object &o, const char *key)
{
    const boost::json::value &v = RequireKey(o, key);
    if (!v.is_array())
        throw std::runtime_error(std::string("'") + key + "' must be an array of strings");

    std::vector<std::string> out;
    for (const boost::json::value &x : v.as_array())
    {
        if (!x.is_string())
            throw std::runtime_error(std::string("'") + key + "' array must contain strings");
        out.emplace_back(boost::json::value_to<std::string>(x));
    }
    return out;
}

std::string Config::GetPath()
{
    if (const char *value = std::getenv(PATH_ENV_VAR))
        return value;
    return DEFAULT_PATH;
}

Config::Settings Config::Parse(const std::string &json)
{
    boost::json::value jv = boost::json::parse(json);
    if (!jv.is_object())
        throw std::runtime_error("config root must be an object");

    const boost::json::object &o = jv.as_object();
    Settings s;

    if (o.if_contains("log_directory"))
    {
        s.log.directory = RequireString(o, "log_directory");
        LOGD("config") << "log_directory=" << s.log.directory;
    }
    if (o.if_contains("console_log_level"))
        s.log.console_min_severity = RequireSeverity(o, "console_log_level");
    if (o.if_contains("file_log_level"))
        s.log.file_min_severity = RequireSeverity(o, "file_log_level");

    if (o.if_contains("reload_command"))
    {
        s.reload = RequireCommand(o, "reload_command");
        LOGD("config") << "reload_command=" << Process::ToString(s.reload);
    }
    if (o.if_contains("lookup_command"))
    {
        s.lookup = RequireCommand(o, "lookup_command");
        LOGD("config") << "lookup_command=" << Process::ToString(s.lookup);
    }

    if (o.if_contains("flush_resolved_cache"))
        s.flush_resolved_cache = RequireBool(o, "flush_resolved_cache");

    return s;
}

Config::Settings Config::Load(const std::string &path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        LOGD("config") << "No config at " << path << ", using defaults";
        return Settings{};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot read config " + path);

    std::ostringstream buf;
    buf << in.rdbuf();

    LOGD("config") << "Parsing JSON config " << path;
    try
    {
        return Parse(buf.str());
    }
    catch (const std::exception &e)
    {
        throw std::runtime_error("config " + path + ": " + e.what());
    }
}
