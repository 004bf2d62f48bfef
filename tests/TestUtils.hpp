#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <string>

#include <unistd.h>

namespace TestUtils
{
    // Выставляет/снимает переменную окружения и восстанавливает её в деструкторе
    class ScopedEnv
    {
    public:
        explicit ScopedEnv(std::string name)
                : name_(std::move(name))
        {
            if (const char *v = std::getenv(name_.c_str()))
                saved_ = v;
        }

        ~ScopedEnv()
        {
            if (saved_)
                ::setenv(name_.c_str(), saved_->c_str(), 1);
            else
                ::unsetenv(name_.c_str());
        }

        ScopedEnv(const ScopedEnv&)            = delete;
        ScopedEnv& operator=(const ScopedEnv&) = delete;

        void Set(const std::string &value) { ::setenv(name_.c_str(), value.c_str(), 1); }
        void Unset()                       { ::unsetenv(name_.c_str()); }

    private:
        std::string                name_;
        std::optional<std::string> saved_;
    };

    class TempDir
    {
    public:
        TempDir()
        {
            std::string tmpl = (std::filesystem::temp_directory_path() / "cfg-adguard-dns-XXXXXX").string();
            if (::mkdtemp(tmpl.data()) == nullptr)
                throw std::runtime_error("mkdtemp failed");
            path_ = tmpl;
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir&)            = delete;
        TempDir& operator=(const TempDir&) = delete;

        std::filesystem::path File(const std::string &name) const { return path_ / name; }

    private:
        std::filesystem::path path_;
    };

    inline std::string ReadFile(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }

    inline void WriteFile(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }
}
