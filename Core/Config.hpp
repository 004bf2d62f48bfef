#pragma once

// Config.hpp — необязательный JSON-конфиг утилиты (Boost.JSON).
// Путь к head-файлу resolvconf здесь НЕ настраивается — только через
// RESOLVCONF_HEAD_PATH (см. ResolvHead::GetPath).

#include "Core/Logger.hpp"
#include "Core/Process.hpp"

#include <string>
#include <vector>

#include <boost/json.hpp>

namespace Config
{
    constexpr const char *PATH_ENV_VAR = "CFG_ADGUARD_DNS_CONFIG";
    constexpr const char *DEFAULT_PATH = "/etc/cfg-adguard-dns/config.json";

    struct Settings
    {
        Logger::Options log{};

        Process::Command reload { "resolvconf", { "-u" } };
        Process::Command lookup { "nslookup",   { "wikipedia.org" } };

        bool flush_resolved_cache = true;
    };

    // Все Require* бросают std::runtime_error с именем ключа.
    std::string              RequireString(const boost::json::object &o, const char *key);
    bool                     RequireBool(const boost::json::object &o, const char *key);
    std::vector<std::string> RequireStringArray(const boost::json::object &o, const char *key);

    std::string GetPath();

    // Отсутствующие ключи — значения по умолчанию; неверный тип — исключение.
    Settings Parse(const std::string &json);

    // Нет файла — Settings{}; не читается/битый JSON — исключение.
    Settings Load(const std::string &path);
}
