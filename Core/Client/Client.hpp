#pragma once

// Client.hpp — разбор аргументов и выполнение одной команды cfg-adguard-dns.

#include "Core/Config.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace Client
{
    enum class Verb
    {
        Help,
        Activate,
        Deactivate,
        Status,
        Unknown
    };

    // args — argv целиком, args[0] — имя программы. Смотрим только args[1].
    Verb ParseVerb(const std::vector<std::string> &args);

    const std::string &HelpText();

    // 0 — в том числе для неизвестного аргумента; 1 — фатальная ошибка
    // (head-файл не создаётся, внешняя утилита не запускается, сбой записи).
    int Run(const std::vector<std::string> &args,
            const Config::Settings     &settings,
            std::ostream               &out,
            std::ostream               &err);
}
