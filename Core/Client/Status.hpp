#pragma once

// Status.hpp — определение, включён ли AdGuard DNS.
// Файл head НЕ читается: резолвим контрольный домен системным резолвером
// (nslookup) и ищем в выводе адреса AdGuard.

#include "Core/Process.hpp"

#include <string>

namespace Status
{
    enum class State
    {
        Activated,
        Deactivated,
        Undecodable     // вывод утилиты не является корректным UTF-8
    };

    bool IsValidUtf8(const std::string &bytes);

    State Classify(const std::string &lookup_output);

    // Process::SpawnError, если утилиту не удалось запустить
    State Query(const Process::Command &lookup);

    // Строка для пользователя; для Undecodable — сообщение об ошибке (stderr)
    std::string Describe(State state);
}
