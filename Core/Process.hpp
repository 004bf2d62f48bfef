#pragma once

// Process.hpp — синхронный запуск внешней утилиты (fork + execvp).
// stdout забирается целиком как сырые байты, stderr уходит в /dev/null,
// stdin — /dev/null. Таймаутов нет: вызов ждёт завершения дочернего процесса.

#include <stdexcept>
#include <string>
#include <vector>

namespace Process
{
    struct Command
    {
        std::string              program;  // ищется по PATH
        std::vector<std::string> args;     // без argv[0]
    };

    struct Result
    {
        int         exit_code = 0;         // 128 + signo, если убит сигналом
        std::string out;                   // stdout как есть, без декодирования
    };

    // Не удалось запустить программу (нет в PATH, нет прав, сбой pipe/fork).
    class SpawnError : public std::runtime_error
    {
    public:
        SpawnError(const std::string &program, int err);

        const std::string &Program() const noexcept { return program_; }
        int                Errno()   const noexcept { return errno_; }

    private:
        std::string program_;
        int         errno_;
    };

    // Ненулевой код возврата ошибкой не считается — решает вызывающий.
    Result Run(const Command &command);

    // "resolvconf -u" — для логов
    std::string ToString(const Command &command);
}
