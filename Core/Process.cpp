#include "Core/Process.hpp"
#include "Core/Logger.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace
{
    // Локальный RAII для пары дескрипторов pipe
    struct Pipe
    {
        int rd = -1;
        int wr = -1;

        Pipe()
        {
            int fds[2];
            if (::pipe2(fds, O_CLOEXEC) < 0)
                throw std::runtime_error(std::string("pipe2: ") + std::strerror(errno));
            rd = fds[0];
            wr = fds[1];
        }
        ~Pipe()
        {
            CloseRead();
            CloseWrite();
        }
        Pipe(const Pipe&)            = delete;
        Pipe& operator=(const Pipe&) = delete;

        void CloseRead()  { if (rd >= 0) { ::close(rd); rd = -1; } }
        void CloseWrite() { if (wr >= 0) { ::close(wr); wr = -1; } }
    };

    ssize_t ReadRetry(int fd, void *buf, std::size_t len)
    {
        for (;;)
        {
            ssize_t n = ::read(fd, buf, len);
            if (n < 0 && errno == EINTR) continue;
            return n;
        }
    }

    int WaitChild(pid_t pid)
    {
        int status = 0;
        for (;;)
        {
            if (::waitpid(pid, &status, 0) >= 0) break;
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("waitpid: ") + std::strerror(errno));
        }
        if (WIFEXITED(status))   return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return -1;
    }

    // Только async-signal-safe вызовы: мы между fork и exec.
    [[noreturn]] void ExecChild(const std::vector<char*> &argv, int out_fd, int err_report_fd)
    {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0)
        {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::dup2(out_fd, STDOUT_FILENO);

        ::execvp(argv[0], argv.data());

        // сюда попадаем только при неудаче exec — отдаём errno родителю
        const int err = errno;
        ssize_t ignored = ::write(err_report_fd, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }
}

Process::SpawnError::SpawnError(const std::string &program, int err)
        : std::runtime_error("failed to execute " + program + ": " + std::strerror(err))
        , program_(program)
        , errno_(err)
{
}

std::string Process::ToString(const Command &command)
{
    std::string s = command.program;
    for (const auto &a : command.args)
    {
        s += ' ';
        s += a;
    }
    return s;
}

Process::Result Process::Run(const Command &command)
{
    if (command.program.empty())
        throw SpawnError("<empty>", EINVAL);

    std::vector<char*> argv;
    argv.reserve(command.args.size() + 2);
    argv.push_back(const_cast<char*>(command.program.c_str()));
    for (const auto &a : command.args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    LOGD("process") << "Spawn: " << ToString(command);

    Pipe out;
    Pipe report;   // CLOEXEC: закрывается сам при успешном exec

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        const int err = errno;
        LOGE("process") << "fork failed: " << std::strerror(err);
        throw SpawnError(command.program, err);
    }
    if (pid == 0)
        ExecChild(argv, out.wr, report.wr);

    out.CloseWrite();
    report.CloseWrite();

    int exec_errno = 0;
    const ssize_t n = ReadRetry(report.rd, &exec_errno, sizeof(exec_errno));
    if (n == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        (void)WaitChild(pid);
        LOGE("process") << "exec failed: " << command.program << ": " << std::strerror(exec_errno);
        throw SpawnError(command.program, exec_errno);
    }

    Result result;
    std::array<char, 4096> buf{};
    for (;;)
    {
        const ssize_t rd = ReadRetry(out.rd, buf.data(), buf.size());
        if (rd == 0) break;
        if (rd < 0)
        {
            const int err = errno;
            (void)WaitChild(pid);
            throw std::runtime_error("read stdout of " + command.program + ": " + std::strerror(err));
        }
        result.out.append(buf.data(), static_cast<std::size_t>(rd));
    }

    result.exit_code = WaitChild(pid);
    if (result.exit_code != 0)
    {
        LOGW("process") << ToString(command) << " exited with code " << result.exit_code;
    }
    else
    {
        LOGT("process") << ToString(command) << " ok, stdout=" << result.out.size() << " bytes";
    }
    return result;
}
