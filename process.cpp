#include "process.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

static std::vector<char*> to_argv(const std::vector<std::string>& args)
{
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const std::string& arg : args)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

bool run_capture(const std::vector<std::string>& args, process_output& out)
{
    out.stdout_text.clear();
    out.exit_code = -1;
    if (args.empty())
    {
        return false;
    }

    std::vector<char*> argv = to_argv(args);

    int pipefd[2];
    if (pipe(pipefd) == -1)
    {
        spdlog::error("process: pipe() failed for '{}': {}", args[0], std::strerror(errno));
        return false;
    }

    pid_t pid = fork();
    if (pid == -1)
    {
        spdlog::error("process: fork() failed for '{}': {}", args[0], std::strerror(errno));
        close(pipefd[0]);
        close(pipefd[1]);
        return false;
    }

    if (pid == 0)
    {
        close(pipefd[0]);
        dup2(pipefd[1], STDOUT_FILENO);
        close(pipefd[1]);
        int dev_null = open("/dev/null", O_RDWR);
        if (dev_null >= 0)
        {
            dup2(dev_null, STDIN_FILENO);
            dup2(dev_null, STDERR_FILENO);
            close(dev_null);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    close(pipefd[1]);
    char buffer[512];
    for (;;)
    {
        ssize_t count = read(pipefd[0], buffer, sizeof(buffer));
        if (count > 0)
        {
            out.stdout_text.append(buffer, static_cast<size_t>(count));
            continue;
        }
        if (count < 0 && errno == EINTR)
        {
            continue;
        }
        break;
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1)
    {
        if (errno != EINTR)
        {
            return false;
        }
    }

    if (WIFEXITED(status))
    {
        out.exit_code = WEXITSTATUS(status);
    }
    return true;
}

ChildProcess::~ChildProcess()
{
    stop(500);
}

bool ChildProcess::start(const std::vector<std::string>& args)
{
    if (args.empty() || _pid > 0)
    {
        return false;
    }

    std::vector<char*> argv = to_argv(args);

    pid_t pid = fork();
    if (pid == -1)
    {
        spdlog::error("process: fork() failed for '{}': {}", args[0], std::strerror(errno));
        return false;
    }

    if (pid == 0)
    {
        if (setsid() < 0)
        {
            _exit(EXIT_FAILURE);
        }
        int dev_null = open("/dev/null", O_RDWR);
        if (dev_null >= 0)
        {
            dup2(dev_null, STDIN_FILENO);
            dup2(dev_null, STDOUT_FILENO);
            dup2(dev_null, STDERR_FILENO);
            close(dev_null);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    _pid = pid;
    spdlog::info("process: started '{}' as pid {}", args[0], _pid);
    return true;
}

bool ChildProcess::is_running()
{
    if (_pid <= 0)
    {
        return false;
    }

    int status = 0;
    pid_t result = waitpid(_pid, &status, WNOHANG);
    if (result == 0)
    {
        return true;
    }

    spdlog::warn("process: pid {} has exited", _pid);
    _pid = -1;
    return false;
}

void ChildProcess::stop(int grace_ms)
{
    if (_pid <= 0)
    {
        return;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (waitpid(_pid, nullptr, WNOHANG) == _pid)
        {
            _pid = -1;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    spdlog::info("process: terminating pid {}", _pid);
    kill(_pid, SIGTERM);
    waitpid(_pid, nullptr, 0);
    _pid = -1;
}

pid_t ChildProcess::pid() const
{
    return _pid;
}
