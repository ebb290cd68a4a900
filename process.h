#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

struct process_output
{
    std::string stdout_text;
    int exit_code = -1;
};

// Runs argv to completion and captures its stdout. False when it could not be started.
bool run_capture(const std::vector<std::string>& args, process_output& out);

// Detached child with stdio on /dev/null; stopped and reaped on destruction.
class ChildProcess
{
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool start(const std::vector<std::string>& args);
    bool is_running();
    void stop(int grace_ms);
    pid_t pid() const;

private:
    pid_t _pid = -1;
};
