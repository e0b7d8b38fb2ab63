#pragma once
///@file

#include "baseimg/libutil/types.hh"
#include "baseimg/libutil/error.hh"
#include "baseimg/libutil/file-descriptor.hh"

#include <sys/types.h>
#include <unistd.h>
#include <signal.h>

#include <functional>
#include <optional>

namespace baseimg {

class Pid
{
    pid_t pid = -1;
    int killSignal = SIGKILL;
public:
    Pid();
    explicit Pid(pid_t pid): pid(pid) {}
    Pid(Pid && other);
    Pid & operator=(Pid && other);
    ~Pid() noexcept(false);
    explicit operator bool() const { return pid != -1; }
    int kill();
    int wait();

    void setKillSignal(int signal);
    pid_t release();
    pid_t get() const { return pid; }
};


/**
 * Fork a process that runs the given function, and return the child
 * pid to the caller.
 */
struct ProcessOptions
{
    bool dieWithParent = true;
    /**
     * use clone() with the specified flags
     */
    int cloneFlags = 0;
};

[[nodiscard]]
Pid startProcess(std::function<void()> fun, const ProcessOptions & options = ProcessOptions());


struct RunOptions
{
    Path program;
    bool searchPath = true;
    std::optional<std::string> argv0;
    Strings args = {};
    std::optional<Path> chdir = {};
    /**
     * Replaces the whole environment of the program when set.
     */
    std::optional<StringMap> environment = {};
    bool dieWithParent = true;
    bool captureStdout = false;
};

struct [[nodiscard("you must call RunningProgram::wait()")]] RunningProgram
{
    friend RunningProgram runProgram2(const RunOptions & options);

private:
    Path program;
    Pid pid;
    AutoCloseFD childStdout;

    RunningProgram(PathView program, Pid pid, AutoCloseFD childStdout);

public:
    RunningProgram() = default;
    RunningProgram(RunningProgram &&) = default;
    RunningProgram & operator=(RunningProgram &&) = default;

    explicit operator bool() const { return bool(pid); }

    int kill();
    [[nodiscard]]
    int wait();
    void waitAndCheck();

    std::optional<int> getStdoutFD() const
    {
        return childStdout ? std::optional(childStdout.get()) : std::nullopt;
    }
};

/**
 * Start a program. Its stderr is always inherited; its stdout is
 * inherited too unless `captureStdout` is set.
 */
RunningProgram runProgram2(const RunOptions & options);

/**
 * Run a program to completion.
 *
 * @return the wait status and everything the program wrote to stdout.
 */
std::pair<int, std::string> runProgram(RunOptions options);

/**
 * Run a program and return its stdout in a string (i.e., like the
 * shell backtick operator). Throws `ExecError` if it does not exit
 * successfully.
 */
std::string runProgram(Path program, bool searchPath = false, const Strings & args = Strings());

class ExecError : public Error
{
public:
    int status;

    template<typename... Args>
    ExecError(int status, const Args & ... args)
        : Error(args...), status(status)
    { }
};

/**
 * Convert the exit status of a child as returned by wait() into an
 * error string.
 */
std::string statusToString(int status);

bool statusOk(int status);

}
