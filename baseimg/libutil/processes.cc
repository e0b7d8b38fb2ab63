#include "baseimg/libutil/current-process.hh"
#include "baseimg/libutil/environment-variables.hh"
#include "baseimg/libutil/finally.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/processes.hh"
#include "baseimg/libutil/strings.hh"
#include "baseimg/libutil/signals.hh"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>

#include <sched.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace baseimg {

Pid::Pid()
{
}


Pid::Pid(Pid && other) : pid(other.pid), killSignal(other.killSignal)
{
    other.pid = -1;
}


Pid & Pid::operator=(Pid && other)
{
    Pid tmp(std::move(other));
    std::swap(pid, tmp.pid);
    std::swap(killSignal, tmp.killSignal);
    return *this;
}


Pid::~Pid() noexcept(false)
{
    if (pid != -1) kill();
}


int Pid::kill()
{
    if (pid == -1)
        throw Error("cannot kill a process that is not running");

    debug("killing process %1%", pid);

    if (::kill(pid, killSignal) != 0)
        logError(SysError("killing process %d", pid).info());

    return wait();
}


int Pid::wait()
{
    if (pid == -1)
        throw Error("cannot wait for a process that is not running");

    while (1) {
        int status;
        int res = waitpid(pid, &status, 0);
        if (res == pid) {
            pid = -1;
            return status;
        }
        if (errno != EINTR)
            throw SysError("cannot get exit status of PID %d", pid);
        checkInterrupt();
    }
}


void Pid::setKillSignal(int signal)
{
    this->killSignal = signal;
}


pid_t Pid::release()
{
    pid_t p = pid;
    pid = -1;
    return p;
}


//////////////////////////////////////////////////////////////////////


static pid_t doFork(std::function<void()> fun)
{
    pid_t pid = fork();
    if (pid != 0) return pid;
    fun();
    _exit(1);
}

static int childEntry(void * arg)
{
    auto main = static_cast<std::function<void()> *>(arg);
    (*main)();
    return 1;
}


Pid startProcess(std::function<void()> fun, const ProcessOptions & options)
{
    std::function<void()> wrapper = [&]() {
        logger = makeSimpleLogger();
        try {
            if (options.dieWithParent && prctl(PR_SET_PDEATHSIG, SIGKILL) == -1)
                throw SysError("setting death signal");
            fun();
        } catch (std::exception & e) {
            std::cerr << e.what() << "\n";
        }
        _exit(1);
    };

    pid_t pid = -1;

    if (options.cloneFlags) {
        if (options.cloneFlags & CLONE_VM)
            throw Error("cannot start a process sharing our address space");

        size_t stackSize = 1 * 1024 * 1024;
        auto stack = static_cast<char *>(mmap(0, stackSize,
            PROT_WRITE | PROT_READ, MAP_PRIVATE | MAP_ANONYMOUS | MAP_STACK, -1, 0));
        if (stack == MAP_FAILED) throw SysError("allocating stack");

        Finally freeStack([&]() { munmap(stack, stackSize); });

        pid = clone(childEntry, stack + stackSize, options.cloneFlags | SIGCHLD, &wrapper);
    } else
        pid = doFork(wrapper);

    if (pid == -1) throw SysError("unable to fork");

    return Pid{pid};
}


std::string runProgram(Path program, bool searchPath, const Strings & args)
{
    auto res = runProgram(RunOptions{.program = program, .searchPath = searchPath, .args = args});

    if (!statusOk(res.first))
        throw ExecError(res.first, "program '%1%' %2%", program, statusToString(res.first));

    return res.second;
}

std::pair<int, std::string> runProgram(RunOptions options)
{
    options.captureStdout = true;

    auto proc = runProgram2(options);
    auto childStdout = drainFD(*proc.getStdoutFD());
    int status = proc.wait();

    return {status, std::move(childStdout)};
}

RunningProgram::RunningProgram(PathView program, Pid pid, AutoCloseFD childStdout)
    : program(program)
    , pid(std::move(pid))
    , childStdout(std::move(childStdout))
{
}

int RunningProgram::kill()
{
    return pid.kill();
}

int RunningProgram::wait()
{
    return pid.wait();
}

void RunningProgram::waitAndCheck()
{
    int status = pid.wait();
    if (status) {
        /* A program killed by the same ^C that interrupted us is not a
           program failure. */
        checkInterrupt();
        throw ExecError(status, "program '%1%' %2%", program, statusToString(status));
    }
}

RunningProgram runProgram2(const RunOptions & options)
{
    checkInterrupt();

    /* Create a pipe. */
    Pipe out;
    if (options.captureStdout) out.create();

    ProcessOptions processOptions {
        .dieWithParent = options.dieWithParent,
    };

    Strings commandLine{shellEscape(options.program)};
    for (auto & arg : options.args) commandLine.push_back(shellEscape(arg));
    printMsg(lvlChatty, "running command: %s", concatStringsSep(" ", commandLine));

    /* Fork. */
    Pid pid{startProcess([&]() {
        if (options.environment)
            replaceEnv(*options.environment);
        if (options.captureStdout && dup2(out.writeSide.get(), STDOUT_FILENO) == -1)
            throw SysError("dupping stdout");

        if (options.chdir && chdir((*options.chdir).c_str()) == -1)
            throw SysError("chdir failed");

        Strings args_(options.args);
        args_.push_front(options.argv0.value_or(options.program));

        restoreProcessContext();

        if (options.searchPath)
            execvp(options.program.c_str(), stringsToCharPtrs(args_).data());
            // This allows you to refer to a program with a pathname relative
            // to the PATH variable.
        else
            execv(options.program.c_str(), stringsToCharPtrs(args_).data());

        throw SysError("executing '%1%'", options.program);
    }, processOptions)};

    out.writeSide.close();

    return RunningProgram{
        options.program,
        std::move(pid),
        options.captureStdout ? std::move(out.readSide) : AutoCloseFD{}
    };
}

std::string statusToString(int status)
{
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        if (WIFEXITED(status))
            return fmt("failed with exit code %1%", WEXITSTATUS(status));
        else if (WIFSIGNALED(status)) {
            int sig = WTERMSIG(status);
            const char * description = strsignal(sig);
            return fmt("failed due to signal %1% (%2%)", sig, description);
        }
        else
            return "died abnormally";
    } else return "succeeded";
}


bool statusOk(int status)
{
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

}
