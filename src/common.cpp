#include <stdexcept>
#include <iostream>

#include <errno.h>
#include <string.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

#include "errors.h"
#include "common.h"

bool debug = false;

const char* error_name(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Generic: return "Error";
    case ErrorCode::NamespaceUnavailable: return "NamespaceUnavailable";
    case ErrorCode::CapacityExceeded: return "CapacityExceeded";
    case ErrorCode::VMBusy: return "VMBusy";
    case ErrorCode::VMNotRunning: return "VMNotRunning";
    case ErrorCode::LaunchFailed: return "LaunchFailed";
    case ErrorCode::NetworkHelperUnprivileged: return "NetworkHelperUnprivileged";
    case ErrorCode::NameConflict: return "NameConflict";
    case ErrorCode::VMNotFound: return "VMNotFound";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::DiskCreateFailed: return "DiskCreateFailed";
    case ErrorCode::DiskCloneFailed: return "DiskCloneFailed";
    case ErrorCode::DiskNotFound: return "DiskNotFound";
    }
    return "Error";
}

static void print_cmdline(const std::vector<std::string>& cmdline)
{
    std::cerr << "+";
    for (const auto& arg : cmdline) {
        std::cerr << ' ' << arg;
    }
    std::cerr << std::endl;
}

int exec(const std::vector<std::string>& cmdline)
{
    if (cmdline.size() < 1) throw std::logic_error("cmdline too short");
    char ** argv = new char *[cmdline.size() + 1];
    for (size_t i = 0; i < cmdline.size(); i++) {
        argv[i] = strdup(cmdline[i].c_str());
    }
    argv[cmdline.size()] = NULL;
    return execvp(cmdline[0].c_str(), argv);
}

pid_t fork(std::function<void(void)> func)
{
    auto pid = fork();
    if (pid < 0) throw std::runtime_error("fork() failed");
    if (pid > 0) return pid;

    //else(child process)
    try {
        func();
    }
    catch (const std::exception& ex) {
        // never unwind into the parent's frames from the child
        std::cerr << ex.what() << std::endl;
    }
    _exit(-1);
}

std::pair<int,std::string> call_with_stderr(const std::vector<std::string>& cmdline, bool new_session/* = false*/)
{
    if (debug) print_cmdline(cmdline);
    int fd[2];
    if (pipe2(fd, O_CLOEXEC) < 0) throw std::runtime_error("pipe() failed");

    auto pid = fork([&cmdline,&fd,new_session]() {
        if (new_session) setsid();
        auto devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            close(devnull);
        }
        dup2(fd[1], STDERR_FILENO);
        exec(cmdline);
        std::cerr << "execvp(" << cmdline[0] << ") failed: " << strerror(errno) << std::endl;
        _exit(127);
    });
    close(fd[1]);

    // a daemonized grandchild may keep the pipe open, so EOF is not awaited once the child is gone
    std::string output;
    int wstatus = 0;
    bool exited = false;
    with_finally_clause([&]() {
        while (true) {
            struct pollfd pfd = { fd[0], POLLIN, 0 };
            auto r = poll(&pfd, 1, exited? 0 : 100);
            if (r < 0 && errno != EINTR) throw std::runtime_error("poll() failed");
            if (r > 0) {
                char buf[1024];
                auto n = read(fd[0], buf, sizeof(buf));
                if (n > 0) {
                    output.append(buf, n);
                    continue;
                }
                if (n == 0 && exited) break;
                if (n == 0) {
                    // EOF before exit: just wait for the process
                    if (waitpid(pid, &wstatus, 0) < 0) throw std::runtime_error("waitpid() failed");
                    exited = true;
                    break;
                }
            } else if (exited) {
                break;
            }
            if (!exited) {
                auto w = waitpid(pid, &wstatus, WNOHANG);
                if (w < 0) throw std::runtime_error("waitpid() failed");
                if (w == pid) exited = true;
            }
        }
    }, [&fd]() {
        close(fd[0]);
    });

    if (!WIFEXITED(wstatus)) {
        if (WIFSIGNALED(wstatus)) {
            return {128 + WTERMSIG(wstatus), output};
        }
        //else
        return {-1, output};
    }
    return {WEXITSTATUS(wstatus), output};
}

void with_finally_clause(std::function<void(void)> func,std::function<void(void)> finally)
{
    with_finally_clause<void*>([&func]() {
        func();
        return nullptr;
    }, finally);
}

std::string human_readable(uint64_t size)
{
    char buf[32];
    char au = 'K';

    float s = size / 1024.0;

    if (s >= 1024.0) {
        s /= 1024.0;
        au = 'M';
    }
    if (s >= 1024.0) {
        s /= 1024.0;
        au = 'G';
    }
    if (s >= 1024.0) {
        s /= 1024.0;
        au = 'T';
    }
    sprintf(buf, "%.1f%c", s, au);
    return std::string(buf);
}

uint64_t parse_size(const std::string& str, uint64_t unit/* = 1*/)
{
    size_t pos = 0;
    while (pos < str.length() && isdigit((unsigned char)str[pos])) pos++;
    if (pos == 0 || pos > 18) throw VMError(ErrorCode::InvalidArgument, "Invalid size '" + str + "'");
    //else
    uint64_t value = std::stoull(str.substr(0, pos));
    auto suffix = str.substr(pos);
    if (suffix.length() > 0 && (suffix.back() == 'B' || suffix.back() == 'b')) suffix.pop_back();
    if (suffix.length() > 1) throw VMError(ErrorCode::InvalidArgument, "Invalid size suffix in '" + str + "'");
    if (suffix.length() == 1) {
        switch (toupper(suffix[0])) {
        case 'K': unit = 1024ULL; break;
        case 'M': unit = 1024ULL * 1024; break;
        case 'G': unit = 1024ULL * 1024 * 1024; break;
        case 'T': unit = 1024ULL * 1024 * 1024 * 1024; break;
        default: throw VMError(ErrorCode::InvalidArgument, "Invalid size suffix in '" + str + "'");
        }
    }
    if (unit > 0 && value > UINT64_MAX / unit) throw VMError(ErrorCode::InvalidArgument, "Size too large '" + str + "'");
    return value * unit;
}

std::string read_urandom(size_t len)
{
    auto fd = open("/dev/urandom", O_RDONLY, 0);
    if (fd < 0) throw std::runtime_error("open(/dev/urandom) failed");
    std::string buf(len, '\0');
    auto r = read(fd, buf.data(), len);
    close(fd);
    if (r < (ssize_t)len) throw std::runtime_error("read(/dev/urandom, " + std::to_string(len) + ") failed");
    return buf;
}
