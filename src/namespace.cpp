#include <unistd.h>
#include <fcntl.h>
#include <pwd.h>
#include <errno.h>
#include <string.h>
#include <sys/file.h>

#include <chrono>
#include <thread>

#include "errors.h"
#include "namespace.h"

std::string get_acting_user()
{
    auto pw = getpwuid(geteuid());
    if (!pw || !pw->pw_name) throw std::runtime_error("Cannot determine user name of uid " + std::to_string(geteuid()));
    return pw->pw_name;
}

Namespace get_namespace(const std::filesystem::path& vm_root, const std::string& user)
{
    if (user.empty() || user.find('/') != std::string::npos || user == "." || user == "..") {
        throw VMError(ErrorCode::NamespaceUnavailable, "Invalid user name '" + user + "'");
    }
    return Namespace { user, vm_root / user };
}

void validate_namespace(const Namespace& ns)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(ns.path, ec)) {
        throw VMError(ErrorCode::NamespaceUnavailable, ns.path.string() + " doesn't exist.\nContact your system administrator.");
    }
    if (access(ns.path.c_str(), R_OK|W_OK|X_OK) < 0) {
        throw VMError(ErrorCode::NamespaceUnavailable, ns.path.string() + " is not accessible(" + strerror(errno) + ").\nContact your system administrator.");
    }
}

int lock_namespace(const Namespace& ns, int timeout_sec)
{
    auto fd = open(ns.path.c_str(), O_RDONLY|O_DIRECTORY|O_CLOEXEC, 0);
    if (fd < 0) throw VMError(ErrorCode::NamespaceUnavailable, std::string("open(") + ns.path.string() + ") failed: " + strerror(errno));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);
    while (flock(fd, LOCK_EX|LOCK_NB) < 0) {
        if (errno == EINTR) continue;
        if (errno != EWOULDBLOCK) {
            close(fd);
            throw std::runtime_error(std::string("flock(") + ns.path.string() + ") failed: " + strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            close(fd);
            throw std::runtime_error("Timed out waiting for another operation on " + ns.path.string() + " to finish");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return fd;
}

void unlock_namespace(int fd)
{
    flock(fd, LOCK_UN);
    close(fd);
}

void with_namespace_lock(const Namespace& ns, int timeout_sec, std::function<void(void)> func)
{
    with_namespace_lock<void*>(ns, timeout_sec, [&func]() {
        func();
        return nullptr;
    });
}
