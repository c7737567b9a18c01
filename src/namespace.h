#pragma once

#include <string>
#include <filesystem>
#include <functional>

#include "common.h"

struct Namespace {
    std::string user;
    std::filesystem::path path;
};

std::string get_acting_user();
Namespace get_namespace(const std::filesystem::path& vm_root, const std::string& user);
// throws NamespaceUnavailable unless the directory exists and is usable
void validate_namespace(const Namespace& ns);

int lock_namespace(const Namespace& ns, int timeout_sec);
void unlock_namespace(int fd);

// exclusive advisory lock on the namespace directory, held while func runs
template <typename T> T with_namespace_lock(const Namespace& ns, int timeout_sec, std::function<T(void)> func)
{
    auto fd = lock_namespace(ns, timeout_sec);
    return with_finally_clause<T>([&func]() {
        return func();
    }, [fd]() {
        unlock_namespace(fd);
    });
}

void with_namespace_lock(const Namespace& ns, int timeout_sec, std::function<void(void)> func);
