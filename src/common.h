#pragma once

#include <unistd.h>

#include <cstdint>
#include <string>
#include <vector>
#include <functional>
#include <optional>

extern bool debug;

int exec(const std::vector<std::string>& cmdline);
pid_t fork(std::function<void(void)> func);
// stdin/stdout go to /dev/null, stderr is collected until the process exits
std::pair<int,std::string> call_with_stderr(const std::vector<std::string>& cmdline, bool new_session = false);

std::string human_readable(uint64_t size);
uint64_t parse_size(const std::string& str, uint64_t unit = 1);
std::string read_urandom(size_t len);

template <typename T> T with_finally_clause(std::function<T(void)> func,std::function<void(void)> finally)
{
    class finalizer {
        std::function<void(void)>& finally;
    public:
        finalizer(std::function<void(void)>& _finally) : finally(_finally) {}
        ~finalizer() { finally(); }
    };
    finalizer f(finally);
    return func();
}

void with_finally_clause(std::function<void(void)> func,std::function<void(void)> finally);
