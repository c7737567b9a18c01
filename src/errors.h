#pragma once

#include <stdexcept>
#include <string>

// exit status of the command is derived from the code
enum class ErrorCode {
    Generic = 1,
    NamespaceUnavailable = 3,
    CapacityExceeded = 4,
    VMBusy = 5,
    VMNotRunning = 6,
    LaunchFailed = 7,
    NetworkHelperUnprivileged = 8,
    // following ones exit with the generic status
    NameConflict = 101,
    VMNotFound,
    InvalidArgument,
    DiskCreateFailed,
    DiskCloneFailed,
    DiskNotFound,
};

class VMError : public std::runtime_error {
    ErrorCode _code;
public:
    VMError(ErrorCode code, const std::string& what) : std::runtime_error(what), _code(code) {}
    ErrorCode code() const { return _code; }
    int exit_status() const { return (int)_code > 100? (int)ErrorCode::Generic : (int)_code; }
};

const char* error_name(ErrorCode code);
