#include <iostream>

#include "common.h"
#include "errors.h"
#include "disk.h"

static std::string first_line(const std::string& output)
{
    auto nl = output.find('\n');
    return nl == std::string::npos? output : output.substr(0, nl);
}

void create_disk(const std::filesystem::path& path, uint64_t size, const std::string& format, const Config& config)
{
    if (size == 0) throw VMError(ErrorCode::DiskCreateFailed, "Disk size must not be zero");
    if (std::filesystem::exists(path)) throw VMError(ErrorCode::DiskCreateFailed, path.string() + " already exists");

    std::vector<std::string> cmdline;
    if (format == "qcow2") {
        cmdline = { config.qemu_img, "create", "-q", "-f", "qcow2", path.string(), std::to_string(size) };
    } else if (format == "raw") {
        cmdline = { "truncate", "-s", std::to_string(size), path.string() };
    } else {
        throw VMError(ErrorCode::DiskCreateFailed, "Unsupported disk format '" + format + "'");
    }

    auto [status, output] = call_with_stderr(cmdline);
    if (status != 0) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        throw VMError(ErrorCode::DiskCreateFailed, "Creating disk " + path.string() + " failed: " + first_line(output));
    }
}

void clone_disk(const std::filesystem::path& src, const std::filesystem::path& dst, const std::string& format, const Config& config)
{
    if (!std::filesystem::is_regular_file(src)) throw VMError(ErrorCode::DiskCloneFailed, src.string() + " does not exist");
    if (std::filesystem::exists(dst)) throw VMError(ErrorCode::DiskCloneFailed, dst.string() + " already exists");

    std::vector<std::string> cmdline;
    if (format == "qcow2") {
        cmdline = { config.qemu_img, "convert", "-q", "-O", "qcow2", src.string(), dst.string() };
    } else if (format == "raw") {
        cmdline = { "cp", "--sparse=always", src.string(), dst.string() };
    } else {
        throw VMError(ErrorCode::DiskCloneFailed, "Unsupported disk format '" + format + "'");
    }

    std::cout << "Copying disk " << src.filename().string() << "..." << std::endl;
    auto [status, output] = call_with_stderr(cmdline);
    if (status != 0) {
        std::error_code ec;
        std::filesystem::remove(dst, ec);
        throw VMError(ErrorCode::DiskCloneFailed, "Copying disk " + src.string() + " failed: " + first_line(output));
    }
}

void delete_disk(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) throw VMError(ErrorCode::DiskNotFound, path.string() + " does not exist");
    //else
    std::filesystem::remove(path);
}
