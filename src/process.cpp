#include <signal.h>
#include <errno.h>
#include <string.h>

#include <iostream>
#include <fstream>
#include <sstream>
#include <chrono>
#include <thread>

#include "common.h"
#include "errors.h"
#include "process.h"

std::string to_string(RuntimeState state)
{
    return state == RuntimeState::RUNNING? "running" : "stopped";
}

std::string drive_argument(const VMConfig& vm)
{
    return "file=" + vm.disk_path.string() + ",format=" + vm.disk_format + ",if=virtio";
}

std::vector<std::string> build_qemu_cmdline(const VMConfig& vm, uint32_t memory_mb, const NetworkSpec& network,
    const std::optional<std::filesystem::path>& media, const Config& config)
{
    std::vector<std::string> qemu_cmdline = {
        config.qemu,
        "-name", "guest=" + vm.name + ",process=vmmgr-" + std::to_string(vm.id),
        "-machine", "q35",
        "-m", std::to_string(memory_mb),
        "-drive", drive_argument(vm),
        "-display", "none",
        "-daemonize"
    };
    if (config.kvm && std::filesystem::exists("/dev/kvm")) qemu_cmdline.push_back("-enable-kvm");

    if (media.has_value()) {
        qemu_cmdline.push_back("-drive");
        qemu_cmdline.push_back("file=" + media.value().string() + ",media=cdrom,readonly=on");
        qemu_cmdline.push_back("-boot");
        qemu_cmdline.push_back("once=d");
    }

    qemu_cmdline.insert(qemu_cmdline.end(), network.qemu_args.begin(), network.qemu_args.end());
    return qemu_cmdline;
}

static std::optional<std::vector<std::string>> read_cmdline(const std::filesystem::path& cmdline_path)
{
    std::ifstream f(cmdline_path, std::ios::binary);
    if (!f) return std::nullopt;
    std::vector<std::string> argv;
    std::string arg;
    while (std::getline(f, arg, '\0')) {
        argv.push_back(arg);
    }
    return argv;
}

std::vector<pid_t> find_vm_processes(const VMConfig& vm, const std::filesystem::path& proc_root/* = "/proc"*/)
{
    auto identity = drive_argument(vm);
    std::vector<pid_t> pids;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(proc_root, ec); !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) continue;
        //else
        auto argv = read_cmdline(it->path() / "cmdline"); // process may be gone already
        if (!argv) continue;
        for (const auto& arg : argv.value()) {
            if (arg == identity) {
                pids.push_back((pid_t)std::stol(name));
                break;
            }
        }
    }
    if (ec) throw std::runtime_error("Scanning " + proc_root.string() + " failed: " + ec.message());
    return pids;
}

RuntimeState query_state(const VMConfig& vm)
{
    return find_vm_processes(vm).empty()? RuntimeState::STOPPED : RuntimeState::RUNNING;
}

static std::string trim(const std::string& str)
{
    auto end = str.find_last_not_of(" \r\n\t");
    return end == std::string::npos? "" : str.substr(0, end + 1);
}

void launch_vm(const VMConfig& vm, uint32_t memory_mb, const NetworkSpec& network,
    const std::optional<std::filesystem::path>& media, const Config& config)
{
    auto qemu_cmdline = build_qemu_cmdline(vm, memory_mb, network, media, config);

    std::cout << "Starting " << vm.name << std::endl;
    auto [status, output] = call_with_stderr(qemu_cmdline, true);
    if (status != 0) {
        if (network.mode == NetworkMode::BRIDGE && is_acl_denial(output)) {
            throw VMError(ErrorCode::LaunchFailed, "Network helper " + network.helper + " is not allowed to use the bridge."
                " Add 'allow <bridge>' to its ACL file (bridge.conf): " + trim(output));
        }
        if (network.mode == NetworkMode::BRIDGE && is_permission_failure(output)) {
            throw VMError(ErrorCode::NetworkHelperUnprivileged, unprivileged_helper_message(network.helper));
        }
        //else
        throw VMError(ErrorCode::LaunchFailed, "Launching " + vm.name + " failed(exit status " + std::to_string(status) + "): " + trim(output));
    }
    if (debug && !output.empty()) std::cerr << trim(output) << std::endl;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config.launch_timeout);
    while (query_state(vm) != RuntimeState::RUNNING) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw VMError(ErrorCode::LaunchFailed, vm.name + " not started(hypervisor exited right after launch?)");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cout << vm.name << " started." << std::endl;
}

void terminate_vm(const VMConfig& vm, bool force, const Config& config)
{
    auto pids = find_vm_processes(vm);
    if (pids.empty()) throw VMError(ErrorCode::VMNotRunning, vm.name + " is not running");

    std::cout << (force? "Forcefully stopping " : "Stopping ") << vm.name << std::endl;
    for (auto pid : pids) {
        if (kill(pid, force? SIGKILL : SIGTERM) < 0 && errno != ESRCH) {
            throw std::runtime_error("kill(" + std::to_string(pid) + ") failed: " + strerror(errno));
        }
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config.stop_timeout);
    while (!find_vm_processes(vm).empty()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "Warning: " << vm.name << " has been signaled but is still running" << std::endl;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}
