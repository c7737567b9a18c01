#pragma once

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "config.h"
#include "network.h"
#include "vm_config.h"

enum class RuntimeState { STOPPED, RUNNING };

std::string to_string(RuntimeState state);

// the argv element that identifies the VM's hypervisor process
std::string drive_argument(const VMConfig& vm);

std::vector<std::string> build_qemu_cmdline(const VMConfig& vm, uint32_t memory_mb, const NetworkSpec& network,
    const std::optional<std::filesystem::path>& media, const Config& config);

std::vector<pid_t> find_vm_processes(const VMConfig& vm, const std::filesystem::path& proc_root = "/proc");
RuntimeState query_state(const VMConfig& vm);

/**
 * Launch the hypervisor in its own session. Returns once the hypervisor has
 * daemonized and its process is visible; the VM keeps running after this
 * command exits.
 */
void launch_vm(const VMConfig& vm, uint32_t memory_mb, const NetworkSpec& network,
    const std::optional<std::filesystem::path>& media, const Config& config);

/**
 * Signal the VM's hypervisor process(SIGTERM, or SIGKILL when forced) and wait
 * up to stop_timeout seconds for it to go away. The guest OS is not shut down
 * gracefully. Throws VMNotRunning when no process is found.
 */
void terminate_vm(const VMConfig& vm, bool force, const Config& config);
