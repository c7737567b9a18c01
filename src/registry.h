#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>

#include "config.h"
#include "namespace.h"
#include "vm_config.h"
#include "process.h"

static const uint32_t MIN_MEMORY_MB = 16;

struct VMInfo {
    VMConfig vm;
    RuntimeState state;
};

typedef std::function<void(const VMConfig&, const std::filesystem::path&)> PersistFunc;

std::vector<VMInfo> list_vms(const Namespace& ns, const Config& config);
RuntimeState get_vm_state(const Namespace& ns, const Config& config, const std::string& name);

// on failure every allocated resource is released before the error propagates
VMConfig create_vm(const Namespace& ns, const Config& config, const std::string& name,
    uint64_t disk_size, NetworkMode network_mode, PersistFunc persist = save_vm_config);
VMConfig clone_vm(const Namespace& ns, const Config& config, const std::string& src_name,
    const std::string& new_name, PersistFunc persist = save_vm_config);
void modify_vm(const Namespace& ns, const Config& config, const std::string& name, NetworkMode network_mode);
void delete_vm(const Namespace& ns, const Config& config, const std::string& name);

void run_vm(const Namespace& ns, const Config& config, const std::string& name, uint32_t memory_mb);
void install_vm(const Namespace& ns, const Config& config, const std::string& name, uint32_t memory_mb,
    const std::filesystem::path& media);
void stop_vm(const Namespace& ns, const Config& config, const std::string& name, bool force = false);
