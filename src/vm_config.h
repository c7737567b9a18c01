#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

#include "namespace.h"
#include "network.h"

static const char* const vm_config_file = "config.json";

// persisted per-VM metadata (<namespace>/<name>/config.json)
struct VMConfig {
    uint8_t id = 0;
    std::string name;
    std::filesystem::path disk_path;
    uint64_t disk_size = 0;
    std::string disk_format = "qcow2";
    NetworkMode network_mode = NetworkMode::NAT;
    std::string mac_address;
};

bool validate_vm_name(const std::string& name);
std::filesystem::path get_vm_dir(const Namespace& ns, const std::string& name);
bool vm_exists(const Namespace& ns, const std::string& name);
std::vector<std::string> list_vm_names(const Namespace& ns);

VMConfig load_vm_config(const std::filesystem::path& config_path);
VMConfig load_vm_config(const Namespace& ns, const std::string& name);
// id only, for records that are otherwise broken
uint8_t load_vm_id(const std::filesystem::path& config_path);
// written to a temporary file and renamed into place
void save_vm_config(const VMConfig& vm, const std::filesystem::path& config_path);
