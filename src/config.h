#pragma once

#include <filesystem>
#include <string>

static const std::filesystem::path default_config_path("/etc/vmmgr/default.ini");

struct Config {
    std::filesystem::path vm_root = "/opt/VMs";
    std::string qemu = "qemu-system-x86_64";
    std::string qemu_img = "qemu-img";
    std::string disk_format = "qcow2";
    bool kvm = true;
    std::string bridge = "br0";
    std::filesystem::path bridge_helper = "/usr/lib/qemu/qemu-bridge-helper";
    std::filesystem::path sysfs_net = "/sys/class/net";
    int lock_timeout = 30;
    int launch_timeout = 5;
    int stop_timeout = 10;
};

// missing file means defaults
Config load_config(const std::filesystem::path& ini_path = default_config_path);
