#pragma once

#include <string>
#include <vector>

#include "config.h"

enum class NetworkMode { NAT, BRIDGE, NONE };

std::string to_string(NetworkMode mode);
NetworkMode parse_network_mode(const std::string& str);

// how the hypervisor has to wire the VM's virtual NIC
struct NetworkSpec {
    NetworkMode mode;
    std::vector<std::string> qemu_args;
    std::string helper; // bridge mode only
};

NetworkSpec resolve_network(NetworkMode mode, const std::string& mac_address, const Config& config);

// true if hypervisor's error output indicates the bridge helper lacked CAP_NET_ADMIN
bool is_permission_failure(const std::string& output);
// the helper refused the bridge because of its ACL (bridge.conf)
bool is_acl_denial(const std::string& output);
std::string unprivileged_helper_message(const std::string& helper);
