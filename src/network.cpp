#include <cctype>
#include <algorithm>
#include <initializer_list>

#include "errors.h"
#include "network.h"

std::string to_string(NetworkMode mode)
{
    switch (mode) {
    case NetworkMode::NAT: return "nat";
    case NetworkMode::BRIDGE: return "bridge";
    case NetworkMode::NONE: return "none";
    }
    throw std::logic_error("Unknown network mode");
}

NetworkMode parse_network_mode(const std::string& str)
{
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "nat") return NetworkMode::NAT;
    if (lower == "bridge") return NetworkMode::BRIDGE;
    if (lower == "none") return NetworkMode::NONE;
    //else
    throw VMError(ErrorCode::InvalidArgument, "Invalid network mode '" + str + "'. Valid modes are nat, bridge and none.");
}

NetworkSpec resolve_network(NetworkMode mode, const std::string& mac_address, const Config& config)
{
    NetworkSpec spec { mode, {}, "" };
    auto device = "virtio-net-pci,romfile=,netdev=net0,mac=" + mac_address;
    switch (mode) {
    case NetworkMode::NAT:
        spec.qemu_args = { "-netdev", "user,id=net0", "-device", device };
        break;
    case NetworkMode::BRIDGE:
        if (!std::filesystem::exists(config.sysfs_net / config.bridge / "bridge")) {
            throw VMError(ErrorCode::LaunchFailed, "Bridge interface '" + config.bridge + "' does not exist.");
        }
        if (!std::filesystem::exists(config.bridge_helper)) {
            throw VMError(ErrorCode::LaunchFailed, "Network helper " + config.bridge_helper.string() + " is not installed.");
        }
        spec.helper = config.bridge_helper.string();
        spec.qemu_args = { "-netdev", "bridge,br=" + config.bridge + ",helper=" + spec.helper + ",id=net0", "-device", device };
        break;
    case NetworkMode::NONE:
        spec.qemu_args = { "-nic", "none" };
        break;
    }
    return spec;
}

static bool contains_any(const std::string& output, std::initializer_list<const char*> patterns)
{
    for (auto pattern : patterns) {
        if (output.find(pattern) != std::string::npos) return true;
    }
    return false;
}

bool is_permission_failure(const std::string& output)
{
    // permission errors of the disk, media or /dev/kvm don't count
    return contains_any(output, { "bridge helper failed", "failed to create tun device" })
        && contains_any(output, { "Operation not permitted", "Permission denied" });
}

bool is_acl_denial(const std::string& output)
{
    return output.find("access denied by acl file") != std::string::npos;
}

std::string unprivileged_helper_message(const std::string& helper)
{
    return "Network helper " + helper + " lacks the network administration capability.\n"
        "Ask your system administrator to run: setcap cap_net_admin+ep " + helper;
}
