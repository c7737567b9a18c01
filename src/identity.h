#pragma once

#include <cstdint>
#include <bitset>
#include <string>

#include "namespace.h"

static const int MAX_VMS = 256;

// VM ids used within a namespace
class IdPool {
    std::bitset<MAX_VMS> used;
public:
    // smallest free id, CapacityExceeded when all are taken
    uint8_t allocate();
    void release(uint8_t id);
    void mark_used(uint8_t id) { used.set(id); }
    bool is_used(uint8_t id) const { return used.test(id); }
    size_t count() const { return used.count(); }
};

IdPool load_id_pool(const Namespace& ns);

// 52:54:<id>:xx:xx:xx with random trailing bytes; collisions are possible and tolerated
std::string generate_mac_address(uint8_t id);
bool validate_mac_address(const std::string& mac_str);
