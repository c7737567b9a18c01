#include <cstdio>
#include <cctype>
#include <iostream>

#include "errors.h"
#include "vm_config.h"
#include "identity.h"

uint8_t IdPool::allocate()
{
    for (int id = 0; id < MAX_VMS; id++) {
        if (used.test(id)) continue;
        //else
        used.set(id);
        return (uint8_t)id;
    }
    throw VMError(ErrorCode::CapacityExceeded, "No more than " + std::to_string(MAX_VMS) + " VMs can be created");
}

void IdPool::release(uint8_t id)
{
    used.reset(id);
}

IdPool load_id_pool(const Namespace& ns)
{
    IdPool pool;
    for (const auto& name : list_vm_names(ns)) {
        auto config_path = get_vm_dir(ns, name) / vm_config_file;
        try {
            pool.mark_used(load_vm_config(config_path).id);
        }
        catch (const std::runtime_error& ex) {
            std::cerr << "Warning: " << ex.what() << std::endl;
            // a broken record still owns its id until it is repaired or removed
            try {
                pool.mark_used(load_vm_id(config_path));
            }
            catch (const std::runtime_error&) {
                throw std::runtime_error("Cannot determine the id of " + name + " from " + config_path.string()
                    + ". Repair or remove it before creating VMs.");
            }
        }
    }
    return pool;
}

std::string generate_mac_address(uint8_t id)
{
    auto buf = read_urandom(3);

    uint8_t mac[6];
    mac[0] = 0x52; // locally administered, unicast
    mac[1] = 0x54;
    mac[2] = id;
    mac[3] = buf[0];
    mac[4] = buf[1];
    mac[5] = buf[2];

    char mac_str[18];
    sprintf(mac_str, "%02x:%02x:%02x:%02x:%02x:%02x", (int)mac[0], (int)mac[1], (int)mac[2], (int)mac[3], (int)mac[4], (int)mac[5]);
    return mac_str;
}

bool validate_mac_address(const std::string& mac_str)
{
    if (mac_str.length() != 17) return false;
    //else
    for (int i = 0; i < 17; i++) {
      char c = tolower(mac_str[i]);
      if (i % 3 == 2) {
        if ( c != ':') return false; // invalid tokenizer
        else continue;
      }
      //else
      if (!isdigit(c) && (c < 'a' || c > 'f')) return false; // invalid hex char
    }

    return true;
}
