#include <memory>
#include <stdexcept>

#include <iniparser4/iniparser.h>

#include "errors.h"
#include "config.h"

Config load_config(const std::filesystem::path& ini_path/* = default_config_path*/)
{
    Config config;
    if (!std::filesystem::exists(ini_path)) return config;
    //else
    auto ini = std::shared_ptr<dictionary>(iniparser_load(ini_path.c_str()), iniparser_freedict);
    if (!ini) throw std::runtime_error("Failed to load configuration file " + ini_path.string());

    config.vm_root = iniparser_getstring(ini.get(), ":vm_root", config.vm_root.c_str());
    config.qemu = iniparser_getstring(ini.get(), ":qemu", config.qemu.c_str());
    config.qemu_img = iniparser_getstring(ini.get(), ":qemu_img", config.qemu_img.c_str());
    config.disk_format = iniparser_getstring(ini.get(), ":disk_format", config.disk_format.c_str());
    config.kvm = (bool)iniparser_getboolean(ini.get(), ":kvm", config.kvm? 1 : 0);
    config.bridge = iniparser_getstring(ini.get(), ":bridge", config.bridge.c_str());
    config.bridge_helper = iniparser_getstring(ini.get(), ":bridge_helper", config.bridge_helper.c_str());
    config.sysfs_net = iniparser_getstring(ini.get(), ":sysfs_net", config.sysfs_net.c_str());
    config.lock_timeout = iniparser_getint(ini.get(), ":lock_timeout", config.lock_timeout);
    config.launch_timeout = iniparser_getint(ini.get(), ":launch_timeout", config.launch_timeout);
    config.stop_timeout = iniparser_getint(ini.get(), ":stop_timeout", config.stop_timeout);

    if (config.disk_format != "qcow2" && config.disk_format != "raw") {
        throw VMError(ErrorCode::InvalidArgument, "Unsupported disk_format '" + config.disk_format + "' in " + ini_path.string());
    }
    if (config.lock_timeout < 0 || config.launch_timeout < 0 || config.stop_timeout < 0) {
        throw VMError(ErrorCode::InvalidArgument, "Timeouts must not be negative in " + ini_path.string());
    }
    return config;
}
