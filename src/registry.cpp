#include <iostream>

#include "errors.h"
#include "identity.h"
#include "disk.h"
#include "network.h"
#include "registry.h"

std::vector<VMInfo> list_vms(const Namespace& ns, const Config& config)
{
    validate_namespace(ns);
    std::vector<VMInfo> vms;
    for (const auto& name : list_vm_names(ns)) {
        try {
            auto vm = load_vm_config(get_vm_dir(ns, name) / vm_config_file);
            vms.push_back({vm, query_state(vm)});
        }
        catch (const std::runtime_error& ex) {
            std::cerr << "Warning: " << ex.what() << std::endl;
        }
    }
    return vms;
}

RuntimeState get_vm_state(const Namespace& ns, const Config& config, const std::string& name)
{
    validate_namespace(ns);
    return query_state(load_vm_config(ns, name));
}

VMConfig create_vm(const Namespace& ns, const Config& config, const std::string& name,
    uint64_t disk_size, NetworkMode network_mode, PersistFunc persist/* = save_vm_config*/)
{
    validate_namespace(ns);
    auto vm_dir = get_vm_dir(ns, name);
    if (disk_size == 0) throw VMError(ErrorCode::InvalidArgument, "Disk size must not be zero");

    return with_namespace_lock<VMConfig>(ns, config.lock_timeout, [&]() {
        if (std::filesystem::exists(vm_dir)) throw VMError(ErrorCode::NameConflict, name + " already exists");

        auto pool = load_id_pool(ns);
        VMConfig vm;
        vm.id = pool.allocate();
        vm.name = name;
        vm.disk_format = config.disk_format;
        vm.disk_path = vm_dir / ("disk." + config.disk_format);
        vm.disk_size = disk_size;
        vm.network_mode = network_mode;
        vm.mac_address = generate_mac_address(vm.id);

        std::filesystem::create_directory(vm_dir);
        try {
            create_disk(vm.disk_path, vm.disk_size, vm.disk_format, config);
            persist(vm, vm_dir / vm_config_file);
        }
        catch (...) {
            // the id is free again once the directory is gone; pools are rebuilt from disk
            std::error_code ec;
            std::filesystem::remove_all(vm_dir, ec);
            throw;
        }
        std::cout << "Created " << name << " (id " << (int)vm.id << ", " << vm.mac_address << ")" << std::endl;
        return vm;
    });
}

VMConfig clone_vm(const Namespace& ns, const Config& config, const std::string& src_name,
    const std::string& new_name, PersistFunc persist/* = save_vm_config*/)
{
    validate_namespace(ns);
    auto vm_dir = get_vm_dir(ns, new_name);

    return with_namespace_lock<VMConfig>(ns, config.lock_timeout, [&]() {
        auto src = load_vm_config(ns, src_name);
        if (query_state(src) == RuntimeState::RUNNING) {
            throw VMError(ErrorCode::VMBusy, src_name + " is running. Stop it before cloning.");
        }
        if (std::filesystem::exists(vm_dir)) throw VMError(ErrorCode::NameConflict, new_name + " already exists");

        auto pool = load_id_pool(ns);
        VMConfig vm = src;
        vm.id = pool.allocate();
        vm.name = new_name;
        vm.disk_path = vm_dir / ("disk." + src.disk_format);
        vm.mac_address = generate_mac_address(vm.id);

        std::filesystem::create_directory(vm_dir);
        try {
            clone_disk(src.disk_path, vm.disk_path, vm.disk_format, config);
            persist(vm, vm_dir / vm_config_file);
        }
        catch (...) {
            // the id is free again once the directory is gone; pools are rebuilt from disk
            std::error_code ec;
            std::filesystem::remove_all(vm_dir, ec);
            throw;
        }
        std::cout << "Cloned " << src_name << " as " << new_name << " (id " << (int)vm.id << ", " << vm.mac_address << ")" << std::endl;
        return vm;
    });
}

void modify_vm(const Namespace& ns, const Config& config, const std::string& name, NetworkMode network_mode)
{
    validate_namespace(ns);
    with_namespace_lock(ns, config.lock_timeout, [&]() {
        auto vm = load_vm_config(ns, name);
        if (query_state(vm) == RuntimeState::RUNNING) {
            throw VMError(ErrorCode::VMBusy, name + " is running. Stop it before modifying.");
        }
        vm.network_mode = network_mode;
        save_vm_config(vm, get_vm_dir(ns, name) / vm_config_file);
    });
}

void delete_vm(const Namespace& ns, const Config& config, const std::string& name)
{
    validate_namespace(ns);
    with_namespace_lock(ns, config.lock_timeout, [&]() {
        auto vm = load_vm_config(ns, name);
        if (query_state(vm) == RuntimeState::RUNNING) {
            throw VMError(ErrorCode::VMBusy, name + " is running. Stop it before deleting.");
        }

        try {
            delete_disk(vm.disk_path);
        }
        catch (const VMError& ex) {
            if (ex.code() != ErrorCode::DiskNotFound) throw;
            //else
            std::cerr << "Warning: " << ex.what() << std::endl;
        }
        auto vm_dir = get_vm_dir(ns, name);
        std::filesystem::remove(vm_dir / vm_config_file);
        std::filesystem::remove_all(vm_dir);
        std::cout << "Deleted " << name << std::endl;
    });
}

static void start(const Namespace& ns, const Config& config, const std::string& name, uint32_t memory_mb,
    const std::optional<std::filesystem::path>& media)
{
    validate_namespace(ns);
    if (memory_mb < MIN_MEMORY_MB) {
        throw VMError(ErrorCode::InvalidArgument, "Memory too less(at least " + std::to_string(MIN_MEMORY_MB) + "MB required)");
    }
    if (media.has_value() && !std::filesystem::is_regular_file(media.value())) {
        throw VMError(ErrorCode::LaunchFailed, "Installation medium " + media.value().string() + " does not exist");
    }

    with_namespace_lock(ns, config.lock_timeout, [&]() {
        auto vm = load_vm_config(ns, name);
        // checked under the lock so that two invocations never launch the same VM
        if (query_state(vm) == RuntimeState::RUNNING) throw VMError(ErrorCode::VMBusy, name + " is already running");
        if (!std::filesystem::exists(vm.disk_path)) {
            throw VMError(ErrorCode::LaunchFailed, "Disk " + vm.disk_path.string() + " of " + name + " does not exist");
        }
        auto network = resolve_network(vm.network_mode, vm.mac_address, config);
        launch_vm(vm, memory_mb, network, media, config);
    });
}

void run_vm(const Namespace& ns, const Config& config, const std::string& name, uint32_t memory_mb)
{
    start(ns, config, name, memory_mb, std::nullopt);
}

void install_vm(const Namespace& ns, const Config& config, const std::string& name, uint32_t memory_mb,
    const std::filesystem::path& media)
{
    start(ns, config, name, memory_mb, std::filesystem::absolute(media));
}

void stop_vm(const Namespace& ns, const Config& config, const std::string& name, bool force/* = false*/)
{
    validate_namespace(ns);
    terminate_vm(load_vm_config(ns, name), force, config);
}
