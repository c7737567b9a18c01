#include <set>
#include <thread>
#include <future>

#include <gtest/gtest.h>

#include "errors.h"
#include "identity.h"
#include "registry.h"
#include "test_util.h"

static const uint64_t disk_size = 1024 * 1024;

#define EXPECT_VM_ERROR(statement, expected) \
    try { \
        statement; \
        ADD_FAILURE() << #statement << " did not throw"; \
    } \
    catch (const VMError& ex) { \
        EXPECT_EQ(ex.code(), expected) << ex.what(); \
    }

TEST(Registry, CreateIsStopped)
{
    TestEnv env;
    auto vm = create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT);
    EXPECT_EQ(vm.id, 0);
    EXPECT_EQ(vm.mac_address.substr(0, 9), "52:54:00:");
    EXPECT_EQ(vm.disk_path, env.ns.path / "alpha" / "disk.raw");
    EXPECT_EQ(std::filesystem::file_size(vm.disk_path), disk_size);
    EXPECT_EQ(get_vm_state(env.ns, env.config, "alpha"), RuntimeState::STOPPED);

    auto vms = list_vms(env.ns, env.config);
    ASSERT_EQ(vms.size(), 1u);
    EXPECT_EQ(vms[0].vm.name, "alpha");
    EXPECT_EQ(vms[0].vm.network_mode, NetworkMode::NAT);
    EXPECT_EQ(vms[0].state, RuntimeState::STOPPED);
}

TEST(Registry, CreateRejectsBadInput)
{
    TestEnv env;
    create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT);
    EXPECT_VM_ERROR(create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NONE), ErrorCode::NameConflict);
    EXPECT_VM_ERROR(create_vm(env.ns, env.config, "../evil", disk_size, NetworkMode::NAT), ErrorCode::InvalidArgument);
    EXPECT_VM_ERROR(create_vm(env.ns, env.config, "beta", 0, NetworkMode::NAT), ErrorCode::InvalidArgument);
    EXPECT_EQ(list_vm_names(env.ns), std::vector<std::string>{"alpha"});
}

TEST(Registry, IdsAreReusedSmallestFirst)
{
    TestEnv env;
    for (const char* name : { "a", "b", "c" }) create_vm(env.ns, env.config, name, disk_size, NetworkMode::NONE);
    delete_vm(env.ns, env.config, "b");
    EXPECT_FALSE(std::filesystem::exists(env.ns.path / "b"));
    EXPECT_EQ(create_vm(env.ns, env.config, "d", disk_size, NetworkMode::NONE).id, 1);
    EXPECT_EQ(create_vm(env.ns, env.config, "e", disk_size, NetworkMode::NONE).id, 3);
}

TEST(Registry, CapacityExceeded)
{
    TestEnv env;
    // records only; disks are irrelevant to allocation
    for (int id = 0; id < MAX_VMS; id++) {
        VMConfig vm;
        vm.id = (uint8_t)id;
        vm.name = "vm" + std::to_string(id);
        vm.disk_path = env.ns.path / vm.name / "disk.raw";
        vm.disk_size = disk_size;
        vm.disk_format = "raw";
        vm.mac_address = generate_mac_address(vm.id);
        std::filesystem::create_directory(env.ns.path / vm.name);
        save_vm_config(vm, env.ns.path / vm.name / vm_config_file);
    }

    EXPECT_VM_ERROR(create_vm(env.ns, env.config, "one-too-many", disk_size, NetworkMode::NAT), ErrorCode::CapacityExceeded);
    EXPECT_FALSE(std::filesystem::exists(env.ns.path / "one-too-many"));
    EXPECT_EQ(list_vm_names(env.ns).size(), (size_t)MAX_VMS);
    EXPECT_EQ(load_id_pool(env.ns).count(), (size_t)MAX_VMS);
    EXPECT_EQ(load_vm_config(env.ns, "vm17").id, 17);

    // the missing disk of a record is tolerated on delete
    delete_vm(env.ns, env.config, "vm17");
    EXPECT_EQ(create_vm(env.ns, env.config, "one-too-many", disk_size, NetworkMode::NAT).id, 17);
}

TEST(Registry, BrokenRecordKeepsItsId)
{
    TestEnv env;
    std::filesystem::create_directory(env.ns.path / "broken");
    env.write_file(env.ns.path / "broken" / vm_config_file,
        R"({"id": 0, "name": "broken", "disk_path": "/x/broken/disk.raw", "disk_size": 1048576,
        "network_mode": "tap", "mac_address": "52:54:00:aa:bb:cc"})");

    EXPECT_TRUE(list_vms(env.ns, env.config).empty());
    EXPECT_TRUE(load_id_pool(env.ns).is_used(0));
    EXPECT_EQ(create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT).id, 1);
}

TEST(Registry, UnreadableRecordBlocksAllocation)
{
    TestEnv env;
    std::filesystem::create_directory(env.ns.path / "truncated");
    env.write_file(env.ns.path / "truncated" / vm_config_file, R"({"id": 0, "na)");

    EXPECT_THROW(create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT), std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(env.ns.path / "alpha"));

    std::filesystem::remove_all(env.ns.path / "truncated");
    EXPECT_EQ(create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT).id, 0);
}

TEST(Registry, CreateRollsBackOnPersistFailure)
{
    TestEnv env;
    auto failing = [](const VMConfig&, const std::filesystem::path&) {
        throw std::runtime_error("disk full");
    };
    EXPECT_THROW(create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT, failing), std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(env.ns.path / "alpha"));
    EXPECT_TRUE(list_vm_names(env.ns).empty());

    // the id went back to the pool
    EXPECT_EQ(create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT).id, 0);
}

TEST(Registry, CreateRollsBackOnDiskFailure)
{
    TestEnv env;
    auto config = env.config;
    config.disk_format = "qcow2";
    config.qemu_img = "/nonexistent/qemu-img";
    EXPECT_VM_ERROR(create_vm(env.ns, config, "alpha", disk_size, NetworkMode::NAT), ErrorCode::DiskCreateFailed);
    EXPECT_FALSE(std::filesystem::exists(env.ns.path / "alpha"));
}

TEST(Registry, ConcurrentCreatesGetDistinctIds)
{
    TestEnv env;
    static const int count = 8;
    std::vector<std::future<VMConfig>> futures;
    for (int i = 0; i < count; i++) {
        futures.push_back(std::async(std::launch::async, [&env, i]() {
            return create_vm(env.ns, env.config, "vm" + std::to_string(i), disk_size, NetworkMode::NAT);
        }));
    }
    std::set<int> ids;
    for (auto& f : futures) ids.insert(f.get().id);
    EXPECT_EQ(ids.size(), (size_t)count);
    EXPECT_EQ(*ids.begin(), 0);
    EXPECT_EQ(*ids.rbegin(), count - 1);
}

TEST(Registry, ConcurrentCreatesOfSameName)
{
    TestEnv env;
    auto attempt = [&env]() {
        try {
            create_vm(env.ns, env.config, "same", disk_size, NetworkMode::NAT);
            return true;
        }
        catch (const VMError& ex) {
            EXPECT_EQ(ex.code(), ErrorCode::NameConflict);
            return false;
        }
    };
    auto f1 = std::async(std::launch::async, attempt);
    auto f2 = std::async(std::launch::async, attempt);
    EXPECT_EQ((int)f1.get() + (int)f2.get(), 1);
    EXPECT_EQ(list_vm_names(env.ns), std::vector<std::string>{"same"});
}

TEST(Registry, MutationsWaitForLock)
{
    TestEnv env;
    auto fd = lock_namespace(env.ns, 1);
    auto f = std::async(std::launch::async, [&env]() {
        return create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT);
    });
    EXPECT_EQ(f.wait_for(std::chrono::milliseconds(500)), std::future_status::timeout);
    EXPECT_FALSE(vm_exists(env.ns, "alpha"));
    unlock_namespace(fd);
    EXPECT_EQ(f.get().name, "alpha");
}

TEST(Registry, LockTimeout)
{
    TestEnv env;
    auto config = env.config;
    config.lock_timeout = 0;
    auto fd = lock_namespace(env.ns, 1);
    EXPECT_THROW(create_vm(env.ns, config, "alpha", disk_size, NetworkMode::NAT), std::runtime_error);
    unlock_namespace(fd);
    EXPECT_FALSE(std::filesystem::exists(env.ns.path / "alpha"));
}

TEST(Registry, Clone)
{
    TestEnv env;
    auto src = create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NONE);
    env.write_file(src.disk_path, "installed system");

    auto dst = clone_vm(env.ns, env.config, "alpha", "beta");
    EXPECT_NE(dst.id, src.id);
    EXPECT_NE(dst.mac_address, src.mac_address);
    EXPECT_EQ(dst.network_mode, NetworkMode::NONE);
    EXPECT_EQ(dst.disk_size, src.disk_size);
    EXPECT_EQ(dst.disk_path, env.ns.path / "beta" / "disk.raw");
    EXPECT_EQ(env.read_file(dst.disk_path), "installed system");

    env.write_file(src.disk_path, "changed");
    EXPECT_EQ(env.read_file(dst.disk_path), "installed system");

    EXPECT_VM_ERROR(clone_vm(env.ns, env.config, "alpha", "beta"), ErrorCode::NameConflict);
    EXPECT_VM_ERROR(clone_vm(env.ns, env.config, "ghost", "gamma"), ErrorCode::VMNotFound);
}

TEST(Registry, CloneRollsBack)
{
    TestEnv env;
    auto src = create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT);
    std::filesystem::remove(src.disk_path);
    EXPECT_VM_ERROR(clone_vm(env.ns, env.config, "alpha", "beta"), ErrorCode::DiskCloneFailed);
    EXPECT_FALSE(std::filesystem::exists(env.ns.path / "beta"));
    EXPECT_EQ(load_id_pool(env.ns).count(), 1u);
}

TEST(Registry, RunStateStop)
{
    TestEnv env;
    create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT);
    create_vm(env.ns, env.config, "alpha2", disk_size, NetworkMode::NAT);

    run_vm(env.ns, env.config, "alpha", 256);
    EXPECT_EQ(get_vm_state(env.ns, env.config, "alpha"), RuntimeState::RUNNING);
    EXPECT_EQ(get_vm_state(env.ns, env.config, "alpha2"), RuntimeState::STOPPED);
    EXPECT_VM_ERROR(run_vm(env.ns, env.config, "alpha", 256), ErrorCode::VMBusy);

    stop_vm(env.ns, env.config, "alpha");
    EXPECT_EQ(get_vm_state(env.ns, env.config, "alpha"), RuntimeState::STOPPED);
    EXPECT_VM_ERROR(stop_vm(env.ns, env.config, "alpha"), ErrorCode::VMNotRunning);
    EXPECT_VM_ERROR(stop_vm(env.ns, env.config, "alpha2", true), ErrorCode::VMNotRunning);
}

TEST(Registry, RunRejectsBadInput)
{
    TestEnv env;
    auto vm = create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT);
    EXPECT_VM_ERROR(run_vm(env.ns, env.config, "alpha", 8), ErrorCode::InvalidArgument);
    EXPECT_VM_ERROR(run_vm(env.ns, env.config, "ghost", 256), ErrorCode::VMNotFound);
    EXPECT_VM_ERROR(run_vm(env.ns, env.config, "alpha", 4 * 1024 * 1024), ErrorCode::LaunchFailed);
    EXPECT_VM_ERROR(install_vm(env.ns, env.config, "alpha", 256, env.root / "missing.iso"), ErrorCode::LaunchFailed);

    std::filesystem::remove(vm.disk_path);
    EXPECT_VM_ERROR(run_vm(env.ns, env.config, "alpha", 256), ErrorCode::LaunchFailed);
    EXPECT_EQ(get_vm_state(env.ns, env.config, "alpha"), RuntimeState::STOPPED);
}

TEST(Registry, Install)
{
    TestEnv env;
    create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NONE);
    env.write_file(env.root / "install.iso", "iso image");
    install_vm(env.ns, env.config, "alpha", 512, env.root / "install.iso");
    EXPECT_EQ(get_vm_state(env.ns, env.config, "alpha"), RuntimeState::RUNNING);
    stop_vm(env.ns, env.config, "alpha", true);
    EXPECT_EQ(get_vm_state(env.ns, env.config, "alpha"), RuntimeState::STOPPED);
}

TEST(Registry, RunningVMIsBusy)
{
    TestEnv env;
    create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT);
    run_vm(env.ns, env.config, "alpha", 256);

    EXPECT_VM_ERROR(delete_vm(env.ns, env.config, "alpha"), ErrorCode::VMBusy);
    EXPECT_VM_ERROR(modify_vm(env.ns, env.config, "alpha", NetworkMode::NONE), ErrorCode::VMBusy);
    EXPECT_VM_ERROR(clone_vm(env.ns, env.config, "alpha", "beta"), ErrorCode::VMBusy);
    EXPECT_TRUE(vm_exists(env.ns, "alpha"));
    EXPECT_FALSE(std::filesystem::exists(env.ns.path / "beta"));

    stop_vm(env.ns, env.config, "alpha");
    delete_vm(env.ns, env.config, "alpha");
    EXPECT_FALSE(std::filesystem::exists(env.ns.path / "alpha"));
    EXPECT_EQ(create_vm(env.ns, env.config, "beta", disk_size, NetworkMode::NAT).id, 0);
}

TEST(Registry, Modify)
{
    TestEnv env;
    auto vm = create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::NAT);
    modify_vm(env.ns, env.config, "alpha", NetworkMode::NONE);
    auto modified = load_vm_config(env.ns, "alpha");
    EXPECT_EQ(modified.network_mode, NetworkMode::NONE);
    EXPECT_EQ(modified.id, vm.id);
    EXPECT_EQ(modified.mac_address, vm.mac_address);
    EXPECT_VM_ERROR(modify_vm(env.ns, env.config, "ghost", NetworkMode::NONE), ErrorCode::VMNotFound);
}

TEST(Registry, DeleteNotFound)
{
    TestEnv env;
    EXPECT_VM_ERROR(delete_vm(env.ns, env.config, "ghost"), ErrorCode::VMNotFound);
}

TEST(Registry, BridgeHelperWithoutCapability)
{
    TestEnv env;
    env.provide_bridge();
    create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::BRIDGE);
    EXPECT_VM_ERROR(run_vm(env.ns, env.config, "alpha", 256), ErrorCode::NetworkHelperUnprivileged);
    EXPECT_EQ(get_vm_state(env.ns, env.config, "alpha"), RuntimeState::STOPPED);
}

TEST(Registry, BridgeVMWithUnreadableDisk)
{
    TestEnv env;
    env.provide_bridge();
    auto vm = create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::BRIDGE);
    env.write_file(vm.disk_path.string() + ".denied", "");
    EXPECT_VM_ERROR(run_vm(env.ns, env.config, "alpha", 256), ErrorCode::LaunchFailed);
    EXPECT_EQ(get_vm_state(env.ns, env.config, "alpha"), RuntimeState::STOPPED);
}

TEST(Registry, BridgeDeniedByHelperAcl)
{
    TestEnv env;
    env.config.bridge = "acl-denied";
    env.provide_bridge();
    create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::BRIDGE);
    try {
        run_vm(env.ns, env.config, "alpha", 256);
        FAIL();
    }
    catch (const VMError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::LaunchFailed);
        EXPECT_NE(std::string(ex.what()).find("bridge.conf"), std::string::npos);
    }
}

TEST(Registry, BridgeMissing)
{
    TestEnv env;
    create_vm(env.ns, env.config, "alpha", disk_size, NetworkMode::BRIDGE);
    EXPECT_VM_ERROR(run_vm(env.ns, env.config, "alpha", 256), ErrorCode::LaunchFailed);
}

TEST(Registry, NamespaceUnavailable)
{
    TestEnv env;
    auto ns = get_namespace(env.root, "nobody-here");
    EXPECT_VM_ERROR(list_vms(ns, env.config), ErrorCode::NamespaceUnavailable);
    EXPECT_VM_ERROR(create_vm(ns, env.config, "alpha", disk_size, NetworkMode::NAT), ErrorCode::NamespaceUnavailable);
    EXPECT_VM_ERROR(get_vm_state(ns, env.config, "alpha"), ErrorCode::NamespaceUnavailable);
    EXPECT_VM_ERROR(run_vm(ns, env.config, "alpha", 256), ErrorCode::NamespaceUnavailable);
    EXPECT_VM_ERROR(stop_vm(ns, env.config, "alpha"), ErrorCode::NamespaceUnavailable);
    EXPECT_VM_ERROR(delete_vm(ns, env.config, "alpha"), ErrorCode::NamespaceUnavailable);
    EXPECT_FALSE(std::filesystem::exists(ns.path));

    EXPECT_VM_ERROR(get_namespace(env.root, ".."), ErrorCode::NamespaceUnavailable);
}
