#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>

#include <memory>
#include <algorithm>
#include <fstream>
#include <sstream>

#include <uuid/uuid.h>
#include <yajl/yajl_tree.h>
#include <yajl/yajl_gen.h>

#include "errors.h"
#include "identity.h"
#include "vm_config.h"

bool validate_vm_name(const std::string& name)
{
    if (name.length() < 1 || name.length() > 64) return false;
    if (name[0] == '.' || name[0] == '-') return false;
    //else
    return std::all_of(name.begin(), name.end(), [](char c) {
        return isalnum((unsigned char)c) || c == '.' || c == '_' || c == '-';
    });
}

std::filesystem::path get_vm_dir(const Namespace& ns, const std::string& name)
{
    if (!validate_vm_name(name)) {
        throw VMError(ErrorCode::InvalidArgument, "Invalid VM name '" + name + "'. Use up to 64 of A-Z a-z 0-9 . _ - not starting with . or -");
    }
    return ns.path / name;
}

bool vm_exists(const Namespace& ns, const std::string& name)
{
    return std::filesystem::exists(get_vm_dir(ns, name) / vm_config_file);
}

std::vector<std::string> list_vm_names(const Namespace& ns)
{
    std::vector<std::string> names;
    for (const auto& d : std::filesystem::directory_iterator(ns.path)) {
        if (!d.is_directory()) continue;
        auto name = d.path().filename().string();
        if (!validate_vm_name(name)) continue;
        if (!std::filesystem::exists(d.path() / vm_config_file)) continue;
        //else
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

static yajl_val get_property(yajl_val obj, const char* name, yajl_type type, const std::filesystem::path& config_path)
{
    const char* path[] = { name, NULL };
    auto val = yajl_tree_get(obj, path, type);
    if (!val || (type == yajl_t_number && !YAJL_IS_INTEGER(val))) {
        throw std::runtime_error(config_path.string() + ": missing or invalid property '" + name + "'");
    }
    return val;
}

static std::shared_ptr<yajl_val_s> parse_vm_config(const std::filesystem::path& config_path)
{
    std::ifstream f(config_path);
    if (!f) throw std::runtime_error("Failed to open " + config_path.string());
    std::stringstream buf;
    buf << f.rdbuf();

    char errorbuf[1024];
    std::shared_ptr<yajl_val_s> tree(yajl_tree_parse(buf.str().c_str(), errorbuf, sizeof(errorbuf)), yajl_tree_free);
    if (!tree) throw std::runtime_error(config_path.string() + ": " + errorbuf);
    if (!YAJL_IS_OBJECT(tree.get())) throw std::runtime_error(config_path.string() + ": not a JSON object");
    return tree;
}

static uint8_t get_id(yajl_val tree, const std::filesystem::path& config_path)
{
    auto id = YAJL_GET_INTEGER(get_property(tree, "id", yajl_t_number, config_path));
    if (id < 0 || id >= MAX_VMS) throw std::runtime_error(config_path.string() + ": id " + std::to_string(id) + " out of range");
    return (uint8_t)id;
}

VMConfig load_vm_config(const std::filesystem::path& config_path)
{
    auto tree = parse_vm_config(config_path);

    VMConfig vm;
    vm.id = get_id(tree.get(), config_path);
    vm.name = YAJL_GET_STRING(get_property(tree.get(), "name", yajl_t_string, config_path));
    vm.disk_path = YAJL_GET_STRING(get_property(tree.get(), "disk_path", yajl_t_string, config_path));
    auto disk_size = YAJL_GET_INTEGER(get_property(tree.get(), "disk_size", yajl_t_number, config_path));
    if (disk_size <= 0) throw std::runtime_error(config_path.string() + ": invalid disk_size");
    vm.disk_size = (uint64_t)disk_size;
    // older records have no format; qcow2 was the only one then
    const char* format_path[] = { "disk_format", NULL };
    auto format = yajl_tree_get(tree.get(), format_path, yajl_t_string);
    if (format) vm.disk_format = YAJL_GET_STRING(format);
    vm.network_mode = parse_network_mode(YAJL_GET_STRING(get_property(tree.get(), "network_mode", yajl_t_string, config_path)));
    vm.mac_address = YAJL_GET_STRING(get_property(tree.get(), "mac_address", yajl_t_string, config_path));
    if (!validate_mac_address(vm.mac_address)) {
        throw std::runtime_error(config_path.string() + ": invalid mac_address '" + vm.mac_address + "'");
    }
    return vm;
}

uint8_t load_vm_id(const std::filesystem::path& config_path)
{
    auto tree = parse_vm_config(config_path);
    return get_id(tree.get(), config_path);
}

VMConfig load_vm_config(const Namespace& ns, const std::string& name)
{
    auto config_path = get_vm_dir(ns, name) / vm_config_file;
    if (!std::filesystem::exists(config_path)) {
        throw VMError(ErrorCode::VMNotFound, "VM " + name + " does not exist");
    }
    return load_vm_config(config_path);
}

static void gen_string(yajl_gen gen, const std::string& str)
{
    yajl_gen_string(gen, (const unsigned char*)str.c_str(), str.length());
}

void save_vm_config(const VMConfig& vm, const std::filesystem::path& config_path)
{
    std::shared_ptr<yajl_gen_t> gen(yajl_gen_alloc(NULL), yajl_gen_free);
    yajl_gen_config(gen.get(), yajl_gen_beautify, 1);
    yajl_gen_map_open(gen.get());
    gen_string(gen.get(), "id");
    yajl_gen_integer(gen.get(), vm.id);
    gen_string(gen.get(), "name");
    gen_string(gen.get(), vm.name);
    gen_string(gen.get(), "disk_path");
    gen_string(gen.get(), vm.disk_path.string());
    gen_string(gen.get(), "disk_size");
    yajl_gen_integer(gen.get(), (long long)vm.disk_size);
    gen_string(gen.get(), "disk_format");
    gen_string(gen.get(), vm.disk_format);
    gen_string(gen.get(), "network_mode");
    gen_string(gen.get(), to_string(vm.network_mode));
    gen_string(gen.get(), "mac_address");
    gen_string(gen.get(), vm.mac_address);
    yajl_gen_map_close(gen.get());

    const unsigned char* buf;
    size_t len;
    if (yajl_gen_get_buf(gen.get(), &buf, &len) != yajl_gen_status_ok) throw std::runtime_error("yajl_gen_get_buf() failed");

    uuid_t uuid;
    char uuid_str[37];
    uuid_generate(uuid);
    uuid_unparse_lower(uuid, uuid_str);
    auto tmp_path = config_path.parent_path() / (std::string(".") + vm_config_file + '.' + uuid_str);

    try {
        auto fd = open(tmp_path.c_str(), O_WRONLY|O_CREAT|O_EXCL|O_CLOEXEC, 0644);
        if (fd < 0) throw std::runtime_error(std::string("open(") + tmp_path.string() + ") failed: " + strerror(errno));
        with_finally_clause([&]() {
            size_t written = 0;
            while (written < len) {
                auto r = ::write(fd, buf + written, len - written);
                if (r < 0) {
                    if (errno == EINTR) continue;
                    throw std::runtime_error("Failed writing to " + tmp_path.string() + ": " + strerror(errno));
                }
                written += r;
            }
            if (fsync(fd) < 0) throw std::runtime_error("fsync(" + tmp_path.string() + ") failed");
        }, [fd]() {
            close(fd);
        });
        std::filesystem::rename(tmp_path, config_path);
    }
    catch (...) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        throw;
    }
}
