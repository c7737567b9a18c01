#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>

#include <libsmartcols/libsmartcols.h>
#include <argparse/argparse.hpp>

#include "common.h"
#include "errors.h"
#include "config.h"
#include "namespace.h"
#include "registry.h"

struct Context {
    Config config;
    Namespace ns;
};

static uint32_t parse_memory(const std::string& str)
{
    static const uint64_t MiB = 1024ULL * 1024;
    auto memory = parse_size(str, MiB) / MiB;
    if (memory > UINT32_MAX) throw VMError(ErrorCode::InvalidArgument, "Memory size too large '" + str + "'");
    return (uint32_t)memory;
}

static int list(const Context& ctx, const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    program.add_argument("-c").help("Include configuration").default_value(false).implicit_value(true);
    program.add_argument("-s").help("Include status").default_value(false).implicit_value(true);
    program.add_argument("-name", "--name").help("Show this VM only");
    try {
        program.parse_args(args);
    }
    catch (const std::runtime_error& err) {
        std::cout << err.what() << std::endl;
        std::cout << program;
        return 1;
    }

    auto with_config = program.get<bool>("-c");
    auto with_status = program.get<bool>("-s");
    auto only = program.present("-name");
    auto vms = list_vms(ctx.ns, ctx.config);
    if (only) load_vm_config(ctx.ns, only.value()); // VMNotFound unless it exists

    std::shared_ptr<libscols_table> table(scols_new_table(), scols_unref_table);
    if (!table) throw std::runtime_error("scols_new_table() failed");
    scols_table_new_column(table.get(), "ID", 0.1, SCOLS_FL_RIGHT);
    scols_table_new_column(table.get(), "NAME", 0.1, 0);
    if (with_status) scols_table_new_column(table.get(), "STATE", 0.1, 0);
    if (with_config) {
        scols_table_new_column(table.get(), "NETWORK", 0.1, 0);
        scols_table_new_column(table.get(), "MAC ADDRESS", 0.1, 0);
        scols_table_new_column(table.get(), "SIZE", 0.1, SCOLS_FL_RIGHT);
        scols_table_new_column(table.get(), "DISK", 0.1, 0);
    }

    for (const auto& i:vms) {
        if (only && i.vm.name != only.value()) continue;
        auto line = scols_table_new_line(table.get(), NULL);
        if (!line) throw std::runtime_error("scols_table_new_line() failed");
        size_t col = 0;
        scols_line_set_data(line, col++, std::to_string(i.vm.id).c_str());
        scols_line_set_data(line, col++, i.vm.name.c_str());
        if (with_status) scols_line_set_data(line, col++, to_string(i.state).c_str());
        if (with_config) {
            scols_line_set_data(line, col++, to_string(i.vm.network_mode).c_str());
            scols_line_set_data(line, col++, i.vm.mac_address.c_str());
            scols_line_set_data(line, col++, human_readable(i.vm.disk_size).c_str());
            scols_line_set_data(line, col++, i.vm.disk_path.c_str());
        }
    }
    scols_print_table(table.get());

    return 0;
}

static int create(const Context& ctx, const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    program.add_argument("-name", "--name").help("VM name").required();
    program.add_argument("-size", "--size").help("Disk size (understand suffix K, M, G and T)").required();
    program.add_argument("-network", "--network").help("Network type: nat, bridge or none").default_value(std::string("nat"));
    try {
        program.parse_args(args);
    }
    catch (const std::runtime_error& err) {
        std::cout << err.what() << std::endl;
        std::cout << program;
        return 1;
    }

    auto size = parse_size(program.get<std::string>("-size"));
    auto network_mode = parse_network_mode(program.get<std::string>("-network"));
    create_vm(ctx.ns, ctx.config, program.get<std::string>("-name"), size, network_mode);
    return 0;
}

static int _clone(const Context& ctx, const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    program.add_argument("-name", "--name").help("VM to clone").required();
    program.add_argument("-as", "--as").help("Name of the new VM").required();
    try {
        program.parse_args(args);
    }
    catch (const std::runtime_error& err) {
        std::cout << err.what() << std::endl;
        std::cout << program;
        return 1;
    }

    clone_vm(ctx.ns, ctx.config, program.get<std::string>("-name"), program.get<std::string>("-as"));
    return 0;
}

static int modify(const Context& ctx, const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    program.add_argument("-name", "--name").help("VM name").required();
    program.add_argument("-network", "--network").help("Network type: nat, bridge or none").required();
    try {
        program.parse_args(args);
    }
    catch (const std::runtime_error& err) {
        std::cout << err.what() << std::endl;
        std::cout << program;
        return 1;
    }

    modify_vm(ctx.ns, ctx.config, program.get<std::string>("-name"), parse_network_mode(program.get<std::string>("-network")));
    return 0;
}

static int _delete(const Context& ctx, const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    program.add_argument("-name", "--name").help("VM name").required();
    try {
        program.parse_args(args);
    }
    catch (const std::runtime_error& err) {
        std::cout << err.what() << std::endl;
        std::cout << program;
        return 1;
    }

    delete_vm(ctx.ns, ctx.config, program.get<std::string>("-name"));
    return 0;
}

static int state(const Context& ctx, const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    program.add_argument("-name", "--name").help("VM name (all VMs if omitted)");
    try {
        program.parse_args(args);
    }
    catch (const std::runtime_error& err) {
        std::cout << err.what() << std::endl;
        std::cout << program;
        return 1;
    }

    auto name = program.present("-name");
    if (name) {
        std::cout << to_string(get_vm_state(ctx.ns, ctx.config, name.value())) << std::endl;
    } else {
        for (const auto& i : list_vms(ctx.ns, ctx.config)) {
            std::cout << i.vm.name << '\t' << to_string(i.state) << std::endl;
        }
    }
    return 0;
}

static int run(const Context& ctx, const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    program.add_argument("-name", "--name").help("VM name").required();
    program.add_argument("-memory", "--memory").help("Memory size in MB (understand suffix M and G)").required();
    try {
        program.parse_args(args);
    }
    catch (const std::runtime_error& err) {
        std::cout << err.what() << std::endl;
        std::cout << program;
        return 1;
    }

    run_vm(ctx.ns, ctx.config, program.get<std::string>("-name"), parse_memory(program.get<std::string>("-memory")));
    return 0;
}

static int install(const Context& ctx, const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    program.add_argument("-name", "--name").help("VM name").required();
    program.add_argument("-memory", "--memory").help("Memory size in MB (understand suffix M and G)").required();
    program.add_argument("-media", "--media").help("Installation medium (ISO image) to boot from").required();
    try {
        program.parse_args(args);
    }
    catch (const std::runtime_error& err) {
        std::cout << err.what() << std::endl;
        std::cout << program;
        return 1;
    }

    install_vm(ctx.ns, ctx.config, program.get<std::string>("-name"), parse_memory(program.get<std::string>("-memory")),
        program.get<std::string>("-media"));
    return 0;
}

static int stop(const Context& ctx, const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    program.add_argument("-name", "--name").help("VM name").required();
    program.add_argument("-f", "--force").help("Force kill vm").default_value(false).implicit_value(true);
    try {
        program.parse_args(args);
    }
    catch (const std::runtime_error& err) {
        std::cout << err.what() << std::endl;
        std::cout << program;
        return 1;
    }

    stop_vm(ctx.ns, ctx.config, program.get<std::string>("-name"), program.get<bool>("-f"));
    return 0;
}

static const std::map<std::string,std::pair<int (*)(const Context&, const std::vector<std::string>&),std::string> > subcommands {
  {"list", {list, "List VMs"}},
  {"create", {create, "Create new VM"}},
  {"clone", {_clone, "Clone a stopped VM"}},
  {"modify", {modify, "Change network mode of a stopped VM"}},
  {"delete", {_delete, "Delete a stopped VM"}},
  {"state", {state, "Show whether VM is running"}},
  {"run", {run, "Start VM"}},
  {"install", {install, "Start VM booting from installation medium"}},
  {"stop", {stop, "Stop VM"}},
};

static void show_subcommands()
{
    for (auto i = subcommands.cbegin(); i != subcommands.cend(); i++) {
        std::cout << i->first << '\t' << i->second.second << std::endl;
    }
}

static void usage(const std::string& progname)
{
    std::cout << "Usage: " << progname << " [--config FILE] [--debug] <subcommand> [-h] [arguments...]" << std::endl;
    std::cout << "Valid subcommands are:" << std::endl;
    show_subcommands();
}

static int _main(int argc, char* argv[])
{
    std::string progname(argv[0]);
    auto env_config = getenv("VMMGR_CONFIG");
    std::filesystem::path config_path = env_config? env_config : default_config_path;

    int i = 1;
    for (; i < argc && argv[i][0] == '-'; i++) {
        std::string opt(argv[i]);
        if (opt == "--debug") {
            debug = true;
        } else if (opt == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (opt == "-h" || opt == "--help") {
            usage(progname);
            return 0;
        } else {
            std::cout << "Invalid option '" << opt << "'." << std::endl;
            usage(progname);
            return 1;
        }
    }

    if (i >= argc) {
        std::cout << "Subcommand not specified." << std::endl;
        usage(progname);
        return 1;
    }

    std::string subcommand(argv[i]);

    if (!subcommands.contains(subcommand)) {
        std::cout << "Invalid subcommand '" << subcommand << "'." << std::endl;
        usage(progname);
        return 1;
    }

    std::vector<std::string> args;

    args.push_back(progname + ' ' + subcommand);
    for (i++; i < argc; i++) {
        args.push_back(argv[i]);
    }

    try {
        Context ctx;
        ctx.config = load_config(config_path);
        ctx.ns = get_namespace(ctx.config.vm_root, get_acting_user());
        return subcommands.at(subcommand).first(ctx, args);
    }
    catch (const VMError& e) {
        std::cerr << error_name(e.code()) << ": " << e.what() << std::endl;
        return e.exit_status();
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return (int)ErrorCode::Generic;
    }
}

#ifdef __MAIN_MODULE__
int main(int argc, char* argv[]) { return _main(argc, argv); }
#endif
