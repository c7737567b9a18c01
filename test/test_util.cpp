#include <stdlib.h>
#include <sys/stat.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "registry.h"
#include "test_util.h"

// behaves like "qemu-system-x86_64 ... -daemonize": checks arguments, leaves a
// background process carrying the same argv behind and exits.
// <image>.denied makes opening that image fail with EACCES.
static const char* fake_qemu = R"(#!/bin/sh
prev=
for arg in "$@"; do
  case "$arg" in
    file=*)
      path="${arg#file=}"
      path="${path%%,*}"
      if [ -e "$path.denied" ]; then
        echo "qemu-system-x86_64: -drive $arg: Could not open '$path': Permission denied" >&2
        exit 1
      fi;;
    bridge,br=acl-denied,*)
      echo "access denied by acl file" >&2
      echo "qemu-system-x86_64: -netdev $arg: bridge helper failed" >&2
      exit 1;;
    bridge,*)
      echo "failed to create tun device: Operation not permitted" >&2
      echo "qemu-system-x86_64: -netdev $arg: bridge helper failed" >&2
      exit 1;;
  esac
  if [ "$prev" = "-m" ] && [ "$arg" -gt 1048576 ]; then
    echo "qemu-system-x86_64: cannot set up guest memory 'pc.ram': Cannot allocate memory" >&2
    exit 1
  fi
  prev="$arg"
done
( while :; do sleep 1; done ) </dev/null >/dev/null 2>&1 &
exit 0
)";

TestEnv::TestEnv()
{
    char tmpl[] = "/tmp/vmmgr-test-XXXXXX";
    if (!mkdtemp(tmpl)) throw std::runtime_error("mkdtemp() failed");
    root = tmpl;
    ns = get_namespace(root, "tester");
    std::filesystem::create_directory(ns.path);

    write_file(root / "fake-qemu", fake_qemu, true);

    config.vm_root = root;
    config.qemu = (root / "fake-qemu").string();
    config.disk_format = "raw";
    config.kvm = false;
    config.bridge = "br0";
    config.bridge_helper = root / "qemu-bridge-helper";
    config.sysfs_net = root / "sys-class-net";
    config.lock_timeout = 10;
    config.launch_timeout = 5;
    config.stop_timeout = 5;
}

TestEnv::~TestEnv()
{
    // never leave fake hypervisors behind
    try {
        if (std::filesystem::is_directory(ns.path)) {
            for (const auto& i : list_vms(ns, config)) {
                if (i.state == RuntimeState::RUNNING) terminate_vm(i.vm, true, config);
            }
        }
    }
    catch (const std::exception&) {
        // the test has already reported its failure
    }
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

void TestEnv::provide_bridge()
{
    std::filesystem::create_directories(config.sysfs_net / config.bridge / "bridge");
    write_file(config.bridge_helper, "#!/bin/sh\nexit 1\n", true);
}

void TestEnv::write_file(const std::filesystem::path& path, const std::string& content, bool executable/* = false*/)
{
    {
        std::ofstream f(path, std::ios::binary);
        if (!f) throw std::runtime_error("Failed to open " + path.string());
        f << content;
    }
    if (executable) chmod(path.c_str(), 0755);
}

std::string TestEnv::read_file(const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::binary);
    std::stringstream buf;
    buf << f.rdbuf();
    return buf.str();
}
