#include "config.hpp"

namespace dcx {
using namespace std;

size_t OUTPUT_LIMIT_BYTES = 16 << 20;  // 16M
filesystem::path RUN_DIR = "/tmp/dcx";
string CGROUP_ROOT;
bool ISOLATE_NAMESPACES = false;
string DOCKER_BIN = "docker";
bool DEBUG = false;

}  // namespace dcx
