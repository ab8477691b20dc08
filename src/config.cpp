#include "config.hpp"

namespace runner {
using namespace std;

double DEFAULT_TIME_LIMIT = 5;           // 5s
double COMPILE_TIME_LIMIT = 30;          // 30s
size_t MAX_SOURCE_SIZE = 1 << 20;        // 1M
size_t OUTPUT_LIMIT = 1 << 24;           // 16M

filesystem::path RUN_DIR = "/tmp/code-runner";

}  // namespace runner
