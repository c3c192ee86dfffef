#include "starjudge/config.hpp"
#include <system_error>

namespace starjudge {
using namespace std;

int COMPILE_TIME_LIMIT = 15000;  // 15s
int RUN_TIME_LIMIT = 1500;       // 1.5s

size_t MESSAGE_LIMIT = 500;
size_t OUTPUT_LIMIT = 1 << 26;        // 64M
size_t MAX_CODE_LENGTH = 100000;      // 100K
size_t MAX_INPUT_LENGTH = 10000000;   // 10M
size_t CACHE_MAX_ENTRIES = 0;

filesystem::path default_work_dir() {
    error_code ec;
    filesystem::path tmp = filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return tmp / "starstack-oj";
}

filesystem::path WORK_DIR = default_work_dir();
filesystem::path CACHE_DIR = default_work_dir() / "cache";
bool DEBUG = false;

}  // namespace starjudge
