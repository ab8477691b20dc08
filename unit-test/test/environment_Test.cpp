#include "test/environment.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <vector>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace runner {
using namespace std;

void setup_test_environment() {
    RUN_DIR = filesystem::path("/tmp/test/run");
    filesystem::create_directories(RUN_DIR);
    CHECK(filesystem::is_directory(RUN_DIR))
        << "Run directory " << RUN_DIR << " does not exist";
}

bool has_tool(const string &name) {
    vector<string> dirs;
    string path = get_env("PATH", "");
    boost::algorithm::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        filesystem::path candidate = filesystem::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

filesystem::path make_script(const filesystem::path &dir, const string &name, const string &body) {
    filesystem::create_directories(dir);
    filesystem::path script = dir / name;
    write_file_content(script, "#!/bin/sh\n" + body + "\n");
    filesystem::permissions(script, filesystem::perms::owner_all);
    return filesystem::absolute(script);
}

}  // namespace runner
