#include "common/io_utils.hpp"
#include <errno.h>
#include <algorithm>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"

namespace runner {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw internal_error("subpath is not safe " + subpath);
    return subpath;
}

int count_directories_in_directory(const fs::path &dir) {
    if (!fs::is_directory(dir))
        return -1;
    return count_if(fs::directory_iterator(dir), {}, [](const fs::directory_entry &entry) { return entry.is_directory(); });
}

}  // namespace runner
