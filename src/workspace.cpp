#include "workspace.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/io_utils.hpp"

namespace runner {
using namespace std;
namespace fs = std::filesystem;

static string random_uuid() {
    // random_generator 不是线程安全的，每个线程持有一个
    thread_local boost::uuids::random_generator generator;
    return boost::lexical_cast<string>(generator());
}

workspace::workspace(const fs::path &root) {
    fs::path base = fs::absolute(root);
    fs::create_directories(base);
    // uuid 重复的概率可以忽略，但 create_directory 返回 false 时说明文件夹已存在，换一个名字
    do {
        dir = base / random_uuid();
    } while (!fs::create_directory(dir));

    // 构造函数抛出异常时析构函数不会执行，需要在这里删除刚创建的文件夹
    error_code ec;
    fs::permissions(dir, fs::perms::owner_all, ec);
    if (ec) {
        fs::path failed = dir;
        release();
        throw fs::filesystem_error("unable to set permissions of workspace", failed, ec);
    }
    DLOG(INFO) << "Created workspace " << dir;
}

workspace::~workspace() {
    release();
}

const fs::path &workspace::path() const {
    return dir;
}

fs::path workspace::write_file(const string &name, const string &content) const {
    fs::path file = dir / assert_safe_path(name);
    write_file_content(file, content);
    return file;
}

bool workspace::release() noexcept {
    if (dir.empty()) return true;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(ERROR) << "Unable to delete workspace " << dir << ": " << ec.message();
    } else {
        DLOG(INFO) << "Deleted workspace " << dir;
    }
    bool removed = !fs::exists(dir, ec);
    dir.clear();
    return removed;
}

}  // namespace runner
