#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace runner {

scoped_guard::scoped_guard() : f() {}
scoped_guard::scoped_guard(const std::function<void()> &f) : f(f) {}
scoped_guard::scoped_guard(scoped_guard &&other) : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    // 析构函数不能抛出异常，否则在栈展开时会直接 terminate
    try {
        f();
    } catch (std::exception &e) {
        LOG(ERROR) << "Deferred action failed: " << e.what();
    }
}

scoped_guard scoped_guard::operator+(const std::function<void()> &f) const {
    return scoped_guard(f);
}

}  // namespace runner
