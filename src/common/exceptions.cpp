#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace runner {
using namespace std;

runner_exception::runner_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runner_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runner_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : runner_exception(message) {}

}  // namespace runner
