#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace runner {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::UNSUPPORTED, "Unsupported")
    (status::COMPILER_NOT_FOUND, "Compiler Not Found")
    (status::RUNTIME_NOT_FOUND, "Runtime Not Found")
    (status::INTERNAL_ERROR, "Internal Error");

static const unordered_map<status, int> status_id = boost::assign::map_list_of
    (status::ACCEPTED, 3)
    (status::COMPILATION_ERROR, 6)
    (status::TIME_LIMIT_EXCEEDED, 5)
    (status::RUNTIME_ERROR, 11)
    (status::UNSUPPORTED, -1)
    (status::COMPILER_NOT_FOUND, -1)
    (status::RUNTIME_NOT_FOUND, -1)
    (status::INTERNAL_ERROR, -1);
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

int get_status_id(status stat) {
    return status_id.at(stat);
}

}  // namespace runner
