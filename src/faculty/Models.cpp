#include "faculty/Models.hpp"

namespace faculty {

const std::string& FacultyRecord::department_or_unknown() const {
    static const std::string unknown = "Unknown";
    return department ? *department : unknown;
}

}  // namespace faculty
