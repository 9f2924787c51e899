#include <ridesim/core/types.hpp>

namespace ridesim::core {

std::string to_string(Location location) {
    return "(" + std::to_string(location.row) + "," + std::to_string(location.col) + ")";
}

std::ostream& operator<<(std::ostream& os, Location location) {
    return os << '(' << location.row << ',' << location.col << ')';
}

} // namespace ridesim::core
