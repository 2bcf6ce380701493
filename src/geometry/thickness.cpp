#include <panelkit/geometry/thickness.h>

#include <sstream>

namespace panelkit::geometry {

std::string Thickness::to_string() const {
    std::ostringstream oss;
    oss << "Thickness(" << left << ", " << top << ", " << right << ", " << bottom << ")";
    return oss.str();
}

} // namespace panelkit::geometry
