#include <panelkit/geometry/point.h>

#include <sstream>

namespace panelkit::geometry {

std::string Point::to_string() const {
    std::ostringstream oss;
    oss << "Point(" << x << ", " << y << ")";
    return oss.str();
}

} // namespace panelkit::geometry
