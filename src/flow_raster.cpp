#include "include/flow_raster.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

// Length of one unit in meters
double meters_in(LengthUnits units) {
    switch (units) {
        case LengthUnits::Meters:     return 1.0;
        case LengthUnits::Kilometers: return 1000.0;
        case LengthUnits::Feet:       return 0.3048;
        case LengthUnits::Miles:      return 1609.344;
        case LengthUnits::Base:       break;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

}  // namespace


LengthUnits parse_units(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "base")       return LengthUnits::Base;
    if (lower == "meters")     return LengthUnits::Meters;
    if (lower == "kilometers") return LengthUnits::Kilometers;
    if (lower == "feet")       return LengthUnits::Feet;
    if (lower == "miles")      return LengthUnits::Miles;

    throw std::invalid_argument(
        "Unsupported units (" + name + "). Supported options are: "
        "base, meters, kilometers, feet, miles");
}

std::string units_name(LengthUnits units) {
    switch (units) {
        case LengthUnits::Base:       return "base";
        case LengthUnits::Meters:     return "meters";
        case LengthUnits::Kilometers: return "kilometers";
        case LengthUnits::Feet:       return "feet";
        case LengthUnits::Miles:      return "miles";
    }
    return "unknown";
}

// ============================================================================
// FlowRaster
// ============================================================================

bool FlowRaster::has_transform() const {
    return transform.size() == 6 && transform[1] != 0 && transform[5] != 0;
}

void FlowRaster::require_transform(const std::string& name) const {
    if (!has_transform()) {
        throw MissingTransformError("The " + name + " must have an affine Transform");
    }
}

void FlowRaster::require_crs(const std::string& reason) const {
    if (!has_crs()) {
        throw MissingCRSError(reason + " because the flow direction raster does not have a CRS");
    }
}

Point FlowRaster::center(const Pixel& pixel) const {
    require_transform();
    // x = gt[0] + col * gt[1] + row * gt[2]
    // y = gt[3] + col * gt[4] + row * gt[5]
    const double col = pixel.col + 0.5;
    const double row = pixel.row + 0.5;
    return Point(transform[0] + col * transform[1] + row * transform[2],
                 transform[3] + col * transform[4] + row * transform[5]);
}

Pixel FlowRaster::pixel_at(const Point& point) const {
    require_transform();
    // Inverse transform assumes a north-up raster (gt[2] = gt[4] = 0)
    const int col = static_cast<int>(std::floor((point.x - transform[0]) / transform[1]));
    const int row = static_cast<int>(std::floor((point.y - transform[3]) / transform[5]));
    return Pixel(row, col);
}

Pixel FlowRaster::vertex_pixel(const Polyline& line, size_t k) const {
    require_transform();
    const Point& point = line[k];
    const double col = (point.x - transform[0]) / transform[1];
    const double row = (point.y - transform[3]) / transform[5];
    if (line.size() < 2 || col != std::floor(col) || row != std::floor(row)) {
        return pixel_at(point);
    }

    if (k + 1 < line.size()) {
        return pixel_at(line[k + 1]);
    }
    // Reflect the previous pixel through the corner
    const Pixel previous = pixel_at(line[k - 1]);
    return Pixel(2 * static_cast<int>(row) - previous.row - 1,
                 2 * static_cast<int>(col) - previous.col - 1);
}

double FlowRaster::dx(LengthUnits units) const {
    require_transform();
    return from_base(std::abs(transform[1]), units);
}

double FlowRaster::dy(LengthUnits units) const {
    require_transform();
    return from_base(std::abs(transform[5]), units);
}

double FlowRaster::pixel_diagonal(LengthUnits units) const {
    return std::hypot(dx(units), dy(units));
}

double FlowRaster::pixel_area(LengthUnits units) const {
    return dx(units) * dy(units);
}

double FlowRaster::to_base(double length, LengthUnits units) const {
    if (units == LengthUnits::Base) {
        return length;
    }
    require_crs("Cannot convert from " + units_name(units));
    return length * meters_in(units) / unit_meters;
}

double FlowRaster::from_base(double length, LengthUnits units) const {
    if (units == LengthUnits::Base) {
        return length;
    }
    require_crs("Cannot convert to " + units_name(units));
    return length * unit_meters / meters_in(units);
}

// ============================================================================
// ValueRaster
// ============================================================================

void ValueRaster::check_range(double min, double max) const {
    for (int y = 0; y < data.height(); y++) {
        for (int x = 0; x < data.width(); x++) {
            const double value = data(x, y);
            if (std::isnan(value)) {
                continue;
            }
            if (value < min || value > max) {
                std::ostringstream message;
                message << "The data elements of the " << raster_name << " must be ";
                if (std::isinf(max)) {
                    message << ">= " << min;
                } else {
                    message << "between " << min << " and " << max;
                }
                message << ", but pixel (row=" << y << ", col=" << x << ") has value " << value;
                throw std::invalid_argument(message.str());
            }
        }
    }
}
