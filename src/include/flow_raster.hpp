#pragma once

#include "stream_errors.hpp"

#include <richdem/common/Array2D.hpp>
#include <richdem/common/constants.hpp>

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>


/**
 * @brief Units for lengths and areas measured on the flow raster grid
 *
 * Base is the unit of the CRS (and affine transform). The remaining options
 * are converted through the size of one base unit in meters.
 */
enum class LengthUnits {
    Base,
    Meters,
    Kilometers,
    Feet,
    Miles
};

LengthUnits parse_units(const std::string& name);
std::string units_name(LengthUnits units);

/**
 * @brief A raster pixel, by row and column
 */
struct Pixel {
    int row;
    int col;

    Pixel() : row(0), col(0) {}
    Pixel(int row, int col) : row(row), col(col) {}

    bool operator==(const Pixel& other) const { return row == other.row && col == other.col; }
    bool operator!=(const Pixel& other) const { return !(*this == other); }
};

/**
 * @brief A point in the coordinates of the flow raster CRS
 */
struct Point {
    double x;
    double y;

    Point() : x(0), y(0) {}
    Point(double x, double y) : x(x), y(y) {}

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
    bool operator<(const Point& other) const { return x < other.x || (x == other.x && y < other.y); }
};

using Polyline = std::vector<Point>;

/**
 * @brief Returns true if a value matches a NoData value. NaN always counts as NoData.
 */
template<typename T>
bool is_nodata_value(T value, T nodata) {
    if constexpr (std::is_floating_point<T>::value) {
        if (std::isnan(value)) {
            return true;
        }
        if (std::isnan(nodata)) {
            return false;
        }
    }
    return value == nodata;
}

// ============================================================================
// FLOW DIRECTIONS
// ============================================================================

/**
 * @brief Immutable D8 flow direction raster with its georeferencing
 *
 * Input flow numbers follow the TauDEM convention:
 *
 *      4 3 2
 *      5 X 1
 *      6 7 8
 *
 * They are converted once to richdem flow directions so that neighbors are
 * located with richdem::d8x / richdem::d8y. Pixels whose value is NoData are
 * stored as richdem::NO_FLOW.
 *
 * The raster is shared (read-only) by every StreamSegments copy and by the
 * parallel basin workers.
 */
class FlowRaster {
public:
    /**
     * @brief Validates and converts a TauDEM flow direction raster
     *
     * @tparam T: Data type of the input raster.
     * @param flow: TauDEM D8 flow numbers (1-8). Other values must be NoData.
     * @param meters_per_unit: Length of one CRS base unit in meters.
     */
    template<typename T>
    explicit FlowRaster(const richdem::Array2D<T>& flow, double meters_per_unit = 1.0);

    int rows() const { return dirs.height(); }
    int cols() const { return dirs.width(); }
    bool in_grid(int row, int col) const { return dirs.inGrid(col, row); }
    bool in_grid(const Pixel& pixel) const { return dirs.inGrid(pixel.col, pixel.row); }

    bool has_transform() const;
    bool has_crs() const { return !crs.empty(); }
    void require_transform(const std::string& name = "flow direction raster") const;
    void require_crs(const std::string& reason) const;

    const std::vector<double>& geotransform() const { return transform; }
    const std::string& projection() const { return crs; }
    double meters_per_unit() const { return unit_meters; }

    /** @brief The richdem flow direction grid (indexed x=col, y=row) */
    const richdem::Array2D<richdem::flowdir_t>& flowdirs() const { return dirs; }

    /** @brief TauDEM flow number of a pixel, or 0 if the pixel is NoData */
    uint8_t taudem(int row, int col) const { return d8_tau[dirs(col, row)]; }

    bool is_valid(int row, int col) const { return dirs(col, row) != richdem::NO_FLOW; }
    bool is_valid(const Pixel& pixel) const { return is_valid(pixel.row, pixel.col); }

    /**
     * @brief Locates the pixel immediately downstream of a valid pixel
     *
     * The returned pixel may lie outside the raster when flow leaves the grid.
     */
    Pixel downstream(const Pixel& pixel) const {
        const auto dir = dirs(pixel.col, pixel.row);
        return Pixel(pixel.row + richdem::d8y[dir], pixel.col + richdem::d8x[dir]);
    }

    /** @brief True if a valid pixel drains directly into the target pixel */
    bool drains_to(const Pixel& pixel, const Pixel& target) const {
        return is_valid(pixel) && downstream(pixel) == target;
    }

    // Affine transform
    Point center(const Pixel& pixel) const;
    Pixel pixel_at(const Point& point) const;

    /**
     * @brief Pixel of a polyline vertex
     *
     * A vertex on a pixel corner (a split point in the middle of a diagonal
     * step) belongs to the pixel the line enters next.
     */
    Pixel vertex_pixel(const Polyline& line, size_t k) const;

    // Resolution and unit conversion
    double dx(LengthUnits units = LengthUnits::Base) const;
    double dy(LengthUnits units = LengthUnits::Base) const;
    double pixel_diagonal(LengthUnits units = LengthUnits::Base) const;
    double pixel_area(LengthUnits units = LengthUnits::Base) const;
    double to_base(double length, LengthUnits units) const;
    double from_base(double length, LengthUnits units) const;

    /**
     * @brief Checks that a raster matches the shape, transform and CRS of the flow raster
     *
     * A raster without a transform or CRS inherits the flow raster's metadata.
     *
     * @param raster: The raster being checked
     * @param name: Name of the raster for error messages
     */
    template<typename T>
    void check_conforms(const richdem::Array2D<T>& raster, const std::string& name) const;

    /** @brief Blank raster with the flow raster's shape and georeferencing */
    template<typename T>
    richdem::Array2D<T> new_raster(const T& value = T()) const;

    /** @brief TauDEM flow number to richdem direction, and back. The map is its own inverse. */
    static constexpr std::array<uint8_t, 9> d8_tau = {0, 5, 4, 3, 2, 1, 8, 7, 6};

private:
    richdem::Array2D<richdem::flowdir_t> dirs;
    std::vector<double> transform;
    std::string crs;
    double unit_meters;
};

// ============================================================================
// DATA RASTERS
// ============================================================================

/**
 * @brief Canonical data raster used for summaries and confinement angles
 *
 * Values are stored as double and NoData values become NaN on construction,
 * so downstream code only needs to test for NaN.
 */
class ValueRaster {
public:
    template<typename T>
    ValueRaster(const richdem::Array2D<T>& raster, const FlowRaster& flow, const std::string& name);

    double operator()(int row, int col) const { return data(col, row); }
    double operator()(const Pixel& pixel) const { return data(pixel.col, pixel.row); }
    bool is_nodata(int row, int col) const { return std::isnan(data(col, row)); }

    int rows() const { return data.height(); }
    int cols() const { return data.width(); }
    const richdem::Array2D<double>& values() const { return data; }
    const std::string& name() const { return raster_name; }

    /**
     * @brief Throws std::invalid_argument if a data value falls outside [min, max]
     */
    void check_range(double min, double max) const;

private:
    richdem::Array2D<double> data;
    std::string raster_name;
};

/**
 * @brief Canonical boolean raster. NoData pixels are false.
 */
class MaskRaster {
public:
    template<typename T>
    MaskRaster(const richdem::Array2D<T>& raster, const FlowRaster& flow, const std::string& name);

    bool operator()(int row, int col) const { return data(col, row) != 0; }
    bool operator()(const Pixel& pixel) const { return data(pixel.col, pixel.row) != 0; }

    int rows() const { return data.height(); }
    int cols() const { return data.width(); }
    const richdem::Array2D<uint8_t>& values() const { return data; }
    const std::string& name() const { return raster_name; }

private:
    richdem::Array2D<uint8_t> data;
    std::string raster_name;
};


// ============================================================================
// IMPLEMENTATION - Template Functions
// ============================================================================

template<typename T>
FlowRaster::FlowRaster(const richdem::Array2D<T>& flow, double meters_per_unit)
    : dirs(flow, richdem::NO_FLOW), transform(flow.geotransform), crs(flow.projection),
      unit_meters(meters_per_unit)
{
    if (!(meters_per_unit > 0) || !std::isfinite(meters_per_unit)) {
        throw std::invalid_argument("meters_per_unit must be a positive, finite number");
    }

    const T nodata = flow.noData();
    auto vals_are_ok = true;
    #pragma omp parallel for collapse(2) reduction(&&:vals_are_ok)
    for (int y = 0; y < flow.height(); y++) {
        for (int x = 0; x < flow.width(); x++) {
            const T value = flow(x, y);
            if (is_nodata_value(value, nodata)) {
                continue;
            }
            const double number = static_cast<double>(value);
            if (number >= 1 && number <= 8 && number == std::floor(number)) {
                dirs(x, y) = d8_tau[static_cast<int>(number)];
            } else {
                vals_are_ok = false;
            }
        }
    }

    if (!vals_are_ok) {
        throw std::invalid_argument(
            "The flow direction raster must contain TauDEM D8 flow numbers (1 through 8) "
            "or NoData values");
    }
}

template<typename T>
void FlowRaster::check_conforms(const richdem::Array2D<T>& raster, const std::string& name) const {
    if (raster.width() != dirs.width() || raster.height() != dirs.height()) {
        throw RasterMetadataError(
            "The shape of the " + name + " (" + std::to_string(raster.height()) + " x "
            + std::to_string(raster.width()) + ") does not match the shape of the flow "
            "direction raster (" + std::to_string(rows()) + " x " + std::to_string(cols()) + ")");
    }

    const bool raster_has_transform = raster.geotransform.size() == 6
        && raster.geotransform[1] != 0 && raster.geotransform[5] != 0;
    if (raster_has_transform && has_transform() && raster.geotransform != transform) {
        throw RasterMetadataError(
            "The affine transform of the " + name + " does not match the transform of "
            "the flow direction raster");
    }
    if (!raster.projection.empty() && has_crs() && raster.projection != crs) {
        throw RasterMetadataError(
            "The CRS of the " + name + " does not match the CRS of the flow direction raster");
    }
}

template<typename T>
richdem::Array2D<T> FlowRaster::new_raster(const T& value) const {
    richdem::Array2D<T> raster(dirs.width(), dirs.height(), value);
    raster.geotransform = transform;
    raster.projection = crs;
    return raster;
}

template<typename T>
ValueRaster::ValueRaster(const richdem::Array2D<T>& raster, const FlowRaster& flow,
                         const std::string& name)
    : data(raster, std::numeric_limits<double>::quiet_NaN()), raster_name(name)
{
    flow.check_conforms(raster, name);
    data.geotransform = flow.geotransform();
    data.projection = flow.projection();
    data.setNoData(std::numeric_limits<double>::quiet_NaN());

    const T nodata = raster.noData();
    #pragma omp parallel for collapse(2)
    for (int y = 0; y < raster.height(); y++) {
        for (int x = 0; x < raster.width(); x++) {
            const T value = raster(x, y);
            if (!is_nodata_value(value, nodata)) {
                data(x, y) = static_cast<double>(value);
            }
        }
    }
}

template<typename T>
MaskRaster::MaskRaster(const richdem::Array2D<T>& raster, const FlowRaster& flow,
                       const std::string& name)
    : data(raster, 0), raster_name(name)
{
    flow.check_conforms(raster, name);
    data.geotransform = flow.geotransform();
    data.projection = flow.projection();

    const T nodata = raster.noData();
    auto vals_are_ok = true;
    #pragma omp parallel for collapse(2) reduction(&&:vals_are_ok)
    for (int y = 0; y < raster.height(); y++) {
        for (int x = 0; x < raster.width(); x++) {
            const T value = raster(x, y);
            if (is_nodata_value(value, nodata)) {
                continue;
            }
            if (value == T(1)) {
                data(x, y) = 1;
            } else if (value != T(0)) {
                vals_are_ok = false;
            }
        }
    }

    if (!vals_are_ok) {
        throw std::invalid_argument(
            "The " + name + " must be a boolean raster (only 0, 1, or NoData values)");
    }
}
