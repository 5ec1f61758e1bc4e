#include "include/confinement.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();
const double PI = 3.14159265358979323846;

double degrees(double radians) {
    return radians * 180.0 / PI;
}

}  // namespace


// ============================================================================
// ConfinementKernel
// ============================================================================

ConfinementKernel::ConfinementKernel(int neighborhood, int nrows, int ncols)
    : neighborhood(neighborhood), nrows(nrows), ncols(ncols), row(0), col(0) {}

void ConfinementKernel::update(int row, int col) {
    this->row = row;
    this->col = col;
}

int ConfinementKernel::rotate(int direction, int steps) {
    return ((direction - 1 + steps) % 8 + 8) % 8 + 1;
}

std::vector<Pixel> ConfinementKernel::window(int direction) const {
    const auto dir = FlowRaster::d8_tau[direction];
    std::vector<Pixel> pixels;
    for (int k = 1; k <= neighborhood; k++) {
        const int r = row + k * richdem::d8y[dir];
        const int c = col + k * richdem::d8x[dir];
        if (r < 0 || r >= nrows || c < 0 || c >= ncols) {
            break;
        }
        pixels.emplace_back(r, c);
    }
    return pixels;
}

double ConfinementKernel::max_height(int direction, const ValueRaster& dem) const {
    const auto pixels = window(direction);
    if (pixels.empty()) {
        return NaN;
    }

    double height = -std::numeric_limits<double>::infinity();
    for (const auto& pixel : pixels) {
        const double value = dem(pixel);
        if (std::isnan(value)) {
            return NaN;
        }
        height = std::max(height, value);
    }
    return height;
}

std::pair<double, double> ConfinementKernel::orthogonal_slopes(int flow, double length,
                                                               const ValueRaster& dem) const {
    const double center = dem(row, col);
    if (std::isnan(center)) {
        return {NaN, NaN};
    }

    // The two directions at 90 degrees to the flow
    const double clockwise = max_height(rotate(flow, -2), dem);
    const double counterclock = max_height(rotate(flow, 2), dem);
    return {(clockwise - center) / length, (counterclock - center) / length};
}

// ============================================================================
// ConfinementAngles
// ============================================================================

ConfinementAngles::ConfinementAngles(const FlowRaster& flow, const ConfinementParams& params)
    : flow(flow), params(params)
{
    if (params.neighborhood < 1) {
        throw std::invalid_argument("neighborhood must be a positive integer");
    }
    if (!(params.dem_per_m > 0) || std::isinf(params.dem_per_m)) {
        throw std::invalid_argument("dem_per_m must be a positive, finite number");
    }
}

double ConfinementAngles::lateral_length(int flow_number) const {
    const double scale = params.neighborhood * params.dem_per_m;
    const double width = flow.dx(LengthUnits::Meters);
    const double height = flow.dy(LengthUnits::Meters);

    if (flow_number == 1 || flow_number == 5) {
        return height * scale;
    } else if (flow_number == 3 || flow_number == 7) {
        return width * scale;
    }
    return std::hypot(width, height) * scale;
}

double ConfinementAngles::segment_angle(const std::vector<Pixel>& pixels, ConfinementKernel& kernel,
                                        const ValueRaster& dem) const {
    // Any NoData flow direction invalidates the whole segment
    for (const auto& pixel : pixels) {
        if (!flow.is_valid(pixel)) {
            return NaN;
        }
    }
    if (pixels.empty()) {
        return NaN;
    }

    double clockwise = 0;
    double counterclock = 0;
    for (const auto& pixel : pixels) {
        const int flow_number = flow.taudem(pixel.row, pixel.col);
        kernel.update(pixel.row, pixel.col);
        const auto slopes = kernel.orthogonal_slopes(flow_number, lateral_length(flow_number), dem);
        clockwise += std::atan(slopes.first);
        counterclock += std::atan(slopes.second);
    }

    const double npixels = static_cast<double>(pixels.size());
    return 180.0 - degrees(clockwise / npixels) - degrees(counterclock / npixels);
}

std::vector<double> ConfinementAngles::angles(const std::vector<std::vector<Pixel>>& indices,
                                              const ValueRaster& dem) const {
    ConfinementKernel kernel(params.neighborhood, flow.rows(), flow.cols());
    std::vector<double> theta(indices.size(), NaN);
    for (size_t k = 0; k < indices.size(); k++) {
        theta[k] = segment_angle(indices[k], kernel, dem);
    }
    return theta;
}
