#pragma once

#include "flow_raster.hpp"

#include <utility>
#include <vector>


/**
 * @brief Parameters for confinement angles
 */
struct ConfinementParams {
    int neighborhood;       // Number of pixels searched on each side of the stream
    double dem_per_m;       // DEM vertical units per meter

    ConfinementParams() : neighborhood(1), dem_per_m(1.0) {}
    ConfinementParams(int neighborhood, double dem_per_m = 1.0)
        : neighborhood(neighborhood), dem_per_m(dem_per_m) {}
};

/**
 * @brief Irregular focal statistics for confinement angle slopes
 *
 * For the current processing pixel, the kernel locates the pixels in one of
 * the 8 D8 directions (up to the neighborhood size, clipped at the raster
 * edges). The slopes perpendicular to the flow direction are computed from
 * the highest DEM pixel on each side of the stream.
 */
class ConfinementKernel {
private:
    int neighborhood;
    int nrows;
    int ncols;
    int row;
    int col;

public:
    ConfinementKernel(int neighborhood, int nrows, int ncols);

    /** @brief Moves the kernel to a new processing pixel */
    void update(int row, int col);

    /**
     * @brief Pixels strictly in a TauDEM direction from the processing pixel, nearest first
     * @param direction TauDEM flow number (1-8)
     */
    std::vector<Pixel> window(int direction) const;

    /**
     * @brief Maximum DEM height in a direction
     * @return NaN if the window is empty or contains NoData
     */
    double max_height(int direction, const ValueRaster& dem) const;

    /**
     * @brief Slopes perpendicular to flow at the processing pixel
     *
     * @param flow TauDEM flow number of the processing pixel
     * @param length Lateral length (in DEM units) across the neighborhood
     * @param dem The DEM
     * @return Clockwise and counterclockwise slopes. Both are NaN if the processing pixel is NoData.
     */
    std::pair<double, double> orthogonal_slopes(int flow, double length, const ValueRaster& dem) const;

    /** @brief TauDEM direction rotated by a number of 45 degree steps */
    static int rotate(int direction, int steps);
};

/**
 * @brief Computes stream segment confinement angles
 */
class ConfinementAngles {
private:
    const FlowRaster& flow;
    ConfinementParams params;

public:
    /**
     * @throws std::invalid_argument if the neighborhood is not a positive integer
     *         or dem_per_m is not positive
     */
    ConfinementAngles(const FlowRaster& flow, const ConfinementParams& params);

    /**
     * @brief Mean confinement angle (degrees) of each segment
     *
     * Pixel angles are 180 - atan(clockwise slope) - atan(counterclockwise slope).
     * A segment is NaN if any of its pixels has NoData flow, or if any pixel
     * angle is NaN. Angles are not clamped to [0, 180].
     *
     * @param indices Pixels of each segment
     * @param dem DEM conforming to the flow raster
     */
    std::vector<double> angles(const std::vector<std::vector<Pixel>>& indices,
                               const ValueRaster& dem) const;

    /** @brief Confinement angle of a single segment */
    double segment_angle(const std::vector<Pixel>& pixels, ConfinementKernel& kernel,
                         const ValueRaster& dem) const;

private:
    /** @brief Length perpendicular to a flow direction, in DEM units */
    double lateral_length(int flow_number) const;
};
