#pragma once

#include "flow_raster.hpp"

#include <richdem/common/Array2D.hpp>
#include <richdem/common/constants.hpp>

#include <limits>
#include <vector>


/**
 * @brief Flow routing primitives over a D8 flow direction raster
 *
 * This class provides methods to:
 * - Compute (weighted, masked) flow accumulation
 * - Delineate the catchment basin of a pixel
 * - Trace the stream network that follows a mask of stream pixels
 * - Split long stream segments into equal-length pieces
 */
class Watershed {
private:
    const FlowRaster& flow;  // Flow directions shared by all queries

public:
    /**
     * @brief Constructor
     * @param flow Flow direction raster. Must outlive the Watershed object.
     */
    explicit Watershed(const FlowRaster& flow) : flow(flow) {}

    ~Watershed() = default;

    /**
     * @brief Computes flow accumulation for the flow raster
     *
     * The accumulation at a pixel is the sum of the weights of every pixel
     * that drains through it (including itself). Pixels are processed in
     * topological order using the number of inflowing pixels (NIPS).
     *
     * @param weights Weight of each pixel. NaN weights propagate NaN downstream.
     * @param omitnan True to treat NaN weights as 0 instead of propagating them
     * @return Accumulation raster. Pixels without a valid flow direction are NaN.
     */
    richdem::Array2D<double> accumulate(richdem::Array2D<double> weights, bool omitnan = false) const;

    /**
     * @brief Accumulation with optional weights and mask
     *
     * When weights are absent every pixel has a weight of 1. The mask multiplies
     * the weights, so only true pixels contribute.
     *
     * @param weights Optional data raster
     * @param mask Optional boolean raster
     * @param omitnan True to ignore NoData weights
     */
    richdem::Array2D<double> accumulation(const ValueRaster* weights = nullptr,
                                          const MaskRaster* mask = nullptr,
                                          bool omitnan = false) const;

    /**
     * @brief Delineates the catchment basin draining to a pixel
     *
     * Traces upstream from the outlet following the inverse of the flow
     * directions, in the manner of a breadth-first search.
     *
     * @param row Row of the outlet pixel
     * @param col Column of the outlet pixel
     * @return Mask (1 = in basin) with the flow raster's shape
     * @throws CatchmentError if the outlet lies outside the raster
     */
    richdem::Array2D<uint8_t> catchment(int row, int col) const;

    /**
     * @brief Lists the pixels in the catchment basin of an outlet, outlet first
     */
    std::vector<Pixel> catchment_pixels(int row, int col) const;

    /**
     * @brief Traces the stream network defined by a mask of stream pixels
     *
     * Algorithm:
     * 1. Stream pixels are masked pixels with a valid flow direction
     * 2. Count the stream pixels draining into each pixel (indegree)
     * 3. Trace downstream from each channel head (indegree 0, row-major order)
     * 4. A trace ends after appending the first pixel that is a junction
     *    (indegree > 1), not a stream pixel, or outside the raster
     * 5. Junctions become new starting pixels once every upstream trace reached them
     *
     * Each polyline holds pixel-center coordinates from upstream to downstream.
     * The final coordinate is the pixel that ends the trace.
     *
     * @param mask Stream pixel mask
     * @param max_length Maximum segment length in CRS base units
     * @return Stream segment polylines
     */
    std::vector<Polyline> network(const MaskRaster& mask,
                                  double max_length = std::numeric_limits<double>::infinity()) const;

    /**
     * @brief Splits a polyline into equal-length pieces no longer than max_length
     *
     * Adjacent pieces share the exact coordinate of their split point.
     */
    static std::vector<Polyline> split(const Polyline& line, double max_length);

    /**
     * @brief Length of a polyline in CRS base units
     */
    static double length(const Polyline& line);
};
