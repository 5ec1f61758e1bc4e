#pragma once

#include "flow_raster.hpp"
#include "watershed.hpp"

#include <limits>
#include <string>
#include <vector>


/**
 * @brief Parameters for building a stream segment network
 */
struct NetworkParams {
    double max_length;          // Maximum segment length (infinity = never split)
    LengthUnits units;          // Units of max_length
    bool verbose;               // Print progress messages

    // Default constructor
    NetworkParams()
        : max_length(std::numeric_limits<double>::infinity()),
          units(LengthUnits::Meters), verbose(true) {}

    // Parameterized constructor
    NetworkParams(double max_length, LengthUnits units = LengthUnits::Meters, bool verbose = true)
        : max_length(max_length), units(units), verbose(verbose) {}
};

/** Child index of a terminal segment */
constexpr int NO_CHILD = -1;

/**
 * @brief Segment arrays produced by the network builder
 *
 * Segment k owns indices[k]. child[k] is the index of the segment
 * immediately downstream (or NO_CHILD) and parents[k] lists the indices of
 * the segments immediately upstream, in ascending order.
 */
struct StreamNetwork {
    std::vector<Polyline> segments;
    std::vector<std::vector<Pixel>> indices;
    std::vector<int> child;
    std::vector<std::vector<int>> parents;
};

/**
 * @brief Builds the stream segments and their connectivity graph
 *
 * The builder:
 * - Validates the georeferencing of the flow raster and the maximum length
 * - Traces (and splits) the stream network
 * - Converts segment coordinates to the raster pixels owned by each segment
 * - Links each segment to its parents and child
 */
class StreamNetworkBuilder {
private:
    const FlowRaster& flow;
    NetworkParams params;

public:
    StreamNetworkBuilder(const FlowRaster& flow, const NetworkParams& params);

    /**
     * @brief Builds the network for a mask of stream pixels
     *
     * @param mask Pixels that may belong to a stream segment
     * @return Segment arrays with connectivity
     * @throws MissingTransformError, MissingCRSError if the flow raster lacks georeferencing
     * @throws std::invalid_argument if max_length is shorter than a pixel diagonal
     */
    StreamNetwork build(const MaskRaster& mask) const;

    /**
     * @brief Converts segment polylines to the pixels owned by each segment
     *
     * The final pixel of each segment belongs to the segment downstream. When a
     * segment was split, the pixel holding the split point goes to the
     * downstream piece.
     */
    std::vector<std::vector<Pixel>> pixel_indices(const std::vector<Polyline>& segments) const;

    /**
     * @brief Links segments whose final coordinate is the first coordinate of another segment
     *
     * @param segments Segment polylines
     * @param child Output - index of the downstream segment, or NO_CHILD
     * @param parents Output - indices of upstream segments
     */
    static void connect(const std::vector<Polyline>& segments,
                        std::vector<int>& child,
                        std::vector<std::vector<int>>& parents);

    /**
     * @brief max_length in CRS base units, after validation
     */
    double max_length_in_base() const;
};
