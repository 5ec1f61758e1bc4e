#pragma once

#include "flow_raster.hpp"

#include <richdem/common/Array2D.hpp>

#include <cstdint>
#include <new>
#include <set>
#include <string>
#include <vector>


/**
 * @brief Parameters for building the terminal basin raster
 */
struct BasinParams {
    bool parallel;      // Build catchments with multiple OpenMP threads
    int nprocess;       // Number of threads (0 = one less than the number of processors)
    bool verbose;       // Print progress messages

    // Default constructor
    BasinParams() : parallel(false), nprocess(0), verbose(true) {}

    // Parameterized constructor
    BasinParams(bool parallel, int nprocess = 0, bool verbose = true)
        : parallel(parallel), nprocess(nprocess), verbose(verbose) {}
};

/**
 * @brief A terminal basin raster and the ids stamped into it
 */
struct BasinRaster {
    richdem::Array2D<int32_t> raster;   // Terminal segment id of each pixel (0 = background)
    std::set<int> ids;                  // Ids present in the raster
};

/**
 * @brief Builds the raster of terminal outlet catchment basins
 *
 * Each pixel is labeled with the id of the terminal segment whose catchment
 * contains it. Where nested catchments overlap, the pixel belongs to the
 * most downstream basin.
 *
 * Sequential algorithm:
 * 1. Sort terminal outlets by catchment area (smallest first)
 * 2. Stamp each catchment onto the raster, so larger basins overwrite smaller ones
 *
 * Parallel algorithm:
 * 1. Count the terminal outlets draining into each terminal outlet
 * 2. Group outlets by that count. Outlets in a group cannot be nested.
 * 3. Process groups from the highest count (most downstream) to the lowest
 * 4. Within a group, each thread builds a stride-interleaved chunk of catchments
 * 5. Merge each chunk into the final raster, claiming only unlabeled pixels
 *
 * Both algorithms produce the same raster for any number of threads.
 */
class BasinRasterBuilder {
private:
    const FlowRaster& flow;
    BasinParams params;

public:
    /**
     * @throws std::invalid_argument if nprocess is negative
     */
    BasinRasterBuilder(const FlowRaster& flow, const BasinParams& params);

    /** @brief Number of worker threads used by the parallel algorithm */
    int workers() const;

    /**
     * @brief Builds the basin raster
     *
     * @param ids Terminal segment ids
     * @param outlets Terminal outlet pixels
     * @param areas Catchment area of each terminal outlet (any consistent unit)
     * @throws CatchmentError if any catchment cannot be delineated
     * @throws BasinMemoryError if the raster cannot be allocated
     */
    BasinRaster build(const std::vector<int>& ids, const std::vector<Pixel>& outlets,
                      const std::vector<double>& areas) const;

    richdem::Array2D<int32_t> build_sequential(const std::vector<int>& ids,
                                               const std::vector<Pixel>& outlets,
                                               const std::vector<double>& areas) const;

    richdem::Array2D<int32_t> build_parallel(const std::vector<int>& ids,
                                             const std::vector<Pixel>& outlets) const;

    /**
     * @brief Number of terminal outlets that drain into each terminal outlet (including itself)
     */
    std::vector<int> count_outlets(const std::vector<Pixel>& outlets) const;

    /**
     * @brief Labels the catchment of an outlet, overwriting existing labels
     */
    void stamp_catchment(const Pixel& outlet, int32_t id, richdem::Array2D<int32_t>& raster) const;

    /**
     * @brief Copies the labels of a raster into the unlabeled pixels of the final raster
     */
    static void update_raster(richdem::Array2D<int32_t>& final_raster,
                              const richdem::Array2D<int32_t>& raster);

    /**
     * @brief Runs a full-grid allocation, reporting std::bad_alloc as BasinMemoryError
     *
     * @param allocate Callable that builds and returns the new raster
     */
    template<typename Allocate>
    auto guard_allocation(Allocate allocate) const -> decltype(allocate());

private:
    /** @brief Blank full-grid raster. Allocation failure raises BasinMemoryError. */
    template<typename T>
    richdem::Array2D<T> new_raster(const T& value) const;

    /** @brief Sequentially builds the catchments of members k, k+nchunks, ... */
    richdem::Array2D<int32_t> chunk_raster(const std::vector<int>& members, size_t chunk, size_t nchunks,
                                           const std::vector<int>& ids,
                                           const std::vector<Pixel>& outlets) const;
};


// ============================================================================
// IMPLEMENTATION - Template Functions
// ============================================================================

template<typename Allocate>
auto BasinRasterBuilder::guard_allocation(Allocate allocate) const -> decltype(allocate()) {
    try {
        return allocate();
    } catch (const std::bad_alloc&) {
        throw BasinMemoryError(
            "Cannot create the terminal outlet basin raster because the flow direction raster ("
            + std::to_string(flow.rows()) + " x " + std::to_string(flow.cols()) + " pixels) "
            "is too large for memory. Try using a coarser resolution or a smaller bounding box "
            "for the analysis");
    }
}

template<typename T>
richdem::Array2D<T> BasinRasterBuilder::new_raster(const T& value) const {
    return guard_allocation([&]() { return flow.new_raster<T>(value); });
}
