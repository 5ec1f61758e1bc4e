#include "include/basin_raster.hpp"
#include "include/watershed.hpp"

#include <omp.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <functional>
#include <iostream>
#include <numeric>
#include <queue>
#include <set>
#include <string>
#include <utility>


BasinRasterBuilder::BasinRasterBuilder(const FlowRaster& flow, const BasinParams& params)
    : flow(flow), params(params)
{
    if (params.nprocess < 0) {
        throw std::invalid_argument(
            "nprocess must be a positive integer (or 0 to use one less than the number of processors)");
    }
}

int BasinRasterBuilder::workers() const {
    if (params.nprocess > 0) {
        return params.nprocess;
    }
    return std::max(1, omp_get_num_procs() - 1);
}

BasinRaster BasinRasterBuilder::build(const std::vector<int>& ids, const std::vector<Pixel>& outlets,
                                      const std::vector<double>& areas) const {
    if (ids.size() != outlets.size() || ids.size() != areas.size()) {
        throw std::invalid_argument("ids, outlets, and areas must have the same length");
    }

    if (params.verbose) {
        std::cout << "Locating terminal outlet basins..." << std::endl;
        std::cout << "  Terminal outlets: " << outlets.size() << std::endl;
    }

    BasinRaster basins;
    if (params.parallel) {
        basins.raster = build_parallel(ids, outlets);
    } else {
        basins.raster = build_sequential(ids, outlets, areas);
    }

    for (size_t i = 0; i < basins.raster.size(); i++) {
        if (basins.raster(i) != 0) {
            basins.ids.insert(basins.raster(i));
        }
    }

    if (params.verbose) {
        std::cout << "  Labeled " << basins.ids.size() << " basins" << std::endl;
    }
    return basins;
}

// ============================================================================
// SEQUENTIAL
// ============================================================================

void BasinRasterBuilder::stamp_catchment(const Pixel& outlet, int32_t id,
                                         richdem::Array2D<int32_t>& raster) const {
    if (!flow.in_grid(outlet)) {
        throw CatchmentError(
            "Cannot delineate the catchment basin of terminal segment " + std::to_string(id)
            + " because its outlet (row=" + std::to_string(outlet.row) + ", col="
            + std::to_string(outlet.col) + ") is outside the flow raster");
    }

    // Pixels already holding this id were visited. Ids are unique, so older
    // labels from other basins are simply overwritten.
    std::queue<Pixel> to_process;
    raster(outlet.col, outlet.row) = id;
    to_process.push(outlet);

    while (!to_process.empty()) {
        const Pixel current = to_process.front();
        to_process.pop();

        for (int dir = 1; dir <= 8; dir++) {
            const Pixel neighbor(current.row + richdem::d8y[dir], current.col + richdem::d8x[dir]);
            if (!flow.in_grid(neighbor) || raster(neighbor.col, neighbor.row) == id) {
                continue;
            }
            if (flow.drains_to(neighbor, current)) {
                raster(neighbor.col, neighbor.row) = id;
                to_process.push(neighbor);
            }
        }
    }
}

richdem::Array2D<int32_t> BasinRasterBuilder::build_sequential(const std::vector<int>& ids,
                                                               const std::vector<Pixel>& outlets,
                                                               const std::vector<double>& areas) const {
    // Smallest basins first, so downstream basins claim shared pixels last
    std::vector<size_t> order(ids.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return areas[a] < areas[b]; });

    auto raster = new_raster<int32_t>(0);
    for (auto k : order) {
        stamp_catchment(outlets[k], ids[k], raster);
    }
    return raster;
}

// ============================================================================
// PARALLEL
// ============================================================================

std::vector<int> BasinRasterBuilder::count_outlets(const std::vector<Pixel>& outlets) const {
    auto weights = new_raster<double>(0.0);
    for (const auto& outlet : outlets) {
        if (!flow.in_grid(outlet)) {
            throw CatchmentError(
                "Terminal outlet (row=" + std::to_string(outlet.row) + ", col="
                + std::to_string(outlet.col) + ") is outside the flow raster");
        }
        weights(outlet.col, outlet.row) = 1;
    }

    const auto accu = guard_allocation(
        [&]() { return Watershed(flow).accumulate(std::move(weights)); });
    std::vector<int> counts;
    counts.reserve(outlets.size());
    for (const auto& outlet : outlets) {
        const double count = accu(outlet.col, outlet.row);
        counts.push_back(std::isnan(count) ? 1 : static_cast<int>(std::lround(count)));
    }
    return counts;
}

void BasinRasterBuilder::update_raster(richdem::Array2D<int32_t>& final_raster,
                                       const richdem::Array2D<int32_t>& raster) {
    #pragma omp parallel for
    for (size_t i = 0; i < final_raster.size(); i++) {
        if (final_raster(i) == 0) {
            final_raster(i) = raster(i);
        }
    }
}

richdem::Array2D<int32_t> BasinRasterBuilder::chunk_raster(const std::vector<int>& members,
                                                           size_t chunk, size_t nchunks,
                                                           const std::vector<int>& ids,
                                                           const std::vector<Pixel>& outlets) const {
    auto raster = new_raster<int32_t>(0);
    for (size_t m = chunk; m < members.size(); m += nchunks) {
        const auto k = members[m];
        stamp_catchment(outlets[k], ids[k], raster);
    }
    return raster;
}

richdem::Array2D<int32_t> BasinRasterBuilder::build_parallel(const std::vector<int>& ids,
                                                             const std::vector<Pixel>& outlets) const {
    const auto counts = count_outlets(outlets);
    const std::set<int, std::greater<int>> groups(counts.begin(), counts.end());
    const int nworkers = workers();

    if (params.verbose) {
        std::cout << "  Processing " << groups.size() << " outlet groups with "
                  << nworkers << " threads" << std::endl;
    }

    auto final_raster = new_raster<int32_t>(0);
    for (const auto count : groups) {
        std::vector<int> members;
        for (size_t k = 0; k < counts.size(); k++) {
            if (counts[k] == count) {
                members.push_back(static_cast<int>(k));
            }
        }

        // Each chunk is built by one thread. Errors are rethrown after the
        // parallel region so that no partial raster is returned.
        const size_t nchunks = std::min(members.size(), static_cast<size_t>(nworkers));
        std::vector<richdem::Array2D<int32_t>> chunks(nchunks);
        std::vector<std::exception_ptr> errors(nchunks);

        #pragma omp parallel for num_threads(nworkers) schedule(static, 1)
        for (int k = 0; k < static_cast<int>(nchunks); k++) {
            try {
                chunks[k] = chunk_raster(members, k, nchunks, ids, outlets);
            } catch (...) {
                errors[k] = std::current_exception();
            }
        }

        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
        for (const auto& chunk : chunks) {
            update_raster(final_raster, chunk);
        }
    }
    return final_raster;
}
