#pragma once

#include "basin_raster.hpp"
#include "confinement.hpp"
#include "flow_raster.hpp"
#include "statistics.hpp"
#include "stream_network.hpp"

#include <richdem/common/Array2D.hpp>

#include <memory>
#include <optional>
#include <utility>
#include <vector>


/**
 * @brief Selects stream segments by id and/or by index
 *
 * The selected segments are the union of both parts. An empty indices
 * vector selects nothing, otherwise it needs one element per segment.
 */
struct Selection {
    std::vector<int> ids;
    std::vector<bool> indices;

    Selection() = default;
    Selection(std::vector<int> ids, std::vector<bool> indices = {})
        : ids(std::move(ids)), indices(std::move(indices)) {}

    static Selection by_ids(std::vector<int> ids) { return Selection(std::move(ids)); }
    static Selection by_indices(std::vector<bool> indices) { return Selection({}, std::move(indices)); }
};

/**
 * @brief A stream segment network and its hazard-model input variables
 *
 * The network is built once from a flow direction raster and a stream mask.
 * Each segment has a unique id, a polyline (upstream to downstream), the
 * raster pixels it owns, and the number of pixels draining to its outlet.
 * Segments are stored in parallel arrays, and the network graph is stored as
 * child/parent indices into those arrays.
 *
 * Segments can be removed, in which case the remaining ids do not change. The
 * flow raster is immutable and shared between copies of the object.
 */
class StreamSegments {
private:
    std::shared_ptr<const FlowRaster> flow_;

    // Segment arrays
    std::vector<int> ids_;
    std::vector<Polyline> segments_;
    std::vector<std::vector<Pixel>> indices_;
    std::vector<double> npixels_;

    // Network graph
    std::vector<int> child_;
    std::vector<std::vector<int>> parents_;

    // Terminal outlet basins, built on demand
    std::shared_ptr<const BasinRaster> basins_;

public:
    /**
     * @brief Builds the stream segment network
     *
     * @param flow TauDEM D8 flow directions with an affine transform and CRS
     * @param mask Pixels that may belong to a stream segment
     * @param params Maximum segment length and logging options
     */
    StreamSegments(std::shared_ptr<const FlowRaster> flow, const MaskRaster& mask,
                   const NetworkParams& params = NetworkParams());

    // ========================================================================
    // Properties
    // ========================================================================

    std::size_t size() const { return ids_.size(); }
    std::size_t nlocal() const;
    const FlowRaster& flow() const { return *flow_; }
    std::shared_ptr<const FlowRaster> shared_flow() const { return flow_; }

    const std::vector<int>& ids() const { return ids_; }
    const std::vector<Polyline>& segments() const { return segments_; }
    const std::vector<std::vector<Pixel>>& indices() const { return indices_; }
    const std::vector<double>& npixels() const { return npixels_; }
    const std::vector<int>& child_indices() const { return child_; }
    const std::vector<std::vector<int>>& parent_indices() const { return parents_; }

    /** @brief Ids of the terminal segments */
    std::vector<int> terminal_ids() const;

    /** @brief Array index of a segment id. Throws std::out_of_range for unknown ids. */
    int index_of(int id) const;

    // ========================================================================
    // Network queries
    // ========================================================================

    /** @brief Id of the segment immediately downstream, if any */
    std::optional<int> child(int id) const;

    /** @brief Ids of the segments immediately upstream */
    std::vector<int> parents(int id) const;

    /** @brief Ids of all upstream segments */
    std::vector<int> ancestors(int id) const;

    /** @brief Ids of all downstream segments, nearest first */
    std::vector<int> descendents(int id) const;

    /** @brief Ids of every segment in the local drainage network of a segment */
    std::vector<int> family(int id) const;

    std::vector<bool> isterminal() const;
    std::vector<bool> isterminal(const std::vector<int>& ids) const;

    /** @brief Id of the terminal segment downstream of each segment */
    std::vector<int> termini() const;
    std::vector<int> termini(const std::vector<int>& ids) const;

    /**
     * @brief Outlet pixel of each segment
     *
     * @param segment_outlets True for each segment's own outlet. False for the
     *        terminal outlet of its local drainage network.
     */
    std::vector<Pixel> outlets(bool segment_outlets = false) const;
    std::vector<Pixel> outlets(const std::vector<int>& ids, bool segment_outlets = false) const;

    /**
     * @brief Whether each segment's local network is nested in another network's basin
     *
     * Locates the terminal basins first if they were not yet located.
     */
    std::vector<bool> isnested(const BasinParams& params = BasinParams());
    std::vector<bool> isnested(const std::vector<int>& ids, const BasinParams& params = BasinParams());

    // ========================================================================
    // Rasters
    // ========================================================================

    /** @brief Raster of segment ids (0 = not in a segment) */
    richdem::Array2D<int32_t> raster() const;

    /** @brief Raster of terminal basin ids, locating the basins if needed */
    richdem::Array2D<int32_t> basin_raster(const BasinParams& params = BasinParams());

    /** @brief Mask of the catchment basin of a segment's outlet */
    richdem::Array2D<uint8_t> catchment_mask(int id) const;

    /**
     * @brief Builds and caches the terminal outlet basin raster
     * @throws CatchmentError, BasinMemoryError
     */
    void locate_basins(const BasinParams& params = BasinParams());
    bool basins_located() const { return static_cast<bool>(basins_); }

    // ========================================================================
    // Summaries
    // ========================================================================

    /**
     * @brief Summarizes the values on the pixels of each segment
     *
     * Outlet statistics use each segment's outlet pixel.
     */
    std::vector<double> summary(Statistic statistic, const ValueRaster& values,
                                bool terminal = false) const;

    /**
     * @brief Summarizes the values over the catchment basin of each segment
     *
     * Sums and means are computed from flow accumulations. Other statistics
     * iterate over each catchment. Catchments without any (masked) pixels are NaN.
     *
     * @param statistic The statistic to compute
     * @param values Data values
     * @param mask Optional mask of the pixels to include
     * @param terminal True to only summarize terminal segments
     */
    std::vector<double> catchment_summary(Statistic statistic, const ValueRaster& values,
                                          const MaskRaster* mask = nullptr,
                                          bool terminal = false) const;

    // ========================================================================
    // Model inputs
    // ========================================================================

    std::vector<double> area(const MaskRaster* mask = nullptr,
                             LengthUnits units = LengthUnits::Kilometers,
                             bool terminal = false) const;
    std::vector<double> burn_ratio(const MaskRaster& isburned, bool terminal = false) const;
    std::vector<double> burned_area(const MaskRaster& isburned,
                                    LengthUnits units = LengthUnits::Kilometers,
                                    bool terminal = false) const;
    std::vector<double> catchment_ratio(const MaskRaster& mask, bool terminal = false) const;
    std::vector<double> upslope_ratio(const MaskRaster& mask, bool terminal = false) const;
    std::vector<double> developed_area(const MaskRaster& isdeveloped,
                                       LengthUnits units = LengthUnits::Kilometers,
                                       bool terminal = false) const;
    std::vector<bool> in_mask(const MaskRaster& mask, bool terminal = false) const;
    std::vector<bool> in_perimeter(const MaskRaster& perimeter, bool terminal = false) const;
    std::vector<double> kf_factor(const ValueRaster& kf_factor, const MaskRaster* mask = nullptr,
                                  bool omitnan = false, bool terminal = false) const;
    std::vector<double> length(LengthUnits units = LengthUnits::Meters, bool terminal = false) const;
    std::vector<double> scaled_dnbr(const ValueRaster& dnbr, const MaskRaster* mask = nullptr,
                                    bool omitnan = false, bool terminal = false) const;
    std::vector<double> scaled_thickness(const ValueRaster& soil_thickness,
                                         const MaskRaster* mask = nullptr,
                                         bool omitnan = false, bool terminal = false) const;
    std::vector<double> sine_theta(const ValueRaster& sine_thetas, const MaskRaster* mask = nullptr,
                                   bool omitnan = false, bool terminal = false) const;
    std::vector<double> slope(const ValueRaster& slopes, bool terminal = false) const;
    std::vector<double> relief(const ValueRaster& relief, bool terminal = false) const;
    std::vector<double> ruggedness(const ValueRaster& relief, double relief_per_m = 1.0,
                                   bool terminal = false) const;

    /**
     * @brief Mean confinement angle (degrees) of each segment
     *
     * @param dem DEM conforming to the flow raster
     * @param params Neighborhood size and DEM units per meter
     */
    std::vector<double> confinement(const ValueRaster& dem,
                                    const ConfinementParams& params = ConfinementParams()) const;

    // ========================================================================
    // Filtering
    // ========================================================================

    /**
     * @brief Restricts a selection so that filtering preserves flow continuity
     *
     * Requested segments are only removed from the upstream edge (no parents)
     * or downstream edge (no child) of their local network. Edges are
     * recomputed after each round of removals until no requested segment is
     * on an edge.
     *
     * @param selection Segments to remove (or keep, when keep is true)
     * @param keep True if the selection lists the segments to keep
     * @param upstream True to allow removal from upstream edges
     * @param downstream True to allow removal from downstream edges
     * @return Per-segment flags in the sense of the selection (remove or keep)
     */
    std::vector<bool> continuous(const Selection& selection, bool keep = false,
                                 bool upstream = true, bool downstream = true) const;

    /**
     * @brief Removes segments from the network
     *
     * Removed segments are detached from the graph, remaining segments keep
     * their ids, and the basin raster is discarded if it labels a removed segment.
     */
    void remove(const Selection& selection);

    /** @brief Removes every segment not in the selection */
    void keep(const Selection& selection);

    /** @brief Copy with independent segment arrays. The flow raster and basins are shared. */
    StreamSegments copy() const { return *this; }

private:
    /** @brief Resolves a selection into one flag per segment */
    std::vector<bool> resolve(const Selection& selection) const;

    /** @brief Indices of terminal segments, or of all segments */
    std::vector<int> selected(bool terminal) const;

    /** @brief Outlets of the selected segments */
    std::vector<Pixel> selected_outlets(bool terminal) const;

    /** @brief Flow accumulation sampled at the selected segment outlets */
    std::vector<double> accumulation(const ValueRaster* weights, const MaskRaster* mask,
                                     bool omitnan, bool terminal) const;

    /** @brief Values at the selected segment outlets */
    std::vector<double> outlet_values(const ValueRaster& values, bool terminal) const;

    /** @brief Catchment sums and means from flow accumulation */
    std::vector<double> accumulation_summary(Statistic statistic, const ValueRaster& values,
                                             const MaskRaster* mask, bool terminal) const;

    /** @brief Catchment statistics by iterating over catchment basins */
    std::vector<double> iterated_summary(Statistic statistic, const ValueRaster& values,
                                         const MaskRaster* mask, bool terminal) const;

    /** @brief Index of the terminal segment downstream of a segment index */
    int terminus(int index) const;

    /** @brief Area of each selected catchment, from pixel counts */
    std::vector<double> masked_area(const MaskRaster* mask, LengthUnits units, bool terminal) const;
};
