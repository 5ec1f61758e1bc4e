#include "include/stream_segments.hpp"
#include "include/watershed.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>


StreamSegments::StreamSegments(std::shared_ptr<const FlowRaster> flow, const MaskRaster& mask,
                               const NetworkParams& params)
    : flow_(std::move(flow))
{
    if (!flow_) {
        throw std::invalid_argument("The flow direction raster must not be null");
    }
    if (mask.rows() != flow_->rows() || mask.cols() != flow_->cols()) {
        throw RasterMetadataError("The shape of the " + mask.name()
                                  + " does not match the shape of the flow direction raster");
    }
    if (mask.values().geotransform != flow_->geotransform()
        || mask.values().projection != flow_->projection()) {
        throw RasterMetadataError("The " + mask.name()
                                  + " was built for a flow direction raster with different georeferencing");
    }

    auto network = StreamNetworkBuilder(*flow_, params).build(mask);
    segments_ = std::move(network.segments);
    indices_ = std::move(network.indices);
    child_ = std::move(network.child);
    parents_ = std::move(network.parents);

    ids_.resize(segments_.size());
    for (size_t k = 0; k < ids_.size(); k++) {
        ids_[k] = static_cast<int>(k) + 1;
    }

    // Upslope pixel count at each segment outlet
    const auto accu = Watershed(*flow_).accumulation();
    const auto outlets = this->outlets(true);
    npixels_.resize(outlets.size());
    for (size_t k = 0; k < outlets.size(); k++) {
        const auto& outlet = outlets[k];
        npixels_[k] = flow_->in_grid(outlet)
            ? accu(outlet.col, outlet.row)
            : std::numeric_limits<double>::quiet_NaN();
    }
}

// ============================================================================
// PROPERTIES
// ============================================================================

std::size_t StreamSegments::nlocal() const {
    return static_cast<std::size_t>(std::count(child_.begin(), child_.end(), NO_CHILD));
}

std::vector<int> StreamSegments::terminal_ids() const {
    std::vector<int> terminal;
    for (size_t k = 0; k < ids_.size(); k++) {
        if (child_[k] == NO_CHILD) {
            terminal.push_back(ids_[k]);
        }
    }
    return terminal;
}

int StreamSegments::index_of(int id) const {
    // Ids stay sorted because segments are only ever removed
    const auto match = std::lower_bound(ids_.begin(), ids_.end(), id);
    if (match == ids_.end() || *match != id) {
        throw std::out_of_range("There is no stream segment with ID = " + std::to_string(id));
    }
    return static_cast<int>(match - ids_.begin());
}

// ============================================================================
// NETWORK QUERIES
// ============================================================================

std::optional<int> StreamSegments::child(int id) const {
    const int c = child_[index_of(id)];
    if (c == NO_CHILD) {
        return std::nullopt;
    }
    return ids_[c];
}

std::vector<int> StreamSegments::parents(int id) const {
    std::vector<int> upstream;
    for (auto p : parents_[index_of(id)]) {
        upstream.push_back(ids_[p]);
    }
    return upstream;
}

std::vector<int> StreamSegments::ancestors(int id) const {
    std::vector<int> upstream;
    std::vector<int> to_process = parents_[index_of(id)];
    while (!to_process.empty()) {
        const int k = to_process.back();
        to_process.pop_back();
        upstream.push_back(ids_[k]);
        to_process.insert(to_process.end(), parents_[k].begin(), parents_[k].end());
    }
    std::sort(upstream.begin(), upstream.end());
    return upstream;
}

std::vector<int> StreamSegments::descendents(int id) const {
    std::vector<int> downstream;
    for (int k = child_[index_of(id)]; k != NO_CHILD; k = child_[k]) {
        downstream.push_back(ids_[k]);
    }
    return downstream;
}

int StreamSegments::terminus(int index) const {
    while (child_[index] != NO_CHILD) {
        index = child_[index];
    }
    return index;
}

std::vector<int> StreamSegments::family(int id) const {
    const int t = terminus(index_of(id));
    auto members = ancestors(ids_[t]);
    members.push_back(ids_[t]);
    std::sort(members.begin(), members.end());
    return members;
}

std::vector<bool> StreamSegments::isterminal() const {
    std::vector<bool> terminal(child_.size());
    for (size_t k = 0; k < child_.size(); k++) {
        terminal[k] = child_[k] == NO_CHILD;
    }
    return terminal;
}

std::vector<bool> StreamSegments::isterminal(const std::vector<int>& ids) const {
    std::vector<bool> terminal;
    terminal.reserve(ids.size());
    for (auto id : ids) {
        terminal.push_back(child_[index_of(id)] == NO_CHILD);
    }
    return terminal;
}

std::vector<int> StreamSegments::termini() const {
    std::vector<int> terminal(ids_.size());
    for (size_t k = 0; k < ids_.size(); k++) {
        terminal[k] = ids_[terminus(static_cast<int>(k))];
    }
    return terminal;
}

std::vector<int> StreamSegments::termini(const std::vector<int>& ids) const {
    std::vector<int> terminal;
    terminal.reserve(ids.size());
    for (auto id : ids) {
        terminal.push_back(ids_[terminus(index_of(id))]);
    }
    return terminal;
}

std::vector<Pixel> StreamSegments::outlets(bool segment_outlets) const {
    std::vector<Pixel> pixels(ids_.size());
    for (size_t k = 0; k < ids_.size(); k++) {
        const int s = segment_outlets ? static_cast<int>(k) : terminus(static_cast<int>(k));
        // A segment whose pixels all went to its neighbors drains through its first coordinate
        pixels[k] = indices_[s].empty() ? flow_->vertex_pixel(segments_[s], 0) : indices_[s].back();
    }
    return pixels;
}

std::vector<Pixel> StreamSegments::outlets(const std::vector<int>& ids, bool segment_outlets) const {
    const auto all = outlets(segment_outlets);
    std::vector<Pixel> pixels;
    pixels.reserve(ids.size());
    for (auto id : ids) {
        pixels.push_back(all[index_of(id)]);
    }
    return pixels;
}

std::vector<bool> StreamSegments::isnested(const BasinParams& params) {
    return isnested(ids_, params);
}

std::vector<bool> StreamSegments::isnested(const std::vector<int>& ids, const BasinParams& params) {
    std::vector<int> selected;
    selected.reserve(ids.size());
    for (auto id : ids) {
        selected.push_back(index_of(id));
    }

    if (!basins_located()) {
        locate_basins(params);
    }

    // A local network is nested when its terminal outlet was claimed by a more downstream basin
    std::vector<bool> nested;
    nested.reserve(selected.size());
    for (auto k : selected) {
        const int t = terminus(k);
        const Pixel outlet = indices_[t].empty() ? flow_->vertex_pixel(segments_[t], 0)
                                                 : indices_[t].back();
        nested.push_back(basins_->raster(outlet.col, outlet.row) != ids_[t]);
    }
    return nested;
}

// ============================================================================
// RASTERS
// ============================================================================

richdem::Array2D<int32_t> StreamSegments::raster() const {
    auto raster = flow_->new_raster<int32_t>(0);
    for (size_t k = 0; k < indices_.size(); k++) {
        for (const auto& pixel : indices_[k]) {
            raster(pixel.col, pixel.row) = ids_[k];
        }
    }
    return raster;
}

richdem::Array2D<int32_t> StreamSegments::basin_raster(const BasinParams& params) {
    if (!basins_located()) {
        locate_basins(params);
    }
    return basins_->raster;
}

richdem::Array2D<uint8_t> StreamSegments::catchment_mask(int id) const {
    const auto outlet = outlets(std::vector<int>{id}, true).front();
    return Watershed(*flow_).catchment(outlet.row, outlet.col);
}

void StreamSegments::locate_basins(const BasinParams& params) {
    std::vector<int> ids;
    std::vector<Pixel> outlets;
    std::vector<double> areas;
    const auto segment_outlets = this->outlets(true);
    for (size_t k = 0; k < ids_.size(); k++) {
        if (child_[k] == NO_CHILD) {
            ids.push_back(ids_[k]);
            outlets.push_back(segment_outlets[k]);
            areas.push_back(npixels_[k]);
        }
    }

    auto basins = BasinRasterBuilder(*flow_, params).build(ids, outlets, areas);
    basins_ = std::make_shared<const BasinRaster>(std::move(basins));
}

// ============================================================================
// FILTERING
// ============================================================================

std::vector<bool> StreamSegments::resolve(const Selection& selection) const {
    const size_t nsegments = ids_.size();
    if (!selection.indices.empty() && selection.indices.size() != nsegments) {
        throw std::invalid_argument(
            "The selection indices must have one element per stream segment ("
            + std::to_string(nsegments) + "), but they have "
            + std::to_string(selection.indices.size()) + " elements");
    }

    std::vector<bool> flags = selection.indices;
    flags.resize(nsegments, false);
    for (auto id : selection.ids) {
        flags[index_of(id)] = true;
    }
    return flags;
}

std::vector<bool> StreamSegments::continuous(const Selection& selection, bool keep,
                                             bool upstream, bool downstream) const {
    auto requested = resolve(selection);
    if (keep) {
        requested.flip();
    }

    // Work on copies so the network is unchanged
    auto child = child_;
    auto parents = parents_;
    std::vector<bool> removed(ids_.size(), false);

    bool changed = true;
    while (changed) {
        changed = false;

        std::vector<int> edges;
        for (size_t k = 0; k < requested.size(); k++) {
            if (!requested[k] || removed[k]) {
                continue;
            }
            if ((upstream && parents[k].empty()) || (downstream && child[k] == NO_CHILD)) {
                edges.push_back(static_cast<int>(k));
            }
        }

        for (auto k : edges) {
            removed[k] = true;
            changed = true;
            if (child[k] != NO_CHILD) {
                auto& siblings = parents[child[k]];
                siblings.erase(std::remove(siblings.begin(), siblings.end(), k), siblings.end());
            }
            for (auto p : parents[k]) {
                child[p] = NO_CHILD;
            }
            child[k] = NO_CHILD;
            parents[k].clear();
        }
    }

    if (keep) {
        removed.flip();
    }
    return removed;
}

void StreamSegments::remove(const Selection& selection) {
    const auto removed = resolve(selection);

    // New index of every surviving segment
    std::vector<int> new_index(ids_.size(), NO_CHILD);
    std::vector<int> removed_ids;
    int next = 0;
    for (size_t k = 0; k < ids_.size(); k++) {
        if (removed[k]) {
            removed_ids.push_back(ids_[k]);
        } else {
            new_index[k] = next++;
        }
    }
    if (removed_ids.empty()) {
        return;
    }

    std::vector<int> ids;
    std::vector<Polyline> segments;
    std::vector<std::vector<Pixel>> indices;
    std::vector<double> npixels;
    std::vector<int> child;
    std::vector<std::vector<int>> parents;

    for (size_t k = 0; k < ids_.size(); k++) {
        if (removed[k]) {
            continue;
        }
        ids.push_back(ids_[k]);
        segments.push_back(std::move(segments_[k]));
        indices.push_back(std::move(indices_[k]));
        npixels.push_back(npixels_[k]);
        child.push_back(child_[k] == NO_CHILD ? NO_CHILD : new_index[child_[k]]);

        std::vector<int> upstream;
        for (auto p : parents_[k]) {
            if (new_index[p] != NO_CHILD) {
                upstream.push_back(new_index[p]);
            }
        }
        parents.push_back(std::move(upstream));
    }

    ids_ = std::move(ids);
    segments_ = std::move(segments);
    indices_ = std::move(indices);
    npixels_ = std::move(npixels);
    child_ = std::move(child);
    parents_ = std::move(parents);

    // Only discard the basins when they label a removed segment
    if (basins_) {
        for (auto id : removed_ids) {
            if (basins_->ids.count(id) > 0) {
                basins_.reset();
                break;
            }
        }
    }
}

void StreamSegments::keep(const Selection& selection) {
    auto removed = resolve(selection);
    removed.flip();
    remove(Selection::by_indices(std::move(removed)));
}
