#include "include/stream_network.hpp"

#include <cmath>
#include <iostream>
#include <map>
#include <sstream>


StreamNetworkBuilder::StreamNetworkBuilder(const FlowRaster& flow, const NetworkParams& params)
    : flow(flow), params(params) {}

double StreamNetworkBuilder::max_length_in_base() const {
    if (std::isnan(params.max_length) || params.max_length <= 0) {
        throw std::invalid_argument("max_length must be positive");
    }
    if (std::isinf(params.max_length)) {
        return params.max_length;
    }

    const double max_length = flow.to_base(params.max_length, params.units);
    const double diagonal = flow.pixel_diagonal();
    if (max_length < diagonal) {
        std::ostringstream message;
        if (flow.has_crs()) {
            message << "max_length (value=" << flow.from_base(max_length, LengthUnits::Meters)
                    << " meters) must be at least as long as the diagonals of the pixels in "
                    << "the flow direction raster (length=" << flow.pixel_diagonal(LengthUnits::Meters)
                    << " meters)";
        } else {
            message << "max_length (value=" << max_length << ") must be at least as long as "
                    << "the diagonals of the pixels in the flow direction raster (length="
                    << diagonal << ")";
        }
        throw std::invalid_argument(message.str());
    }
    return max_length;
}

StreamNetwork StreamNetworkBuilder::build(const MaskRaster& mask) const {
    flow.require_transform();
    flow.require_crs("Cannot build a stream segment network");
    const double max_length = max_length_in_base();

    if (params.verbose) {
        std::cout << "Building stream segment network..." << std::endl;
    }

    StreamNetwork network;
    network.segments = Watershed(flow).network(mask, max_length);
    network.indices = pixel_indices(network.segments);
    connect(network.segments, network.child, network.parents);

    if (params.verbose) {
        size_t nterminal = 0;
        for (auto child : network.child) {
            if (child == NO_CHILD) {
                nterminal++;
            }
        }
        std::cout << "  Found " << network.segments.size() << " stream segments in "
                  << nterminal << " local drainage networks" << std::endl;
    }
    return network;
}

std::vector<std::vector<Pixel>> StreamNetworkBuilder::pixel_indices(
    const std::vector<Polyline>& segments) const
{
    std::vector<std::vector<Pixel>> indices;
    indices.reserve(segments.size());

    bool split_pending = false;
    for (const auto& segment : segments) {
        std::vector<Pixel> pixels;
        pixels.reserve(segment.size());
        for (size_t k = 0; k < segment.size(); k++) {
            pixels.push_back(flow.vertex_pixel(segment, k));
        }

        // A duplicated leading pixel is a split point shared with the piece upstream
        const bool split_start = pixels.size() > 1 && pixels[0] == pixels[1];
        if (split_start || split_pending) {
            pixels.erase(pixels.begin());
        }

        // A duplicated trailing pixel is credited to the next piece
        const size_t n = pixels.size();
        split_pending = n > 1 && pixels[n - 1] == pixels[n - 2];

        // The final pixel is the outlet, owned by the downstream segment
        if (!pixels.empty()) {
            pixels.pop_back();
        }
        indices.push_back(std::move(pixels));
    }
    return indices;
}

void StreamNetworkBuilder::connect(const std::vector<Polyline>& segments,
                                   std::vector<int>& child,
                                   std::vector<std::vector<int>>& parents)
{
    const int nsegments = static_cast<int>(segments.size());
    child.assign(nsegments, NO_CHILD);
    parents.assign(nsegments, {});

    std::map<Point, int> starts;
    for (int s = 0; s < nsegments; s++) {
        if (!segments[s].empty()) {
            starts.emplace(segments[s].front(), s);
        }
    }

    for (int p = 0; p < nsegments; p++) {
        if (segments[p].empty()) {
            continue;
        }
        const auto match = starts.find(segments[p].back());
        if (match != starts.end() && match->second != p) {
            child[p] = match->second;
            parents[match->second].push_back(p);
        }
    }
}
