#include "include/stream_segments.hpp"
#include "include/watershed.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>


namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();
const double INF = std::numeric_limits<double>::infinity();

template<typename Raster>
void check_metadata(const Raster& raster, const FlowRaster& flow) {
    if (raster.rows() != flow.rows() || raster.cols() != flow.cols()) {
        throw RasterMetadataError(
            "The shape of the " + raster.name() + " (" + std::to_string(raster.rows()) + " x "
            + std::to_string(raster.cols()) + ") does not match the shape of the flow "
            "direction raster (" + std::to_string(flow.rows()) + " x "
            + std::to_string(flow.cols()) + ")");
    }

    // Rasters take their georeferencing from the flow raster they were built against
    if (raster.values().geotransform != flow.geotransform()) {
        throw RasterMetadataError(
            "The affine transform of the " + raster.name() + " does not match the transform "
            "of the flow direction raster");
    }
    if (raster.values().projection != flow.projection()) {
        throw RasterMetadataError(
            "The CRS of the " + raster.name() + " does not match the CRS of the flow direction raster");
    }
}

std::vector<double> scale(std::vector<double> values, double divisor) {
    for (auto& value : values) {
        value /= divisor;
    }
    return values;
}

}  // namespace


// ============================================================================
// SELECTION HELPERS
// ============================================================================

std::vector<int> StreamSegments::selected(bool terminal) const {
    std::vector<int> indices;
    for (size_t k = 0; k < ids_.size(); k++) {
        if (!terminal || child_[k] == NO_CHILD) {
            indices.push_back(static_cast<int>(k));
        }
    }
    return indices;
}

std::vector<Pixel> StreamSegments::selected_outlets(bool terminal) const {
    const auto all = outlets(true);
    std::vector<Pixel> pixels;
    for (auto k : selected(terminal)) {
        pixels.push_back(all[k]);
    }
    return pixels;
}

std::vector<double> StreamSegments::accumulation(const ValueRaster* weights, const MaskRaster* mask,
                                                 bool omitnan, bool terminal) const {
    const auto accu = Watershed(*flow_).accumulation(weights, mask, omitnan);
    std::vector<double> values;
    for (const auto& outlet : selected_outlets(terminal)) {
        values.push_back(flow_->in_grid(outlet) ? accu(outlet.col, outlet.row) : NaN);
    }
    return values;
}

std::vector<double> StreamSegments::outlet_values(const ValueRaster& values, bool terminal) const {
    check_metadata(values, *flow_);
    std::vector<double> sampled;
    for (const auto& outlet : selected_outlets(terminal)) {
        sampled.push_back(flow_->in_grid(outlet) ? values(outlet) : NaN);
    }
    return sampled;
}

// ============================================================================
// SUMMARIES
// ============================================================================

std::vector<double> StreamSegments::summary(Statistic statistic, const ValueRaster& values,
                                            bool terminal) const {
    check_metadata(values, *flow_);
    if (statistic == Statistic::Outlet) {
        return outlet_values(values, terminal);
    }

    std::vector<double> summaries;
    for (auto k : selected(terminal)) {
        std::vector<double> pixel_values;
        pixel_values.reserve(indices_[k].size());
        for (const auto& pixel : indices_[k]) {
            pixel_values.push_back(values(pixel));
        }
        summaries.push_back(summarize(statistic, pixel_values));
    }
    return summaries;
}

std::vector<double> StreamSegments::catchment_summary(Statistic statistic, const ValueRaster& values,
                                                      const MaskRaster* mask, bool terminal) const {
    check_metadata(values, *flow_);
    if (mask != nullptr) {
        check_metadata(*mask, *flow_);
    }

    switch (statistic) {
        case Statistic::Outlet:
            return outlet_values(values, terminal);
        case Statistic::Sum:
        case Statistic::Mean:
        case Statistic::NanSum:
        case Statistic::NanMean:
            return accumulation_summary(statistic, values, mask, terminal);
        default:
            return iterated_summary(statistic, values, mask, terminal);
    }
}

std::vector<double> StreamSegments::accumulation_summary(Statistic statistic, const ValueRaster& values,
                                                         const MaskRaster* mask, bool terminal) const {
    const bool omitnan = omits_nan(statistic);
    const auto& data = values.values();

    // Pixels counted by the statistic. NaN pixels are only counted when they poison the sum.
    auto counted = flow_->new_raster<double>(1.0);
    #pragma omp parallel for
    for (size_t i = 0; i < counted.size(); i++) {
        const bool in_mask = mask == nullptr || mask->values()(i) != 0;
        if (!in_mask || (omitnan && std::isnan(data(i)))) {
            counted(i) = 0;
        }
    }

    const Watershed watershed(*flow_);
    const auto sums = watershed.accumulation(&values, mask, omitnan);
    const auto counts = watershed.accumulate(std::move(counted));

    std::vector<double> summaries;
    for (const auto& outlet : selected_outlets(terminal)) {
        if (!flow_->in_grid(outlet)) {
            summaries.push_back(NaN);
            continue;
        }
        const double sum = sums(outlet.col, outlet.row);
        const double count = counts(outlet.col, outlet.row);
        if (!(count > 0)) {
            summaries.push_back(NaN);
        } else if (statistic == Statistic::Sum || statistic == Statistic::NanSum) {
            summaries.push_back(sum);
        } else {
            summaries.push_back(sum / count);
        }
    }
    return summaries;
}

std::vector<double> StreamSegments::iterated_summary(Statistic statistic, const ValueRaster& values,
                                                     const MaskRaster* mask, bool terminal) const {
    const Watershed watershed(*flow_);
    std::vector<double> summaries;
    for (const auto& outlet : selected_outlets(terminal)) {
        std::vector<double> basin_values;
        for (const auto& pixel : watershed.catchment_pixels(outlet.row, outlet.col)) {
            if (mask == nullptr || (*mask)(pixel)) {
                basin_values.push_back(values(pixel));
            }
        }
        summaries.push_back(summarize(statistic, basin_values));
    }
    return summaries;
}

// ============================================================================
// MODEL INPUTS
// ============================================================================

std::vector<double> StreamSegments::masked_area(const MaskRaster* mask, LengthUnits units,
                                                bool terminal) const {
    if (mask != nullptr) {
        check_metadata(*mask, *flow_);
    }
    const double pixel_area = flow_->pixel_area(units);
    auto areas = accumulation(nullptr, mask, false, terminal);
    for (auto& area : areas) {
        area *= pixel_area;
    }
    return areas;
}

std::vector<double> StreamSegments::area(const MaskRaster* mask, LengthUnits units, bool terminal) const {
    return masked_area(mask, units, terminal);
}

std::vector<double> StreamSegments::burn_ratio(const MaskRaster& isburned, bool terminal) const {
    return catchment_ratio(isburned, terminal);
}

std::vector<double> StreamSegments::burned_area(const MaskRaster& isburned, LengthUnits units,
                                                bool terminal) const {
    return masked_area(&isburned, units, terminal);
}

std::vector<double> StreamSegments::catchment_ratio(const MaskRaster& mask, bool terminal) const {
    const auto masked = masked_area(&mask, LengthUnits::Base, terminal);
    const auto total = masked_area(nullptr, LengthUnits::Base, terminal);
    std::vector<double> ratios(masked.size());
    for (size_t k = 0; k < masked.size(); k++) {
        ratios[k] = masked[k] / total[k];
    }
    return ratios;
}

std::vector<double> StreamSegments::upslope_ratio(const MaskRaster& mask, bool terminal) const {
    return catchment_ratio(mask, terminal);
}

std::vector<double> StreamSegments::developed_area(const MaskRaster& isdeveloped, LengthUnits units,
                                                   bool terminal) const {
    return masked_area(&isdeveloped, units, terminal);
}

std::vector<bool> StreamSegments::in_mask(const MaskRaster& mask, bool terminal) const {
    check_metadata(mask, *flow_);
    std::vector<bool> inside;
    for (auto k : selected(terminal)) {
        bool any = false;
        for (const auto& pixel : indices_[k]) {
            if (mask(pixel)) {
                any = true;
                break;
            }
        }
        inside.push_back(any);
    }
    return inside;
}

std::vector<bool> StreamSegments::in_perimeter(const MaskRaster& perimeter, bool terminal) const {
    return in_mask(perimeter, terminal);
}

std::vector<double> StreamSegments::kf_factor(const ValueRaster& kf_factor, const MaskRaster* mask,
                                              bool omitnan, bool terminal) const {
    kf_factor.check_range(0, INF);
    const auto statistic = omitnan ? Statistic::NanMean : Statistic::Mean;
    return catchment_summary(statistic, kf_factor, mask, terminal);
}

std::vector<double> StreamSegments::length(LengthUnits units, bool terminal) const {
    std::vector<double> lengths;
    for (auto k : selected(terminal)) {
        lengths.push_back(flow_->from_base(Watershed::length(segments_[k]), units));
    }
    return lengths;
}

std::vector<double> StreamSegments::scaled_dnbr(const ValueRaster& dnbr, const MaskRaster* mask,
                                                bool omitnan, bool terminal) const {
    const auto statistic = omitnan ? Statistic::NanMean : Statistic::Mean;
    return scale(catchment_summary(statistic, dnbr, mask, terminal), 1000);
}

std::vector<double> StreamSegments::scaled_thickness(const ValueRaster& soil_thickness,
                                                     const MaskRaster* mask, bool omitnan,
                                                     bool terminal) const {
    soil_thickness.check_range(0, INF);
    const auto statistic = omitnan ? Statistic::NanMean : Statistic::Mean;
    return scale(catchment_summary(statistic, soil_thickness, mask, terminal), 100);
}

std::vector<double> StreamSegments::sine_theta(const ValueRaster& sine_thetas, const MaskRaster* mask,
                                               bool omitnan, bool terminal) const {
    sine_thetas.check_range(0, 1);
    const auto statistic = omitnan ? Statistic::NanMean : Statistic::Mean;
    return catchment_summary(statistic, sine_thetas, mask, terminal);
}

std::vector<double> StreamSegments::slope(const ValueRaster& slopes, bool terminal) const {
    return summary(Statistic::Mean, slopes, terminal);
}

std::vector<double> StreamSegments::relief(const ValueRaster& relief, bool terminal) const {
    return outlet_values(relief, terminal);
}

std::vector<double> StreamSegments::ruggedness(const ValueRaster& relief, double relief_per_m,
                                               bool terminal) const {
    if (!(relief_per_m > 0) || std::isinf(relief_per_m)) {
        throw std::invalid_argument("relief_per_m must be a positive, finite number");
    }

    const auto heights = outlet_values(relief, terminal);
    const auto areas = masked_area(nullptr, LengthUnits::Meters, terminal);
    std::vector<double> rugged(heights.size());
    for (size_t k = 0; k < heights.size(); k++) {
        rugged[k] = heights[k] / relief_per_m / std::sqrt(areas[k]);
    }
    return rugged;
}

std::vector<double> StreamSegments::confinement(const ValueRaster& dem,
                                                const ConfinementParams& params) const {
    check_metadata(dem, *flow_);
    return ConfinementAngles(*flow_, params).angles(indices_, dem);
}
