#include "include/statistics.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>


namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();

double mean_of(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double variance_of(const std::vector<double>& values) {
    const double mean = mean_of(values);
    double total = 0;
    for (auto value : values) {
        total += (value - mean) * (value - mean);
    }
    return total / static_cast<double>(values.size());
}

double median_of(std::vector<double>& values) {
    const size_t middle = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + middle, values.end());
    const double upper = values[middle];
    if (values.size() % 2 == 1) {
        return upper;
    }
    const double lower = *std::max_element(values.begin(), values.begin() + middle);
    return (lower + upper) / 2;
}

}  // namespace


const std::map<std::string, std::string>& statistic_descriptions() {
    static const std::map<std::string, std::string> descriptions = {
        {"outlet",    "Values at stream segment outlet pixels"},
        {"min",       "Minimum value"},
        {"max",       "Maximum value"},
        {"mean",      "Mean"},
        {"median",    "Median"},
        {"std",       "Standard deviation"},
        {"sum",       "Sum"},
        {"var",       "Variance"},
        {"nanmin",    "Minimum value, ignoring NaN"},
        {"nanmax",    "Maximum value, ignoring NaN"},
        {"nanmean",   "Mean value, ignoring NaN"},
        {"nanmedian", "Median value, ignoring NaN"},
        {"nanstd",    "Standard deviation, ignoring NaN"},
        {"nansum",    "Sum, ignoring NaN"},
        {"nanvar",    "Variance, ignoring NaN"},
    };
    return descriptions;
}

Statistic parse_statistic(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::map<std::string, Statistic> statistics = {
        {"outlet", Statistic::Outlet},       {"min", Statistic::Min},
        {"max", Statistic::Max},             {"mean", Statistic::Mean},
        {"median", Statistic::Median},       {"std", Statistic::Std},
        {"sum", Statistic::Sum},             {"var", Statistic::Var},
        {"nanmin", Statistic::NanMin},       {"nanmax", Statistic::NanMax},
        {"nanmean", Statistic::NanMean},     {"nanmedian", Statistic::NanMedian},
        {"nanstd", Statistic::NanStd},       {"nansum", Statistic::NanSum},
        {"nanvar", Statistic::NanVar},
    };

    const auto match = statistics.find(lower);
    if (match == statistics.end()) {
        std::string options;
        for (const auto& entry : statistic_descriptions()) {
            options += (options.empty() ? "" : ", ") + entry.first;
        }
        throw std::invalid_argument(
            "Unrecognized statistic (" + name + "). Supported options are: " + options);
    }
    return match->second;
}

std::string statistic_name(Statistic statistic) {
    switch (statistic) {
        case Statistic::Outlet:    return "outlet";
        case Statistic::Min:       return "min";
        case Statistic::Max:       return "max";
        case Statistic::Mean:      return "mean";
        case Statistic::Median:    return "median";
        case Statistic::Std:       return "std";
        case Statistic::Sum:       return "sum";
        case Statistic::Var:       return "var";
        case Statistic::NanMin:    return "nanmin";
        case Statistic::NanMax:    return "nanmax";
        case Statistic::NanMean:   return "nanmean";
        case Statistic::NanMedian: return "nanmedian";
        case Statistic::NanStd:    return "nanstd";
        case Statistic::NanSum:    return "nansum";
        case Statistic::NanVar:    return "nanvar";
    }
    return "unknown";
}

bool omits_nan(Statistic statistic) {
    switch (statistic) {
        case Statistic::NanMin:
        case Statistic::NanMax:
        case Statistic::NanMean:
        case Statistic::NanMedian:
        case Statistic::NanStd:
        case Statistic::NanSum:
        case Statistic::NanVar:
            return true;
        default:
            return false;
    }
}

double summarize(Statistic statistic, std::vector<double>& values) {
    if (omits_nan(statistic)) {
        values.erase(std::remove_if(values.begin(), values.end(),
                                    [](double value) { return std::isnan(value); }),
                     values.end());
    } else if (std::any_of(values.begin(), values.end(), [](double value) { return std::isnan(value); })) {
        return NaN;
    }
    if (values.empty()) {
        return NaN;
    }

    switch (statistic) {
        case Statistic::Outlet:
            return values.front();
        case Statistic::Min:
        case Statistic::NanMin:
            return *std::min_element(values.begin(), values.end());
        case Statistic::Max:
        case Statistic::NanMax:
            return *std::max_element(values.begin(), values.end());
        case Statistic::Mean:
        case Statistic::NanMean:
            return mean_of(values);
        case Statistic::Median:
        case Statistic::NanMedian:
            return median_of(values);
        case Statistic::Std:
        case Statistic::NanStd:
            return std::sqrt(variance_of(values));
        case Statistic::Sum:
        case Statistic::NanSum:
            return std::accumulate(values.begin(), values.end(), 0.0);
        case Statistic::Var:
        case Statistic::NanVar:
            return variance_of(values);
    }
    return NaN;
}
