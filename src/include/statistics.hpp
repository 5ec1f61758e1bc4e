#pragma once

#include <map>
#include <string>
#include <vector>


/**
 * @brief Summary statistics for stream segment and catchment values
 *
 * The nan-prefixed statistics ignore NaN (NoData) values. The others return
 * NaN when any summarized value is NaN. Every statistic returns NaN when
 * there are no values to summarize.
 */
enum class Statistic {
    Outlet,
    Min,
    Max,
    Mean,
    Median,
    Std,
    Sum,
    Var,
    NanMin,
    NanMax,
    NanMean,
    NanMedian,
    NanStd,
    NanSum,
    NanVar
};

/**
 * @brief Parses a statistic name (case-insensitive)
 * @throws std::invalid_argument for unrecognized names
 */
Statistic parse_statistic(const std::string& name);

std::string statistic_name(Statistic statistic);

/** @brief Statistic names and their descriptions */
const std::map<std::string, std::string>& statistic_descriptions();

/** @brief True for statistics that ignore NaN values */
bool omits_nan(Statistic statistic);

/**
 * @brief Computes a statistic over a set of values
 *
 * Outlet statistics take the first value. Std and Var are population
 * statistics (no degrees-of-freedom correction).
 *
 * @param statistic The statistic to compute
 * @param values Values to summarize (reordered in place)
 */
double summarize(Statistic statistic, std::vector<double>& values);
