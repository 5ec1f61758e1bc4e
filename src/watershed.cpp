#include "include/watershed.hpp"

#include <cmath>
#include <queue>
#include <string>
#include <utility>


// ============================================================================
// FLOW ACCUMULATION
// ============================================================================

richdem::Array2D<double> Watershed::accumulate(richdem::Array2D<double> accu, bool omitnan) const {
    const auto& flowdirs = flow.flowdirs();

    if (omitnan) {
        #pragma omp parallel for
        for (size_t i = 0; i < accu.size(); i++) {
            if (std::isnan(accu(i))) {
                accu(i) = 0;
            }
        }
    }

    // Calculate number of inflowing pixels (NIPS) for each cell
    richdem::Array2D<uint8_t> nips(flowdirs, 0);
    for (int y = 0; y < nips.height(); y++) {
        for (int x = 0; x < nips.width(); x++) {
            if (flowdirs(x, y) == richdem::NO_FLOW) {
                continue;
            }
            int my_nx = x + richdem::d8x[flowdirs(x, y)];
            int my_ny = y + richdem::d8y[flowdirs(x, y)];
            if (flowdirs.inGrid(my_nx, my_ny)) {
                nips(my_nx, my_ny)++;
            }
        }
    }

    // Walk downstream from every cell without inflow. A walk stops at a
    // confluence until the last of its upstream walks arrives.
    for (int y = 0; y < flowdirs.height(); y++) {
        for (int x = 0; x < flowdirs.width(); x++) {
            if (flowdirs(x, y) == richdem::NO_FLOW) {
                continue;
            }
            if (nips(x, y) != 0) {
                continue;
            }

            auto current_cell_accu = accu(x, y);
            int next_x = x + richdem::d8x[flowdirs(x, y)];
            int next_y = y + richdem::d8y[flowdirs(x, y)];

            while (flowdirs.inGrid(next_x, next_y)) {
                accu(next_x, next_y) = current_cell_accu + accu(next_x, next_y);
                if (nips(next_x, next_y) > 1) {
                    nips(next_x, next_y)--;
                    break;
                }
                if (flowdirs(next_x, next_y) == richdem::NO_FLOW) {
                    break;
                }
                current_cell_accu = accu(next_x, next_y);
                int dx = richdem::d8x[flowdirs(next_x, next_y)];
                int dy = richdem::d8y[flowdirs(next_x, next_y)];
                next_x += dx;
                next_y += dy;
            }
        }
    }

    // Accumulation is undefined where there is no flow direction
    #pragma omp parallel for
    for (size_t i = 0; i < accu.size(); i++) {
        if (flowdirs(i) == richdem::NO_FLOW) {
            accu(i) = std::numeric_limits<double>::quiet_NaN();
        }
    }
    return accu;
}

richdem::Array2D<double> Watershed::accumulation(const ValueRaster* weights,
                                                 const MaskRaster* mask,
                                                 bool omitnan) const {
    richdem::Array2D<double> values = (weights != nullptr)
        ? weights->values()
        : flow.new_raster<double>(1.0);

    if (mask != nullptr) {
        const auto& keep = mask->values();
        #pragma omp parallel for
        for (size_t i = 0; i < values.size(); i++) {
            if (keep(i) == 0) {
                values(i) = 0;
            }
        }
    }
    return accumulate(std::move(values), omitnan);
}

// ============================================================================
// CATCHMENT BASINS
// ============================================================================

std::vector<Pixel> Watershed::catchment_pixels(int row, int col) const {
    if (!flow.in_grid(row, col)) {
        throw CatchmentError(
            "Cannot delineate the catchment basin of pixel (row=" + std::to_string(row)
            + ", col=" + std::to_string(col) + ") because it is outside the flow raster");
    }

    richdem::Array2D<uint8_t> visited(flow.flowdirs(), 0);
    std::vector<Pixel> basin;
    std::queue<Pixel> to_process;

    visited(col, row) = 1;
    to_process.push(Pixel(row, col));

    while (!to_process.empty()) {
        const Pixel current = to_process.front();
        to_process.pop();
        basin.push_back(current);

        // Check all 8 neighbors for cells flowing into the current one
        for (int dir = 1; dir <= 8; dir++) {
            const Pixel neighbor(current.row + richdem::d8y[dir], current.col + richdem::d8x[dir]);
            if (!flow.in_grid(neighbor) || visited(neighbor.col, neighbor.row)) {
                continue;
            }
            if (flow.drains_to(neighbor, current)) {
                visited(neighbor.col, neighbor.row) = 1;
                to_process.push(neighbor);
            }
        }
    }
    return basin;
}

richdem::Array2D<uint8_t> Watershed::catchment(int row, int col) const {
    auto basin = flow.new_raster<uint8_t>(0);
    for (const auto& pixel : catchment_pixels(row, col)) {
        basin(pixel.col, pixel.row) = 1;
    }
    return basin;
}

// ============================================================================
// STREAM NETWORK
// ============================================================================

std::vector<Polyline> Watershed::network(const MaskRaster& mask, double max_length) const {
    const auto in_network = [&](const Pixel& pixel) {
        return flow.in_grid(pixel) && mask(pixel) && flow.is_valid(pixel);
    };

    // Count the stream pixels that drain into each pixel
    richdem::Array2D<uint8_t> indegree(flow.flowdirs(), 0);
    for (int row = 0; row < flow.rows(); row++) {
        for (int col = 0; col < flow.cols(); col++) {
            const Pixel pixel(row, col);
            if (!in_network(pixel)) {
                continue;
            }
            const Pixel next = flow.downstream(pixel);
            if (in_network(next)) {
                indegree(next.col, next.row)++;
            }
        }
    }
    richdem::Array2D<uint8_t> remaining = indegree;

    // Channel heads, in row-major order
    std::queue<Pixel> starts;
    for (int row = 0; row < flow.rows(); row++) {
        for (int col = 0; col < flow.cols(); col++) {
            if (in_network(Pixel(row, col)) && indegree(col, row) == 0) {
                starts.push(Pixel(row, col));
            }
        }
    }

    std::vector<Polyline> segments;
    while (!starts.empty()) {
        Pixel current = starts.front();
        starts.pop();

        Polyline line{flow.center(current)};
        while (true) {
            const Pixel next = flow.downstream(current);
            line.push_back(flow.center(next));

            if (!in_network(next)) {
                break;
            }
            if (indegree(next.col, next.row) > 1) {
                // The junction starts a new segment once all its tributaries arrived
                if (--remaining(next.col, next.row) == 0) {
                    starts.push(next);
                }
                break;
            }
            current = next;
        }
        segments.push_back(std::move(line));
    }

    if (std::isinf(max_length)) {
        return segments;
    }

    std::vector<Polyline> split_segments;
    for (const auto& segment : segments) {
        for (auto& piece : split(segment, max_length)) {
            split_segments.push_back(std::move(piece));
        }
    }
    return split_segments;
}

double Watershed::length(const Polyline& line) {
    double total = 0;
    for (size_t k = 1; k < line.size(); k++) {
        total += std::hypot(line[k].x - line[k - 1].x, line[k].y - line[k - 1].y);
    }
    return total;
}

std::vector<Polyline> Watershed::split(const Polyline& line, double max_length) {
    const double total = length(line);
    if (total <= max_length) {
        return {line};
    }

    // Distance of each vertex along the line
    std::vector<double> distance(line.size(), 0.0);
    for (size_t k = 1; k < line.size(); k++) {
        distance[k] = distance[k - 1]
            + std::hypot(line[k].x - line[k - 1].x, line[k].y - line[k - 1].y);
    }

    const auto npieces = static_cast<size_t>(std::ceil(total / max_length));
    const double piece_length = total / static_cast<double>(npieces);

    // Each split point is interpolated once and shared by both adjacent pieces
    std::vector<Point> split_points;
    size_t vertex = 0;
    for (size_t k = 1; k < npieces; k++) {
        const double target = static_cast<double>(k) * piece_length;
        while (vertex + 2 < line.size() && distance[vertex + 1] < target) {
            vertex++;
        }
        const double span = distance[vertex + 1] - distance[vertex];
        const double t = (span > 0) ? (target - distance[vertex]) / span : 0.0;
        if (t >= 1) {
            split_points.push_back(line[vertex + 1]);
        } else if (t <= 0) {
            split_points.push_back(line[vertex]);
        } else {
            split_points.emplace_back(line[vertex].x + t * (line[vertex + 1].x - line[vertex].x),
                                      line[vertex].y + t * (line[vertex + 1].y - line[vertex].y));
        }
    }

    std::vector<Polyline> pieces(npieces);
    size_t next_vertex = 1;
    for (size_t k = 0; k < npieces; k++) {
        Polyline& piece = pieces[k];
        piece.push_back(k == 0 ? line.front() : split_points[k - 1]);

        const double end = static_cast<double>(k + 1) * piece_length;
        const bool last = (k + 1 == npieces);
        while (next_vertex + 1 < line.size() && (last || distance[next_vertex] < end)) {
            if (piece.back() != line[next_vertex]) {
                piece.push_back(line[next_vertex]);
            }
            next_vertex++;
        }

        const Point& stop = last ? line.back() : split_points[k];
        if (piece.size() == 1 || piece.back() != stop) {
            piece.push_back(stop);
        }
    }
    return pieces;
}
