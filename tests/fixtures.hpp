#pragma once

#include "flow_raster.hpp"
#include "stream_network.hpp"
#include "stream_segments.hpp"

#include <gtest/gtest.h>
#include <richdem/common/Array2D.hpp>

#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gtest {

const std::string TEST_CRS = "EPSG:26911";

//! Network options without progress messages or splitting.
const NetworkParams QUIET(std::numeric_limits<double>::infinity(), LengthUnits::Meters, false);

//! Builds a raster from row-major values with a 1 meter, north-down identity transform.
template<typename T>
richdem::Array2D<T> make_raster(const std::vector<std::vector<T>>& rows, T nodata) {
	const int height = static_cast<int>(rows.size());
	const int width = static_cast<int>(rows.front().size());
	richdem::Array2D<T> raster(width, height, T());
	for (int y = 0; y < height; y++) {
		for (int x = 0; x < width; x++) {
			raster(x, y) = rows[y][x];
		}
	}
	raster.setNoData(nodata);
	raster.geotransform = {0, 1, 0, 0, 0, 1};
	raster.projection = TEST_CRS;
	return raster;
}

//! Boolean raster that is true on the listed pixels.
inline richdem::Array2D<int> make_mask(int rows, int cols, const std::vector<Pixel>& pixels) {
	std::vector<std::vector<int>> values(rows, std::vector<int>(cols, 0));
	for (const auto& pixel : pixels) {
		values[pixel.row][pixel.col] = 1;
	}
	return make_raster(values, -1);
}

// ============================================================================
// Stream network fixture. Six segments in two local drainage networks.
// ============================================================================

inline richdem::Array2D<int> network_flow() {
	return make_raster<int>({
		{0, 0, 0, 0, 0, 0, 0},
		{0, 7, 3, 3, 7, 3, 0},
		{0, 7, 3, 3, 7, 3, 0},
		{0, 1, 7, 3, 6, 5, 0},
		{0, 5, 1, 7, 1, 1, 0},
		{0, 5, 5, 7, 1, 1, 0},
		{0, 0, 0, 0, 0, 0, 0},
	}, 0);
}

inline std::vector<Pixel> network_mask_pixels() {
	return {
		{1, 1}, {2, 1}, {3, 1}, {3, 2}, {4, 2},
		{1, 4}, {2, 4},
		{2, 5}, {1, 5},
		{3, 5},
		{3, 4},
		{4, 3}, {5, 3},
	};
}

inline richdem::Array2D<double> network_dem() {
	return make_raster<double>({
		{0, 0, 0, 0, 0, 0, 0},
		{0, 61, 10, 10, 50, 10, 0},
		{0, 51, 61, 61, 40, 30, 0},
		{0, 41, 31, 99, 20, 30, 0},
		{0, 19, 21, 10, 22, 20, 0},
		{0, 15, 19, 10, 20, 16, 0},
		{0, 0, 0, 0, 0, 0, 0},
	}, -9999);
}

//! Flow raster and stream mask shared by the segment tests.
struct NetworkFixture {
	std::shared_ptr<const FlowRaster> flow;
	richdem::Array2D<int> mask;

	NetworkFixture()
		: flow(std::make_shared<const FlowRaster>(network_flow())),
		  mask(make_mask(7, 7, network_mask_pixels())) {}

	MaskRaster stream_mask() const { return MaskRaster(mask, *flow, "stream mask"); }
};

//! Checks that every stream pixel belongs to exactly one segment and no other pixel belongs to any.
inline void expectPixelsOwnedOnce(const StreamSegments& segments, const std::vector<Pixel>& stream_pixels) {
	const auto& flow = segments.flow();
	richdem::Array2D<int> owners(flow.cols(), flow.rows(), 0);
	for (const auto& pixels : segments.indices()) {
		for (const auto& pixel : pixels) {
			ASSERT_TRUE(flow.in_grid(pixel));
			owners(pixel.col, pixel.row)++;
		}
	}
	for (const auto& pixel : stream_pixels) {
		EXPECT_EQ(owners(pixel.col, pixel.row), 1) << "row " << pixel.row << ", col " << pixel.col;
		owners(pixel.col, pixel.row) = 0;
	}
	for (int row = 0; row < flow.rows(); row++) {
		for (int col = 0; col < flow.cols(); col++) {
			EXPECT_EQ(owners(col, row), 0) << "row " << row << ", col " << col;
		}
	}
}

}  // namespace gtest
