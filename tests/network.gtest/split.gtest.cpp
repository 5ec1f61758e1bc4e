#include "fixtures.hpp"
#include "stream_segments.hpp"
#include "watershed.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <vector>

namespace gtest {

TEST(Split, ShortLinesAreUnchanged) {
	const Polyline line = {{0, 0}, {0, 1}, {0, 2}};
	const auto pieces = Watershed::split(line, 5);
	ASSERT_EQ(pieces.size(), 1u);
	EXPECT_EQ(pieces[0].size(), 3u);
}

TEST(Split, PiecesHaveEqualLength) {
	const Polyline line = {{0, 0}, {0, 7}};
	const auto pieces = Watershed::split(line, 3);

	ASSERT_EQ(pieces.size(), 3u);
	for (const auto& piece : pieces) {
		EXPECT_NEAR(Watershed::length(piece), 7.0 / 3.0, 1e-12);
	}
	// Adjacent pieces share the exact split point
	EXPECT_EQ(pieces[0].back(), pieces[1].front());
	EXPECT_EQ(pieces[1].back(), pieces[2].front());
}

TEST(Split, SplitPointCreditedDownstream) {
	NetworkFixture fixture;
	const NetworkParams params(2.5, LengthUnits::Meters, false);
	StreamSegments segments(fixture.flow, fixture.stream_mask(), params);

	ASSERT_EQ(segments.size(), 7u);
	EXPECT_EQ(segments.indices()[0], std::vector<Pixel>({{1, 1}, {2, 1}, {3, 1}}));
	EXPECT_EQ(segments.indices()[1], std::vector<Pixel>({{3, 2}, {4, 2}}));

	const Point split_point(2.0, 3.5);
	EXPECT_EQ(segments.segments()[0].back(), split_point);
	EXPECT_EQ(segments.segments()[1].front(), split_point);
	EXPECT_EQ(segments.child(1), std::optional<int>(2));
	expectPixelsOwnedOnce(segments, network_mask_pixels());
}

TEST(Split, EveryStreamPixelHasOneOwner) {
	NetworkFixture fixture;
	for (double max_length : {1.5, 2.0, 2.5}) {
		const NetworkParams params(max_length, LengthUnits::Meters, false);
		StreamSegments segments(fixture.flow, fixture.stream_mask(), params);
		EXPECT_GT(segments.size(), 6u) << "max_length " << max_length;
		expectPixelsOwnedOnce(segments, network_mask_pixels());
	}
}

TEST(Split, SplitPointOnPixelEdge) {
	auto flow = std::make_shared<const FlowRaster>(make_raster<int>({
		{0, 0, 0, 0, 0, 0, 0},
		{0, 5, 5, 5, 5, 5, 0},
		{0, 0, 0, 0, 0, 0, 0},
	}, 0));
	const auto mask = make_mask(3, 7, {{1, 1}, {1, 2}, {1, 3}, {1, 4}, {1, 5}});
	const NetworkParams params(2.5, LengthUnits::Meters, false);
	StreamSegments segments(flow, MaskRaster(mask, *flow, "stream mask"), params);

	ASSERT_EQ(segments.size(), 2u);
	std::vector<double> upstream_x, downstream_x;
	for (const auto& point : segments.segments()[0]) {
		upstream_x.push_back(point.x);
		EXPECT_DOUBLE_EQ(point.y, 1.5);
	}
	for (const auto& point : segments.segments()[1]) {
		downstream_x.push_back(point.x);
	}
	EXPECT_EQ(upstream_x, std::vector<double>({5.5, 4.5, 3.5, 3.0}));
	EXPECT_EQ(downstream_x, std::vector<double>({3.0, 2.5, 1.5, 0.5}));

	EXPECT_EQ(segments.indices()[0], std::vector<Pixel>({{1, 5}, {1, 4}, {1, 3}}));
	EXPECT_EQ(segments.indices()[1], std::vector<Pixel>({{1, 2}, {1, 1}}));
	EXPECT_EQ(segments.npixels(), std::vector<double>({3, 5}));
	EXPECT_EQ(segments.child_indices(), std::vector<int>({1, -1}));
	expectPixelsOwnedOnce(segments, {{1, 1}, {1, 2}, {1, 3}, {1, 4}, {1, 5}});
}

TEST(Split, SplitPointOnPixelCorner) {
	// Three diagonal steps to the southwest. The split point falls on the
	// corner shared by pixels (2,2), (2,1), (3,2) and (3,1).
	auto flow = std::make_shared<const FlowRaster>(make_raster<int>({
		{0, 0, 0, 0, 0},
		{0, 0, 0, 6, 0},
		{0, 0, 6, 0, 0},
		{0, 6, 0, 0, 0},
		{0, 0, 0, 0, 0},
	}, 0));
	const std::vector<Pixel> channel = {{1, 3}, {2, 2}, {3, 1}};
	const NetworkParams params(2.2, LengthUnits::Meters, false);
	StreamSegments segments(flow, MaskRaster(make_mask(5, 5, channel), *flow, "stream mask"), params);

	ASSERT_EQ(segments.size(), 2u);
	EXPECT_EQ(segments.segments()[0].back(), Point(2.0, 3.0));
	EXPECT_EQ(segments.indices()[0], std::vector<Pixel>({{1, 3}, {2, 2}}));
	EXPECT_EQ(segments.indices()[1], std::vector<Pixel>({{3, 1}}));
	EXPECT_EQ(segments.npixels(), std::vector<double>({2, 3}));
	expectPixelsOwnedOnce(segments, channel);
}

TEST(Split, CornerVertexBelongsToNextPixel) {
	const FlowRaster flow(make_raster<int>({{6, 6}, {6, 6}}, 0));
	const Polyline line = {{1.5, 0.5}, {1.0, 1.0}, {0.5, 1.5}};
	EXPECT_EQ(flow.vertex_pixel(line, 1), Pixel(1, 0));
	EXPECT_EQ(flow.vertex_pixel({{1.0, 1.0}, {0.5, 1.5}}, 0), Pixel(1, 0));
	EXPECT_EQ(flow.vertex_pixel({{1.5, 0.5}, {1.0, 1.0}}, 1), Pixel(1, 0));
	EXPECT_EQ(flow.vertex_pixel({{0.5, 0.5}, {1.0, 1.0}}, 1), Pixel(1, 1));
	EXPECT_EQ(flow.vertex_pixel(line, 0), Pixel(0, 1));
}

TEST(Split, LongChannelIsChained) {
	// 1000 meters of 10 meter pixels draining south
	std::vector<std::vector<int>> values(101, std::vector<int>(3, 0));
	std::vector<Pixel> channel;
	for (int row = 0; row < 100; row++) {
		values[row][1] = 7;
		channel.emplace_back(row, 1);
	}
	auto raster = make_raster(values, 0);
	raster.geotransform = {0, 10, 0, 0, 0, 10};
	auto flow = std::make_shared<const FlowRaster>(raster);

	auto mask = make_mask(101, 3, channel);
	mask.geotransform = raster.geotransform;
	const NetworkParams params(300, LengthUnits::Meters, false);
	StreamSegments segments(flow, MaskRaster(mask, *flow, "stream mask"), params);

	ASSERT_EQ(segments.size(), 4u);
	EXPECT_EQ(segments.child_indices(), std::vector<int>({1, 2, 3, -1}));
	EXPECT_EQ(segments.termini(), std::vector<int>({4, 4, 4, 4}));

	int expected_row = 0;
	for (size_t k = 0; k < 4; k++) {
		EXPECT_NEAR(segments.length()[k], 250, 1e-9);
		ASSERT_EQ(segments.indices()[k].size(), 25u);
		for (const auto& pixel : segments.indices()[k]) {
			EXPECT_EQ(pixel, Pixel(expected_row++, 1));
		}
	}
	EXPECT_EQ(segments.npixels(), std::vector<double>({25, 50, 75, 100}));
	expectPixelsOwnedOnce(segments, channel);
}

}  // namespace gtest
