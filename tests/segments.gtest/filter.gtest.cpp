#include "fixtures.hpp"
#include "stream_segments.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace gtest {

TEST(Continuous, InteriorSegmentIsKept) {
	NetworkFixture fixture;
	StreamSegments segments(fixture.flow, fixture.stream_mask(), QUIET);

	const auto removed = segments.continuous(Selection::by_ids({5}));
	EXPECT_EQ(removed, std::vector<bool>(6, false));
}

TEST(Continuous, RemovesFromUpstreamEdge) {
	NetworkFixture fixture;
	StreamSegments segments(fixture.flow, fixture.stream_mask(), QUIET);

	const auto removed = segments.continuous(Selection::by_ids({2, 4, 5}));
	EXPECT_EQ(removed, std::vector<bool>({false, true, false, true, true, false}));

	const auto downstream_only = segments.continuous(Selection::by_ids({2, 4, 5}), false, false, true);
	EXPECT_EQ(downstream_only, std::vector<bool>(6, false));
}

TEST(Continuous, RemovesFromDownstreamEdge) {
	NetworkFixture fixture;
	StreamSegments segments(fixture.flow, fixture.stream_mask(), QUIET);

	const auto removed = segments.continuous(Selection::by_ids({5, 6}), false, false, true);
	EXPECT_EQ(removed, std::vector<bool>({false, false, false, false, true, true}));
}

TEST(Continuous, KeepMode) {
	NetworkFixture fixture;
	StreamSegments segments(fixture.flow, fixture.stream_mask(), QUIET);

	const auto kept = segments.continuous(Selection::by_ids({1, 3, 6}), true);
	EXPECT_EQ(kept, std::vector<bool>({true, false, true, false, false, true}));
}

TEST(Continuous, IsPure) {
	NetworkFixture fixture;
	StreamSegments segments(fixture.flow, fixture.stream_mask(), QUIET);

	const Selection selection({4}, {true, false, false, false, true, false});
	const auto first = segments.continuous(selection);
	const auto second = segments.continuous(selection);
	EXPECT_EQ(first, second);
	EXPECT_EQ(segments.child_indices(), std::vector<int>({5, 4, -1, 4, 5, -1}));
	EXPECT_EQ(segments.size(), 6u);
}

TEST(Remove, RemapsConnectivity) {
	NetworkFixture fixture;
	StreamSegments segments(fixture.flow, fixture.stream_mask(), QUIET);

	segments.remove(Selection::by_ids({1, 3, 6}));
	EXPECT_EQ(segments.ids(), std::vector<int>({2, 4, 5}));
	EXPECT_EQ(segments.child_indices(), std::vector<int>({2, 2, -1}));
	EXPECT_EQ(segments.parent_indices()[2], std::vector<int>({0, 1}));
	EXPECT_EQ(segments.npixels(), std::vector<double>({2, 1, 4}));
	EXPECT_EQ(segments.indices()[2], std::vector<Pixel>({{3, 4}}));

	// Remaining ids are unchanged
	EXPECT_EQ(segments.parents(5), std::vector<int>({2, 4}));
	EXPECT_FALSE(segments.child(5).has_value());
	EXPECT_THROW(segments.child(1), std::out_of_range);
}

TEST(Remove, IdsAndIndicesAreCombined) {
	NetworkFixture fixture;
	StreamSegments segments(fixture.flow, fixture.stream_mask(), QUIET);

	segments.remove(Selection({2}, {false, false, false, true, false, false}));
	EXPECT_EQ(segments.ids(), std::vector<int>({1, 3, 5, 6}));
}

TEST(Remove, RejectsWrongIndexLength) {
	NetworkFixture fixture;
	StreamSegments segments(fixture.flow, fixture.stream_mask(), QUIET);
	EXPECT_THROW(segments.remove(Selection::by_indices({true, false})), std::invalid_argument);
}

TEST(Remove, KeepIsComplementary) {
	NetworkFixture fixture;
	StreamSegments segments(fixture.flow, fixture.stream_mask(), QUIET);
	const std::vector<bool> selected = {true, false, true, true, false, false};

	auto removed = segments.copy();
	removed.remove(Selection::by_indices(selected));
	auto kept = segments.copy();
	kept.keep(Selection::by_indices(selected));

	EXPECT_EQ(removed.ids(), std::vector<int>({2, 5, 6}));
	EXPECT_EQ(kept.ids(), std::vector<int>({1, 3, 4}));

	std::vector<int> all = removed.ids();
	all.insert(all.end(), kept.ids().begin(), kept.ids().end());
	std::sort(all.begin(), all.end());
	EXPECT_EQ(all, segments.ids());
}

TEST(Remove, BasinsSurviveUnrelatedRemoval) {
	NetworkFixture fixture;
	StreamSegments segments(fixture.flow, fixture.stream_mask(), QUIET);
	segments.locate_basins(BasinParams(false, 0, false));
	ASSERT_TRUE(segments.basins_located());

	segments.remove(Selection::by_ids({4}));
	EXPECT_TRUE(segments.basins_located());

	segments.remove(Selection::by_ids({3}));
	EXPECT_FALSE(segments.basins_located());
}

}  // namespace gtest
