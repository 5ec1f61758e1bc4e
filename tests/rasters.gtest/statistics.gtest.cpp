#include "statistics.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace gtest {

const double NaN = std::numeric_limits<double>::quiet_NaN();

double summarizeCopy(Statistic statistic, std::vector<double> values) {
	return summarize(statistic, values);
}

TEST(Statistics, ParseNames) {
	EXPECT_EQ(parse_statistic("mean"), Statistic::Mean);
	EXPECT_EQ(parse_statistic("NanMedian"), Statistic::NanMedian);
	EXPECT_EQ(parse_statistic("OUTLET"), Statistic::Outlet);
	EXPECT_EQ(statistic_name(Statistic::NanVar), "nanvar");
	EXPECT_EQ(statistic_descriptions().size(), 15u);
}

TEST(Statistics, UnknownNameListsOptions) {
	try {
		parse_statistic("mode");
		FAIL() << "Expected std::invalid_argument";
	} catch (const std::invalid_argument& error) {
		const std::string message = error.what();
		EXPECT_NE(message.find("mode"), std::string::npos);
		EXPECT_NE(message.find("nanmean"), std::string::npos);
	}
}

TEST(Statistics, Values) {
	const std::vector<double> values = {4, 1, 3, 2};
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::Outlet, values), 4);
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::Min, values), 1);
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::Max, values), 4);
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::Mean, values), 2.5);
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::Median, values), 2.5);
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::Sum, values), 10);
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::Var, values), 1.25);
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::Std, values), std::sqrt(1.25));
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::Median, {5, 1, 3}), 3);
}

TEST(Statistics, NaNHandling) {
	const std::vector<double> values = {4, NaN, 3, 2};
	EXPECT_TRUE(std::isnan(summarizeCopy(Statistic::Mean, values)));
	EXPECT_TRUE(std::isnan(summarizeCopy(Statistic::Max, values)));
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::NanMean, values), 3);
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::NanMax, values), 4);
	EXPECT_DOUBLE_EQ(summarizeCopy(Statistic::NanSum, values), 9);
	EXPECT_TRUE(omits_nan(Statistic::NanStd));
	EXPECT_FALSE(omits_nan(Statistic::Std));
}

TEST(Statistics, EmptyIsNaN) {
	EXPECT_TRUE(std::isnan(summarizeCopy(Statistic::Sum, {})));
	EXPECT_TRUE(std::isnan(summarizeCopy(Statistic::NanSum, {NaN, NaN})));
	EXPECT_TRUE(std::isnan(summarizeCopy(Statistic::Median, {})));
}

}  // namespace gtest
