#include "fixtures.hpp"
#include "stream_errors.hpp"
#include "watershed.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace gtest {

TEST(FlowRaster, ConvertsTauDEMNumbers) {
	const FlowRaster flow(network_flow());

	EXPECT_EQ(flow.rows(), 7);
	EXPECT_EQ(flow.cols(), 7);
	EXPECT_EQ(flow.taudem(1, 1), 7);
	EXPECT_EQ(flow.taudem(3, 1), 1);
	EXPECT_EQ(flow.taudem(0, 0), 0);
	EXPECT_FALSE(flow.is_valid(0, 0));

	// 1 = east, 3 = north, 5 = west, 7 = south
	EXPECT_EQ(flow.downstream({3, 1}), Pixel(3, 2));
	EXPECT_EQ(flow.downstream({1, 2}), Pixel(0, 2));
	EXPECT_EQ(flow.downstream({4, 1}), Pixel(4, 0));
	EXPECT_EQ(flow.downstream({1, 1}), Pixel(2, 1));
	EXPECT_EQ(flow.downstream({3, 4}), Pixel(4, 3));
	EXPECT_TRUE(flow.drains_to({2, 4}, {3, 4}));
}

TEST(FlowRaster, RejectsInvalidNumbers) {
	auto raster = network_flow();
	raster(2, 2) = 9;
	EXPECT_THROW(FlowRaster flow(raster), std::invalid_argument);
	EXPECT_THROW(FlowRaster flow(network_flow(), -1.0), std::invalid_argument);
}

TEST(FlowRaster, RejectsInvalidNumbersInLargeRasters) {
	// Large enough to split the validation over every thread
	std::vector<std::vector<int>> flow_values(300, std::vector<int>(300, 7));
	std::vector<std::vector<int>> mask_values(300, std::vector<int>(300, 1));
	const FlowRaster flow(make_raster(flow_values, 0));
	EXPECT_NO_THROW(MaskRaster mask(make_raster(mask_values, -1), flow, "mask"));

	flow_values[299][299] = 12;
	mask_values[150][7] = 3;
	EXPECT_THROW(FlowRaster bad(make_raster(flow_values, 0)), std::invalid_argument);
	EXPECT_THROW(MaskRaster bad(make_raster(mask_values, -1), flow, "mask"), std::invalid_argument);
}

TEST(FlowRaster, Georeferencing) {
	auto raster = network_flow();
	raster.geotransform = {100, 10, 0, 500, 0, -10};
	const FlowRaster flow(raster, 0.3048);

	const Point center = flow.center({2, 3});
	EXPECT_DOUBLE_EQ(center.x, 135);
	EXPECT_DOUBLE_EQ(center.y, 475);
	EXPECT_EQ(flow.pixel_at(center), Pixel(2, 3));

	EXPECT_DOUBLE_EQ(flow.dx(), 10);
	EXPECT_DOUBLE_EQ(flow.dy(LengthUnits::Feet), 10);
	EXPECT_DOUBLE_EQ(flow.dx(LengthUnits::Meters), 3.048);
	EXPECT_DOUBLE_EQ(flow.pixel_area(LengthUnits::Base), 100);
	EXPECT_DOUBLE_EQ(flow.to_base(3.048, LengthUnits::Meters), 10);
}

TEST(FlowRaster, UnitConversionNeedsCRS) {
	auto raster = network_flow();
	raster.projection.clear();
	const FlowRaster flow(raster);

	EXPECT_DOUBLE_EQ(flow.dx(), 1);
	EXPECT_THROW(flow.dx(LengthUnits::Meters), MissingCRSError);
}

TEST(FlowRaster, ParseUnits) {
	EXPECT_EQ(parse_units("Kilometers"), LengthUnits::Kilometers);
	EXPECT_EQ(parse_units("base"), LengthUnits::Base);
	EXPECT_EQ(units_name(LengthUnits::Miles), "miles");
	EXPECT_THROW(parse_units("furlongs"), std::invalid_argument);
}

TEST(Rasters, MetadataMustConform) {
	const FlowRaster flow(network_flow());

	auto shifted = network_dem();
	shifted.geotransform = {5, 1, 0, 0, 0, 1};
	EXPECT_THROW(ValueRaster dem(shifted, flow, "dem"), RasterMetadataError);

	auto reprojected = network_dem();
	reprojected.projection = "EPSG:4326";
	EXPECT_THROW(ValueRaster dem(reprojected, flow, "dem"), RasterMetadataError);

	// Rasters without georeferencing inherit the flow raster's
	auto bare = network_dem();
	bare.geotransform.clear();
	bare.projection.clear();
	const ValueRaster dem(bare, flow, "dem");
	EXPECT_EQ(dem.values().geotransform, flow.geotransform());
}

TEST(Rasters, NoDataBecomesNaN) {
	const FlowRaster flow(network_flow());
	auto values = network_dem();
	values(3, 3) = -9999;
	const ValueRaster dem(values, flow, "dem");

	EXPECT_TRUE(dem.is_nodata(3, 3));
	EXPECT_TRUE(std::isnan(dem(3, 3)));
	EXPECT_DOUBLE_EQ(dem(2, 2), 61);
}

TEST(Rasters, MaskMustBeBoolean) {
	const FlowRaster flow(network_flow());
	auto values = make_mask(7, 7, {{1, 1}});
	values(2, 2) = -1;
	const MaskRaster mask(values, flow, "mask");
	EXPECT_TRUE(mask(1, 1));
	EXPECT_FALSE(mask(2, 2));

	values(3, 3) = 2;
	EXPECT_THROW(MaskRaster bad(values, flow, "mask"), std::invalid_argument);
}

TEST(Watershed, Accumulation) {
	const FlowRaster flow(network_flow());
	const Watershed watershed(flow);

	const auto accu = watershed.accumulation();
	EXPECT_DOUBLE_EQ(accu(3, 5), 11);
	EXPECT_DOUBLE_EQ(accu(4, 3), 4);
	EXPECT_DOUBLE_EQ(accu(1, 1), 1);
	EXPECT_TRUE(std::isnan(accu(0, 0)));
}

TEST(Watershed, WeightedAccumulation) {
	const FlowRaster flow(network_flow());
	const Watershed watershed(flow);
	auto values = network_dem();
	values(1, 1) = -9999;
	const ValueRaster weights(values, flow, "weights");

	EXPECT_TRUE(std::isnan(watershed.accumulation(&weights)(2, 4)));
	EXPECT_DOUBLE_EQ(watershed.accumulation(&weights, nullptr, true)(2, 4), 144);
	EXPECT_DOUBLE_EQ(watershed.accumulation(&weights)(4, 3), 140);
}

TEST(Watershed, CatchmentOutsideRaster) {
	const FlowRaster flow(network_flow());
	const Watershed watershed(flow);
	EXPECT_THROW(watershed.catchment(7, 2), CatchmentError);
	EXPECT_EQ(watershed.catchment_pixels(3, 4).size(), 4u);
	EXPECT_EQ(watershed.catchment_pixels(3, 4).front(), Pixel(3, 4));
}

}  // namespace gtest
