#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "hyperidx.h"
#include "rastercalc.hpp"

using namespace hyperidx::raster;

TEST(RasterCalcTest, ReferencedBands) {
	std::vector<std::string> names = RasterCalculator::referencedBands(
		"(B8 - B4) / (B8 + B4 + 1e-6)");
	ASSERT_EQ(2u, names.size());
	EXPECT_EQ("B8", names[0]);
	EXPECT_EQ("B4", names[1]);
}

TEST(RasterCalcTest, ReferencedBandsSkipsFunctionsAndNumbers) {
	std::vector<std::string> names = RasterCalculator::referencedBands(
		"sqrt(b_red * scene_nir) + log (2.5E+3 * _x1) - abs(.5)");
	ASSERT_EQ(3u, names.size());
	EXPECT_EQ("b_red", names[0]);
	EXPECT_EQ("scene_nir", names[1]);
	EXPECT_EQ("_x1", names[2]);
	EXPECT_TRUE(RasterCalculator::referencedBands("1 + 2").empty());
}

TEST(RasterCalcTest, AddSource) {
	GDALRasterCalculator calc("out");
	calc.addSource("B4", "b4.tif");
	calc.addSource("B8", "stack.tif", 8);
	ASSERT_EQ(2u, calc.sources().size());
	EXPECT_EQ(1, calc.sources().at("B4").band);
	EXPECT_EQ("stack.tif", calc.sources().at("B8").filename);
	EXPECT_EQ(8, calc.sources().at("B8").band);
	EXPECT_THROW(calc.addSource("4b", "b4.tif"), std::invalid_argument);
	EXPECT_THROW(calc.addSource("B4", ""), std::invalid_argument);
	EXPECT_THROW(calc.addSource("B4", "b4.tif", 0), std::invalid_argument);
}

TEST(RasterCalcTest, OutputFilename) {
	GDALRasterCalculator calc("out");
	EXPECT_EQ("out/s2_NDVI.tif", calc.outputFilename("s2_NDVI"));
}

TEST(RasterCalcTest, MissingSource) {
	GDALRasterCalculator calc("out");
	calc.addSource("B4", "b4.tif");
	EXPECT_THROW(calc.calculate("NDVI", "(B8 - B4) / (B8 + B4 + 1e-6)"), std::runtime_error);
	EXPECT_THROW(calc.calculate("ONE", "1 + 2"), std::runtime_error);
}

TEST(RasterCalcTest, UnreadableSource) {
	GDALRasterCalculator calc("out");
	calc.addSource("B4", "/nonexistent/b4.tif");
	EXPECT_THROW(calc.calculate("X", "B4 * 2"), std::runtime_error);
}
