#include <string>
#include <vector>
#include <utility>
#include <stdexcept>
#include <sstream>
#include <iostream>

#include <gtest/gtest.h>
#include <omp.h>

#include "hyperidx.h"
#include "catalog.hpp"
#include "matcher.hpp"
#include "rastercalc.hpp"
#include "indices.hpp"

using namespace hyperidx;
using namespace hyperidx::catalog;
using namespace hyperidx::matching;
using namespace hyperidx::indices;
using namespace hyperidx::indices::config;

namespace {

	// Records the calls it receives.
	class RecordingCalculator : public raster::RasterCalculator {
	public:
		std::vector<std::pair<std::string, std::string> > calls;

		void calculate(const std::string &outputName, const std::string &expression) {
			calls.push_back(std::make_pair(outputName, expression));
		}
	};

	// Records the calls it receives and fails on the first one.
	class FirstCallFails : public RecordingCalculator {
	public:
		void calculate(const std::string &outputName, const std::string &expression) {
			RecordingCalculator::calculate(outputName, expression);
			if(calls.size() == 1)
				throw std::runtime_error("engine failed for " + outputName);
		}
	};

} // anon

class IndicesTest : public ::testing::Test {
protected:
	HyperIndices hi;

	// A Sentinel-2 like band set.
	std::vector<BandInput> s2() {
		return BandMatcher::makeInputs(
			{"B2", "B3", "B4", "B5", "B8", "B11", "B12"},
			{490, 560, 665, 705, 842, 1610, 2190});
	}

	IndexRequest named(const std::vector<std::string> &names) {
		IndexRequest req;
		req.indices = names;
		return req;
	}
};

// ============================================================================
// Selection
// ============================================================================

TEST_F(IndicesTest, SelectsInRequestOrder) {
	std::vector<const IndexDefinition*> defs = hi.select(named({"EVI", "ndvi", "NDVI", "SAVI"}));
	ASSERT_EQ(3u, defs.size());
	EXPECT_EQ("EVI", defs[0]->name);
	EXPECT_EQ("NDVI", defs[1]->name);
	EXPECT_EQ("SAVI", defs[2]->name);
}

TEST_F(IndicesTest, ThemeTakesPrecedence) {
	IndexRequest req = named({"NDBI"});
	req.theme = "water";
	std::vector<const IndexDefinition*> defs = hi.select(req);
	ASSERT_EQ(4u, defs.size());
	for(const IndexDefinition *def : defs)
		EXPECT_EQ(WATER, def->theme);
}

TEST_F(IndicesTest, SelectsAllAndThemesByName) {
	EXPECT_EQ(IndexCatalog::instance().size(), hi.select(named({"all"})).size());
	EXPECT_EQ(IndexCatalog::instance().size(), hi.select(named({"NDVI", "all"})).size());
	std::vector<const IndexDefinition*> defs = hi.select(named({"NDBI", "urban"}));
	ASSERT_EQ(2u, defs.size());
	EXPECT_EQ("NDBI", defs[0]->name);
	EXPECT_EQ("UI", defs[1]->name);
}

TEST_F(IndicesTest, SelectionErrors) {
	EXPECT_THROW(hi.select(named({"NDVI", "NOPE"})), UnknownIndexError);
	IndexRequest req;
	req.theme = "forest";
	EXPECT_THROW(hi.select(req), UnknownThemeError);
	EXPECT_THROW(hi.select(IndexRequest()), InvalidInputError);
	EXPECT_THROW(hi.select(named({" "})), InvalidInputError);
}

TEST_F(IndicesTest, OutputName) {
	EXPECT_EQ("s2_NDVI", HyperIndices::outputName("s2", "NDVI"));
	EXPECT_EQ("NDVI", HyperIndices::outputName("", "NDVI"));
}

// ============================================================================
// Computation
// ============================================================================

TEST_F(IndicesTest, ComputesRequestedIndices) {
	BatchResult r = hi.compute(s2(), named({"NDVI", "NDWI"}));
	ASSERT_EQ(2u, r.expressions.size());
	EXPECT_EQ("NDVI", r.expressions[0].indexName);
	EXPECT_EQ("(B8 - B4) / (B8 + B4 + 1e-6)", r.expressions[0].expression);
	EXPECT_EQ("NDWI", r.expressions[1].indexName);
	EXPECT_TRUE(r.warnings.empty());
}

TEST_F(IndicesTest, SkipsUnmatchedIndices) {
	IndexRequest req;
	req.theme = "vegetation";
	BatchResult r = hi.compute(BandMatcher::makeInputs({"b1"}, {480}), req);
	EXPECT_TRUE(r.expressions.empty());
	ASSERT_EQ(18u, r.warnings.size());
	EXPECT_EQ(0u, r.warnings[0].find("index NDVI skipped: missing role(s) "));
	for(const std::string &w : r.warnings)
		EXPECT_NE(std::string::npos, w.find(" skipped: missing role(s) "));
}

TEST_F(IndicesTest, SkipDoesNotAbortBatch) {
	BatchResult r = hi.compute(BandMatcher::makeInputs({"r", "n"}, {665, 842}),
		named({"EVI", "NDVI", "NDWI", "SR"}));
	ASSERT_EQ(2u, r.expressions.size());
	EXPECT_EQ("NDVI", r.expressions[0].indexName);
	EXPECT_EQ("SR", r.expressions[1].indexName);
	ASSERT_EQ(2u, r.warnings.size());
	EXPECT_EQ(0u, r.warnings[0].find("index EVI skipped"));
	EXPECT_EQ(0u, r.warnings[1].find("index NDWI skipped"));
}

TEST_F(IndicesTest, InvalidInputBeforeSelection) {
	// The unknown index would raise UnknownIndexError; input errors come first.
	EXPECT_THROW(hi.compute(BandMatcher::makeInputs({"a", "a"}, {665, 842}), named({"NOPE"})),
		InvalidInputError);
	std::vector<BandInput> none;
	EXPECT_THROW(hi.compute(none, named({"NDVI"})), InvalidInputError);
}

TEST_F(IndicesTest, Normalization) {
	IndexRequest req = named({"NDVI", "DVI"});
	req.normalize = true;
	BatchResult r = hi.compute(s2(), req);
	ASSERT_EQ(2u, r.expressions.size());
	EXPECT_TRUE(r.expressions[0].normalized);
	EXPECT_EQ("(((B8 - B4) / (B8 + B4 + 1e-6)) - (-1)) / (1 - (-1))", r.expressions[0].expression);
	EXPECT_FALSE(r.expressions[1].normalized);
	EXPECT_EQ("B8 - B4", r.expressions[1].expression);
	ASSERT_EQ(1u, r.warnings.size());
	EXPECT_EQ("index DVI has no defined range; normalization skipped", r.warnings[0]);
}

TEST_F(IndicesTest, OrderDoesNotDependOnThreads) {
	IndexRequest req;
	req.indices.push_back("all");
	omp_set_num_threads(1);
	BatchResult serial = hi.compute(s2(), req);
	omp_set_num_threads(4);
	BatchResult parallel = hi.compute(s2(), req);
	ASSERT_EQ(serial.expressions.size(), parallel.expressions.size());
	for(size_t i = 0; i < serial.expressions.size(); ++i) {
		EXPECT_EQ(serial.expressions[i].indexName, parallel.expressions[i].indexName);
		EXPECT_EQ(serial.expressions[i].expression, parallel.expressions[i].expression);
	}
	EXPECT_EQ(serial.warnings, parallel.warnings);
	EXPECT_EQ(IndexCatalog::instance().size(), serial.expressions.size() + serial.warnings.size());
}

TEST_F(IndicesTest, ParallelLogLinesStayWhole) {
	IndexRequest req;
	req.indices.push_back("all");
	std::stringstream log;
	std::streambuf *saved = std::cerr.rdbuf(log.rdbuf());
	hi_loglevel(HI_LOG_TRACE);
	omp_set_num_threads(4);
	BatchResult r = hi.compute(s2(), req);
	hi_loglevel(HI_LOG_NONE);
	std::cerr.rdbuf(saved);

	ASSERT_FALSE(r.expressions.empty());
	const std::string prefixes[] = {"TRACE:   ", "DEBUG:   ", "WARNING: "};
	std::string line;
	int lines = 0;
	while(std::getline(log, line)) {
		int found = 0;
		bool leading = false;
		for(const std::string &p : prefixes) {
			size_t pos = 0;
			while((pos = line.find(p, pos)) != std::string::npos) {
				if(pos == 0)
					leading = true;
				++found;
				pos += p.size();
			}
		}
		EXPECT_TRUE(leading) << line;
		EXPECT_EQ(1, found) << line;
		++lines;
	}
	EXPECT_GT(lines, (int) r.expressions.size());
}

TEST_F(IndicesTest, RunPassesExpressionsToCalculator) {
	RecordingCalculator calc;
	IndexRequest req = named({"NDVI", "EVI", "NDWI"});
	req.outputPrefix = "s2";
	BatchResult r = hi.run(BandMatcher::makeInputs({"B4", "B8"}, {665, 842}), req, calc);
	ASSERT_EQ(1u, r.expressions.size());
	ASSERT_EQ(1u, calc.calls.size());
	EXPECT_EQ("s2_NDVI", calc.calls[0].first);
	EXPECT_EQ(r.expressions[0].expression, calc.calls[0].second);
	EXPECT_EQ(3u, r.selected);
	EXPECT_EQ(2u, r.skipped());
}

TEST_F(IndicesTest, CalculatorFailureSkipsOnlyThatIndex) {
	FirstCallFails calc;
	BatchResult r = hi.run(BandMatcher::makeInputs({"B4", "B8"}, {665, 842}),
		named({"NDVI", "SR", "DVI"}), calc);
	ASSERT_EQ(3u, calc.calls.size());
	EXPECT_EQ("NDVI", calc.calls[0].first);
	EXPECT_EQ("DVI", calc.calls[2].first);
	ASSERT_EQ(2u, r.expressions.size());
	EXPECT_EQ("SR", r.expressions[0].indexName);
	EXPECT_EQ("DVI", r.expressions[1].indexName);
	ASSERT_EQ(1u, r.warnings.size());
	EXPECT_EQ("index NDVI failed: engine failed for NDVI", r.warnings[0]);
	EXPECT_EQ(1u, r.skipped());
}

// ============================================================================
// Configuration
// ============================================================================

TEST_F(IndicesTest, ConfigCheck) {
	IndicesConfig config;
	EXPECT_THROW(config.check(), InvalidInputError);
	config.bandNames = {"B4", "B8"};
	config.wavelengths = {665};
	EXPECT_THROW(config.check(), InvalidInputError);
	config.wavelengths.push_back(842);
	config.indices.push_back("NDVI");
	EXPECT_THROW(config.check(), std::invalid_argument);
	config.printOnly = true;
	EXPECT_NO_THROW(config.check());
	config.printOnly = false;
	config.bandFiles = {"b4.tif", "b8.tif"};
	EXPECT_NO_THROW(config.check());
	config.indices.clear();
	EXPECT_THROW(config.check(), std::invalid_argument);
}

TEST_F(IndicesTest, ConfigRequest) {
	IndicesConfig config;
	config.bandNames = {"B4", "B8"};
	config.wavelengths = {665, 842};
	config.indices = {"NDVI"};
	config.normalize = true;
	config.outputPrefix = "x";
	IndexRequest req = config.request();
	EXPECT_EQ(config.indices, req.indices);
	EXPECT_TRUE(req.normalize);
	EXPECT_EQ("x", req.outputPrefix);
	std::vector<BandInput> in = config.inputs();
	ASSERT_EQ(2u, in.size());
	EXPECT_EQ("B8", in[1].name);
}
