#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>

#include "omp.h"

#include "hyperidx.h"
#include "util.hpp"
#include "catalog.hpp"
#include "reporter.hpp"
#include "indices.hpp"
#include "rastercalc.hpp"

using namespace hyperidx::util;
using namespace hyperidx::catalog;
using namespace hyperidx::indices;
using namespace hyperidx::indices::config;
using namespace hyperidx::raster;

void usage() {
	std::cerr << "This program computes spectral indices from a set of raster bands, each\n"
		<< "labelled with its wavelength. For each index, the band nearest to the\n"
		<< "wavelength of each required role is used; indices that cannot be fully\n"
		<< "matched are skipped with a warning.\n\n"
		<< "Usage: hyperidx -l [-li]\n"
		<< "       hyperidx -d <index>\n"
		<< "       hyperidx <options>\n"
		<< " -l              List the indices by theme.\n"
		<< " -li             List the indices by theme, with descriptions.\n"
		<< " -d <index>      Show the definition of an index.\n"
		<< " -b <name=file>  A band and the raster file containing it. Repeat for each\n"
		<< "                 band. With -p, the file may be omitted.\n"
		<< " -w <nm,nm,...>  Wavelengths of the bands, in the order the bands are given.\n"
		<< " -x <idx,idx>    Indices to compute. An item may also be a theme or \"all\".\n"
		<< " -t <theme>      Compute every index of a theme: vegetation, pigments,\n"
		<< "                 metabolism, biochemical, water, soil, urban, stress,\n"
		<< "                 materials or all. Overrides -x.\n"
		<< " -o <prefix>     Prefix for output names (prefix_NAME).\n"
		<< " -od <dir>       Output directory. Default current directory.\n"
		<< " -n              Normalize indices with a known range to [0, 1].\n"
		<< " -p              Print the expressions instead of computing rasters.\n"
		<< " -threads <n>    The number of threads to use.\n"
		<< " -v              Verbose output.\n"
		<< " -h              Print this message.\n";
}

int main(int argc, char **argv) {

	try {

		IndicesConfig config;
		bool list = false;
		bool detailed = false;
		std::string detail;

		hi_loglevel(HI_LOG_WARN);

		for(int i = 1; i < argc; ++i) {
			std::string arg(argv[i]);
			if(arg == "-h") {
				usage();
				return 0;
			} else if(arg == "-v") {
				hi_loglevel(HI_LOG_DEBUG);
			} else if(arg == "-l") {
				list = true;
			} else if(arg == "-li") {
				list = true;
				detailed = true;
			} else if(arg == "-n") {
				config.normalize = true;
			} else if(arg == "-p") {
				config.printOnly = true;
			} else if(i + 1 >= argc) {
				hi_argerr("Missing value for " << arg << ".");
			} else if(arg == "-d") {
				detail.assign(argv[++i]);
			} else if(arg == "-b") {
				std::string band(argv[++i]);
				if(band.find('=') == std::string::npos) {
					config.bandNames.push_back(band);
				} else {
					std::string name, file;
					Util::splitAssignment(band, name, file);
					config.bandNames.push_back(name);
					config.bandFiles.push_back(file);
				}
			} else if(arg == "-w") {
				Util::parseDoubles(argv[++i], config.wavelengths);
			} else if(arg == "-x") {
				Util::splitString(argv[++i], config.indices);
			} else if(arg == "-t") {
				config.theme.assign(argv[++i]);
			} else if(arg == "-o") {
				config.outputPrefix.assign(argv[++i]);
			} else if(arg == "-od") {
				config.outputDir.assign(argv[++i]);
			} else if(arg == "-threads") {
				config.threads = atoi(argv[++i]);
			} else {
				hi_argerr("Unknown argument: " << arg);
			}
		}

		CatalogReporter reporter;
		if(list) {
			CatalogReporter::printListing(std::cout, reporter.listing(config.theme), detailed);
			return 0;
		}
		if(!detail.empty()) {
			CatalogReporter::printDetail(std::cout, reporter.detail(detail));
			return 0;
		}

		config.check();

		omp_set_dynamic(0);
		if(config.threads > 0)
			omp_set_num_threads(config.threads);

		HyperIndices hi;
		if(config.printOnly) {
			BatchResult result = hi.compute(config.inputs(), config.request());
			for(const auto &expr : result.expressions)
				std::cout << HyperIndices::outputName(config.outputPrefix, expr.indexName)
					<< " = " << expr.expression << std::endl;
		} else {
			GDALRasterCalculator calc(config.outputDir);
			for(size_t i = 0; i < config.bandNames.size(); ++i)
				calc.addSource(config.bandNames[i], config.bandFiles[i]);
			BatchResult result = hi.run(config.inputs(), config.request(), calc);
			std::cout << result.expressions.size() << " indices calculated, "
				<< result.skipped() << " skipped." << std::endl;
		}

	} catch(const std::exception &e) {
		std::cerr << e.what() << std::endl;
		usage();
		return 1;
	}

	return 0;
}
