#include <string>
#include <vector>
#include <map>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <iomanip>

#include <boost/filesystem.hpp>

#include <gdal_priv.h>
#include <cpl_minixml.h>
#include <cpl_conv.h>

#include "hyperidx.h"
#include "matcher.hpp"
#include "util.hpp"
#include "rastercalc.hpp"

using namespace hyperidx::raster;
using namespace hyperidx::util;

namespace {

	bool isNameChar(char c) {
		return std::isalnum((unsigned char) c) || c == '_';
	}

	// Holds an opened source dataset and closes it.
	class SourceDataset {
	public:
		GDALDataset *ds;

		SourceDataset(const std::string &filename) {
			ds = (GDALDataset *) GDALOpen(filename.c_str(), GA_ReadOnly);
			if(ds == NULL)
				hi_runerr("Failed to open raster: " << filename);
		}

		~SourceDataset() {
			GDALClose(ds);
		}
	};

} // anon

RasterCalculator::~RasterCalculator() {}

std::vector<std::string> RasterCalculator::referencedBands(const std::string &expression) {
	std::vector<std::string> names;
	size_t i = 0;
	while(i < expression.size()) {
		char c = expression[i];
		if(std::isdigit((unsigned char) c) || c == '.') {
			// Skip a numeric literal, exponent included.
			while(i < expression.size() && (std::isdigit((unsigned char) expression[i]) || expression[i] == '.'))
				++i;
			if(i < expression.size() && (expression[i] == 'e' || expression[i] == 'E')) {
				++i;
				if(i < expression.size() && (expression[i] == '+' || expression[i] == '-'))
					++i;
				while(i < expression.size() && std::isdigit((unsigned char) expression[i]))
					++i;
			}
		} else if(std::isalpha((unsigned char) c) || c == '_') {
			size_t start = i;
			while(i < expression.size() && isNameChar(expression[i]))
				++i;
			std::string name = expression.substr(start, i - start);
			size_t next = i;
			while(next < expression.size() && std::isspace((unsigned char) expression[next]))
				++next;
			bool function = next < expression.size() && expression[next] == '(';
			if(!function && std::find(names.begin(), names.end(), name) == names.end())
				names.push_back(name);
		} else {
			++i;
		}
	}
	return names;
}

BandSource::BandSource() :
	band(1) {
}

BandSource::BandSource(const std::string &filename, int band) :
	filename(filename), band(band) {
}

GDALRasterCalculator::GDALRasterCalculator(const std::string &outputDir) :
	m_outputDir(outputDir) {
	if(m_outputDir.empty())
		m_outputDir = ".";
	GDALAllRegister();
}

void GDALRasterCalculator::addSource(const std::string &bandName, const std::string &filename, int band) {
	if(!hyperidx::matching::BandMatcher::isValidBandName(bandName))
		hi_argerr("Invalid band name: \"" << bandName << "\".");
	if(filename.empty())
		hi_argerr("A filename is required for band " << bandName << ".");
	if(band < 1)
		hi_argerr("Band numbers start at 1; got " << band << " for " << bandName << ".");
	m_sources[bandName] = BandSource(filename, band);
}

const std::map<std::string, BandSource>& GDALRasterCalculator::sources() const {
	return m_sources;
}

std::string GDALRasterCalculator::outputFilename(const std::string &outputName) const {
	boost::filesystem::path p(m_outputDir);
	p /= outputName + ".tif";
	return p.string();
}

std::string GDALRasterCalculator::vrtXML(const std::string &expression) const {
	std::vector<std::string> names = referencedBands(expression);
	if(names.empty())
		hi_runerr("The expression references no bands: " << expression);

	int cols = -1, rows = -1;
	double trans[6] = {0, 1, 0, 0, 0, 1};
	bool hasTrans = false;
	std::string projection;

	CPLXMLNode *root = CPLCreateXMLNode(nullptr, CXT_Element, "VRTDataset");
	CPLXMLNode *band = CPLCreateXMLNode(root, CXT_Element, "VRTRasterBand");
	CPLAddXMLAttributeAndValue(band, "dataType", "Float32");
	CPLAddXMLAttributeAndValue(band, "band", "1");
	CPLAddXMLAttributeAndValue(band, "subClass", "VRTDerivedRasterBand");

	try {
		for(const std::string &name : names) {
			auto it = m_sources.find(name);
			if(it == m_sources.end())
				hi_runerr("No raster source for band " << name << ".");
			const BandSource &src = it->second;

			SourceDataset sds(src.filename);
			int c = sds.ds->GetRasterXSize();
			int r = sds.ds->GetRasterYSize();
			if(src.band > sds.ds->GetRasterCount())
				hi_runerr("Band " << src.band << " does not exist in " << src.filename << ".");
			if(cols == -1) {
				cols = c;
				rows = r;
				hasTrans = sds.ds->GetGeoTransform(trans) == CE_None;
				const char *proj = sds.ds->GetProjectionRef();
				if(proj != nullptr)
					projection.assign(proj);
			} else if(c != cols || r != rows) {
				hi_runerr("Raster " << src.filename << " is " << c << "x" << r
					<< " but the other sources are " << cols << "x" << rows << ".");
			}

			std::stringstream bandNum;
			bandNum << src.band;
			CPLXMLNode *source = CPLCreateXMLNode(band, CXT_Element, "SimpleSource");
			CPLAddXMLAttributeAndValue(source, "name", name.c_str());
			CPLXMLNode *filename = CPLCreateXMLNode(source, CXT_Element, "SourceFilename");
			CPLAddXMLAttributeAndValue(filename, "relativeToVRT", "0");
			CPLCreateXMLNode(filename, CXT_Text, src.filename.c_str());
			CPLXMLNode *sourceBand = CPLCreateXMLNode(source, CXT_Element, "SourceBand");
			CPLCreateXMLNode(sourceBand, CXT_Text, bandNum.str().c_str());
		}
	} catch(...) {
		CPLDestroyXMLNode(root);
		throw;
	}

	CPLXMLNode *pixelFunctionType = CPLCreateXMLNode(band, CXT_Element, "PixelFunctionType");
	CPLCreateXMLNode(pixelFunctionType, CXT_Text, "expression");
	CPLXMLNode *arguments = CPLCreateXMLNode(band, CXT_Element, "PixelFunctionArguments");
	CPLAddXMLAttributeAndValue(arguments, "dialect", "muparser");
	CPLAddXMLAttributeAndValue(arguments, "expression", expression.c_str());

	std::stringstream xsize, ysize;
	xsize << cols;
	ysize << rows;
	CPLAddXMLAttributeAndValue(root, "rasterXSize", xsize.str().c_str());
	CPLAddXMLAttributeAndValue(root, "rasterYSize", ysize.str().c_str());
	if(!projection.empty())
		CPLCreateXMLElementAndValue(root, "SRS", projection.c_str());
	if(hasTrans) {
		std::stringstream gt;
		gt << std::setprecision(16) << trans[0];
		for(int i = 1; i < 6; ++i)
			gt << ", " << trans[i];
		CPLCreateXMLElementAndValue(root, "GeoTransform", gt.str().c_str());
	}

	char *xml = CPLSerializeXMLTree(root);
	std::string out(xml);
	CPLFree(xml);
	CPLDestroyXMLNode(root);
	return out;
}

void GDALRasterCalculator::calculate(const std::string &outputName, const std::string &expression) {
	if(outputName.empty())
		hi_argerr("An output name is required.");

	std::string xml = vrtXML(expression);
	hi_trace("VRT for " << outputName << ":\n" << xml);

	if(!Util::mkdir(m_outputDir))
		hi_runerr("Failed to create output directory: " << m_outputDir);

	GDALDataset *vrt = (GDALDataset *) GDALOpen(xml.c_str(), GA_ReadOnly);
	if(vrt == NULL)
		hi_runerr("Failed to build a virtual raster for " << outputName << ": " << CPLGetLastErrorMsg());

	GDALDriver *drv = GetGDALDriverManager()->GetDriverByName("GTiff");
	if(drv == NULL) {
		GDALClose(vrt);
		hi_runerr("The GTiff driver is not available.");
	}

	std::string filename = outputFilename(outputName);
	hi_debug("Writing " << filename);
	GDALDataset *out = drv->CreateCopy(filename.c_str(), vrt, FALSE, NULL, NULL, NULL);
	GDALClose(vrt);
	if(out == NULL)
		hi_runerr("Failed to write " << filename << ": " << CPLGetLastErrorMsg());
	GDALClose(out);
}
