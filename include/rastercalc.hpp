#ifndef __RASTERCALC_HPP__
#define __RASTERCALC_HPP__

#include <string>
#include <vector>
#include <map>

#include "hyperidx.h"

namespace hyperidx {

    namespace raster {

        /**
         * Receives the expression of each computed index and produces the
         * corresponding output.
         */
        class DLL_EXPORT RasterCalculator {
        public:

            // Returns the band identifiers referenced by an expression, in order of
            // first appearance. Numeric literals and function names are skipped.
            static std::vector<std::string> referencedBands(const std::string &expression);

            virtual void calculate(const std::string &outputName, const std::string &expression) = 0;

            virtual ~RasterCalculator();
        };

        // A band of a raster file standing in for an identifier.
        class DLL_EXPORT BandSource {
        public:
            std::string filename;
            int band;

            BandSource();
            BandSource(const std::string &filename, int band);
        };

        /**
         * Evaluates expressions with GDAL. Each expression becomes a derived
         * band in a VRT which is then written to outputDir/outputName.tif
         * as a Float32 GeoTIFF.
         */
        class DLL_EXPORT GDALRasterCalculator : public RasterCalculator {
        private:
            std::string m_outputDir;
            std::map<std::string, BandSource> m_sources;

            // Build the VRT description for the expression.
            std::string vrtXML(const std::string &expression) const;

        public:
            GDALRasterCalculator(const std::string &outputDir);

            // Bind an identifier to a band of a raster file (1-based).
            void addSource(const std::string &bandName, const std::string &filename, int band = 1);

            const std::map<std::string, BandSource>& sources() const;

            // Returns the path the output of the named index is written to.
            std::string outputFilename(const std::string &outputName) const;

            void calculate(const std::string &outputName, const std::string &expression);
        };

    } // raster

} // hyperidx

#endif
