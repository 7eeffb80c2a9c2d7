#ifndef __INDICES_HPP__
#define __INDICES_HPP__

#include <string>
#include <vector>

#include "hyperidx.h"
#include "catalog.hpp"
#include "matcher.hpp"
#include "expression.hpp"
#include "rastercalc.hpp"

namespace hyperidx {

    namespace indices {

        // Indices to compute, by name or theme, and how to emit them.
        class DLL_EXPORT IndexRequest {
        public:
            // Index names. An entry may also be "all" or a theme name.
            std::vector<std::string> indices;
            // If not empty, selects the theme's indices and the names are ignored.
            std::string theme;
            bool normalize;
            std::string outputPrefix;

            IndexRequest() :
                normalize(false) {
            }
        };

        namespace config {

            class DLL_EXPORT IndicesConfig {
            public:
                std::vector<std::string> bandNames;
                std::vector<std::string> bandFiles;
                std::vector<double> wavelengths;
                std::vector<std::string> indices;
                std::string theme;
                std::string outputPrefix;
                std::string outputDir;
                bool normalize;
                bool printOnly;
                int threads;

                IndicesConfig() :
                    outputDir("."),
                    normalize(false),
                    printOnly(false),
                    threads(0) {
                }

                void check() const {
                    if (bandNames.empty())
                        hi_inputerr("At least one band must be given.");
                    if (bandNames.size() != wavelengths.size())
                        hi_inputerr("There are " << bandNames.size() << " bands but "
                            << wavelengths.size() << " wavelengths.");
                    if (!printOnly && bandFiles.size() != bandNames.size())
                        hi_argerr("Each band requires a raster file unless only printing expressions.");
                    if (indices.empty() && theme.empty())
                        hi_argerr("Either a list of indices or a theme must be given.");
                    if (!printOnly && outputDir.empty())
                        hi_argerr("An output directory is required.");
                    if (threads < 0)
                        hi_argerr("The number of threads must not be negative.");
                }

                // Zip the band names and wavelengths.
                std::vector<hyperidx::matching::BandInput> inputs() const {
                    return hyperidx::matching::BandMatcher::makeInputs(bandNames, wavelengths);
                }

                IndexRequest request() const {
                    IndexRequest req;
                    req.indices = indices;
                    req.theme = theme;
                    req.normalize = normalize;
                    req.outputPrefix = outputPrefix;
                    return req;
                }

            };

        } // config

        // The expressions built for a request, in request order, and the
        // warnings raised along the way.
        class DLL_EXPORT BatchResult {
        public:
            std::vector<hyperidx::expression::ComputedExpression> expressions;
            std::vector<std::string> warnings;
            // The number of indices the request selected.
            size_t selected;

            BatchResult() :
                selected(0) {
            }

            // Selected indices that produced no expression or output.
            size_t skipped() const {
                return selected - expressions.size();
            }
        };

        /**
         * Resolves a request against the catalog and builds the expression of
         * every index whose roles can all be matched. Indices are processed in
         * parallel; the result does not depend on the number of threads.
         */
        class DLL_EXPORT HyperIndices {
        private:
            const hyperidx::catalog::IndexCatalog &m_catalog;

        public:
            HyperIndices();

            HyperIndices(const hyperidx::catalog::IndexCatalog &catalog);

            // Returns the name of the output raster for an index.
            static std::string outputName(const std::string &prefix, const std::string &indexName);

            // Resolve the request to definitions, without duplicates. Throws
            // UnknownIndexError, UnknownThemeError, or InvalidInputError if nothing
            // is selected.
            std::vector<const hyperidx::catalog::IndexDefinition*> select(const IndexRequest &request) const;

            // Validate the inputs, then match, build and normalize each selected index.
            BatchResult compute(const std::vector<hyperidx::matching::BandInput> &inputs,
                const IndexRequest &request) const;

            // Compute, then pass each expression to the calculator. An index the
            // calculator fails on is dropped from the result with a warning and
            // the remaining indices are still calculated.
            BatchResult run(const std::vector<hyperidx::matching::BandInput> &inputs,
                const IndexRequest &request, hyperidx::raster::RasterCalculator &calculator) const;
        };

    } // indices

} // hyperidx

#endif
