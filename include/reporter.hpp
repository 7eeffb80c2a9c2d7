#ifndef __REPORTER_HPP__
#define __REPORTER_HPP__

#include <string>
#include <vector>
#include <utility>
#include <ostream>

#include "hyperidx.h"
#include "catalog.hpp"

namespace hyperidx {

    namespace catalog {

        // The indices of one theme as (name, description) pairs.
        class DLL_EXPORT ThemeListing {
        public:
            Theme theme;
            std::vector<std::pair<std::string, std::string> > indices;

            ThemeListing(Theme theme);
        };

        // Everything known about one index, for display.
        class DLL_EXPORT IndexDetail {
        public:
            std::string name;
            std::string description;
            Theme theme;
            std::string formula;
            std::string citation;
            std::vector<RoleSpec> roles;
            bool hasRange;
            double rangeMin;
            double rangeMax;

            IndexDetail(const IndexDefinition &def);
        };

        /**
         * Produces the listing and detail reports for a catalog.
         */
        class DLL_EXPORT CatalogReporter {
        private:
            const IndexCatalog &m_catalog;

        public:
            CatalogReporter();

            CatalogReporter(const IndexCatalog &catalog);

            /**
             * List the indices grouped by theme, in theme order. An empty filter or
             * "all" lists every theme; otherwise only the named one. Themes with
             * no indices are left out. Throws UnknownThemeError.
             */
            std::vector<ThemeListing> listing(const std::string &themeFilter = "") const;

            // Throws UnknownIndexError.
            IndexDetail detail(const std::string &name) const;

            // Write a listing followed by the number of indices in it. If detailed,
            // each name is followed by its description.
            static void printListing(std::ostream &out, const std::vector<ThemeListing> &listing, bool detailed);

            static void printDetail(std::ostream &out, const IndexDetail &detail);
        };

    } // catalog

} // hyperidx

#endif
