#ifndef __CATALOG_HPP__
#define __CATALOG_HPP__

#include <string>
#include <vector>
#include <map>

#include "hyperidx.h"

namespace hyperidx {

    namespace catalog {

        // Tolerance applied to a role that is declared by its center alone.
        const double DEFAULT_TOLERANCE_NM = 20.0;

        enum Theme {
            VEGETATION = 0,
            PIGMENTS,
            METABOLISM,
            BIOCHEMICAL,
            WATER,
            SOIL,
            URBAN,
            STRESS,
            MATERIALS
        };

        // Number of entries in Theme.
        const int THEME_COUNT = 9;

        // Returns the lower-case name of the theme.
        DLL_EXPORT std::string themeName(Theme theme);

        // Parses a theme name (case-insensitive). Throws UnknownThemeError.
        // "all" is not a theme and is rejected here.
        DLL_EXPORT Theme parseTheme(const std::string &name);

        // Returns true if the name is a theme (case-insensitive).
        DLL_EXPORT bool isTheme(const std::string &name);

        // Returns all themes in declaration order.
        DLL_EXPORT std::vector<Theme> themes();

        // A spectral requirement of an index: a semantic role (e.g. "red")
        // centered on a wavelength, satisfied by any band within the tolerance.
        class DLL_EXPORT RoleSpec {
        public:
            std::string roleId;
            double center;
            double tolerance;

            RoleSpec(const std::string &roleId, double center, double tolerance = DEFAULT_TOLERANCE_NM);

            // Build a role from a wavelength window [minWl, maxWl]. The center is the
            // middle of the window and the tolerance its half-width.
            static RoleSpec fromRange(const std::string &roleId, double minWl, double maxWl);

            // Return true if the wavelength is within tolerance of the center.
            bool accepts(double wavelength) const;

            // Returns a printable description, e.g. "red@655+/-35nm".
            std::string print() const;
        };

        // An immutable index definition. The formula is a template over
        // {roleId} placeholders; see expression.hpp for the grammar.
        class DLL_EXPORT IndexDefinition {
        public:
            std::string name;
            std::string description;
            Theme theme;
            std::vector<RoleSpec> roles;
            std::string formula;
            bool hasRange;
            double rangeMin;
            double rangeMax;
            std::string citation;

            IndexDefinition(const std::string &name, const std::string &description, Theme theme,
                const std::vector<RoleSpec> &roles, const std::string &formula,
                const std::string &citation);

            IndexDefinition(const std::string &name, const std::string &description, Theme theme,
                const std::vector<RoleSpec> &roles, const std::string &formula,
                const std::string &citation, double rangeMin, double rangeMax);

            // Returns the role with the given id, or nullptr.
            const RoleSpec* role(const std::string &roleId) const;

            // Returns the role ids referenced by {placeholders} in the formula, in order
            // of first appearance.
            std::vector<std::string> placeholders() const;

            // Throws a runtime_error if an invariant of the definition is broken.
            void check() const;
        };

        // The read-only registry of index definitions. Built once from the
        // literal table in catalog_table.cpp.
        class DLL_EXPORT IndexCatalog {
        private:
            std::vector<IndexDefinition> m_defs;
            std::map<std::string, size_t> m_byName;

            IndexCatalog();

        public:

            // Returns the process-wide catalog.
            static const IndexCatalog& instance();

            // Build a catalog from an arbitrary table. Checks every definition.
            IndexCatalog(const std::vector<IndexDefinition> &defs);

            // Find a definition by name (case-insensitive). Throws UnknownIndexError.
            const IndexDefinition& lookup(const std::string &name) const;

            bool contains(const std::string &name) const;

            // Definitions of one theme, in table order.
            std::vector<const IndexDefinition*> listByTheme(Theme theme) const;

            // Definitions of the named theme; "all" gives every definition.
            // Throws UnknownThemeError.
            std::vector<const IndexDefinition*> listByTheme(const std::string &theme) const;

            // Every definition, in table order.
            std::vector<const IndexDefinition*> listAll() const;

            size_t size() const;
        };

        // The literal table of definitions. Defined in catalog_table.cpp.
        DLL_EXPORT std::vector<IndexDefinition> catalogTable();

    } // catalog

} // hyperidx

#endif
