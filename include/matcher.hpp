#ifndef __MATCHER_HPP__
#define __MATCHER_HPP__

#include <string>
#include <vector>

#include "hyperidx.h"
#include "catalog.hpp"

namespace hyperidx {

    namespace matching {

        // A user-supplied band: an identifier and the wavelength (nm) it represents.
        class DLL_EXPORT BandInput {
        public:
            std::string name;
            double wavelength;

            BandInput(const std::string &name, double wavelength);
        };

        // The band chosen for one role of an index. If matched is false,
        // no input was within tolerance and the band fields are empty.
        class DLL_EXPORT RoleBinding {
        public:
            hyperidx::catalog::RoleSpec role;
            bool matched;
            std::string bandName;
            double wavelength;
            double distance;

            RoleBinding(const hyperidx::catalog::RoleSpec &role);
            RoleBinding(const hyperidx::catalog::RoleSpec &role, const BandInput &band, double distance);
        };

        enum MatchStatus {
            FULLY_MATCHED,
            PARTIALLY_MATCHED,
            UNMATCHED
        };

        DLL_EXPORT std::string statusName(MatchStatus status);

        // The role-to-band resolution for one index. Built by BandMatcher and
        // not modified afterwards.
        class DLL_EXPORT MatchResult {
        private:
            std::string m_indexName;
            std::vector<RoleBinding> m_bindings;
            MatchStatus m_status;

        public:
            MatchResult(const std::string &indexName, const std::vector<RoleBinding> &bindings);

            const std::string& indexName() const;

            MatchStatus status() const;

            // Bindings in the order the roles are declared.
            const std::vector<RoleBinding>& bindings() const;

            // Returns the binding for the role, or nullptr if the index has no such role.
            const RoleBinding* binding(const std::string &roleId) const;

            // Returns the band bound to the role, or an empty string.
            std::string band(const std::string &roleId) const;

            // The roles left without a band.
            std::vector<hyperidx::catalog::RoleSpec> missingRoles() const;
        };

        // Resolves the roles of an index to concrete input bands by nearest
        // wavelength. Roles are served in declaration order; each band is
        // used at most once per index; equal distances go to the earliest input.
        class DLL_EXPORT BandMatcher {
        public:

            // Throws InvalidInputError if the list is empty, contains duplicate
            // names, a name that cannot be used in an expression, or a wavelength
            // that is not a finite positive number.
            static void validate(const std::vector<BandInput> &inputs);

            // Zip parallel lists of names and wavelengths. Throws InvalidInputError
            // if the lengths differ.
            static std::vector<BandInput> makeInputs(const std::vector<std::string> &names,
                const std::vector<double> &wavelengths);

            // Returns true if the name is usable as an identifier in an expression.
            static bool isValidBandName(const std::string &name);

            MatchResult match(const hyperidx::catalog::IndexDefinition &index,
                const std::vector<BandInput> &inputs) const;
        };

    } // matching

} // hyperidx

#endif
