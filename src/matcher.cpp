#include <string>
#include <vector>
#include <set>
#include <cmath>
#include <cctype>

#include "hyperidx.h"
#include "catalog.hpp"
#include "matcher.hpp"

using namespace hyperidx::catalog;
using namespace hyperidx::matching;

BandInput::BandInput(const std::string &name, double wavelength) :
	name(name), wavelength(wavelength) {
}

RoleBinding::RoleBinding(const RoleSpec &role) :
	role(role), matched(false), wavelength(0), distance(0) {
}

RoleBinding::RoleBinding(const RoleSpec &role, const BandInput &band, double distance) :
	role(role), matched(true), bandName(band.name), wavelength(band.wavelength), distance(distance) {
}

std::string hyperidx::matching::statusName(MatchStatus status) {
	switch(status) {
	case FULLY_MATCHED: return "FULLY_MATCHED";
	case PARTIALLY_MATCHED: return "PARTIALLY_MATCHED";
	case UNMATCHED: return "UNMATCHED";
	default:
		hi_argerr("Unknown match status: " << (int) status);
	}
}

MatchResult::MatchResult(const std::string &indexName, const std::vector<RoleBinding> &bindings) :
	m_indexName(indexName),
	m_bindings(bindings) {
	size_t matched = 0;
	for(const RoleBinding &b : m_bindings) {
		if(b.matched)
			++matched;
	}
	if(!m_bindings.empty() && matched == m_bindings.size()) {
		m_status = FULLY_MATCHED;
	} else if(matched > 0) {
		m_status = PARTIALLY_MATCHED;
	} else {
		m_status = UNMATCHED;
	}
}

const std::string& MatchResult::indexName() const {
	return m_indexName;
}

MatchStatus MatchResult::status() const {
	return m_status;
}

const std::vector<RoleBinding>& MatchResult::bindings() const {
	return m_bindings;
}

const RoleBinding* MatchResult::binding(const std::string &roleId) const {
	for(const RoleBinding &b : m_bindings) {
		if(b.role.roleId == roleId)
			return &b;
	}
	return nullptr;
}

std::string MatchResult::band(const std::string &roleId) const {
	const RoleBinding *b = binding(roleId);
	if(b == nullptr || !b->matched)
		return "";
	return b->bandName;
}

std::vector<RoleSpec> MatchResult::missingRoles() const {
	std::vector<RoleSpec> missing;
	for(const RoleBinding &b : m_bindings) {
		if(!b.matched)
			missing.push_back(b.role);
	}
	return missing;
}

bool BandMatcher::isValidBandName(const std::string &name) {
	if(name.empty())
		return false;
	unsigned char c = (unsigned char) name[0];
	if(!(std::isalpha(c) || c == '_'))
		return false;
	for(size_t i = 1; i < name.size(); ++i) {
		c = (unsigned char) name[i];
		if(!(std::isalnum(c) || c == '_'))
			return false;
	}
	return true;
}

void BandMatcher::validate(const std::vector<BandInput> &inputs) {
	if(inputs.empty())
		hi_inputerr("At least one input band is required.");
	std::set<std::string> names;
	for(const BandInput &b : inputs) {
		if(!isValidBandName(b.name))
			hi_inputerr("Invalid band name: \"" << b.name << "\". Names must start with a letter or "
				"underscore and contain only letters, digits and underscores.");
		if(!names.insert(b.name).second)
			hi_inputerr("Duplicate band name: " << b.name);
		if(!std::isfinite(b.wavelength) || b.wavelength <= 0)
			hi_inputerr("Invalid wavelength for band " << b.name << ": " << b.wavelength);
	}
}

std::vector<BandInput> BandMatcher::makeInputs(const std::vector<std::string> &names,
	const std::vector<double> &wavelengths) {
	if(names.size() != wavelengths.size())
		hi_inputerr("Number of input bands (" << names.size() << ") must match number of wavelengths ("
			<< wavelengths.size() << ").");
	std::vector<BandInput> inputs;
	for(size_t i = 0; i < names.size(); ++i)
		inputs.push_back(BandInput(names[i], wavelengths[i]));
	return inputs;
}

MatchResult BandMatcher::match(const IndexDefinition &index, const std::vector<BandInput> &inputs) const {
	validate(inputs);

	std::vector<bool> used(inputs.size(), false);
	std::vector<RoleBinding> bindings;

	for(const RoleSpec &role : index.roles) {
		int best = -1;
		double bestDist = 0;
		for(size_t i = 0; i < inputs.size(); ++i) {
			if(used[i])
				continue;
			double dist = std::abs(inputs[i].wavelength - role.center);
			// Strict comparison: on a tie the earlier input is kept.
			if(best == -1 || dist < bestDist) {
				best = (int) i;
				bestDist = dist;
			}
		}
		if(best != -1 && bestDist <= role.tolerance) {
			used[best] = true;
			bindings.push_back(RoleBinding(role, inputs[best], bestDist));
			hi_trace(index.name << ": " << role.print() << " -> " << inputs[best].name
				<< " (" << inputs[best].wavelength << "nm)");
		} else {
			bindings.push_back(RoleBinding(role));
			hi_trace(index.name << ": " << role.print() << " unmatched");
		}
	}

	return MatchResult(index.name, bindings);
}
