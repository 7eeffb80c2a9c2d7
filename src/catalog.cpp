#include <string>
#include <vector>
#include <map>
#include <set>
#include <cmath>
#include <sstream>
#include <algorithm>

#include <boost/algorithm/string.hpp>

#include "hyperidx.h"
#include "catalog.hpp"

using namespace hyperidx::catalog;

namespace {

	const char* THEME_NAMES[] = {
		"vegetation", "pigments", "metabolism", "biochemical", "water",
		"soil", "urban", "stress", "materials"
	};

	std::string key(const std::string &name) {
		return boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(name));
	}

} // anon

std::string hyperidx::catalog::themeName(Theme theme) {
	int i = (int) theme;
	if(i < 0 || i >= THEME_COUNT)
		hi_unknowntheme("Unknown theme: " << i);
	return THEME_NAMES[i];
}

Theme hyperidx::catalog::parseTheme(const std::string &name) {
	std::string n = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
	for(int i = 0; i < THEME_COUNT; ++i) {
		if(n == THEME_NAMES[i])
			return (Theme) i;
	}
	hi_unknowntheme("Unknown theme: \"" << name << "\". Expected one of "
		<< boost::algorithm::join(std::vector<std::string>(THEME_NAMES, THEME_NAMES + THEME_COUNT), ", ")
		<< " or all.");
}

bool hyperidx::catalog::isTheme(const std::string &name) {
	std::string n = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
	for(int i = 0; i < THEME_COUNT; ++i) {
		if(n == THEME_NAMES[i])
			return true;
	}
	return false;
}

std::vector<Theme> hyperidx::catalog::themes() {
	std::vector<Theme> t;
	for(int i = 0; i < THEME_COUNT; ++i)
		t.push_back((Theme) i);
	return t;
}

RoleSpec::RoleSpec(const std::string &roleId, double center, double tolerance) :
	roleId(roleId), center(center), tolerance(tolerance) {
}

RoleSpec RoleSpec::fromRange(const std::string &roleId, double minWl, double maxWl) {
	if(maxWl < minWl)
		hi_argerr("Invalid wavelength window for " << roleId << ": " << minWl << " > " << maxWl);
	return RoleSpec(roleId, (minWl + maxWl) / 2.0, (maxWl - minWl) / 2.0);
}

bool RoleSpec::accepts(double wavelength) const {
	return std::abs(wavelength - center) <= tolerance;
}

std::string RoleSpec::print() const {
	std::stringstream ss;
	ss << roleId << "@" << center << "+/-" << tolerance << "nm";
	return ss.str();
}

IndexDefinition::IndexDefinition(const std::string &name, const std::string &description, Theme theme,
	const std::vector<RoleSpec> &roles, const std::string &formula, const std::string &citation) :
	name(name), description(description), theme(theme),
	roles(roles), formula(formula),
	hasRange(false), rangeMin(0), rangeMax(0),
	citation(citation) {
}

IndexDefinition::IndexDefinition(const std::string &name, const std::string &description, Theme theme,
	const std::vector<RoleSpec> &roles, const std::string &formula, const std::string &citation,
	double rangeMin, double rangeMax) :
	name(name), description(description), theme(theme),
	roles(roles), formula(formula),
	hasRange(true), rangeMin(rangeMin), rangeMax(rangeMax),
	citation(citation) {
}

const RoleSpec* IndexDefinition::role(const std::string &roleId) const {
	for(const RoleSpec &r : roles) {
		if(r.roleId == roleId)
			return &r;
	}
	return nullptr;
}

std::vector<std::string> IndexDefinition::placeholders() const {
	std::vector<std::string> ids;
	size_t pos = 0;
	while((pos = formula.find('{', pos)) != std::string::npos) {
		size_t end = formula.find('}', pos);
		if(end == std::string::npos)
			hi_runerr("Unterminated placeholder in formula of " << name << ": " << formula);
		std::string id = formula.substr(pos + 1, end - pos - 1);
		if(std::find(ids.begin(), ids.end(), id) == ids.end())
			ids.push_back(id);
		pos = end + 1;
	}
	return ids;
}

void IndexDefinition::check() const {
	if(name.empty())
		hi_runerr("Index definition without a name.");
	if(roles.empty())
		hi_runerr("Index " << name << " declares no roles.");
	std::set<std::string> ids;
	for(const RoleSpec &r : roles) {
		if(r.roleId.empty())
			hi_runerr("Index " << name << " has a role without an id.");
		if(!(r.tolerance > 0))
			hi_runerr("Index " << name << ": role " << r.roleId << " has a non-positive tolerance.");
		if(!ids.insert(r.roleId).second)
			hi_runerr("Index " << name << ": role " << r.roleId << " is declared twice.");
	}
	std::vector<std::string> used = placeholders();
	for(const std::string &id : used) {
		if(ids.find(id) == ids.end())
			hi_runerr("Index " << name << ": formula references undeclared role " << id << ".");
	}
	if(used.size() != ids.size())
		hi_runerr("Index " << name << ": some declared roles are not used by the formula.");
	if(hasRange && !(rangeMin < rangeMax))
		hi_runerr("Index " << name << ": range minimum must be less than the maximum.");
}

IndexCatalog::IndexCatalog() :
	IndexCatalog(catalogTable()) {
}

IndexCatalog::IndexCatalog(const std::vector<IndexDefinition> &defs) :
	m_defs(defs) {
	for(size_t i = 0; i < m_defs.size(); ++i) {
		m_defs[i].check();
		std::string k = key(m_defs[i].name);
		if(m_byName.find(k) != m_byName.end())
			hi_runerr("Duplicate index name: " << m_defs[i].name);
		m_byName[k] = i;
	}
	hi_trace("Catalog built with " << m_defs.size() << " indices.");
}

const IndexCatalog& IndexCatalog::instance() {
	static const IndexCatalog catalog;
	return catalog;
}

const IndexDefinition& IndexCatalog::lookup(const std::string &name) const {
	auto it = m_byName.find(key(name));
	if(it == m_byName.end())
		hi_unknownidx("Unknown index: \"" << name << "\".");
	return m_defs[it->second];
}

bool IndexCatalog::contains(const std::string &name) const {
	return m_byName.find(key(name)) != m_byName.end();
}

std::vector<const IndexDefinition*> IndexCatalog::listByTheme(Theme theme) const {
	std::vector<const IndexDefinition*> lst;
	for(const IndexDefinition &def : m_defs) {
		if(def.theme == theme)
			lst.push_back(&def);
	}
	return lst;
}

std::vector<const IndexDefinition*> IndexCatalog::listByTheme(const std::string &theme) const {
	if(boost::algorithm::iequals(boost::algorithm::trim_copy(theme), "all"))
		return listAll();
	return listByTheme(parseTheme(theme));
}

std::vector<const IndexDefinition*> IndexCatalog::listAll() const {
	std::vector<const IndexDefinition*> lst;
	std::set<std::string> seen;
	for(const IndexDefinition &def : m_defs) {
		if(seen.insert(key(def.name)).second)
			lst.push_back(&def);
	}
	return lst;
}

size_t IndexCatalog::size() const {
	return m_defs.size();
}
