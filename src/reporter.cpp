#include <string>
#include <vector>
#include <ostream>

#include <boost/algorithm/string.hpp>

#include "hyperidx.h"
#include "catalog.hpp"
#include "reporter.hpp"

using namespace hyperidx::catalog;

ThemeListing::ThemeListing(Theme theme) :
	theme(theme) {
}

IndexDetail::IndexDetail(const IndexDefinition &def) :
	name(def.name),
	description(def.description),
	theme(def.theme),
	formula(def.formula),
	citation(def.citation),
	roles(def.roles),
	hasRange(def.hasRange),
	rangeMin(def.rangeMin),
	rangeMax(def.rangeMax) {
}

CatalogReporter::CatalogReporter() :
	m_catalog(IndexCatalog::instance()) {
}

CatalogReporter::CatalogReporter(const IndexCatalog &catalog) :
	m_catalog(catalog) {
}

std::vector<ThemeListing> CatalogReporter::listing(const std::string &themeFilter) const {
	std::string filter = boost::algorithm::trim_copy(themeFilter);
	std::vector<Theme> selected;
	if(filter.empty() || boost::algorithm::iequals(filter, "all")) {
		selected = themes();
	} else {
		selected.push_back(parseTheme(filter));
	}
	std::vector<ThemeListing> result;
	for(Theme theme : selected) {
		ThemeListing lst(theme);
		for(const IndexDefinition *def : m_catalog.listByTheme(theme))
			lst.indices.push_back(std::make_pair(def->name, def->description));
		if(!lst.indices.empty())
			result.push_back(lst);
	}
	return result;
}

IndexDetail CatalogReporter::detail(const std::string &name) const {
	return IndexDetail(m_catalog.lookup(name));
}

void CatalogReporter::printListing(std::ostream &out, const std::vector<ThemeListing> &listing, bool detailed) {
	size_t total = 0;
	for(const ThemeListing &lst : listing) {
		total += lst.indices.size();
		out << boost::algorithm::to_upper_copy(themeName(lst.theme)) << " (" << lst.indices.size() << ")\n";
		for(const auto &item : lst.indices) {
			out << "  " << item.first;
			if(detailed)
				out << ": " << item.second;
			out << "\n";
		}
		out << "\n";
	}
	out << "Total indices available: " << total << "\n";
}

void CatalogReporter::printDetail(std::ostream &out, const IndexDetail &detail) {
	out << detail.name << ": " << detail.description << "\n"
		<< "  Theme:    " << themeName(detail.theme) << "\n"
		<< "  Formula:  " << detail.formula << "\n";
	out << "  Roles:    ";
	for(size_t i = 0; i < detail.roles.size(); ++i) {
		if(i > 0)
			out << ", ";
		out << detail.roles[i].print();
	}
	out << "\n";
	if(detail.hasRange) {
		out << "  Range:    [" << detail.rangeMin << ", " << detail.rangeMax << "]\n";
	} else {
		out << "  Range:    none\n";
	}
	out << "  Citation: " << detail.citation << "\n";
}
