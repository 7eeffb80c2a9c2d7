#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "hyperidx.h"
#include "catalog.hpp"
#include "expression.hpp"

using namespace hyperidx;
using namespace hyperidx::catalog;

class CatalogTest : public ::testing::Test {
protected:
	const IndexCatalog &catalog = IndexCatalog::instance();

	std::vector<RoleSpec> redNir() {
		return {RoleSpec("red", 665), RoleSpec("nir", 850)};
	}
};

// ============================================================================
// Table contents
// ============================================================================

TEST_F(CatalogTest, HoldsEveryIndex) {
	EXPECT_EQ(86u, catalog.size());
	EXPECT_EQ(86u, catalog.listAll().size());
}

TEST_F(CatalogTest, ThemeCounts) {
	EXPECT_EQ(18u, catalog.listByTheme(VEGETATION).size());
	EXPECT_EQ(17u, catalog.listByTheme(PIGMENTS).size());
	EXPECT_EQ(13u, catalog.listByTheme(METABOLISM).size());
	EXPECT_EQ(5u, catalog.listByTheme(BIOCHEMICAL).size());
	EXPECT_EQ(4u, catalog.listByTheme(WATER).size());
	EXPECT_EQ(3u, catalog.listByTheme(SOIL).size());
	EXPECT_EQ(2u, catalog.listByTheme(URBAN).size());
	EXPECT_EQ(5u, catalog.listByTheme(STRESS).size());
	EXPECT_EQ(19u, catalog.listByTheme(MATERIALS).size());
}

TEST_F(CatalogTest, EveryTemplateParses) {
	for(const IndexDefinition *def : catalog.listAll()) {
		SCOPED_TRACE(def->name);
		expression::FormulaTemplate tpl(def->formula);
		std::vector<std::string> roles = tpl.roles();
		EXPECT_EQ(def->roles.size(), roles.size());
		for(const std::string &id : roles)
			EXPECT_NE(nullptr, def->role(id));
	}
}

TEST_F(CatalogTest, NdviDefinition) {
	const IndexDefinition &ndvi = catalog.lookup("NDVI");
	EXPECT_EQ("NDVI", ndvi.name);
	EXPECT_EQ(VEGETATION, ndvi.theme);
	ASSERT_EQ(2u, ndvi.roles.size());
	EXPECT_EQ("red", ndvi.roles[0].roleId);
	EXPECT_EQ("nir", ndvi.roles[1].roleId);
	EXPECT_DOUBLE_EQ(655, ndvi.roles[0].center);
	EXPECT_DOUBLE_EQ(35, ndvi.roles[0].tolerance);
	EXPECT_TRUE(ndvi.hasRange);
	EXPECT_DOUBLE_EQ(-1, ndvi.rangeMin);
	EXPECT_DOUBLE_EQ(1, ndvi.rangeMax);
	EXPECT_FALSE(ndvi.citation.empty());
}

// ============================================================================
// Lookup
// ============================================================================

TEST_F(CatalogTest, LookupIgnoresCase) {
	EXPECT_EQ("CIrededge", catalog.lookup("cirededge").name);
	EXPECT_EQ("CIrededge", catalog.lookup("CIREDEDGE").name);
	EXPECT_EQ("NDVI", catalog.lookup(" ndvi ").name);
	EXPECT_TRUE(catalog.contains("evi"));
	EXPECT_FALSE(catalog.contains("NOPE"));
}

TEST_F(CatalogTest, LookupUnknownIndex) {
	EXPECT_THROW(catalog.lookup("NOPE"), UnknownIndexError);
	EXPECT_THROW(catalog.lookup(""), UnknownIndexError);
}

// ============================================================================
// Themes
// ============================================================================

TEST_F(CatalogTest, ThemeNames) {
	EXPECT_EQ("vegetation", themeName(VEGETATION));
	EXPECT_EQ("materials", themeName(MATERIALS));
	EXPECT_EQ(WATER, parseTheme("Water"));
	EXPECT_TRUE(isTheme("SOIL"));
	EXPECT_FALSE(isTheme("all"));
	EXPECT_EQ((size_t) THEME_COUNT, themes().size());
}

TEST_F(CatalogTest, UnknownTheme) {
	EXPECT_THROW(parseTheme("forest"), UnknownThemeError);
	EXPECT_THROW(parseTheme("all"), UnknownThemeError);
	EXPECT_THROW(catalog.listByTheme("forest"), UnknownThemeError);
}

TEST_F(CatalogTest, ListByThemeIsStable) {
	std::vector<const IndexDefinition*> first = catalog.listByTheme("vegetation");
	std::vector<const IndexDefinition*> second = catalog.listByTheme("VEGETATION");
	ASSERT_EQ(18u, first.size());
	EXPECT_EQ(first, second);
	std::set<std::string> names;
	for(const IndexDefinition *def : first) {
		EXPECT_EQ(VEGETATION, def->theme);
		EXPECT_TRUE(names.insert(def->name).second);
	}
	EXPECT_EQ("NDVI", first[0]->name);
}

TEST_F(CatalogTest, AllIsTheUnionOfThemes) {
	std::vector<const IndexDefinition*> all = catalog.listByTheme("all");
	EXPECT_EQ(catalog.listAll(), all);
	std::set<std::string> names;
	for(const IndexDefinition *def : all)
		EXPECT_TRUE(names.insert(def->name).second);
	size_t total = 0;
	for(Theme t : themes())
		total += catalog.listByTheme(t).size();
	EXPECT_EQ(total, all.size());
}

// ============================================================================
// Definition checks
// ============================================================================

TEST_F(CatalogTest, RoleFromRange) {
	RoleSpec r = RoleSpec::fromRange("red", 620, 690);
	EXPECT_DOUBLE_EQ(655, r.center);
	EXPECT_DOUBLE_EQ(35, r.tolerance);
	EXPECT_TRUE(r.accepts(690));
	EXPECT_FALSE(r.accepts(690.5));
	EXPECT_EQ("red@655+/-35nm", r.print());
	EXPECT_DOUBLE_EQ(DEFAULT_TOLERANCE_NM, RoleSpec("nir", 850).tolerance);
}

TEST_F(CatalogTest, RejectsDuplicateNames) {
	std::vector<IndexDefinition> defs;
	defs.push_back(IndexDefinition("X", "", VEGETATION, redNir(), "{nir} - {red}", ""));
	defs.push_back(IndexDefinition("x", "", SOIL, redNir(), "{nir} + {red}", ""));
	EXPECT_THROW(IndexCatalog c(defs), std::runtime_error);
}

TEST_F(CatalogTest, RejectsUndeclaredRole) {
	IndexDefinition def("X", "", VEGETATION, redNir(), "{nir} - {green}", "");
	EXPECT_THROW(def.check(), std::runtime_error);
}

TEST_F(CatalogTest, RejectsUnusedRole) {
	IndexDefinition def("X", "", VEGETATION, redNir(), "{nir} * 2", "");
	EXPECT_THROW(def.check(), std::runtime_error);
}

TEST_F(CatalogTest, RejectsBadDefinitions) {
	EXPECT_THROW(IndexDefinition("X", "", VEGETATION, {}, "1", "").check(), std::runtime_error);
	EXPECT_THROW(IndexDefinition("X", "", VEGETATION, {RoleSpec("red", 665, 0)}, "{red}", "").check(),
		std::runtime_error);
	EXPECT_THROW(IndexDefinition("X", "", VEGETATION, {RoleSpec("red", 665), RoleSpec("red", 670)},
		"{red}", "").check(), std::runtime_error);
	EXPECT_THROW(IndexDefinition("X", "", VEGETATION, redNir(), "{nir} - {red}", "", 1, 1).check(),
		std::runtime_error);
}

TEST_F(CatalogTest, CustomCatalog) {
	std::vector<IndexDefinition> defs;
	defs.push_back(IndexDefinition("DIFF", "Difference", SOIL, redNir(), "{nir} - {red}", "none"));
	IndexCatalog c(defs);
	EXPECT_EQ(1u, c.size());
	EXPECT_EQ("DIFF", c.lookup("diff").name);
	EXPECT_TRUE(c.listByTheme(VEGETATION).empty());
	EXPECT_EQ(1u, c.listByTheme("soil").size());
}
