/*
 * The index table. Each entry declares its roles as wavelength windows (nm);
 * the matcher uses the window center as the target and its half-width as the
 * tolerance. Formulas are templates over {role} placeholders. Divisions are
 * written plainly: the expression builder guards every denominator.
 */

#include <vector>

#include "catalog.hpp"

using namespace hyperidx::catalog;

namespace {

	RoleSpec r(const char *id, double minWl, double maxWl) {
		return RoleSpec::fromRange(id, minWl, maxWl);
	}

	// Broad multispectral windows shared by many indices.
	RoleSpec blue()    { return r("blue", 450, 520); }
	RoleSpec green()   { return r("green", 520, 600); }
	RoleSpec red()     { return r("red", 620, 690); }
	RoleSpec rededge() { return r("rededge", 690, 730); }
	RoleSpec nir()     { return r("nir", 760, 900); }
	RoleSpec swir()    { return r("swir", 1550, 1750); }

	// Narrow hyperspectral windows.
	RoleSpec b550()     { return r("b550", 545, 555); }
	RoleSpec b680()     { return r("b680", 675, 685); }
	RoleSpec b695()     { return r("b695", 690, 700); }
	RoleSpec b860()     { return r("b860", 855, 865); }
	RoleSpec b900()     { return r("b900", 895, 905); }
	RoleSpec b970()     { return r("b970", 965, 975); }
	RoleSpec b1240()    { return r("b1240", 1235, 1245); }
	RoleSpec swir1600() { return r("swir1600", 1595, 1605); }
	RoleSpec swir1650() { return r("swir1650", 1645, 1655); }
	RoleSpec swir2200() { return r("swir2200", 2195, 2205); }
	RoleSpec swir2210() { return r("swir2210", 2205, 2215); }
	RoleSpec swir2300() { return r("swir2300", 2295, 2305); }
	RoleSpec swir2450() { return r("swir2450", 2445, 2455); }

	void vegetation(std::vector<IndexDefinition> &t) {
		t.push_back(IndexDefinition("NDVI", "Normalized Difference Vegetation Index", VEGETATION,
			{red(), nir()},
			"({nir} - {red}) / ({nir} + {red})",
			"Rouse et al. 1974", -1, 1));
		t.push_back(IndexDefinition("EVI", "Enhanced Vegetation Index", VEGETATION,
			{blue(), red(), nir()},
			"2.5 * ({nir} - {red}) / ({nir} + 6 * {red} - 7.5 * {blue} + 1)",
			"Huete et al. 2002", -1, 1));
		t.push_back(IndexDefinition("SAVI", "Soil Adjusted Vegetation Index", VEGETATION,
			{red(), nir()},
			"((1 + 0.5) * ({nir} - {red})) / ({nir} + {red} + 0.5)",
			"Huete 1988", -1, 1));
		t.push_back(IndexDefinition("MSAVI", "Modified Soil Adjusted Vegetation Index", VEGETATION,
			{red(), nir()},
			"(2 * {nir} + 1 - sqrt((2 * {nir} + 1)^2 - 8 * ({nir} - {red}))) / 2",
			"Qi et al. 1994"));
		t.push_back(IndexDefinition("GNDVI", "Green Normalized Difference Vegetation Index", VEGETATION,
			{green(), nir()},
			"({nir} - {green}) / ({nir} + {green})",
			"Gitelson et al. 1996", -1, 1));
		t.push_back(IndexDefinition("NDRE", "Normalized Difference Red Edge", VEGETATION,
			{rededge(), nir()},
			"({nir} - {rededge}) / ({nir} + {rededge})",
			"Gitelson and Merzlyak 1994", -1, 1));
		t.push_back(IndexDefinition("CIrededge", "Chlorophyll Index Red Edge", VEGETATION,
			{rededge(), nir()},
			"({nir} / {rededge}) - 1",
			"Gitelson et al. 2003"));
		t.push_back(IndexDefinition("MTCI", "MERIS Terrestrial Chlorophyll Index", VEGETATION,
			{red(), rededge(), nir()},
			"({nir} - {rededge}) / ({rededge} - {red})",
			"Dash and Curran 2004"));
		t.push_back(IndexDefinition("MCARI", "Modified Chlorophyll Absorption Ratio Index", VEGETATION,
			{green(), red(), rededge()},
			"(({rededge} - {red}) - 0.2 * ({rededge} - {green})) * ({rededge} / {red})",
			"Daughtry et al. 2000"));
		t.push_back(IndexDefinition("REIP", "Red Edge Inflection Point", VEGETATION,
			{red(), r("re1", 697, 712), r("re2", 732, 748), nir()},
			"700 + 40 * ((({red} + {nir}) / 2) - {re1}) / ({re2} - {re1})",
			"Guyot et al. 1988"));
		t.push_back(IndexDefinition("ARVI", "Atmospherically Resistant Vegetation Index", VEGETATION,
			{blue(), red(), nir()},
			"({nir} - (2 * {red} - {blue})) / ({nir} + (2 * {red} - {blue}))",
			"Kaufman and Tanre 1992"));
		t.push_back(IndexDefinition("VARI", "Visible Atmospherically Resistant Index", VEGETATION,
			{blue(), green(), red()},
			"({green} - {red}) / ({green} + {red} - {blue})",
			"Gitelson et al. 2002"));
		t.push_back(IndexDefinition("DVI", "Difference Vegetation Index", VEGETATION,
			{red(), nir()},
			"{nir} - {red}",
			"Tucker 1979"));
		t.push_back(IndexDefinition("TVI", "Triangular Vegetation Index", VEGETATION,
			{green(), red(), nir()},
			"0.5 * (120 * ({nir} - {green}) - 200 * ({red} - {green}))",
			"Broge and Leblanc 2001"));
		t.push_back(IndexDefinition("OSAVI", "Optimized Soil Adjusted Vegetation Index", VEGETATION,
			{red(), nir()},
			"({nir} - {red}) / ({nir} + {red} + 0.16)",
			"Rondeaux et al. 1996"));
		t.push_back(IndexDefinition("SR", "Simple Ratio", VEGETATION,
			{red(), nir()},
			"{nir} / {red}",
			"Jordan 1969"));
		t.push_back(IndexDefinition("EVI2", "Two-band Enhanced Vegetation Index", VEGETATION,
			{red(), nir()},
			"2.5 * ({nir} - {red}) / ({nir} + 2.4 * {red} + 1)",
			"Jiang et al. 2008"));
		t.push_back(IndexDefinition("WDRVI", "Wide Dynamic Range Vegetation Index", VEGETATION,
			{red(), nir()},
			"(0.2 * {nir} - {red}) / (0.2 * {nir} + {red})",
			"Gitelson 2004", -1, 1));
	}

	void pigments(std::vector<IndexDefinition> &t) {
		t.push_back(IndexDefinition("ARI1", "Anthocyanin Reflectance Index 1", PIGMENTS,
			{green(), rededge()},
			"(1 / {green}) - (1 / {rededge})",
			"Gitelson et al. 2001"));
		t.push_back(IndexDefinition("ARI2", "Anthocyanin Reflectance Index 2", PIGMENTS,
			{green(), rededge(), nir()},
			"{nir} * ((1 / {green}) - (1 / {rededge}))",
			"Gitelson et al. 2001"));
		t.push_back(IndexDefinition("CRI550", "Carotenoid Reflectance Index 550", PIGMENTS,
			{r("b510", 505, 515), b550()},
			"(1 / {b510}) - (1 / {b550})",
			"Gitelson et al. 2002"));
		t.push_back(IndexDefinition("CRI700", "Carotenoid Reflectance Index 700", PIGMENTS,
			{r("b510", 505, 515), r("b700", 695, 705)},
			"(1 / {b510}) - (1 / {b700})",
			"Gitelson et al. 2002"));
		t.push_back(IndexDefinition("CARI", "Chlorophyll Absorption Ratio Index", PIGMENTS,
			{b550(), red(), r("re700", 695, 705)},
			"({re700} / {red}) * abs((({b550} - {red}) / {re700}) + {red} - {b550})",
			"Kim et al. 1994"));
		t.push_back(IndexDefinition("MCARIOSAVI", "MCARI/OSAVI ratio - Chlorophyll content", PIGMENTS,
			{green(), red(), r("re700", 695, 705), nir()},
			"((({re700} - {red}) - 0.2 * ({re700} - {green})) * ({re700} / {red})) / ((1.16 * ({nir} - {red}) / ({nir} + {red} + 0.16)))",
			"Daughtry et al. 2000"));
		t.push_back(IndexDefinition("GITELSON", "Gitelson Chlorophyll Index", PIGMENTS,
			{green(), nir()},
			"({nir} / {green}) - 1",
			"Gitelson et al. 2003"));
		t.push_back(IndexDefinition("GITELSON2", "Gitelson Chlorophyll Index 2", PIGMENTS,
			{rededge(), nir()},
			"({nir} / {rededge}) - 1",
			"Gitelson et al. 2003"));
		t.push_back(IndexDefinition("MCARI1", "Modified Chlorophyll Absorption Ratio Index 1", PIGMENTS,
			{green(), red(), nir()},
			"1.2 * (2.5 * ({nir} - {red}) - 1.3 * ({nir} - {green}))",
			"Haboudane et al. 2004"));
		t.push_back(IndexDefinition("MCARI2", "Modified Chlorophyll Absorption Ratio Index 2", PIGMENTS,
			{green(), red(), nir()},
			"(1.5 * (2.5 * ({nir} - {red}) - 1.3 * ({nir} - {green}))) / sqrt((2 * {nir} + 1)^2 - (6 * {nir} - 5 * sqrt({red})) - 0.5)",
			"Haboudane et al. 2004"));
		t.push_back(IndexDefinition("RDVI", "Renormalized Difference Vegetation Index", PIGMENTS,
			{red(), nir()},
			"({nir} - {red}) / sqrt({nir} + {red})",
			"Roujean and Breon 1995"));
		t.push_back(IndexDefinition("MARI", "Modified Anthocyanin Reflectance Index", PIGMENTS,
			{green(), rededge(), nir()},
			"((1 / {green}) - (1 / {rededge})) * {nir}",
			"Gitelson et al. 2006"));
		t.push_back(IndexDefinition("VREI1", "Vogelmann Red Edge Index 1", PIGMENTS,
			{r("re720", 715, 725), r("re740", 735, 745)},
			"{re740} / {re720}",
			"Vogelmann et al. 1993"));
		t.push_back(IndexDefinition("VREI2", "Vogelmann Red Edge Index 2", PIGMENTS,
			{r("re715", 710, 720), r("re726", 721, 731), r("re734", 729, 739), r("re747", 742, 752)},
			"({re734} - {re747}) / ({re715} + {re726})",
			"Vogelmann et al. 1993"));
		t.push_back(IndexDefinition("DD", "Double Difference Index - Chlorophyll", PIGMENTS,
			{r("re672", 667, 677), r("re701", 696, 706), r("re720", 715, 725), r("re749", 744, 754)},
			"({re749} - {re720}) - ({re701} - {re672})",
			"le Maire et al. 2004"));
		t.push_back(IndexDefinition("NDVI705", "Red Edge Normalized Difference Vegetation Index", PIGMENTS,
			{r("b705", 700, 710), r("b750", 745, 755)},
			"({b750} - {b705}) / ({b750} + {b705})",
			"Sims and Gamon 2002", -1, 1));
		t.push_back(IndexDefinition("MNDVI705", "Modified Red Edge Normalized Difference Vegetation Index", PIGMENTS,
			{r("b445", 440, 450), r("b705", 700, 710), r("b750", 745, 755)},
			"({b750} - {b705}) / ({b750} + {b705} - 2 * {b445})",
			"Sims and Gamon 2002"));
	}

	void metabolism(std::vector<IndexDefinition> &t) {
		t.push_back(IndexDefinition("WI", "Water Index - Leaf water content", METABOLISM,
			{b900(), b970()},
			"{b900} / {b970}",
			"Penuelas et al. 1997"));
		t.push_back(IndexDefinition("NDWI1240", "Normalized Difference Water Index 1240", METABOLISM,
			{b860(), b1240()},
			"({b860} - {b1240}) / ({b860} + {b1240})",
			"Gao 1996"));
		t.push_back(IndexDefinition("NDWI2130", "Normalized Difference Water Index 2130", METABOLISM,
			{b860(), r("b2130", 2125, 2135)},
			"({b860} - {b2130}) / ({b860} + {b2130})",
			"Gao 1996"));
		t.push_back(IndexDefinition("LWCI", "Leaf Water Content Index", METABOLISM,
			{b900(), r("b955", 950, 960), b970()},
			"log(1 - ({b970} - {b900})) / log(1 - ({b970} - {b955}))",
			"Galvao et al. 2005"));
		t.push_back(IndexDefinition("NDII", "Normalized Difference Infrared Index", METABOLISM,
			{r("b819", 814, 824), r("b1649", 1644, 1654)},
			"({b819} - {b1649}) / ({b819} + {b1649})",
			"Hardisky et al. 1983"));
		t.push_back(IndexDefinition("SRWI", "Simple Ratio Water Index", METABOLISM,
			{b860(), b1240()},
			"{b860} / {b1240}",
			"Zarco-Tejada et al. 2003"));
		t.push_back(IndexDefinition("DATT", "Datt Index - Leaf pigment", METABOLISM,
			{b680(), r("b710", 705, 715), r("b850", 845, 855)},
			"({b850} - {b710}) / ({b850} - {b680})",
			"Datt 1999"));
		t.push_back(IndexDefinition("CARTER1", "Carter Index 1 - Stress", METABOLISM,
			{r("b420", 415, 425), b695()},
			"{b695} / {b420}",
			"Carter 1994"));
		t.push_back(IndexDefinition("CARTER2", "Carter Index 2 - Stress", METABOLISM,
			{b695(), r("b760", 755, 765)},
			"{b695} / {b760}",
			"Carter 1994"));
		t.push_back(IndexDefinition("GMI", "Gamon Index - Photosynthetic efficiency", METABOLISM,
			{b550(), r("b750", 745, 755)},
			"{b750} / {b550}",
			"Gamon et al. 1990"));
		t.push_back(IndexDefinition("NPQI", "Normalized Phaeophytinization Index", METABOLISM,
			{r("b415", 410, 420), r("b435", 430, 440)},
			"({b415} - {b435}) / ({b415} + {b435})",
			"Barnes et al. 1992"));
		t.push_back(IndexDefinition("NPCI", "Normalized Pigment Chlorophyll Index", METABOLISM,
			{r("b430", 425, 435), b680()},
			"({b680} - {b430}) / ({b680} + {b430})",
			"Penuelas et al. 1994"));
		t.push_back(IndexDefinition("RGRI", "Red-Green Ratio Index", METABOLISM,
			{green(), red()},
			"{red} / {green}",
			"Gamon and Surfus 1999"));
	}

	void biochemical(std::vector<IndexDefinition> &t) {
		t.push_back(IndexDefinition("CAI", "Cellulose Absorption Index", BIOCHEMICAL,
			{r("swir1", 2000, 2100), r("swir2", 2100, 2300), r("swir3", 2000, 2100)},
			"0.5 * ({swir1} + {swir2}) - {swir3}",
			"Nagler et al. 2000"));
		t.push_back(IndexDefinition("NDLI", "Normalized Difference Lignin Index", BIOCHEMICAL,
			{r("swir1", 1680, 1750), r("swir2", 1754, 1850)},
			"(log(1 / {swir1}) - log(1 / {swir2})) / (log(1 / {swir1}) + log(1 / {swir2}))",
			"Serrano et al. 2002"));
		t.push_back(IndexDefinition("PRI", "Photochemical Reflectance Index", BIOCHEMICAL,
			{r("green1", 528, 532), r("green2", 565, 570)},
			"({green1} - {green2}) / ({green1} + {green2})",
			"Gamon et al. 1992", -1, 1));
		t.push_back(IndexDefinition("SIPI", "Structure Insensitive Pigment Index", BIOCHEMICAL,
			{r("blue", 445, 455), red(), nir()},
			"({nir} - {blue}) / ({nir} - {red})",
			"Penuelas et al. 1995"));
		t.push_back(IndexDefinition("PSRI", "Plant Senescence Reflectance Index", BIOCHEMICAL,
			{green(), red(), rededge()},
			"({red} - {green}) / {rededge}",
			"Merzlyak et al. 1999"));
	}

	void water(std::vector<IndexDefinition> &t) {
		t.push_back(IndexDefinition("NDWI", "Normalized Difference Water Index", WATER,
			{green(), nir()},
			"({green} - {nir}) / ({green} + {nir})",
			"McFeeters 1996", -1, 1));
		t.push_back(IndexDefinition("MNDWI", "Modified Normalized Difference Water Index", WATER,
			{green(), swir()},
			"({green} - {swir}) / ({green} + {swir})",
			"Xu 2006", -1, 1));
		t.push_back(IndexDefinition("NDMI", "Normalized Difference Moisture Index", WATER,
			{nir(), swir()},
			"({nir} - {swir}) / ({nir} + {swir})",
			"Wilson and Sader 2002", -1, 1));
		t.push_back(IndexDefinition("NDSI", "Normalized Difference Snow Index", WATER,
			{green(), swir()},
			"({green} - {swir}) / ({green} + {swir})",
			"Hall et al. 1995", -1, 1));
	}

	void soil(std::vector<IndexDefinition> &t) {
		t.push_back(IndexDefinition("BI", "Brightness Index", SOIL,
			{green(), red()},
			"sqrt(({red}^2 + {green}^2) / 2)",
			"Escadafal et al. 1994"));
		t.push_back(IndexDefinition("CI", "Coloration Index", SOIL,
			{green(), red()},
			"({red} - {green}) / {red}",
			"Escadafal et al. 1994"));
		t.push_back(IndexDefinition("RI", "Redness Index", SOIL,
			{green(), red()},
			"{red}^2 / ({green}^3)",
			"Madeira et al. 1997"));
	}

	void urban(std::vector<IndexDefinition> &t) {
		t.push_back(IndexDefinition("NDBI", "Normalized Difference Built-up Index", URBAN,
			{nir(), swir()},
			"({swir} - {nir}) / ({swir} + {nir})",
			"Zha et al. 2003", -1, 1));
		t.push_back(IndexDefinition("UI", "Urban Index", URBAN,
			{nir(), swir()},
			"({swir} - {nir}) / ({swir} + {nir})",
			"Kawamura et al. 1996"));
	}

	void stress(std::vector<IndexDefinition> &t) {
		t.push_back(IndexDefinition("MSI", "Moisture Stress Index", STRESS,
			{nir(), swir()},
			"{swir} / {nir}",
			"Rock et al. 1986"));
		t.push_back(IndexDefinition("NDNI", "Normalized Difference Nitrogen Index", STRESS,
			{r("nir1", 1510, 1520), r("nir2", 1680, 1690)},
			"(log(1 / {nir1}) - log(1 / {nir2})) / (log(1 / {nir1}) + log(1 / {nir2}))",
			"Serrano et al. 2002"));
		t.push_back(IndexDefinition("TCARI", "Transformed Chlorophyll Absorption Ratio", STRESS,
			{green(), red(), rededge()},
			"3 * (({rededge} - {red}) - 0.2 * ({rededge} - {green}) * ({rededge} / {red}))",
			"Haboudane et al. 2002"));
		t.push_back(IndexDefinition("NBR", "Normalized Burn Ratio", STRESS,
			{nir(), r("swir2", 2080, 2350)},
			"({nir} - {swir2}) / ({nir} + {swir2})",
			"Key and Benson 2006", -1, 1));
		t.push_back(IndexDefinition("NBR2", "Normalized Burn Ratio 2", STRESS,
			{r("swir1", 1550, 1750), r("swir2", 2080, 2350)},
			"({swir1} - {swir2}) / ({swir1} + {swir2})",
			"USGS Landsat Surface Reflectance-derived Spectral Indices", -1, 1));
	}

	void materials(std::vector<IndexDefinition> &t) {
		// Hydrocarbons.
		t.push_back(IndexDefinition("HI", "Hydrocarbon Index - Oil & gas detection", MATERIALS,
			{swir2200(), swir2300(), r("swir2400", 2395, 2405)},
			"({swir2200} * {swir2400}) / ({swir2300}^2)",
			"Cloutis 1989"));
		t.push_back(IndexDefinition("THI", "Tentative Hydrocarbon Index", MATERIALS,
			{r("swir1730", 1725, 1735), swir2210(), swir2450()},
			"({swir1730} + {swir2450}) / (2 * {swir2210})",
			"Kuhn et al. 2004"));
		t.push_back(IndexDefinition("OHI", "Oil and Hydrocarbon Index", MATERIALS,
			{swir1650(), swir2210(), swir2450()},
			"({swir1650} + {swir2450}) / {swir2210}",
			"Lammoglia and Filho 2011"));
		t.push_back(IndexDefinition("TPI", "Tar/Petroleum Index", MATERIALS,
			{swir1650(), swir2300()},
			"{swir2300} / {swir1650}",
			"Martinez and Le Toan 2007"));
		t.push_back(IndexDefinition("COAL", "Coal/Carbon Index", MATERIALS,
			{nir(), swir1600(), swir2200()},
			"({swir2200} / {swir1600}) * ({swir2200} / {nir})",
			"van der Meer 1995"));
		// Plastics.
		t.push_back(IndexDefinition("PLASTIC", "Plastic Detection Index", MATERIALS,
			{nir(), swir1600(), swir2200()},
			"({nir} / {swir1600}) - ({swir2200} / {swir1600})",
			"Garaba and Dierssen 2018"));
		t.push_back(IndexDefinition("PDI", "Plastic Debris Index", MATERIALS,
			{red(), nir(), swir1600()},
			"({nir} - {red}) / ({nir} + {red}) - ({swir1600} - {nir}) / ({swir1600} + {nir})",
			"Biermann et al. 2020"));
		t.push_back(IndexDefinition("FPI", "Floating Plastic Index", MATERIALS,
			{red(), nir(), swir1600()},
			"{nir} / ({red} + {swir1600}) * 100",
			"Themistocleous et al. 2020"));
		t.push_back(IndexDefinition("RSWIR", "Reversed SWIR Index - Marine debris", MATERIALS,
			{nir(), swir1600()},
			"{swir1600} / {nir}",
			"Kikaki et al. 2020"));
		t.push_back(IndexDefinition("NDPI", "Normalized Difference Plastic Index", MATERIALS,
			{nir(), swir1650()},
			"({swir1650} - {nir}) / ({swir1650} + {nir})",
			"Themistocleous et al. 2020"));
		t.push_back(IndexDefinition("MPDI", "Marine Plastic Detection Index", MATERIALS,
			{r("b490", 485, 495), r("b560", 555, 565), r("b665", 660, 670), r("b865", 860, 870)},
			"({b490} - {b560}) / ({b490} + {b560}) + ({b665} - {b865}) / ({b665} + {b865})",
			"Biermann et al. 2020"));
		// Minerals.
		t.push_back(IndexDefinition("FERRIC", "Ferric Iron Index", MATERIALS,
			{r("b830", 825, 835), swir1650()},
			"{swir1650} / {b830}",
			"Segal 1982"));
		t.push_back(IndexDefinition("FERROUS", "Ferrous Iron Index", MATERIALS,
			{r("b1550", 1545, 1555), swir1650()},
			"{swir1650} / {b1550}",
			"Segal 1982"));
		t.push_back(IndexDefinition("LATERITE", "Laterite Index - Iron-rich materials", MATERIALS,
			{red(), nir(), swir1650()},
			"({swir1650} + {red}) / {nir}",
			"Pour and Hashim 2012"));
		t.push_back(IndexDefinition("GOSSAN", "Gossan Index - Weathered sulfides", MATERIALS,
			{green(), red(), swir1650()},
			"({red} * {swir1650}) / ({green}^2)",
			"Rajendran and Nasir 2019"));
		t.push_back(IndexDefinition("SINDEX", "S-Index - Soil/sediment composition", MATERIALS,
			{red(), nir()},
			"sqrt({red} * {nir})",
			"Escadafal and Huete 1991"));
		// Built environment.
		t.push_back(IndexDefinition("PAINT", "Paint Detection Index (synthetic coatings)", MATERIALS,
			{r("b450", 445, 455), b550(), r("b650", 645, 655)},
			"({b450} + {b650}) / (2 * {b550})",
			"Based on pigment absorption features"));
		t.push_back(IndexDefinition("ASPHALT", "Asphalt/Bitumen Index", MATERIALS,
			{swir1600(), swir2200()},
			"({swir1600} - {swir2200}) / ({swir1600} + {swir2200})",
			"Herold et al. 2004"));
		t.push_back(IndexDefinition("CONCRETE", "Concrete Detection Index", MATERIALS,
			{r("b500", 495, 505), nir(), swir2200()},
			"({b500} + {swir2200}) / {nir}",
			"Dopido et al. 2012"));
	}

} // anon

std::vector<IndexDefinition> hyperidx::catalog::catalogTable() {
	std::vector<IndexDefinition> t;
	vegetation(t);
	pigments(t);
	metabolism(t);
	biochemical(t);
	water(t);
	soil(t);
	urban(t);
	stress(t);
	materials(t);
	return t;
}
