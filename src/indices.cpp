#include <string>
#include <vector>
#include <set>
#include <exception>

#include <boost/algorithm/string.hpp>

#include "hyperidx.h"
#include "catalog.hpp"
#include "matcher.hpp"
#include "expression.hpp"
#include "rastercalc.hpp"
#include "util.hpp"
#include "indices.hpp"

using namespace hyperidx::catalog;
using namespace hyperidx::matching;
using namespace hyperidx::expression;
using namespace hyperidx::indices;
using namespace hyperidx::util;

namespace {

	// The private result of one index.
	class Slot {
	public:
		bool built;
		ComputedExpression expr;
		std::vector<std::string> warnings;
		std::exception_ptr error;

		Slot() :
			built(false) {
		}
	};

	void add(std::vector<const IndexDefinition*> &selected, std::set<std::string> &seen,
			const std::vector<const IndexDefinition*> &defs) {
		for(const IndexDefinition *def : defs) {
			if(seen.insert(def->name).second)
				selected.push_back(def);
		}
	}

} // anon

HyperIndices::HyperIndices() :
	m_catalog(IndexCatalog::instance()) {
}

HyperIndices::HyperIndices(const IndexCatalog &catalog) :
	m_catalog(catalog) {
}

std::string HyperIndices::outputName(const std::string &prefix, const std::string &indexName) {
	if(prefix.empty())
		return indexName;
	return prefix + "_" + indexName;
}

std::vector<const IndexDefinition*> HyperIndices::select(const IndexRequest &request) const {
	std::vector<const IndexDefinition*> selected;
	std::set<std::string> seen;
	if(!boost::algorithm::trim_copy(request.theme).empty()) {
		if(!request.indices.empty())
			hi_debug("A theme was given; ignoring the list of indices.");
		add(selected, seen, m_catalog.listByTheme(request.theme));
	} else {
		for(const std::string &entry : request.indices) {
			std::string name = boost::algorithm::trim_copy(entry);
			if(name.empty())
				continue;
			if(boost::algorithm::iequals(name, "all") || isTheme(name)) {
				add(selected, seen, m_catalog.listByTheme(name));
			} else {
				const IndexDefinition &def = m_catalog.lookup(name);
				if(seen.insert(def.name).second)
					selected.push_back(&def);
			}
		}
	}
	if(selected.empty())
		hi_inputerr("No indices were selected.");
	return selected;
}

BatchResult HyperIndices::compute(const std::vector<BandInput> &inputs, const IndexRequest &request) const {
	BandMatcher::validate(inputs);
	std::vector<const IndexDefinition*> defs = select(request);
	hi_debug("Computing " << defs.size() << " indices from " << inputs.size() << " bands.");

	std::vector<Slot> slots(defs.size());
	BandMatcher matcher;
	ExpressionBuilder builder;
	Normalizer normalizer;

	#pragma omp parallel for
	for(int i = 0; i < (int) defs.size(); ++i) {
		Slot &slot = slots[i];
		const IndexDefinition &def = *defs[i];
		try {
			MatchResult match = matcher.match(def, inputs);
			if(match.status() != FULLY_MATCHED) {
				slot.warnings.push_back(ExpressionBuilder::skipWarning(def, match));
				continue;
			}
			ComputedExpression expr = builder.build(def, match);
			if(request.normalize)
				expr = normalizer.normalize(expr, def);
			slot.warnings.insert(slot.warnings.end(), expr.warnings.begin(), expr.warnings.end());
			slot.expr = expr;
			slot.built = true;
		} catch(...) {
			slot.error = std::current_exception();
		}
	}

	for(const Slot &slot : slots) {
		if(slot.error)
			std::rethrow_exception(slot.error);
	}

	BatchResult result;
	result.selected = defs.size();
	for(const Slot &slot : slots) {
		if(slot.built)
			result.expressions.push_back(slot.expr);
		for(const std::string &w : slot.warnings) {
			hi_warn(w);
			result.warnings.push_back(w);
		}
	}
	hi_debug(result.expressions.size() << " of " << defs.size() << " indices built.");
	return result;
}

BatchResult HyperIndices::run(const std::vector<BandInput> &inputs, const IndexRequest &request,
		hyperidx::raster::RasterCalculator &calculator) const {
	BatchResult result = compute(inputs, request);
	std::vector<ComputedExpression> calculated;
	int total = (int) result.expressions.size();
	for(int i = 0; i < total; ++i) {
		const ComputedExpression &expr = result.expressions[i];
		std::string name = outputName(request.outputPrefix, expr.indexName);
		if(hi__loglevel >= HI_LOG_DEBUG)
			Util::status(i, total, name);
		try {
			calculator.calculate(name, expr.expression);
			calculated.push_back(expr);
		} catch(const std::exception &e) {
			std::string w = "index " + expr.indexName + " failed: " + e.what();
			hi_warn(w);
			result.warnings.push_back(w);
		}
	}
	if(hi__loglevel >= HI_LOG_DEBUG)
		Util::status(total, total, "", true);
	result.expressions.swap(calculated);
	hi_debug(result.expressions.size() << " indices calculated, " << result.skipped() << " skipped.");
	return result;
}
