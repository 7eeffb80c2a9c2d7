#include <string>
#include <vector>
#include <map>
#include <memory>
#include <sstream>
#include <cctype>
#include <algorithm>
#include <iterator>

#include <boost/algorithm/string.hpp>

#include "hyperidx.h"
#include "catalog.hpp"
#include "matcher.hpp"
#include "expression.hpp"

using namespace hyperidx::catalog;
using namespace hyperidx::matching;
using namespace hyperidx::expression;

namespace {

	const char* FUNCTIONS[] = {"sqrt", "log", "abs"};

	const int PREC_ADD = 1;
	const int PREC_MUL = 2;
	const int PREC_NEG = 3;
	const int PREC_ATOM = 4;

	// Largest exponent that will be expanded into a product.
	const int MAX_EXPONENT = 8;

	/**
	 * Recursive-descent parser for formula templates. Produces a tree of
	 * Nodes; the caller owns the root.
	 */
	class Parser {
	private:
		const std::string &m_text;
		size_t m_pos;

		void skip() {
			while(m_pos < m_text.size() && std::isspace((unsigned char) m_text[m_pos]))
				++m_pos;
		}

		char peek() {
			skip();
			return m_pos < m_text.size() ? m_text[m_pos] : '\0';
		}

		void expect(char c) {
			if(peek() != c)
				fail(std::string("expected '") + c + "'");
			++m_pos;
		}

		void fail(const std::string &msg) {
			hi_runerr("Malformed formula \"" << m_text << "\" at " << m_pos << ": " << msg << ".");
		}

		Node* number() {
			size_t start = m_pos;
			while(m_pos < m_text.size() && std::isdigit((unsigned char) m_text[m_pos]))
				++m_pos;
			if(m_pos < m_text.size() && m_text[m_pos] == '.') {
				++m_pos;
				while(m_pos < m_text.size() && std::isdigit((unsigned char) m_text[m_pos]))
					++m_pos;
			}
			if(m_pos < m_text.size() && (m_text[m_pos] == 'e' || m_text[m_pos] == 'E')) {
				++m_pos;
				if(m_pos < m_text.size() && (m_text[m_pos] == '+' || m_text[m_pos] == '-'))
					++m_pos;
				size_t digits = m_pos;
				while(m_pos < m_text.size() && std::isdigit((unsigned char) m_text[m_pos]))
					++m_pos;
				if(digits == m_pos)
					fail("bad exponent in numeric literal");
			}
			std::string lit = m_text.substr(start, m_pos - start);
			if(lit == ".")
				fail("bad numeric literal");
			return new Node(Node::NUMBER, lit);
		}

		Node* role() {
			++m_pos; // {
			size_t end = m_text.find('}', m_pos);
			if(end == std::string::npos)
				fail("unterminated placeholder");
			std::string id = boost::algorithm::trim_copy(m_text.substr(m_pos, end - m_pos));
			if(id.empty())
				fail("empty placeholder");
			m_pos = end + 1;
			return new Node(Node::ROLE, id);
		}

		Node* call() {
			size_t start = m_pos;
			while(m_pos < m_text.size() && std::isalpha((unsigned char) m_text[m_pos]))
				++m_pos;
			std::string name = m_text.substr(start, m_pos - start);
			if(std::find(std::begin(FUNCTIONS), std::end(FUNCTIONS), name) == std::end(FUNCTIONS))
				fail("unknown function " + name);
			expect('(');
			std::unique_ptr<Node> arg(expr());
			expect(')');
			Node *n = new Node(Node::CALL, name);
			n->lhs = std::move(arg);
			return n;
		}

		Node* primary() {
			char c = peek();
			if(std::isdigit((unsigned char) c) || c == '.')
				return number();
			if(c == '{')
				return role();
			if(std::isalpha((unsigned char) c))
				return call();
			if(c == '(') {
				++m_pos;
				std::unique_ptr<Node> inner(expr());
				expect(')');
				return inner.release();
			}
			fail(c == '\0' ? "unexpected end of formula" : std::string("unexpected '") + c + "'");
			return nullptr;
		}

		Node* power() {
			std::unique_ptr<Node> base(primary());
			if(peek() == '^') {
				++m_pos;
				skip();
				size_t start = m_pos;
				while(m_pos < m_text.size() && std::isdigit((unsigned char) m_text[m_pos]))
					++m_pos;
				if(start == m_pos)
					fail("exponent must be a non-negative integer");
				int exp = std::stoi(m_text.substr(start, m_pos - start));
				if(exp > MAX_EXPONENT)
					fail("exponent too large");
				Node *n = new Node(Node::POW, base.release());
				n->exponent = exp;
				return n;
			}
			return base.release();
		}

		Node* unary() {
			if(peek() == '-') {
				++m_pos;
				return new Node(Node::NEG, unary());
			}
			return power();
		}

		Node* term() {
			std::unique_ptr<Node> lhs(unary());
			while(true) {
				char c = peek();
				if(c != '*' && c != '/')
					break;
				++m_pos;
				std::unique_ptr<Node> rhs(unary());
				lhs.reset(new Node(c == '*' ? Node::MUL : Node::DIV, lhs.release(), rhs.release()));
			}
			return lhs.release();
		}

		Node* expr() {
			std::unique_ptr<Node> lhs(term());
			while(true) {
				char c = peek();
				if(c != '+' && c != '-')
					break;
				++m_pos;
				std::unique_ptr<Node> rhs(term());
				lhs.reset(new Node(c == '+' ? Node::ADD : Node::SUB, lhs.release(), rhs.release()));
			}
			return lhs.release();
		}

	public:
		Parser(const std::string &text) :
			m_text(text), m_pos(0) {
		}

		Node* parse() {
			std::unique_ptr<Node> root(expr());
			if(peek() != '\0')
				fail(std::string("unexpected '") + m_text[m_pos] + "'");
			return root.release();
		}
	};

	int precedence(const Node &node) {
		switch(node.kind) {
		case Node::ADD:
		case Node::SUB:
			return PREC_ADD;
		case Node::MUL:
		case Node::DIV:
			return PREC_MUL;
		case Node::NEG:
			return PREC_NEG;
		case Node::POW:
			return node.exponent >= 2 ? PREC_MUL : PREC_ATOM;
		default:
			return PREC_ATOM;
		}
	}

	void collectRoles(const Node &node, std::vector<std::string> &roles) {
		if(node.kind == Node::ROLE) {
			if(std::find(roles.begin(), roles.end(), node.text) == roles.end())
				roles.push_back(node.text);
			return;
		}
		if(node.lhs)
			collectRoles(*node.lhs, roles);
		if(node.rhs)
			collectRoles(*node.rhs, roles);
	}

} // anon

Node::Node(Kind kind, const std::string &text) :
	kind(kind), text(text), exponent(0) {
}

Node::Node(Kind kind, Node *lhs, Node *rhs) :
	kind(kind), exponent(0), lhs(lhs), rhs(rhs) {
}

FormulaTemplate::FormulaTemplate(const std::string &text) :
	m_text(text) {
	Parser parser(m_text);
	m_root.reset(parser.parse());
}

std::vector<std::string> FormulaTemplate::roles() const {
	std::vector<std::string> roles;
	collectRoles(*m_root, roles);
	return roles;
}

std::string FormulaTemplate::emitOperand(const Node &node, int prec, bool right,
	const std::map<std::string, std::string> &bands) const {
	std::string s = emit(node, bands);
	int p = precedence(node);
	bool parens = p < prec || (right && p == prec) || (node.kind == Node::NEG && prec < PREC_NEG);
	return parens ? "(" + s + ")" : s;
}

std::string FormulaTemplate::emit(const Node &node, const std::map<std::string, std::string> &bands) const {
	switch(node.kind) {
	case Node::NUMBER:
		return node.text;
	case Node::ROLE:
	{
		auto it = bands.find(node.text);
		if(it == bands.end() || it->second.empty())
			hi_runerr("No band bound to role " << node.text << " in formula " << m_text);
		return it->second;
	}
	case Node::CALL:
		return node.text + "(" + emit(*node.lhs, bands) + ")";
	case Node::NEG:
		return "-" + emitOperand(*node.lhs, PREC_NEG, false, bands);
	case Node::ADD:
		return emitOperand(*node.lhs, PREC_ADD, false, bands) + " + " + emitOperand(*node.rhs, PREC_ADD, true, bands);
	case Node::SUB:
		return emitOperand(*node.lhs, PREC_ADD, false, bands) + " - " + emitOperand(*node.rhs, PREC_ADD, true, bands);
	case Node::MUL:
		return emitOperand(*node.lhs, PREC_MUL, false, bands) + " * " + emitOperand(*node.rhs, PREC_MUL, true, bands);
	case Node::DIV:
		// The denominator is always guarded; the template cannot opt out.
		return emitOperand(*node.lhs, PREC_MUL, false, bands) + " / (" + emit(*node.rhs, bands) + " + " + GUARD_EPSILON + ")";
	case Node::POW:
	{
		if(node.exponent == 0)
			return "1";
		std::string base = emitOperand(*node.lhs, PREC_ATOM, false, bands);
		std::vector<std::string> factors(node.exponent, base);
		return boost::algorithm::join(factors, " * ");
	}
	default:
		hi_runerr("Unknown node kind: " << (int) node.kind);
	}
}

std::string FormulaTemplate::render(const std::map<std::string, std::string> &bands) const {
	return emit(*m_root, bands);
}

ComputedExpression::ComputedExpression() :
	normalized(false) {
}

ComputedExpression::ComputedExpression(const std::string &indexName, const std::string &expression) :
	indexName(indexName), expression(expression), normalized(false) {
}

std::string ExpressionBuilder::skipWarning(const IndexDefinition &index, const MatchResult &match) {
	std::vector<std::string> roles;
	for(const RoleSpec &r : match.missingRoles())
		roles.push_back(r.print());
	std::stringstream ss;
	ss << "index " << index.name << " skipped: missing role(s) " << boost::algorithm::join(roles, ", ");
	return ss.str();
}

ComputedExpression ExpressionBuilder::build(const IndexDefinition &index, const MatchResult &match) const {
	if(match.indexName() != index.name)
		hi_runerr("Match result for " << match.indexName() << " used to build " << index.name << ".");
	if(match.status() != FULLY_MATCHED)
		hi_runerr("Cannot build " << index.name << ": match status is " << statusName(match.status()) << ".");

	std::map<std::string, std::string> bands;
	for(const RoleBinding &b : match.bindings())
		bands[b.role.roleId] = b.bandName;

	FormulaTemplate tpl(index.formula);
	ComputedExpression expr(index.name, tpl.render(bands));
	hi_debug(index.name << " = " << expr.expression);
	return expr;
}

std::string Normalizer::literal(double value) {
	std::stringstream ss;
	ss << std::setprecision(12) << value;
	return value < 0 ? "(" + ss.str() + ")" : ss.str();
}

ComputedExpression Normalizer::normalize(const ComputedExpression &expr, const IndexDefinition &index) const {
	ComputedExpression out(expr);
	if(!index.hasRange) {
		out.normalized = false;
		out.warnings.push_back("index " + index.name + " has no defined range; normalization skipped");
		return out;
	}
	std::string min = literal(index.rangeMin);
	std::string max = literal(index.rangeMax);
	out.expression = "((" + expr.expression + ") - " + min + ") / (" + max + " - " + min + ")";
	out.normalized = true;
	return out;
}
