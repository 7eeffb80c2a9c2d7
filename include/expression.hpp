#ifndef __EXPRESSION_HPP__
#define __EXPRESSION_HPP__

#include <string>
#include <vector>
#include <map>
#include <memory>

#include "hyperidx.h"
#include "catalog.hpp"
#include "matcher.hpp"

namespace hyperidx {

    namespace expression {

        // Added to every denominator so that bands with no signal do not
        // produce a division by zero.
        const std::string GUARD_EPSILON = "1e-6";

        // A node in a parsed formula template.
        class DLL_EXPORT Node {
        public:
            enum Kind {
                NUMBER,
                ROLE,
                ADD,
                SUB,
                MUL,
                DIV,
                NEG,
                POW,
                CALL
            };

            Kind kind;
            // The literal spelling (NUMBER), role id (ROLE) or function name (CALL).
            std::string text;
            // The exponent of a POW node.
            int exponent;
            std::unique_ptr<Node> lhs;
            std::unique_ptr<Node> rhs;

            Node(Kind kind, const std::string &text = "");
            Node(Kind kind, Node *lhs, Node *rhs = nullptr);
        };

        // A parsed formula template. Grammar:
        //
        //   expr    := term (('+' | '-') term)*
        //   term    := unary (('*' | '/') unary)*
        //   unary   := '-' unary | power
        //   power   := primary ('^' integer)?
        //   primary := number | '{' role '}' | func '(' expr ')' | '(' expr ')'
        //   func    := sqrt | log | abs
        //
        // Throws runtime_error on a malformed template.
        class DLL_EXPORT FormulaTemplate {
        private:
            std::string m_text;
            std::unique_ptr<Node> m_root;

            std::string emit(const Node &node, const std::map<std::string, std::string> &bands) const;
            std::string emitOperand(const Node &node, int prec, bool right,
                const std::map<std::string, std::string> &bands) const;

        public:
            FormulaTemplate(const std::string &text);

            // Role ids referenced by the template, in order of first appearance.
            std::vector<std::string> roles() const;

            // Substitute each role with its band and return the expression text.
            // Every division is emitted with a guarded denominator and integer
            // powers are expanded to products. Throws runtime_error if a role has
            // no band.
            std::string render(const std::map<std::string, std::string> &bands) const;
        };

        // The expression for one index, ready for the raster engine.
        class DLL_EXPORT ComputedExpression {
        public:
            std::string indexName;
            std::string expression;
            bool normalized;
            std::vector<std::string> warnings;

            ComputedExpression();
            ComputedExpression(const std::string &indexName, const std::string &expression);
        };

        // Builds guarded expressions from fully matched indices.
        class DLL_EXPORT ExpressionBuilder {
        public:

            // Returns the warning recorded when an index cannot be built.
            static std::string skipWarning(const hyperidx::catalog::IndexDefinition &index,
                const hyperidx::matching::MatchResult &match);

            // Build the expression. The match must be FULLY_MATCHED and belong to the
            // index; otherwise throws runtime_error.
            ComputedExpression build(const hyperidx::catalog::IndexDefinition &index,
                const hyperidx::matching::MatchResult &match) const;
        };

        // Rescales an expression to [0, 1] using the index's known range.
        class DLL_EXPORT Normalizer {
        public:

            // Formats a number for an expression; negative values are parenthesized.
            static std::string literal(double value);

            // Returns a new expression ((x) - min) / (max - min), or, if the index
            // has no range, a copy of expr with a warning appended.
            ComputedExpression normalize(const ComputedExpression &expr,
                const hyperidx::catalog::IndexDefinition &index) const;
        };

    } // expression

} // hyperidx

#endif
