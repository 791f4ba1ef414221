#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace polygraph::graph {

/**
 * Arithmetic evaluator for function attributes.
 *
 * Grammar (lowest to highest precedence):
 *   expr    := term (('+' | '-') term)*
 *   term    := unary (('*' | '/' | '%') unary)*
 *   unary   := ('-' | '+') unary | power
 *   power   := primary ('^' unary)?
 *   primary := number | name | call | '(' expr ')'
 *
 * Names are bare identifiers or quoted strings ("molar mass"); both are
 * passed to the resolver with whitespace replaced by '_'. `pi` and `e` are
 * used when the resolver does not know them.
 * Functions: sqrt abs min max pow exp log log10 floor ceil round.
 */
class Expression {
public:
    // Value of a name, or nullopt if unknown. Throw ExpressionError for
    // names that exist but are not numeric.
    using Resolver = std::function<std::optional<double>(const std::string& name)>;

    /**
     * @throws ExpressionError on syntax errors, unknown names or functions,
     *         division by zero and non-finite results
     */
    static double evaluate(const std::string& expression, const Resolver& resolver);

    // Names the expression refers to, in order of first use
    static std::vector<std::string> referenced_names(const std::string& expression);
};

} // namespace polygraph::graph
