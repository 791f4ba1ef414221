#include "expression.hpp"
#include "core/model/identity.hpp"
#include "polygraph/error.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace polygraph::graph {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double EULER = 2.71828182845904523536;

enum class TokenType {
    NUMBER,
    NAME,
    OPERATOR,
    LPAREN,
    RPAREN,
    COMMA,
    END
};

struct Token {
    TokenType type = TokenType::END;
    std::string text;
    double number = 0.0;
    bool quoted = false;
    size_t position = 0;
};

std::vector<Token> tokenize(const std::string& input) {
    std::vector<Token> tokens;
    size_t i = 0;

    while (i < input.size()) {
        char c = input[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        Token token;
        token.position = i;

        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            const char* begin = input.c_str() + i;
            char* end = nullptr;
            token.number = std::strtod(begin, &end);
            if (end == begin) {
                throw ExpressionError("Invalid number at position " + std::to_string(i));
            }
            token.type = TokenType::NUMBER;
            token.text.assign(begin, static_cast<const char*>(end));
            i += static_cast<size_t>(end - begin);
        } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t start = i;
            while (i < input.size() &&
                   (std::isalnum(static_cast<unsigned char>(input[i])) || input[i] == '_')) {
                ++i;
            }
            token.type = TokenType::NAME;
            token.text = input.substr(start, i - start);
        } else if (c == '"' || c == '\'') {
            size_t close = input.find(c, i + 1);
            if (close == std::string::npos) {
                throw ExpressionError("Unterminated quoted name at position " + std::to_string(i));
            }
            token.type = TokenType::NAME;
            token.quoted = true;
            token.text = input.substr(i + 1, close - i - 1);
            if (model::is_blank(token.text)) {
                throw ExpressionError("Empty quoted name at position " + std::to_string(i));
            }
            i = close + 1;
        } else if (c == '+' || c == '-' || c == '*' || c == '/' || c == '^' || c == '%') {
            token.type = TokenType::OPERATOR;
            token.text = std::string(1, c);
            ++i;
        } else if (c == '(') {
            token.type = TokenType::LPAREN;
            ++i;
        } else if (c == ')') {
            token.type = TokenType::RPAREN;
            ++i;
        } else if (c == ',') {
            token.type = TokenType::COMMA;
            ++i;
        } else {
            throw ExpressionError(std::string("Unexpected character '") + c +
                                  "' at position " + std::to_string(i));
        }
        tokens.push_back(std::move(token));
    }

    Token end;
    end.position = input.size();
    tokens.push_back(end);
    return tokens;
}

// Resolver-facing form of a name token
std::string scope_name(const Token& token) {
    return model::underscore_whitespace(token.text);
}

class Parser {
public:
    Parser(std::vector<Token> tokens, const Expression::Resolver& resolver)
        : tokens_(std::move(tokens)), resolver_(resolver) {}

    double parse() {
        double value = expr();
        if (peek().type != TokenType::END) {
            throw ExpressionError("Unexpected token at position " + std::to_string(peek().position));
        }
        return value;
    }

private:
    const Token& peek() const { return tokens_[pos_]; }
    const Token& next() { return tokens_[pos_++]; }

    bool accept_operator(char op) {
        if (peek().type == TokenType::OPERATOR && peek().text[0] == op) {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect(TokenType type, const char* what) {
        if (peek().type != type) {
            throw ExpressionError(std::string("Expected ") + what +
                                  " at position " + std::to_string(peek().position));
        }
        ++pos_;
    }

    double expr() {
        double value = term();
        while (true) {
            if (accept_operator('+')) {
                value += term();
            } else if (accept_operator('-')) {
                value -= term();
            } else {
                return value;
            }
        }
    }

    double term() {
        double value = unary();
        while (true) {
            if (accept_operator('*')) {
                value *= unary();
            } else if (accept_operator('/')) {
                double divisor = unary();
                if (divisor == 0.0) throw ExpressionError("Division by zero");
                value /= divisor;
            } else if (accept_operator('%')) {
                double divisor = unary();
                if (divisor == 0.0) throw ExpressionError("Modulo by zero");
                value = std::fmod(value, divisor);
            } else {
                return value;
            }
        }
    }

    double unary() {
        if (accept_operator('-')) return -unary();
        if (accept_operator('+')) return unary();
        return power();
    }

    double power() {
        double base = primary();
        if (accept_operator('^')) {
            return std::pow(base, unary());
        }
        return base;
    }

    double primary() {
        const Token& token = next();
        switch (token.type) {
            case TokenType::NUMBER:
                return token.number;
            case TokenType::LPAREN: {
                double value = expr();
                expect(TokenType::RPAREN, "')'");
                return value;
            }
            case TokenType::NAME:
                if (!token.quoted && peek().type == TokenType::LPAREN) {
                    return call(token);
                }
                return resolve(token);
            default:
                throw ExpressionError("Unexpected token at position " + std::to_string(token.position));
        }
    }

    double resolve(const Token& token) {
        std::string name = scope_name(token);
        if (resolver_) {
            auto value = resolver_(name);
            if (value) return *value;
        }
        if (!token.quoted && name == "pi") return PI;
        if (!token.quoted && name == "e") return EULER;
        throw ExpressionError("Unknown name '" + token.text + "'");
    }

    double call(const Token& function) {
        expect(TokenType::LPAREN, "'('");
        std::vector<double> args;
        if (peek().type != TokenType::RPAREN) {
            args.push_back(expr());
            while (peek().type == TokenType::COMMA) {
                ++pos_;
                args.push_back(expr());
            }
        }
        expect(TokenType::RPAREN, "')'");
        return apply(function.text, args);
    }

    static void arity(const std::string& name, const std::vector<double>& args, size_t expected) {
        if (args.size() != expected) {
            throw ExpressionError(name + "() takes " + std::to_string(expected) +
                                  " argument(s), got " + std::to_string(args.size()));
        }
    }

    static double apply(const std::string& name, const std::vector<double>& args) {
        if (name == "min" || name == "max") {
            if (args.empty()) {
                throw ExpressionError(name + "() needs at least one argument");
            }
            return name == "min" ? *std::min_element(args.begin(), args.end())
                                 : *std::max_element(args.begin(), args.end());
        }
        if (name == "pow") {
            arity(name, args, 2);
            return std::pow(args[0], args[1]);
        }

        arity(name, args, 1);
        double x = args[0];
        if (name == "sqrt") return std::sqrt(x);
        if (name == "abs") return std::fabs(x);
        if (name == "exp") return std::exp(x);
        if (name == "log") return std::log(x);
        if (name == "log10") return std::log10(x);
        if (name == "floor") return std::floor(x);
        if (name == "ceil") return std::ceil(x);
        if (name == "round") return std::round(x);
        throw ExpressionError("Unknown function '" + name + "'");
    }

    std::vector<Token> tokens_;
    const Expression::Resolver& resolver_;
    size_t pos_ = 0;
};

} // namespace

double Expression::evaluate(const std::string& expression, const Resolver& resolver) {
    if (model::is_blank(expression)) {
        throw ExpressionError("Expression is empty");
    }

    Parser parser(tokenize(expression), resolver);
    double value = parser.parse();
    if (!std::isfinite(value)) {
        throw ExpressionError("Expression '" + expression + "' has no finite value");
    }
    return value;
}

std::vector<std::string> Expression::referenced_names(const std::string& expression) {
    std::vector<Token> tokens = tokenize(expression);
    std::vector<std::string> names;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        if (token.type != TokenType::NAME) continue;
        bool is_call = !token.quoted && tokens[i + 1].type == TokenType::LPAREN;
        if (is_call) continue;
        std::string name = scope_name(token);
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

} // namespace polygraph::graph
