#include "core/graph/expression.hpp"
#include "polygraph/error.hpp"
#include <gtest/gtest.h>
#include <map>

using namespace polygraph;
using namespace polygraph::graph;

namespace {

Expression::Resolver scope(std::map<std::string, double> values) {
    return [values](const std::string& name) -> std::optional<double> {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

double eval(const std::string& expression) {
    return Expression::evaluate(expression, nullptr);
}

}

TEST(ExpressionTest, Precedence) {
    EXPECT_DOUBLE_EQ(eval("1 + 2 * 3"), 7.0);
    EXPECT_DOUBLE_EQ(eval("(1 + 2) * 3"), 9.0);
    EXPECT_DOUBLE_EQ(eval("10 - 4 - 3"), 3.0);
    EXPECT_DOUBLE_EQ(eval("12 / 4 / 3"), 1.0);
    EXPECT_DOUBLE_EQ(eval("7 % 4"), 3.0);
    EXPECT_DOUBLE_EQ(eval("1.5e2"), 150.0);
}

TEST(ExpressionTest, PowerIsRightAssociative) {
    EXPECT_DOUBLE_EQ(eval("2 ^ 3 ^ 2"), 512.0);
    EXPECT_DOUBLE_EQ(eval("-2 ^ 2"), -4.0);
    EXPECT_DOUBLE_EQ(eval("2 ^ -1"), 0.5);
    EXPECT_DOUBLE_EQ(eval("--3"), 3.0);
}

TEST(ExpressionTest, Functions) {
    EXPECT_DOUBLE_EQ(eval("sqrt(16)"), 4.0);
    EXPECT_DOUBLE_EQ(eval("abs(-2.5)"), 2.5);
    EXPECT_DOUBLE_EQ(eval("min(3, 1, 2)"), 1.0);
    EXPECT_DOUBLE_EQ(eval("max(3, 1, 2)"), 3.0);
    EXPECT_DOUBLE_EQ(eval("pow(2, 10)"), 1024.0);
    EXPECT_DOUBLE_EQ(eval("floor(2.75) + ceil(0.25) + round(1.5)"), 5.0);
    EXPECT_DOUBLE_EQ(eval("log10(1000)"), 3.0);
    EXPECT_DOUBLE_EQ(eval("log(exp(2))"), 2.0);
}

TEST(ExpressionTest, Constants) {
    EXPECT_NEAR(eval("pi"), 3.14159265, 1e-8);
    EXPECT_NEAR(eval("e"), 2.71828182, 1e-8);

    // Scope values win over the constants
    EXPECT_DOUBLE_EQ(Expression::evaluate("e * 2", scope({{"e", 4.0}})), 8.0);
}

TEST(ExpressionTest, NamesResolveThroughScope) {
    auto resolver = scope({{"molar_mass", 18.0}, {"count", 2.0}});
    EXPECT_DOUBLE_EQ(Expression::evaluate("molar_mass * count", resolver), 36.0);
    EXPECT_DOUBLE_EQ(Expression::evaluate("\"molar mass\" / 2", resolver), 9.0);
    EXPECT_DOUBLE_EQ(Expression::evaluate("'molar  mass' + count", resolver), 20.0);
}

TEST(ExpressionTest, Errors) {
    auto resolver = scope({{"x", 1.0}});

    EXPECT_THROW(Expression::evaluate("y + 1", resolver), ExpressionError);
    EXPECT_THROW(eval("1 / 0"), ExpressionError);
    EXPECT_THROW(eval("5 % 0"), ExpressionError);
    EXPECT_THROW(eval("1 +"), ExpressionError);
    EXPECT_THROW(eval("(1 + 2"), ExpressionError);
    EXPECT_THROW(eval("1 2"), ExpressionError);
    EXPECT_THROW(eval("3 $ 4"), ExpressionError);
    EXPECT_THROW(eval("\"open"), ExpressionError);
    EXPECT_THROW(eval(""), ExpressionError);
    EXPECT_THROW(eval("frobnicate(1)"), ExpressionError);
    EXPECT_THROW(eval("pow(1)"), ExpressionError);
    EXPECT_THROW(eval("min()"), ExpressionError);
    EXPECT_THROW(eval("sqrt(-1)"), ExpressionError);
    EXPECT_THROW(eval("log(0)"), ExpressionError);

    try {
        eval("1 / 0");
    } catch (const ExpressionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ExpressionInvalid);
    }
}

TEST(ExpressionTest, ResolverErrorsPropagate) {
    Expression::Resolver resolver = [](const std::string& name) -> std::optional<double> {
        throw ExpressionError("Attribute '" + name + "' is not numeric");
    };
    EXPECT_THROW(Expression::evaluate("state * 2", resolver), ExpressionError);
}

TEST(ExpressionTest, ReferencedNames) {
    auto names = Expression::referenced_names("sqrt(a) + \"molar mass\" * a - max(b, 2)");
    EXPECT_EQ(names, (std::vector<std::string>{"a", "molar_mass", "b"}));
    EXPECT_TRUE(Expression::referenced_names("1 + 2").empty());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
