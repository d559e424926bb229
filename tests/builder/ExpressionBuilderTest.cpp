#include "statexpr/ExpressionBuilder.hpp"
#include "statexpr/Errors.hpp"
#include "statexpr/nodes/Leaf.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace statexpr;

namespace {

std::vector<double> run(ValueNode& n, const std::vector<MapDump>& dumps) {
    std::vector<double> out;
    for (const auto& d : dumps) out.push_back(n.evaluate(d));
    return out;
}

std::size_t errorOffset(std::string_view text) {
    try {
        build(text);
    } catch (const BuildError& e) {
        return e.offset();
    }
    ADD_FAILURE() << "no BuildError for " << text;
    return BuildError::npos;
}

} // namespace

TEST(ExpressionBuilderTest, Precedence) {
    auto n = build("1 + 2 * 3 - 8 / 4");
    MapDump d;
    EXPECT_DOUBLE_EQ(n->evaluate(d), 5.0);
    EXPECT_EQ(n->describe(), "((1 + (2 * 3)) - (8 / 4))");
}

TEST(ExpressionBuilderTest, Parentheses) {
    auto n = build("(1 + 2) * 3");
    MapDump d;
    EXPECT_DOUBLE_EQ(n->evaluate(d), 9.0);
}

TEST(ExpressionBuilderTest, UnaryMinus) {
    MapDump d{{"x", 4.0}};
    auto lit = build("-2 * 3");
    EXPECT_DOUBLE_EQ(lit->evaluate(d), -6.0);
    EXPECT_EQ(lit->describe(), "(-2 * 3)");

    auto neg = build("-LV('x')");
    EXPECT_DOUBLE_EQ(neg->evaluate(d), -4.0);
    EXPECT_EQ(neg->describe(), "(0 - FieldValue(\"x\"))");

    auto twice = build("--3");
    EXPECT_DOUBLE_EQ(twice->evaluate(d), 3.0);
}

TEST(ExpressionBuilderTest, QuotedOperandIsFieldLookup) {
    auto n = build("'a' + 1");
    MapDump d{{"a", 2.0}};
    EXPECT_DOUBLE_EQ(n->evaluate(d), 3.0);
    EXPECT_EQ(n->describe(), "(FieldValue(\"a\") + 1)");
}

TEST(ExpressionBuilderTest, AccumulatedInstructions) {
    auto n = build("AC(LV('sim_insts'))");
    std::vector<MapDump> dumps{{{"sim_insts", 10.0}}, {{"sim_insts", 5.0}}, {{"sim_insts", 7.0}}};
    EXPECT_EQ(run(*n, dumps), (std::vector<double>{10.0, 15.0, 22.0}));
    EXPECT_EQ(n->describe(), "Accumulate(FieldValue(\"sim_insts\"))");
}

TEST(ExpressionBuilderTest, KeywordArguments) {
    MapDump d;
    auto withDefault = build("LV('missing', default=1.5)");
    EXPECT_DOUBLE_EQ(withDefault->evaluate(d), 1.5);

    auto named = build("SlidingSum(param=LV('x'), length=2)");
    std::vector<MapDump> dumps{{{"x", 1.0}}, {{"x", 2.0}}, {{"x", 3.0}}};
    EXPECT_EQ(run(*named, dumps), (std::vector<double>{1.0, 3.0, 5.0}));

    auto mixed = build("AC(LV('x'), start=100)");
    EXPECT_DOUBLE_EQ(mixed->evaluate(dumps[0]), 101.0);
}

TEST(ExpressionBuilderTest, AliasesMatchFullNames) {
    std::vector<MapDump> dumps{{{"x", 1.0}}, {{"x", 2.0}}, {{"x", 4.0}}};
    const std::vector<std::pair<const char*, const char*>> pairs{
        {"AMean(LV('x'))", "ArithmeticMean(FieldValue('x'))"},
        {"GMean(LV('x'))", "GeometricMean(FieldValue('x'))"},
        {"HMean(LV('x'))", "HarmonicMean(FieldValue('x'))"},
        {"SlidingAMean(LV('x'), 2)", "SlidingArithmeticMean(FieldValue('x'), 2)"},
        {"SlidingGMean(LV('x'), 2)", "SlidingGeometricMean(FieldValue('x'), 2)"},
        {"SlidingHMean(LV('x'), 2)", "SlidingHarmonicMean(FieldValue('x'), 2)"},
    };
    for (const auto& [alias, full] : pairs) {
        auto a = build(alias);
        auto f = build(full);
        EXPECT_EQ(a->describe(), f->describe()) << alias;
        EXPECT_EQ(run(*a, dumps), run(*f, dumps)) << alias;
    }
}

TEST(ExpressionBuilderTest, IpcFromDump) {
    auto n = build("IPC('system.cpu')");
    MapDump d{{"system.cpu.committedInsts", 300.0}, {"system.cpu.numCycles", 600.0}};
    EXPECT_DOUBLE_EQ(n->evaluate(d), 0.5);
}

TEST(ExpressionBuilderTest, BinaryConstructorsByName) {
    auto n = build("Div(Add(1, 2), Constant(4))");
    MapDump d;
    EXPECT_DOUBLE_EQ(n->evaluate(d), 0.75);
}

TEST(ExpressionBuilderTest, UnknownNameFails) {
    EXPECT_THROW(build("Foo(LV('x'))"), BuildError);
    EXPECT_THROW(build("open('/etc/passwd')"), BuildError);
    EXPECT_EQ(errorOffset("1 + Nope(2)"), 4u);
}

TEST(ExpressionBuilderTest, ExtraNames) {
    Registry extra;
    extra.add("Twice", [](CallArgs& a) -> NodePtr {
        auto p = a.takeNode(0, "param");
        a.done();
        return std::move(p) * 2;
    });
    auto n = build("Twice(LV('x')) + 1", &extra);
    MapDump d{{"x", 3.0}};
    EXPECT_DOUBLE_EQ(n->evaluate(d), 7.0);

    EXPECT_THROW(build("Twice(LV('x'))"), BuildError);
}

TEST(ExpressionBuilderTest, ExtraNamesShadowDefaults) {
    Registry extra;
    extra.add("LV", [](CallArgs& a) -> NodePtr {
        a.takeString(0, "attr");
        a.done();
        return std::make_unique<Constant>(42.0);
    });
    auto n = build("LV('x')", &extra);
    MapDump d;
    EXPECT_DOUBLE_EQ(n->evaluate(d), 42.0);
}

TEST(ExpressionBuilderTest, CustomRegistryOnly) {
    Registry only;
    only.add("One", [](CallArgs& a) -> NodePtr { a.done(); return std::make_unique<Constant>(1.0); });
    ExpressionBuilder b(only);
    MapDump d;
    EXPECT_DOUBLE_EQ(b.build("One() + One()")->evaluate(d), 2.0);
    EXPECT_THROW(b.build("LV('x')"), BuildError);
}

TEST(ExpressionBuilderTest, SyntaxErrors) {
    EXPECT_THROW(build(""), BuildError);
    EXPECT_THROW(build("   "), BuildError);
    EXPECT_THROW(build("1 +"), BuildError);
    EXPECT_THROW(build("(1 + 2"), BuildError);
    EXPECT_THROW(build("1 2"), BuildError);
    EXPECT_THROW(build("LV"), BuildError);
    EXPECT_THROW(build("LV('x'"), BuildError);
    EXPECT_THROW(build("AC(start=1, LV('x'))"), BuildError);
    EXPECT_THROW(build("LV('x', default=1, default=2)"), BuildError);
    EXPECT_THROW(build("SlidingSum(LV('x'), 0)"), BuildError);
    EXPECT_THROW(build("SlidingSum(LV('x'), 1.5)"), BuildError);
    EXPECT_THROW(build("LV(1)"), BuildError);
    EXPECT_THROW(build("Constant(1, 2)"), BuildError);
    EXPECT_EQ(errorOffset("1 + * 2"), 4u);
    EXPECT_EQ(errorOffset("LV('x') )"), 8u);
}

TEST(ExpressionBuilderTest, DeepNestingIsBuildError) {
    const std::string parens = std::string(200000, '(') + "1" + std::string(200000, ')');
    EXPECT_THROW(build(parens), BuildError);

    std::string calls;
    for (int i = 0; i < 100000; ++i) calls += "AC(";
    calls += "1";
    for (int i = 0; i < 100000; ++i) calls += ")";
    EXPECT_THROW(build(calls), BuildError);

    EXPECT_THROW(build(std::string(200000, '-') + "1"), BuildError);

    const std::string moderate = std::string(50, '(') + "2" + std::string(50, ')');
    MapDump d;
    EXPECT_DOUBLE_EQ(build(moderate)->evaluate(d), 2.0);
}

TEST(ExpressionBuilderTest, TryBuild) {
    ExpressionBuilder b;
    auto ok = b.tryBuild("AC(LV('x'))");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value()->describe(), "Accumulate(FieldValue(\"x\"))");

    auto bad = b.tryBuild("AC(Bogus(1))");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().where, 3u);
    EXPECT_NE(bad.error().message.find("Bogus"), std::string::npos);
    EXPECT_EQ(bad.error().describe().rfind("3: ", 0), 0u);
}

TEST(ExpressionBuilderTest, BuiltTreesAreIndependent) {
    auto a = build("AC(LV('x'))");
    auto b = build("AC(LV('x'))");
    MapDump d{{"x", 1.0}};
    a->evaluate(d);
    a->evaluate(d);
    EXPECT_DOUBLE_EQ(b->evaluate(d), 1.0);
}
