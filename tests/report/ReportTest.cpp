#include "statexpr/Report.hpp"
#include "statexpr/Errors.hpp"
#include "statexpr/nodes/Leaf.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace statexpr;

namespace {

std::vector<MapDump> insts(const std::vector<double>& xs) {
    std::vector<MapDump> out;
    for (double x : xs) out.push_back(MapDump{{"sim_insts", x}});
    return out;
}

ReportOptions noHeader() {
    ReportOptions o;
    o.header = false;
    return o;
}

} // namespace

TEST(ReportTest, OneLinePerDump) {
    auto dumps = insts({10, 5, 7});
    Report r({"AC(LV('sim_insts'))", "LV('sim_insts') * 2"}, noHeader());
    std::ostringstream out;
    auto stats = r.run(rangeSource(dumps), out);
    EXPECT_EQ(out.str(), "10:20\n15:10\n22:14\n");
    EXPECT_EQ(stats.rows, 3u);
    EXPECT_EQ(stats.skipped, 0u);
}

TEST(ReportTest, Header) {
    Report r({"AC(LV('sim_insts'))", "IPC('cpu')"});
    std::ostringstream out;
    r.writeHeader(out);
    EXPECT_EQ(out.str(), "# 0: Accumulate(FieldValue(\"sim_insts\"))\n# 1: IPC(\"cpu\")\n");
}

TEST(ReportTest, SeparatorAndLastOnly) {
    auto dumps = insts({1, 2, 3});
    ReportOptions o = noHeader();
    o.separator = ",";
    o.lastOnly = true;
    Report r({"AC(LV('sim_insts'))", "AMean(LV('sim_insts'))"}, o);
    std::ostringstream out;
    auto stats = r.run(rangeSource(dumps), out);
    EXPECT_EQ(out.str(), "6,2\n");
    EXPECT_EQ(stats.rows, 3u);
}

TEST(ReportTest, BatchesUseFirstDump) {
    auto dumps = insts({1, 2, 3, 4, 5});
    ReportOptions o = noHeader();
    o.window.step = 2;
    Report r({"AC(LV('sim_insts'))"}, o);
    std::ostringstream out;
    r.run(rangeSource(dumps), out);
    EXPECT_EQ(out.str(), "1\n4\n9\n");
}

TEST(ReportTest, WindowStartAndTrim) {
    auto dumps = insts({1, 2, 3, 4, 5});
    ReportOptions o = noHeader();
    o.window.start = 1;
    o.window.trim = 1;
    Report r({"LV('sim_insts')"}, o);
    std::ostringstream out;
    r.run(rangeSource(dumps), out);
    EXPECT_EQ(out.str(), "2\n3\n4\n");
}

TEST(ReportTest, AbortPropagates) {
    std::vector<MapDump> dumps{MapDump{{"sim_insts", 1.0}}, MapDump{}};
    Report r({"LV('sim_insts')"}, noHeader());
    std::ostringstream out;
    EXPECT_THROW(r.run(rangeSource(dumps), out), FieldNotFound);
    EXPECT_EQ(out.str(), "1\n");
}

TEST(ReportTest, SkipPolicy) {
    std::vector<MapDump> dumps{MapDump{{"x", 1.0}, {"y", 2.0}},
                               MapDump{{"x", 1.0}, {"y", 0.0}},
                               MapDump{{"x", 3.0}, {"y", 1.0}}};
    ReportOptions o = noHeader();
    o.onError = ErrorPolicy::Skip;
    Report r({"LV('x') / LV('y')"}, o);
    std::ostringstream out;
    auto stats = r.run(rangeSource(dumps), out);
    EXPECT_EQ(out.str(), "0.5\n3\n");
    EXPECT_EQ(stats.rows, 2u);
    EXPECT_EQ(stats.skipped, 1u);
}

TEST(ReportTest, BadExpressionFailsBeforeReading) {
    EXPECT_THROW(Report({"AC(LV('x'))", "Nope(1)"}), BuildError);
    EXPECT_THROW(Report(std::vector<std::string>{}), ConfigError);

    ReportOptions o;
    o.window.step = 0;
    EXPECT_THROW(Report({"LV('x')"}, o), ConfigError);
}

TEST(ReportTest, UnknownNameConsumesNoRecords) {
    std::size_t pulls = 0;
    FunctionSource<MapDump> src([&pulls]() -> std::optional<MapDump> {
        ++pulls;
        return MapDump{{"x", 1.0}};
    });
    std::ostringstream out;
    auto report = [&] {
        Report r({"Unknown(LV('x'))"});
        r.run(std::move(src), out);
    };
    EXPECT_THROW(report(), BuildError);
    EXPECT_EQ(pulls, 0u);
    EXPECT_TRUE(out.str().empty());
}

TEST(ReportTest, ResetRestartsState) {
    auto dumps = insts({1, 2});
    Report r({"AC(LV('sim_insts'))"}, noHeader());
    std::ostringstream first, second, third;
    r.run(rangeSource(dumps), first);
    r.run(rangeSource(dumps), second);
    r.reset();
    r.run(rangeSource(dumps), third);
    EXPECT_EQ(first.str(), "1\n3\n");
    EXPECT_EQ(second.str(), "4\n6\n");
    EXPECT_EQ(third.str(), first.str());
}

TEST(ReportTest, OwnedDumps) {
    std::vector<std::shared_ptr<Dump>> dumps;
    dumps.push_back(std::make_shared<MapDump>(MapDump{{"sim_insts", 4.0}}));
    dumps.push_back(std::make_shared<MapDump>(MapDump{{"sim_insts", 6.0}}));
    Report r({"AMean(LV('sim_insts'))"}, noHeader());
    std::ostringstream out;
    r.run(rangeSource(dumps), out);
    EXPECT_EQ(out.str(), "4\n5\n");
}

TEST(ReportTest, StdoutHoldsOnlyReport) {
    std::vector<MapDump> dumps{MapDump{{"x", 1.0}}, MapDump{}, MapDump{{"x", 2.0}}};
    ReportOptions o;
    o.onError = ErrorPolicy::Skip;
    Report r({"LV('x')"}, o);

    ::testing::internal::CaptureStdout();
    r.run(rangeSource(dumps), std::cout);
    std::cout.flush();
    const std::string out = ::testing::internal::GetCapturedStdout();
    EXPECT_EQ(out, "# 0: FieldValue(\"x\")\n1\n2\n");
}

TEST(ReportTest, ParseErrorPolicy) {
    EXPECT_EQ(parseErrorPolicy("abort"), ErrorPolicy::Abort);
    EXPECT_EQ(parseErrorPolicy("skip"), ErrorPolicy::Skip);
    EXPECT_THROW(parseErrorPolicy("ignore"), ConfigError);
}
