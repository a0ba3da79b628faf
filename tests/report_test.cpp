#include <gtest/gtest.h>
#include "report.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

#include <sstream>
#include <chrono>

namespace {

using namespace pc;
using namespace pc::test_support;

TEST(ReportTest, VerdictLines) {
  auto catalog = type_catalog::go_primitives();
  report_writer writer(catalog, { });

  EXPECT_EQ("      bool -> uint8      ❌", writer.verdict_line({ "bool", "uint8" }, false));
  EXPECT_EQ("complex128 -> complex64  ✅", writer.verdict_line({ "complex128", "complex64" }, true));
  EXPECT_EQ("---------- converting rune values ----------", writer.section_header("rune"));

  report_writer ascii(catalog, { true });
  EXPECT_EQ("      rune -> string     yes", ascii.verdict_line({ "rune", "string" }, true));
  EXPECT_EQ("    string -> rune       no", ascii.verdict_line({ "string", "rune" }, false));
}

TEST(ReportTest, MatrixLayout) {
  diagnostic_collector diags;
  auto catalog = type_catalog::from_names({ "int", "string", "bool" }, diags);
  failure_set failures;
  failures.add({ { "string", "int" }, { } });

  report_writer writer(catalog, { true });
  std::ostringstream stream;
  writer.write_matrix(stream, failures);

  auto lines = utils::split_lines(stream.str());
  ASSERT_EQ(12u, lines.size());
  EXPECT_EQ("---------- converting int values ----------", lines[0]);
  EXPECT_EQ("       int -> int        yes", lines[1]);
  EXPECT_EQ("       int -> string     yes", lines[2]);
  EXPECT_EQ("       int -> bool       yes", lines[3]);
  EXPECT_EQ("---------- converting string values ----------", lines[4]);
  EXPECT_EQ("    string -> int        no", lines[5]);
  EXPECT_EQ("    string -> string     yes", lines[6]);
  EXPECT_EQ("---------- converting bool values ----------", lines[8]);
  EXPECT_EQ("      bool -> bool       yes", lines[11]);
}

TEST(ReportTest, FullCatalogLineCount) {
  auto catalog = type_catalog::go_primitives();
  report_writer writer(catalog, { });
  std::ostringstream stream;
  writer.write_matrix(stream, failure_set());

  EXPECT_EQ(19u + 361u, utils::split_lines(stream.str()).size());
  EXPECT_EQ(std::string::npos, stream.str().find("❌"));
}

TEST(ReportTest, Summary) {
  auto catalog = type_catalog::go_primitives();
  failure_set failures;
  failures.add({ { "string", "int" }, { } });
  failures.add({ { "string", "int" }, { } });
  failures.add({ { "bool", "int" }, { } });

  report_writer writer(catalog, { });
  std::ostringstream stream;
  writer.write_summary(stream, failures);

  EXPECT_EQ("359 of 361 conversions are valid\n", stream.str());
}

TEST(ReportTest, Durations) {
  using namespace std::chrono;

  EXPECT_EQ("250us", format_duration(microseconds(250)));
  EXPECT_EQ("12.500ms", format_duration(microseconds(12500)));
  EXPECT_EQ("1.250s", format_duration(milliseconds(1250)));

  auto catalog = type_catalog::go_primitives();
  report_writer writer(catalog, { });
  std::ostringstream stream;
  writer.write_duration(stream, milliseconds(3));
  EXPECT_EQ("execution took 3.000ms\n", stream.str());
}

}
