#include <gtest/gtest.h>
#include "pipeline.hpp"
#include "oracle.hpp"
#include "toolchain.hpp"
#include "test_helpers.hpp"

#include <sstream>

#include <llvm/Support/Program.h>

namespace {

using namespace pc;
using namespace pc::test_support;

// Runs the real Go toolchain when one is installed.
TEST(GoIntegrationTest, MatchesGoConversionRules) {
  if (!llvm::sys::findProgramByName("go"))
    GTEST_SKIP() << "go is not on PATH";

  temp_directory dir;
  auto catalog = type_catalog::go_primitives();
  diagnostic_collector diags;

  pipeline_options options;
  options.output_path = dir.file("output/conversions.go");

  llvm_process_runner runner;
  compiler_oracle oracle(toolchain_options(), runner, diags);
  pipeline p(catalog, oracle, diags, options);

  std::ostringstream output;
  ASSERT_TRUE(p.run(output));
  ASSERT_TRUE(p.rejected().has_value());

  auto& failures = *p.rejected();
  catalog.for_each_pair([&] (const conversion_pair& pair) {
    EXPECT_EQ(go_accepts(pair.from, pair.to), is_convertible(failures, pair)) << pair.from << " -> " << pair.to;
  });
}

}
