#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/CppUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"
#include "util/Rendering.hpp"

#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <array>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#ifndef MIT_TEST_MODE
static_assert(false, "MIT_TEST_MODE macro must be defined for unit tests");
#endif

namespace {

struct TestParams {
  int count = 3;
  double ratio = 0.25;
  bool enabled = true;
  std::string label;

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Test options");

    return desc.template add_option<"count", 'n'>(po::value<int>(&count)->default_value(count),
                                                  "count")
      .template add_option<"ratio">(po2::default_value("{:.2f}", &ratio), "ratio")
      .template add_flag<"enabled", "disabled">(&enabled, "enable", "disable")
      .template add_hidden_option<"label">(po::value<std::string>(&label), "hidden label");
  }
};

}  // namespace

TEST(Random, uniform_sample) {
  std::mt19937 prng(1);
  std::array<int, 7> counts = {};

  constexpr int N = 7000;
  for (int i = 0; i < N; ++i) {
    int x = util::Random::uniform_sample(prng, 0, 7);
    ASSERT_GE(x, 0);
    ASSERT_LT(x, 7);
    counts[x]++;
  }
  for (int c : counts) {
    EXPECT_GT(c, N / 7 / 2);
  }

  EXPECT_EQ(util::Random::uniform_sample(prng, 4, 5), 4);
  EXPECT_THROW(util::Random::uniform_sample(prng, 3, 3), util::Exception);
  EXPECT_THROW(util::Random::uniform_sample(prng, 5, 2), util::Exception);
}

TEST(Random, set_seed) {
  std::mt19937& prng = util::Random::default_prng();

  util::Random::set_seed(17);
  std::vector<int> a;
  for (int i = 0; i < 20; ++i) a.push_back(util::Random::uniform_sample(prng, 0, 1000));

  util::Random::set_seed(17);
  std::vector<int> b;
  for (int i = 0; i < 20; ++i) b.push_back(util::Random::uniform_sample(prng, 0, 1000));

  EXPECT_EQ(a, b);
}

TEST(BoostUtil, parse_args) {
  namespace po2 = boost_util::program_options;

  TestParams params;
  std::vector<std::string> args = {"-n", "9", "--ratio", "0.5", "--disabled", "--label", "x"};
  auto vm = po2::parse_args(params.make_options_description(), args);

  EXPECT_EQ(params.count, 9);
  EXPECT_DOUBLE_EQ(params.ratio, 0.5);
  EXPECT_FALSE(params.enabled);
  EXPECT_EQ(params.label, "x");
  EXPECT_TRUE(vm.count("count"));
}

TEST(BoostUtil, defaults) {
  namespace po2 = boost_util::program_options;

  TestParams params;
  std::vector<std::string> args;
  po2::parse_args(params.make_options_description(), args);

  EXPECT_EQ(params.count, 3);
  EXPECT_DOUBLE_EQ(params.ratio, 0.25);
  EXPECT_TRUE(params.enabled);
  EXPECT_TRUE(params.label.empty());
}

TEST(BoostUtil, bad_args) {
  namespace po2 = boost_util::program_options;

  TestParams params;
  std::vector<std::string> unknown = {"--bogus"};
  EXPECT_THROW(po2::parse_args(params.make_options_description(), unknown),
               util::CleanException);

  TestParams params2;
  std::vector<std::string> malformed = {"--count", "many"};
  EXPECT_THROW(po2::parse_args(params2.make_options_description(), malformed),
               util::CleanException);
}

TEST(BoostUtil, help) {
  namespace po2 = boost_util::program_options;

  TestParams params;
  auto desc = params.make_options_description();

  po2::Settings::help_full = false;
  std::ostringstream brief;
  brief << desc;
  EXPECT_NE(brief.str().find("--ratio"), std::string::npos);
  EXPECT_NE(brief.str().find("0.25"), std::string::npos);
  EXPECT_NE(brief.str().find("--disabled"), std::string::npos);
  EXPECT_EQ(brief.str().find("--enabled"), std::string::npos);
  EXPECT_EQ(brief.str().find("--label"), std::string::npos);

  po2::Settings::help_full = true;
  std::ostringstream full;
  full << desc;
  EXPECT_NE(full.str().find("--enabled"), std::string::npos);
  EXPECT_NE(full.str().find("--label"), std::string::npos);
  po2::Settings::help_full = false;
}

TEST(Asserts, release_assert) {
  EXPECT_NO_THROW(RELEASE_ASSERT(1 + 1 == 2));
  EXPECT_THROW(RELEASE_ASSERT(1 + 1 == 3), util::ReleaseAssertionError);

  try {
    int x = 5;
    RELEASE_ASSERT(x < 0, "x={}", x);
    FAIL() << "expected throw";
  } catch (const util::ReleaseAssertionError& e) {
    std::string what = e.what();
    EXPECT_NE(what.find("RELEASE_ASSERT failed: x=5"), std::string::npos) << what;
  }
}

TEST(Asserts, clean_assert) {
  EXPECT_THROW(CLEAN_ASSERT(false, "bad input {}", "foo"), util::CleanException);
  EXPECT_THROW(CLEAN_ASSERT(false), util::CleanAssertionError);
  EXPECT_NO_THROW(CLEAN_ASSERT(true, "fine"));
}

TEST(Exceptions, format) {
  util::Exception e("{} + {} = {}", 1, 2, 3);
  EXPECT_STREQ(e.what(), "1 + 2 = 3");

  util::CleanException c("plain");
  EXPECT_STREQ(c.what(), "plain");
}

TEST(Rendering, set) {
  util::Rendering::set(util::Rendering::kTerminal);
  EXPECT_EQ(util::Rendering::mode(), util::Rendering::kTerminal);
  util::Rendering::set(util::Rendering::kText);
  EXPECT_EQ(util::Rendering::mode(), util::Rendering::kText);
}

TEST(CppUtil, string_literal_sequence) {
  using Seq = util::StringLiteralSequence<"a", "bc">;
  static_assert(util::string_literal_sequence_contains_v<Seq, "bc">);
  static_assert(!util::string_literal_sequence_contains_v<Seq, "b">);
  static_assert(util::no_overlap_v<Seq, util::StringLiteralSequence<"d">>);
  static_assert(!util::no_overlap_v<Seq, util::StringLiteralSequence<"a">>);

  static_assert(util::int_sequence_contains_v<util::int_sequence<1, 2, 3>, 2>);
  static_assert(!util::int_sequence_contains_v<util::int_sequence<1, 2, 3>, 4>);

}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
