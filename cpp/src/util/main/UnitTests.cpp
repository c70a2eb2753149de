#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/CppUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

TEST(Random, uniform_sample) {
  util::Random::set_seed(1);

  constexpr int N = 10000;
  std::array<int, 5> counts = {};
  for (int i = 0; i < N; ++i) {
    int x = util::Random::uniform_sample(3, 8);
    ASSERT_GE(x, 3);
    ASSERT_LT(x, 8);
    counts[x - 3]++;
  }
  for (int c : counts) {
    double pct = c * 1.0 / N;
    EXPECT_LT(std::abs(pct - 0.2), 0.02);
  }
}

TEST(Random, uniform_sample_invalid_range) {
  EXPECT_THROW(util::Random::uniform_sample(5, 5), util::Exception);
  EXPECT_THROW(util::Random::uniform_sample(6, 2), util::Exception);
}

TEST(Random, choose) {
  util::Random::set_seed(1);

  std::vector<std::string> v = {"a", "b", "c"};
  using count_map_t = std::map<std::string, int>;
  count_map_t counts;

  constexpr int N = 3000;
  for (int i = 0; i < N; ++i) {
    counts[util::Random::choose(v.begin(), v.end())]++;
  }
  EXPECT_EQ(counts.size(), 3u);
  for (const auto& [s, c] : counts) {
    EXPECT_GT(c, N / 4) << s;
  }
}

TEST(Random, set_seed_is_reproducible) {
  std::vector<int> a;
  std::vector<int> b;

  util::Random::set_seed(7);
  for (int i = 0; i < 20; ++i) a.push_back(util::Random::uniform_sample(0, 1000));
  util::Random::set_seed(7);
  for (int i = 0; i < 20; ++i) b.push_back(util::Random::uniform_sample(0, 1000));

  EXPECT_EQ(a, b);
}

TEST(Exception, format) {
  util::Exception e("x={} y={}", 3, "four");
  EXPECT_STREQ(e.what(), "x=3 y=four");

  util::CleanException ce("bad value: {}", 1.5);
  EXPECT_STREQ(ce.what(), "bad value: 1.5");
}

TEST(Asserts, release_assert) {
  EXPECT_NO_THROW(RELEASE_ASSERT(1 + 1 == 2));
  EXPECT_THROW(RELEASE_ASSERT(1 + 1 == 3), util::ReleaseAssertionError);

  try {
    int x = 4;
    RELEASE_ASSERT(x < 3, "x={}", x);
    FAIL() << "expected a throw";
  } catch (const util::ReleaseAssertionError& e) {
    std::string what = e.what();
    EXPECT_NE(what.find("RELEASE_ASSERT failed: x=4"), std::string::npos) << what;
  }
}

TEST(Asserts, clean_assert) {
  EXPECT_THROW(CLEAN_ASSERT(false, "oops"), util::CleanAssertionError);
  EXPECT_THROW(CLEAN_ASSERT(false), util::CleanException);
  EXPECT_NO_THROW(CLEAN_ASSERT(2 > 1, "n={}", 2));

  try {
    CLEAN_ASSERT(1 > 2, "n={}", 1);
    FAIL() << "expected a throw";
  } catch (const util::CleanException& e) {
    std::string what = e.what();
    EXPECT_NE(what.find("n=1"), std::string::npos) << what;
  }
}

TEST(CppUtil, seconds_since) {
  auto start = std::chrono::steady_clock::now();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  double elapsed = util::seconds_since(start);
  EXPECT_GE(elapsed, 0.02);
  EXPECT_LT(elapsed, 5.0);
}

TEST(CppUtil, string_literal_sequences) {
  using S = util::StringLiteralSequence<"time-limit", "node-limit">;
  using T = util::StringLiteralSequence<"debug">;

  static_assert(util::string_literal_sequence_contains_v<S, "node-limit">);
  static_assert(!util::string_literal_sequence_contains_v<S, "debug">);
  static_assert(util::no_overlap_v<S, T>);
  static_assert(!util::no_overlap_v<S, util::concat_string_literal_sequence_t<S, T>>);

  using I = util::int_sequence<'h', 't'>;
  static_assert(util::int_sequence_contains_v<I, 't'>);
  static_assert(util::no_overlap_v<I, util::int_sequence<'D'>>);
  static_assert(std::is_same_v<util::concat_int_sequence_t<I, util::int_sequence<'D'>>,
                               util::int_sequence<'h', 't', 'D'>>);
  SUCCEED();
}

TEST(Logging, parse_level) {
  EXPECT_EQ(util::Logging::parse_level("trace"), spdlog::level::trace);
  EXPECT_EQ(util::Logging::parse_level("warn"), spdlog::level::warn);
  EXPECT_EQ(util::Logging::parse_level("error"), spdlog::level::err);
  EXPECT_EQ(util::Logging::parse_level("off"), spdlog::level::off);
  EXPECT_THROW(util::Logging::parse_level("warning"), util::CleanException);
  EXPECT_THROW(util::Logging::parse_level("INFO"), util::CleanException);
}

struct TestParams {
  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Test options");
    return desc
      .template add_option<"count", 'c'>(po::value<int>(&count)->default_value(count), "count")
      .template add_option<"ratio">(po2::default_value("{:.2f}", &ratio), "ratio")
      .template add_flag<"verbose", "quiet">(&verbose, "verbose", "quiet");
  }

  int count = 1;
  double ratio = 0.5;
  bool verbose = false;
};

TEST(BoostUtil, parse_args) {
  namespace po2 = boost_util::program_options;

  TestParams params;
  auto desc = params.make_options_description();

  std::vector<std::string> args = {"-c", "7", "--ratio", "0.25", "--verbose"};
  po2::parse_args(desc, args);

  EXPECT_EQ(params.count, 7);
  EXPECT_DOUBLE_EQ(params.ratio, 0.25);
  EXPECT_TRUE(params.verbose);
}

TEST(BoostUtil, parse_args_defaults) {
  namespace po2 = boost_util::program_options;

  TestParams params;
  params.verbose = true;
  auto desc = params.make_options_description();

  std::vector<std::string> args = {"--quiet"};
  po2::parse_args(desc, args);

  EXPECT_EQ(params.count, 1);
  EXPECT_DOUBLE_EQ(params.ratio, 0.5);
  EXPECT_FALSE(params.verbose);
}

TEST(BoostUtil, parse_args_error) {
  namespace po2 = boost_util::program_options;

  TestParams params;
  auto desc = params.make_options_description();

  std::vector<std::string> unknown = {"--no-such-option"};
  EXPECT_THROW(po2::parse_args(desc, unknown), util::CleanException);

  std::vector<std::string> bad_value = {"--count", "seven"};
  EXPECT_THROW(po2::parse_args(desc, bad_value), util::CleanException);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
