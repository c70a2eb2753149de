#pragma once

#include <concepts>
#include <iterator>
#include <random>

/*
 * A wrapper around STL's random machinery.
 *
 * To use with a timer-based seed, just directly use any of the functions, such as
 * util::Random::uniform_sample().
 *
 * To initialize with a specific seed, first call:
 *
 * util::Random::set_seed(seed);
 *
 * To add a cmdline option to set the seed, do:
 *
 * util::Random::Params random_params;
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description raw_desc("General options");
 * auto desc = raw_desc.add(random_params.make_options_description());
 * po2::parse_args(desc, ac, av);
 *
 * util::Random::init(random_params);
 *
 * Each of the random functions in this class has 2 variants: one that accepts a std::mt19937
 * reference as the first argument, and one that doesn't. The latter uses the default prng
 * (controlled by the seed set above).
 */
namespace util {

class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  static void init(const Params&);

  static void set_seed(int seed);

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper).
   *
   * T and U should be integral types, and lower must be less than upper.
   *
   * Uses prng as the random number generator.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper).
   *
   * Uses the default prng.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(T lower, U upper);

  /*
   * Returns a uniformly chosen element of the non-empty random-access range [begin, end).
   */
  template <std::random_access_iterator T>
  static auto choose(std::mt19937& prng, T begin, T end);

  template <std::random_access_iterator T>
  static auto choose(T begin, T end);

  static std::mt19937& default_prng();
};

}  // namespace util

#include "inline/util/Random.inl"
