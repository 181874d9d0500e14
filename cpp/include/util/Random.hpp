#pragma once

#include <concepts>
#include <random>

/*
 * A wrapper around STL's random machinery.
 *
 * default_prng() is seeded from the current time unless a seed is set.
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
 * uniform_sample() takes the prng to draw from: either default_prng(), or an independent prng,
 * which the tests use to generate reproducible random positions.
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
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  static std::mt19937& default_prng();
};

}  // namespace util

#include "inline/util/Random.inl"
