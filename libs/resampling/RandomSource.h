// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_RANDOM_SOURCE_H
#define __MKC_RESAMPLING_RANDOM_SOURCE_H 1

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <random>
#include <utility>
#include <array>

#include "randutils.hpp"
#include "ResamplingException.h"

/**
 * @file RandomSource.h
 * @brief Adapts an injected random engine to the draws the estimators need.
 *
 * The bootstrap never owns global random state. Callers pass either a plain
 * UniformRandomBitGenerator (std::mt19937_64, std::minstd_rand, ...) or a
 * randutils-style wrapper exposing engine(). Everything below works through
 * get_engine() so both kinds behave the same way.
 */
namespace mkc_resampling
{
  namespace rng
  {
    using DefaultRandomSource = randutils::mt19937_rng;

    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>>
      : std::true_type {};

    /// The UniformRandomBitGenerator behind @p rng (the object itself for std engines)
    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
	return rng.engine();
      else
	return rng;
    }

    /**
     * @brief Uniform index in [0, hiExclusive).
     *
     * Uses std::uniform_int_distribution on the underlying engine so there is
     * no modulo bias regardless of the engine's word size.
     *
     * @throws InvalidParameterException if hiExclusive == 0
     */
    template <typename Rng>
    inline std::size_t draw_index(Rng& rng, std::size_t hiExclusive)
    {
      if (hiExclusive == 0)
	throw InvalidParameterException("draw_index: cannot draw from an empty range");

      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(get_engine(rng));
    }

    // SplitMix64 finaliser
    inline std::uint64_t splitmix64(std::uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    /**
     * @brief Build an engine of type @p Engine seeded deterministically from a
     * 64-bit value.
     *
     * The 64-bit value is split into 32-bit words and passed through
     * randutils::seed_seq_fe128 so that nearby seeds give unrelated streams.
     * Works for std engines and for randutils::random_generator wrappers.
     */
    template <class Engine = DefaultRandomSource>
    inline Engine make_seeded_engine(std::uint64_t seed)
    {
      const std::uint64_t mixed = splitmix64(seed);
      std::array<std::uint32_t, 4> words = {
	static_cast<std::uint32_t>(seed),
	static_cast<std::uint32_t>(seed >> 32),
	static_cast<std::uint32_t>(mixed),
	static_cast<std::uint32_t>(mixed >> 32)
      };

      randutils::seed_seq_fe128 seq(words.begin(), words.end());
      return Engine(seq);
    }

    /**
     * @brief Hands out one independent engine per bootstrap replicate.
     *
     * Replicate b always receives the same engine for a given master seed, so a
     * bootstrap run does not depend on the order or the thread in which its
     * replicates are evaluated.
     */
    template <class Engine = DefaultRandomSource>
    class ReplicateEngineProvider
    {
    public:
      using engine_type = Engine;

      explicit ReplicateEngineProvider(std::uint64_t masterSeed,
				       std::uint64_t streamTag = 0)
	: mMasterSeed(masterSeed),
	  mStreamTag(streamTag)
      {}

      /// A provider for an unrelated stream under the same master seed
      ReplicateEngineProvider withStream(std::uint64_t streamTag) const
      {
	return ReplicateEngineProvider(mMasterSeed, streamTag);
      }

      Engine make_engine(std::size_t replicate) const
      {
	return make_seeded_engine<Engine>(seedFor(replicate));
      }

      std::uint64_t seedFor(std::size_t replicate) const
      {
	std::uint64_t h = splitmix64(mMasterSeed ^ 0x6a09e667f3bcc909ull);
	h = splitmix64(h ^ mStreamTag);
	return splitmix64(h ^ static_cast<std::uint64_t>(replicate));
      }

      std::uint64_t getMasterSeed() const noexcept
      {
	return mMasterSeed;
      }

      std::uint64_t getStreamTag() const noexcept
      {
	return mStreamTag;
      }

    private:
      std::uint64_t mMasterSeed;
      std::uint64_t mStreamTag;
    };
  } // namespace rng
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_RANDOM_SOURCE_H
