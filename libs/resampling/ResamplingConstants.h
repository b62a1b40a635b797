// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <cstddef>
#include <cstdint>

namespace mkc_resampling
{
  namespace ResamplingConstants
  {
    /// Bootstrap draw count used when the caller does not give one
    constexpr std::size_t kDefaultNumResamples = 1000;

    /// Smallest sample any of the estimators accepts
    constexpr std::size_t kMinSampleSize = 2;

    /// A variance needs at least two replicate statistics
    constexpr std::size_t kMinReplicates = 2;

    /// Seed used by the command-line tool when --seed is not given
    constexpr std::uint64_t kDefaultSeed = 0x5eed5eed12345678ull;

    /// Upper bound on --threads, per hardware thread
    constexpr std::size_t kMaxThreadsPerCore = 4;

    constexpr const char* kDefaultMethodName     = "jackknife";
    constexpr const char* kDefaultFunctionalName = "mean";
  } // namespace ResamplingConstants
} // namespace mkc_resampling
