// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_ESTIMATE_RESULT_H
#define __MKC_RESAMPLING_ESTIMATE_RESULT_H 1

#include <cstddef>

namespace mkc_resampling
{
  /**
   * @brief Outcome of one jackknife, bootstrap or subsampling run.
   *
   * estimate and standardError are the answer; the remaining members are
   * diagnostics describing how the estimate was formed.
   */
  struct EstimateResult
  {
    double      estimate;         // point estimate (bias-corrected where the method corrects)
    double      standardError;    // always >= 0
    double      fullStatistic;    // functional on the original sample
    double      replicateMean;    // mean of the functional over the resample set
    double      biasEstimate;     // bias the method attributes to fullStatistic
    std::size_t n;                // sample size
    std::size_t numResamples;     // size of the resample set
  };
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_ESTIMATE_RESULT_H
