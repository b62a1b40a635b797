// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_H
#define __MKC_RESAMPLING_H 1

#include <cstddef>
#include <utility>
#include <vector>

#include "BootstrapEstimator.h"
#include "EstimateResult.h"
#include "Functionals.h"
#include "JackknifeEstimator.h"
#include "ResamplingConstants.h"
#include "ResamplingMethod.h"
#include "SubsamplingEstimator.h"

namespace mkc_resampling
{
  // Convenience entry points for the common case of a scalar sample

  using ScalarSample = std::vector<double>;
  using ScalarStatFn = FunctionalApplicator<double>::StatFn;

  inline EstimateResult jackknife(const ScalarSample& sample, ScalarStatFn functional)
  {
    return JackknifeEstimator<double>().run(sample, std::move(functional));
  }

  template <class Rng>
  EstimateResult bootstrap(const ScalarSample& sample,
			   ScalarStatFn functional,
			   std::size_t numResamples,
			   Rng& randomSource)
  {
    return BootstrapEstimator<double>(numResamples).run(sample, std::move(functional), randomSource);
  }

  template <class Rng>
  EstimateResult bootstrap(const ScalarSample& sample, ScalarStatFn functional, Rng& randomSource)
  {
    return bootstrap(sample, std::move(functional),
		     ResamplingConstants::kDefaultNumResamples, randomSource);
  }

  inline EstimateResult subsample(const ScalarSample& sample, ScalarStatFn functional, std::size_t blockSize)
  {
    return SubsamplingEstimator<double>(blockSize).run(sample, std::move(functional));
  }
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_H
