// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_METHOD_H
#define __MKC_RESAMPLING_METHOD_H 1

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "BootstrapEstimator.h"
#include "EstimateResult.h"
#include "JackknifeEstimator.h"
#include "ParallelExecutors.h"
#include "RandomSource.h"
#include "ResamplingConstants.h"
#include "ResamplingException.h"
#include "SubsamplingEstimator.h"

namespace mkc_resampling
{
  enum class ResamplingMethod
    {
      Jackknife,
      Bootstrap,
      Subsampling
    };

  /**
   * @brief Method from its name, ignoring case and surrounding blanks.
   *
   * Accepts "jackknife", "bootstrap", "subsample" and "subsampling".
   *
   * @throws InvalidParameterException for any other name.
   */
  inline ResamplingMethod parseResamplingMethod(const std::string& name)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));

    if (key == "jackknife")
      return ResamplingMethod::Jackknife;
    if (key == "bootstrap")
      return ResamplingMethod::Bootstrap;
    if (key == "subsample" || key == "subsampling")
      return ResamplingMethod::Subsampling;

    throw InvalidParameterException("Unknown resampling method '" + name
				    + "' (expected jackknife, bootstrap or subsampling)");
  }

  inline std::string toString(ResamplingMethod method)
  {
    switch (method)
      {
      case ResamplingMethod::Jackknife:
	return "jackknife";
      case ResamplingMethod::Bootstrap:
	return "bootstrap";
      case ResamplingMethod::Subsampling:
	return "subsampling";
      }

    throw InvalidParameterException("toString: unrecognised ResamplingMethod value");
  }

  /**
   * @brief Everything needed to run one of the three methods.
   *
   * numResamples is used by the bootstrap only, blockSize by subsampling only.
   * numThreads > 1 spreads the bootstrap over a BoostThreadPoolExecutor; the
   * result is the same for every thread count because each replicate gets its
   * own engine derived from seed.
   */
  struct EstimatorOptions
  {
    ResamplingMethod    method       = ResamplingMethod::Jackknife;
    std::size_t         numResamples = ResamplingConstants::kDefaultNumResamples;
    std::size_t         blockSize    = 0;
    std::uint64_t       seed         = ResamplingConstants::kDefaultSeed;
    std::size_t         numThreads   = 1;
    SubsamplingVariance subsamplingVariance = SubsamplingVariance::Summed;
  };

  /**
   * @brief The replicate statistics the selected method would combine.
   *
   * Uses the same options as estimateWithMethod, so the values are the ones
   * behind its estimate (the bootstrap draws come from the same seed).
   */
  template <class Observation>
  std::vector<double>
  replicatesWithMethod(const EstimatorOptions& options,
		       const std::vector<Observation>& sample,
		       typename FunctionalApplicator<Observation>::StatFn functional)
  {
    switch (options.method)
      {
      case ResamplingMethod::Jackknife:
	return JackknifeEstimator<Observation>().replicates(sample, std::move(functional));

      case ResamplingMethod::Bootstrap:
	{
	  const rng::ReplicateEngineProvider<> provider(options.seed);

	  if (options.numThreads > 1)
	    {
	      using Pool = concurrency::BoostThreadPoolExecutor;
	      BootstrapEstimator<Observation, Pool> estimator(options.numResamples,
							      std::make_shared<Pool>(options.numThreads));
	      return estimator.replicatesWithProvider(sample, std::move(functional), provider);
	    }

	  BootstrapEstimator<Observation> estimator(options.numResamples);
	  return estimator.replicatesWithProvider(sample, std::move(functional), provider);
	}

      case ResamplingMethod::Subsampling:
	return SubsamplingEstimator<Observation>(options.blockSize, options.subsamplingVariance)
	  .replicates(sample, std::move(functional));
      }

    throw InvalidParameterException("replicatesWithMethod: unrecognised ResamplingMethod value");
  }

  template <class Observation>
  EstimateResult
  estimateWithMethod(const EstimatorOptions& options,
		     const std::vector<Observation>& sample,
		     typename FunctionalApplicator<Observation>::StatFn functional)
  {
    switch (options.method)
      {
      case ResamplingMethod::Jackknife:
	return JackknifeEstimator<Observation>().run(sample, std::move(functional));

      case ResamplingMethod::Bootstrap:
	{
	  const rng::ReplicateEngineProvider<> provider(options.seed);

	  if (options.numThreads > 1)
	    {
	      using Pool = concurrency::BoostThreadPoolExecutor;
	      BootstrapEstimator<Observation, Pool> estimator(options.numResamples,
							      std::make_shared<Pool>(options.numThreads));
	      return estimator.runWithProvider(sample, std::move(functional), provider);
	    }

	  BootstrapEstimator<Observation> estimator(options.numResamples);
	  return estimator.runWithProvider(sample, std::move(functional), provider);
	}

      case ResamplingMethod::Subsampling:
	return SubsamplingEstimator<Observation>(options.blockSize, options.subsamplingVariance)
	  .run(sample, std::move(functional));
      }

    throw InvalidParameterException("estimateWithMethod: unrecognised ResamplingMethod value");
  }
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_METHOD_H
