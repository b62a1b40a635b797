// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_SUBSAMPLING_ESTIMATOR_H
#define __MKC_RESAMPLING_SUBSAMPLING_ESTIMATOR_H 1

#include <vector>
#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

#include "EstimateResult.h"
#include "FunctionalApplicator.h"
#include "ReplicateStatistics.h"
#include "ResamplingConstants.h"
#include "ResamplingException.h"

namespace mkc_resampling
{
  /**
   * @brief Normalisation of the sum of squared window deviations.
   *
   * Summed:         var = (b/N) * sum_k (theta_k - theta_bar)^2
   * WindowAveraged: var = (b/N) * (1/M) * sum_k (theta_k - theta_bar)^2,
   *                 M = N - b + 1 (Politis, Romano & Wolf 1999, sec. 3.8)
   */
  enum class SubsamplingVariance
    {
      Summed,
      WindowAveraged
    };

  /**
   * @class SubsamplingEstimator
   * @brief Overlapping-block subsampling estimate and standard error.
   *
   * The resample set is the M = N - b + 1 contiguous windows of length b,
   * x[k .. k+b), k = 0..N-b, in order.
   *
   *   theta_full = f(x)
   *   theta_k    = f(x[k .. k+b))
   *   theta_bar  = (1/M) sum_k theta_k
   *
   *   estimate   = theta_full - (theta_bar - theta_full) * b / (N - b)
   *   std error  = sqrt(var), var as selected by SubsamplingVariance
   *
   * Requirements: 1 <= b <= N (else InvalidParameterException) and M >= 2
   * (else InsufficientSampleSizeException). b == N therefore fails instead of
   * reporting a zero error from a single window.
   *
   * @tparam Observation Element type of the sample.
   */
  template <class Observation = double>
  class SubsamplingEstimator
  {
  public:
    using Sample = std::vector<Observation>;
    using StatFn = typename FunctionalApplicator<Observation>::StatFn;

    /**
     * @throws InvalidParameterException if blockSize == 0.
     */
    explicit SubsamplingEstimator(std::size_t blockSize,
				  SubsamplingVariance variance = SubsamplingVariance::Summed)
      : m_blockSize(blockSize),
	m_variance(variance)
    {
      if (m_blockSize == 0)
	throw InvalidParameterException("SubsamplingEstimator: block size must be >= 1");
    }

    /// theta_k for every window, in window order
    std::vector<double> replicates(const Sample& x, StatFn functional) const
    {
      const FunctionalApplicator<Observation> applicator(std::move(functional));
      checkSample(x);
      return windows(x, applicator);
    }

    EstimateResult run(const Sample& x, StatFn functional) const
    {
      const FunctionalApplicator<Observation> applicator(std::move(functional));
      checkSample(x);

      const std::size_t n = x.size();
      const double thetaFull = applicator.applyToSample(x);
      const std::vector<double> thetas = windows(x, applicator);

      const double nd       = static_cast<double>(n);
      const double bd       = static_cast<double>(m_blockSize);
      const double thetaBar = ReplicateStatUtils::requireFinite(ReplicateStatUtils::computeShiftedMean(thetas),
								"SubsamplingEstimator: replicate mean");
      const double ss       = ReplicateStatUtils::computeSumOfSquaredDeviations(thetas, thetaBar);

      // checkSample guarantees N - b >= 1
      const double bias = (thetaBar - thetaFull) * bd / (nd - bd);

      double scale = bd / nd;
      if (m_variance == SubsamplingVariance::WindowAveraged)
	scale /= static_cast<double>(thetas.size());

      const double estimate = ReplicateStatUtils::requireFinite(thetaFull - bias,
								"SubsamplingEstimator: estimate");
      const double se = ReplicateStatUtils::requireFinite(ReplicateStatUtils::computeClampedRoot(scale, ss),
							  "SubsamplingEstimator: standard error");

      return EstimateResult{
	/*estimate      =*/ estimate,
	/*standardError =*/ se,
	/*fullStatistic =*/ thetaFull,
	/*replicateMean =*/ thetaBar,
	/*biasEstimate  =*/ bias,
	/*n             =*/ n,
	/*numResamples  =*/ thetas.size()
      };
    }

    std::size_t getBlockSize() const
    {
      return m_blockSize;
    }

    SubsamplingVariance getVarianceNormalization() const
    {
      return m_variance;
    }

    /// Number of windows a sample of size @p n yields (0 if b > n)
    std::size_t numWindows(std::size_t n) const
    {
      return (m_blockSize > n) ? 0 : n - m_blockSize + 1;
    }

  private:
    void checkSample(const Sample& x) const
    {
      const std::size_t n = x.size();
      if (n < ResamplingConstants::kMinSampleSize)
	throw InsufficientSampleSizeException("SubsamplingEstimator: sample size must be >= 2, got "
					      + std::to_string(n));
      if (m_blockSize > n)
	throw InvalidParameterException("SubsamplingEstimator: block size " + std::to_string(m_blockSize)
					+ " exceeds sample size " + std::to_string(n));
      if (numWindows(n) < ResamplingConstants::kMinReplicates)
	throw InsufficientSampleSizeException("SubsamplingEstimator: block size " + std::to_string(m_blockSize)
					      + " leaves fewer than 2 windows in a sample of size "
					      + std::to_string(n));
    }

    std::vector<double> windows(const Sample& x,
				const FunctionalApplicator<Observation>& applicator) const
    {
      const std::size_t m = numWindows(x.size());
      std::vector<double> thetas;
      thetas.reserve(m);

      Sample y(m_blockSize);
      for (std::size_t k = 0; k < m; ++k)
	{
	  std::copy_n(x.begin() + static_cast<std::ptrdiff_t>(k),
		      static_cast<std::ptrdiff_t>(m_blockSize),
		      y.begin());
	  thetas.push_back(applicator.applyToReplicate(y, k));
	}
      return thetas;
    }

  private:
    std::size_t         m_blockSize;
    SubsamplingVariance m_variance;
  };
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_SUBSAMPLING_ESTIMATOR_H
