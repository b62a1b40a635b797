// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_JACKKNIFE_ESTIMATOR_H
#define __MKC_RESAMPLING_JACKKNIFE_ESTIMATOR_H 1

#include <vector>
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
   * @class JackknifeEstimator
   * @brief Delete-one jackknife estimate and standard error of a functional.
   *
   * For a sample x of size N and functional f:
   *
   *   theta_full = f(x)
   *   theta_i    = f(x with observation i removed),  i = 0..N-1
   *   theta_bar  = (1/N) sum_i theta_i
   *
   *   estimate   = N * theta_full - (N-1) * theta_bar
   *   std error  = sqrt( (N-1)/N * sum_i (theta_i - theta_bar)^2 )
   *
   * The estimate removes the first-order (1/N) bias of theta_full, which is
   * what makes the method useful for non-linear functionals such as the
   * square of a mean. For a linear functional (the mean itself) the correction
   * vanishes and the estimate equals theta_full.
   *
   * The method is deterministic. It needs N >= 2: with N = 1 every
   * leave-one-out resample would be empty.
   *
   * Reference: Quenouille, M. H. (1956). Notes on bias in estimation.
   * Biometrika 43, 353-360. Tukey, J. W. (1958). Bias and confidence in not
   * quite large samples. Ann. Math. Statist. 29, 614.
   *
   * @tparam Observation Element type of the sample.
   */
  template <class Observation = double>
  class JackknifeEstimator
  {
  public:
    using Sample = std::vector<Observation>;
    using StatFn = typename FunctionalApplicator<Observation>::StatFn;

    /**
     * @brief Leave-one-out values theta_0..theta_{N-1}.
     *
     * Replicate i is x with element i removed, all other elements kept in
     * their original order. Only one resample buffer of length N-1 is live at
     * a time.
     *
     * @throws InsufficientSampleSizeException if x.size() < 2.
     * @throws InvalidFunctionalResultException if f returns NaN/Inf.
     */
    std::vector<double> replicates(const Sample& x, StatFn functional) const
    {
      const FunctionalApplicator<Observation> applicator(std::move(functional));
      checkSampleSize(x);
      return leaveOneOut(x, applicator);
    }

    /**
     * @brief Bias-corrected jackknife estimate and standard error.
     *
     * @throws InsufficientSampleSizeException if x.size() < 2.
     * @throws InvalidFunctionalResultException if f returns NaN/Inf on the
     *         sample or any leave-one-out resample, or if the replicates
     *         overflow when combined.
     */
    EstimateResult run(const Sample& x, StatFn functional) const
    {
      const FunctionalApplicator<Observation> applicator(std::move(functional));
      checkSampleSize(x);

      const std::size_t n = x.size();
      const double thetaFull = applicator.applyToSample(x);
      const std::vector<double> thetas = leaveOneOut(x, applicator);

      const double nd       = static_cast<double>(n);
      const double thetaBar = ReplicateStatUtils::requireFinite(ReplicateStatUtils::computeShiftedMean(thetas),
								"JackknifeEstimator: replicate mean");
      const double ss       = ReplicateStatUtils::computeSumOfSquaredDeviations(thetas, thetaBar);

      const double estimate = ReplicateStatUtils::requireFinite(nd * thetaFull - (nd - 1.0) * thetaBar,
								"JackknifeEstimator: estimate");
      const double se = ReplicateStatUtils::requireFinite(ReplicateStatUtils::computeClampedRoot((nd - 1.0) / nd, ss),
							  "JackknifeEstimator: standard error");

      return EstimateResult{
	/*estimate      =*/ estimate,
	/*standardError =*/ se,
	/*fullStatistic =*/ thetaFull,
	/*replicateMean =*/ thetaBar,
	/*biasEstimate  =*/ (nd - 1.0) * (thetaBar - thetaFull),
	/*n             =*/ n,
	/*numResamples  =*/ thetas.size()
      };
    }

  private:
    static void checkSampleSize(const Sample& x)
    {
      if (x.size() < ResamplingConstants::kMinSampleSize)
	throw InsufficientSampleSizeException("JackknifeEstimator: sample size must be >= 2, got "
					      + std::to_string(x.size()));
    }

    static std::vector<double>
    leaveOneOut(const Sample& x, const FunctionalApplicator<Observation>& applicator)
    {
      const std::size_t n = x.size();
      std::vector<double> thetas;
      thetas.reserve(n);

      Sample y;
      y.reserve(n - 1);
      for (std::size_t i = 0; i < n; ++i)
	{
	  y.clear();
	  y.insert(y.end(), x.begin(), x.begin() + static_cast<std::ptrdiff_t>(i));
	  y.insert(y.end(), x.begin() + static_cast<std::ptrdiff_t>(i + 1), x.end());
	  thetas.push_back(applicator.applyToReplicate(y, i));
	}
      return thetas;
    }
  };
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_JACKKNIFE_ESTIMATOR_H
