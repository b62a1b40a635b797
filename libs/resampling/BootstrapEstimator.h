// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_BOOTSTRAP_ESTIMATOR_H
#define __MKC_RESAMPLING_BOOTSTRAP_ESTIMATOR_H 1

#include <vector>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include "EstimateResult.h"
#include "FunctionalApplicator.h"
#include "RandomSource.h"
#include "ReplicateStatistics.h"
#include "ResamplingConstants.h"
#include "ResamplingException.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace mkc_resampling
{
  /**
   * @class BootstrapEstimator
   * @brief Nonparametric (i.i.d., n-out-of-n) bootstrap estimate and standard
   * error of a functional.
   *
   * Each of the B replicates draws N indices uniformly with replacement from
   * [0, N) and evaluates the functional on the resulting resample:
   *
   *   theta_b    = f(x*_b),            b = 1..B
   *   estimate   = (1/B) sum_b theta_b
   *   std error  = sqrt( sum_b (theta_b - estimate)^2 / (B-1) )
   *
   * The functional is also evaluated on the original sample; the difference
   * between the bootstrap mean and that value is reported as biasEstimate but
   * is not subtracted from the estimate.
   *
   * Randomness is always injected:
   *  - run(x, f, rng) draws every index from @p rng, sequentially. Any
   *    UniformRandomBitGenerator or randutils-style wrapper works.
   *  - runWithProvider(x, f, provider) gives replicate b its own engine
   *    provider.make_engine(b). Replicates are then independent of evaluation
   *    order and are spread over the Executor.
   *
   * @tparam Observation Element type of the sample.
   * @tparam Executor    Executor used by runWithProvider (see ParallelExecutors.h).
   */
  template <class Observation = double,
	    class Executor    = concurrency::SingleThreadExecutor>
  class BootstrapEstimator
  {
  public:
    using Sample = std::vector<Observation>;
    using StatFn = typename FunctionalApplicator<Observation>::StatFn;

    /**
     * @param numResamples Number of bootstrap replicates B.
     * @throws InvalidParameterException if numResamples == 0.
     * @throws InsufficientSampleSizeException if numResamples == 1.
     */
    explicit BootstrapEstimator(std::size_t numResamples = ResamplingConstants::kDefaultNumResamples)
      : BootstrapEstimator(numResamples, std::make_shared<Executor>())
    {}

    BootstrapEstimator(std::size_t numResamples, std::shared_ptr<Executor> executor)
      : m_B(numResamples),
	m_exec(std::move(executor)),
	m_chunkHint(0)
    {
      if (m_B == 0)
	throw InvalidParameterException("BootstrapEstimator: number of resamples must be positive");
      if (m_B < ResamplingConstants::kMinReplicates)
	throw InsufficientSampleSizeException("BootstrapEstimator: at least 2 resamples are needed for a variance, got "
					      + std::to_string(m_B));
      if (!m_exec)
	throw InvalidParameterException("BootstrapEstimator: executor must not be null");
    }

    /**
     * @brief Bootstrap replicate values, drawing all indices from @p rng.
     *
     * Resamples are produced one at a time into a single reused buffer.
     */
    template <class Rng>
    std::vector<double> replicates(const Sample& x, StatFn functional, Rng& rng) const
    {
      const FunctionalApplicator<Observation> applicator(std::move(functional));
      checkSampleSize(x);
      return drawSequential(x, applicator, rng);
    }

    template <class Rng>
    EstimateResult run(const Sample& x, StatFn functional, Rng& rng) const
    {
      const FunctionalApplicator<Observation> applicator(std::move(functional));
      checkSampleSize(x);

      const double thetaFull = applicator.applyToSample(x);
      return summarize(x.size(), thetaFull, drawSequential(x, applicator, rng));
    }

    /**
     * @brief Bootstrap replicate values with one engine per replicate.
     *
     * The result depends only on the provider's seed, not on the executor or
     * its thread count.
     */
    template <class Engine>
    std::vector<double>
    replicatesWithProvider(const Sample& x,
			   StatFn functional,
			   const rng::ReplicateEngineProvider<Engine>& provider) const
    {
      const FunctionalApplicator<Observation> applicator(std::move(functional));
      checkSampleSize(x);
      return drawParallel(x, applicator, provider);
    }

    template <class Engine>
    EstimateResult runWithProvider(const Sample& x,
				   StatFn functional,
				   const rng::ReplicateEngineProvider<Engine>& provider) const
    {
      const FunctionalApplicator<Observation> applicator(std::move(functional));
      checkSampleSize(x);

      const double thetaFull = applicator.applyToSample(x);
      return summarize(x.size(), thetaFull, drawParallel(x, applicator, provider));
    }

    /// Chunk length for parallel_for_chunked; 0 lets the executor size decide.
    void setChunkSizeHint(std::size_t c)
    {
      m_chunkHint = c;
    }

    std::size_t getNumResamples() const
    {
      return m_B;
    }

    const Executor& getExecutor() const
    {
      return *m_exec;
    }

  private:
    static void checkSampleSize(const Sample& x)
    {
      if (x.size() < ResamplingConstants::kMinSampleSize)
	throw InsufficientSampleSizeException("BootstrapEstimator: sample size must be >= 2, got "
					      + std::to_string(x.size()));
    }

    template <class Rng>
    static void fillResample(const Sample& x, Sample& y, Rng& rng)
    {
      const std::size_t n = x.size();
      for (std::size_t j = 0; j < n; ++j)
	y[j] = x[rng::draw_index(rng, n)];
    }

    template <class Rng>
    std::vector<double> drawSequential(const Sample& x,
				       const FunctionalApplicator<Observation>& applicator,
				       Rng& rng) const
    {
      std::vector<double> thetas;
      thetas.reserve(m_B);

      Sample y(x.size());
      for (std::size_t b = 0; b < m_B; ++b)
	{
	  fillResample(x, y, rng);
	  thetas.push_back(applicator.applyToReplicate(y, b));
	}
      return thetas;
    }

    template <class Engine>
    std::vector<double> drawParallel(const Sample& x,
				     const FunctionalApplicator<Observation>& applicator,
				     const rng::ReplicateEngineProvider<Engine>& provider) const
    {
      // Slot b is written only by replicate b
      std::vector<double> thetas(m_B, 0.0);

      concurrency::parallel_for_chunked(
	m_B,
	*m_exec,
	[&](std::size_t b) {
	  Engine engine = provider.make_engine(b);
	  Sample y(x.size());
	  fillResample(x, y, engine);
	  thetas[b] = applicator.applyToReplicate(y, b);
	},
	m_chunkHint);

      return thetas;
    }

    static EstimateResult summarize(std::size_t n,
				    double thetaFull,
				    const std::vector<double>& thetas)
    {
      const std::size_t m    = thetas.size();
      const double      mean = ReplicateStatUtils::requireFinite(ReplicateStatUtils::computeShiftedMean(thetas),
								 "BootstrapEstimator: replicate mean");
      const double      ss   = ReplicateStatUtils::computeSumOfSquaredDeviations(thetas, mean);
      const double      se   = ReplicateStatUtils::requireFinite(
				   ReplicateStatUtils::computeClampedRoot(1.0 / static_cast<double>(m - 1), ss),
				   "BootstrapEstimator: standard error");

      return EstimateResult{
	/*estimate      =*/ mean,
	/*standardError =*/ se,
	/*fullStatistic =*/ thetaFull,
	/*replicateMean =*/ mean,
	/*biasEstimate  =*/ mean - thetaFull,
	/*n             =*/ n,
	/*numResamples  =*/ m
      };
    }

  private:
    std::size_t               m_B;
    std::shared_ptr<Executor> m_exec;
    std::size_t               m_chunkHint;
  };
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_BOOTSTRAP_ESTIMATOR_H
