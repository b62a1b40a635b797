// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_REPLICATE_STATISTICS_H
#define __MKC_RESAMPLING_REPLICATE_STATISTICS_H 1

#include <vector>
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include "ResamplingException.h"

namespace mkc_resampling
{
  /**
   * @brief Location/spread summary of a set of values.
   *
   * variance is the unbiased (n-1) sample variance; it is 0 when count < 2.
   */
  struct SummaryStatistics
  {
    std::size_t count;
    double      mean;
    double      variance;
    double      min;
    double      max;
  };

  /**
   * @brief Arithmetic shared by the jackknife, bootstrap and subsampling estimators.
   *
   * All estimators reduce their replicate statistics theta_1..theta_M in the
   * same way: a mean, a sum of squared deviations about that mean, and a
   * square root of a scaled sum.
   */
  struct ReplicateStatUtils
  {
    /**
     * @brief Mean of @p values computed about the first element.
     *
     * mean = v_0 + (1/M) * sum_i (v_i - v_0)
     *
     * When every value is identical each deviation is exactly 0.0, so the
     * result is exactly v_0 and the deviations about the mean are exact zeros
     * too. A plain sum/M can round away from v_0 and leave a tiny spurious
     * spread.
     *
     * @return 0 for an empty vector.
     */
    static double computeShiftedMean(const std::vector<double>& values)
    {
      if (values.empty())
	return 0.0;

      const double pivot = values.front();
      double shiftedSum = 0.0;
      for (double v : values)
	shiftedSum += (v - pivot);

      return pivot + shiftedSum / static_cast<double>(values.size());
    }

    /// sum_i (v_i - mean)^2, never negative
    static double computeSumOfSquaredDeviations(const std::vector<double>& values,
						double mean)
    {
      double ss = 0.0;
      for (double v : values)
	{
	  const double d = v - mean;
	  ss += d * d;
	}
      return ss > 0.0 ? ss : 0.0;
    }

    /**
     * @brief sqrt(scale * sumSquares) with the radicand clamped at zero.
     *
     * Both factors are non-negative in exact arithmetic; the clamp keeps
     * rounding from ever producing sqrt of a negative number.
     */
    static double computeClampedRoot(double scale, double sumSquares)
    {
      const double radicand = scale * sumSquares;
      return radicand > 0.0 ? std::sqrt(radicand) : 0.0;
    }

    /**
     * @brief Returns @p value, or throws when it is NaN or infinite.
     *
     * Finite replicate statistics can still overflow once they are combined,
     * e.g. deviations between values of opposite sign near DBL_MAX.
     *
     * @throws InvalidFunctionalResultException naming @p what.
     */
    static double requireFinite(double value, const std::string& what)
    {
      if (!std::isfinite(value))
	throw InvalidFunctionalResultException(what + " is not finite (overflow while combining replicates)",
					       value);
      return value;
    }

    /**
     * @brief Count, mean, unbiased variance, min and max via Boost.Accumulators.
     *
     * Used for diagnostics (sample and replicate summaries), not for the
     * estimates themselves.
     */
    template <class Container>
    static SummaryStatistics summarize(const Container& values)
    {
      using namespace boost::accumulators;

      accumulator_set<double, stats<tag::count,
				    tag::mean,
				    tag::variance,
				    tag::min,
				    tag::max>> acc;
      for (const auto& v : values)
	acc(static_cast<double>(v));

      const std::size_t n = boost::accumulators::count(acc);
      if (n == 0)
	{
	  const double nan = std::numeric_limits<double>::quiet_NaN();
	  return SummaryStatistics{0, nan, 0.0, nan, nan};
	}

      // Boost reports the population variance; rescale to the n-1 divisor
      double var = 0.0;
      if (n > 1)
	var = boost::accumulators::variance(acc) * static_cast<double>(n) / static_cast<double>(n - 1);

      return SummaryStatistics{n,
			       boost::accumulators::mean(acc),
			       var > 0.0 ? var : 0.0,
			       (boost::accumulators::min)(acc),
			       (boost::accumulators::max)(acc)};
    }
  };
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_REPLICATE_STATISTICS_H
