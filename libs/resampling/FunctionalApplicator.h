// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_FUNCTIONAL_APPLICATOR_H
#define __MKC_RESAMPLING_FUNCTIONAL_APPLICATOR_H 1

#include <vector>
#include <cmath>
#include <cstddef>
#include <functional>
#include <sstream>
#include <string>
#include <utility>

#include "ResamplingException.h"

namespace mkc_resampling
{
  /**
   * @class FunctionalApplicator
   * @brief Evaluates a caller-supplied functional on the full sample and on
   * resamples through one code path.
   *
   * The functional maps a sequence of observations (length >= 1) to a real
   * number. Every evaluation is checked: an empty input raises
   * InsufficientSampleSizeException before the functional is called, and a NaN
   * or infinite result raises InvalidFunctionalResultException. Nothing is
   * cached and no partial results are returned on failure.
   *
   * @tparam Observation Element type of the sample (double, or a fixed-width
   * row such as std::array<double, K> for multi-column data).
   */
  template <class Observation = double>
  class FunctionalApplicator
  {
  public:
    using Sample = std::vector<Observation>;
    using StatFn = std::function<double(const Sample&)>;

    explicit FunctionalApplicator(StatFn functional)
      : mFunctional(std::move(functional))
    {
      if (!mFunctional)
	throw InvalidParameterException("FunctionalApplicator: functional must be callable");
    }

    /// theta on the original sample
    double applyToSample(const Sample& sample) const
    {
      return evaluate(sample, "full sample");
    }

    /// theta on resample @p index of a resample set
    double applyToReplicate(const Sample& resample, std::size_t index) const
    {
      return evaluate(resample, index);
    }

    /**
     * @brief Apply the functional to every sequence of @p resamples, in order.
     *
     * @return One value per input sequence.
     * @throws InvalidFunctionalResultException on the first non-finite value.
     */
    std::vector<double> applyAll(const std::vector<Sample>& resamples) const
    {
      std::vector<double> values;
      values.reserve(resamples.size());
      for (std::size_t i = 0; i < resamples.size(); ++i)
	values.push_back(evaluate(resamples[i], i));
      return values;
    }

  private:
    template <class Where>
    double evaluate(const Sample& x, const Where& where) const
    {
      if (x.empty())
	{
	  std::ostringstream msg;
	  msg << "FunctionalApplicator: empty sequence at " << describe(where);
	  throw InsufficientSampleSizeException(msg.str());
	}

      const double value = mFunctional(x);
      if (!std::isfinite(value))
	{
	  std::ostringstream msg;
	  msg << "FunctionalApplicator: functional returned " << value
	      << " at " << describe(where)
	      << " (length " << x.size() << ")";
	  throw InvalidFunctionalResultException(msg.str(), value);
	}
      return value;
    }

    static std::string describe(const char* label)
    {
      return label;
    }

    static std::string describe(std::size_t index)
    {
      return "resample " + std::to_string(index);
    }

  private:
    StatFn mFunctional;
  };
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_FUNCTIONAL_APPLICATOR_H
