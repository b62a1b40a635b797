// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_FUNCTIONALS_H
#define __MKC_RESAMPLING_FUNCTIONALS_H 1

#include <array>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include "ResamplingException.h"

namespace mkc_resampling
{
  /**
   * @brief Arithmetic mean of a scalar sample; 0 for an empty sample.
   *
   * The default functional: with it every estimator reports the error of the
   * sample mean.
   */
  inline double arithmeticMean(const std::vector<double>& x)
  {
    if (x.empty())
      return 0.0;

    double sum = 0.0;
    for (double v : x)
      sum += v;
    return sum / static_cast<double>(x.size());
  }

  /// Per-column means of fixed-width rows
  template <std::size_t K>
  std::array<double, K> columnMeans(const std::vector<std::array<double, K>>& rows)
  {
    std::array<double, K> sums{};
    for (const auto& row : rows)
      for (std::size_t c = 0; c < K; ++c)
	sums[c] += row[c];

    if (!rows.empty())
      for (std::size_t c = 0; c < K; ++c)
	sums[c] /= static_cast<double>(rows.size());

    return sums;
  }

  /**
   * @brief Functional x -> g(mean(x)).
   *
   * This is the usual shape of a Monte Carlo observable: a non-linear
   * function of an averaged measurement, e.g. g(m) = m*m.
   */
  inline std::function<double(const std::vector<double>&)>
  makeMeanTransform(std::function<double(double)> g)
  {
    if (!g)
      throw InvalidParameterException("makeMeanTransform: transform must be callable");

    return [g = std::move(g)](const std::vector<double>& x) {
      return g(arithmeticMean(x));
    };
  }

  /**
   * @brief Functional over multi-column observations: g applied to the vector
   * of column means.
   *
   * With K = 2 and g(m) = m[0] * m[1] this estimates the product of the
   * expectations of two jointly measured quantities. Rows are resampled as a
   * whole, so correlations between the columns are preserved.
   */
  template <std::size_t K>
  std::function<double(const std::vector<std::array<double, K>>&)>
  makeColumnMeansTransform(std::function<double(const std::array<double, K>&)> g)
  {
    if (!g)
      throw InvalidParameterException("makeColumnMeansTransform: transform must be callable");

    return [g = std::move(g)](const std::vector<std::array<double, K>>& rows) {
      return g(columnMeans(rows));
    };
  }
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_FUNCTIONALS_H
