// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <functional>
#include <string>
#include <vector>

namespace mkc_resampling
{
  /**
   * @brief Scalar functionals selectable by name from the command line.
   *
   *   mean          arithmetic mean
   *   mean-squared  square of the arithmetic mean
   *   variance      sample variance (n-1 divisor)
   *   std-dev       square root of the sample variance
   *   median        middle value, average of the two middle values for even n
   *
   * variance and std-dev are undefined for a single observation and return
   * NaN there, which the estimators report as an invalid functional result.
   */
  class FunctionalRegistry
  {
  public:
    using Functional = std::function<double(const std::vector<double>&)>;

    /**
     * @throws InvalidParameterException if @p name is not registered.
     */
    static Functional getFunctional(const std::string& name);

    static bool isFunctionalAvailable(const std::string& name);

    /// Registered names in alphabetical order
    static std::vector<std::string> getAvailableFunctionals();

  private:
    FunctionalRegistry();
  };

  double sampleVariance(const std::vector<double>& x);
  double sampleMedian(const std::vector<double>& x);
}
