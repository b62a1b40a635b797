// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <boost/algorithm/string/join.hpp>
#include "FunctionalRegistry.h"
#include "Functionals.h"
#include "ResamplingException.h"

namespace mkc_resampling
{
  namespace
  {
    const std::map<std::string, FunctionalRegistry::Functional>& registry()
    {
      static const std::map<std::string, FunctionalRegistry::Functional> functionals = {
	{ "mean",         arithmeticMean },
	{ "mean-squared", makeMeanTransform([](double m) { return m * m; }) },
	{ "variance",     sampleVariance },
	{ "std-dev",      [](const std::vector<double>& x) { return std::sqrt(sampleVariance(x)); } },
	{ "median",       sampleMedian }
      };
      return functionals;
    }
  }

  double sampleVariance(const std::vector<double>& x)
  {
    if (x.size() < 2)
      return std::numeric_limits<double>::quiet_NaN();

    const double mean = arithmeticMean(x);
    double ss = 0.0;
    for (double v : x)
      ss += (v - mean) * (v - mean);

    return ss / static_cast<double>(x.size() - 1);
  }

  double sampleMedian(const std::vector<double>& x)
  {
    if (x.empty())
      return std::numeric_limits<double>::quiet_NaN();

    std::vector<double> sorted(x);
    std::sort(sorted.begin(), sorted.end());

    const std::size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 1)
      return sorted[mid];

    return 0.5 * (sorted[mid - 1] + sorted[mid]);
  }

  FunctionalRegistry::Functional FunctionalRegistry::getFunctional(const std::string& name)
  {
    auto it = registry().find(name);
    if (it == registry().end())
      throw InvalidParameterException("Unknown functional '" + name + "' (available: "
				      + boost::algorithm::join(getAvailableFunctionals(), ", ") + ")");
    return it->second;
  }

  bool FunctionalRegistry::isFunctionalAvailable(const std::string& name)
  {
    return registry().find(name) != registry().end();
  }

  std::vector<std::string> FunctionalRegistry::getAvailableFunctionals()
  {
    std::vector<std::string> names;
    names.reserve(registry().size());
    for (const auto& entry : registry())
      names.push_back(entry.first);
    return names;
  }
}
