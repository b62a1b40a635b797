// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//
#ifndef __MKC_RESAMPLING_ESTIMATE_LOGGER_H
#define __MKC_RESAMPLING_ESTIMATE_LOGGER_H 1

#include <ostream>
#include <string>
#include <vector>
#include "EstimateResult.h"
#include "ReplicateStatistics.h"

namespace mkc_resampling
{
  class EstimateLogger
  {
  public:
    // "count mean variance min max" block for the input sample
    static void logSampleSummary (const std::vector<double>& sample,
				  std::ostream& outputStream);

    // Diagnostics of a finished run followed by the one-line result
    static void logEstimate (const std::string& methodName,
			     const std::string& functionalName,
			     const EstimateResult& result,
			     std::ostream& outputStream);

    // "method functional estimate +/- error"
    static void logResultLine (const std::string& methodName,
			       const std::string& functionalName,
			       const EstimateResult& result,
			       std::ostream& outputStream);

    static void logReplicates (const std::vector<double>& replicates,
			       std::ostream& outputStream);

  private:
    EstimateLogger();

  private:
    static void logSummary (const SummaryStatistics& summary,
			    std::ostream& outputStream);
    static void logSeparator(std::ostream& outputStream);
  };
}

#endif
