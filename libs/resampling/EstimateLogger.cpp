// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <iomanip>
#include "EstimateLogger.h"

namespace mkc_resampling
{
  namespace
  {
    constexpr int kReportPrecision = 10;

    // Restores the caller's stream formatting on scope exit
    class StreamStateGuard
    {
    public:
      explicit StreamStateGuard(std::ostream& os)
	: mStream(os),
	  mFlags(os.flags()),
	  mPrecision(os.precision())
      {}

      ~StreamStateGuard()
      {
	mStream.flags(mFlags);
	mStream.precision(mPrecision);
      }

    private:
      std::ostream&           mStream;
      std::ios_base::fmtflags mFlags;
      std::streamsize         mPrecision;
    };
  }

  void EstimateLogger::logSampleSummary (const std::vector<double>& sample,
					 std::ostream& outputStream)
  {
    outputStream << "Sample summary" << std::endl;
    EstimateLogger::logSummary (ReplicateStatUtils::summarize (sample), outputStream);
    EstimateLogger::logSeparator (outputStream);
  }

  void EstimateLogger::logEstimate (const std::string& methodName,
				    const std::string& functionalName,
				    const EstimateResult& result,
				    std::ostream& outputStream)
  {
    StreamStateGuard guard (outputStream);
    outputStream << std::setprecision (kReportPrecision);

    outputStream << "Method:            " << methodName << std::endl;
    outputStream << "Functional:        " << functionalName << std::endl;
    outputStream << "Sample size:       " << result.n << std::endl;
    outputStream << "Resamples:         " << result.numResamples << std::endl;
    outputStream << "Full statistic:    " << result.fullStatistic << std::endl;
    outputStream << "Replicate mean:    " << result.replicateMean << std::endl;
    outputStream << "Bias estimate:     " << result.biasEstimate << std::endl;
    EstimateLogger::logSeparator (outputStream);

    EstimateLogger::logResultLine (methodName, functionalName, result, outputStream);
  }

  void EstimateLogger::logResultLine (const std::string& methodName,
				      const std::string& functionalName,
				      const EstimateResult& result,
				      std::ostream& outputStream)
  {
    StreamStateGuard guard (outputStream);
    outputStream << std::setprecision (kReportPrecision)
		 << methodName << " " << functionalName << " "
		 << result.estimate << " ± " << result.standardError << std::endl;
  }

  void EstimateLogger::logReplicates (const std::vector<double>& replicates,
				      std::ostream& outputStream)
  {
    outputStream << "Replicate statistics" << std::endl;
    EstimateLogger::logSummary (ReplicateStatUtils::summarize (replicates), outputStream);
    EstimateLogger::logSeparator (outputStream);
  }

  void EstimateLogger::logSummary (const SummaryStatistics& summary,
				   std::ostream& outputStream)
  {
    StreamStateGuard guard (outputStream);
    outputStream << std::setprecision (kReportPrecision);

    outputStream << "  count:    " << summary.count << std::endl;
    if (summary.count == 0)
      return;

    outputStream << "  mean:     " << summary.mean << std::endl;
    outputStream << "  variance: " << summary.variance << std::endl;
    outputStream << "  min:      " << summary.min << std::endl;
    outputStream << "  max:      " << summary.max << std::endl;
  }

  void EstimateLogger::logSeparator(std::ostream& outputStream)
  {
    outputStream << "----------------------------------------" << std::endl;
  }
}
