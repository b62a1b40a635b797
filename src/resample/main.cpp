// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <iostream>
#include <vector>
#include <string>
#include <boost/algorithm/string/join.hpp>
#include "ResamplingConfiguration.h"
#include "SampleFileReader.h"
#include "FunctionalRegistry.h"
#include "EstimateLogger.h"
#include "ResamplingException.h"
#include "ResamplingMethod.h"

using namespace mkc_resampling;

void printUsage(const boost::program_options::options_description& desc)
{
  std::cout << "resample - jackknife, bootstrap and subsampling error estimates\n\n";
  std::cout << "Usage: resample --input <file> [options]\n\n";
  std::cout << desc << std::endl;

  std::cout << "\nFunctionals: "
	    << boost::algorithm::join(FunctionalRegistry::getAvailableFunctionals(), ", ") << "\n";
  std::cout << "\nExamples:\n";
  std::cout << "  resample -i samples.txt\n";
  std::cout << "  resample -i samples.txt -m bootstrap -B 5000 -s 42 -t 4\n";
  std::cout << "  resample -i samples.txt -m subsampling -b 10 -f median -v\n";
}

int main(int argc, char* argv[])
{
  try
    {
      ResamplingConfigurationReader reader;
      auto configuration = reader.readConfiguration(argc, argv);
      if (!configuration)
	{
	  printUsage(reader.getOptionsDescription());
	  return 0;
	}

      SampleFileReader sampleReader(configuration->getInputFileName());
      const std::vector<double> sample = sampleReader.readSample();

      auto functional = FunctionalRegistry::getFunctional(configuration->getFunctionalName());

      if (configuration->isVerbose())
	{
	  std::cout << "Input file: " << configuration->getInputFileName() << std::endl;
	  EstimateLogger::logSampleSummary(sample, std::cout);
	}

      if (configuration->isVerbose())
	EstimateLogger::logReplicates(replicatesWithMethod(configuration->getEstimatorOptions(),
							   sample,
							   functional),
				      std::cout);

      const EstimateResult result = estimateWithMethod(configuration->getEstimatorOptions(),
						       sample,
						       functional);

      if (configuration->isVerbose())
	EstimateLogger::logEstimate(configuration->getMethodName(),
				    configuration->getFunctionalName(),
				    result,
				    std::cout);
      else
	EstimateLogger::logResultLine(configuration->getMethodName(),
				      configuration->getFunctionalName(),
				      result,
				      std::cout);
      return 0;
    }
  catch (const ResamplingConfigurationException& e)
    {
      std::cerr << "Configuration error: " << e.what() << std::endl;
    }
  catch (const ResamplingException& e)
    {
      std::cerr << "Resampling error: " << e.what() << std::endl;
    }
  catch (const std::exception& e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
    }

  return 1;
}
