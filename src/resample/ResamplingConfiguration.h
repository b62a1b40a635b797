// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <boost/program_options.hpp>
#include "ResamplingMethod.h"

namespace mkc_resampling
{
  class ResamplingConfigurationException : public std::runtime_error
  {
  public:
  ResamplingConfigurationException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~ResamplingConfigurationException()
      {}
  };

  class ResamplingConfiguration
  {
  public:
    ResamplingConfiguration(const std::string& inputFileName,
			    const std::string& functionalName,
			    const EstimatorOptions& options,
			    bool verbose)
      : mInputFileName(inputFileName),
        mFunctionalName(functionalName),
        mOptions(options),
        mVerbose(verbose)
    {}

    const std::string& getInputFileName() const
    {
      return mInputFileName;
    }

    const std::string& getFunctionalName() const
    {
      return mFunctionalName;
    }

    std::string getMethodName() const
    {
      return toString(mOptions.method);
    }

    const EstimatorOptions& getEstimatorOptions() const
    {
      return mOptions;
    }

    bool isVerbose() const
    {
      return mVerbose;
    }

  private:
    std::string mInputFileName;
    std::string mFunctionalName;
    EstimatorOptions mOptions;
    bool mVerbose;
  };

  /**
   * @brief Builds a ResamplingConfiguration from command-line arguments.
   *
   * Option parsing errors, missing or out-of-range values and unknown
   * method or functional names are all reported as
   * ResamplingConfigurationException.
   */
  class ResamplingConfigurationReader
  {
  public:
    ResamplingConfigurationReader();
    ~ResamplingConfigurationReader()
      {}

    /// nullptr when --help was given
    std::shared_ptr<ResamplingConfiguration> readConfiguration(int argc, const char* const argv[]);

    const boost::program_options::options_description& getOptionsDescription() const
    {
      return mDescription;
    }

  private:
    boost::program_options::options_description mDescription;
  };
}
