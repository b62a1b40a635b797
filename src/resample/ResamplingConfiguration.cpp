// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <thread>
#include <boost/algorithm/string/trim.hpp>
#include "ResamplingConfiguration.h"
#include "FunctionalRegistry.h"
#include "ResamplingConstants.h"

namespace po = boost::program_options;

namespace mkc_resampling
{
  static std::size_t toCount(long long value, const std::string& optionName, long long minimum);
  static std::uint64_t parseSeed(const std::string& seedStr);
  static std::size_t maxWorkerThreads();

  ResamplingConfigurationReader::ResamplingConfigurationReader()
    : mDescription("Options")
  {
    mDescription.add_options()
      ("help,h", "Show help message")
      ("input,i", po::value<std::string>(), "Sample file: numbers separated by blanks, commas or semicolons; '#' starts a comment")
      ("method,m", po::value<std::string>()->default_value(ResamplingConstants::kDefaultMethodName),
       "Resampling method: jackknife, bootstrap or subsampling")
      ("functional,f", po::value<std::string>()->default_value(ResamplingConstants::kDefaultFunctionalName),
       "Functional: mean, mean-squared, variance, std-dev or median")
      ("resamples,B", po::value<long long>()->default_value(static_cast<long long>(ResamplingConstants::kDefaultNumResamples)),
       "Number of bootstrap resamples")
      ("block-size,b", po::value<long long>(), "Subsampling block size (required for subsampling)")
      ("seed,s", po::value<std::string>(), "Bootstrap seed (decimal or 0x-prefixed hex)")
      ("threads,t", po::value<long long>()->default_value(1), "Worker threads for the bootstrap (at most 4 per hardware thread)")
      ("verbose,v", "Print the sample summary and diagnostics");
  }

  std::shared_ptr<ResamplingConfiguration>
  ResamplingConfigurationReader::readConfiguration(int argc, const char* const argv[])
  {
    po::variables_map vm;
    try
      {
	po::store(po::parse_command_line(argc, argv, mDescription), vm);
	po::notify(vm);
      }
    catch (const po::error& e)
      {
	throw ResamplingConfigurationException(std::string("ResamplingConfigurationReader::readConfiguration - ")
					       + e.what());
      }

    if (vm.count("help"))
      return nullptr;

    if (!vm.count("input"))
      throw ResamplingConfigurationException("ResamplingConfigurationReader::readConfiguration - the option '--input' is required");

    EstimatorOptions options;
    try
      {
	options.method = parseResamplingMethod(vm["method"].as<std::string>());
      }
    catch (const InvalidParameterException& e)
      {
	throw ResamplingConfigurationException(std::string("ResamplingConfigurationReader::readConfiguration - ")
					       + e.what());
      }

    const std::string functionalName = boost::algorithm::trim_copy(vm["functional"].as<std::string>());
    if (!FunctionalRegistry::isFunctionalAvailable(functionalName))
      throw ResamplingConfigurationException("ResamplingConfigurationReader::readConfiguration - unknown functional '"
					     + functionalName + "'");

    options.numResamples = toCount(vm["resamples"].as<long long>(), "resamples", 1);
    options.numThreads = toCount(vm["threads"].as<long long>(), "threads", 1);
    if (options.numThreads > maxWorkerThreads())
      throw ResamplingConfigurationException("ResamplingConfigurationReader::readConfiguration - '--threads' must be at most "
					     + std::to_string(maxWorkerThreads())
					     + ", got " + std::to_string(options.numThreads));

    if (vm.count("block-size"))
      options.blockSize = toCount(vm["block-size"].as<long long>(), "block-size", 1);
    else if (options.method == ResamplingMethod::Subsampling)
      throw ResamplingConfigurationException("ResamplingConfigurationReader::readConfiguration - subsampling requires '--block-size'");

    if (vm.count("seed"))
      options.seed = parseSeed(vm["seed"].as<std::string>());

    return std::make_shared<ResamplingConfiguration>(vm["input"].as<std::string>(),
						     functionalName,
						     options,
						     vm.count("verbose") > 0);
  }

  static std::size_t toCount(long long value, const std::string& optionName, long long minimum)
  {
    if (value < minimum)
      throw ResamplingConfigurationException("ResamplingConfigurationReader::readConfiguration - '--" + optionName
					     + "' must be at least " + std::to_string(minimum)
					     + ", got " + std::to_string(value));
    return static_cast<std::size_t>(value);
  }

  static std::size_t maxWorkerThreads()
  {
    const unsigned int cores = std::max(1u, std::thread::hardware_concurrency());
    return static_cast<std::size_t>(cores) * ResamplingConstants::kMaxThreadsPerCore;
  }

  // Decimal, or hexadecimal after an explicit 0x/0X prefix. A leading zero is
  // not an octal marker.
  static std::uint64_t parseSeed(const std::string& seedStr)
  {
    const std::string trimmed = boost::algorithm::trim_copy(seedStr);

    int base = 10;
    std::string digits(trimmed);
    if (trimmed.size() >= 2 && trimmed[0] == '0' && (trimmed[1] == 'x' || trimmed[1] == 'X'))
      {
	base = 16;
	digits = trimmed.substr(2);
      }

    const bool leadingDigit = !digits.empty()
      && (base == 16 ? std::isxdigit(static_cast<unsigned char>(digits[0]))
	  : std::isdigit(static_cast<unsigned char>(digits[0])));
    if (!leadingDigit)
      throw ResamplingConfigurationException("ResamplingConfigurationReader::readConfiguration - invalid seed '"
					     + seedStr + "'");

    std::size_t consumed = 0;
    unsigned long long value = 0;
    try
      {
	value = std::stoull(digits, &consumed, base);
      }
    catch (const std::exception&)
      {
	throw ResamplingConfigurationException("ResamplingConfigurationReader::readConfiguration - invalid seed '"
					       + seedStr + "'");
      }

    if (consumed != digits.size())
      throw ResamplingConfigurationException("ResamplingConfigurationReader::readConfiguration - invalid seed '"
					     + seedStr + "'");

    return static_cast<std::uint64_t>(value);
  }
}
