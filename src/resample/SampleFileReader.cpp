// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include <fstream>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include "SampleFileReader.h"
#include "ResamplingConfiguration.h"

using namespace boost::filesystem;

namespace mkc_resampling
{
  static bool parseReal(const std::string& token, double& value);

  SampleFileReader::SampleFileReader (const std::string& sampleFileName)
    : mSampleFileName(sampleFileName)
  {}

  std::vector<double> SampleFileReader::readSample() const
  {
    path samplePath(mSampleFileName);

    if (!exists(samplePath))
      throw ResamplingConfigurationException("SampleFileReader::readSample - sample file " + mSampleFileName
					     + " does not exist");
    if (!is_regular_file(samplePath))
      throw ResamplingConfigurationException("SampleFileReader::readSample - " + mSampleFileName
					     + " is not a regular file");

    std::ifstream input(samplePath.string());
    if (!input)
      throw ResamplingConfigurationException("SampleFileReader::readSample - cannot open " + mSampleFileName);

    return parseSample(input, mSampleFileName);
  }

  std::vector<double> SampleFileReader::parseSample(std::istream& input, const std::string& sourceName)
  {
    std::vector<double> sample;
    std::vector<std::string> tokens;
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(input, line))
      {
	++lineNumber;

	const std::string::size_type commentStart = line.find('#');
	if (commentStart != std::string::npos)
	  line.erase(commentStart);

	boost::algorithm::trim(line);
	if (line.empty())
	  continue;

	tokens.clear();
	boost::algorithm::split(tokens, line, boost::algorithm::is_any_of(" \t\r,;"),
				boost::algorithm::token_compress_on);

	for (const std::string& token : tokens)
	  {
	    if (token.empty())
	      continue;

	    double value = 0.0;
	    if (!parseReal(token, value))
	      throw ResamplingConfigurationException("SampleFileReader::parseSample - " + sourceName
						     + " line " + std::to_string(lineNumber)
						     + ": '" + token + "' is not a finite number");
	    sample.push_back(value);
	  }
      }

    return sample;
  }

  static bool parseReal(const std::string& token, double& value)
  {
    std::size_t consumed = 0;
    try
      {
	value = std::stod(token, &consumed);
      }
    catch (const std::exception&)
      {
	return false;
      }

    return consumed == token.size() && std::isfinite(value);
  }
}
