// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <istream>
#include <string>
#include <vector>

namespace mkc_resampling
{
  /**
   * @brief Reads a scalar sample from a text file.
   *
   * Values are separated by any mix of blanks, tabs, commas and semicolons,
   * across any number of lines. Everything after '#' on a line is ignored.
   * A token that is not a finite real number raises
   * ResamplingConfigurationException naming the file and line.
   */
  class SampleFileReader
  {
  public:
    SampleFileReader (const std::string& sampleFileName);
    ~SampleFileReader()
      {}

    std::vector<double> readSample() const;

    static std::vector<double> parseSample(std::istream& input, const std::string& sourceName);

  private:
    std::string mSampleFileName;
  };
}
