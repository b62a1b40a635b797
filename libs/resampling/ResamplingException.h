// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_EXCEPTION_H
#define __MKC_RESAMPLING_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_resampling
{
  // Base class for every error raised by the resampling estimators
  class ResamplingException : public std::runtime_error
  {
  public:
    explicit ResamplingException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~ResamplingException() = default;
  };

  /**
   * @brief The sample, or the number of resamples derived from it, is too
   * small for the requested statistic (N < 2, fewer than two bootstrap draws,
   * fewer than two subsampling windows, an empty resample).
   */
  class InsufficientSampleSizeException : public ResamplingException
  {
  public:
    explicit InsufficientSampleSizeException(const std::string& msg)
      : ResamplingException(msg)
    {}
  };

  /**
   * @brief An estimator parameter is out of range (block size outside [1, N],
   * zero resamples, unknown method name).
   */
  class InvalidParameterException : public ResamplingException
  {
  public:
    explicit InvalidParameterException(const std::string& msg)
      : ResamplingException(msg)
    {}
  };

  /**
   * @brief The caller's functional produced NaN or an infinity.
   */
  class InvalidFunctionalResultException : public ResamplingException
  {
  public:
    InvalidFunctionalResultException(const std::string& msg,
				     double offendingValue)
      : ResamplingException(msg),
	mOffendingValue(offendingValue)
    {}

    double getOffendingValue() const
    {
      return mOffendingValue;
    }

  private:
    double mOffendingValue;
  };
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_EXCEPTION_H
