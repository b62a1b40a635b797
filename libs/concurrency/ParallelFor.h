// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_PARALLEL_FOR_H
#define __MKC_RESAMPLING_PARALLEL_FOR_H 1

#include <algorithm>
#include <cstddef>
#include <future>
#include <vector>

namespace mkc_resampling
{
  namespace concurrency
  {
    /**
     * @brief Run body(i) for every i in [0, total), split into contiguous chunks.
     *
     * Each chunk becomes one executor task. Without a hint the range is cut
     * into roughly four chunks per executor thread; a non-zero
     * @p chunkSizeHint fixes the chunk length instead. Returns after every
     * chunk has finished and rethrows the first exception a chunk raised.
     */
    template <typename Executor, typename Body>
    void parallel_for_chunked(std::size_t total,
			      Executor&   exec,
			      Body        body,
			      std::size_t chunkSizeHint = 0)
    {
      if (total == 0)
	return;

      std::size_t chunkSize = chunkSizeHint;
      if (chunkSize == 0)
	{
	  const std::size_t numChunks = std::max<std::size_t>(1, exec.getNumThreads() * 4);
	  chunkSize = (total + numChunks - 1) / numChunks;
	}

      std::vector<std::future<void>> futures;
      futures.reserve((total + chunkSize - 1) / chunkSize);

      for (std::size_t start = 0; start < total; start += chunkSize)
	{
	  const std::size_t end = std::min(total, start + chunkSize);
	  futures.emplace_back(exec.submit([&body, start, end]() {
	    for (std::size_t i = start; i < end; ++i)
	      body(i);
	  }));
	}

      exec.waitAll(futures);
    }
  } // namespace concurrency
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_PARALLEL_FOR_H
