// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MKC_RESAMPLING_PARALLEL_EXECUTORS_H
#define __MKC_RESAMPLING_PARALLEL_EXECUTORS_H 1

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <vector>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to spread independent replicates over threads.
 *
 *  - SingleThreadExecutor: runs each task inline on the calling thread.
 *    Deterministic; the default for every estimator.
 *  - BoostThreadPoolExecutor: a fixed pool of worker threads backed by
 *    boost::asio::thread_pool.
 */
namespace mkc_resampling
{
  namespace concurrency
  {
    class IParallelExecutor
    {
    public:
      virtual ~IParallelExecutor() = default;

      // Schedule a void() task; the future carries any exception it throws
      virtual std::future<void> submit(std::function<void()> task) = 0;

      /**
       * @brief Wait for every future, then rethrow the first failure.
       *
       * All tasks are allowed to finish before anything is rethrown, so no
       * task outlives state owned by the caller's stack frame.
       */
      virtual void waitAll(std::vector<std::future<void>>& futures)
      {
	std::exception_ptr firstError;
	for (auto& f : futures)
	  {
	    try
	      {
		f.get();
	      }
	    catch (...)
	      {
		if (!firstError)
		  firstError = std::current_exception();
	      }
	  }

	if (firstError)
	  std::rethrow_exception(firstError);
      }

      virtual std::size_t getNumThreads() const = 0;
    };

    class SingleThreadExecutor : public IParallelExecutor
    {
    public:
      std::future<void> submit(std::function<void()> task) override
      {
	std::promise<void> prom;
	auto fut = prom.get_future();
	try
	  {
	    task();
	    prom.set_value();
	  }
	catch (...)
	  {
	    prom.set_exception(std::current_exception());
	  }
	return fut;
      }

      std::size_t getNumThreads() const override
      {
	return 1;
      }
    };

    /**
     * @brief Fixed-size worker pool on top of boost::asio::thread_pool.
     *
     * numThreads == 0 selects std::thread::hardware_concurrency(), falling
     * back to 2 when the platform reports 0. The destructor joins the pool
     * after all posted work has run.
     */
    class BoostThreadPoolExecutor : public IParallelExecutor
    {
    public:
      explicit BoostThreadPoolExecutor(std::size_t numThreads = 0)
	: mNumThreads(resolveThreadCount(numThreads)),
	  mPool(mNumThreads)
      {}

      BoostThreadPoolExecutor(const BoostThreadPoolExecutor&) = delete;
      BoostThreadPoolExecutor& operator=(const BoostThreadPoolExecutor&) = delete;

      ~BoostThreadPoolExecutor()
      {
	mPool.join();
      }

      std::future<void> submit(std::function<void()> task) override
      {
	auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
	auto fut = packaged->get_future();
	boost::asio::post(mPool, [packaged]() { (*packaged)(); });
	return fut;
      }

      std::size_t getNumThreads() const override
      {
	return mNumThreads;
      }

    private:
      static std::size_t resolveThreadCount(std::size_t requested)
      {
	if (requested > 0)
	  return requested;

	const unsigned hw = std::thread::hardware_concurrency();
	return hw ? hw : 2;
      }

    private:
      std::size_t             mNumThreads;
      boost::asio::thread_pool mPool;
    };
  } // namespace concurrency
} // namespace mkc_resampling

#endif // __MKC_RESAMPLING_PARALLEL_EXECUTORS_H
