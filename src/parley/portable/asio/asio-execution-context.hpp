#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <optional>
#include <thread>
#include <vector>

namespace parley::net {

/**
 * @brief A pool of threads running one `boost::asio::io_context`.
 *
 * While the pool is running, the io_context is kept busy by a work guard, so
 * the threads wait for work instead of returning. `release` drops the guard: the
 * threads return once the outstanding work is done.
 */
class AsioExecutionContext {
private:
  using WorkGuardType = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  boost::asio::io_context& io_context_;
  std::size_t size_;
  std::optional<WorkGuardType> work_;
  std::vector<std::thread> pool_;

public:
  AsioExecutionContext(boost::asio::io_context& io_context, std::size_t thread_pool_size = 0)
      : io_context_{io_context}, size_{thread_pool_size == 0 ? std::thread::hardware_concurrency()
                                                             : thread_pool_size} {
    if (size_ == 0)
      size_ = 1;
    pool_.reserve(size_);
  }

  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;

  ~AsioExecutionContext() {
    release();
    join();
  }

  /** @brief Start the threads; no-op if already running */
  void run() {
    if (is_running())
      return;
    work_.emplace(boost::asio::make_work_guard(io_context_));
    for (std::size_t i = 0; i < size_; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  /** @brief Let the threads finish when the io_context runs out of work */
  void release() { work_.reset(); }

  /** @brief Wait for every thread to return */
  void join() {
    for (auto& thread : pool_)
      if (thread.joinable())
        thread.join();
    pool_.clear();
  }

  /** @brief true iff the threads were started and not yet joined */
  bool is_running() const noexcept { return pool_.size() > 0; }

  /** @brief Number of threads executing io requests in parallel */
  std::size_t size() const noexcept { return size_; }
};

} // namespace parley::net
