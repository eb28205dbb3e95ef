#pragma once

#include "parley/utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>

namespace parley::rpc {

// -------------------------------------------------------------------------------------- Dispatcher

/**
 * @brief Runs actions one at a time, in submission order, on a strand of an `io_context`.
 *
 * Actions may be posted from any thread. An action that throws is logged, and the
 * dispatcher carries on with the next action.
 *
 * The dispatcher must outlive every action posted to it; owners capture a
 * `shared_ptr` to themselves in each action.
 */
class Dispatcher {
private:
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::atomic<uint64_t> sequence_{0};

public:
  explicit Dispatcher(boost::asio::io_context& io_context)
      : strand_{boost::asio::make_strand(io_context)} {}

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  template<typename Action> void post(Action&& action) {
    boost::asio::post(strand_, [this, action = std::forward<Action>(action)]() mutable {
      sequence_.fetch_add(1, std::memory_order_relaxed);
      try {
        action();
      } catch (std::exception& e) {
        LOG_ERR("dispatched action threw: {}", e.what());
      }
    });
  }

  /**
   * @brief The number of actions started so far. Within an action, this is the
   *        1-based position of that action in the total order.
   */
  uint64_t sequence() const noexcept { return sequence_.load(std::memory_order_relaxed); }
};

} // namespace parley::rpc
