// Stategraph kernel: ExecutionRuntime per-execution worker thread
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>

#include "stategraph/kernel/graph_engine.hpp"
#include "stategraph/kernel/services/graph_event_service.hpp"

namespace sg {

/**
 * @brief Owns one GraphEngine and the only thread allowed to touch it.
 *
 * Every call for the execution is posted as a job; jobs run one at a time in
 * submission order, so two callers can never interleave inside the engine.
 * Exceptions thrown by a job reach the caller through the returned future.
 */
class ExecutionRuntime {
public:
  ExecutionRuntime(std::shared_ptr<const GraphModel> graph,
                   EngineOptions options,
                   std::shared_ptr<SessionStore> sessions,
                   std::string execution_id = {});
  ~ExecutionRuntime();

  ExecutionRuntime(const ExecutionRuntime&) = delete;
  ExecutionRuntime& operator=(const ExecutionRuntime&) = delete;

  void start();
  void stop();
  bool running() const { return running_; }

  template <typename Fn>
  auto post(Fn&& fn) -> std::future<decltype(fn(std::declval<GraphEngine&>()))> {
    using Ret = decltype(fn(std::declval<GraphEngine&>()));
    auto task = std::make_shared<std::packaged_task<Ret()>>(
        [this, f = std::forward<Fn>(fn)]() mutable {
          if constexpr (!std::is_void_v<Ret>) {
            return f(engine_);
          } else {
            f(engine_);
          }
        });
    std::future<Ret> fut = task->get_future();
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (!running_) {
        throw GraphError(GraphErrc::InvalidState,
                         "Runtime of execution '" + engine_.execution_id() + "' is stopped.");
      }
      queue_.push([task] { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  const std::string& execution_id() const { return engine_.execution_id(); }
  const std::string& graph_name() const { return engine_.graph().name(); }
  GraphEventService& event_service() { return event_service_; }

private:
  void run_loop();

  GraphEventService event_service_;
  GraphEngine engine_;

  std::thread worker_;
  std::atomic<bool> running_{false};
  std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> queue_;
};

} // namespace sg
