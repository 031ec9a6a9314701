// Stategraph kernel: ExecutionRuntime implementation
#include "stategraph/kernel/execution_runtime.hpp"

namespace sg {

ExecutionRuntime::ExecutionRuntime(std::shared_ptr<const GraphModel> graph,
                                   EngineOptions options,
                                   std::shared_ptr<SessionStore> sessions,
                                   std::string execution_id)
    : engine_(std::move(graph), std::move(options), std::move(execution_id)) {
    engine_.attach_session_store(std::move(sessions));
    engine_.attach_event_service(&event_service_);
}

ExecutionRuntime::~ExecutionRuntime() { stop(); }

void ExecutionRuntime::start() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&ExecutionRuntime::run_loop, this);
}

void ExecutionRuntime::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void ExecutionRuntime::run_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&]{ return !queue_.empty() || !running_; });
            // Jobs accepted before stop() still run.
            if (queue_.empty()) break;
            job = std::move(queue_.front());
            queue_.pop();
        }
        // packaged_task stores exceptions in the future; the job itself does not throw.
        job();
    }
}

} // namespace sg
