#include "stategraph/kernel/services/graph_event_service.hpp"

namespace sg {

void GraphEventService::push(const std::string& execution_id,
                             const std::string& node_id,
                             const std::string& kind,
                             double ms,
                             const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.push_back(StepEvent{ execution_id, node_id, kind, ms, detail });
}

std::vector<GraphEventService::StepEvent> GraphEventService::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StepEvent> out;
    out.swap(buffer_);
    return out;
}

std::size_t GraphEventService::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

} // namespace sg
