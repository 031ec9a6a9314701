#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace sg {

class GraphEventService {
 public:
  struct StepEvent {
    std::string execution_id;
    std::string node_id;
    std::string kind;  // start, invoke, suspend, resume, complete, fail, warning
    double elapsed_ms;
    std::string detail;
  };

  void push(const std::string& execution_id, const std::string& node_id,
            const std::string& kind, double ms, const std::string& detail = {});
  std::vector<StepEvent> drain();
  std::size_t pending() const;

 private:
  mutable std::mutex mutex_;
  std::vector<StepEvent> buffer_;
};

}  // namespace sg
