#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace kild::wait {

class CancellationToken {
public:
  void cancel();
  [[nodiscard]] bool is_cancelled() const;

  [[nodiscard]] bool wait_for(std::chrono::milliseconds duration) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
};

} // namespace kild::wait
