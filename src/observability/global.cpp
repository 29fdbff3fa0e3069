#include "kild/observability/global.hpp"

#include <mutex>

namespace kild::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_session_event(const std::string &operation, const std::string &phase,
                          const std::string &session_id, const std::string &detail) {
  record_event(SessionEvent{
      .operation = operation, .phase = phase, .session_id = session_id, .detail = detail});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_poll(const std::string &target, const std::uint64_t attempts,
                 const std::chrono::milliseconds elapsed, const bool ok) {
  record_metric(PollMetric{.target = target, .attempts = attempts, .elapsed = elapsed, .ok = ok});
}

} // namespace kild::observability
