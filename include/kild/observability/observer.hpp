#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace kild::observability {

struct SessionEvent {
  std::string operation;
  std::string phase;
  std::string session_id;
  std::string detail;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SessionEvent, WarningEvent, ErrorEvent>;

struct PollMetric {
  std::string target;
  std::uint64_t attempts = 0;
  std::chrono::milliseconds elapsed{0};
  bool ok = false;
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<PollMetric, ActiveSessionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace kild::observability
