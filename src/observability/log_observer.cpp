#include "kild/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace kild::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SessionEvent>) {
          std::string line = "session." + evt.operation + "." + evt.phase;
          if (!evt.session_id.empty()) {
            line += " session_id=" + evt.session_id;
          }
          if (!evt.detail.empty()) {
            line += " " + evt.detail;
          }
          log_line("INFO", line);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, PollMetric>) {
          log_line("DEBUG", "metric.poll target=" + m.target +
                                " attempts=" + std::to_string(m.attempts) +
                                " elapsed_ms=" + std::to_string(m.elapsed.count()) +
                                " ok=" + (m.ok ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line("DEBUG", "metric.active_sessions=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace kild::observability
