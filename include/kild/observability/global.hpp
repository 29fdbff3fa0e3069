#pragma once

#include "kild/observability/observer.hpp"

#include <memory>

namespace kild::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_session_event(const std::string &operation, const std::string &phase,
                          const std::string &session_id, const std::string &detail = "");
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);
void record_poll(const std::string &target, std::uint64_t attempts,
                 std::chrono::milliseconds elapsed, bool ok);

} // namespace kild::observability
