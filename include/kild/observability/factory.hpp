#pragma once

#include "kild/config/schema.hpp"
#include "kild/observability/observer.hpp"

#include <memory>

namespace kild::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace kild::observability
