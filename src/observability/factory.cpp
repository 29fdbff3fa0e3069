#include "kild/observability/factory.hpp"

#include "kild/common/fs.hpp"
#include "kild/observability/log_observer.hpp"
#include "kild/observability/noop_observer.hpp"

namespace kild::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop" || backend == "off") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace kild::observability
