#include "clawlink/observability/factory.hpp"

#include "clawlink/common/fs.hpp"
#include "clawlink/observability/log_observer.hpp"
#include "clawlink/observability/multi_observer.hpp"
#include "clawlink/observability/noop_observer.hpp"

#include <vector>

namespace clawlink::observability {

namespace {

std::vector<std::string> split_backends(const std::string &list) {
  std::vector<std::string> names;
  std::size_t start = 0;
  while (start <= list.size()) {
    const auto comma = list.find(',', start);
    const auto end = comma == std::string::npos ? list.size() : comma;
    if (auto name = common::to_lower(common::trim(list.substr(start, end - start)));
        !name.empty()) {
      names.push_back(std::move(name));
    }
    start = end + 1;
  }
  return names;
}

// Unknown names fall back to the log backend.
std::unique_ptr<IObserver> make_backend(const std::string &name) {
  if (name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto names = split_backends(config.observability.backend);
  if (names.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (names.size() == 1) {
    return make_backend(names.front());
  }

  std::vector<std::unique_ptr<IObserver>> backends;
  backends.reserve(names.size());
  for (const auto &name : names) {
    backends.push_back(make_backend(name));
  }
  return std::make_unique<MultiObserver>(std::move(backends));
}

} // namespace clawlink::observability
