#pragma once

#include "kild/common/result.hpp"
#include "kild/observability/global.hpp"
#include "kild/wait/cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace kild::wait {

inline constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{100};

enum class ProbeErrorKind {
  Retryable,
  Terminal,
};

template <typename E> struct ProbeError {
  ProbeErrorKind kind = ProbeErrorKind::Retryable;
  E error;
  std::string message;

  static ProbeError retryable(E error, std::string message) {
    return ProbeError{ProbeErrorKind::Retryable, std::move(error), std::move(message)};
  }
  static ProbeError terminal(E error, std::string message) {
    return ProbeError{ProbeErrorKind::Terminal, std::move(error), std::move(message)};
  }
};

struct PollOptions {
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds interval = DEFAULT_POLL_INTERVAL;
  std::string target = "resource";
};

struct PollState {
  std::uint64_t attempts = 0;
  std::chrono::steady_clock::time_point started_at;
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds interval{0};

  [[nodiscard]] std::chrono::milliseconds elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
  }

  /// True when the next attempt would start at or past the deadline. A timeout that is not a
  /// whole number of intervals gives up to one interval early (250ms at 100ms stops near 200ms).
  [[nodiscard]] bool next_attempt_misses_deadline() const {
    const auto now = elapsed();
    return now >= timeout || now + interval >= timeout;
  }
};

template <typename T> struct PollSuccess {
  T value;
  std::uint64_t attempts = 0;
  std::chrono::milliseconds elapsed{0};
};

enum class WaitErrorKind { Timeout, Cancelled, ProbeFailed };

template <typename E> struct WaitError {
  WaitErrorKind kind = WaitErrorKind::Timeout;
  std::string message;
  std::uint64_t attempts = 0;
  std::chrono::milliseconds elapsed{0};
  /// Set for ProbeFailed (the terminal probe error) and for Timeout (the last retryable one).
  std::optional<E> cause;

  [[nodiscard]] std::string_view code() const {
    switch (kind) {
    case WaitErrorKind::Timeout:
      return "WAIT_TIMEOUT";
    case WaitErrorKind::Cancelled:
      return "WAIT_CANCELLED";
    case WaitErrorKind::ProbeFailed:
      return "WAIT_PROBE_FAILED";
    }
    return "WAIT_PROBE_FAILED";
  }

  [[nodiscard]] bool is_user_error() const {
    return kind == WaitErrorKind::Timeout || kind == WaitErrorKind::Cancelled;
  }
};

template <typename T, typename E>
using Probe = std::function<common::Result<T, ProbeError<E>>()>;

template <typename T, typename E>
using PollResult = common::Result<PollSuccess<T>, WaitError<E>>;

namespace detail {

template <typename T, typename E>
PollResult<T, E> finish_failure(const PollOptions &options, const PollState &state,
                                WaitErrorKind kind, std::string message,
                                std::optional<E> cause) {
  const auto elapsed = state.elapsed();
  observability::record_poll(options.target, state.attempts, elapsed, false);
  return PollResult<T, E>::failure(WaitError<E>{.kind = kind,
                                                .message = std::move(message),
                                                .attempts = state.attempts,
                                                .elapsed = elapsed,
                                                .cause = std::move(cause)});
}

} // namespace detail

template <typename T, typename E>
PollResult<T, E> poll_with(const Probe<T, E> &probe, const PollOptions &options,
                           const CancellationToken *cancel) {
  PollState state{.attempts = 0,
                  .started_at = std::chrono::steady_clock::now(),
                  .timeout = options.timeout,
                  .interval = options.interval};

  while (true) {
    if (cancel != nullptr && cancel->is_cancelled()) {
      return detail::finish_failure<T, E>(options, state, WaitErrorKind::Cancelled,
                                          "wait for " + options.target + " was cancelled",
                                          std::nullopt);
    }

    ++state.attempts;
    auto outcome = probe();
    if (outcome.ok()) {
      const auto elapsed = state.elapsed();
      observability::record_poll(options.target, state.attempts, elapsed, true);
      return PollResult<T, E>::success(PollSuccess<T>{
          .value = std::move(outcome.value()), .attempts = state.attempts, .elapsed = elapsed});
    }

    const ProbeError<E> &failure = outcome.error();
    if (failure.kind == ProbeErrorKind::Terminal) {
      return detail::finish_failure<T, E>(options, state, WaitErrorKind::ProbeFailed,
                                          failure.message, failure.error);
    }

    if (state.next_attempt_misses_deadline()) {
      return detail::finish_failure<T, E>(
          options, state, WaitErrorKind::Timeout,
          "timed out after " + std::to_string(state.elapsed().count()) + "ms waiting for " +
              options.target + " (" + failure.message + ")",
          failure.error);
    }

    if (cancel != nullptr) {
      if (cancel->wait_for(options.interval)) {
        return detail::finish_failure<T, E>(options, state, WaitErrorKind::Cancelled,
                                            "wait for " + options.target + " was cancelled",
                                            std::nullopt);
      }
    } else {
      std::this_thread::sleep_for(options.interval);
    }
  }
}

template <typename T, typename E>
PollResult<T, E> poll(const Probe<T, E> &probe, const PollOptions &options) {
  return poll_with<T, E>(probe, options, nullptr);
}

template <typename T, typename E>
std::future<PollResult<T, E>> poll_async(Probe<T, E> probe, PollOptions options,
                                         std::shared_ptr<CancellationToken> token) {
  return std::async(std::launch::async,
                    [probe = std::move(probe), options = std::move(options),
                     token = std::move(token)]() {
                      return poll_with<T, E>(probe, options, token.get());
                    });
}

} // namespace kild::wait
