#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace glucolumin::service {

/*
  Runs one RPC body, logging latency on success and the error kind on
  failure. Exceptions are rethrown for the transport to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view visit_id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      GLUCOLUMIN_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::DoubleField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      GLUCOLUMIN_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::DoubleField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    GLUCOLUMIN_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("kind", util::ErrorKind(ex)),
                                        observability::StringField("error", ex.what()), observability::StringField("visit_id", visit_id),
                                        observability::DoubleField("latency_ms", elapsed_ms())});
    throw;
  }
}

} // namespace glucolumin::service
