#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace datahub::service {

/*
  Runs one service call. Failures are logged with the route and the
  subject id (upload id, dataset id, object key) and rethrown untouched
  for the transport to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      DATAHUB_LOG_DEBUG("RPC done", {observability::StringField("route", route), observability::IntField("elapsed_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      DATAHUB_LOG_DEBUG("RPC done", {observability::StringField("route", route), observability::IntField("elapsed_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    DATAHUB_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                     observability::StringField("subject", subject),
                                     observability::IntField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

} // namespace datahub::service
