#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace threadnet::service {

namespace detail {

inline bool IsClientError(const std::exception& ex) {
  return dynamic_cast<const util::InvalidFormat*>(&ex) || dynamic_cast<const util::NotFound*>(&ex) ||
         dynamic_cast<const util::NotAllowed*>(&ex) || dynamic_cast<const util::InvalidState*>(&ex);
}

inline void RecordOutcome(std::string_view route, bool success, std::chrono::steady_clock::time_point started_at) {
  observability::Metrics::Instance().RecordRequest(route, success);
  observability::Metrics::Instance().ObserveRequestLatencyMs(
      route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
}

} // namespace detail

/*
  Runs one request inside a span, records request count and latency, and
  logs failures. Exceptions propagate unchanged.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view dataset_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!dataset_id.empty()) {
    span.SetAttribute("dataset.id", dataset_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      detail::RecordOutcome(route, true, started_at);
      return;
    } else {
      auto result = fn();
      detail::RecordOutcome(route, true, started_at);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    if (detail::IsClientError(ex)) {
      THREADNET_LOG_WARN("request rejected", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                              observability::StringField("dataset_id", dataset_id)});
    } else {
      THREADNET_LOG_ERROR("request failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                             observability::StringField("dataset_id", dataset_id)});
    }
    detail::RecordOutcome(route, false, started_at);
    throw;
  }
}

} // namespace threadnet::service
