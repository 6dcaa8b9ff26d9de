#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/service_context.hpp"

namespace receiver::service {

/*
  Wraps one RPC: span, request metrics, failure log. Exceptions are
  rethrown unchanged for the transport layer to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, const CallContext& call, std::string_view receiver_id, Fn&& fn) {
  receiver::observability::SpanScope span(route);
  span.SetAttribute("request.id", call.request_id);
  if (!receiver_id.empty()) {
    span.SetAttribute("receiver.id", receiver_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       record     = [&](bool success) {
    receiver::observability::Metrics::Instance().RecordRequest(route, success);
    receiver::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RECEIVER_LOG_ERROR("RPC failed", {receiver::observability::StringField("route", route), receiver::observability::StringField("error", ex.what()),
                                      receiver::observability::StringField("request_id", call.request_id),
                                      receiver::observability::StringField("receiver_id", receiver_id)});
    record(false);
    throw;
  }
}

} // namespace receiver::service
