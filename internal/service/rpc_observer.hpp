#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace vigil::service {

/*
  Wraps one RPC body in a span, request metrics and failure logging.
  Exceptions are rethrown for the transport adapter to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  vigil::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("vigil.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    vigil::observability::Metrics::Instance().RecordRequest(route, success);
    vigil::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    VIGIL_LOG_ERROR("RPC failed", {vigil::observability::StringField("route", route),
                                   vigil::observability::StringField("error", ex.what()),
                                   vigil::observability::StringField("subject", subject)});
    finish(false);
    throw;
  }
}

} // namespace vigil::service
