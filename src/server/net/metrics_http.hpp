// SPDX-License-Identifier: Apache-2.0
// metrics_http.hpp
// Minimal HTTP/1.1 endpoint: Prometheus text at /metrics, liveness JSON at /health.
#pragma once
#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace astro::net {

std::string build_metrics_body();
std::string build_health_body();
// Full HTTP response (status line, headers and body) for a raw request.
std::string build_http_response(std::string_view request);

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port);

} // namespace astro::net
