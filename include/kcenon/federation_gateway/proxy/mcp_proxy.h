// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
//    this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

/**
 * @file mcp_proxy.h
 * @brief Forwards requests to providers with translation, retry and health tracking
 *
 * Features:
 * - Connection lookup through the connection_pool
 * - Inline body translation when the request and the provider speak
 *   different protocol versions
 * - Bounded retry with exponential backoff for transport failures
 * - Circuit breaking per provider
 * - Aggregate statistics and a health summary
 */

#pragma once

#include "connection_pool.h"
#include "protocol_translator.h"
#include "proxy_types.h"
#include "retry_policy.h"

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <json/json.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace federation_gateway::proxy
{

/**
 * @struct proxy_metrics
 * @brief Aggregate proxy counters
 */
struct proxy_metrics
{
	std::atomic<uint64_t> total_requests{ 0 };
	std::atomic<uint64_t> successful_requests{ 0 };
	std::atomic<uint64_t> failed_requests{ 0 };
	std::atomic<uint64_t> retried_attempts{ 0 };    ///< Attempts after the first
	std::atomic<uint64_t> circuit_rejections{ 0 };  ///< Failed fast on an open circuit
	std::atomic<uint64_t> translated_requests{ 0 }; ///< Bodies translated inline
	std::atomic<uint64_t> timeouts{ 0 };

	[[nodiscard]] double success_rate() const noexcept;

	void reset() noexcept;
};

/**
 * @class mcp_proxy
 * @brief Request forwarding front of the connection pool
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - proxy_request() blocks for the transport call and any backoff sleeps
 *
 * Usage Example:
 * @code
 * auto proxy = std::make_shared<mcp_proxy>(pool, translator, transport);
 *
 * proxy_request request;
 * request.method = "POST";
 * request.path = "/tools/call";
 * request.body["tool"] = "search";
 * request.protocol_version = "1.0";
 *
 * auto response = proxy->proxy_request("search", request);
 * if (response.is_err()) {
 *     // external_service_error, circuit_open, ...
 * }
 * @endcode
 */
class mcp_proxy
{
public:
	mcp_proxy(std::shared_ptr<connection_pool> pool,
			  std::shared_ptr<protocol_translator> translator,
			  std::shared_ptr<provider_transport> transport);

	mcp_proxy(const mcp_proxy&) = delete;
	mcp_proxy& operator=(const mcp_proxy&) = delete;

	/**
	 * @brief Forward a request to a provider
	 *
	 * The body is translated to the provider's protocol version before
	 * sending and the response body is translated back. Retryable failures
	 * are retried up to retry.max_attempts; a status of 500 or above counts
	 * as a failure.
	 *
	 * @param server_id Target provider
	 * @param request Request to forward
	 * @return Provider response, or an error tagged with the provider name
	 */
	[[nodiscard]] kcenon::common::Result<proxy_response> proxy_request(
		const std::string& server_id, const proxy_request& request);

	/**
	 * @brief Forward a request to the provider routed for its path
	 *
	 * Fails with not_found when no routing rule matches.
	 */
	[[nodiscard]] kcenon::common::Result<proxy_response> route_request(
		const proxy_request& request);

	/**
	 * @brief Health summary: status, counters, success rate, latency and pool state
	 */
	[[nodiscard]] Json::Value health() const;

	/**
	 * @brief Flat counters for scraping
	 */
	[[nodiscard]] Json::Value metrics() const;

	[[nodiscard]] const proxy_metrics& stats() const noexcept { return metrics_; }

	[[nodiscard]] double average_latency_ms() const;

	[[nodiscard]] const std::shared_ptr<connection_pool>& pool() const noexcept { return pool_; }

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

private:
	kcenon::common::Result<proxy_response> send_once(server_connection& connection,
													 http_method method,
													 const proxy_request& request,
													 const Json::Value& body);

	void record_request(bool success, std::chrono::milliseconds latency);

	std::shared_ptr<connection_pool> pool_;
	std::shared_ptr<protocol_translator> translator_;
	std::shared_ptr<provider_transport> transport_;
	retry_policy retry_;

	proxy_metrics metrics_;
	mutable std::mutex latency_mutex_;
	double average_latency_ms_ = 0.0;

	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace federation_gateway::proxy
