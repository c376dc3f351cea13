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
 * @file proxy_types.h
 * @brief Request, response, transport and configuration types for the proxy
 *
 * The proxy never opens sockets itself. Outbound calls go through the
 * provider_transport interface so an embedding process can plug in any
 * HTTP client, and tests can plug in a scripted one.
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace federation_gateway::proxy
{

/**
 * @enum http_method
 * @brief Methods accepted for forwarding
 */
enum class http_method : uint8_t
{
	get = 1,
	post = 2,
	put = 3,
	del = 4
};

constexpr const char* to_string(http_method method) noexcept
{
	switch (method)
	{
	case http_method::get:
		return "GET";
	case http_method::post:
		return "POST";
	case http_method::put:
		return "PUT";
	case http_method::del:
		return "DELETE";
	default:
		return "unknown";
	}
}

/**
 * @brief Parse an upper-case method name
 * @return The method, or std::nullopt for anything outside GET|POST|PUT|DELETE
 */
[[nodiscard]] std::optional<http_method> parse_http_method(const std::string& name);

using header_map = std::map<std::string, std::string>;

/**
 * @struct proxy_request
 * @brief Request as received by mcp_proxy::proxy_request()
 */
struct proxy_request
{
	std::string method = "POST";            ///< GET, POST, PUT or DELETE
	std::string path = "/";                 ///< Provider-relative path
	header_map headers;                     ///< Forwarded headers
	Json::Value body{ Json::nullValue };    ///< JSON body
	std::string protocol_version = "2.0";   ///< Version the body is shaped for
	std::optional<std::chrono::milliseconds> timeout; ///< Overrides the configured timeout
	std::optional<uint32_t> max_attempts; ///< Overrides the configured retry budget (min 1)
};

/**
 * @struct proxy_response
 * @brief Provider response
 */
struct proxy_response
{
	uint16_t status_code = 200;
	header_map headers;
	Json::Value body{ Json::nullValue };
};

/**
 * @struct outbound_request
 * @brief Fully resolved call handed to the transport
 */
struct outbound_request
{
	std::string server_id;
	http_method method = http_method::post;
	std::string url;                     ///< Server address joined with the path
	header_map headers;
	Json::Value body{ Json::nullValue };
	std::chrono::milliseconds timeout{ 30000 };
};

/**
 * @class provider_transport
 * @brief Outbound HTTP-style call to a provider
 *
 * Implementations must enforce request.timeout and report an elapsed
 * timeout as error_code::external_service_timeout. Any other transport
 * failure is reported as error_code::external_service_error. A response
 * with an error status is a successful call; the proxy classifies it.
 *
 * Implementations are called concurrently from many threads.
 */
class provider_transport
{
public:
	virtual ~provider_transport() = default;

	[[nodiscard]] virtual kcenon::common::Result<proxy_response> send(
		const outbound_request& request) = 0;
};

/**
 * @struct retry_config
 * @brief Bounded retry with exponential backoff
 *
 * Delay before attempt n (0-based, after the first failure) is
 * base_delay * multiplier^n, capped at max_delay. With jitter enabled the
 * delay is scaled by a random factor in [0.5, 1.0].
 */
struct retry_config
{
	uint32_t max_attempts = 3;                       ///< Total attempts, including the first
	std::chrono::milliseconds base_delay{ 1000 };
	std::chrono::milliseconds max_delay{ 30000 };
	double multiplier = 2.0;
	bool jitter = true;
};

/**
 * @struct circuit_breaker_config
 * @brief Per-connection failure isolation thresholds
 */
struct circuit_breaker_config
{
	bool enabled = true;
	uint32_t degraded_threshold = 2;              ///< Consecutive failures before Degraded
	uint32_t failure_threshold = 5;               ///< Consecutive failures before Broken
	uint32_t success_threshold = 3;               ///< Half-open successes before Active
	std::chrono::milliseconds open_timeout{ 60000 }; ///< Time Broken before probing
	uint32_t half_open_max_calls = 3;             ///< Concurrent probes while half-open
};

/**
 * @struct proxy_config
 * @brief Proxy and connection pool configuration
 */
struct proxy_config
{
	std::chrono::milliseconds request_timeout{ 30000 };
	std::chrono::milliseconds connection_timeout{ 10000 };
	std::chrono::milliseconds idle_timeout{ 300000 }; ///< Inactivity before Idle
	bool auto_register_servers = false; ///< Create unknown servers on first use
	std::string default_address_base = "http://localhost:8080"; ///< Base for auto-registered servers
	std::string default_protocol_version = "2.0";
	retry_config retry;
	circuit_breaker_config circuit_breaker;
};

} // namespace federation_gateway::proxy
