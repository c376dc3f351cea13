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

#include <kcenon/federation_gateway/proxy/mcp_proxy.h>

#include <kcenon/federation_gateway/core/federation_error.h>
#include <kcenon/federation_gateway/logging/console_logger.h>
#include <kcenon/federation_gateway/metrics/metrics_base.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>

namespace federation_gateway::proxy
{

namespace
{

constexpr const char* MODULE = "mcp_proxy";

using kcenon::common::interfaces::log_level;
using metrics::metrics_utils;

std::string join_url(const std::string& address, const std::string& path)
{
	if (path.empty())
	{
		return address;
	}
	if (!address.empty() && address.back() == '/' && path.front() == '/')
	{
		return address + path.substr(1);
	}
	if ((address.empty() || address.back() != '/') && path.front() != '/')
	{
		return address + "/" + path;
	}
	return address + path;
}

} // namespace

std::optional<http_method> parse_http_method(const std::string& name)
{
	if (name == "GET")
	{
		return http_method::get;
	}
	if (name == "POST")
	{
		return http_method::post;
	}
	if (name == "PUT")
	{
		return http_method::put;
	}
	if (name == "DELETE")
	{
		return http_method::del;
	}
	return std::nullopt;
}

// ============================================================================
// proxy_metrics
// ============================================================================

double proxy_metrics::success_rate() const noexcept
{
	return metrics_utils::calculate_rate(successful_requests.load(std::memory_order_relaxed),
										 total_requests.load(std::memory_order_relaxed));
}

void proxy_metrics::reset() noexcept
{
	total_requests.store(0, std::memory_order_relaxed);
	successful_requests.store(0, std::memory_order_relaxed);
	failed_requests.store(0, std::memory_order_relaxed);
	retried_attempts.store(0, std::memory_order_relaxed);
	circuit_rejections.store(0, std::memory_order_relaxed);
	translated_requests.store(0, std::memory_order_relaxed);
	timeouts.store(0, std::memory_order_relaxed);
}

// ============================================================================
// mcp_proxy
// ============================================================================

mcp_proxy::mcp_proxy(std::shared_ptr<connection_pool> pool,
					 std::shared_ptr<protocol_translator> translator,
					 std::shared_ptr<provider_transport> transport)
	: pool_(std::move(pool))
	, translator_(std::move(translator))
	, transport_(std::move(transport))
	, retry_(pool_->config().retry)
{
}

kcenon::common::Result<proxy_response> mcp_proxy::proxy_request(const std::string& server_id,
																const proxy_request& request)
{
	auto start = std::chrono::steady_clock::now();
	auto elapsed = [&start]()
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - start);
	};

	auto method = parse_http_method(request.method);
	if (!method)
	{
		record_request(false, elapsed());
		return make_error(error_code::internal_error,
						  "Unsupported HTTP method: " + request.method, MODULE);
	}

	auto connection_result = pool_->get_connection(server_id);
	if (connection_result.is_err())
	{
		record_request(false, elapsed());
		return connection_result.error();
	}
	auto connection = connection_result.value();

	Json::Value body = request.body;
	bool translated = request.protocol_version != connection->protocol_version();
	if (translated)
	{
		auto translation = translator_->translate(request.body, request.protocol_version,
												  connection->protocol_version());
		if (translation.is_err())
		{
			record_request(false, elapsed());
			return translation.error();
		}
		body = translation.value();
		metrics_.translated_requests.fetch_add(1, std::memory_order_relaxed);
	}

	kcenon::common::Result<proxy_response> outcome
		= make_error(error_code::internal_error, "No attempt made", MODULE);

	const uint32_t max_attempts = request.max_attempts
									  ? std::max<uint32_t>(*request.max_attempts, 1)
									  : retry_.max_attempts();

	for (uint32_t attempt = 0; attempt < max_attempts; ++attempt)
	{
		if (attempt > 0)
		{
			metrics_.retried_attempts.fetch_add(1, std::memory_order_relaxed);
		}

		outcome = send_once(*connection, *method, request, body);
		if (outcome.is_ok())
		{
			break;
		}

		const auto& error = outcome.error();
		auto kind = error_kind_of(error);
		if (kind == error_code::circuit_open)
		{
			metrics_.circuit_rejections.fetch_add(1, std::memory_order_relaxed);
		}
		else if (kind == error_code::external_service_timeout)
		{
			metrics_.timeouts.fetch_add(1, std::memory_order_relaxed);
		}

		if (attempt + 1 >= max_attempts || !retry_.should_retry(error, attempt))
		{
			break;
		}

		logging::emit(logger_, log_level::debug,
					  "Retrying request to '" + server_id + "' after attempt "
						  + std::to_string(attempt + 1) + ": " + error.message);
		retry_.wait(attempt);
	}

	if (outcome.is_err())
	{
		record_request(false, elapsed());
		logging::emit(logger_, log_level::warning,
					  "Proxy request to '" + server_id + "' failed: " + outcome.error().message);
		return outcome.error();
	}

	auto response = std::move(outcome.value());
	if (translated)
	{
		auto translation = translator_->translate(response.body, connection->protocol_version(),
												  request.protocol_version);
		if (translation.is_err())
		{
			record_request(false, elapsed());
			return translation.error();
		}
		response.body = translation.value();
	}

	record_request(true, elapsed());
	return response;
}

kcenon::common::Result<proxy_response> mcp_proxy::route_request(const proxy_request& request)
{
	auto server_id = pool_->route(request.path);
	if (!server_id)
	{
		return make_error(error_code::not_found, "No route for path '" + request.path + "'",
						  MODULE);
	}
	return proxy_request(*server_id, request);
}

kcenon::common::Result<proxy_response> mcp_proxy::send_once(server_connection& connection,
															 http_method method,
															 const proxy_request& request,
															 const Json::Value& body)
{
	auto acquired = connection.try_acquire(pool_->config().circuit_breaker);
	if (acquired.is_err())
	{
		return acquired.error();
	}

	outbound_request outbound;
	outbound.server_id = connection.server_id();
	outbound.method = method;
	outbound.url = join_url(connection.address(), request.path);
	outbound.headers = request.headers;
	outbound.body = body;
	outbound.timeout = request.timeout.value_or(pool_->config().request_timeout);

	auto start = std::chrono::steady_clock::now();
	auto since_start = [&start]()
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - start);
	};

	std::optional<kcenon::common::Result<proxy_response>> sent;
	try
	{
		sent.emplace(transport_->send(outbound));
	}
	catch (const std::exception&)
	{
		// Return the connection taken by try_acquire before propagating.
		pool_->record_outcome(connection, false, since_start());
		throw;
	}
	auto latency = since_start();

	if (sent->is_err())
	{
		pool_->record_outcome(connection, false, latency);

		const auto& error = sent->error();
		if (error_kind_of(error) == error_code::external_service_timeout)
		{
			return make_timeout_error(MODULE, connection.server_id(),
									  static_cast<uint32_t>(outbound.timeout.count()));
		}
		return make_external_service_error(MODULE, connection.server_id(), error.message);
	}

	auto response = std::move(sent->value());
	if (response.status_code >= 500)
	{
		pool_->record_outcome(connection, false, latency);
		return make_external_service_error(MODULE, connection.server_id(),
										   "HTTP " + std::to_string(response.status_code));
	}

	pool_->record_outcome(connection, true, latency);
	return response;
}

void mcp_proxy::record_request(bool success, std::chrono::milliseconds latency)
{
	std::lock_guard<std::mutex> lock(latency_mutex_);

	auto count = metrics_.total_requests.fetch_add(1, std::memory_order_relaxed) + 1;
	if (success)
	{
		metrics_.successful_requests.fetch_add(1, std::memory_order_relaxed);
	}
	else
	{
		metrics_.failed_requests.fetch_add(1, std::memory_order_relaxed);
	}

	average_latency_ms_ = metrics_utils::running_average(
		average_latency_ms_, static_cast<double>(latency.count()), count);
}

double mcp_proxy::average_latency_ms() const
{
	std::lock_guard<std::mutex> lock(latency_mutex_);
	return average_latency_ms_;
}

Json::Value mcp_proxy::health() const
{
	auto total = metrics_.total_requests.load(std::memory_order_relaxed);
	auto rate = metrics_.success_rate();
	auto pool = pool_->stats();

	auto state = metrics::classify_health(rate, total);
	if (pool.total > 0 && pool.broken == pool.total)
	{
		state = metrics::health_state::unhealthy;
	}
	else if (state == metrics::health_state::healthy && pool.broken > 0)
	{
		state = metrics::health_state::degraded;
	}

	Json::Value result(Json::objectValue);
	result["status"] = metrics::to_string(state);
	result["total_requests"] = Json::UInt64(total);
	result["successful_requests"]
		= Json::UInt64(metrics_.successful_requests.load(std::memory_order_relaxed));
	result["failed_requests"]
		= Json::UInt64(metrics_.failed_requests.load(std::memory_order_relaxed));
	result["success_rate"] = rate;
	result["average_latency_ms"] = average_latency_ms();

	Json::Value connections(Json::objectValue);
	connections["total"] = Json::UInt64(pool.total);
	connections["active"] = Json::UInt64(pool.active);
	connections["idle"] = Json::UInt64(pool.idle);
	connections["connecting"] = Json::UInt64(pool.connecting);
	connections["degraded"] = Json::UInt64(pool.degraded);
	connections["broken"] = Json::UInt64(pool.broken);
	connections["utilization"] = pool.utilization();
	result["connections"] = connections;

	Json::Value providers(Json::objectValue);
	for (const auto& snapshot : pool_->snapshots())
	{
		Json::Value provider(Json::objectValue);
		provider["status"] = to_string(snapshot.status);
		provider["address"] = snapshot.address;
		provider["protocol_version"] = snapshot.protocol_version;
		provider["success_rate"] = snapshot.success_rate();
		provider["average_latency_ms"] = snapshot.average_latency_ms;
		provider["health_score"] = snapshot.health_score;
		providers[snapshot.server_id] = provider;
	}
	result["providers"] = providers;

	return result;
}

Json::Value mcp_proxy::metrics() const
{
	Json::Value result(Json::objectValue);
	result["proxy_requests_total"]
		= Json::UInt64(metrics_.total_requests.load(std::memory_order_relaxed));
	result["proxy_requests_successful"]
		= Json::UInt64(metrics_.successful_requests.load(std::memory_order_relaxed));
	result["proxy_requests_failed"]
		= Json::UInt64(metrics_.failed_requests.load(std::memory_order_relaxed));
	result["proxy_retry_attempts"]
		= Json::UInt64(metrics_.retried_attempts.load(std::memory_order_relaxed));
	result["proxy_circuit_rejections"]
		= Json::UInt64(metrics_.circuit_rejections.load(std::memory_order_relaxed));
	result["proxy_translated_requests"]
		= Json::UInt64(metrics_.translated_requests.load(std::memory_order_relaxed));
	result["proxy_timeouts"] = Json::UInt64(metrics_.timeouts.load(std::memory_order_relaxed));
	result["proxy_average_latency_ms"] = average_latency_ms();

	auto pool = pool_->stats();
	result["pool_connections_total"] = Json::UInt64(pool.total);
	result["pool_connections_active"] = Json::UInt64(pool.active);
	result["pool_connections_idle"] = Json::UInt64(pool.idle);
	result["pool_connections_broken"] = Json::UInt64(pool.broken);
	result["pool_utilization"] = pool.utilization();
	return result;
}

void mcp_proxy::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
}

} // namespace federation_gateway::proxy
