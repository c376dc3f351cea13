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
 * @file connection_pool.h
 * @brief Logical provider connections with health tracking and circuit breaking
 *
 * The pool holds one server_connection record per provider. A record does
 * not own a socket; it is the gateway's view of the provider: where it
 * lives, which protocol version it speaks, how its recent calls went and
 * whether calls to it are currently allowed.
 *
 * Status transitions:
 * @code
 *  Connecting --success--> Active --degraded_threshold failures--> Degraded
 *  Active/Degraded --failure_threshold failures--> Broken (circuit open)
 *  Broken --open_timeout elapsed, success_threshold probe successes--> Active
 *  Active --idle_timeout without calls--> Idle --next call--> Active
 *  any --remove_server()--> Closing
 * @endcode
 */

#pragma once

#include "proxy_types.h"

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace federation_gateway::proxy
{

/**
 * @enum connection_status
 * @brief Lifecycle and health state of a provider connection
 */
enum class connection_status : uint8_t
{
	connecting = 1,
	active = 2,
	idle = 3,
	degraded = 4,
	broken = 5,
	closing = 6
};

constexpr const char* to_string(connection_status status) noexcept
{
	switch (status)
	{
	case connection_status::connecting:
		return "connecting";
	case connection_status::active:
		return "active";
	case connection_status::idle:
		return "idle";
	case connection_status::degraded:
		return "degraded";
	case connection_status::broken:
		return "broken";
	case connection_status::closing:
		return "closing";
	default:
		return "unknown";
	}
}

/**
 * @struct connection_snapshot
 * @brief Consistent copy of a connection's state and metrics
 */
struct connection_snapshot
{
	std::string server_id;
	std::string address;
	std::string protocol_version;
	connection_status status = connection_status::connecting;
	uint64_t total_requests = 0;
	uint64_t successful_requests = 0;
	uint64_t failed_requests = 0;
	double average_latency_ms = 0.0;
	uint32_t consecutive_successes = 0;
	uint32_t consecutive_failures = 0;
	uint64_t last_request_time = 0; ///< Unix epoch ms, 0 if never used
	bool half_open = false;         ///< Probing after the open timeout
	uint32_t health_score = 100;    ///< 0-100 scale

	[[nodiscard]] double success_rate() const noexcept
	{
		return total_requests > 0
				   ? static_cast<double>(successful_requests) / total_requests * 100.0
				   : 100.0;
	}
};

/**
 * @brief Status change produced by recording an outcome
 */
using status_transition = std::pair<connection_status, connection_status>;

/**
 * @class server_connection
 * @brief One provider's connection record
 *
 * Every method locks the record's own mutex; records never lock each
 * other or the pool.
 */
class server_connection
{
public:
	server_connection(std::string server_id,
					  std::string address,
					  std::string protocol_version,
					  connection_status initial_status);

	server_connection(const server_connection&) = delete;
	server_connection& operator=(const server_connection&) = delete;

	[[nodiscard]] const std::string& server_id() const noexcept { return server_id_; }
	[[nodiscard]] const std::string& address() const noexcept { return address_; }
	[[nodiscard]] const std::string& protocol_version() const noexcept
	{
		return protocol_version_;
	}

	[[nodiscard]] connection_status status() const;

	[[nodiscard]] connection_snapshot snapshot() const;

	/**
	 * @brief Ask permission to send one request
	 *
	 * Fails with error_code::circuit_open while the circuit is open, when
	 * all half-open probe slots are taken, or when the connection is
	 * closing. An Idle connection becomes Active.
	 */
	kcenon::common::VoidResult try_acquire(const circuit_breaker_config& config);

	/**
	 * @brief Record a successful call
	 * @return The status change, if any
	 */
	std::optional<status_transition> record_success(const circuit_breaker_config& config,
													std::chrono::milliseconds latency);

	/**
	 * @brief Record a failed call
	 * @return The status change, if any
	 */
	std::optional<status_transition> record_failure(const circuit_breaker_config& config,
													std::chrono::milliseconds latency);

	/**
	 * @brief Move an Active connection to Idle after idle_timeout without calls
	 * @return true if the connection became Idle
	 */
	bool mark_idle_if_inactive(std::chrono::milliseconds idle_timeout);

	/**
	 * @brief Transition to Closing; all later acquires fail
	 */
	void close();

private:
	void record_latency(std::chrono::milliseconds latency);
	[[nodiscard]] uint32_t calculate_health_score() const;
	void open_circuit();

	const std::string server_id_;
	const std::string address_;
	const std::string protocol_version_;

	mutable std::mutex mutex_;
	connection_status status_;
	std::chrono::steady_clock::time_point last_activity_;
	uint64_t last_request_time_ = 0;

	uint64_t total_requests_ = 0;
	uint64_t successful_requests_ = 0;
	uint64_t failed_requests_ = 0;
	double average_latency_ms_ = 0.0;
	uint32_t consecutive_successes_ = 0;
	uint32_t consecutive_failures_ = 0;

	std::chrono::steady_clock::time_point opened_at_;
	bool half_open_ = false;
	uint32_t half_open_in_flight_ = 0;
};

/**
 * @struct pool_stats
 * @brief Per-status connection counts
 */
struct pool_stats
{
	size_t total = 0;
	size_t connecting = 0;
	size_t active = 0;
	size_t idle = 0;
	size_t degraded = 0;
	size_t broken = 0;
	size_t closing = 0;

	/**
	 * @brief Share of connections able to take traffic right now, in percent
	 */
	[[nodiscard]] double utilization() const noexcept
	{
		return total > 0 ? static_cast<double>(active + degraded) / total * 100.0 : 0.0;
	}
};

/**
 * @class connection_pool
 * @brief Thread-safe registry of provider connections and routing rules
 *
 * The map is guarded by a shared_mutex. Lookups take the shared lock;
 * creation re-checks under the exclusive lock so concurrent first callers
 * for the same id observe a single record.
 *
 * Usage Example:
 * @code
 * auto pool = std::make_shared<connection_pool>(config);
 * pool->register_server("search", "http://search.internal:9000", "2.0");
 * pool->add_route("/search", "search");
 *
 * auto connection = pool->get_connection("search");
 * if (connection.is_ok()) {
 *     auto snapshot = connection.value()->snapshot();
 * }
 * @endcode
 */
class connection_pool
{
public:
	explicit connection_pool(const proxy_config& config = proxy_config{});

	connection_pool(const connection_pool&) = delete;
	connection_pool& operator=(const connection_pool&) = delete;

	/**
	 * @brief Register a provider
	 *
	 * Fails with validation_error for an empty id or address or an
	 * unsupported protocol version, and with conflict when the id is
	 * already registered.
	 */
	kcenon::common::Result<std::shared_ptr<server_connection>> register_server(
		const std::string& server_id,
		const std::string& address,
		const std::string& protocol_version);

	/**
	 * @brief Look up a provider's connection
	 *
	 * Unknown ids fail with not_found unless auto_register_servers is set,
	 * in which case an Active record addressed at
	 * "{default_address_base}/{server_id}" is created.
	 */
	kcenon::common::Result<std::shared_ptr<server_connection>> get_connection(
		const std::string& server_id);

	/**
	 * @brief Close and forget a provider
	 */
	kcenon::common::VoidResult remove_server(const std::string& server_id);

	/**
	 * @brief Move connections idle past idle_timeout to Idle
	 * @return Number of connections that became Idle
	 */
	size_t sweep_idle();

	/**
	 * @brief Record a call outcome and log any status change
	 */
	void record_outcome(server_connection& connection,
						bool success,
						std::chrono::milliseconds latency);

	/**
	 * @brief Route requests whose path starts with prefix to server_id
	 */
	void add_route(const std::string& prefix, const std::string& server_id);

	/**
	 * @brief Resolve a path to a provider id, longest prefix first
	 */
	[[nodiscard]] std::optional<std::string> route(const std::string& path) const;

	[[nodiscard]] pool_stats stats() const;

	[[nodiscard]] std::vector<connection_snapshot> snapshots() const;

	[[nodiscard]] size_t size() const;

	[[nodiscard]] const proxy_config& config() const noexcept { return config_; }

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

private:
	void log_transition(const std::string& server_id, const status_transition& transition);

	proxy_config config_;

	mutable std::shared_mutex connections_mutex_;
	std::unordered_map<std::string, std::shared_ptr<server_connection>> connections_;

	mutable std::shared_mutex routes_mutex_;
	std::map<std::string, std::string> routes_;

	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace federation_gateway::proxy
