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

#include <kcenon/federation_gateway/proxy/connection_pool.h>

#include <kcenon/federation_gateway/core/federation_error.h>
#include <kcenon/federation_gateway/logging/console_logger.h>
#include <kcenon/federation_gateway/proxy/protocol_translator.h>

#include <algorithm>

namespace federation_gateway::proxy
{

namespace
{

constexpr const char* MODULE = "connection_pool";

using kcenon::common::interfaces::log_level;

uint64_t current_timestamp_ms()
{
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
									 std::chrono::system_clock::now().time_since_epoch())
									 .count());
}

kcenon::common::error_info circuit_open_error(const std::string& server_id,
											  const std::string& reason)
{
	return make_error(error_code::circuit_open,
					  "Provider '" + server_id + "' unavailable: " + reason, MODULE);
}

} // namespace

// ============================================================================
// server_connection
// ============================================================================

server_connection::server_connection(std::string server_id,
									 std::string address,
									 std::string protocol_version,
									 connection_status initial_status)
	: server_id_(std::move(server_id))
	, address_(std::move(address))
	, protocol_version_(std::move(protocol_version))
	, status_(initial_status)
	, last_activity_(std::chrono::steady_clock::now())
{
}

connection_status server_connection::status() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return status_;
}

connection_snapshot server_connection::snapshot() const
{
	std::lock_guard<std::mutex> lock(mutex_);

	connection_snapshot result;
	result.server_id = server_id_;
	result.address = address_;
	result.protocol_version = protocol_version_;
	result.status = status_;
	result.total_requests = total_requests_;
	result.successful_requests = successful_requests_;
	result.failed_requests = failed_requests_;
	result.average_latency_ms = average_latency_ms_;
	result.consecutive_successes = consecutive_successes_;
	result.consecutive_failures = consecutive_failures_;
	result.last_request_time = last_request_time_;
	result.half_open = half_open_;
	result.health_score = calculate_health_score();
	return result;
}

kcenon::common::VoidResult server_connection::try_acquire(const circuit_breaker_config& config)
{
	std::lock_guard<std::mutex> lock(mutex_);

	if (status_ == connection_status::closing)
	{
		return circuit_open_error(server_id_, "connection closing");
	}

	if (config.enabled && status_ == connection_status::broken)
	{
		if (!half_open_)
		{
			auto open_for = std::chrono::steady_clock::now() - opened_at_;
			if (open_for < config.open_timeout)
			{
				return circuit_open_error(server_id_, "circuit open");
			}
			half_open_ = true;
			half_open_in_flight_ = 0;
			consecutive_successes_ = 0;
		}

		if (half_open_in_flight_ >= std::max<uint32_t>(config.half_open_max_calls, 1))
		{
			return circuit_open_error(server_id_, "half-open probe limit reached");
		}
		++half_open_in_flight_;
	}
	else if (status_ == connection_status::idle)
	{
		status_ = connection_status::active;
	}

	last_activity_ = std::chrono::steady_clock::now();
	return kcenon::common::ok();
}

std::optional<status_transition> server_connection::record_success(
	const circuit_breaker_config& config, std::chrono::milliseconds latency)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto previous = status_;
	++successful_requests_;
	++consecutive_successes_;
	consecutive_failures_ = 0;
	record_latency(latency);

	if (half_open_)
	{
		if (half_open_in_flight_ > 0)
		{
			--half_open_in_flight_;
		}
		if (consecutive_successes_ >= config.success_threshold)
		{
			half_open_ = false;
			half_open_in_flight_ = 0;
			status_ = connection_status::active;
		}
	}
	else if (status_ != connection_status::closing)
	{
		status_ = connection_status::active;
	}

	if (previous == status_)
	{
		return std::nullopt;
	}
	return status_transition{ previous, status_ };
}

std::optional<status_transition> server_connection::record_failure(
	const circuit_breaker_config& config, std::chrono::milliseconds latency)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto previous = status_;
	++failed_requests_;
	++consecutive_failures_;
	consecutive_successes_ = 0;
	record_latency(latency);

	if (status_ == connection_status::closing)
	{
		return std::nullopt;
	}

	if (!config.enabled)
	{
		if (consecutive_failures_ >= config.degraded_threshold)
		{
			status_ = connection_status::degraded;
		}
	}
	else if (half_open_)
	{
		open_circuit();
	}
	else if (consecutive_failures_ >= config.failure_threshold)
	{
		open_circuit();
	}
	else if (consecutive_failures_ >= config.degraded_threshold)
	{
		status_ = connection_status::degraded;
	}

	if (previous == status_)
	{
		return std::nullopt;
	}
	return status_transition{ previous, status_ };
}

bool server_connection::mark_idle_if_inactive(std::chrono::milliseconds idle_timeout)
{
	std::lock_guard<std::mutex> lock(mutex_);

	if (status_ != connection_status::active)
	{
		return false;
	}

	if (std::chrono::steady_clock::now() - last_activity_ < idle_timeout)
	{
		return false;
	}

	status_ = connection_status::idle;
	return true;
}

void server_connection::close()
{
	std::lock_guard<std::mutex> lock(mutex_);
	status_ = connection_status::closing;
	half_open_ = false;
	half_open_in_flight_ = 0;
}

void server_connection::record_latency(std::chrono::milliseconds latency)
{
	++total_requests_;
	average_latency_ms_ = (average_latency_ms_ * static_cast<double>(total_requests_ - 1)
						   + static_cast<double>(latency.count()))
						  / static_cast<double>(total_requests_);
	last_activity_ = std::chrono::steady_clock::now();
	last_request_time_ = current_timestamp_ms();
}

uint32_t server_connection::calculate_health_score() const
{
	// Factor 1: Success rate (50% weight)
	double success_rate
		= total_requests_ > 0
			  ? static_cast<double>(successful_requests_) / static_cast<double>(total_requests_)
			  : 1.0;
	uint32_t success_score = static_cast<uint32_t>(success_rate * 50);

	// Factor 2: Latency (30% weight)
	uint32_t latency_score = 30;
	if (total_requests_ > 0)
	{
		if (average_latency_ms_ < 50.0)
		{
			latency_score = 30;
		}
		else if (average_latency_ms_ < 250.0)
		{
			latency_score = 20;
		}
		else if (average_latency_ms_ < 1000.0)
		{
			latency_score = 10;
		}
		else
		{
			latency_score = 0;
		}
	}

	// Factor 3: Success streak (20% weight), new connections start full
	uint32_t streak_score
		= total_requests_ > 0 ? std::min(consecutive_successes_, 10u) * 2 : 20;

	uint32_t failure_penalty = consecutive_failures_ * 10;
	uint32_t total_score = success_score + latency_score + streak_score;
	total_score = total_score > failure_penalty ? total_score - failure_penalty : 0;

	return std::min(total_score, 100u);
}

void server_connection::open_circuit()
{
	status_ = connection_status::broken;
	opened_at_ = std::chrono::steady_clock::now();
	half_open_ = false;
	half_open_in_flight_ = 0;
}

// ============================================================================
// connection_pool
// ============================================================================

connection_pool::connection_pool(const proxy_config& config) : config_(config)
{
}

kcenon::common::Result<std::shared_ptr<server_connection>> connection_pool::register_server(
	const std::string& server_id,
	const std::string& address,
	const std::string& protocol_version)
{
	if (server_id.empty())
	{
		return make_validation_error(MODULE, "server_id", "must not be empty");
	}
	if (address.empty())
	{
		return make_validation_error(MODULE, "address", "must not be empty");
	}
	if (!protocol_translator::is_supported(protocol_version))
	{
		return make_validation_error(MODULE, "protocol_version",
									 "unsupported version '" + protocol_version + "'");
	}

	std::shared_ptr<server_connection> connection;
	{
		std::unique_lock lock(connections_mutex_);
		if (connections_.count(server_id) > 0)
		{
			return make_error(error_code::conflict,
							  "Server '" + server_id + "' is already registered", MODULE);
		}

		connection = std::make_shared<server_connection>(server_id, address, protocol_version,
														 connection_status::connecting);
		connections_.emplace(server_id, connection);
	}

	logging::emit(logger_, log_level::info,
				  "Registered provider '" + server_id + "' at " + address + " (protocol "
					  + protocol_version + ")");
	return connection;
}

kcenon::common::Result<std::shared_ptr<server_connection>> connection_pool::get_connection(
	const std::string& server_id)
{
	{
		std::shared_lock lock(connections_mutex_);
		auto it = connections_.find(server_id);
		if (it != connections_.end())
		{
			return it->second;
		}
	}

	if (!config_.auto_register_servers)
	{
		return make_error(error_code::not_found,
						  "Provider '" + server_id + "' is not registered", MODULE);
	}

	if (server_id.empty())
	{
		return make_validation_error(MODULE, "server_id", "must not be empty");
	}

	std::shared_ptr<server_connection> connection;
	bool created = false;
	{
		std::unique_lock lock(connections_mutex_);
		auto it = connections_.find(server_id);
		if (it != connections_.end())
		{
			connection = it->second;
		}
		else
		{
			connection = std::make_shared<server_connection>(
				server_id, config_.default_address_base + "/" + server_id,
				config_.default_protocol_version, connection_status::active);
			connections_.emplace(server_id, connection);
			created = true;
		}
	}

	if (created)
	{
		logging::emit(logger_, log_level::info,
					  "Auto-registered provider '" + server_id + "' at "
						  + connection->address());
	}
	return connection;
}

kcenon::common::VoidResult connection_pool::remove_server(const std::string& server_id)
{
	std::shared_ptr<server_connection> connection;
	{
		std::unique_lock lock(connections_mutex_);
		auto it = connections_.find(server_id);
		if (it == connections_.end())
		{
			return make_error(error_code::not_found,
							  "Provider '" + server_id + "' is not registered", MODULE);
		}
		connection = std::move(it->second);
		connections_.erase(it);
	}

	connection->close();

	{
		std::unique_lock lock(routes_mutex_);
		for (auto it = routes_.begin(); it != routes_.end();)
		{
			if (it->second == server_id)
			{
				it = routes_.erase(it);
			}
			else
			{
				++it;
			}
		}
	}

	logging::emit(logger_, log_level::info, "Removed provider '" + server_id + "'");
	return kcenon::common::ok();
}

size_t connection_pool::sweep_idle()
{
	std::vector<std::shared_ptr<server_connection>> connections;
	{
		std::shared_lock lock(connections_mutex_);
		connections.reserve(connections_.size());
		for (const auto& [id, connection] : connections_)
		{
			connections.push_back(connection);
		}
	}

	size_t idled = 0;
	for (const auto& connection : connections)
	{
		if (connection->mark_idle_if_inactive(config_.idle_timeout))
		{
			++idled;
		}
	}

	if (idled > 0)
	{
		logging::emit(logger_, log_level::debug,
					  "Marked " + std::to_string(idled) + " provider connection(s) idle");
	}
	return idled;
}

void connection_pool::record_outcome(server_connection& connection,
									 bool success,
									 std::chrono::milliseconds latency)
{
	auto transition = success ? connection.record_success(config_.circuit_breaker, latency)
							  : connection.record_failure(config_.circuit_breaker, latency);
	if (transition)
	{
		log_transition(connection.server_id(), *transition);
	}
}

void connection_pool::add_route(const std::string& prefix, const std::string& server_id)
{
	std::unique_lock lock(routes_mutex_);
	routes_[prefix] = server_id;
}

std::optional<std::string> connection_pool::route(const std::string& path) const
{
	std::shared_lock lock(routes_mutex_);

	const std::string* best_prefix = nullptr;
	const std::string* best_server = nullptr;
	for (const auto& [prefix, server_id] : routes_)
	{
		if (path.compare(0, prefix.size(), prefix) != 0)
		{
			continue;
		}
		if (best_prefix == nullptr || prefix.size() > best_prefix->size())
		{
			best_prefix = &prefix;
			best_server = &server_id;
		}
	}

	if (best_server == nullptr)
	{
		return std::nullopt;
	}
	return *best_server;
}

pool_stats connection_pool::stats() const
{
	pool_stats result;
	for (const auto& snapshot : snapshots())
	{
		++result.total;
		switch (snapshot.status)
		{
		case connection_status::connecting:
			++result.connecting;
			break;
		case connection_status::active:
			++result.active;
			break;
		case connection_status::idle:
			++result.idle;
			break;
		case connection_status::degraded:
			++result.degraded;
			break;
		case connection_status::broken:
			++result.broken;
			break;
		case connection_status::closing:
			++result.closing;
			break;
		}
	}
	return result;
}

std::vector<connection_snapshot> connection_pool::snapshots() const
{
	std::vector<std::shared_ptr<server_connection>> connections;
	{
		std::shared_lock lock(connections_mutex_);
		connections.reserve(connections_.size());
		for (const auto& [id, connection] : connections_)
		{
			connections.push_back(connection);
		}
	}

	std::vector<connection_snapshot> result;
	result.reserve(connections.size());
	for (const auto& connection : connections)
	{
		result.push_back(connection->snapshot());
	}

	std::sort(result.begin(), result.end(),
			  [](const connection_snapshot& a, const connection_snapshot& b)
			  { return a.server_id < b.server_id; });
	return result;
}

size_t connection_pool::size() const
{
	std::shared_lock lock(connections_mutex_);
	return connections_.size();
}

void connection_pool::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
}

void connection_pool::log_transition(const std::string& server_id,
									 const status_transition& transition)
{
	auto level = transition.second == connection_status::broken
						 || transition.second == connection_status::degraded
					 ? log_level::warning
					 : log_level::info;

	logging::emit(logger_, level,
				  "Provider '" + server_id + "' " + to_string(transition.first) + " -> "
					  + to_string(transition.second));
}

} // namespace federation_gateway::proxy
