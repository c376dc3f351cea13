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

#include <kcenon/federation_gateway/admission/rate_limiter.h>
#include <kcenon/federation_gateway/logging/console_logger.h>

#include <algorithm>

namespace federation_gateway::admission
{

namespace
{

using steady_clock = std::chrono::steady_clock;

constexpr auto SECOND_WINDOW = std::chrono::seconds(1);
constexpr auto MINUTE_WINDOW = std::chrono::seconds(60);
constexpr auto HOUR_WINDOW = std::chrono::seconds(3600);

uint64_t current_timestamp_ms()
{
	return static_cast<uint64_t>(
		std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch())
			.count());
}

/**
 * @brief Convert a steady_clock deadline to Unix epoch milliseconds
 */
uint64_t to_epoch_ms(steady_clock::time_point deadline, steady_clock::time_point now)
{
	auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
	auto epoch_now = static_cast<int64_t>(current_timestamp_ms());
	auto value = epoch_now + remaining.count();
	return value > 0 ? static_cast<uint64_t>(value) : 0;
}

void initialize_windows(window_counters& counters, steady_clock::time_point now)
{
	counters.second_reset = now;
	counters.minute_reset = now;
	counters.hour_reset = now;
}

void refresh_windows(window_counters& counters, steady_clock::time_point now)
{
	if (now - counters.second_reset >= SECOND_WINDOW)
	{
		counters.per_second = 0;
		counters.second_reset = now;
	}
	if (now - counters.minute_reset >= MINUTE_WINDOW)
	{
		counters.per_minute = 0;
		counters.minute_reset = now;
	}
	if (now - counters.hour_reset >= HOUR_WINDOW)
	{
		counters.per_hour = 0;
		counters.hour_reset = now;
	}
}

admission_result make_rejection(limit_violation violation,
								limit_scope scope,
								uint32_t usage,
								uint32_t limit,
								steady_clock::time_point reset_at,
								steady_clock::time_point now)
{
	admission_result result;
	result.admitted = false;
	result.violation = violation;
	result.scope = scope;
	result.current_usage = usage;
	result.limit = limit;

	auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(reset_at - now);
	result.retry_after_ms = remaining.count() > 0 ? static_cast<uint64_t>(remaining.count()) : 0;
	result.reset_time = to_epoch_ms(reset_at, now);
	return result;
}

/**
 * @brief Evaluate the four limits of one scope in fixed order
 * @return Rejection for the first violated limit, std::nullopt if all pass
 */
std::optional<admission_result> evaluate(const window_counters& counters,
										 const rate_limit_config& limits,
										 limit_scope scope,
										 steady_clock::time_point now)
{
	if (limits.requests_per_second > 0 && counters.per_second >= limits.requests_per_second)
	{
		return make_rejection(limit_violation::requests_per_second, scope, counters.per_second,
							  limits.requests_per_second, counters.second_reset + SECOND_WINDOW,
							  now);
	}
	if (limits.requests_per_minute > 0 && counters.per_minute >= limits.requests_per_minute)
	{
		return make_rejection(limit_violation::requests_per_minute, scope, counters.per_minute,
							  limits.requests_per_minute, counters.minute_reset + MINUTE_WINDOW,
							  now);
	}
	if (limits.requests_per_hour > 0 && counters.per_hour >= limits.requests_per_hour)
	{
		return make_rejection(limit_violation::requests_per_hour, scope, counters.per_hour,
							  limits.requests_per_hour, counters.hour_reset + HOUR_WINDOW, now);
	}
	if (limits.concurrent_requests > 0 && counters.concurrent >= limits.concurrent_requests)
	{
		// No window for concurrency; suggest a short back-off.
		return make_rejection(limit_violation::concurrent_requests, scope, counters.concurrent,
							  limits.concurrent_requests, now + SECOND_WINDOW, now);
	}
	return std::nullopt;
}

void increment(window_counters& counters)
{
	++counters.per_second;
	++counters.per_minute;
	++counters.per_hour;
	++counters.concurrent;
}

rate_limit_status make_status(const window_counters& counters,
							  const rate_limit_config& limits,
							  steady_clock::time_point now)
{
	rate_limit_status status;
	status.requests_per_second = counters.per_second;
	status.requests_per_minute = counters.per_minute;
	status.requests_per_hour = counters.per_hour;
	status.concurrent_requests = counters.concurrent;
	status.limits = limits;
	status.second_reset = to_epoch_ms(counters.second_reset + SECOND_WINDOW, now);
	status.minute_reset = to_epoch_ms(counters.minute_reset + MINUTE_WINDOW, now);
	status.hour_reset = to_epoch_ms(counters.hour_reset + HOUR_WINDOW, now);
	return status;
}

} // namespace

// ============================================================================
// rate_limit_metrics
// ============================================================================

double rate_limit_metrics::rejection_rate() const noexcept
{
	auto total = total_checks.load(std::memory_order_relaxed);
	if (total == 0)
	{
		return 0.0;
	}

	auto rejected = rejected_global.load(std::memory_order_relaxed)
					+ rejected_client.load(std::memory_order_relaxed);
	return (static_cast<double>(rejected) / static_cast<double>(total)) * 100.0;
}

void rate_limit_metrics::reset() noexcept
{
	total_checks.store(0, std::memory_order_relaxed);
	admitted.store(0, std::memory_order_relaxed);
	rejected_global.store(0, std::memory_order_relaxed);
	rejected_client.store(0, std::memory_order_relaxed);
	rejected_per_second.store(0, std::memory_order_relaxed);
	rejected_per_minute.store(0, std::memory_order_relaxed);
	rejected_per_hour.store(0, std::memory_order_relaxed);
	rejected_concurrent.store(0, std::memory_order_relaxed);
	completions.store(0, std::memory_order_relaxed);
}

// ============================================================================
// rate_limiter
// ============================================================================

rate_limiter::rate_limiter(const rate_limiter_config& config)
	: config_(config)
{
	initialize_windows(global_, steady_clock::now());
}

admission_result rate_limiter::check_and_admit(const std::string& client_id)
{
	metrics_.total_checks.fetch_add(1, std::memory_order_relaxed);

	if (!config_.enabled)
	{
		metrics_.admitted.fetch_add(1, std::memory_order_relaxed);
		admission_result result;
		result.admitted = true;
		return result;
	}

	while (true)
	{
		auto entry = get_or_create(client_id);

		std::lock_guard<std::mutex> global_lock(global_mutex_);
		std::lock_guard<std::mutex> entry_lock(entry->mutex);

		// cleanup() raced us and retired this entry; fetch the live one.
		if (entry->retired)
		{
			continue;
		}

		auto now = steady_clock::now();
		refresh_windows(global_, now);
		refresh_windows(entry->counters, now);

		if (auto rejection = evaluate(global_, config_.global, limit_scope::global, now))
		{
			record_rejection(*rejection, client_id);
			return *rejection;
		}

		if (auto rejection = evaluate(entry->counters, entry->limits, limit_scope::client, now))
		{
			record_rejection(*rejection, client_id);
			return *rejection;
		}

		increment(global_);
		increment(entry->counters);
		entry->last_activity = now;

		entry->recent.push_back(now);
		while (!entry->recent.empty() && now - entry->recent.front() > HOUR_WINDOW)
		{
			entry->recent.pop_front();
		}
		while (entry->recent.size() > MAX_RECENT_REQUESTS)
		{
			entry->recent.pop_front();
		}

		metrics_.admitted.fetch_add(1, std::memory_order_relaxed);

		admission_result result;
		result.admitted = true;
		result.current_usage = entry->counters.per_second;
		result.limit = entry->limits.requests_per_second;
		return result;
	}
}

void rate_limiter::record_completion(const std::string& client_id)
{
	if (!config_.enabled)
	{
		return;
	}

	auto entry = find(client_id);
	if (!entry)
	{
		return;
	}

	// The global slot is released only together with a client slot, so a
	// completion without a matching admission cannot free capacity.
	std::lock_guard<std::mutex> global_lock(global_mutex_);
	std::lock_guard<std::mutex> entry_lock(entry->mutex);
	if (entry->counters.concurrent == 0)
	{
		return;
	}

	--entry->counters.concurrent;
	if (global_.concurrent > 0)
	{
		--global_.concurrent;
	}
	entry->last_activity = steady_clock::now();
	metrics_.completions.fetch_add(1, std::memory_order_relaxed);
}

rate_limit_status rate_limiter::status(const std::string& client_id) const
{
	auto now = steady_clock::now();
	auto entry = find(client_id);

	if (!entry)
	{
		window_counters empty;
		initialize_windows(empty, now);

		rate_limit_config limits = config_.client;
		{
			std::shared_lock lock(clients_mutex_);
			if (auto it = overrides_.find(client_id); it != overrides_.end())
			{
				limits = it->second;
			}
		}

		auto result = make_status(empty, limits, now);
		result.client_id = client_id;
		return result;
	}

	std::lock_guard<std::mutex> lock(entry->mutex);

	// Report what the next check would see without mutating the entry.
	window_counters view = entry->counters;
	refresh_windows(view, now);

	auto result = make_status(view, entry->limits, now);
	result.client_id = client_id;
	result.recent_requests = entry->recent.size();
	return result;
}

rate_limit_status rate_limiter::global_status() const
{
	auto now = steady_clock::now();

	std::lock_guard<std::mutex> lock(global_mutex_);
	window_counters view = global_;
	refresh_windows(view, now);

	auto result = make_status(view, config_.global, now);
	result.client_id = "*";
	return result;
}

bool rate_limiter::is_exempt(const std::string& path) const
{
	return std::any_of(config_.exempt_paths.begin(), config_.exempt_paths.end(),
					   [&path](const std::string& prefix)
					   {
						   if (path.compare(0, prefix.size(), prefix) != 0)
						   {
							   return false;
						   }
						   // "/healthz" is not "/health"
						   return path.size() == prefix.size() || path[prefix.size()] == '/'
								  || path[prefix.size()] == '?';
					   });
}

void rate_limiter::set_client_limits(const std::string& client_id,
									 const rate_limit_config& limits)
{
	std::shared_ptr<client_entry> entry;
	{
		std::unique_lock lock(clients_mutex_);
		overrides_[client_id] = limits;
		if (auto it = clients_.find(client_id); it != clients_.end())
		{
			entry = it->second;
		}
	}

	if (entry)
	{
		std::lock_guard<std::mutex> lock(entry->mutex);
		entry->limits = limits;
	}
}

void rate_limiter::reset(const std::string& client_id)
{
	std::unique_lock lock(clients_mutex_);
	auto it = clients_.find(client_id);
	if (it == clients_.end())
	{
		return;
	}

	auto entry = it->second;
	std::lock_guard<std::mutex> entry_lock(entry->mutex);

	if (entry->counters.concurrent == 0)
	{
		entry->retired = true;
		clients_.erase(it);
		return;
	}

	// In-flight requests keep their slots until they complete.
	entry->counters.per_second = 0;
	entry->counters.per_minute = 0;
	entry->counters.per_hour = 0;
	initialize_windows(entry->counters, steady_clock::now());
	entry->recent.clear();
}

size_t rate_limiter::cleanup()
{
	auto now = steady_clock::now();
	size_t removed = 0;

	std::unique_lock lock(clients_mutex_);
	for (auto it = clients_.begin(); it != clients_.end();)
	{
		auto& entry = it->second;
		std::lock_guard<std::mutex> entry_lock(entry->mutex);

		bool idle = entry->counters.concurrent == 0
					&& now - entry->last_activity >= entry->limits.window_size;
		if (idle)
		{
			entry->retired = true;
			it = clients_.erase(it);
			++removed;
		}
		else
		{
			++it;
		}
	}

	return removed;
}

size_t rate_limiter::tracked_clients() const
{
	std::shared_lock lock(clients_mutex_);
	return clients_.size();
}

const rate_limiter_config& rate_limiter::config() const noexcept
{
	return config_;
}

const rate_limit_metrics& rate_limiter::metrics() const noexcept
{
	return metrics_;
}

void rate_limiter::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
}

std::shared_ptr<rate_limiter::client_entry> rate_limiter::get_or_create(
	const std::string& client_id)
{
	{
		std::shared_lock lock(clients_mutex_);
		if (auto it = clients_.find(client_id); it != clients_.end())
		{
			return it->second;
		}
	}

	std::unique_lock lock(clients_mutex_);
	if (auto it = clients_.find(client_id); it != clients_.end())
	{
		return it->second;
	}

	auto entry = std::make_shared<client_entry>();
	auto override_it = overrides_.find(client_id);
	entry->limits = override_it != overrides_.end() ? override_it->second : config_.client;
	auto now = steady_clock::now();
	initialize_windows(entry->counters, now);
	entry->last_activity = now;

	clients_.emplace(client_id, entry);
	return entry;
}

std::shared_ptr<rate_limiter::client_entry> rate_limiter::find(
	const std::string& client_id) const
{
	std::shared_lock lock(clients_mutex_);
	auto it = clients_.find(client_id);
	return it != clients_.end() ? it->second : nullptr;
}

void rate_limiter::record_rejection(const admission_result& result,
									const std::string& client_id)
{
	if (result.scope == limit_scope::global)
	{
		metrics_.rejected_global.fetch_add(1, std::memory_order_relaxed);
	}
	else
	{
		metrics_.rejected_client.fetch_add(1, std::memory_order_relaxed);
	}

	switch (*result.violation)
	{
	case limit_violation::requests_per_second:
		metrics_.rejected_per_second.fetch_add(1, std::memory_order_relaxed);
		break;
	case limit_violation::requests_per_minute:
		metrics_.rejected_per_minute.fetch_add(1, std::memory_order_relaxed);
		break;
	case limit_violation::requests_per_hour:
		metrics_.rejected_per_hour.fetch_add(1, std::memory_order_relaxed);
		break;
	case limit_violation::concurrent_requests:
		metrics_.rejected_concurrent.fetch_add(1, std::memory_order_relaxed);
		break;
	}

	if (logger_)
	{
		logging::emit(logger_, kcenon::common::interfaces::log_level::debug,
					  "Rate limit exceeded for client " + client_id + ": "
						  + to_string(result.scope) + " " + to_string(*result.violation) + " ("
						  + std::to_string(result.current_usage) + "/"
						  + std::to_string(result.limit) + ")");
	}
}

// ============================================================================
// admission_ticket
// ============================================================================

admission_ticket::admission_ticket(rate_limiter& limiter, std::string client_id)
	: limiter_(&limiter)
	, client_id_(std::move(client_id))
{
}

admission_ticket::~admission_ticket()
{
	release();
}

admission_ticket::admission_ticket(admission_ticket&& other) noexcept
	: limiter_(other.limiter_)
	, client_id_(std::move(other.client_id_))
{
	other.limiter_ = nullptr;
}

admission_ticket& admission_ticket::operator=(admission_ticket&& other) noexcept
{
	if (this != &other)
	{
		release();
		limiter_ = other.limiter_;
		client_id_ = std::move(other.client_id_);
		other.limiter_ = nullptr;
	}
	return *this;
}

void admission_ticket::release()
{
	if (limiter_)
	{
		limiter_->record_completion(client_id_);
		limiter_ = nullptr;
	}
}

} // namespace federation_gateway::admission
