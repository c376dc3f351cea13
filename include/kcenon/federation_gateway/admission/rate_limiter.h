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
 * @file rate_limiter.h
 * @brief Fixed-window admission control for the federation gateway
 *
 * Decides, per request, whether the gateway-wide quota and the calling
 * client's quota allow the call. Four limits are tracked for each scope:
 * requests per second, per minute, per hour and concurrent requests.
 *
 * Features:
 * - Fixed-window counters with per-window reset timestamps
 * - Global limits checked before client limits, first violation wins
 * - Structured admission result naming the violated limit
 * - Per-client limit overrides
 * - Exempt paths (health and metrics endpoints)
 * - RAII admission ticket releasing the concurrent slot
 * - Thread-safe metrics collection
 */

#pragma once

#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace federation_gateway::admission
{

/**
 * @struct rate_limit_config
 * @brief Limits for one scope (the whole gateway or a single client)
 *
 * A limit of 0 disables that particular check.
 */
struct rate_limit_config
{
	uint32_t requests_per_second = 10;     ///< Max admissions per 1s window
	uint32_t requests_per_minute = 600;    ///< Max admissions per 60s window
	uint32_t requests_per_hour = 36000;    ///< Max admissions per 3600s window
	uint32_t concurrent_requests = 10;     ///< Max admitted but not completed
	std::chrono::seconds window_size{ 60 }; ///< Idle time before cleanup() drops a client
};

/**
 * @struct rate_limiter_config
 * @brief Complete limiter configuration
 */
struct rate_limiter_config
{
	bool enabled = true; ///< Disable to admit everything
	rate_limit_config global{ 1000, 60000, 3600000, 1000, std::chrono::seconds(60) };
	rate_limit_config client;                   ///< Default limits for every client
	std::vector<std::string> exempt_paths{ "/health", "/metrics" }; ///< Never limited
};

/**
 * @enum limit_violation
 * @brief Which limit rejected a request
 */
enum class limit_violation : uint8_t
{
	requests_per_second = 1,
	requests_per_minute = 2,
	requests_per_hour = 3,
	concurrent_requests = 4
};

/**
 * @brief Convert limit_violation to string
 */
constexpr const char* to_string(limit_violation violation) noexcept
{
	switch (violation)
	{
	case limit_violation::requests_per_second:
		return "requests_per_second";
	case limit_violation::requests_per_minute:
		return "requests_per_minute";
	case limit_violation::requests_per_hour:
		return "requests_per_hour";
	case limit_violation::concurrent_requests:
		return "concurrent_requests";
	default:
		return "unknown";
	}
}

/**
 * @enum limit_scope
 * @brief Scope of the limit that rejected a request
 */
enum class limit_scope : uint8_t
{
	global = 1,
	client = 2
};

constexpr const char* to_string(limit_scope scope) noexcept
{
	switch (scope)
	{
	case limit_scope::global:
		return "global";
	case limit_scope::client:
		return "client";
	default:
		return "unknown";
	}
}

/**
 * @struct admission_result
 * @brief Outcome of check_and_admit()
 */
struct admission_result
{
	bool admitted = false;                    ///< Whether the request may proceed
	std::optional<limit_violation> violation; ///< Set when rejected
	limit_scope scope = limit_scope::client;  ///< Scope of the violated limit
	uint32_t current_usage = 0;               ///< Counter value at rejection
	uint32_t limit = 0;                       ///< Configured limit that was hit
	uint64_t retry_after_ms = 0;              ///< Time until the window resets
	uint64_t reset_time = 0;                  ///< Window reset (Unix epoch ms)

	explicit operator bool() const noexcept { return admitted; }
};

/**
 * @struct window_counters
 * @brief Fixed-window counters for one scope
 */
struct window_counters
{
	uint32_t per_second = 0;
	uint32_t per_minute = 0;
	uint32_t per_hour = 0;
	uint32_t concurrent = 0;
	std::chrono::steady_clock::time_point second_reset;
	std::chrono::steady_clock::time_point minute_reset;
	std::chrono::steady_clock::time_point hour_reset;
};

/**
 * @struct rate_limit_status
 * @brief Snapshot returned by status()
 */
struct rate_limit_status
{
	std::string client_id;
	uint32_t requests_per_second = 0;
	uint32_t requests_per_minute = 0;
	uint32_t requests_per_hour = 0;
	uint32_t concurrent_requests = 0;
	rate_limit_config limits;
	uint64_t second_reset = 0; ///< Next per-second reset (Unix epoch ms)
	uint64_t minute_reset = 0; ///< Next per-minute reset (Unix epoch ms)
	uint64_t hour_reset = 0;   ///< Next per-hour reset (Unix epoch ms)
	size_t recent_requests = 0; ///< Entries in the diagnostics ring
};

/**
 * @struct rate_limit_metrics
 * @brief Admission counters, updated with relaxed atomics
 */
struct rate_limit_metrics
{
	std::atomic<uint64_t> total_checks{ 0 };
	std::atomic<uint64_t> admitted{ 0 };
	std::atomic<uint64_t> rejected_global{ 0 };
	std::atomic<uint64_t> rejected_client{ 0 };
	std::atomic<uint64_t> rejected_per_second{ 0 };
	std::atomic<uint64_t> rejected_per_minute{ 0 };
	std::atomic<uint64_t> rejected_per_hour{ 0 };
	std::atomic<uint64_t> rejected_concurrent{ 0 };
	std::atomic<uint64_t> completions{ 0 };

	/**
	 * @brief Calculate rejection rate
	 * @return Rejection rate as percentage (0.0 to 100.0)
	 */
	[[nodiscard]] double rejection_rate() const noexcept;

	void reset() noexcept;
};

/**
 * @class rate_limiter
 * @brief Fixed-window rate limiter with global and per-client quotas
 *
 * Check and increment are one critical section: the global lock is taken
 * first, then the client's entry lock, so two concurrent callers for the
 * same client can never both pass a limit. Unrelated clients contend only
 * on the global counters.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - check_and_admit() never blocks on I/O
 *
 * Usage Example:
 * @code
 * rate_limiter_config config;
 * config.client.requests_per_second = 2;
 *
 * rate_limiter limiter(config);
 * auto result = limiter.check_and_admit("client-a");
 * if (!result.admitted) {
 *     // reject with retry_after_ms
 * }
 * // ... handle request ...
 * limiter.record_completion("client-a");
 * @endcode
 */
class rate_limiter
{
public:
	explicit rate_limiter(const rate_limiter_config& config = rate_limiter_config{});

	rate_limiter(const rate_limiter&) = delete;
	rate_limiter& operator=(const rate_limiter&) = delete;

	/**
	 * @brief Decide whether the client may issue one more request
	 * @param client_id Client identifier
	 * @return Admission result; counters change only when admitted
	 */
	[[nodiscard]] admission_result check_and_admit(const std::string& client_id);

	/**
	 * @brief Release the concurrent slot taken by an admitted request
	 * @param client_id Client identifier
	 */
	void record_completion(const std::string& client_id);

	/**
	 * @brief Snapshot of a client's counters, limits and next resets
	 */
	[[nodiscard]] rate_limit_status status(const std::string& client_id) const;

	/**
	 * @brief Snapshot of the gateway-wide counters
	 */
	[[nodiscard]] rate_limit_status global_status() const;

	/**
	 * @brief Check if a request path bypasses rate limiting
	 */
	[[nodiscard]] bool is_exempt(const std::string& path) const;

	/**
	 * @brief Override limits for a single client
	 */
	void set_client_limits(const std::string& client_id, const rate_limit_config& limits);

	/**
	 * @brief Clear a client's request windows
	 *
	 * A client with nothing in flight is forgotten entirely. Otherwise the
	 * window counts restart from zero while in-flight requests keep their
	 * concurrent slots until record_completion() releases them.
	 */
	void reset(const std::string& client_id);

	/**
	 * @brief Remove idle clients with no in-flight requests
	 * @return Number of entries removed
	 */
	size_t cleanup();

	/**
	 * @brief Number of tracked clients
	 */
	[[nodiscard]] size_t tracked_clients() const;

	[[nodiscard]] const rate_limiter_config& config() const noexcept;

	[[nodiscard]] const rate_limit_metrics& metrics() const noexcept;

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

private:
	struct client_entry
	{
		mutable std::mutex mutex;
		rate_limit_config limits;
		window_counters counters;
		std::deque<std::chrono::steady_clock::time_point> recent; ///< Diagnostics only
		std::chrono::steady_clock::time_point last_activity;
		bool retired = false; ///< Removed from the map by reset() or cleanup()
	};

	std::shared_ptr<client_entry> get_or_create(const std::string& client_id);
	std::shared_ptr<client_entry> find(const std::string& client_id) const;

	void record_rejection(const admission_result& result, const std::string& client_id);

	rate_limiter_config config_;

	mutable std::mutex global_mutex_;
	window_counters global_;

	mutable std::shared_mutex clients_mutex_;
	std::unordered_map<std::string, std::shared_ptr<client_entry>> clients_;
	std::unordered_map<std::string, rate_limit_config> overrides_;

	rate_limit_metrics metrics_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;

	static constexpr size_t MAX_RECENT_REQUESTS = 1000;
};

/**
 * @class admission_ticket
 * @brief Releases an admitted request's concurrent slot on destruction
 *
 * Movable, non-copyable. A default-constructed or moved-from ticket
 * releases nothing.
 */
class admission_ticket
{
public:
	admission_ticket() = default;
	admission_ticket(rate_limiter& limiter, std::string client_id);
	~admission_ticket();

	admission_ticket(const admission_ticket&) = delete;
	admission_ticket& operator=(const admission_ticket&) = delete;
	admission_ticket(admission_ticket&& other) noexcept;
	admission_ticket& operator=(admission_ticket&& other) noexcept;

	/**
	 * @brief Release the slot now instead of at destruction
	 */
	void release();

	[[nodiscard]] bool active() const noexcept { return limiter_ != nullptr; }

private:
	rate_limiter* limiter_ = nullptr;
	std::string client_id_;
};

} // namespace federation_gateway::admission
