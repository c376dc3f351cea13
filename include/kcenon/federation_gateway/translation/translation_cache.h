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
 * @file translation_cache.h
 * @brief LRU + TTL cache of schema translation responses
 *
 * Features:
 * - LRU eviction once max_entries is reached
 * - TTL-based expiration, checked on lookup
 * - Deterministic keys from version pair, canonical payload and client id
 * - Hits verified against the stored request identity, so two requests
 *   whose keys collide never share a response
 * - Thread-safe access via shared_mutex
 * - Hit, miss, eviction and expiration counters
 */

#pragma once

#include "translation_types.h"

#include <json/json.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace federation_gateway::translation
{

/**
 * @struct translation_cache_config
 * @brief Configuration for the translation cache
 */
struct translation_cache_config
{
	bool enabled = true;                    ///< Enable/disable cache
	size_t max_entries = 10000;             ///< Maximum number of cached entries
	std::chrono::seconds ttl{ 3600 };       ///< Time-to-live (0 = no expiration)
};

/**
 * @struct translation_cache_metrics
 * @brief Cache counters
 */
struct translation_cache_metrics
{
	std::atomic<uint64_t> hits{ 0 };
	std::atomic<uint64_t> misses{ 0 };
	std::atomic<uint64_t> evictions{ 0 };
	std::atomic<uint64_t> expirations{ 0 };
	std::atomic<uint64_t> puts{ 0 };
	std::atomic<uint64_t> collisions{ 0 }; ///< Key matched, identity did not

	/**
	 * @brief Calculate cache hit rate
	 * @return Hit rate as percentage (0.0 to 100.0)
	 */
	[[nodiscard]] double hit_rate() const noexcept
	{
		auto total = hits.load() + misses.load();
		if (total == 0)
			return 0.0;
		return static_cast<double>(hits.load()) / static_cast<double>(total) * 100.0;
	}

	void reset() noexcept
	{
		hits.store(0);
		misses.store(0);
		evictions.store(0);
		expirations.store(0);
		puts.store(0);
		collisions.store(0);
	}
};

/**
 * @class translation_cache
 * @brief Thread-safe LRU cache for translation responses
 *
 * Thread Safety:
 * - get() takes an exclusive lock because it reorders the LRU list
 * - size() takes a shared lock
 */
class translation_cache
{
public:
	explicit translation_cache(const translation_cache_config& config = translation_cache_config{});

	translation_cache(const translation_cache&) = delete;
	translation_cache& operator=(const translation_cache&) = delete;

	/**
	 * @brief Look up a cached response
	 * @param cache_key Key from make_key()
	 * @param identity Identity from make_identity(); must equal the stored one
	 * @return The response, or std::nullopt on miss, expiry, identity
	 *         mismatch or when disabled
	 */
	[[nodiscard]] std::optional<schema_translation_response> get(const std::string& cache_key,
																 const std::string& identity = "");

	/**
	 * @brief Store a response, replacing any entry under the same key
	 */
	void put(const std::string& cache_key,
			 const schema_translation_response& response,
			 const std::string& identity = "");

	/**
	 * @brief Build the cache key for a request
	 *
	 * Hash-combines the version pair, the canonical (sorted-key, compact)
	 * serialization of source_data and the optional client id, prefixed
	 * with "schema_translation:".
	 */
	[[nodiscard]] static std::string make_key(const schema_translation_request& request);

	/**
	 * @brief Full canonical form of a request, compared on every hit
	 */
	[[nodiscard]] static std::string make_identity(const schema_translation_request& request);

	void invalidate_key(const std::string& cache_key);

	void clear();

	[[nodiscard]] const translation_cache_metrics& metrics() const noexcept;

	void reset_metrics();

	[[nodiscard]] size_t size() const noexcept;

	[[nodiscard]] bool is_enabled() const noexcept;

	[[nodiscard]] const translation_cache_config& config() const noexcept;

private:
	struct cache_entry
	{
		std::string key;
		std::string identity;
		schema_translation_response response;
		std::chrono::steady_clock::time_point expires_at;
	};

	using cache_list = std::list<cache_entry>;
	using cache_map = std::unordered_map<std::string, cache_list::iterator>;

	[[nodiscard]] bool is_expired(const cache_entry& entry) const noexcept;

	void evict_lru();

	void remove_entry(cache_list::iterator it);

	translation_cache_config config_;
	mutable std::shared_mutex mutex_;

	cache_list lru_list_; ///< LRU ordering (front = most recent)
	cache_map cache_map_; ///< Key to list iterator mapping

	translation_cache_metrics metrics_;
};

/**
 * @brief Compact serialization with sorted object keys
 */
[[nodiscard]] std::string canonical_json(const Json::Value& value);

} // namespace federation_gateway::translation
