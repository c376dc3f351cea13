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

#include <kcenon/federation_gateway/translation/translation_cache.h>

#include <kcenon/federation_gateway/core/json_utils.h>

#include <functional>
#include <iterator>
#include <sstream>

namespace federation_gateway::translation
{

namespace
{

void hash_combine(size_t& seed, const std::string& value)
{
	seed ^= std::hash<std::string>{}(value) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

} // namespace

std::string canonical_json(const Json::Value& value)
{
	return write_json(value);
}

translation_cache::translation_cache(const translation_cache_config& config) : config_(config)
{
}

std::optional<schema_translation_response> translation_cache::get(const std::string& cache_key,
																  const std::string& identity)
{
	if (!config_.enabled)
	{
		return std::nullopt;
	}

	std::unique_lock lock(mutex_);

	auto it = cache_map_.find(cache_key);
	if (it == cache_map_.end())
	{
		++metrics_.misses;
		return std::nullopt;
	}

	auto& entry = *(it->second);

	if (is_expired(entry))
	{
		++metrics_.expirations;
		++metrics_.misses;
		remove_entry(it->second);
		return std::nullopt;
	}

	if (entry.identity != identity)
	{
		++metrics_.collisions;
		++metrics_.misses;
		return std::nullopt;
	}

	++metrics_.hits;
	lru_list_.splice(lru_list_.begin(), lru_list_, it->second);

	return entry.response;
}

void translation_cache::put(const std::string& cache_key,
							const schema_translation_response& response,
							const std::string& identity)
{
	if (!config_.enabled || config_.max_entries == 0)
	{
		return;
	}

	std::unique_lock lock(mutex_);

	auto existing = cache_map_.find(cache_key);
	if (existing != cache_map_.end())
	{
		remove_entry(existing->second);
	}

	while (cache_map_.size() >= config_.max_entries && !lru_list_.empty())
	{
		evict_lru();
	}

	cache_entry entry;
	entry.key = cache_key;
	entry.identity = identity;
	entry.response = response;

	if (config_.ttl.count() > 0)
	{
		entry.expires_at = std::chrono::steady_clock::now() + config_.ttl;
	}
	else
	{
		entry.expires_at = std::chrono::steady_clock::time_point::max();
	}

	lru_list_.push_front(std::move(entry));
	cache_map_[cache_key] = lru_list_.begin();

	++metrics_.puts;
}

std::string translation_cache::make_key(const schema_translation_request& request)
{
	size_t hash_value = std::hash<std::string>{}(request.source_version);
	hash_combine(hash_value, request.target_version);
	hash_combine(hash_value, canonical_json(request.source_data));
	hash_combine(hash_value, request.client_id.value_or(""));
	hash_combine(hash_value, request.client_id ? "1" : "0");

	std::ostringstream oss;
	oss << "schema_translation:" << std::hex << hash_value;
	return oss.str();
}

std::string translation_cache::make_identity(const schema_translation_request& request)
{
	std::string identity;
	identity.reserve(request.source_version.size() + request.target_version.size() + 64);
	identity += request.source_version;
	identity += '\n';
	identity += request.target_version;
	identity += '\n';
	identity += request.client_id ? "1:" + *request.client_id : std::string("0:");
	identity += '\n';
	identity += canonical_json(request.source_data);
	return identity;
}

void translation_cache::invalidate_key(const std::string& cache_key)
{
	std::unique_lock lock(mutex_);

	auto it = cache_map_.find(cache_key);
	if (it != cache_map_.end())
	{
		remove_entry(it->second);
	}
}

void translation_cache::clear()
{
	std::unique_lock lock(mutex_);

	lru_list_.clear();
	cache_map_.clear();
}

const translation_cache_metrics& translation_cache::metrics() const noexcept
{
	return metrics_;
}

void translation_cache::reset_metrics()
{
	metrics_.reset();
}

size_t translation_cache::size() const noexcept
{
	std::shared_lock lock(mutex_);
	return cache_map_.size();
}

bool translation_cache::is_enabled() const noexcept
{
	return config_.enabled;
}

const translation_cache_config& translation_cache::config() const noexcept
{
	return config_;
}

bool translation_cache::is_expired(const cache_entry& entry) const noexcept
{
	if (config_.ttl.count() == 0)
	{
		return false;
	}
	return std::chrono::steady_clock::now() > entry.expires_at;
}

void translation_cache::evict_lru()
{
	if (lru_list_.empty())
	{
		return;
	}

	remove_entry(std::prev(lru_list_.end()));
	++metrics_.evictions;
}

void translation_cache::remove_entry(cache_list::iterator it)
{
	cache_map_.erase(it->key);
	lru_list_.erase(it);
}

} // namespace federation_gateway::translation
