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
 * @file schema_translation_engine.h
 * @brief Cacheable translation-as-a-service with history
 *
 * Translates payloads between schema versions using the translator
 * registry shared with the proxy, returns field-mapping metadata, caches
 * responses by a deterministic key and logs every attempt to a per-pair
 * history.
 */

#pragma once

#include "translation_cache.h"
#include "translation_types.h"
#include "translator_registry.h"

#include <kcenon/federation_gateway/storage/repositories.h>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <json/json.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace federation_gateway::translation
{

/**
 * @struct schema_translation_metrics
 * @brief Translation counters; cache counters live in translation_cache_metrics
 */
struct schema_translation_metrics
{
	std::atomic<uint64_t> total_requests{ 0 };         ///< Every translate_schema() call
	std::atomic<uint64_t> successful_translations{ 0 }; ///< Misses translated successfully
	std::atomic<uint64_t> failed_translations{ 0 };
	std::atomic<uint64_t> cache_hits{ 0 };
	std::atomic<uint64_t> total_time_us{ 0 };           ///< Time spent translating misses

	[[nodiscard]] double success_rate() const noexcept;

	[[nodiscard]] double average_time_ms() const noexcept;

	void reset() noexcept;
};

/**
 * @class schema_translation_engine
 * @brief Thread-safe schema translation service
 *
 * Usage Example:
 * @code
 * auto engine = std::make_shared<schema_translation_engine>(
 *     translator_registry::with_defaults(),
 *     std::make_shared<storage::memory_translation_repository>());
 *
 * schema_translation_request request;
 * request.source_version = "v1.0";
 * request.target_version = "v2.0";
 * request.source_data["tool"] = "search";
 *
 * auto response = engine->translate_schema(request);
 * @endcode
 */
class schema_translation_engine
{
public:
	schema_translation_engine(std::shared_ptr<translator_registry> registry,
							  std::shared_ptr<storage::translation_repository> repository,
							  const translation_cache_config& cache_config = translation_cache_config{});

	schema_translation_engine(const schema_translation_engine&) = delete;
	schema_translation_engine& operator=(const schema_translation_engine&) = delete;

	/**
	 * @brief Translate a payload, serving repeated requests from cache
	 *
	 * Identical requests (versions, payload, client id) yield identical
	 * translated data. A miss stores a translation record and appends a
	 * history record; a failure appends a failed history record.
	 *
	 * @return Response, validation_error for empty versions, or
	 *         schema_translation_failed for an unregistered pair
	 */
	[[nodiscard]] kcenon::common::Result<schema_translation_response> translate_schema(
		const schema_translation_request& request);

	[[nodiscard]] kcenon::common::Result<schema_translation_record> get_translation(
		const std::string& translation_id) const;

	/**
	 * @brief Stored translations, oldest first, optionally for one client
	 */
	[[nodiscard]] kcenon::common::Result<std::vector<schema_translation_record>> list_translations(
		const std::optional<std::string>& client_id = std::nullopt) const;

	/**
	 * @brief History of attempts for one version pair, oldest first
	 */
	[[nodiscard]] kcenon::common::Result<std::vector<translation_history_record>>
	translation_history(const std::string& source_version, const std::string& target_version) const;

	/**
	 * @brief Health summary: status, counters, success rate, cache state
	 */
	[[nodiscard]] Json::Value health() const;

	/**
	 * @brief Flat counters for scraping
	 */
	[[nodiscard]] Json::Value metrics() const;

	[[nodiscard]] const schema_translation_metrics& stats() const noexcept { return metrics_; }

	[[nodiscard]] const translation_cache& cache() const noexcept { return cache_; }

	[[nodiscard]] const std::shared_ptr<translator_registry>& registry() const noexcept
	{
		return registry_;
	}

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

private:
	void append_history(const schema_translation_request& request,
						double duration_ms,
						size_t payload_size,
						const std::string& error_message);

	std::shared_ptr<translator_registry> registry_;
	std::shared_ptr<storage::translation_repository> repository_;
	translation_cache cache_;

	schema_translation_metrics metrics_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace federation_gateway::translation
