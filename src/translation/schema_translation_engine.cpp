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

#include <kcenon/federation_gateway/translation/schema_translation_engine.h>

#include <kcenon/federation_gateway/core/federation_error.h>
#include <kcenon/federation_gateway/core/id_generator.h>
#include <kcenon/federation_gateway/logging/console_logger.h>
#include <kcenon/federation_gateway/metrics/metrics_base.h>

#include <chrono>

namespace federation_gateway::translation
{

namespace
{

constexpr const char* MODULE = "schema_translation_engine";

using kcenon::common::interfaces::log_level;
using metrics::metrics_utils;

} // namespace

// ============================================================================
// schema_translation_metrics
// ============================================================================

double schema_translation_metrics::success_rate() const noexcept
{
	auto successful = successful_translations.load(std::memory_order_relaxed);
	auto failed = failed_translations.load(std::memory_order_relaxed);
	return metrics_utils::calculate_rate(successful, successful + failed);
}

double schema_translation_metrics::average_time_ms() const noexcept
{
	return metrics_utils::average_us_to_ms(total_time_us.load(std::memory_order_relaxed),
										   successful_translations.load(std::memory_order_relaxed)
											   + failed_translations.load(std::memory_order_relaxed));
}

void schema_translation_metrics::reset() noexcept
{
	total_requests.store(0, std::memory_order_relaxed);
	successful_translations.store(0, std::memory_order_relaxed);
	failed_translations.store(0, std::memory_order_relaxed);
	cache_hits.store(0, std::memory_order_relaxed);
	total_time_us.store(0, std::memory_order_relaxed);
}

// ============================================================================
// schema_translation_engine
// ============================================================================

schema_translation_engine::schema_translation_engine(
	std::shared_ptr<translator_registry> registry,
	std::shared_ptr<storage::translation_repository> repository,
	const translation_cache_config& cache_config)
	: registry_(std::move(registry))
	, repository_(std::move(repository))
	, cache_(cache_config)
{
}

kcenon::common::Result<schema_translation_response> schema_translation_engine::translate_schema(
	const schema_translation_request& request)
{
	metrics_.total_requests.fetch_add(1, std::memory_order_relaxed);

	if (request.source_version.empty())
	{
		return make_validation_error(MODULE, "source_version", "must not be empty");
	}
	if (request.target_version.empty())
	{
		return make_validation_error(MODULE, "target_version", "must not be empty");
	}

	auto cache_key = translation_cache::make_key(request);
	auto cache_identity = translation_cache::make_identity(request);
	if (auto cached = cache_.get(cache_key, cache_identity))
	{
		metrics_.cache_hits.fetch_add(1, std::memory_order_relaxed);
		return *cached;
	}

	auto payload_size = canonical_json(request.source_data).size();
	auto start = std::chrono::steady_clock::now();
	auto translated
		= registry_->translate(request.source_data, request.source_version, request.target_version);
	auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
						  std::chrono::steady_clock::now() - start)
						  .count();
	auto duration_ms = static_cast<double>(elapsed_us) / 1000.0;

	metrics_.total_time_us.fetch_add(static_cast<uint64_t>(elapsed_us), std::memory_order_relaxed);

	if (translated.is_err())
	{
		metrics_.failed_translations.fetch_add(1, std::memory_order_relaxed);
		append_history(request, duration_ms, payload_size, translated.error().message);
		logging::emit(logger_, log_level::warning,
					  "Schema translation failed: " + translated.error().message);
		return translated.error();
	}

	auto& output = translated.value();

	schema_translation_response response;
	response.translated_data = output.payload;
	response.metadata.translation_id = generate_id();
	response.metadata.mapped_fields = output.mapped_fields;
	response.metadata.dropped_fields = output.dropped_fields;
	response.metadata.defaulted_fields = output.defaulted_fields;
	response.metadata.duration_ms = duration_ms;
	response.warnings = output.warnings;

	schema_translation_record record;
	record.id = response.metadata.translation_id;
	record.cache_key = cache_key;
	record.source_version = request.source_version;
	record.target_version = request.target_version;
	record.client_id = request.client_id;
	record.response = response;
	record.created_at = std::chrono::system_clock::now();

	auto stored = repository_->put_translation(record);
	if (stored.is_err())
	{
		metrics_.failed_translations.fetch_add(1, std::memory_order_relaxed);
		append_history(request, duration_ms, payload_size, stored.error().message);
		logging::emit(logger_, log_level::error,
					  "Failed to store translation " + record.id + ": " + stored.error().message);
		return stored.error();
	}

	metrics_.successful_translations.fetch_add(1, std::memory_order_relaxed);
	cache_.put(cache_key, response, cache_identity);
	append_history(request, duration_ms, payload_size, "");

	logging::emit(logger_, log_level::debug,
				  "Translated " + request.source_version + " -> " + request.target_version + " ("
					  + record.id + ")");
	return response;
}

kcenon::common::Result<schema_translation_record> schema_translation_engine::get_translation(
	const std::string& translation_id) const
{
	return repository_->get_translation(translation_id);
}

kcenon::common::Result<std::vector<schema_translation_record>>
schema_translation_engine::list_translations(const std::optional<std::string>& client_id) const
{
	if (!client_id)
	{
		return repository_->list_translations({});
	}

	return repository_->list_translations([&client_id](const schema_translation_record& record)
										  { return record.client_id == client_id; });
}

kcenon::common::Result<std::vector<translation_history_record>>
schema_translation_engine::translation_history(const std::string& source_version,
											   const std::string& target_version) const
{
	return repository_->history(translator_registry::make_key(source_version, target_version));
}

Json::Value schema_translation_engine::health() const
{
	auto attempts = metrics_.successful_translations.load(std::memory_order_relaxed)
					+ metrics_.failed_translations.load(std::memory_order_relaxed);
	auto rate = metrics_.success_rate();

	Json::Value result(Json::objectValue);
	result["status"] = metrics::to_string(metrics::classify_health(rate, attempts));
	result["total_requests"]
		= Json::UInt64(metrics_.total_requests.load(std::memory_order_relaxed));
	result["successful_translations"]
		= Json::UInt64(metrics_.successful_translations.load(std::memory_order_relaxed));
	result["failed_translations"]
		= Json::UInt64(metrics_.failed_translations.load(std::memory_order_relaxed));
	result["success_rate"] = rate;
	result["average_translation_time_ms"] = metrics_.average_time_ms();
	result["cache_size"] = Json::UInt64(cache_.size());
	result["cache_hit_rate"] = cache_.metrics().hit_rate();
	result["translators_loaded"] = Json::UInt64(registry_->size());
	return result;
}

Json::Value schema_translation_engine::metrics() const
{
	const auto& cache_metrics = cache_.metrics();

	Json::Value result(Json::objectValue);
	result["translation_requests_total"]
		= Json::UInt64(metrics_.total_requests.load(std::memory_order_relaxed));
	result["translation_successful"]
		= Json::UInt64(metrics_.successful_translations.load(std::memory_order_relaxed));
	result["translation_failed"]
		= Json::UInt64(metrics_.failed_translations.load(std::memory_order_relaxed));
	result["translation_cache_hits"] = Json::UInt64(cache_metrics.hits.load());
	result["translation_cache_misses"] = Json::UInt64(cache_metrics.misses.load());
	result["translation_cache_evictions"] = Json::UInt64(cache_metrics.evictions.load());
	result["translation_cache_expirations"] = Json::UInt64(cache_metrics.expirations.load());
	result["translation_cache_size"] = Json::UInt64(cache_.size());
	result["translation_average_time_ms"] = metrics_.average_time_ms();
	result["translators_loaded"] = Json::UInt64(registry_->size());
	return result;
}

void schema_translation_engine::set_logger(
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
}

void schema_translation_engine::append_history(const schema_translation_request& request,
											   double duration_ms,
											   size_t payload_size,
											   const std::string& error_message)
{
	translation_history_record record;
	record.timestamp = std::chrono::system_clock::now();
	record.source_version = request.source_version;
	record.target_version = request.target_version;
	record.duration_ms = duration_ms;
	record.success = error_message.empty();
	record.error_message = error_message;
	record.payload_size = payload_size;

	auto appended = repository_->append_history(
		translator_registry::make_key(request.source_version, request.target_version), record);
	if (appended.is_err())
	{
		logging::emit(logger_, log_level::warning,
					  "Failed to append translation history: " + appended.error().message);
	}
}

} // namespace federation_gateway::translation
