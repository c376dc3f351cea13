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
 * @file schema_translation_test.cpp
 * @brief Unit tests for translator_registry, translation_cache and schema_translation_engine
 *
 * Tests cover:
 * - Default v1.0 <-> v2.0 field mapping (renames, drops, defaults)
 * - Registry registration, lookup and missing pairs
 * - LRU eviction and TTL expiry of cached translations
 * - Engine caching, history recording, persistence and observability
 * - JSON codec field validation
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

#include <kcenon/federation_gateway/core/federation_error.h>
#include <kcenon/federation_gateway/storage/memory_repositories.h>
#include <kcenon/federation_gateway/translation/schema_translation_engine.h>
#include <kcenon/federation_gateway/translation/translation_cache.h>
#include <kcenon/federation_gateway/translation/translation_codec.h>
#include <kcenon/federation_gateway/translation/translator_registry.h>

using namespace federation_gateway;
using namespace federation_gateway::translation;

namespace
{

Json::Value v1_payload()
{
	Json::Value payload(Json::objectValue);
	payload["tool"] = "search";
	payload["args"]["query"] = "weather";
	payload["session"] = "abc";
	payload["id"] = 7;
	return payload;
}

schema_translation_request upgrade_request(Json::Value data = v1_payload())
{
	schema_translation_request request;
	request.source_version = "v1.0";
	request.target_version = "v2.0";
	request.source_data = std::move(data);
	return request;
}

} // namespace

// ============================================================================
// Translator Registry Tests
// ============================================================================

class TranslatorRegistryTest : public ::testing::Test
{
protected:
	std::shared_ptr<translator_registry> registry_ = translator_registry::with_defaults();
};

TEST_F(TranslatorRegistryTest, DefaultsRegisterBothDirections)
{
	EXPECT_EQ(registry_->size(), 2u);
	auto keys = registry_->keys();
	ASSERT_EQ(keys.size(), 2u);
	EXPECT_EQ(keys[0], "v1.0->v2.0");
	EXPECT_EQ(keys[1], "v2.0->v1.0");
	EXPECT_EQ(registry_->find("v1.0", "v2.0")->name(), "V1ToV2Translator");
}

TEST_F(TranslatorRegistryTest, UpgradeRenamesDropsAndDefaults)
{
	auto result = registry_->translate(v1_payload(), "v1.0", "v2.0");
	ASSERT_TRUE(result.is_ok());

	const auto& output = result.value();
	EXPECT_EQ(output.payload["name"].asString(), "search");
	EXPECT_EQ(output.payload["arguments"]["query"].asString(), "weather");
	EXPECT_EQ(output.payload["jsonrpc"].asString(), "2.0");
	EXPECT_EQ(output.payload["id"].asInt(), 7);
	EXPECT_FALSE(output.payload.isMember("tool"));
	EXPECT_FALSE(output.payload.isMember("session"));

	std::vector<std::string> mapped = { "arguments", "id", "name" };
	EXPECT_EQ(output.mapped_fields, mapped);
	EXPECT_EQ(output.dropped_fields, std::vector<std::string>{ "session" });
	EXPECT_EQ(output.defaulted_fields, std::vector<std::string>{ "jsonrpc" });
	EXPECT_TRUE(output.warnings.empty());
}

TEST_F(TranslatorRegistryTest, DowngradeReversesRenames)
{
	Json::Value payload(Json::objectValue);
	payload["jsonrpc"] = "2.0";
	payload["name"] = "search";
	payload["arguments"]["query"] = "news";

	auto result = registry_->translate(payload, "v2.0", "v1.0");
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().payload["tool"].asString(), "search");
	EXPECT_EQ(result.value().payload["args"]["query"].asString(), "news");
	EXPECT_FALSE(result.value().payload.isMember("jsonrpc"));
	EXPECT_TRUE(result.value().defaulted_fields.empty());
}

TEST_F(TranslatorRegistryTest, ExistingDefaultIsKept)
{
	auto payload = v1_payload();
	payload["jsonrpc"] = "1.5";

	auto result = registry_->translate(payload, "v1.0", "v2.0");
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().payload["jsonrpc"].asString(), "1.5");
	EXPECT_TRUE(result.value().defaulted_fields.empty());
}

TEST_F(TranslatorRegistryTest, RenameConflictDropsSourceWithWarning)
{
	auto payload = v1_payload();
	payload["name"] = "explicit";

	auto result = registry_->translate(payload, "v1.0", "v2.0");
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().payload["name"].asString(), "explicit");
	ASSERT_EQ(result.value().warnings.size(), 1u);
	EXPECT_EQ(result.value().warnings[0],
			  "Field 'tool' not renamed to 'name': target already present");

	const auto& dropped = result.value().dropped_fields;
	EXPECT_NE(std::find(dropped.begin(), dropped.end(), "tool"), dropped.end());
}

TEST_F(TranslatorRegistryTest, NonObjectPayloadPassesThrough)
{
	Json::Value payload(Json::arrayValue);
	payload.append(1);
	payload.append(2);

	auto result = registry_->translate(payload, "v1.0", "v2.0");
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().payload, payload);
	ASSERT_EQ(result.value().warnings.size(), 1u);
	EXPECT_EQ(result.value().warnings[0], "Payload is not an object; passed through unchanged");
}

TEST_F(TranslatorRegistryTest, IdenticalVersionsAreIdentity)
{
	auto payload = v1_payload();
	auto result = registry_->translate(payload, "v3.0", "v3.0");

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().payload, payload);
	EXPECT_EQ(result.value().mapped_fields.size(), 4u);
	EXPECT_TRUE(registry_->supports("v3.0", "v3.0"));
}

TEST_F(TranslatorRegistryTest, MissingPairFails)
{
	auto result = registry_->translate(v1_payload(), "v1.0", "v3.0");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(error_kind_of(result.error()), error_code::schema_translation_failed);
	EXPECT_EQ(result.error().message, "No translator available for v1.0 -> v3.0");
	EXPECT_FALSE(registry_->supports("v1.0", "v3.0"));
}

TEST_F(TranslatorRegistryTest, RegisterAndUnregisterCustomTranslator)
{
	field_mapping_rules rules;
	rules.renames = { { "name", "method" } };
	registry_->register_translator(
		std::make_shared<field_mapping_translator>("V2ToV3", "v2.0", "v3.0", rules));

	EXPECT_EQ(registry_->size(), 3u);
	EXPECT_TRUE(registry_->supports("v2.0", "v3.0"));

	Json::Value payload(Json::objectValue);
	payload["name"] = "search";
	auto result = registry_->translate(payload, "v2.0", "v3.0");
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().payload["method"].asString(), "search");

	EXPECT_TRUE(registry_->unregister_translator("v2.0", "v3.0"));
	EXPECT_FALSE(registry_->unregister_translator("v2.0", "v3.0"));
	EXPECT_EQ(registry_->find("v2.0", "v3.0"), nullptr);
}

TEST_F(TranslatorRegistryTest, NullTranslatorIgnored)
{
	registry_->register_translator(nullptr);
	EXPECT_EQ(registry_->size(), 2u);
}

// ============================================================================
// Translation Cache Tests
// ============================================================================

class TranslationCacheTest : public ::testing::Test
{
protected:
	static schema_translation_response response_with_id(const std::string& id)
	{
		schema_translation_response response;
		response.metadata.translation_id = id;
		return response;
	}
};

TEST_F(TranslationCacheTest, KeyIgnoresMemberOrderButNotClient)
{
	Json::Value first(Json::objectValue);
	first["a"] = 1;
	first["b"] = 2;
	Json::Value second(Json::objectValue);
	second["b"] = 2;
	second["a"] = 1;

	auto request_a = upgrade_request(first);
	auto request_b = upgrade_request(second);
	EXPECT_EQ(translation_cache::make_key(request_a), translation_cache::make_key(request_b));

	request_b.client_id = "client-1";
	EXPECT_NE(translation_cache::make_key(request_a), translation_cache::make_key(request_b));
	EXPECT_EQ(translation_cache::make_key(request_a).rfind("schema_translation:", 0), 0u);
}

TEST_F(TranslationCacheTest, CollidingKeyDoesNotReturnOtherRequest)
{
	Json::Value first(Json::objectValue);
	first["tool"] = "search";
	Json::Value second(Json::objectValue);
	second["tool"] = "weather";

	auto identity_a = translation_cache::make_identity(upgrade_request(first));
	auto identity_b = translation_cache::make_identity(upgrade_request(second));
	ASSERT_NE(identity_a, identity_b);

	// Force both requests onto one key
	translation_cache cache;
	cache.put("shared", response_with_id("for-a"), identity_a);

	EXPECT_FALSE(cache.get("shared", identity_b).has_value());
	EXPECT_EQ(cache.metrics().collisions.load(), 1u);

	auto hit = cache.get("shared", identity_a);
	ASSERT_TRUE(hit.has_value());
	EXPECT_EQ(hit->metadata.translation_id, "for-a");

	cache.put("shared", response_with_id("for-b"), identity_b);
	EXPECT_EQ(cache.get("shared", identity_b)->metadata.translation_id, "for-b");
	EXPECT_FALSE(cache.get("shared", identity_a).has_value());
	EXPECT_EQ(cache.size(), 1u);
}

TEST_F(TranslationCacheTest, EvictsLeastRecentlyUsed)
{
	translation_cache_config config;
	config.max_entries = 2;
	translation_cache cache(config);

	cache.put("a", response_with_id("1"));
	cache.put("b", response_with_id("2"));
	ASSERT_TRUE(cache.get("a").has_value());

	cache.put("c", response_with_id("3"));

	EXPECT_EQ(cache.size(), 2u);
	EXPECT_TRUE(cache.get("a").has_value());
	EXPECT_FALSE(cache.get("b").has_value());
	EXPECT_TRUE(cache.get("c").has_value());
	EXPECT_EQ(cache.metrics().evictions.load(), 1u);
}

TEST_F(TranslationCacheTest, ExpiredEntriesMiss)
{
	translation_cache_config config;
	config.ttl = std::chrono::seconds(1);
	translation_cache cache(config);

	cache.put("key", response_with_id("1"));
	ASSERT_TRUE(cache.get("key").has_value());

	std::this_thread::sleep_for(std::chrono::milliseconds(1100));

	EXPECT_FALSE(cache.get("key").has_value());
	EXPECT_EQ(cache.metrics().expirations.load(), 1u);
	EXPECT_EQ(cache.size(), 0u);
}

TEST_F(TranslationCacheTest, DisabledCacheStoresNothing)
{
	translation_cache_config config;
	config.enabled = false;
	translation_cache cache(config);

	cache.put("key", response_with_id("1"));
	EXPECT_FALSE(cache.get("key").has_value());
	EXPECT_EQ(cache.size(), 0u);
}

TEST_F(TranslationCacheTest, InvalidateAndClear)
{
	translation_cache cache;
	cache.put("a", response_with_id("1"));
	cache.put("b", response_with_id("2"));

	cache.invalidate_key("a");
	EXPECT_FALSE(cache.get("a").has_value());
	EXPECT_EQ(cache.size(), 1u);

	cache.clear();
	EXPECT_EQ(cache.size(), 0u);
}

// ============================================================================
// Schema Translation Engine Tests
// ============================================================================

class SchemaTranslationEngineTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		repository_ = std::make_shared<storage::memory_translation_repository>();
		engine_ = std::make_unique<schema_translation_engine>(translator_registry::with_defaults(),
															  repository_);
	}

	std::shared_ptr<storage::memory_translation_repository> repository_;
	std::unique_ptr<schema_translation_engine> engine_;
};

TEST_F(SchemaTranslationEngineTest, TranslatesAndDescribesFields)
{
	auto result = engine_->translate_schema(upgrade_request());

	ASSERT_TRUE(result.is_ok());
	const auto& response = result.value();
	EXPECT_FALSE(response.metadata.translation_id.empty());
	EXPECT_EQ(response.translated_data["name"].asString(), "search");
	EXPECT_EQ(response.metadata.dropped_fields, std::vector<std::string>{ "session" });
	EXPECT_EQ(response.metadata.defaulted_fields, std::vector<std::string>{ "jsonrpc" });
	EXPECT_GE(response.metadata.duration_ms, 0.0);

	EXPECT_EQ(engine_->stats().successful_translations.load(), 1u);
	EXPECT_EQ(engine_->cache().size(), 1u);
}

TEST_F(SchemaTranslationEngineTest, RepeatedRequestServedFromCache)
{
	auto first = engine_->translate_schema(upgrade_request());
	auto second = engine_->translate_schema(upgrade_request());

	ASSERT_TRUE(first.is_ok());
	ASSERT_TRUE(second.is_ok());
	EXPECT_EQ(first.value().metadata.translation_id, second.value().metadata.translation_id);

	EXPECT_EQ(engine_->stats().total_requests.load(), 2u);
	EXPECT_EQ(engine_->stats().cache_hits.load(), 1u);
	EXPECT_EQ(engine_->stats().successful_translations.load(), 1u);

	auto history = engine_->translation_history("v1.0", "v2.0");
	ASSERT_TRUE(history.is_ok());
	EXPECT_EQ(history.value().size(), 1u);
}

TEST_F(SchemaTranslationEngineTest, EmptyVersionsRejected)
{
	auto request = upgrade_request();
	request.source_version.clear();

	auto result = engine_->translate_schema(request);
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(error_kind_of(result.error()), error_code::validation_error);
	EXPECT_NE(result.error().message.find("source_version"), std::string::npos);

	request = upgrade_request();
	request.target_version.clear();
	result = engine_->translate_schema(request);
	ASSERT_TRUE(result.is_err());
	EXPECT_NE(result.error().message.find("target_version"), std::string::npos);
}

TEST_F(SchemaTranslationEngineTest, HistoryRecordsSuccessAndFailure)
{
	ASSERT_TRUE(engine_->translate_schema(upgrade_request()).is_ok());

	auto unsupported = upgrade_request();
	unsupported.target_version = "v9.0";
	auto failed = engine_->translate_schema(unsupported);
	ASSERT_TRUE(failed.is_err());
	EXPECT_EQ(error_kind_of(failed.error()), error_code::schema_translation_failed);

	auto successes = engine_->translation_history("v1.0", "v2.0");
	ASSERT_TRUE(successes.is_ok());
	ASSERT_EQ(successes.value().size(), 1u);
	EXPECT_TRUE(successes.value()[0].success);
	EXPECT_GT(successes.value()[0].payload_size, 0u);

	auto failures = engine_->translation_history("v1.0", "v9.0");
	ASSERT_TRUE(failures.is_ok());
	ASSERT_EQ(failures.value().size(), 1u);
	EXPECT_FALSE(failures.value()[0].success);
	EXPECT_EQ(failures.value()[0].error_message, "No translator available for v1.0 -> v9.0");

	EXPECT_EQ(engine_->stats().failed_translations.load(), 1u);
	EXPECT_DOUBLE_EQ(engine_->stats().success_rate(), 50.0);
}

TEST_F(SchemaTranslationEngineTest, HistoryIsBoundedPerPair)
{
	repository_ = std::make_shared<storage::memory_translation_repository>(3);
	engine_ = std::make_unique<schema_translation_engine>(translator_registry::with_defaults(),
														  repository_);

	for (int i = 0; i < 5; ++i)
	{
		auto payload = v1_payload();
		payload["id"] = i;
		ASSERT_TRUE(engine_->translate_schema(upgrade_request(payload)).is_ok());
	}

	auto history = engine_->translation_history("v1.0", "v2.0");
	ASSERT_TRUE(history.is_ok());
	EXPECT_EQ(history.value().size(), 3u);
}

TEST_F(SchemaTranslationEngineTest, StoredTranslationsAreQueryable)
{
	auto request = upgrade_request();
	request.client_id = "client-a";
	auto first = engine_->translate_schema(request);
	ASSERT_TRUE(first.is_ok());

	auto other = upgrade_request();
	other.client_id = "client-b";
	ASSERT_TRUE(engine_->translate_schema(other).is_ok());

	auto stored = engine_->get_translation(first.value().metadata.translation_id);
	ASSERT_TRUE(stored.is_ok());
	EXPECT_EQ(stored.value().source_version, "v1.0");
	EXPECT_EQ(stored.value().client_id, std::optional<std::string>("client-a"));
	EXPECT_EQ(stored.value().response.translated_data["name"].asString(), "search");

	auto mine = engine_->list_translations(std::string("client-a"));
	ASSERT_TRUE(mine.is_ok());
	EXPECT_EQ(mine.value().size(), 1u);

	auto all = engine_->list_translations();
	ASSERT_TRUE(all.is_ok());
	EXPECT_EQ(all.value().size(), 2u);

	auto missing = engine_->get_translation("nope");
	ASSERT_TRUE(missing.is_err());
	EXPECT_EQ(error_kind_of(missing.error()), error_code::not_found);
}

TEST_F(SchemaTranslationEngineTest, HealthAndMetricsDocuments)
{
	ASSERT_TRUE(engine_->translate_schema(upgrade_request()).is_ok());
	ASSERT_TRUE(engine_->translate_schema(upgrade_request()).is_ok());

	auto health = engine_->health();
	EXPECT_EQ(health["status"].asString(), "healthy");
	EXPECT_EQ(health["total_requests"].asUInt64(), 2u);
	EXPECT_EQ(health["successful_translations"].asUInt64(), 1u);
	EXPECT_EQ(health["cache_size"].asUInt64(), 1u);
	EXPECT_DOUBLE_EQ(health["cache_hit_rate"].asDouble(), 50.0);
	EXPECT_EQ(health["translators_loaded"].asUInt64(), 2u);

	auto metrics = engine_->metrics();
	EXPECT_EQ(metrics["translation_requests_total"].asUInt64(), 2u);
	EXPECT_EQ(metrics["translation_cache_hits"].asUInt64(), 1u);
	EXPECT_EQ(metrics["translation_cache_misses"].asUInt64(), 1u);
}

TEST_F(SchemaTranslationEngineTest, RepeatedFailuresMakeEngineUnhealthy)
{
	for (int i = 0; i < 10; ++i)
	{
		auto request = upgrade_request();
		request.target_version = "v9.0";
		EXPECT_TRUE(engine_->translate_schema(request).is_err());
	}

	EXPECT_EQ(engine_->health()["status"].asString(), "unhealthy");
}

// ============================================================================
// Translation Codec Tests
// ============================================================================

TEST(TranslationCodecTest, ParsesRequest)
{
	Json::Value json(Json::objectValue);
	json["source_version"] = "v1.0";
	json["target_version"] = "v2.0";
	json["source_data"] = v1_payload();
	json["client_id"] = "client-a";

	auto request = request_from_json(json);
	ASSERT_TRUE(request.is_ok());
	EXPECT_EQ(request.value().source_version, "v1.0");
	EXPECT_EQ(request.value().client_id, std::optional<std::string>("client-a"));
	EXPECT_EQ(to_json(request.value()), json);
}

TEST(TranslationCodecTest, RejectsMissingOrMistypedFields)
{
	Json::Value json(Json::objectValue);
	json["target_version"] = "v2.0";
	json["source_data"] = v1_payload();

	auto missing_source = request_from_json(json);
	ASSERT_TRUE(missing_source.is_err());
	EXPECT_NE(missing_source.error().message.find("source_version"), std::string::npos);

	json["source_version"] = "v1.0";
	json.removeMember("source_data");
	auto missing_data = request_from_json(json);
	ASSERT_TRUE(missing_data.is_err());
	EXPECT_NE(missing_data.error().message.find("source_data"), std::string::npos);

	json["source_data"] = v1_payload();
	json["client_id"] = 12;
	auto bad_client = request_from_json(json);
	ASSERT_TRUE(bad_client.is_err());
	EXPECT_NE(bad_client.error().message.find("client_id"), std::string::npos);

	EXPECT_TRUE(request_from_json(Json::Value("text")).is_err());
}

TEST(TranslationCodecTest, ResponseDocumentShape)
{
	schema_translation_response response;
	response.translated_data["name"] = "search";
	response.metadata.translation_id = "t-1";
	response.metadata.mapped_fields = { "name" };
	response.warnings = { "note" };

	auto json = to_json(response);
	EXPECT_EQ(json["translation_metadata"]["translation_id"].asString(), "t-1");
	EXPECT_EQ(json["translation_metadata"]["mapped_fields"][0].asString(), "name");
	EXPECT_EQ(json["warnings"][0].asString(), "note");

	auto parsed = response_from_json(json);
	ASSERT_TRUE(parsed.is_ok());
	EXPECT_EQ(parsed.value().metadata.translation_id, "t-1");

	json["translation_metadata"]["dropped_fields"] = "session";
	auto bad = response_from_json(json);
	ASSERT_TRUE(bad.is_err());
	EXPECT_NE(bad.error().message.find("dropped_fields"), std::string::npos);
}
