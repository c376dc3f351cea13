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
 * @file proxy_test.cpp
 * @brief Unit tests for mcp_proxy, retry_policy and protocol_translator
 *
 * Tests cover:
 * - Forwarding (URL joining, headers, timeouts, methods)
 * - Inline protocol translation in both directions
 * - Error tagging, retry with backoff and HTTP status classification
 * - Circuit breaker fail-fast behavior
 * - Routing, health and metrics documents
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>

#include <kcenon/federation_gateway/core/federation_error.h>
#include <kcenon/federation_gateway/proxy/mcp_proxy.h>
#include <kcenon/federation_gateway/proxy/protocol_translator.h>
#include <kcenon/federation_gateway/proxy/retry_policy.h>

#include "mock_transport.h"

using namespace federation_gateway;
using namespace federation_gateway::proxy;
using federation_gateway::test_support::mock_transport;

// ============================================================================
// Retry Policy Tests
// ============================================================================

class RetryPolicyTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		config_.max_attempts = 4;
		config_.base_delay = std::chrono::milliseconds(100);
		config_.max_delay = std::chrono::milliseconds(350);
		config_.multiplier = 2.0;
		config_.jitter = false;
	}

	retry_config config_;
};

TEST_F(RetryPolicyTest, DelayGrowsExponentiallyAndCaps)
{
	retry_policy policy(config_);

	EXPECT_EQ(policy.next_delay(0), std::chrono::milliseconds(100));
	EXPECT_EQ(policy.next_delay(1), std::chrono::milliseconds(200));
	EXPECT_EQ(policy.next_delay(2), std::chrono::milliseconds(350));
	EXPECT_EQ(policy.next_delay(10), std::chrono::milliseconds(350));
}

TEST_F(RetryPolicyTest, JitterStaysWithinHalfToFull)
{
	config_.jitter = true;
	retry_policy policy(config_);

	for (int i = 0; i < 50; ++i)
	{
		auto delay = policy.next_delay(1);
		EXPECT_GE(delay, std::chrono::milliseconds(100));
		EXPECT_LE(delay, std::chrono::milliseconds(200));
	}
}

TEST_F(RetryPolicyTest, OnlyRetryableErrorsWithinBudget)
{
	retry_policy policy(config_);

	auto transport = make_error(error_code::external_service_error, "down", "test");
	auto validation = make_validation_error("test", "field", "bad");

	EXPECT_TRUE(policy.should_retry(transport, 0));
	EXPECT_TRUE(policy.should_retry(transport, 2));
	EXPECT_FALSE(policy.should_retry(transport, 3));
	EXPECT_FALSE(policy.should_retry(validation, 0));
}

TEST_F(RetryPolicyTest, WaitStopsWhenInterrupted)
{
	config_.base_delay = std::chrono::milliseconds(5000);
	config_.max_delay = std::chrono::milliseconds(5000);
	retry_policy policy(config_);

	auto start = std::chrono::steady_clock::now();
	EXPECT_FALSE(policy.wait(0, []() { return true; }));
	EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1000));
}

// ============================================================================
// Protocol Translator Tests
// ============================================================================

class ProtocolTranslatorTest : public ::testing::Test
{
protected:
	protocol_translator translator_{ nullptr };
};

TEST_F(ProtocolTranslatorTest, SupportsBothVersions)
{
	EXPECT_TRUE(protocol_translator::is_supported("1.0"));
	EXPECT_TRUE(protocol_translator::is_supported("2.0"));
	EXPECT_FALSE(protocol_translator::is_supported("3.0"));
	EXPECT_EQ(protocol_translator::registry_version("1.0"), "v1.0");
}

TEST_F(ProtocolTranslatorTest, IdenticalVersionsAreIdentity)
{
	Json::Value body;
	body["anything"] = 1;

	auto result = translator_.translate(body, "2.0", "2.0");
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value(), body);
}

TEST_F(ProtocolTranslatorTest, TranslatesDownAndUp)
{
	Json::Value v2;
	v2["jsonrpc"] = "2.0";
	v2["name"] = "search";
	v2["arguments"]["q"] = "weather";

	auto down = translator_.translate(v2, "2.0", "1.0");
	ASSERT_TRUE(down.is_ok());
	EXPECT_EQ(down.value()["tool"].asString(), "search");
	EXPECT_EQ(down.value()["args"]["q"].asString(), "weather");
	EXPECT_FALSE(down.value().isMember("jsonrpc"));

	auto up = translator_.translate(down.value(), "1.0", "2.0");
	ASSERT_TRUE(up.is_ok());
	EXPECT_EQ(up.value(), v2);
}

TEST_F(ProtocolTranslatorTest, MissingPairIsTranslationFailure)
{
	auto result = translator_.translate(Json::Value(Json::objectValue), "2.0", "9.9");
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(error_kind_of(result.error()), error_code::schema_translation_failed);
	EXPECT_EQ(result.error().message, "No translator available for v2.0 -> v9.9");
}

TEST_F(ProtocolTranslatorTest, UsesTranslatorsRegisteredLater)
{
	translation::field_mapping_rules rules;
	rules.renames = { { "name", "method" } };
	translator_.registry()->register_translator(
		std::make_shared<translation::field_mapping_translator>("V2ToV3", "v2.0", "v3.0", rules));

	Json::Value body(Json::objectValue);
	body["name"] = "search";

	auto result = translator_.translate(body, "2.0", "3.0");
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value()["method"].asString(), "search");
	EXPECT_FALSE(result.value().isMember("name"));
}

// ============================================================================
// Proxy Tests
// ============================================================================

class ProxyTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		config_.retry.max_attempts = 1;
		config_.retry.base_delay = std::chrono::milliseconds(1);
		config_.retry.max_delay = std::chrono::milliseconds(5);
		config_.retry.jitter = false;
		config_.circuit_breaker.degraded_threshold = 1;
		config_.circuit_breaker.failure_threshold = 2;
		config_.circuit_breaker.open_timeout = std::chrono::milliseconds(60000);
		transport_ = std::make_shared<mock_transport>();
	}

	std::shared_ptr<mcp_proxy> make_proxy()
	{
		pool_ = std::make_shared<connection_pool>(config_);
		auto translator = std::make_shared<protocol_translator>(nullptr);
		return std::make_shared<mcp_proxy>(pool_, translator, transport_);
	}

	static proxy_request request(const std::string& path = "/tools/call")
	{
		proxy_request req;
		req.path = path;
		req.body["jsonrpc"] = "2.0";
		req.body["name"] = "search";
		req.body["arguments"]["q"] = "weather";
		return req;
	}

	proxy_config config_;
	std::shared_ptr<connection_pool> pool_;
	std::shared_ptr<mock_transport> transport_;
};

TEST_F(ProxyTest, ForwardsToProviderAddress)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search:9000/", "2.0").is_ok());

	auto req = request();
	req.headers["x-trace"] = "abc";
	req.method = "PUT";

	auto result = proxy->proxy_request("search", req);
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().status_code, 200);
	EXPECT_EQ(result.value().body, req.body);

	auto sent = transport_->requests();
	ASSERT_EQ(sent.size(), 1u);
	EXPECT_EQ(sent[0].server_id, "search");
	EXPECT_EQ(sent[0].url, "http://search:9000/tools/call");
	EXPECT_EQ(sent[0].method, http_method::put);
	EXPECT_EQ(sent[0].headers.at("x-trace"), "abc");
	EXPECT_EQ(sent[0].timeout, config_.request_timeout);

	EXPECT_EQ(proxy->stats().total_requests.load(), 1u);
	EXPECT_EQ(proxy->stats().successful_requests.load(), 1u);
	EXPECT_EQ(pool_->get_connection("search").value()->status(), connection_status::active);
}

TEST_F(ProxyTest, RequestTimeoutOverridesConfig)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());

	auto req = request();
	req.timeout = std::chrono::milliseconds(250);
	ASSERT_TRUE(proxy->proxy_request("search", req).is_ok());

	EXPECT_EQ(transport_->requests().at(0).timeout, std::chrono::milliseconds(250));
}

TEST_F(ProxyTest, UnsupportedMethodIsInternalError)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());

	auto req = request();
	req.method = "PATCH";

	auto result = proxy->proxy_request("search", req);
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(error_kind_of(result.error()), error_code::internal_error);
	EXPECT_EQ(result.error().message, "Unsupported HTTP method: PATCH");
	EXPECT_TRUE(transport_->requests().empty());
	EXPECT_EQ(proxy->stats().failed_requests.load(), 1u);
}

TEST_F(ProxyTest, UnknownServerIsNotFound)
{
	auto proxy = make_proxy();

	auto result = proxy->proxy_request("missing", request());
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(error_kind_of(result.error()), error_code::not_found);
}

TEST_F(ProxyTest, TranslatesBodyForOlderProvider)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("legacy", "http://legacy", "1.0").is_ok());

	auto req = request();
	auto result = proxy->proxy_request("legacy", req);
	ASSERT_TRUE(result.is_ok());

	auto sent = transport_->requests().at(0).body;
	EXPECT_EQ(sent["tool"].asString(), "search");
	EXPECT_EQ(sent["args"]["q"].asString(), "weather");
	EXPECT_FALSE(sent.isMember("jsonrpc"));

	// The echoed 1.0 body is translated back for the caller
	EXPECT_EQ(result.value().body, req.body);
	EXPECT_EQ(proxy->stats().translated_requests.load(), 1u);
}

TEST_F(ProxyTest, TransportFailureTaggedWithProvider)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());
	transport_->enqueue("search", mock_transport::failure("connection refused"));

	auto result = proxy->proxy_request("search", request());
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(error_kind_of(result.error()), error_code::external_service_error);
	EXPECT_NE(result.error().message.find("search"), std::string::npos);
	EXPECT_NE(result.error().message.find("connection refused"), std::string::npos);

	auto snapshot = pool_->get_connection("search").value()->snapshot();
	EXPECT_EQ(snapshot.failed_requests, 1u);
	EXPECT_EQ(proxy->stats().failed_requests.load(), 1u);
}

TEST_F(ProxyTest, TimeoutIsReportedAndCounted)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());
	transport_->enqueue("search", mock_transport::timeout("search"));

	auto result = proxy->proxy_request("search", request());
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(error_kind_of(result.error()), error_code::external_service_timeout);
	EXPECT_EQ(proxy->stats().timeouts.load(), 1u);
}

TEST_F(ProxyTest, RetriesTransientFailures)
{
	config_.retry.max_attempts = 3;
	config_.circuit_breaker.failure_threshold = 5;
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());

	transport_->enqueue("search", mock_transport::failure());
	transport_->enqueue("search", mock_transport::response(Json::Value(), 503));

	Json::Value body;
	body["ok"] = true;
	transport_->enqueue("search", mock_transport::response(body));

	auto result = proxy->proxy_request("search", request());
	ASSERT_TRUE(result.is_ok());
	EXPECT_TRUE(result.value().body["ok"].asBool());
	EXPECT_EQ(transport_->call_count("search"), 3u);
	EXPECT_EQ(proxy->stats().retried_attempts.load(), 2u);
	EXPECT_EQ(proxy->stats().total_requests.load(), 1u);
}

TEST_F(ProxyTest, RequestAttemptOverrideLimitsRetries)
{
	config_.retry.max_attempts = 3;
	config_.circuit_breaker.failure_threshold = 5;
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());

	transport_->enqueue("search", mock_transport::failure());
	transport_->enqueue("search", mock_transport::response(Json::Value("late")));

	auto single = request();
	single.max_attempts = 1;

	auto result = proxy->proxy_request("search", single);
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(error_kind_of(result.error()), error_code::external_service_error);
	EXPECT_EQ(transport_->call_count("search"), 1u);
	EXPECT_EQ(proxy->stats().retried_attempts.load(), 0u);
}

TEST_F(ProxyTest, ThrowingTransportReleasesConnectionBeforePropagating)
{
	config_.circuit_breaker.degraded_threshold = 5;
	config_.circuit_breaker.failure_threshold = 5;
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());

	transport_->throw_on_send("socket layer bug");

	EXPECT_THROW(static_cast<void>(proxy->proxy_request("search", request())),
				 std::runtime_error);

	auto connection = pool_->get_connection("search");
	ASSERT_TRUE(connection.is_ok());
	EXPECT_EQ(connection.value()->snapshot().consecutive_failures, 1u);
}

TEST_F(ProxyTest, ServerErrorStatusBecomesExternalError)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());
	transport_->enqueue("search", mock_transport::response(Json::Value(), 502));

	auto result = proxy->proxy_request("search", request());
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(error_kind_of(result.error()), error_code::external_service_error);
	EXPECT_NE(result.error().message.find("HTTP 502"), std::string::npos);
}

TEST_F(ProxyTest, ClientErrorStatusIsReturnedAsResponse)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());
	transport_->enqueue("search", mock_transport::response(Json::Value(), 404));

	auto result = proxy->proxy_request("search", request());
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().status_code, 404);
}

TEST_F(ProxyTest, BrokenConnectionFailsFast)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());
	transport_->enqueue("search", mock_transport::failure());
	transport_->enqueue("search", mock_transport::failure());

	EXPECT_TRUE(proxy->proxy_request("search", request()).is_err());
	EXPECT_TRUE(proxy->proxy_request("search", request()).is_err());
	ASSERT_EQ(pool_->get_connection("search").value()->status(), connection_status::broken);

	auto result = proxy->proxy_request("search", request());
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(error_kind_of(result.error()), error_code::circuit_open);
	EXPECT_EQ(transport_->call_count("search"), 2u);
	EXPECT_EQ(proxy->stats().circuit_rejections.load(), 1u);
}

TEST_F(ProxyTest, RouteRequestUsesRoutingRules)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());
	pool_->add_route("/search", "search");

	auto routed = proxy->route_request(request("/search/web"));
	ASSERT_TRUE(routed.is_ok());
	EXPECT_EQ(transport_->requests().at(0).url, "http://search/search/web");

	auto unrouted = proxy->route_request(request("/unknown"));
	ASSERT_TRUE(unrouted.is_err());
	EXPECT_EQ(error_kind_of(unrouted.error()), error_code::not_found);
}

TEST_F(ProxyTest, HealthAndMetricsDescribeProviders)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());
	ASSERT_TRUE(proxy->proxy_request("search", request()).is_ok());

	auto health = proxy->health();
	EXPECT_EQ(health["status"].asString(), "healthy");
	EXPECT_EQ(health["total_requests"].asUInt64(), 1u);
	EXPECT_EQ(health["connections"]["active"].asUInt64(), 1u);
	EXPECT_DOUBLE_EQ(health["connections"]["utilization"].asDouble(), 100.0);
	EXPECT_EQ(health["providers"]["search"]["status"].asString(), "active");

	auto metrics = proxy->metrics();
	EXPECT_EQ(metrics["proxy_requests_total"].asUInt64(), 1u);
	EXPECT_EQ(metrics["proxy_requests_successful"].asUInt64(), 1u);
	EXPECT_EQ(metrics["pool_connections_total"].asUInt64(), 1u);
}

TEST_F(ProxyTest, AllProvidersBrokenIsUnhealthy)
{
	auto proxy = make_proxy();
	ASSERT_TRUE(pool_->register_server("search", "http://search", "2.0").is_ok());
	transport_->enqueue("search", mock_transport::failure());
	transport_->enqueue("search", mock_transport::failure());
	EXPECT_TRUE(proxy->proxy_request("search", request()).is_err());
	EXPECT_TRUE(proxy->proxy_request("search", request()).is_err());

	EXPECT_EQ(proxy->health()["status"].asString(), "unhealthy");
}
