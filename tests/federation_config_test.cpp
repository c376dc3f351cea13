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
 * @file federation_config_test.cpp
 * @brief Unit tests for federation_config loading and validation
 *
 * Tests cover:
 * - Default configuration validity
 * - Key = value file parsing for every section
 * - Rejection of unparseable values and missing files
 * - Cross-field validation messages
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <kcenon/federation_gateway/core/federation_config.h>

using namespace federation_gateway;

class FederationConfigTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		auto name = std::string("federation_config_test_")
					+ ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf";
		path_ = (std::filesystem::temp_directory_path() / name).string();
	}

	void TearDown() override
	{
		std::error_code ignored;
		std::filesystem::remove(path_, ignored);
	}

	void write(const std::string& content)
	{
		std::ofstream file(path_);
		file << content;
	}

	static bool has_error(const federation_config& config, const std::string& text)
	{
		for (const auto& error : config.validation_errors())
		{
			if (error.find(text) != std::string::npos)
			{
				return true;
			}
		}
		return false;
	}

	std::string path_;
};

TEST_F(FederationConfigTest, DefaultsAreValid)
{
	auto config = federation_config::default_config();

	EXPECT_TRUE(config.validate());
	EXPECT_EQ(config.name, "federation_gateway");
	EXPECT_EQ(config.logging.level, "info");
	EXPECT_FALSE(config.proxy.auto_register_servers);
	EXPECT_EQ(config.translation.max_history_per_key, 1000u);
	EXPECT_EQ(config.rate_limit.exempt_paths.size(), 2u);
}

TEST_F(FederationConfigTest, LoadsEverySection)
{
	write(R"(# gateway settings
name = edge-gateway
logging.level = debug
logging.enable_console = false

rate_limit.enabled = true
rate_limit.exempt_paths = /health, /metrics, /status
rate_limit.client.requests_per_second = 5
rate_limit.client.requests_per_minute = 100
rate_limit.global.concurrent_requests = 50

proxy.request_timeout_ms = 2500
proxy.auto_register_servers = true
proxy.default_address_base = http://mesh.local
proxy.retry.max_attempts = 4
proxy.retry.multiplier = 1.5
proxy.retry.jitter = 0
proxy.circuit_breaker.failure_threshold = 7
proxy.circuit_breaker.open_timeout_ms = 15000

translation.cache.max_entries = 64
translation.cache.ttl_seconds = 120
translation.max_history_per_key = 50

workflow.max_parallel_steps = 8
workflow.cost_header = x-cost
)");

	auto config = federation_config::load_from_file(path_);
	ASSERT_TRUE(config.has_value());

	EXPECT_EQ(config->name, "edge-gateway");
	EXPECT_EQ(config->logging.level, "debug");
	EXPECT_FALSE(config->logging.enable_console);

	ASSERT_EQ(config->rate_limit.exempt_paths.size(), 3u);
	EXPECT_EQ(config->rate_limit.exempt_paths[2], "/status");
	EXPECT_EQ(config->rate_limit.client.requests_per_second, 5u);
	EXPECT_EQ(config->rate_limit.client.requests_per_minute, 100u);
	EXPECT_EQ(config->rate_limit.global.concurrent_requests, 50u);

	EXPECT_EQ(config->proxy.request_timeout, std::chrono::milliseconds(2500));
	EXPECT_TRUE(config->proxy.auto_register_servers);
	EXPECT_EQ(config->proxy.default_address_base, "http://mesh.local");
	EXPECT_EQ(config->proxy.retry.max_attempts, 4u);
	EXPECT_DOUBLE_EQ(config->proxy.retry.multiplier, 1.5);
	EXPECT_FALSE(config->proxy.retry.jitter);
	EXPECT_EQ(config->proxy.circuit_breaker.failure_threshold, 7u);
	EXPECT_EQ(config->proxy.circuit_breaker.open_timeout, std::chrono::milliseconds(15000));

	EXPECT_EQ(config->translation.cache.max_entries, 64u);
	EXPECT_EQ(config->translation.cache.ttl, std::chrono::seconds(120));
	EXPECT_EQ(config->translation.max_history_per_key, 50u);

	EXPECT_EQ(config->workflow.max_parallel_steps, 8u);
	EXPECT_EQ(config->workflow.cost_header, "x-cost");

	EXPECT_TRUE(config->validate());
}

TEST_F(FederationConfigTest, MissingFileReturnsNullopt)
{
	EXPECT_FALSE(federation_config::load_from_file(path_ + ".missing").has_value());
}

TEST_F(FederationConfigTest, UnparseableValueReturnsNullopt)
{
	write("proxy.retry.max_attempts = many\n");
	EXPECT_FALSE(federation_config::load_from_file(path_).has_value());

	write("rate_limit.enabled = maybe\n");
	EXPECT_FALSE(federation_config::load_from_file(path_).has_value());

	write("rate_limit.client.requests_per_second = -1\n");
	EXPECT_FALSE(federation_config::load_from_file(path_).has_value());
}

TEST_F(FederationConfigTest, UnknownKeysAndMalformedLinesIgnored)
{
	write("not a setting\nsomething.else = 1\nname = kept\n");

	auto config = federation_config::load_from_file(path_);
	ASSERT_TRUE(config.has_value());
	EXPECT_EQ(config->name, "kept");
}

TEST_F(FederationConfigTest, ReportsInconsistentRateLimits)
{
	auto config = federation_config::default_config();
	config.rate_limit.client.requests_per_second = 1000;
	config.rate_limit.client.requests_per_minute = 100;
	config.rate_limit.global.window_size = std::chrono::seconds(0);

	EXPECT_FALSE(config.validate());
	EXPECT_TRUE(has_error(config, "rate_limit.client.requests_per_second cannot exceed"));
	EXPECT_TRUE(has_error(config, "rate_limit.global.window_size_seconds"));
}

TEST_F(FederationConfigTest, ReportsProxyAndServiceErrors)
{
	auto config = federation_config::default_config();
	config.name.clear();
	config.proxy.default_protocol_version = "9.9";
	config.proxy.retry.max_attempts = 0;
	config.proxy.retry.base_delay = std::chrono::milliseconds(5000);
	config.proxy.retry.max_delay = std::chrono::milliseconds(100);
	config.translation.max_history_per_key = 0;
	config.workflow.max_parallel_steps = 0;
	config.logging.level = "verbose";

	EXPECT_TRUE(has_error(config, "Gateway name cannot be empty"));
	EXPECT_TRUE(has_error(config, "Unsupported proxy.default_protocol_version: 9.9"));
	EXPECT_TRUE(has_error(config, "proxy.retry.max_attempts must be at least 1"));
	EXPECT_TRUE(has_error(config, "proxy.retry.base_delay_ms cannot exceed max_delay_ms"));
	EXPECT_TRUE(has_error(config, "translation.max_history_per_key"));
	EXPECT_TRUE(has_error(config, "workflow.max_parallel_steps"));
	EXPECT_TRUE(has_error(config, "Invalid log level: verbose"));
}

TEST_F(FederationConfigTest, AutoRegistrationNeedsAddressBase)
{
	auto config = federation_config::default_config();
	config.proxy.auto_register_servers = true;
	config.proxy.default_address_base.clear();

	EXPECT_TRUE(has_error(config, "proxy.default_address_base is required"));
}
