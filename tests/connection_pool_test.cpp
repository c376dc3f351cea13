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
 * @file connection_pool_test.cpp
 * @brief Unit tests for connection_pool and server_connection
 *
 * Tests cover:
 * - Registration and lazy auto-registration
 * - Concurrent first lookups converging on one record
 * - Circuit breaker transitions (Degraded, Broken, half-open, Active)
 * - Idle sweeping, removal and routing rules
 * - Pool statistics and health scores
 */

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include <kcenon/federation_gateway/core/federation_error.h>
#include <kcenon/federation_gateway/proxy/connection_pool.h>

using namespace federation_gateway;
using namespace federation_gateway::proxy;

// ============================================================================
// Registration Tests
// ============================================================================

class ConnectionPoolTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		config_.circuit_breaker.degraded_threshold = 2;
		config_.circuit_breaker.failure_threshold = 3;
		config_.circuit_breaker.success_threshold = 2;
		config_.circuit_breaker.open_timeout = std::chrono::milliseconds(100);
		config_.circuit_breaker.half_open_max_calls = 1;
	}

	void TearDown() override {}

	static constexpr std::chrono::milliseconds latency{ 5 };

	proxy_config config_;
};

TEST_F(ConnectionPoolTest, RegisterServerStartsConnecting)
{
	connection_pool pool(config_);

	auto result = pool.register_server("search", "http://search:9000", "2.0");
	ASSERT_TRUE(result.is_ok());

	auto connection = result.value();
	EXPECT_EQ(connection->server_id(), "search");
	EXPECT_EQ(connection->address(), "http://search:9000");
	EXPECT_EQ(connection->protocol_version(), "2.0");
	EXPECT_EQ(connection->status(), connection_status::connecting);
	EXPECT_EQ(pool.size(), 1u);
}

TEST_F(ConnectionPoolTest, RegisterServerRejectsBadInput)
{
	connection_pool pool(config_);

	auto empty_id = pool.register_server("", "http://x", "2.0");
	ASSERT_TRUE(empty_id.is_err());
	EXPECT_EQ(error_kind_of(empty_id.error()), error_code::validation_error);
	EXPECT_NE(empty_id.error().message.find("server_id"), std::string::npos);

	auto empty_address = pool.register_server("a", "", "2.0");
	ASSERT_TRUE(empty_address.is_err());
	EXPECT_NE(empty_address.error().message.find("address"), std::string::npos);

	auto bad_version = pool.register_server("a", "http://x", "3.0");
	ASSERT_TRUE(bad_version.is_err());
	EXPECT_NE(bad_version.error().message.find("protocol_version"), std::string::npos);

	EXPECT_EQ(pool.size(), 0u);
}

TEST_F(ConnectionPoolTest, DuplicateRegistrationConflicts)
{
	connection_pool pool(config_);
	ASSERT_TRUE(pool.register_server("search", "http://search:9000", "2.0").is_ok());

	auto duplicate = pool.register_server("search", "http://other:9000", "1.0");
	ASSERT_TRUE(duplicate.is_err());
	EXPECT_EQ(error_kind_of(duplicate.error()), error_code::conflict);
}

TEST_F(ConnectionPoolTest, UnknownServerIsNotFoundByDefault)
{
	connection_pool pool(config_);

	auto result = pool.get_connection("missing");
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(error_kind_of(result.error()), error_code::not_found);
	EXPECT_EQ(pool.size(), 0u);
}

TEST_F(ConnectionPoolTest, AutoRegistrationCreatesActiveRecord)
{
	config_.auto_register_servers = true;
	connection_pool pool(config_);

	auto result = pool.get_connection("weather");
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value()->status(), connection_status::active);
	EXPECT_EQ(result.value()->address(), "http://localhost:8080/weather");
	EXPECT_EQ(result.value()->protocol_version(), "2.0");

	auto again = pool.get_connection("weather");
	ASSERT_TRUE(again.is_ok());
	EXPECT_EQ(again.value().get(), result.value().get());
}

TEST_F(ConnectionPoolTest, ConcurrentFirstLookupsShareOneRecord)
{
	config_.auto_register_servers = true;
	connection_pool pool(config_);

	std::vector<std::future<server_connection*>> futures;
	for (int i = 0; i < 16; ++i)
	{
		futures.push_back(std::async(std::launch::async,
									 [&pool]() -> server_connection*
									 {
										 auto result = pool.get_connection("shared");
										 return result.is_ok() ? result.value().get() : nullptr;
									 }));
	}

	server_connection* first = nullptr;
	for (auto& future : futures)
	{
		auto* connection = future.get();
		ASSERT_NE(connection, nullptr);
		if (first == nullptr)
		{
			first = connection;
		}
		EXPECT_EQ(connection, first);
	}
	EXPECT_EQ(pool.size(), 1u);
}

// ============================================================================
// Circuit Breaker Tests
// ============================================================================

class CircuitBreakerTest : public ConnectionPoolTest
{
protected:
	std::shared_ptr<server_connection> active_connection(connection_pool& pool)
	{
		auto connection = pool.register_server("svc", "http://svc", "2.0").value();
		pool.record_outcome(*connection, true, latency);
		return connection;
	}
};

TEST_F(CircuitBreakerTest, FirstSuccessActivates)
{
	connection_pool pool(config_);
	auto connection = active_connection(pool);
	EXPECT_EQ(connection->status(), connection_status::active);
}

TEST_F(CircuitBreakerTest, ConsecutiveFailuresDegradeThenBreak)
{
	connection_pool pool(config_);
	auto connection = active_connection(pool);

	pool.record_outcome(*connection, false, latency);
	EXPECT_EQ(connection->status(), connection_status::active);

	pool.record_outcome(*connection, false, latency);
	EXPECT_EQ(connection->status(), connection_status::degraded);

	pool.record_outcome(*connection, false, latency);
	EXPECT_EQ(connection->status(), connection_status::broken);

	auto acquired = connection->try_acquire(config_.circuit_breaker);
	ASSERT_TRUE(acquired.is_err());
	EXPECT_EQ(error_kind_of(acquired.error()), error_code::circuit_open);
	EXPECT_FALSE(is_retryable(acquired.error()));
}

TEST_F(CircuitBreakerTest, SuccessResetsFailureStreak)
{
	connection_pool pool(config_);
	auto connection = active_connection(pool);

	pool.record_outcome(*connection, false, latency);
	pool.record_outcome(*connection, false, latency);
	ASSERT_EQ(connection->status(), connection_status::degraded);

	pool.record_outcome(*connection, true, latency);
	EXPECT_EQ(connection->status(), connection_status::active);
	EXPECT_EQ(connection->snapshot().consecutive_failures, 0u);
}

TEST_F(CircuitBreakerTest, HalfOpenSuccessesRestoreActive)
{
	connection_pool pool(config_);
	auto connection = active_connection(pool);
	for (int i = 0; i < 3; ++i)
	{
		pool.record_outcome(*connection, false, latency);
	}
	ASSERT_EQ(connection->status(), connection_status::broken);

	std::this_thread::sleep_for(std::chrono::milliseconds(150));

	ASSERT_TRUE(connection->try_acquire(config_.circuit_breaker).is_ok());
	EXPECT_TRUE(connection->snapshot().half_open);

	// One probe at a time
	auto second = connection->try_acquire(config_.circuit_breaker);
	ASSERT_TRUE(second.is_err());
	EXPECT_EQ(error_kind_of(second.error()), error_code::circuit_open);

	pool.record_outcome(*connection, true, latency);
	EXPECT_EQ(connection->status(), connection_status::broken);

	ASSERT_TRUE(connection->try_acquire(config_.circuit_breaker).is_ok());
	pool.record_outcome(*connection, true, latency);
	EXPECT_EQ(connection->status(), connection_status::active);
	EXPECT_FALSE(connection->snapshot().half_open);
}

TEST_F(CircuitBreakerTest, HalfOpenFailureReopens)
{
	connection_pool pool(config_);
	auto connection = active_connection(pool);
	for (int i = 0; i < 3; ++i)
	{
		pool.record_outcome(*connection, false, latency);
	}

	std::this_thread::sleep_for(std::chrono::milliseconds(150));
	ASSERT_TRUE(connection->try_acquire(config_.circuit_breaker).is_ok());

	pool.record_outcome(*connection, false, latency);
	EXPECT_EQ(connection->status(), connection_status::broken);
	EXPECT_FALSE(connection->snapshot().half_open);
	EXPECT_TRUE(connection->try_acquire(config_.circuit_breaker).is_err());
}

TEST_F(CircuitBreakerTest, DisabledBreakerOnlyDegrades)
{
	config_.circuit_breaker.enabled = false;
	connection_pool pool(config_);
	auto connection = active_connection(pool);

	for (int i = 0; i < 10; ++i)
	{
		pool.record_outcome(*connection, false, latency);
	}

	EXPECT_EQ(connection->status(), connection_status::degraded);
	EXPECT_TRUE(connection->try_acquire(config_.circuit_breaker).is_ok());
}

// ============================================================================
// Lifecycle and Routing Tests
// ============================================================================

class ConnectionLifecycleTest : public ConnectionPoolTest
{
};

TEST_F(ConnectionLifecycleTest, SweepMarksInactiveConnectionsIdle)
{
	config_.auto_register_servers = true;
	config_.idle_timeout = std::chrono::milliseconds(10);
	connection_pool pool(config_);

	auto connection = pool.get_connection("svc").value();
	std::this_thread::sleep_for(std::chrono::milliseconds(30));

	EXPECT_EQ(pool.sweep_idle(), 1u);
	EXPECT_EQ(connection->status(), connection_status::idle);
	EXPECT_EQ(pool.stats().idle, 1u);

	// Next use reactivates
	ASSERT_TRUE(connection->try_acquire(config_.circuit_breaker).is_ok());
	EXPECT_EQ(connection->status(), connection_status::active);
}

TEST_F(ConnectionLifecycleTest, RemoveServerClosesAndForgets)
{
	connection_pool pool(config_);
	auto connection = pool.register_server("svc", "http://svc", "2.0").value();
	pool.add_route("/svc", "svc");

	ASSERT_TRUE(pool.remove_server("svc").is_ok());

	EXPECT_EQ(connection->status(), connection_status::closing);
	EXPECT_TRUE(connection->try_acquire(config_.circuit_breaker).is_err());
	EXPECT_TRUE(pool.get_connection("svc").is_err());
	EXPECT_FALSE(pool.route("/svc/call").has_value());

	auto again = pool.remove_server("svc");
	ASSERT_TRUE(again.is_err());
	EXPECT_EQ(error_kind_of(again.error()), error_code::not_found);
}

TEST_F(ConnectionLifecycleTest, RouteUsesLongestPrefix)
{
	connection_pool pool(config_);
	pool.add_route("/tools", "general");
	pool.add_route("/tools/search", "search");

	EXPECT_EQ(pool.route("/tools/search/web").value_or(""), "search");
	EXPECT_EQ(pool.route("/tools/calc").value_or(""), "general");
	EXPECT_FALSE(pool.route("/other").has_value());
}

TEST_F(ConnectionLifecycleTest, StatsCountEveryStatus)
{
	config_.auto_register_servers = true;
	connection_pool pool(config_);

	ASSERT_TRUE(pool.register_server("connecting", "http://a", "2.0").is_ok());
	auto active = pool.get_connection("active").value();
	auto broken = pool.get_connection("broken").value();
	for (int i = 0; i < 3; ++i)
	{
		pool.record_outcome(*broken, false, latency);
	}

	auto stats = pool.stats();
	EXPECT_EQ(stats.total, 3u);
	EXPECT_EQ(stats.connecting, 1u);
	EXPECT_EQ(stats.active, 1u);
	EXPECT_EQ(stats.broken, 1u);
	EXPECT_NEAR(stats.utilization(), 100.0 / 3.0, 0.01);

	auto snapshots = pool.snapshots();
	ASSERT_EQ(snapshots.size(), 3u);
	EXPECT_EQ(snapshots[0].server_id, "active");
	EXPECT_EQ(snapshots[1].server_id, "broken");
	EXPECT_EQ(snapshots[2].server_id, "connecting");
}

TEST_F(ConnectionLifecycleTest, SnapshotTracksMetricsAndHealth)
{
	connection_pool pool(config_);
	auto connection = pool.register_server("svc", "http://svc", "2.0").value();

	pool.record_outcome(*connection, true, std::chrono::milliseconds(10));
	pool.record_outcome(*connection, true, std::chrono::milliseconds(30));

	auto healthy = connection->snapshot();
	EXPECT_EQ(healthy.total_requests, 2u);
	EXPECT_EQ(healthy.successful_requests, 2u);
	EXPECT_DOUBLE_EQ(healthy.average_latency_ms, 20.0);
	EXPECT_DOUBLE_EQ(healthy.success_rate(), 100.0);
	EXPECT_GT(healthy.last_request_time, 0u);
	EXPECT_EQ(healthy.health_score, 84u);

	pool.record_outcome(*connection, false, std::chrono::milliseconds(10));
	pool.record_outcome(*connection, false, std::chrono::milliseconds(10));

	auto degraded = connection->snapshot();
	EXPECT_EQ(degraded.failed_requests, 2u);
	EXPECT_EQ(degraded.consecutive_failures, 2u);
	EXPECT_LT(degraded.health_score, healthy.health_score);
}
