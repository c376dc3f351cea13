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
 * @file rate_limiter_test.cpp
 * @brief Unit tests for rate_limiter component
 *
 * Tests cover:
 * - Fixed window algorithm correctness
 * - Global before client evaluation order
 * - Concurrent slot accounting and admission tickets
 * - Exempt paths, overrides and cleanup
 * - Concurrent access safety
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include <kcenon/federation_gateway/admission/rate_limiter.h>

using namespace federation_gateway::admission;

namespace
{

uint64_t now_ms()
{
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
									 std::chrono::system_clock::now().time_since_epoch())
									 .count());
}

} // namespace

// ============================================================================
// Rate Limiter Configuration Tests
// ============================================================================

class RateLimiterConfigTest : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

TEST_F(RateLimiterConfigTest, DefaultConfiguration)
{
	rate_limiter_config config;

	EXPECT_TRUE(config.enabled);
	EXPECT_EQ(config.client.requests_per_second, 10u);
	EXPECT_EQ(config.client.requests_per_minute, 600u);
	EXPECT_EQ(config.client.requests_per_hour, 36000u);
	EXPECT_EQ(config.client.concurrent_requests, 10u);
	EXPECT_EQ(config.client.window_size, std::chrono::seconds(60));

	EXPECT_EQ(config.global.requests_per_second, 1000u);
	EXPECT_EQ(config.global.requests_per_minute, 60000u);
	EXPECT_EQ(config.global.requests_per_hour, 3600000u);
	EXPECT_EQ(config.global.concurrent_requests, 1000u);

	ASSERT_EQ(config.exempt_paths.size(), 2u);
	EXPECT_EQ(config.exempt_paths[0], "/health");
	EXPECT_EQ(config.exempt_paths[1], "/metrics");
}

TEST_F(RateLimiterConfigTest, ViolationNames)
{
	EXPECT_STREQ(to_string(limit_violation::requests_per_second), "requests_per_second");
	EXPECT_STREQ(to_string(limit_violation::concurrent_requests), "concurrent_requests");
	EXPECT_STREQ(to_string(limit_scope::global), "global");
	EXPECT_STREQ(to_string(limit_scope::client), "client");
}

// ============================================================================
// Rate Limiter Basic Behavior Tests
// ============================================================================

class RateLimiterTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		config_.client.requests_per_second = 5;
		config_.client.requests_per_minute = 100;
		config_.client.requests_per_hour = 1000;
		config_.client.concurrent_requests = 100;
	}

	void TearDown() override {}

	rate_limiter_config config_;
};

TEST_F(RateLimiterTest, AdmitsRequestsWithinLimit)
{
	rate_limiter limiter(config_);

	for (int i = 0; i < 5; ++i)
	{
		EXPECT_TRUE(limiter.check_and_admit("client1").admitted)
			<< "Request " << i << " should be admitted";
	}
}

TEST_F(RateLimiterTest, RejectsWithStructuredResult)
{
	rate_limiter limiter(config_);

	for (int i = 0; i < 5; ++i)
	{
		ASSERT_TRUE(limiter.check_and_admit("client1"));
	}

	auto result = limiter.check_and_admit("client1");
	EXPECT_FALSE(result.admitted);
	ASSERT_TRUE(result.violation.has_value());
	EXPECT_EQ(*result.violation, limit_violation::requests_per_second);
	EXPECT_EQ(result.scope, limit_scope::client);
	EXPECT_EQ(result.current_usage, 5u);
	EXPECT_EQ(result.limit, 5u);
	EXPECT_LE(result.retry_after_ms, 1000u);
	EXPECT_GE(result.reset_time + 1, now_ms());
}

TEST_F(RateLimiterTest, RejectionDoesNotIncrementCounters)
{
	rate_limiter limiter(config_);

	for (int i = 0; i < 5; ++i)
	{
		ASSERT_TRUE(limiter.check_and_admit("client1"));
	}
	for (int i = 0; i < 3; ++i)
	{
		EXPECT_FALSE(limiter.check_and_admit("client1"));
	}

	auto status = limiter.status("client1");
	EXPECT_EQ(status.requests_per_second, 5u);
	EXPECT_EQ(status.requests_per_minute, 5u);
	EXPECT_EQ(status.requests_per_hour, 5u);
	EXPECT_EQ(status.concurrent_requests, 5u);

	auto global = limiter.global_status();
	EXPECT_EQ(global.requests_per_second, 5u);
	EXPECT_EQ(global.client_id, "*");
}

TEST_F(RateLimiterTest, ClientsAreIndependent)
{
	rate_limiter limiter(config_);

	for (int i = 0; i < 5; ++i)
	{
		ASSERT_TRUE(limiter.check_and_admit("client1"));
	}
	EXPECT_FALSE(limiter.check_and_admit("client1"));
	EXPECT_TRUE(limiter.check_and_admit("client2"));
	EXPECT_EQ(limiter.tracked_clients(), 2u);
}

TEST_F(RateLimiterTest, GlobalLimitEvaluatedFirst)
{
	config_.global.requests_per_second = 1;
	rate_limiter limiter(config_);

	EXPECT_TRUE(limiter.check_and_admit("client1"));

	auto result = limiter.check_and_admit("client2");
	EXPECT_FALSE(result.admitted);
	EXPECT_EQ(result.scope, limit_scope::global);
	EXPECT_EQ(*result.violation, limit_violation::requests_per_second);

	// The rejected client gained nothing
	EXPECT_EQ(limiter.status("client2").requests_per_second, 0u);
}

TEST_F(RateLimiterTest, WindowResetsAfterDuration)
{
	config_.client.requests_per_second = 1;
	rate_limiter limiter(config_);

	EXPECT_TRUE(limiter.check_and_admit("client1"));
	EXPECT_FALSE(limiter.check_and_admit("client1"));

	std::this_thread::sleep_for(std::chrono::milliseconds(1100));

	EXPECT_TRUE(limiter.check_and_admit("client1"));
	EXPECT_EQ(limiter.status("client1").requests_per_minute, 2u);
}

TEST_F(RateLimiterTest, MinuteLimitAppliesAcrossSeconds)
{
	config_.client.requests_per_second = 0;
	config_.client.requests_per_minute = 3;
	rate_limiter limiter(config_);

	for (int i = 0; i < 3; ++i)
	{
		ASSERT_TRUE(limiter.check_and_admit("client1"));
	}

	auto result = limiter.check_and_admit("client1");
	EXPECT_FALSE(result.admitted);
	EXPECT_EQ(*result.violation, limit_violation::requests_per_minute);
	EXPECT_GT(result.retry_after_ms, 1000u);
}

TEST_F(RateLimiterTest, ZeroLimitMeansUnlimited)
{
	config_.client = rate_limit_config{ 0, 0, 0, 0, std::chrono::seconds(60) };
	rate_limiter limiter(config_);

	for (int i = 0; i < 200; ++i)
	{
		ASSERT_TRUE(limiter.check_and_admit("client1"));
	}
}

TEST_F(RateLimiterTest, DisabledLimiterAdmitsEverything)
{
	config_.enabled = false;
	config_.client.requests_per_second = 1;
	rate_limiter limiter(config_);

	for (int i = 0; i < 20; ++i)
	{
		EXPECT_TRUE(limiter.check_and_admit("client1"));
	}
	EXPECT_EQ(limiter.tracked_clients(), 0u);
}

TEST_F(RateLimiterTest, StatusReportsNextResets)
{
	rate_limiter limiter(config_);
	ASSERT_TRUE(limiter.check_and_admit("client1"));

	auto before = now_ms();
	auto status = limiter.status("client1");

	EXPECT_EQ(status.client_id, "client1");
	EXPECT_EQ(status.limits.requests_per_second, 5u);
	EXPECT_GE(status.second_reset + 1, before);
	EXPECT_LE(status.second_reset, before + 1000);
	EXPECT_GT(status.minute_reset, status.second_reset);
	EXPECT_GT(status.hour_reset, status.minute_reset);
	EXPECT_EQ(status.recent_requests, 1u);
}

TEST_F(RateLimiterTest, StatusOfUnknownClientIsEmpty)
{
	rate_limiter limiter(config_);

	auto status = limiter.status("nobody");
	EXPECT_EQ(status.requests_per_second, 0u);
	EXPECT_EQ(status.concurrent_requests, 0u);
	EXPECT_EQ(limiter.tracked_clients(), 0u);
}

// ============================================================================
// Concurrent Slot Tests
// ============================================================================

class RateLimiterConcurrencyTest : public RateLimiterTest
{
};

TEST_F(RateLimiterConcurrencyTest, ConcurrentLimitReleasedOnCompletion)
{
	config_.client.requests_per_second = 0;
	config_.client.concurrent_requests = 2;
	rate_limiter limiter(config_);

	EXPECT_TRUE(limiter.check_and_admit("client1"));
	EXPECT_TRUE(limiter.check_and_admit("client1"));

	auto rejected = limiter.check_and_admit("client1");
	EXPECT_FALSE(rejected.admitted);
	EXPECT_EQ(*rejected.violation, limit_violation::concurrent_requests);

	limiter.record_completion("client1");
	EXPECT_TRUE(limiter.check_and_admit("client1"));
}

TEST_F(RateLimiterConcurrencyTest, CompletionsBalanceAdmissions)
{
	rate_limiter limiter(config_);

	const int n = 5;
	for (int i = 0; i < n; ++i)
	{
		ASSERT_TRUE(limiter.check_and_admit("client1"));
	}
	for (int i = 0; i < n; ++i)
	{
		limiter.record_completion("client1");
	}

	EXPECT_EQ(limiter.status("client1").concurrent_requests, 0u);
	EXPECT_EQ(limiter.global_status().concurrent_requests, 0u);

	// Extra completions floor at zero
	limiter.record_completion("client1");
	limiter.record_completion("unknown");
	EXPECT_EQ(limiter.status("client1").concurrent_requests, 0u);
	EXPECT_EQ(limiter.global_status().concurrent_requests, 0u);
}

TEST_F(RateLimiterConcurrencyTest, TicketReleasesExactlyOnce)
{
	rate_limiter limiter(config_);

	ASSERT_TRUE(limiter.check_and_admit("client1"));
	ASSERT_TRUE(limiter.check_and_admit("client1"));
	{
		admission_ticket first(limiter, "client1");
		admission_ticket moved(std::move(first));
		EXPECT_FALSE(first.active());
		EXPECT_TRUE(moved.active());

		moved.release();
		EXPECT_FALSE(moved.active());
		EXPECT_EQ(limiter.status("client1").concurrent_requests, 1u);
	}
	EXPECT_EQ(limiter.status("client1").concurrent_requests, 1u);

	{
		admission_ticket second(limiter, "client1");
	}
	EXPECT_EQ(limiter.status("client1").concurrent_requests, 0u);
}

TEST_F(RateLimiterConcurrencyTest, ParallelChecksNeverExceedLimit)
{
	config_.client.requests_per_second = 0;
	config_.client.requests_per_minute = 100;
	config_.client.concurrent_requests = 0;
	rate_limiter limiter(config_);

	std::atomic<int> admitted{ 0 };
	std::vector<std::future<void>> futures;
	for (int t = 0; t < 8; ++t)
	{
		futures.push_back(std::async(std::launch::async,
									 [&limiter, &admitted]()
									 {
										 for (int i = 0; i < 50; ++i)
										 {
											 if (limiter.check_and_admit("shared"))
											 {
												 admitted.fetch_add(1);
											 }
										 }
									 }));
	}
	for (auto& future : futures)
	{
		future.get();
	}

	EXPECT_EQ(admitted.load(), 100);
	EXPECT_EQ(limiter.status("shared").requests_per_minute, 100u);
	EXPECT_EQ(limiter.metrics().admitted.load(), 100u);
	EXPECT_EQ(limiter.metrics().rejected_client.load(), 300u);
}

// ============================================================================
// Exemption, Override and Cleanup Tests
// ============================================================================

class RateLimiterPolicyTest : public RateLimiterTest
{
};

TEST_F(RateLimiterPolicyTest, ExemptPathsMatchWholeSegments)
{
	rate_limiter limiter(config_);

	EXPECT_TRUE(limiter.is_exempt("/health"));
	EXPECT_TRUE(limiter.is_exempt("/health/live"));
	EXPECT_TRUE(limiter.is_exempt("/metrics?format=json"));
	EXPECT_FALSE(limiter.is_exempt("/healthz"));
	EXPECT_FALSE(limiter.is_exempt("/api/health"));
	EXPECT_FALSE(limiter.is_exempt(""));
}

TEST_F(RateLimiterPolicyTest, ClientOverrideReplacesDefaults)
{
	rate_limiter limiter(config_);
	ASSERT_TRUE(limiter.check_and_admit("vip"));

	rate_limit_config vip;
	vip.requests_per_second = 50;
	limiter.set_client_limits("vip", vip);

	for (int i = 0; i < 20; ++i)
	{
		EXPECT_TRUE(limiter.check_and_admit("vip"));
	}
	EXPECT_EQ(limiter.status("vip").limits.requests_per_second, 50u);

	// Overrides also apply to clients first seen later
	limiter.set_client_limits("later", vip);
	EXPECT_EQ(limiter.status("later").limits.requests_per_second, 50u);
}

TEST_F(RateLimiterPolicyTest, ResetDropsIdleClientState)
{
	rate_limiter limiter(config_);
	for (int i = 0; i < 5; ++i)
	{
		ASSERT_TRUE(limiter.check_and_admit("client1"));
		limiter.record_completion("client1");
	}
	EXPECT_FALSE(limiter.check_and_admit("client1"));

	limiter.reset("client1");
	EXPECT_EQ(limiter.tracked_clients(), 0u);

	EXPECT_TRUE(limiter.check_and_admit("client1"));
	EXPECT_EQ(limiter.global_status().concurrent_requests, 1u);
}

TEST_F(RateLimiterPolicyTest, ResetKeepsInFlightSlots)
{
	config_.global.concurrent_requests = 2;
	rate_limiter limiter(config_);

	ASSERT_TRUE(limiter.check_and_admit("a"));
	ASSERT_TRUE(limiter.check_and_admit("b"));

	limiter.reset("a");
	EXPECT_EQ(limiter.status("a").requests_per_second, 0u);
	EXPECT_EQ(limiter.status("a").concurrent_requests, 1u);
	EXPECT_EQ(limiter.global_status().concurrent_requests, 2u);
	EXPECT_FALSE(limiter.check_and_admit("c"));

	// a's request finishes: exactly one slot comes back while b is in flight
	limiter.record_completion("a");
	EXPECT_EQ(limiter.global_status().concurrent_requests, 1u);

	EXPECT_TRUE(limiter.check_and_admit("c"));
	auto rejected = limiter.check_and_admit("d");
	EXPECT_FALSE(rejected.admitted);
	EXPECT_EQ(*rejected.violation, limit_violation::concurrent_requests);
	EXPECT_EQ(rejected.scope, limit_scope::global);
	EXPECT_EQ(limiter.global_status().concurrent_requests, 2u);
}

TEST_F(RateLimiterPolicyTest, UnmatchedCompletionFreesNoCapacity)
{
	config_.global.concurrent_requests = 2;
	rate_limiter limiter(config_);

	ASSERT_TRUE(limiter.check_and_admit("a"));
	ASSERT_TRUE(limiter.check_and_admit("b"));

	limiter.record_completion("ghost");
	limiter.record_completion("a");
	limiter.record_completion("a");

	EXPECT_EQ(limiter.global_status().concurrent_requests, 1u);
	EXPECT_EQ(limiter.metrics().completions.load(), 1u);

	ASSERT_TRUE(limiter.check_and_admit("c"));
	EXPECT_FALSE(limiter.check_and_admit("d").admitted);
}

TEST_F(RateLimiterPolicyTest, CleanupRemovesIdleClients)
{
	config_.client.window_size = std::chrono::seconds(0);
	rate_limiter limiter(config_);

	ASSERT_TRUE(limiter.check_and_admit("idle"));
	ASSERT_TRUE(limiter.check_and_admit("busy"));
	limiter.record_completion("idle");

	EXPECT_EQ(limiter.cleanup(), 1u);
	EXPECT_EQ(limiter.tracked_clients(), 1u);
}

TEST_F(RateLimiterPolicyTest, MetricsTrackRejectionsByKind)
{
	config_.client.requests_per_second = 1;
	rate_limiter limiter(config_);

	ASSERT_TRUE(limiter.check_and_admit("client1"));
	EXPECT_FALSE(limiter.check_and_admit("client1"));
	EXPECT_FALSE(limiter.check_and_admit("client1"));

	const auto& metrics = limiter.metrics();
	EXPECT_EQ(metrics.total_checks.load(), 3u);
	EXPECT_EQ(metrics.admitted.load(), 1u);
	EXPECT_EQ(metrics.rejected_client.load(), 2u);
	EXPECT_EQ(metrics.rejected_per_second.load(), 2u);
	EXPECT_NEAR(metrics.rejection_rate(), 66.67, 0.01);
}
