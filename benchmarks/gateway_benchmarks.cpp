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
 * @file gateway_benchmarks.cpp
 * @brief Performance benchmarks for federation gateway components
 *
 * Benchmarks cover:
 * - Rate limiter admission overhead, single and multi client
 * - Schema translation throughput with and without the cache
 * - Proxy forwarding overhead against an in-process transport
 * - Workflow execution of a small dependency chain
 * - Concurrent admission throughput
 */

#include <benchmark/benchmark.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <kcenon/federation_gateway/admission/rate_limiter.h>
#include <kcenon/federation_gateway/proxy/mcp_proxy.h>
#include <kcenon/federation_gateway/proxy/protocol_translator.h>
#include <kcenon/federation_gateway/storage/memory_repositories.h>
#include <kcenon/federation_gateway/translation/schema_translation_engine.h>
#include <kcenon/federation_gateway/workflow/workflow_engine.h>

using namespace federation_gateway;

namespace
{

/**
 * @brief Transport answering every request with its own body
 */
class echo_transport : public proxy::provider_transport
{
public:
	kcenon::common::Result<proxy::proxy_response> send(
		const proxy::outbound_request& request) override
	{
		proxy::proxy_response response;
		response.body = request.body;
		return response;
	}
};

} // namespace

// ============================================================================
// Benchmark Fixtures
// ============================================================================

class GatewayBenchmarkFixture : public benchmark::Fixture
{
public:
	void SetUp(const benchmark::State& /*state*/) override
	{
		limiter_config_.enabled = true;
		limiter_config_.global = { 0, 0, 0, 0, std::chrono::seconds(60) };
		limiter_config_.client = { 0, 0, 0, 0, std::chrono::seconds(60) };

		proxy_config_.retry.max_attempts = 1;
		proxy_config_.auto_register_servers = true;
	}

	void TearDown(const benchmark::State& /*state*/) override {}

protected:
	static Json::Value v1_payload(int id)
	{
		Json::Value payload(Json::objectValue);
		payload["tool"] = "search";
		payload["args"]["query"] = "benchmark";
		payload["session"] = "bench-session";
		payload["id"] = id;
		return payload;
	}

	std::shared_ptr<proxy::mcp_proxy> make_proxy()
	{
		auto pool = std::make_shared<proxy::connection_pool>(proxy_config_);
		return std::make_shared<proxy::mcp_proxy>(
			pool, std::make_shared<proxy::protocol_translator>(nullptr),
			std::make_shared<echo_transport>());
	}

	admission::rate_limiter_config limiter_config_;
	proxy::proxy_config proxy_config_;
};

// ============================================================================
// Rate Limiter Benchmarks
// ============================================================================

BENCHMARK_DEFINE_F(GatewayBenchmarkFixture, RateLimiterAdmit)(benchmark::State& state)
{
	admission::rate_limiter limiter(limiter_config_);

	for (auto _ : state)
	{
		auto result = limiter.check_and_admit("client-001");
		benchmark::DoNotOptimize(result);
		limiter.record_completion("client-001");
	}

	state.SetItemsProcessed(state.iterations());
}

BENCHMARK_REGISTER_F(GatewayBenchmarkFixture, RateLimiterAdmit)
	->Unit(benchmark::kNanosecond)
	->Iterations(100000);

BENCHMARK_DEFINE_F(GatewayBenchmarkFixture, RateLimiterMultiClient)
(benchmark::State& state)
{
	admission::rate_limiter limiter(limiter_config_);
	const int num_clients = state.range(0);
	int client_index = 0;

	for (auto _ : state)
	{
		std::string client_id = "client-" + std::to_string(client_index % num_clients);
		auto result = limiter.check_and_admit(client_id);
		benchmark::DoNotOptimize(result);
		limiter.record_completion(client_id);
		++client_index;
	}

	state.SetItemsProcessed(state.iterations());
	state.counters["clients"] = num_clients;
}

BENCHMARK_REGISTER_F(GatewayBenchmarkFixture, RateLimiterMultiClient)
	->Unit(benchmark::kNanosecond)
	->Arg(10)
	->Arg(100)
	->Arg(1000);

BENCHMARK_DEFINE_F(GatewayBenchmarkFixture, ConcurrentAdmission)
(benchmark::State& state)
{
	admission::rate_limiter limiter(limiter_config_);
	const int num_threads = state.range(0);
	const int checks_per_thread = 1000;

	for (auto _ : state)
	{
		std::vector<std::thread> threads;
		threads.reserve(num_threads);
		std::atomic<uint64_t> admitted{ 0 };

		for (int t = 0; t < num_threads; ++t)
		{
			threads.emplace_back([&, t]() {
				std::string client_id = "client-" + std::to_string(t);
				for (int i = 0; i < checks_per_thread; ++i)
				{
					if (limiter.check_and_admit(client_id).admitted)
					{
						admitted.fetch_add(1);
						limiter.record_completion(client_id);
					}
				}
			});
		}

		for (auto& thread : threads)
		{
			thread.join();
		}

		benchmark::DoNotOptimize(admitted.load());
	}

	state.SetItemsProcessed(state.iterations() * num_threads * checks_per_thread);
	state.counters["threads"] = num_threads;
}

BENCHMARK_REGISTER_F(GatewayBenchmarkFixture, ConcurrentAdmission)
	->Unit(benchmark::kMillisecond)
	->Arg(1)
	->Arg(4)
	->Arg(8)
	->UseRealTime();

// ============================================================================
// Schema Translation Benchmarks
// ============================================================================

BENCHMARK_DEFINE_F(GatewayBenchmarkFixture, TranslationCacheMiss)
(benchmark::State& state)
{
	translation::translation_cache_config cache_config;
	cache_config.enabled = false;
	translation::schema_translation_engine engine(
		translation::translator_registry::with_defaults(),
		std::make_shared<storage::memory_translation_repository>(100), cache_config);

	int id = 0;
	for (auto _ : state)
	{
		translation::schema_translation_request request;
		request.source_version = "v1.0";
		request.target_version = "v2.0";
		request.source_data = v1_payload(id++);

		auto result = engine.translate_schema(request);
		benchmark::DoNotOptimize(result);
	}

	state.SetItemsProcessed(state.iterations());
}

BENCHMARK_REGISTER_F(GatewayBenchmarkFixture, TranslationCacheMiss)
	->Unit(benchmark::kMicrosecond);

BENCHMARK_DEFINE_F(GatewayBenchmarkFixture, TranslationCacheHit)
(benchmark::State& state)
{
	translation::schema_translation_engine engine(
		translation::translator_registry::with_defaults(),
		std::make_shared<storage::memory_translation_repository>(100));

	translation::schema_translation_request request;
	request.source_version = "v1.0";
	request.target_version = "v2.0";
	request.source_data = v1_payload(1);

	for (auto _ : state)
	{
		auto result = engine.translate_schema(request);
		benchmark::DoNotOptimize(result);
	}

	state.SetItemsProcessed(state.iterations());
	state.counters["cache_hit_rate"] = engine.cache().metrics().hit_rate();
}

BENCHMARK_REGISTER_F(GatewayBenchmarkFixture, TranslationCacheHit)
	->Unit(benchmark::kMicrosecond);

// ============================================================================
// Proxy Benchmarks
// ============================================================================

BENCHMARK_DEFINE_F(GatewayBenchmarkFixture, ProxyForward)(benchmark::State& state)
{
	auto proxy = make_proxy();
	const bool translate = state.range(0) != 0;

	proxy::proxy_request request;
	request.path = "/tools/call";
	request.protocol_version = translate ? "1.0" : "2.0";
	request.body = v1_payload(1);

	for (auto _ : state)
	{
		auto result = proxy->proxy_request("provider", request);
		benchmark::DoNotOptimize(result);
	}

	state.SetItemsProcessed(state.iterations());
	state.counters["translated"] = translate ? 1 : 0;
}

BENCHMARK_REGISTER_F(GatewayBenchmarkFixture, ProxyForward)
	->Unit(benchmark::kMicrosecond)
	->Arg(0)
	->Arg(1);

// ============================================================================
// Workflow Benchmarks
// ============================================================================

BENCHMARK_DEFINE_F(GatewayBenchmarkFixture, WorkflowChain)(benchmark::State& state)
{
	workflow::workflow_engine engine(make_proxy(),
									 std::make_shared<storage::memory_workflow_repository>());
	const int length = state.range(0);

	for (auto _ : state)
	{
		state.PauseTiming();
		workflow::federated_workflow definition;
		definition.name = "chain";
		for (int i = 0; i < length; ++i)
		{
			workflow::workflow_step step;
			step.id = "step-" + std::to_string(i);
			step.provider_id = "provider";
			if (i > 0)
			{
				step.dependencies.push_back("step-" + std::to_string(i - 1));
			}
			definition.steps.push_back(std::move(step));
		}
		auto created = engine.create_workflow(definition);
		state.ResumeTiming();

		if (created.is_err())
		{
			state.SkipWithError(created.error().message.c_str());
			break;
		}
		auto result = engine.execute_workflow(created.value().id);
		benchmark::DoNotOptimize(result);
	}

	state.SetItemsProcessed(state.iterations() * length);
	state.counters["steps"] = length;
}

BENCHMARK_REGISTER_F(GatewayBenchmarkFixture, WorkflowChain)
	->Unit(benchmark::kMillisecond)
	->Arg(1)
	->Arg(5)
	->Arg(20);

BENCHMARK_MAIN();
