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
 * @file workflow_engine.h
 * @brief Multi-step workflow orchestration over the provider proxy
 *
 * Each workflow has exactly one execution record, created Pending with the
 * workflow and advanced monotonically:
 * @code
 *  Pending --execute_workflow()--> Running --> Completed | Failed
 *  Pending | Running --cancel_workflow()--> Cancelled
 * @endcode
 *
 * Steps run in dependency waves. Every wave holds at most
 * max_parallel_executions ready steps, dispatched through the common
 * IExecutor (std::async when none is set). Before each wave the engine
 * checks the workflow timeout and the cancellation token; backoff sleeps
 * between step retries also observe the token. A provider call already in
 * flight is not aborted.
 */

#pragma once

#include "workflow_types.h"

#include <kcenon/federation_gateway/proxy/mcp_proxy.h>
#include <kcenon/federation_gateway/storage/repositories.h>

#include <kcenon/common/interfaces/executor_interface.h>
#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>
#include <kcenon/thread/core/cancellation_token.h>

#include <json/json.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace federation_gateway::workflow
{

/**
 * @struct workflow_engine_config
 * @brief Engine-wide limits and conventions
 */
struct workflow_engine_config
{
	uint32_t max_parallel_steps = 16;               ///< Upper bound on any workflow's wave size
	std::string step_path_prefix = "/steps/";       ///< Default provider path, followed by the step type
	std::string cost_header = "x-provider-cost";    ///< Response header carrying a step's cost
	std::string protocol_version = "2.0";           ///< Protocol version of step request bodies
};

/**
 * @struct workflow_engine_metrics
 * @brief Execution counters
 */
struct workflow_engine_metrics
{
	std::atomic<uint64_t> workflows_created{ 0 };
	std::atomic<uint64_t> total_executions{ 0 };
	std::atomic<uint64_t> successful_executions{ 0 };
	std::atomic<uint64_t> failed_executions{ 0 };
	std::atomic<uint64_t> cancelled_executions{ 0 };
	std::atomic<uint64_t> running_executions{ 0 };
	std::atomic<uint64_t> total_execution_time_ms{ 0 }; ///< Finished executions only
	std::atomic<uint64_t> steps_executed{ 0 };
	std::atomic<uint64_t> step_retries{ 0 };

	[[nodiscard]] double success_rate() const noexcept;

	[[nodiscard]] double average_execution_time_ms() const noexcept;

	void reset() noexcept;
};

/**
 * @class workflow_engine
 * @brief Creates, runs and cancels federated workflows
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - execute_workflow() runs synchronously on the calling thread; its steps
 *   run on the executor
 * - Each execution record has its own mutex; terminal transitions are
 *   written under it as one unit and readers copy under it
 *
 * Usage Example:
 * @code
 * workflow_engine engine(proxy, std::make_shared<storage::memory_workflow_repository>());
 *
 * auto created = engine.create_workflow(definition);
 * if (created.is_ok()) {
 *     auto execution = engine.execute_workflow(created.value().id);
 *     // execution.value().status is completed, failed or cancelled
 * }
 * @endcode
 */
class workflow_engine
{
public:
	workflow_engine(std::shared_ptr<proxy::mcp_proxy> proxy,
					std::shared_ptr<storage::workflow_repository> repository,
					const workflow_engine_config& config = workflow_engine_config{});

	workflow_engine(const workflow_engine&) = delete;
	workflow_engine& operator=(const workflow_engine&) = delete;

	/**
	 * @brief Validate and store a workflow with a Pending execution
	 *
	 * An empty id is replaced by a generated one. Validation failures name
	 * the offending field: "name", "steps", "steps[i].id",
	 * "steps[i].dependencies", "steps[i].provider_id",
	 * "config.max_parallel_executions".
	 */
	[[nodiscard]] kcenon::common::Result<federated_workflow> create_workflow(
		federated_workflow definition);

	/**
	 * @brief Replace a workflow definition while its execution is Pending
	 */
	[[nodiscard]] kcenon::common::Result<federated_workflow> update_workflow(
		federated_workflow definition);

	[[nodiscard]] kcenon::common::Result<federated_workflow> get_workflow(
		const std::string& workflow_id) const;

	/**
	 * @brief Run a Pending workflow to a terminal state
	 *
	 * Step failures and timeouts end in Failed and are returned as a
	 * successful result holding the failed execution. An execution that is
	 * not Pending fails with error_code::conflict.
	 */
	[[nodiscard]] kcenon::common::Result<workflow_execution> execute_workflow(
		const std::string& workflow_id);

	/**
	 * @brief Cancel a Pending or Running execution
	 *
	 * Cancelling an already cancelled execution returns it unchanged;
	 * cancelling a completed or failed one fails with conflict. Steps in
	 * flight are not aborted; the running execute_workflow() call adds them
	 * to the cancelled record when they return.
	 */
	[[nodiscard]] kcenon::common::Result<workflow_execution> cancel_workflow(
		const std::string& workflow_id);

	[[nodiscard]] kcenon::common::Result<workflow_status> get_status(
		const std::string& workflow_id) const;

	[[nodiscard]] kcenon::common::Result<workflow_execution> get_execution(
		const std::string& workflow_id) const;

	/**
	 * @brief Stored workflows, oldest first, optionally for one client
	 */
	[[nodiscard]] kcenon::common::Result<std::vector<federated_workflow>> list_workflows(
		const std::optional<std::string>& client_id = std::nullopt) const;

	/**
	 * @brief Health summary: status, counters, success rate, running count
	 */
	[[nodiscard]] Json::Value health() const;

	/**
	 * @brief Flat counters for scraping
	 */
	[[nodiscard]] Json::Value metrics() const;

	[[nodiscard]] const workflow_engine_metrics& stats() const noexcept { return metrics_; }

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

	void set_executor(std::shared_ptr<kcenon::common::interfaces::IExecutor> executor);

private:
	struct execution_entry
	{
		execution_entry() : token(kcenon::thread::cancellation_token::create()) {}

		mutable std::mutex mutex;
		workflow_execution record;
		kcenon::thread::cancellation_token token;
	};

	struct step_outcome
	{
		step_execution record;
		Json::Value output{ Json::nullValue };
		resource_usage usage;
	};

	struct run_outcome
	{
		bool cancelled = false;
		std::optional<execution_error> error;
		Json::Value result{ Json::objectValue };
		std::vector<step_execution> steps;
		resource_usage usage;
		double total_cost = 0.0;
	};

	std::optional<kcenon::common::error_info> validate(const federated_workflow& workflow) const;

	std::shared_ptr<execution_entry> find_entry(const std::string& workflow_id) const;

	run_outcome run_steps(const federated_workflow& workflow, execution_entry& entry);

	std::vector<step_outcome> run_wave(const federated_workflow& workflow,
									   const std::vector<const workflow_step*>& wave,
									   const std::map<std::string, Json::Value>& outputs,
									   kcenon::thread::cancellation_token token);

	step_outcome run_step(const federated_workflow& workflow,
						  const workflow_step& step,
						  const std::map<std::string, Json::Value>& outputs,
						  kcenon::thread::cancellation_token token);

	step_outcome run_local_step(const workflow_step& step,
								const Json::Value& input,
								const std::map<std::string, Json::Value>& outputs);

	step_outcome run_provider_step(const federated_workflow& workflow,
								   const workflow_step& step,
								   const Json::Value& input,
								   kcenon::thread::cancellation_token token);

	void persist(const workflow_execution& execution, workflow_status workflow_state);

	std::shared_ptr<proxy::mcp_proxy> proxy_;
	std::shared_ptr<storage::workflow_repository> repository_;
	workflow_engine_config config_;

	mutable std::shared_mutex entries_mutex_;
	mutable std::unordered_map<std::string, std::shared_ptr<execution_entry>> entries_;

	workflow_engine_metrics metrics_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor_;
};

} // namespace federation_gateway::workflow
