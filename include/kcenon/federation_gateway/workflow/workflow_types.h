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
 * @file workflow_types.h
 * @brief Workflow definitions, executions and their enumerations
 *
 * Timestamps use std::chrono::system_clock so they can be rendered as
 * RFC 3339 UTC strings. Durations are named with their unit.
 */

#pragma once

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace federation_gateway::workflow
{

using timestamp = std::chrono::system_clock::time_point;

/**
 * @enum workflow_status
 * @brief Execution lifecycle: pending -> running -> {completed, failed, cancelled}
 */
enum class workflow_status : uint8_t
{
	pending = 1,
	running = 2,
	completed = 3,
	failed = 4,
	cancelled = 5
};

constexpr const char* to_string(workflow_status status) noexcept
{
	switch (status)
	{
	case workflow_status::pending:
		return "pending";
	case workflow_status::running:
		return "running";
	case workflow_status::completed:
		return "completed";
	case workflow_status::failed:
		return "failed";
	case workflow_status::cancelled:
		return "cancelled";
	default:
		return "unknown";
	}
}

constexpr bool is_terminal(workflow_status status) noexcept
{
	return status == workflow_status::completed || status == workflow_status::failed
		   || status == workflow_status::cancelled;
}

/**
 * @enum step_status
 * @brief State of one step within an execution
 */
enum class step_status : uint8_t
{
	pending = 1,
	running = 2,
	completed = 3,
	failed = 4,
	skipped = 5,
	cancelled = 6
};

constexpr const char* to_string(step_status status) noexcept
{
	switch (status)
	{
	case step_status::pending:
		return "pending";
	case step_status::running:
		return "running";
	case step_status::completed:
		return "completed";
	case step_status::failed:
		return "failed";
	case step_status::skipped:
		return "skipped";
	case step_status::cancelled:
		return "cancelled";
	default:
		return "unknown";
	}
}

enum class workflow_priority : uint8_t
{
	low = 1,
	normal = 2,
	high = 3,
	critical = 4
};

constexpr const char* to_string(workflow_priority priority) noexcept
{
	switch (priority)
	{
	case workflow_priority::low:
		return "low";
	case workflow_priority::normal:
		return "normal";
	case workflow_priority::high:
		return "high";
	case workflow_priority::critical:
		return "critical";
	default:
		return "unknown";
	}
}

enum class execution_environment : uint8_t
{
	development = 1,
	testing = 2,
	staging = 3,
	production = 4
};

constexpr const char* to_string(execution_environment environment) noexcept
{
	switch (environment)
	{
	case execution_environment::development:
		return "development";
	case execution_environment::testing:
		return "testing";
	case execution_environment::staging:
		return "staging";
	case execution_environment::production:
		return "production";
	default:
		return "unknown";
	}
}

/**
 * @enum step_kind
 * @brief Built-in step types; custom steps carry their own name
 */
enum class step_kind : uint8_t
{
	llm_inference = 1,
	data_transformation = 2,
	api_call = 3,
	database_operation = 4,
	file_operation = 5,
	notification = 6,
	conditional = 7,
	loop = 8,
	parallel = 9,
	custom = 10
};

constexpr const char* to_string(step_kind kind) noexcept
{
	switch (kind)
	{
	case step_kind::llm_inference:
		return "llm_inference";
	case step_kind::data_transformation:
		return "data_transformation";
	case step_kind::api_call:
		return "api_call";
	case step_kind::database_operation:
		return "database_operation";
	case step_kind::file_operation:
		return "file_operation";
	case step_kind::notification:
		return "notification";
	case step_kind::conditional:
		return "conditional";
	case step_kind::loop:
		return "loop";
	case step_kind::parallel:
		return "parallel";
	case step_kind::custom:
		return "custom";
	default:
		return "unknown";
	}
}

/**
 * @struct step_type
 * @brief Step type with the name of a custom step
 */
struct step_type
{
	step_kind kind = step_kind::api_call;
	std::string custom_name; ///< Set only for step_kind::custom

	/**
	 * @brief Wire name: the built-in name, or the custom name
	 */
	[[nodiscard]] std::string name() const;

	/**
	 * @brief Whether the step can run without a provider
	 *
	 * data_transformation, conditional, loop and parallel steps are
	 * evaluated by the engine itself unless a provider is named.
	 */
	[[nodiscard]] bool runs_locally() const noexcept;

	/**
	 * @brief Parse a built-in name; anything else becomes a custom type
	 */
	[[nodiscard]] static step_type parse(const std::string& name);

	bool operator==(const step_type& other) const
	{
		return kind == other.kind && custom_name == other.custom_name;
	}
};

/**
 * @struct retry_policy_config
 * @brief Retry settings of a workflow or a single step
 */
struct retry_policy_config
{
	uint32_t max_attempts = 3;                        ///< Total attempts, including the first
	std::chrono::milliseconds initial_delay{ 1000 };
	std::chrono::milliseconds max_delay{ 30000 };
	double backoff_multiplier = 2.0;
	bool exponential_backoff = true;                  ///< false keeps initial_delay constant
};

/**
 * @struct step_config
 * @brief Per-step parameters and limits
 */
struct step_config
{
	Json::Value parameters{ Json::objectValue };
	std::optional<std::chrono::seconds> timeout; ///< Overrides the proxy timeout
	bool monitoring_enabled = true;
	std::optional<double> cost_budget;           ///< Advisory only
};

/**
 * @struct workflow_step
 * @brief One unit of work within a workflow
 */
struct workflow_step
{
	std::string id;
	std::string name;
	step_type type;
	std::optional<std::string> provider_id;
	step_config config;
	std::map<std::string, std::string> input_mapping;  ///< request field -> "<step_id>.<path>"
	std::map<std::string, std::string> output_mapping; ///< output field -> path into the response body
	std::vector<std::string> dependencies;
	std::optional<retry_policy_config> retry_config;   ///< Overrides the workflow retry policy
};

/**
 * @struct workflow_config
 * @brief Workflow-wide execution settings
 */
struct workflow_config
{
	std::chrono::seconds timeout{ 3600 }; ///< 0 disables the workflow timeout
	uint32_t max_parallel_executions = 4;
	retry_policy_config retry_policy;
	std::optional<double> cost_budget;    ///< Advisory only
	workflow_priority priority = workflow_priority::normal;
	execution_environment environment = execution_environment::production;
};

/**
 * @struct federated_workflow
 * @brief Workflow definition
 */
struct federated_workflow
{
	std::string id;
	std::string client_id;
	std::string name;
	std::optional<std::string> description;
	std::vector<workflow_step> steps;
	workflow_config config;
	workflow_status status = workflow_status::pending;
	timestamp created_at;
	timestamp updated_at;
};

/**
 * @struct execution_error
 * @brief Cause of a failed step or execution
 */
struct execution_error
{
	std::string code;    ///< EXECUTION_FAILED, WORKFLOW_TIMEOUT, INTERNAL_ERROR, ...
	std::string message;
	std::optional<Json::Value> details;
	std::optional<std::string> stack_trace;
	timestamp occurred_at;
};

/**
 * @struct resource_usage
 * @brief Aggregate resources consumed by an execution
 */
struct resource_usage
{
	uint64_t cpu_time = 0;    ///< Milliseconds spent executing steps
	uint64_t memory_used = 0; ///< Bytes
	uint64_t network_io = 0;  ///< Request and response bytes exchanged with providers
	uint64_t disk_io = 0;     ///< Bytes
	uint32_t api_calls = 0;   ///< Provider calls, retries included
};

/**
 * @struct step_execution
 * @brief Record of one step within an execution
 */
struct step_execution
{
	std::string step_id;
	step_status status = step_status::pending;
	std::optional<std::string> provider_id;
	timestamp started_at;
	std::optional<timestamp> ended_at;
	std::optional<Json::Value> result;
	std::optional<execution_error> error;
	double cost = 0.0;
	uint32_t retry_attempts = 0; ///< Attempts after the first
};

/**
 * @struct workflow_execution
 * @brief Execution record of a workflow
 *
 * One execution is created per workflow. Transitions are monotonic and a
 * terminal status or ended_at never changes. When a running execution is
 * cancelled, the steps already dispatched are added to its step records,
 * usage and cost once they return.
 */
struct workflow_execution
{
	std::string id;
	std::string workflow_id;
	workflow_status status = workflow_status::pending;
	std::optional<timestamp> started_at;
	std::optional<timestamp> ended_at;
	std::optional<Json::Value> result;
	std::optional<execution_error> error;
	std::vector<step_execution> step_executions;
	resource_usage usage;
	double total_cost = 0.0;
};

} // namespace federation_gateway::workflow
