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

#include <kcenon/federation_gateway/workflow/workflow_codec.h>

#include <kcenon/federation_gateway/core/federation_error.h>
#include <kcenon/federation_gateway/core/json_utils.h>

namespace federation_gateway::workflow
{

namespace
{

constexpr const char* MODULE = "workflow_codec";

using kcenon::common::error_info;
using kcenon::common::Result;

using read_error = std::optional<error_info>;

error_info type_error(const std::string& path, const std::string& expected)
{
	return make_validation_error(MODULE, path, "must be " + expected);
}

std::string join(const std::string& prefix, const char* key)
{
	return prefix.empty() ? std::string(key) : prefix + "." + key;
}

read_error read_string(const Json::Value& object, const char* key, const std::string& prefix,
					   std::string& out)
{
	const auto& value = object[key];
	if (value.isNull())
	{
		return std::nullopt;
	}
	if (!value.isString())
	{
		return type_error(join(prefix, key), "a string");
	}
	out = value.asString();
	return std::nullopt;
}

read_error read_optional_string(const Json::Value& object, const char* key,
								const std::string& prefix, std::optional<std::string>& out)
{
	const auto& value = object[key];
	if (value.isNull())
	{
		return std::nullopt;
	}
	if (!value.isString())
	{
		return type_error(join(prefix, key), "a string");
	}
	out = value.asString();
	return std::nullopt;
}

read_error read_uint(const Json::Value& object, const char* key, const std::string& prefix,
					 uint64_t& out)
{
	const auto& value = object[key];
	if (value.isNull())
	{
		return std::nullopt;
	}
	if (!value.isUInt64())
	{
		return type_error(join(prefix, key), "a non-negative integer");
	}
	out = value.asUInt64();
	return std::nullopt;
}

read_error read_double(const Json::Value& object, const char* key, const std::string& prefix,
					   std::optional<double>& out)
{
	const auto& value = object[key];
	if (value.isNull())
	{
		return std::nullopt;
	}
	if (!value.isNumeric())
	{
		return type_error(join(prefix, key), "a number");
	}
	out = value.asDouble();
	return std::nullopt;
}

read_error read_bool(const Json::Value& object, const char* key, const std::string& prefix,
					 bool& out)
{
	const auto& value = object[key];
	if (value.isNull())
	{
		return std::nullopt;
	}
	if (!value.isBool())
	{
		return type_error(join(prefix, key), "a boolean");
	}
	out = value.asBool();
	return std::nullopt;
}

read_error read_string_map(const Json::Value& object, const char* key, const std::string& prefix,
						   std::map<std::string, std::string>& out)
{
	const auto& value = object[key];
	if (value.isNull())
	{
		return std::nullopt;
	}
	if (!value.isObject())
	{
		return type_error(join(prefix, key), "an object of strings");
	}
	for (const auto& name : value.getMemberNames())
	{
		if (!value[name].isString())
		{
			return type_error(join(prefix, key) + "." + name, "a string");
		}
		out[name] = value[name].asString();
	}
	return std::nullopt;
}

read_error read_string_list(const Json::Value& object, const char* key, const std::string& prefix,
							std::vector<std::string>& out)
{
	const auto& value = object[key];
	if (value.isNull())
	{
		return std::nullopt;
	}
	if (!value.isArray())
	{
		return type_error(join(prefix, key), "an array of strings");
	}
	for (const auto& item : value)
	{
		if (!item.isString())
		{
			return type_error(join(prefix, key), "an array of strings");
		}
		out.push_back(item.asString());
	}
	return std::nullopt;
}

read_error read_timestamp(const Json::Value& object, const char* key, const std::string& prefix,
						  timestamp& out)
{
	std::string text;
	if (auto error = read_string(object, key, prefix, text))
	{
		return error;
	}
	if (text.empty())
	{
		return std::nullopt;
	}
	auto parsed = parse_timestamp(text);
	if (!parsed)
	{
		return type_error(join(prefix, key), "an RFC 3339 UTC timestamp");
	}
	out = *parsed;
	return std::nullopt;
}

read_error read_retry(const Json::Value& json, const std::string& path, retry_policy_config& out)
{
	if (!json.isObject())
	{
		return type_error(path, "an object");
	}

	uint64_t max_attempts = out.max_attempts;
	uint64_t initial_delay = static_cast<uint64_t>(out.initial_delay.count());
	uint64_t max_delay = static_cast<uint64_t>(out.max_delay.count());
	std::optional<double> multiplier;

	if (auto error = read_uint(json, "max_attempts", path, max_attempts))
		return error;
	if (auto error = read_uint(json, "initial_delay", path, initial_delay))
		return error;
	if (auto error = read_uint(json, "max_delay", path, max_delay))
		return error;
	if (auto error = read_double(json, "backoff_multiplier", path, multiplier))
		return error;
	if (auto error = read_bool(json, "exponential_backoff", path, out.exponential_backoff))
		return error;

	out.max_attempts = static_cast<uint32_t>(max_attempts);
	out.initial_delay = std::chrono::milliseconds(initial_delay);
	out.max_delay = std::chrono::milliseconds(max_delay);
	if (multiplier)
	{
		out.backoff_multiplier = *multiplier;
	}
	return std::nullopt;
}

read_error read_step_type(const Json::Value& json, const std::string& path, step_type& out)
{
	if (json.isString())
	{
		out = step_type::parse(json.asString());
		return std::nullopt;
	}
	if (json.isObject() && json["custom"].isString())
	{
		out = step_type{ step_kind::custom, json["custom"].asString() };
		return std::nullopt;
	}
	return type_error(path, "a step type name or {\"custom\": name}");
}

read_error read_step(const Json::Value& json, const std::string& path, workflow_step& step)
{
	if (!json.isObject())
	{
		return type_error(path, "an object");
	}

	if (auto error = read_string(json, "id", path, step.id))
		return error;
	if (auto error = read_string(json, "name", path, step.name))
		return error;

	if (json.isMember("step_type"))
	{
		if (auto error = read_step_type(json["step_type"], join(path, "step_type"), step.type))
			return error;
	}

	if (auto error = read_optional_string(json, "provider_id", path, step.provider_id))
		return error;

	const auto& config = json["config"];
	if (!config.isNull())
	{
		auto config_path = join(path, "config");
		if (!config.isObject())
		{
			return type_error(config_path, "an object");
		}

		const auto& parameters = config["parameters"];
		if (!parameters.isNull())
		{
			if (!parameters.isObject())
			{
				return type_error(join(config_path, "parameters"), "an object");
			}
			step.config.parameters = parameters;
		}

		if (config.isMember("timeout") && !config["timeout"].isNull())
		{
			uint64_t timeout = 0;
			if (auto error = read_uint(config, "timeout", config_path, timeout))
				return error;
			step.config.timeout = std::chrono::seconds(timeout);
		}

		if (auto error = read_bool(config, "monitoring_enabled", config_path,
								   step.config.monitoring_enabled))
			return error;
		if (auto error = read_double(config, "cost_budget", config_path, step.config.cost_budget))
			return error;
	}

	if (auto error = read_string_map(json, "input_mapping", path, step.input_mapping))
		return error;
	if (auto error = read_string_map(json, "output_mapping", path, step.output_mapping))
		return error;
	if (auto error = read_string_list(json, "dependencies", path, step.dependencies))
		return error;

	const auto& retry = json["retry_config"];
	if (!retry.isNull())
	{
		retry_policy_config policy;
		if (auto error = read_retry(retry, join(path, "retry_config"), policy))
			return error;
		step.retry_config = policy;
	}

	return std::nullopt;
}

read_error read_workflow_config(const Json::Value& json, workflow_config& config)
{
	const std::string path = "config";
	if (!json.isObject())
	{
		return type_error(path, "an object");
	}

	uint64_t timeout = static_cast<uint64_t>(config.timeout.count());
	uint64_t max_parallel = config.max_parallel_executions;
	if (auto error = read_uint(json, "timeout", path, timeout))
		return error;
	if (auto error = read_uint(json, "max_parallel_executions", path, max_parallel))
		return error;
	config.timeout = std::chrono::seconds(timeout);
	config.max_parallel_executions = static_cast<uint32_t>(max_parallel);

	if (!json["retry_policy"].isNull())
	{
		if (auto error = read_retry(json["retry_policy"], join(path, "retry_policy"),
									config.retry_policy))
			return error;
	}

	if (auto error = read_double(json, "cost_budget", path, config.cost_budget))
		return error;

	std::string priority;
	if (auto error = read_string(json, "priority", path, priority))
		return error;
	if (!priority.empty())
	{
		auto parsed = parse_workflow_priority(priority);
		if (!parsed)
		{
			return type_error(join(path, "priority"), "one of low, normal, high, critical");
		}
		config.priority = *parsed;
	}

	std::string environment;
	if (auto error = read_string(json, "environment", path, environment))
		return error;
	if (!environment.empty())
	{
		auto parsed = parse_execution_environment(environment);
		if (!parsed)
		{
			return type_error(join(path, "environment"),
							  "one of development, testing, staging, production");
		}
		config.environment = *parsed;
	}

	return std::nullopt;
}

Json::Value step_type_json(const step_type& type)
{
	if (type.kind == step_kind::custom)
	{
		Json::Value custom(Json::objectValue);
		custom["custom"] = type.custom_name;
		return custom;
	}
	return to_string(type.kind);
}

template <typename Map>
Json::Value string_map_json(const Map& values)
{
	Json::Value json(Json::objectValue);
	for (const auto& [key, value] : values)
	{
		json[key] = value;
	}
	return json;
}

} // namespace

std::optional<workflow_status> parse_workflow_status(const std::string& name)
{
	for (auto status : { workflow_status::pending, workflow_status::running,
						 workflow_status::completed, workflow_status::failed,
						 workflow_status::cancelled })
	{
		if (name == to_string(status))
		{
			return status;
		}
	}
	return std::nullopt;
}

std::optional<workflow_priority> parse_workflow_priority(const std::string& name)
{
	for (auto priority : { workflow_priority::low, workflow_priority::normal,
						   workflow_priority::high, workflow_priority::critical })
	{
		if (name == to_string(priority))
		{
			return priority;
		}
	}
	return std::nullopt;
}

std::optional<execution_environment> parse_execution_environment(const std::string& name)
{
	for (auto environment : { execution_environment::development, execution_environment::testing,
							  execution_environment::staging, execution_environment::production })
	{
		if (name == to_string(environment))
		{
			return environment;
		}
	}
	return std::nullopt;
}

Result<federated_workflow> workflow_from_json(const Json::Value& json)
{
	if (!json.isObject())
	{
		return type_error("workflow", "an object");
	}

	federated_workflow workflow;
	const std::string root;

	if (auto error = read_string(json, "id", root, workflow.id))
		return *error;
	if (auto error = read_string(json, "client_id", root, workflow.client_id))
		return *error;
	if (auto error = read_string(json, "name", root, workflow.name))
		return *error;
	if (auto error = read_optional_string(json, "description", root, workflow.description))
		return *error;

	const auto& steps = json["steps"];
	if (!steps.isNull())
	{
		if (!steps.isArray())
		{
			return type_error("steps", "an array");
		}
		for (Json::ArrayIndex i = 0; i < steps.size(); ++i)
		{
			workflow_step step;
			if (auto error = read_step(steps[i], "steps[" + std::to_string(i) + "]", step))
				return *error;
			workflow.steps.push_back(std::move(step));
		}
	}

	if (!json["config"].isNull())
	{
		if (auto error = read_workflow_config(json["config"], workflow.config))
			return *error;
	}

	std::string status;
	if (auto error = read_string(json, "status", root, status))
		return *error;
	if (!status.empty())
	{
		auto parsed = parse_workflow_status(status);
		if (!parsed)
		{
			return type_error("status", "a workflow status");
		}
		workflow.status = *parsed;
	}

	if (auto error = read_timestamp(json, "created_at", root, workflow.created_at))
		return *error;
	if (auto error = read_timestamp(json, "updated_at", root, workflow.updated_at))
		return *error;

	return workflow;
}

Json::Value to_json(const retry_policy_config& retry)
{
	Json::Value json(Json::objectValue);
	json["max_attempts"] = retry.max_attempts;
	json["initial_delay"] = Json::UInt64(retry.initial_delay.count());
	json["max_delay"] = Json::UInt64(retry.max_delay.count());
	json["backoff_multiplier"] = retry.backoff_multiplier;
	json["exponential_backoff"] = retry.exponential_backoff;
	return json;
}

Json::Value to_json(const workflow_step& step)
{
	Json::Value json(Json::objectValue);
	json["id"] = step.id;
	json["name"] = step.name;
	json["step_type"] = step_type_json(step.type);
	if (step.provider_id)
	{
		json["provider_id"] = *step.provider_id;
	}

	Json::Value config(Json::objectValue);
	config["parameters"] = step.config.parameters;
	if (step.config.timeout)
	{
		config["timeout"] = Json::UInt64(step.config.timeout->count());
	}
	config["monitoring_enabled"] = step.config.monitoring_enabled;
	if (step.config.cost_budget)
	{
		config["cost_budget"] = *step.config.cost_budget;
	}
	json["config"] = config;

	json["input_mapping"] = string_map_json(step.input_mapping);
	json["output_mapping"] = string_map_json(step.output_mapping);

	Json::Value dependencies(Json::arrayValue);
	for (const auto& dependency : step.dependencies)
	{
		dependencies.append(dependency);
	}
	json["dependencies"] = dependencies;

	if (step.retry_config)
	{
		json["retry_config"] = to_json(*step.retry_config);
	}
	return json;
}

Json::Value to_json(const federated_workflow& workflow)
{
	Json::Value json(Json::objectValue);
	json["id"] = workflow.id;
	json["client_id"] = workflow.client_id;
	json["name"] = workflow.name;
	if (workflow.description)
	{
		json["description"] = *workflow.description;
	}

	Json::Value steps(Json::arrayValue);
	for (const auto& step : workflow.steps)
	{
		steps.append(to_json(step));
	}
	json["steps"] = steps;

	Json::Value config(Json::objectValue);
	config["timeout"] = Json::UInt64(workflow.config.timeout.count());
	config["max_parallel_executions"] = workflow.config.max_parallel_executions;
	config["retry_policy"] = to_json(workflow.config.retry_policy);
	if (workflow.config.cost_budget)
	{
		config["cost_budget"] = *workflow.config.cost_budget;
	}
	config["priority"] = to_string(workflow.config.priority);
	config["environment"] = to_string(workflow.config.environment);
	json["config"] = config;

	json["status"] = to_string(workflow.status);
	json["created_at"] = format_timestamp(workflow.created_at);
	json["updated_at"] = format_timestamp(workflow.updated_at);
	return json;
}

Json::Value to_json(const execution_error& error)
{
	Json::Value json(Json::objectValue);
	json["code"] = error.code;
	json["message"] = error.message;
	if (error.details)
	{
		json["details"] = *error.details;
	}
	if (error.stack_trace)
	{
		json["stack_trace"] = *error.stack_trace;
	}
	json["occurred_at"] = format_timestamp(error.occurred_at);
	return json;
}

Json::Value to_json(const resource_usage& usage)
{
	Json::Value json(Json::objectValue);
	json["cpu_time"] = Json::UInt64(usage.cpu_time);
	json["memory_used"] = Json::UInt64(usage.memory_used);
	json["network_io"] = Json::UInt64(usage.network_io);
	json["disk_io"] = Json::UInt64(usage.disk_io);
	json["api_calls"] = usage.api_calls;
	return json;
}

Json::Value to_json(const step_execution& step)
{
	Json::Value json(Json::objectValue);
	json["step_id"] = step.step_id;
	json["status"] = to_string(step.status);
	if (step.provider_id)
	{
		json["provider_id"] = *step.provider_id;
	}
	json["started_at"] = format_timestamp(step.started_at);
	if (step.ended_at)
	{
		json["ended_at"] = format_timestamp(*step.ended_at);
	}
	if (step.result)
	{
		json["result"] = *step.result;
	}
	if (step.error)
	{
		json["error"] = to_json(*step.error);
	}
	json["cost"] = step.cost;
	json["retry_attempts"] = step.retry_attempts;
	return json;
}

Json::Value to_json(const workflow_execution& execution)
{
	Json::Value json(Json::objectValue);
	json["id"] = execution.id;
	json["workflow_id"] = execution.workflow_id;
	json["status"] = to_string(execution.status);
	if (execution.started_at)
	{
		json["started_at"] = format_timestamp(*execution.started_at);
	}
	if (execution.ended_at)
	{
		json["ended_at"] = format_timestamp(*execution.ended_at);
	}
	if (execution.result)
	{
		json["result"] = *execution.result;
	}
	if (execution.error)
	{
		json["error"] = to_json(*execution.error);
	}

	Json::Value steps(Json::arrayValue);
	for (const auto& step : execution.step_executions)
	{
		steps.append(to_json(step));
	}
	json["step_executions"] = steps;
	json["resource_usage"] = to_json(execution.usage);
	json["total_cost"] = execution.total_cost;
	return json;
}

} // namespace federation_gateway::workflow
