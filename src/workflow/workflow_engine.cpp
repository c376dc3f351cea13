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

#include <kcenon/federation_gateway/workflow/workflow_engine.h>

#include <kcenon/federation_gateway/core/federation_error.h>
#include <kcenon/federation_gateway/core/id_generator.h>
#include <kcenon/federation_gateway/core/json_utils.h>
#include <kcenon/federation_gateway/logging/console_logger.h>
#include <kcenon/federation_gateway/metrics/metrics_base.h>
#include <kcenon/federation_gateway/proxy/retry_policy.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <future>
#include <set>

namespace federation_gateway::workflow
{

namespace
{

constexpr const char* MODULE = "workflow_engine";

constexpr const char* EXECUTION_FAILED = "EXECUTION_FAILED";
constexpr const char* WORKFLOW_TIMEOUT = "WORKFLOW_TIMEOUT";
constexpr const char* INTERNAL_ERROR = "INTERNAL_ERROR";
constexpr const char* STEP_CANCELLED = "STEP_CANCELLED";

using kcenon::common::interfaces::log_level;
using metrics::metrics_utils;

/**
 * @brief Job wrapper dispatching one step through IExecutor
 */
class workflow_step_job : public kcenon::common::interfaces::IJob
{
public:
	workflow_step_job(std::string step_id, std::function<void()> work)
		: step_id_(std::move(step_id)), work_(std::move(work))
	{
	}

	kcenon::common::VoidResult execute() override
	{
		if (work_)
		{
			work_();
		}
		return kcenon::common::ok();
	}

	std::string get_name() const override { return "workflow_step:" + step_id_; }
	int get_priority() const override { return 0; }

private:
	std::string step_id_;
	std::function<void()> work_;
};

execution_error make_execution_error(const std::string& code,
									 const std::string& message,
									 std::optional<Json::Value> details = std::nullopt)
{
	execution_error error;
	error.code = code;
	error.message = message;
	error.details = std::move(details);
	error.occurred_at = std::chrono::system_clock::now();
	return error;
}

Json::Value resolve_path(const Json::Value& root, const std::string& path)
{
	const Json::Value* current = &root;
	size_t start = 0;

	while (start <= path.size())
	{
		auto end = path.find('.', start);
		auto segment = path.substr(start, end == std::string::npos ? std::string::npos : end - start);

		if (current->isObject() && current->isMember(segment))
		{
			current = &(*current)[segment];
		}
		else if (current->isArray() && !segment.empty()
				 && std::all_of(segment.begin(), segment.end(),
								[](unsigned char c) { return std::isdigit(c) != 0; }))
		{
			auto index = static_cast<Json::ArrayIndex>(std::strtoul(segment.c_str(), nullptr, 10));
			if (index >= current->size())
			{
				return Json::Value(Json::nullValue);
			}
			current = &(*current)[index];
		}
		else
		{
			return Json::Value(Json::nullValue);
		}

		if (end == std::string::npos)
		{
			break;
		}
		start = end + 1;
	}

	return *current;
}

// "<step_id>" or "<step_id>.<path>" against completed step outputs.
Json::Value resolve_step_path(const std::map<std::string, Json::Value>& outputs,
							  const std::string& path)
{
	auto dot = path.find('.');
	auto step_id = path.substr(0, dot);

	auto it = outputs.find(step_id);
	if (it == outputs.end())
	{
		return Json::Value(Json::nullValue);
	}
	if (dot == std::string::npos)
	{
		return it->second;
	}
	return resolve_path(it->second, path.substr(dot + 1));
}

bool is_truthy(const Json::Value& value)
{
	switch (value.type())
	{
	case Json::nullValue:
		return false;
	case Json::booleanValue:
		return value.asBool();
	case Json::intValue:
	case Json::uintValue:
	case Json::realValue:
		return value.asDouble() != 0.0;
	case Json::stringValue:
		return !value.asString().empty();
	case Json::arrayValue:
	case Json::objectValue:
		return value.size() > 0;
	default:
		return false;
	}
}

Json::Value apply_output_mapping(const workflow_step& step, const Json::Value& body)
{
	if (step.output_mapping.empty())
	{
		return body;
	}

	Json::Value output(Json::objectValue);
	for (const auto& [name, path] : step.output_mapping)
	{
		output[name] = resolve_path(body, path);
	}
	return output;
}

proxy::retry_config to_retry_config(const retry_policy_config& policy)
{
	proxy::retry_config config;
	config.max_attempts = policy.max_attempts;
	config.base_delay = policy.initial_delay;
	config.max_delay = policy.max_delay;
	config.multiplier = policy.exponential_backoff ? policy.backoff_multiplier : 1.0;
	config.jitter = false;
	return config;
}

std::optional<double> parse_cost(const proxy::header_map& headers, const std::string& name)
{
	auto it = headers.find(name);
	if (it == headers.end())
	{
		return std::nullopt;
	}

	char* end = nullptr;
	double cost = std::strtod(it->second.c_str(), &end);
	if (end == it->second.c_str() || cost < 0.0)
	{
		return std::nullopt;
	}
	return cost;
}

void accumulate(resource_usage& total, const resource_usage& delta)
{
	total.cpu_time += delta.cpu_time;
	total.memory_used += delta.memory_used;
	total.network_io += delta.network_io;
	total.disk_io += delta.disk_io;
	total.api_calls += delta.api_calls;
}

uint64_t elapsed_ms(std::chrono::steady_clock::time_point start)
{
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
									 std::chrono::steady_clock::now() - start)
									 .count());
}

} // namespace

// ============================================================================
// workflow_engine_metrics
// ============================================================================

double workflow_engine_metrics::success_rate() const noexcept
{
	auto successful = successful_executions.load(std::memory_order_relaxed);
	auto failed = failed_executions.load(std::memory_order_relaxed);
	return metrics_utils::calculate_rate(successful, successful + failed);
}

double workflow_engine_metrics::average_execution_time_ms() const noexcept
{
	auto finished = successful_executions.load(std::memory_order_relaxed)
					+ failed_executions.load(std::memory_order_relaxed);
	if (finished == 0)
	{
		return 0.0;
	}
	return static_cast<double>(total_execution_time_ms.load(std::memory_order_relaxed))
		   / static_cast<double>(finished);
}

void workflow_engine_metrics::reset() noexcept
{
	workflows_created.store(0, std::memory_order_relaxed);
	total_executions.store(0, std::memory_order_relaxed);
	successful_executions.store(0, std::memory_order_relaxed);
	failed_executions.store(0, std::memory_order_relaxed);
	cancelled_executions.store(0, std::memory_order_relaxed);
	running_executions.store(0, std::memory_order_relaxed);
	total_execution_time_ms.store(0, std::memory_order_relaxed);
	steps_executed.store(0, std::memory_order_relaxed);
	step_retries.store(0, std::memory_order_relaxed);
}

// ============================================================================
// Definition management
// ============================================================================

workflow_engine::workflow_engine(std::shared_ptr<proxy::mcp_proxy> proxy,
								 std::shared_ptr<storage::workflow_repository> repository,
								 const workflow_engine_config& config)
	: proxy_(std::move(proxy))
	, repository_(std::move(repository))
	, config_(config)
{
}

kcenon::common::Result<federated_workflow> workflow_engine::create_workflow(
	federated_workflow definition)
{
	if (auto error = validate(definition))
	{
		return *error;
	}

	if (definition.id.empty())
	{
		definition.id = generate_id();
	}
	else if (repository_->get_workflow(definition.id).is_ok())
	{
		return make_error(error_code::conflict,
						  "Workflow '" + definition.id + "' already exists", MODULE);
	}

	auto now = std::chrono::system_clock::now();
	definition.status = workflow_status::pending;
	definition.created_at = now;
	definition.updated_at = now;

	auto stored = repository_->put_workflow(definition);
	if (stored.is_err())
	{
		return stored.error();
	}

	auto entry = std::make_shared<execution_entry>();
	entry->record.id = generate_id();
	entry->record.workflow_id = definition.id;
	entry->record.status = workflow_status::pending;

	auto stored_execution = repository_->put_execution(entry->record);
	if (stored_execution.is_err())
	{
		return stored_execution.error();
	}

	{
		std::unique_lock lock(entries_mutex_);
		entries_[definition.id] = entry;
	}

	metrics_.workflows_created.fetch_add(1, std::memory_order_relaxed);
	logging::emit(logger_, log_level::info,
				  "Created workflow '" + definition.name + "' (" + definition.id + ") with "
					  + std::to_string(definition.steps.size()) + " step(s)");
	return definition;
}

kcenon::common::Result<federated_workflow> workflow_engine::update_workflow(
	federated_workflow definition)
{
	auto entry = find_entry(definition.id);
	if (!entry)
	{
		return make_error(error_code::not_found,
						  "Workflow '" + definition.id + "' not found", MODULE);
	}

	auto existing = repository_->get_workflow(definition.id);
	if (existing.is_err())
	{
		return existing.error();
	}

	if (auto error = validate(definition))
	{
		return *error;
	}

	// Held across the write so execution cannot start mid-update.
	std::lock_guard<std::mutex> lock(entry->mutex);
	if (entry->record.status != workflow_status::pending)
	{
		return make_error(error_code::conflict,
						  "Workflow '" + definition.id + "' is "
							  + to_string(entry->record.status)
							  + "; only pending workflows can be updated",
						  MODULE);
	}

	if (definition.client_id.empty())
	{
		definition.client_id = existing.value().client_id;
	}
	definition.status = workflow_status::pending;
	definition.created_at = existing.value().created_at;
	definition.updated_at = std::chrono::system_clock::now();

	auto stored = repository_->put_workflow(definition);
	if (stored.is_err())
	{
		return stored.error();
	}

	logging::emit(logger_, log_level::info, "Updated workflow " + definition.id);
	return definition;
}

kcenon::common::Result<federated_workflow> workflow_engine::get_workflow(
	const std::string& workflow_id) const
{
	return repository_->get_workflow(workflow_id);
}

kcenon::common::Result<std::vector<federated_workflow>> workflow_engine::list_workflows(
	const std::optional<std::string>& client_id) const
{
	if (!client_id)
	{
		return repository_->list_workflows({});
	}

	return repository_->list_workflows([&client_id](const federated_workflow& workflow)
									   { return workflow.client_id == *client_id; });
}

std::optional<kcenon::common::error_info> workflow_engine::validate(
	const federated_workflow& workflow) const
{
	if (workflow.name.empty())
	{
		return make_validation_error(MODULE, "name", "must not be empty");
	}
	if (workflow.steps.empty())
	{
		return make_validation_error(MODULE, "steps", "must contain at least one step");
	}
	if (workflow.config.max_parallel_executions < 1)
	{
		return make_validation_error(MODULE, "config.max_parallel_executions",
									 "must be at least 1");
	}

	std::set<std::string> ids;
	for (size_t i = 0; i < workflow.steps.size(); ++i)
	{
		const auto& step = workflow.steps[i];
		auto field = "steps[" + std::to_string(i) + "]";

		if (step.id.empty())
		{
			return make_validation_error(MODULE, field + ".id", "must not be empty");
		}
		if (!ids.insert(step.id).second)
		{
			return make_validation_error(MODULE, field + ".id",
										 "duplicate step id '" + step.id + "'");
		}
		if (!step.type.runs_locally() && (!step.provider_id || step.provider_id->empty()))
		{
			return make_validation_error(MODULE, field + ".provider_id",
										 "required for " + step.type.name() + " steps");
		}
	}

	for (size_t i = 0; i < workflow.steps.size(); ++i)
	{
		const auto& step = workflow.steps[i];
		for (const auto& dependency : step.dependencies)
		{
			if (dependency == step.id || ids.count(dependency) == 0)
			{
				return make_validation_error(MODULE,
											 "steps[" + std::to_string(i) + "].dependencies",
											 "unknown or self dependency '" + dependency + "'");
			}
		}
	}

	// Kahn's algorithm; anything left unvisited sits on a cycle.
	std::map<std::string, size_t> in_degree;
	std::map<std::string, std::vector<std::string>> dependants;
	for (const auto& step : workflow.steps)
	{
		in_degree[step.id] += 0;
		for (const auto& dependency : step.dependencies)
		{
			++in_degree[step.id];
			dependants[dependency].push_back(step.id);
		}
	}

	std::vector<std::string> ready;
	for (const auto& [id, degree] : in_degree)
	{
		if (degree == 0)
		{
			ready.push_back(id);
		}
	}

	size_t visited = 0;
	while (!ready.empty())
	{
		auto id = ready.back();
		ready.pop_back();
		++visited;
		for (const auto& dependant : dependants[id])
		{
			if (--in_degree[dependant] == 0)
			{
				ready.push_back(dependant);
			}
		}
	}

	if (visited != workflow.steps.size())
	{
		return make_validation_error(MODULE, "steps", "dependency cycle detected");
	}

	return std::nullopt;
}

// ============================================================================
// Execution lifecycle
// ============================================================================

kcenon::common::Result<workflow_execution> workflow_engine::execute_workflow(
	const std::string& workflow_id)
{
	auto entry = find_entry(workflow_id);
	if (!entry)
	{
		return make_error(error_code::not_found, "Workflow '" + workflow_id + "' not found",
						  MODULE);
	}

	auto workflow = repository_->get_workflow(workflow_id);
	if (workflow.is_err())
	{
		return workflow.error();
	}

	workflow_execution started;
	{
		std::lock_guard<std::mutex> lock(entry->mutex);
		if (entry->record.status != workflow_status::pending)
		{
			return make_error(error_code::conflict,
							  "Execution of workflow '" + workflow_id + "' is "
								  + to_string(entry->record.status)
								  + "; only pending executions can run",
							  MODULE);
		}

		entry->record.status = workflow_status::running;
		entry->record.started_at = std::chrono::system_clock::now();
		started = entry->record;
	}

	persist(started, workflow_status::running);
	metrics_.total_executions.fetch_add(1, std::memory_order_relaxed);
	metrics_.running_executions.fetch_add(1, std::memory_order_relaxed);
	logging::emit(logger_, log_level::info,
				  "Executing workflow " + workflow_id + " (execution " + started.id + ")");

	auto begin = std::chrono::steady_clock::now();

	run_outcome outcome;
	try
	{
		outcome = run_steps(workflow.value(), *entry);
	}
	catch (const std::exception& e)
	{
		outcome = run_outcome{};
		outcome.error = make_execution_error(INTERNAL_ERROR, e.what());
		logging::emit(logger_, log_level::error,
					  "Unexpected error executing workflow " + workflow_id + ": " + e.what());
	}

	workflow_execution finished;
	bool cancelled_elsewhere = false;
	{
		std::lock_guard<std::mutex> lock(entry->mutex);
		auto& record = entry->record;

		if (record.status == workflow_status::cancelled)
		{
			// Status and ended_at stay as cancel_workflow() set them; the work
			// already dispatched is still accounted for.
			cancelled_elsewhere = true;
			record.step_executions = outcome.steps;
			record.usage = outcome.usage;
			record.total_cost = outcome.total_cost;
		}
		else
		{
			record.step_executions = outcome.steps;
			record.usage = outcome.usage;
			record.total_cost = outcome.total_cost;

			if (outcome.cancelled)
			{
				record.status = workflow_status::cancelled;
			}
			else if (outcome.error)
			{
				record.status = workflow_status::failed;
				record.error = outcome.error;
			}
			else
			{
				record.status = workflow_status::completed;
				record.result = outcome.result;
			}
			record.ended_at = std::chrono::system_clock::now();
		}
		finished = record;
	}

	metrics_.running_executions.fetch_sub(1, std::memory_order_relaxed);

	if (cancelled_elsewhere)
	{
		persist(finished, workflow_status::cancelled);
		logging::emit(logger_, log_level::info,
					  "Workflow " + workflow_id + " stopped after cancellation");
		return finished;
	}

	persist(finished, finished.status);

	const auto& budget = workflow.value().config.cost_budget;
	if (budget && finished.total_cost > *budget)
	{
		logging::emit(logger_, log_level::warning,
					  "Workflow " + workflow_id + " cost " + std::to_string(finished.total_cost)
						  + " exceeded budget " + std::to_string(*budget));
	}

	switch (finished.status)
	{
	case workflow_status::completed:
		metrics_.successful_executions.fetch_add(1, std::memory_order_relaxed);
		metrics_.total_execution_time_ms.fetch_add(elapsed_ms(begin), std::memory_order_relaxed);
		logging::emit(logger_, log_level::info, "Workflow " + workflow_id + " completed");
		break;
	case workflow_status::failed:
		metrics_.failed_executions.fetch_add(1, std::memory_order_relaxed);
		metrics_.total_execution_time_ms.fetch_add(elapsed_ms(begin), std::memory_order_relaxed);
		logging::emit(logger_, log_level::warning,
					  "Workflow " + workflow_id + " failed: " + finished.error->code + ": "
						  + finished.error->message);
		break;
	default:
		metrics_.cancelled_executions.fetch_add(1, std::memory_order_relaxed);
		logging::emit(logger_, log_level::info, "Workflow " + workflow_id + " cancelled");
		break;
	}

	return finished;
}

kcenon::common::Result<workflow_execution> workflow_engine::cancel_workflow(
	const std::string& workflow_id)
{
	auto entry = find_entry(workflow_id);
	if (!entry)
	{
		return make_error(error_code::not_found, "Workflow '" + workflow_id + "' not found",
						  MODULE);
	}

	workflow_execution cancelled;
	{
		std::lock_guard<std::mutex> lock(entry->mutex);
		auto& record = entry->record;

		if (record.status == workflow_status::cancelled)
		{
			return record;
		}
		if (is_terminal(record.status))
		{
			return make_error(error_code::conflict,
							  "Workflow '" + workflow_id + "' already " + to_string(record.status),
							  MODULE);
		}

		record.status = workflow_status::cancelled;
		record.ended_at = std::chrono::system_clock::now();
		cancelled = record;
	}

	entry->token.cancel();
	persist(cancelled, workflow_status::cancelled);
	metrics_.cancelled_executions.fetch_add(1, std::memory_order_relaxed);

	logging::emit(logger_, log_level::info, "Cancelled workflow " + workflow_id);
	return cancelled;
}

kcenon::common::Result<workflow_status> workflow_engine::get_status(
	const std::string& workflow_id) const
{
	auto entry = find_entry(workflow_id);
	if (!entry)
	{
		return make_error(error_code::not_found, "Workflow '" + workflow_id + "' not found",
						  MODULE);
	}

	std::lock_guard<std::mutex> lock(entry->mutex);
	return entry->record.status;
}

kcenon::common::Result<workflow_execution> workflow_engine::get_execution(
	const std::string& workflow_id) const
{
	auto entry = find_entry(workflow_id);
	if (!entry)
	{
		return make_error(error_code::not_found, "Workflow '" + workflow_id + "' not found",
						  MODULE);
	}

	std::lock_guard<std::mutex> lock(entry->mutex);
	return entry->record;
}

std::shared_ptr<workflow_engine::execution_entry> workflow_engine::find_entry(
	const std::string& workflow_id) const
{
	{
		std::shared_lock lock(entries_mutex_);
		auto it = entries_.find(workflow_id);
		if (it != entries_.end())
		{
			return it->second;
		}
	}

	auto stored = repository_->list_executions([&workflow_id](const workflow_execution& execution)
											   { return execution.workflow_id == workflow_id; });
	if (stored.is_err() || stored.value().empty())
	{
		return nullptr;
	}

	std::unique_lock lock(entries_mutex_);
	auto [it, inserted] = entries_.try_emplace(workflow_id, nullptr);
	if (inserted)
	{
		it->second = std::make_shared<execution_entry>();
		it->second->record = stored.value().front();
	}
	return it->second;
}

void workflow_engine::persist(const workflow_execution& execution, workflow_status workflow_state)
{
	auto stored = repository_->put_execution(execution);
	if (stored.is_err())
	{
		logging::emit(logger_, log_level::error,
					  "Failed to store execution " + execution.id + ": " + stored.error().message);
	}

	auto workflow = repository_->get_workflow(execution.workflow_id);
	if (workflow.is_err())
	{
		logging::emit(logger_, log_level::error,
					  "Failed to load workflow " + execution.workflow_id + ": "
						  + workflow.error().message);
		return;
	}

	auto updated = workflow.value();
	updated.status = workflow_state;
	updated.updated_at = std::chrono::system_clock::now();

	auto stored_workflow = repository_->put_workflow(updated);
	if (stored_workflow.is_err())
	{
		logging::emit(logger_, log_level::error,
					  "Failed to store workflow " + updated.id + ": "
						  + stored_workflow.error().message);
	}
}

// ============================================================================
// Step scheduling
// ============================================================================

workflow_engine::run_outcome workflow_engine::run_steps(const federated_workflow& workflow,
														 execution_entry& entry)
{
	run_outcome outcome;

	std::map<std::string, step_status> states;
	std::map<std::string, step_execution> records;
	std::map<std::string, Json::Value> outputs;
	for (const auto& step : workflow.steps)
	{
		states[step.id] = step_status::pending;
	}

	auto max_parallel = std::clamp<uint32_t>(workflow.config.max_parallel_executions, 1,
											 std::max<uint32_t>(config_.max_parallel_steps, 1));
	auto started = std::chrono::steady_clock::now();

	auto close_pending = [&](step_status status)
	{
		auto now = std::chrono::system_clock::now();
		for (const auto& step : workflow.steps)
		{
			if (states[step.id] != step_status::pending)
			{
				continue;
			}
			step_execution record;
			record.step_id = step.id;
			record.status = status;
			record.provider_id = step.provider_id;
			record.started_at = now;
			record.ended_at = now;
			records[step.id] = record;
			states[step.id] = status;
		}
	};

	auto skip_step = [&](const workflow_step& step)
	{
		auto now = std::chrono::system_clock::now();
		step_execution record;
		record.step_id = step.id;
		record.status = step_status::skipped;
		record.provider_id = step.provider_id;
		record.started_at = now;
		record.ended_at = now;
		records[step.id] = record;
		states[step.id] = step_status::skipped;
	};

	while (true)
	{
		// Dependants of skipped steps are skipped too.
		for (bool changed = true; changed;)
		{
			changed = false;
			for (const auto& step : workflow.steps)
			{
				if (states[step.id] != step_status::pending)
				{
					continue;
				}
				bool blocked = std::any_of(step.dependencies.begin(), step.dependencies.end(),
										   [&states](const std::string& dependency)
										   { return states[dependency] == step_status::skipped; });
				if (blocked)
				{
					skip_step(step);
					changed = true;
				}
			}
		}

		std::vector<const workflow_step*> ready;
		bool pending = false;
		for (const auto& step : workflow.steps)
		{
			if (states[step.id] != step_status::pending)
			{
				continue;
			}
			pending = true;
			bool satisfied = std::all_of(step.dependencies.begin(), step.dependencies.end(),
										 [&states](const std::string& dependency)
										 { return states[dependency] == step_status::completed; });
			if (satisfied)
			{
				ready.push_back(&step);
			}
		}

		if (!pending)
		{
			break;
		}

		if (ready.empty())
		{
			outcome.error = make_execution_error(INTERNAL_ERROR, "No runnable step remains");
			close_pending(step_status::skipped);
			break;
		}

		if (workflow.config.timeout.count() > 0
			&& std::chrono::steady_clock::now() - started >= workflow.config.timeout)
		{
			outcome.error = make_execution_error(
				WORKFLOW_TIMEOUT, "Workflow exceeded its timeout of "
									  + std::to_string(workflow.config.timeout.count()) + "s");
			close_pending(step_status::cancelled);
			break;
		}

		if (entry.token.is_cancelled())
		{
			outcome.cancelled = true;
			close_pending(step_status::cancelled);
			break;
		}

		if (ready.size() > max_parallel)
		{
			ready.resize(max_parallel);
		}

		auto results = run_wave(workflow, ready, outputs, entry.token);

		const step_execution* failed = nullptr;
		bool cancelled = false;
		for (size_t i = 0; i < results.size(); ++i)
		{
			auto& result = results[i];
			const auto& step = *ready[i];

			accumulate(outcome.usage, result.usage);
			outcome.total_cost += result.record.cost;
			states[step.id] = result.record.status;
			records[step.id] = result.record;

			if (result.record.status == step_status::completed)
			{
				outputs[step.id] = result.output;

				if (step.type.kind == step_kind::conditional
					&& !is_truthy(result.output["condition"]))
				{
					for (const auto& candidate : workflow.steps)
					{
						bool depends = std::find(candidate.dependencies.begin(),
												 candidate.dependencies.end(), step.id)
									   != candidate.dependencies.end();
						if (depends && states[candidate.id] == step_status::pending)
						{
							skip_step(candidate);
						}
					}
				}
			}
			else if (result.record.status == step_status::failed && failed == nullptr)
			{
				failed = &records[step.id];
			}
			else if (result.record.status == step_status::cancelled)
			{
				cancelled = true;
			}
		}

		if (failed != nullptr)
		{
			Json::Value details(Json::objectValue);
			details["step_id"] = failed->step_id;
			if (failed->error)
			{
				details["step_error"] = failed->error->code;
				if (failed->error->details)
				{
					details["cause"] = *failed->error->details;
				}
			}

			auto code = failed->error && failed->error->code == INTERNAL_ERROR ? INTERNAL_ERROR
																				: EXECUTION_FAILED;
			auto message = "Step '" + failed->step_id + "' failed"
						   + (failed->error ? ": " + failed->error->message : std::string());
			outcome.error = make_execution_error(code, message, details);
			close_pending(step_status::skipped);
			break;
		}

		if (cancelled)
		{
			outcome.cancelled = true;
			close_pending(step_status::cancelled);
			break;
		}
	}

	for (const auto& step : workflow.steps)
	{
		auto it = records.find(step.id);
		if (it != records.end())
		{
			outcome.steps.push_back(it->second);
		}
		if (states[step.id] == step_status::completed)
		{
			outcome.result[step.id] = outputs[step.id];
		}
	}

	return outcome;
}

std::vector<workflow_engine::step_outcome> workflow_engine::run_wave(
	const federated_workflow& workflow,
	const std::vector<const workflow_step*>& wave,
	const std::map<std::string, Json::Value>& outputs,
	kcenon::thread::cancellation_token token)
{
	std::vector<std::shared_ptr<step_outcome>> slots;
	std::vector<std::future<void>> futures;
	slots.reserve(wave.size());
	futures.reserve(wave.size());

	for (const auto* step : wave)
	{
		auto slot = std::make_shared<step_outcome>();
		slots.push_back(slot);

		auto work = [this, &workflow, step, &outputs, token, slot]()
		{ *slot = run_step(workflow, *step, outputs, token); };

		if (executor_)
		{
			auto job = std::make_unique<workflow_step_job>(step->id, work);
			auto result = executor_->execute(std::move(job));
			if (result.is_ok())
			{
				futures.push_back(std::move(result.unwrap()));
				continue;
			}
			logging::emit(logger_, log_level::warning,
						  "Executor rejected step " + step->id + ": " + result.error().message
							  + "; running it on a dedicated thread");
		}

		// Fallback to std::async if no executor provided
		futures.push_back(std::async(std::launch::async, work));
	}

	// Wait for every step before surfacing any exception; the steps
	// reference this wave's inputs.
	for (auto& future : futures)
	{
		future.wait();
	}
	for (auto& future : futures)
	{
		future.get();
	}

	std::vector<step_outcome> results;
	results.reserve(slots.size());
	for (auto& slot : slots)
	{
		results.push_back(std::move(*slot));
	}
	return results;
}

// ============================================================================
// Step execution
// ============================================================================

workflow_engine::step_outcome workflow_engine::run_step(
	const federated_workflow& workflow,
	const workflow_step& step,
	const std::map<std::string, Json::Value>& outputs,
	kcenon::thread::cancellation_token token)
{
	auto begin = std::chrono::steady_clock::now();
	auto started_at = std::chrono::system_clock::now();

	step_outcome outcome;
	try
	{
		Json::Value input(Json::objectValue);
		for (const auto& [field, path] : step.input_mapping)
		{
			input[field] = resolve_step_path(outputs, path);
		}

		if (step.type.runs_locally() && !step.provider_id)
		{
			outcome = run_local_step(step, input, outputs);
		}
		else
		{
			outcome = run_provider_step(workflow, step, input, token);
		}
	}
	catch (const std::exception& e)
	{
		outcome = step_outcome{};
		outcome.record.status = step_status::failed;
		outcome.record.error = make_execution_error(INTERNAL_ERROR, e.what());
		logging::emit(logger_, log_level::error,
					  "Unexpected error in step " + step.id + ": " + e.what());
	}

	outcome.record.step_id = step.id;
	outcome.record.provider_id = step.provider_id;
	outcome.record.started_at = started_at;
	outcome.record.ended_at = std::chrono::system_clock::now();
	if (outcome.record.status == step_status::completed)
	{
		outcome.record.result = outcome.output;
	}
	outcome.usage.cpu_time += elapsed_ms(begin);

	metrics_.steps_executed.fetch_add(1, std::memory_order_relaxed);
	return outcome;
}

workflow_engine::step_outcome workflow_engine::run_local_step(
	const workflow_step& step,
	const Json::Value& input,
	const std::map<std::string, Json::Value>& outputs)
{
	step_outcome outcome;

	if (step.type.kind == step_kind::conditional)
	{
		const auto& condition = step.config.parameters["condition"];
		Json::Value value(Json::nullValue);
		if (condition.isString())
		{
			value = resolve_step_path(outputs, condition.asString());
		}
		else if (condition.isBool())
		{
			value = condition;
		}

		outcome.output = Json::Value(Json::objectValue);
		outcome.output["condition"] = is_truthy(value);
	}
	else
	{
		outcome.output = apply_output_mapping(step, input);
	}

	outcome.record.status = step_status::completed;
	return outcome;
}

workflow_engine::step_outcome workflow_engine::run_provider_step(
	const federated_workflow& workflow,
	const workflow_step& step,
	const Json::Value& input,
	kcenon::thread::cancellation_token token)
{
	step_outcome outcome;
	const auto& parameters = step.config.parameters;

	proxy::proxy_request request;
	request.method = parameters["method"].isString() ? parameters["method"].asString() : "POST";
	request.path = parameters["path"].isString()
					   ? parameters["path"].asString()
					   : config_.step_path_prefix + step.type.name();
	request.protocol_version = config_.protocol_version;
	request.headers["x-workflow-id"] = workflow.id;
	request.headers["x-step-id"] = step.id;
	// The step retry policy below is the only retry loop for workflow calls.
	request.max_attempts = 1;
	request.body = Json::Value(Json::objectValue);
	request.body["step_id"] = step.id;
	request.body["parameters"] = parameters;
	request.body["input"] = input;
	if (step.config.timeout)
	{
		request.timeout
			= std::chrono::duration_cast<std::chrono::milliseconds>(*step.config.timeout);
	}

	auto request_size = write_json(request.body).size();
	proxy::retry_policy policy(
		to_retry_config(step.retry_config.value_or(workflow.config.retry_policy)));

	for (uint32_t attempt = 0; attempt < policy.max_attempts(); ++attempt)
	{
		auto response = proxy_->proxy_request(*step.provider_id, request);
		outcome.usage.api_calls += 1;
		outcome.usage.network_io += request_size;

		if (response.is_ok())
		{
			const auto& value = response.value();
			outcome.usage.network_io += write_json(value.body).size();

			if (value.status_code >= 400)
			{
				outcome.record.status = step_status::failed;
				outcome.record.error = make_execution_error(
					EXECUTION_FAILED, "Provider '" + *step.provider_id + "' returned HTTP "
										  + std::to_string(value.status_code));
				return outcome;
			}

			outcome.output = apply_output_mapping(step, value.body);
			outcome.record.cost = parse_cost(value.headers, config_.cost_header).value_or(0.0);
			outcome.record.status = step_status::completed;
			return outcome;
		}

		const auto& error = response.error();
		if (!policy.should_retry(error, attempt))
		{
			Json::Value details(Json::objectValue);
			details["error_kind"] = to_string(error_kind_of(error));
			details["service"] = *step.provider_id;
			details["retryable"] = is_retryable(error);

			outcome.record.status = step_status::failed;
			outcome.record.error = make_execution_error(EXECUTION_FAILED, error.message, details);
			return outcome;
		}

		outcome.record.retry_attempts += 1;
		metrics_.step_retries.fetch_add(1, std::memory_order_relaxed);
		logging::emit(logger_, log_level::debug,
					  "Retrying step " + step.id + " after attempt " + std::to_string(attempt + 1)
						  + ": " + error.message);

		if (!policy.wait(attempt, [token]() mutable { return token.is_cancelled(); }))
		{
			outcome.record.status = step_status::cancelled;
			outcome.record.error
				= make_execution_error(STEP_CANCELLED, "Cancelled while waiting to retry");
			return outcome;
		}
	}

	// Unreachable while max_attempts() >= 1.
	outcome.record.status = step_status::failed;
	outcome.record.error = make_execution_error(EXECUTION_FAILED, "No attempt made");
	return outcome;
}

// ============================================================================
// Observability
// ============================================================================

Json::Value workflow_engine::health() const
{
	auto finished = metrics_.successful_executions.load(std::memory_order_relaxed)
					+ metrics_.failed_executions.load(std::memory_order_relaxed);
	auto rate = metrics_.success_rate();

	Json::Value result(Json::objectValue);
	result["status"] = metrics::to_string(metrics::classify_health(rate, finished));
	result["total_executions"]
		= Json::UInt64(metrics_.total_executions.load(std::memory_order_relaxed));
	result["successful_executions"]
		= Json::UInt64(metrics_.successful_executions.load(std::memory_order_relaxed));
	result["failed_executions"]
		= Json::UInt64(metrics_.failed_executions.load(std::memory_order_relaxed));
	result["cancelled_executions"]
		= Json::UInt64(metrics_.cancelled_executions.load(std::memory_order_relaxed));
	result["running_executions"]
		= Json::UInt64(metrics_.running_executions.load(std::memory_order_relaxed));
	result["success_rate"] = rate;
	result["average_execution_time_ms"] = metrics_.average_execution_time_ms();
	return result;
}

Json::Value workflow_engine::metrics() const
{
	Json::Value result(Json::objectValue);
	result["workflows_created"]
		= Json::UInt64(metrics_.workflows_created.load(std::memory_order_relaxed));
	result["workflow_executions_total"]
		= Json::UInt64(metrics_.total_executions.load(std::memory_order_relaxed));
	result["workflow_executions_successful"]
		= Json::UInt64(metrics_.successful_executions.load(std::memory_order_relaxed));
	result["workflow_executions_failed"]
		= Json::UInt64(metrics_.failed_executions.load(std::memory_order_relaxed));
	result["workflow_executions_cancelled"]
		= Json::UInt64(metrics_.cancelled_executions.load(std::memory_order_relaxed));
	result["workflow_executions_running"]
		= Json::UInt64(metrics_.running_executions.load(std::memory_order_relaxed));
	result["workflow_steps_executed"]
		= Json::UInt64(metrics_.steps_executed.load(std::memory_order_relaxed));
	result["workflow_step_retries"]
		= Json::UInt64(metrics_.step_retries.load(std::memory_order_relaxed));
	result["workflow_average_execution_time_ms"] = metrics_.average_execution_time_ms();
	return result;
}

void workflow_engine::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
}

void workflow_engine::set_executor(std::shared_ptr<kcenon::common::interfaces::IExecutor> executor)
{
	executor_ = std::move(executor);
}

} // namespace federation_gateway::workflow
