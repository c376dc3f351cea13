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

#include <kcenon/federation_gateway/storage/memory_repositories.h>

#include <kcenon/federation_gateway/core/federation_error.h>

#include <algorithm>

namespace federation_gateway::storage
{

namespace
{

constexpr const char* MODULE = "memory_repository";

template <typename T>
std::vector<T> collect(const std::unordered_map<std::string, T>& records,
					   const predicate<T>& filter)
{
	std::vector<T> result;
	for (const auto& [id, record] : records)
	{
		if (!filter || filter(record))
		{
			result.push_back(record);
		}
	}
	return result;
}

} // namespace

// ============================================================================
// memory_workflow_repository
// ============================================================================

kcenon::common::VoidResult memory_workflow_repository::put_workflow(
	const workflow::federated_workflow& workflow)
{
	if (workflow.id.empty())
	{
		return make_error(error_code::storage_error, "Workflow id must not be empty", MODULE);
	}

	std::unique_lock lock(mutex_);
	workflows_[workflow.id] = workflow;
	return kcenon::common::ok();
}

kcenon::common::Result<workflow::federated_workflow> memory_workflow_repository::get_workflow(
	const std::string& id) const
{
	std::shared_lock lock(mutex_);
	auto it = workflows_.find(id);
	if (it == workflows_.end())
	{
		return make_error(error_code::not_found, "Workflow '" + id + "' not found", MODULE);
	}
	return it->second;
}

kcenon::common::Result<std::vector<workflow::federated_workflow>>
memory_workflow_repository::list_workflows(
	const predicate<workflow::federated_workflow>& filter) const
{
	std::vector<workflow::federated_workflow> result;
	{
		std::shared_lock lock(mutex_);
		result = collect(workflows_, filter);
	}

	std::sort(result.begin(), result.end(),
			  [](const workflow::federated_workflow& a, const workflow::federated_workflow& b)
			  {
				  return a.created_at != b.created_at ? a.created_at < b.created_at
													  : a.id < b.id;
			  });
	return result;
}

kcenon::common::VoidResult memory_workflow_repository::put_execution(
	const workflow::workflow_execution& execution)
{
	if (execution.id.empty())
	{
		return make_error(error_code::storage_error, "Execution id must not be empty", MODULE);
	}

	std::unique_lock lock(mutex_);
	executions_[execution.id] = execution;
	return kcenon::common::ok();
}

kcenon::common::Result<workflow::workflow_execution> memory_workflow_repository::get_execution(
	const std::string& id) const
{
	std::shared_lock lock(mutex_);
	auto it = executions_.find(id);
	if (it == executions_.end())
	{
		return make_error(error_code::not_found, "Execution '" + id + "' not found", MODULE);
	}
	return it->second;
}

kcenon::common::Result<std::vector<workflow::workflow_execution>>
memory_workflow_repository::list_executions(
	const predicate<workflow::workflow_execution>& filter) const
{
	std::vector<workflow::workflow_execution> result;
	{
		std::shared_lock lock(mutex_);
		result = collect(executions_, filter);
	}

	std::sort(result.begin(), result.end(),
			  [](const workflow::workflow_execution& a, const workflow::workflow_execution& b)
			  { return a.id < b.id; });
	return result;
}

// ============================================================================
// memory_translation_repository
// ============================================================================

memory_translation_repository::memory_translation_repository(size_t max_history_per_key)
	: max_history_per_key_(max_history_per_key)
{
}

kcenon::common::VoidResult memory_translation_repository::put_translation(
	const translation::schema_translation_record& record)
{
	if (record.id.empty())
	{
		return make_error(error_code::storage_error, "Translation id must not be empty", MODULE);
	}

	std::unique_lock lock(mutex_);
	translations_[record.id] = record;
	return kcenon::common::ok();
}

kcenon::common::Result<translation::schema_translation_record>
memory_translation_repository::get_translation(const std::string& id) const
{
	std::shared_lock lock(mutex_);
	auto it = translations_.find(id);
	if (it == translations_.end())
	{
		return make_error(error_code::not_found, "Translation '" + id + "' not found", MODULE);
	}
	return it->second;
}

kcenon::common::Result<std::vector<translation::schema_translation_record>>
memory_translation_repository::list_translations(
	const predicate<translation::schema_translation_record>& filter) const
{
	std::vector<translation::schema_translation_record> result;
	{
		std::shared_lock lock(mutex_);
		result = collect(translations_, filter);
	}

	std::sort(result.begin(), result.end(),
			  [](const translation::schema_translation_record& a,
				 const translation::schema_translation_record& b)
			  {
				  return a.created_at != b.created_at ? a.created_at < b.created_at
													  : a.id < b.id;
			  });
	return result;
}

kcenon::common::VoidResult memory_translation_repository::append_history(
	const std::string& key, const translation::translation_history_record& record)
{
	std::unique_lock lock(mutex_);

	auto& entries = history_[key];
	entries.push_back(record);
	while (entries.size() > max_history_per_key_)
	{
		entries.pop_front();
	}
	return kcenon::common::ok();
}

kcenon::common::Result<std::vector<translation::translation_history_record>>
memory_translation_repository::history(const std::string& key) const
{
	std::shared_lock lock(mutex_);

	auto it = history_.find(key);
	if (it == history_.end())
	{
		return std::vector<translation::translation_history_record>{};
	}
	return std::vector<translation::translation_history_record>(it->second.begin(),
																 it->second.end());
}

} // namespace federation_gateway::storage
