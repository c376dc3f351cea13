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
 * @file memory_repositories.h
 * @brief In-process repository implementations
 *
 * Used by tests, benchmarks and embedders without a storage engine.
 * Records live in hash maps behind a shared_mutex; history per key is
 * capped at max_history_per_key records, oldest dropped first.
 */

#pragma once

#include "repositories.h"

#include <cstddef>
#include <deque>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace federation_gateway::storage
{

class memory_workflow_repository : public workflow_repository
{
public:
	memory_workflow_repository() = default;

	kcenon::common::VoidResult put_workflow(const workflow::federated_workflow& workflow) override;

	[[nodiscard]] kcenon::common::Result<workflow::federated_workflow> get_workflow(
		const std::string& id) const override;

	[[nodiscard]] kcenon::common::Result<std::vector<workflow::federated_workflow>>
	list_workflows(const predicate<workflow::federated_workflow>& filter) const override;

	kcenon::common::VoidResult put_execution(const workflow::workflow_execution& execution) override;

	[[nodiscard]] kcenon::common::Result<workflow::workflow_execution> get_execution(
		const std::string& id) const override;

	[[nodiscard]] kcenon::common::Result<std::vector<workflow::workflow_execution>>
	list_executions(const predicate<workflow::workflow_execution>& filter) const override;

private:
	mutable std::shared_mutex mutex_;
	std::unordered_map<std::string, workflow::federated_workflow> workflows_;
	std::unordered_map<std::string, workflow::workflow_execution> executions_;
};

class memory_translation_repository : public translation_repository
{
public:
	explicit memory_translation_repository(size_t max_history_per_key = 1000);

	kcenon::common::VoidResult put_translation(
		const translation::schema_translation_record& record) override;

	[[nodiscard]] kcenon::common::Result<translation::schema_translation_record> get_translation(
		const std::string& id) const override;

	[[nodiscard]] kcenon::common::Result<std::vector<translation::schema_translation_record>>
	list_translations(const predicate<translation::schema_translation_record>& filter) const override;

	kcenon::common::VoidResult append_history(
		const std::string& key, const translation::translation_history_record& record) override;

	[[nodiscard]] kcenon::common::Result<std::vector<translation::translation_history_record>>
	history(const std::string& key) const override;

private:
	size_t max_history_per_key_;

	mutable std::shared_mutex mutex_;
	std::unordered_map<std::string, translation::schema_translation_record> translations_;
	std::unordered_map<std::string, std::deque<translation::translation_history_record>> history_;
};

} // namespace federation_gateway::storage
