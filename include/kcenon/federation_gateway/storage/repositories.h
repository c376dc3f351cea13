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
 * @file repositories.h
 * @brief Persistence interfaces for workflows and translations
 *
 * The gateway never talks to a storage engine directly. Records are
 * written and read through these interfaces, which an embedding process
 * implements over its database of choice. Every operation is one of:
 * get by id, list by predicate, put, or append a history record.
 *
 * Implementations must be thread-safe.
 */

#pragma once

#include <kcenon/federation_gateway/translation/translation_types.h>
#include <kcenon/federation_gateway/workflow/workflow_types.h>

#include <kcenon/common/patterns/result.h>

#include <functional>
#include <string>
#include <vector>

namespace federation_gateway::storage
{

template <typename T>
using predicate = std::function<bool(const T&)>;

/**
 * @class workflow_repository
 * @brief Storage of workflow definitions and their executions
 */
class workflow_repository
{
public:
	virtual ~workflow_repository() = default;

	/**
	 * @brief Insert or replace a workflow definition
	 */
	virtual kcenon::common::VoidResult put_workflow(const workflow::federated_workflow& workflow) = 0;

	/**
	 * @brief Fetch a workflow; fails with not_found when absent
	 */
	[[nodiscard]] virtual kcenon::common::Result<workflow::federated_workflow> get_workflow(
		const std::string& id) const = 0;

	[[nodiscard]] virtual kcenon::common::Result<std::vector<workflow::federated_workflow>>
	list_workflows(const predicate<workflow::federated_workflow>& filter) const = 0;

	virtual kcenon::common::VoidResult put_execution(
		const workflow::workflow_execution& execution) = 0;

	[[nodiscard]] virtual kcenon::common::Result<workflow::workflow_execution> get_execution(
		const std::string& id) const = 0;

	[[nodiscard]] virtual kcenon::common::Result<std::vector<workflow::workflow_execution>>
	list_executions(const predicate<workflow::workflow_execution>& filter) const = 0;
};

/**
 * @class translation_repository
 * @brief Storage of translation records and the per-pair history log
 */
class translation_repository
{
public:
	virtual ~translation_repository() = default;

	virtual kcenon::common::VoidResult put_translation(
		const translation::schema_translation_record& record) = 0;

	[[nodiscard]] virtual kcenon::common::Result<translation::schema_translation_record>
	get_translation(const std::string& id) const = 0;

	[[nodiscard]] virtual kcenon::common::Result<std::vector<translation::schema_translation_record>>
	list_translations(const predicate<translation::schema_translation_record>& filter) const = 0;

	/**
	 * @brief Append to the history kept under key ("src->tgt")
	 */
	virtual kcenon::common::VoidResult append_history(
		const std::string& key, const translation::translation_history_record& record) = 0;

	/**
	 * @brief History under key, oldest first; empty for an unknown key
	 */
	[[nodiscard]] virtual kcenon::common::Result<std::vector<translation::translation_history_record>>
	history(const std::string& key) const = 0;
};

} // namespace federation_gateway::storage
