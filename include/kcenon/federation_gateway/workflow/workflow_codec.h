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
 * @file workflow_codec.h
 * @brief JSON encoding of workflow definitions and execution records
 *
 * Field names are snake_case. Ids are strings, timestamps RFC 3339 UTC
 * strings, workflow and step timeouts whole seconds, retry delays
 * milliseconds. Built-in step types are plain strings; custom step types
 * are written as {"custom": "<name>"} and read from either form.
 */

#pragma once

#include "workflow_types.h"

#include <kcenon/common/patterns/result.h>

#include <json/json.h>

#include <optional>
#include <string>

namespace federation_gateway::workflow
{

[[nodiscard]] std::optional<workflow_status> parse_workflow_status(const std::string& name);
[[nodiscard]] std::optional<workflow_priority> parse_workflow_priority(const std::string& name);
[[nodiscard]] std::optional<execution_environment> parse_execution_environment(
	const std::string& name);

/**
 * @brief Decode a workflow definition
 *
 * Absent optional fields take their defaults. Content rules (non-empty
 * name and steps, dependency sanity) are enforced by the engine; this
 * function only rejects missing or mistyped fields, naming the field path
 * (e.g. "steps[1].dependencies").
 */
[[nodiscard]] kcenon::common::Result<federated_workflow> workflow_from_json(const Json::Value& json);

[[nodiscard]] Json::Value to_json(const federated_workflow& workflow);

[[nodiscard]] Json::Value to_json(const workflow_step& step);

[[nodiscard]] Json::Value to_json(const retry_policy_config& retry);

[[nodiscard]] Json::Value to_json(const workflow_execution& execution);

[[nodiscard]] Json::Value to_json(const step_execution& step);

[[nodiscard]] Json::Value to_json(const execution_error& error);

[[nodiscard]] Json::Value to_json(const resource_usage& usage);

} // namespace federation_gateway::workflow
