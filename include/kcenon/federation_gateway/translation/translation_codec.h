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
 * @file translation_codec.h
 * @brief JSON encoding of schema translation requests, responses and records
 *
 * Request:  {source_version, target_version, source_data, client_id?}
 * Response: {translated_data, translation_metadata: {translation_id,
 *            mapped_fields, dropped_fields, defaulted_fields, duration_ms},
 *            warnings}
 */

#pragma once

#include "translation_types.h"

#include <kcenon/common/patterns/result.h>

#include <json/json.h>

namespace federation_gateway::translation
{

/**
 * @brief Decode a translation request
 *
 * Fails with validation_error naming the first missing or mistyped field.
 */
[[nodiscard]] kcenon::common::Result<schema_translation_request> request_from_json(
	const Json::Value& json);

[[nodiscard]] Json::Value to_json(const schema_translation_request& request);

[[nodiscard]] kcenon::common::Result<schema_translation_response> response_from_json(
	const Json::Value& json);

[[nodiscard]] Json::Value to_json(const schema_translation_response& response);

[[nodiscard]] Json::Value to_json(const schema_translation_record& record);

[[nodiscard]] Json::Value to_json(const translation_history_record& record);

} // namespace federation_gateway::translation
