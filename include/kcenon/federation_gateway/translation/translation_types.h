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
 * @file translation_types.h
 * @brief Request, response and record types of the schema translation service
 */

#pragma once

#include <json/json.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace federation_gateway::translation
{

/**
 * @struct schema_translation_request
 * @brief Payload to translate between two schema versions
 */
struct schema_translation_request
{
	std::string source_version;
	std::string target_version;
	Json::Value source_data{ Json::objectValue };
	std::optional<std::string> client_id; ///< Part of the cache key when set
};

/**
 * @struct translation_metadata
 * @brief Field bookkeeping returned with every translation
 */
struct translation_metadata
{
	std::string translation_id;
	std::vector<std::string> mapped_fields;
	std::vector<std::string> dropped_fields;
	std::vector<std::string> defaulted_fields;
	double duration_ms = 0.0;
};

/**
 * @struct schema_translation_response
 * @brief Result of translate_schema()
 */
struct schema_translation_response
{
	Json::Value translated_data;
	translation_metadata metadata;
	std::vector<std::string> warnings;
};

/**
 * @struct schema_translation_record
 * @brief Stored translation, created once per cache key and never mutated
 */
struct schema_translation_record
{
	std::string id;
	std::string cache_key;
	std::string source_version;
	std::string target_version;
	std::optional<std::string> client_id;
	schema_translation_response response;
	std::chrono::system_clock::time_point created_at;
};

/**
 * @struct translation_history_record
 * @brief One translation attempt, successful or not
 */
struct translation_history_record
{
	std::chrono::system_clock::time_point timestamp;
	std::string source_version;
	std::string target_version;
	double duration_ms = 0.0;
	bool success = false;
	std::string error_message;
	size_t payload_size = 0; ///< Canonical serialized size of the source data
};

} // namespace federation_gateway::translation
