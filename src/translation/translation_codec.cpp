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

#include <kcenon/federation_gateway/translation/translation_codec.h>

#include <kcenon/federation_gateway/core/federation_error.h>
#include <kcenon/federation_gateway/core/json_utils.h>

namespace federation_gateway::translation
{

namespace
{

constexpr const char* MODULE = "translation_codec";

Json::Value string_array(const std::vector<std::string>& values)
{
	Json::Value array(Json::arrayValue);
	for (const auto& value : values)
	{
		array.append(value);
	}
	return array;
}

kcenon::common::Result<std::vector<std::string>> read_string_array(const Json::Value& json,
																   const std::string& field)
{
	std::vector<std::string> values;
	if (json.isNull())
	{
		return values;
	}
	if (!json.isArray())
	{
		return make_validation_error(MODULE, field, "must be an array of strings");
	}
	for (const auto& item : json)
	{
		if (!item.isString())
		{
			return make_validation_error(MODULE, field, "must be an array of strings");
		}
		values.push_back(item.asString());
	}
	return values;
}

} // namespace

kcenon::common::Result<schema_translation_request> request_from_json(const Json::Value& json)
{
	if (!json.isObject())
	{
		return make_validation_error(MODULE, "request", "must be an object");
	}

	schema_translation_request request;

	const auto& source_version = json["source_version"];
	if (!source_version.isString() || source_version.asString().empty())
	{
		return make_validation_error(MODULE, "source_version", "must be a non-empty string");
	}
	request.source_version = source_version.asString();

	const auto& target_version = json["target_version"];
	if (!target_version.isString() || target_version.asString().empty())
	{
		return make_validation_error(MODULE, "target_version", "must be a non-empty string");
	}
	request.target_version = target_version.asString();

	if (!json.isMember("source_data"))
	{
		return make_validation_error(MODULE, "source_data", "is required");
	}
	request.source_data = json["source_data"];

	const auto& client_id = json["client_id"];
	if (!client_id.isNull())
	{
		if (!client_id.isString())
		{
			return make_validation_error(MODULE, "client_id", "must be a string");
		}
		request.client_id = client_id.asString();
	}

	return request;
}

Json::Value to_json(const schema_translation_request& request)
{
	Json::Value json(Json::objectValue);
	json["source_version"] = request.source_version;
	json["target_version"] = request.target_version;
	json["source_data"] = request.source_data;
	if (request.client_id)
	{
		json["client_id"] = *request.client_id;
	}
	return json;
}

kcenon::common::Result<schema_translation_response> response_from_json(const Json::Value& json)
{
	if (!json.isObject())
	{
		return make_validation_error(MODULE, "response", "must be an object");
	}

	schema_translation_response response;
	response.translated_data = json["translated_data"];

	const auto& metadata = json["translation_metadata"];
	if (!metadata.isObject())
	{
		return make_validation_error(MODULE, "translation_metadata", "must be an object");
	}

	const auto& translation_id = metadata["translation_id"];
	if (!translation_id.isString())
	{
		return make_validation_error(MODULE, "translation_metadata.translation_id",
									 "must be a string");
	}
	response.metadata.translation_id = translation_id.asString();

	auto mapped = read_string_array(metadata["mapped_fields"], "translation_metadata.mapped_fields");
	if (mapped.is_err())
	{
		return mapped.error();
	}
	response.metadata.mapped_fields = mapped.value();

	auto dropped
		= read_string_array(metadata["dropped_fields"], "translation_metadata.dropped_fields");
	if (dropped.is_err())
	{
		return dropped.error();
	}
	response.metadata.dropped_fields = dropped.value();

	auto defaulted
		= read_string_array(metadata["defaulted_fields"], "translation_metadata.defaulted_fields");
	if (defaulted.is_err())
	{
		return defaulted.error();
	}
	response.metadata.defaulted_fields = defaulted.value();

	const auto& duration = metadata["duration_ms"];
	if (!duration.isNull() && !duration.isNumeric())
	{
		return make_validation_error(MODULE, "translation_metadata.duration_ms",
									 "must be a number");
	}
	response.metadata.duration_ms = duration.isNull() ? 0.0 : duration.asDouble();

	auto warnings = read_string_array(json["warnings"], "warnings");
	if (warnings.is_err())
	{
		return warnings.error();
	}
	response.warnings = warnings.value();

	return response;
}

Json::Value to_json(const schema_translation_response& response)
{
	Json::Value metadata(Json::objectValue);
	metadata["translation_id"] = response.metadata.translation_id;
	metadata["mapped_fields"] = string_array(response.metadata.mapped_fields);
	metadata["dropped_fields"] = string_array(response.metadata.dropped_fields);
	metadata["defaulted_fields"] = string_array(response.metadata.defaulted_fields);
	metadata["duration_ms"] = response.metadata.duration_ms;

	Json::Value json(Json::objectValue);
	json["translated_data"] = response.translated_data;
	json["translation_metadata"] = metadata;
	json["warnings"] = string_array(response.warnings);
	return json;
}

Json::Value to_json(const schema_translation_record& record)
{
	Json::Value json(Json::objectValue);
	json["id"] = record.id;
	json["source_version"] = record.source_version;
	json["target_version"] = record.target_version;
	if (record.client_id)
	{
		json["client_id"] = *record.client_id;
	}
	json["translated_data"] = record.response.translated_data;
	json["translation_metadata"] = to_json(record.response)["translation_metadata"];
	json["created_at"] = format_timestamp(record.created_at);
	return json;
}

Json::Value to_json(const translation_history_record& record)
{
	Json::Value json(Json::objectValue);
	json["timestamp"] = format_timestamp(record.timestamp);
	json["source_version"] = record.source_version;
	json["target_version"] = record.target_version;
	json["duration_ms"] = record.duration_ms;
	json["success"] = record.success;
	if (!record.error_message.empty())
	{
		json["error_message"] = record.error_message;
	}
	json["payload_size"] = Json::UInt64(record.payload_size);
	return json;
}

} // namespace federation_gateway::translation
