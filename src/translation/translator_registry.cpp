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

#include <kcenon/federation_gateway/translation/translator_registry.h>

#include <kcenon/federation_gateway/core/federation_error.h>

#include <algorithm>

namespace federation_gateway::translation
{

namespace
{

constexpr const char* MODULE = "translator_registry";

bool contains(const std::vector<std::string>& values, const std::string& value)
{
	return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

// ============================================================================
// field_mapping_translator
// ============================================================================

field_mapping_translator::field_mapping_translator(std::string name,
												   std::string source_version,
												   std::string target_version,
												   field_mapping_rules rules)
	: name_(std::move(name))
	, source_version_(std::move(source_version))
	, target_version_(std::move(target_version))
	, rules_(std::move(rules))
{
}

kcenon::common::Result<translation_output> field_mapping_translator::translate(
	const Json::Value& payload) const
{
	translation_output output;

	if (!payload.isObject())
	{
		output.payload = payload;
		output.warnings.push_back("Payload is not an object; passed through unchanged");
		return output;
	}

	output.payload = Json::Value(Json::objectValue);

	// getMemberNames() is sorted for jsoncpp objects.
	for (const auto& field : payload.getMemberNames())
	{
		if (contains(rules_.drops, field))
		{
			output.dropped_fields.push_back(field);
			continue;
		}

		auto rename = rules_.renames.find(field);
		if (rename == rules_.renames.end())
		{
			output.payload[field] = payload[field];
			output.mapped_fields.push_back(field);
			continue;
		}

		const auto& target = rename->second;
		if (payload.isMember(target))
		{
			output.dropped_fields.push_back(field);
			output.warnings.push_back("Field '" + field + "' not renamed to '" + target
									  + "': target already present");
			continue;
		}

		output.payload[target] = payload[field];
		output.mapped_fields.push_back(target);
	}

	for (const auto& [field, value] : rules_.defaults)
	{
		if (!output.payload.isMember(field))
		{
			output.payload[field] = value;
			output.defaulted_fields.push_back(field);
		}
	}

	std::sort(output.mapped_fields.begin(), output.mapped_fields.end());
	return output;
}

std::vector<version_pair> field_mapping_translator::supported_versions() const
{
	return { { source_version_, target_version_ } };
}

std::string field_mapping_translator::name() const
{
	return name_;
}

// ============================================================================
// translator_registry
// ============================================================================

std::shared_ptr<translator_registry> translator_registry::with_defaults()
{
	auto registry = std::make_shared<translator_registry>();

	field_mapping_rules upgrade;
	upgrade.renames = { { "tool", "name" }, { "args", "arguments" } };
	upgrade.drops = { "session" };
	upgrade.defaults = { { "jsonrpc", Json::Value("2.0") } };
	registry->register_translator(std::make_shared<field_mapping_translator>(
		"V1ToV2Translator", "v1.0", "v2.0", std::move(upgrade)));

	field_mapping_rules downgrade;
	downgrade.renames = { { "name", "tool" }, { "arguments", "args" } };
	downgrade.drops = { "jsonrpc" };
	registry->register_translator(std::make_shared<field_mapping_translator>(
		"V2ToV1Translator", "v2.0", "v1.0", std::move(downgrade)));

	return registry;
}

std::string translator_registry::make_key(const std::string& source_version,
										  const std::string& target_version)
{
	return source_version + "->" + target_version;
}

void translator_registry::register_translator(std::shared_ptr<version_translator> translator)
{
	if (!translator)
	{
		return;
	}

	std::unique_lock lock(mutex_);
	for (const auto& [source, target] : translator->supported_versions())
	{
		translators_[make_key(source, target)] = translator;
	}
}

bool translator_registry::unregister_translator(const std::string& source_version,
												const std::string& target_version)
{
	std::unique_lock lock(mutex_);
	return translators_.erase(make_key(source_version, target_version)) > 0;
}

std::shared_ptr<version_translator> translator_registry::find(
	const std::string& source_version, const std::string& target_version) const
{
	std::shared_lock lock(mutex_);
	auto it = translators_.find(make_key(source_version, target_version));
	return it != translators_.end() ? it->second : nullptr;
}

kcenon::common::Result<translation_output> translator_registry::translate(
	const Json::Value& payload,
	const std::string& source_version,
	const std::string& target_version) const
{
	if (source_version == target_version)
	{
		translation_output output;
		output.payload = payload;
		if (payload.isObject())
		{
			output.mapped_fields = payload.getMemberNames();
		}
		return output;
	}

	auto translator = find(source_version, target_version);
	if (!translator)
	{
		return make_translation_error(MODULE, source_version, target_version);
	}

	return translator->translate(payload);
}

bool translator_registry::supports(const std::string& source_version,
								   const std::string& target_version) const
{
	return source_version == target_version
		   || find(source_version, target_version) != nullptr;
}

std::vector<std::string> translator_registry::keys() const
{
	std::vector<std::string> result;
	{
		std::shared_lock lock(mutex_);
		result.reserve(translators_.size());
		for (const auto& [key, translator] : translators_)
		{
			result.push_back(key);
		}
	}
	std::sort(result.begin(), result.end());
	return result;
}

size_t translator_registry::size() const
{
	std::shared_lock lock(mutex_);
	return translators_.size();
}

} // namespace federation_gateway::translation
