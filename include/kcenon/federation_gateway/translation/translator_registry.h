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
 * @file translator_registry.h
 * @brief Pluggable version-to-version payload translators
 *
 * A translator converts a JSON payload shaped for one protocol version
 * into the shape expected by another. Translators are registered under
 * the key "{source_version}->{target_version}"; adding a version pair is a
 * registry insert.
 *
 * Translators must be pure functions of their input: the same payload
 * always yields the same output and the same field metadata.
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <json/json.h>

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace federation_gateway::translation
{

/**
 * @struct translation_output
 * @brief Translated payload and the field bookkeeping behind it
 */
struct translation_output
{
	Json::Value payload;                        ///< Translated payload
	std::vector<std::string> mapped_fields;     ///< Output fields carried from the input
	std::vector<std::string> dropped_fields;    ///< Input fields with no target
	std::vector<std::string> defaulted_fields;  ///< Output fields filled from defaults
	std::vector<std::string> warnings;          ///< Non-fatal translation notes
};

using version_pair = std::pair<std::string, std::string>;

/**
 * @class version_translator
 * @brief Interface for a payload translator
 */
class version_translator
{
public:
	virtual ~version_translator() = default;

	/**
	 * @brief Translate a payload
	 * @param payload Input shaped for the source version
	 * @return Translated output or an error
	 */
	[[nodiscard]] virtual kcenon::common::Result<translation_output> translate(
		const Json::Value& payload) const = 0;

	/**
	 * @brief Ordered version pairs this translator handles
	 */
	[[nodiscard]] virtual std::vector<version_pair> supported_versions() const = 0;

	[[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @struct field_mapping_rules
 * @brief Declarative top-level field rules
 */
struct field_mapping_rules
{
	std::map<std::string, std::string> renames;   ///< source field -> target field
	std::vector<std::string> drops;               ///< Fields removed from the output
	std::map<std::string, Json::Value> defaults;  ///< Fields added when absent
};

/**
 * @class field_mapping_translator
 * @brief Translator driven by rename, drop and default rules
 *
 * Fields are processed in lexicographic order so output and metadata are
 * deterministic. Fields without a rule pass through unchanged. When a
 * rename target already exists in the input, the existing field wins and
 * the renamed one is dropped with a warning. Non-object payloads pass
 * through unchanged with a warning.
 */
class field_mapping_translator : public version_translator
{
public:
	field_mapping_translator(std::string name,
							 std::string source_version,
							 std::string target_version,
							 field_mapping_rules rules);

	[[nodiscard]] kcenon::common::Result<translation_output> translate(
		const Json::Value& payload) const override;

	[[nodiscard]] std::vector<version_pair> supported_versions() const override;

	[[nodiscard]] std::string name() const override;

	[[nodiscard]] const field_mapping_rules& rules() const noexcept { return rules_; }

private:
	std::string name_;
	std::string source_version_;
	std::string target_version_;
	field_mapping_rules rules_;
};

/**
 * @class translator_registry
 * @brief Thread-safe registry of translators keyed by version pair
 *
 * Usage Example:
 * @code
 * auto registry = translator_registry::with_defaults();
 * auto result = registry->translate(payload, "v1.0", "v2.0");
 * if (result.is_err()) {
 *     // error_code::schema_translation_failed
 * }
 * @endcode
 */
class translator_registry
{
public:
	translator_registry() = default;

	translator_registry(const translator_registry&) = delete;
	translator_registry& operator=(const translator_registry&) = delete;

	/**
	 * @brief Create a registry holding the built-in v1.0 <-> v2.0 translators
	 */
	[[nodiscard]] static std::shared_ptr<translator_registry> with_defaults();

	/**
	 * @brief Build the registry key for an ordered version pair
	 */
	[[nodiscard]] static std::string make_key(const std::string& source_version,
											  const std::string& target_version);

	/**
	 * @brief Register a translator under every pair it supports
	 *
	 * A later registration for the same pair replaces the earlier one.
	 */
	void register_translator(std::shared_ptr<version_translator> translator);

	/**
	 * @brief Remove the translator for a pair
	 * @return true if a translator was removed
	 */
	bool unregister_translator(const std::string& source_version,
							   const std::string& target_version);

	[[nodiscard]] std::shared_ptr<version_translator> find(
		const std::string& source_version, const std::string& target_version) const;

	/**
	 * @brief Translate a payload between two versions
	 *
	 * Identical versions return the payload unchanged. A missing pair fails
	 * with error_code::schema_translation_failed naming both versions.
	 */
	[[nodiscard]] kcenon::common::Result<translation_output> translate(
		const Json::Value& payload,
		const std::string& source_version,
		const std::string& target_version) const;

	[[nodiscard]] bool supports(const std::string& source_version,
								const std::string& target_version) const;

	/**
	 * @brief Registered keys in sorted order
	 */
	[[nodiscard]] std::vector<std::string> keys() const;

	[[nodiscard]] size_t size() const;

private:
	mutable std::shared_mutex mutex_;
	std::unordered_map<std::string, std::shared_ptr<version_translator>> translators_;
};

} // namespace federation_gateway::translation
