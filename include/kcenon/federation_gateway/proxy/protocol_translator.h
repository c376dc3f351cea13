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
 * @file protocol_translator.h
 * @brief Inline body translation between provider protocol versions
 *
 * Protocol versions are written "1.0" and "2.0" on connections and
 * requests. The shared translator_registry keys its pairs as "v1.0" and
 * "v2.0"; this class bridges the two spellings.
 */

#pragma once

#include <kcenon/federation_gateway/translation/translator_registry.h>

#include <kcenon/common/patterns/result.h>

#include <json/json.h>

#include <memory>
#include <string>
#include <vector>

namespace federation_gateway::proxy
{

class protocol_translator
{
public:
	explicit protocol_translator(std::shared_ptr<translation::translator_registry> registry);

	/**
	 * @brief Protocol versions servers can be registered with
	 */
	[[nodiscard]] static const std::vector<std::string>& supported_versions();

	[[nodiscard]] static bool is_supported(const std::string& version);

	/**
	 * @brief Registry spelling of a protocol version ("1.0" -> "v1.0")
	 */
	[[nodiscard]] static std::string registry_version(const std::string& version);

	/**
	 * @brief Translate a body between two protocol versions
	 *
	 * Identical versions return the body unchanged. Any other pair is looked
	 * up in the registry; a missing translator fails with
	 * schema_translation_failed naming both versions.
	 */
	[[nodiscard]] kcenon::common::Result<Json::Value> translate(
		const Json::Value& body,
		const std::string& from_version,
		const std::string& to_version) const;

	[[nodiscard]] const std::shared_ptr<translation::translator_registry>& registry() const noexcept
	{
		return registry_;
	}

private:
	std::shared_ptr<translation::translator_registry> registry_;
};

} // namespace federation_gateway::proxy
