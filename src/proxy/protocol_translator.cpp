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

#include <kcenon/federation_gateway/proxy/protocol_translator.h>

#include <algorithm>

namespace federation_gateway::proxy
{

protocol_translator::protocol_translator(
	std::shared_ptr<translation::translator_registry> registry)
	: registry_(registry ? std::move(registry) : translation::translator_registry::with_defaults())
{
}

const std::vector<std::string>& protocol_translator::supported_versions()
{
	static const std::vector<std::string> versions{ "1.0", "2.0" };
	return versions;
}

bool protocol_translator::is_supported(const std::string& version)
{
	const auto& versions = supported_versions();
	return std::find(versions.begin(), versions.end(), version) != versions.end();
}

std::string protocol_translator::registry_version(const std::string& version)
{
	if (!version.empty() && version.front() == 'v')
	{
		return version;
	}
	return "v" + version;
}

kcenon::common::Result<Json::Value> protocol_translator::translate(
	const Json::Value& body,
	const std::string& from_version,
	const std::string& to_version) const
{
	if (from_version == to_version)
	{
		return body;
	}

	auto result = registry_->translate(body, registry_version(from_version),
									   registry_version(to_version));
	if (result.is_err())
	{
		return result.error();
	}

	return result.value().payload;
}

} // namespace federation_gateway::proxy
