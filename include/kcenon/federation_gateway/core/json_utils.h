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
 * @file json_utils.h
 * @brief JSON text and timestamp helpers shared by the codecs
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <json/json.h>

#include <chrono>
#include <optional>
#include <string>

namespace federation_gateway
{

/**
 * @brief Parse JSON text
 * @return The value, or validation_error naming the parse failure
 */
[[nodiscard]] kcenon::common::Result<Json::Value> parse_json(const std::string& text);

/**
 * @brief Serialize JSON; compact output has no whitespace and sorted keys
 */
[[nodiscard]] std::string write_json(const Json::Value& value, bool pretty = false);

/**
 * @brief Format as RFC 3339 UTC with millisecond precision ("2025-01-31T12:00:00.123Z")
 */
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Parse an RFC 3339 UTC timestamp written by format_timestamp()
 *
 * Fractional seconds are optional; only the "Z" designator is accepted.
 */
[[nodiscard]] std::optional<std::chrono::system_clock::time_point> parse_timestamp(
	const std::string& text);

} // namespace federation_gateway
