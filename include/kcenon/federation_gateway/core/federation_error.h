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
 * @file federation_error.h
 * @brief Error taxonomy shared by all federation gateway components
 *
 * Every fallible operation returns kcenon::common::Result<T> (or VoidResult)
 * carrying an error_info whose code is one of the values of error_code.
 * The helpers below build error_info values with consistent messages so
 * callers can tell validation, transport, translation and orchestration
 * failures apart without string matching.
 *
 * @code
 * using namespace federation_gateway;
 *
 * auto result = engine.create_workflow(definition);
 * if (result.is_err() && error_kind_of(result.error()) == error_code::validation_error) {
 *     // message names the offending field
 * }
 * @endcode
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <cstdint>
#include <string>

namespace federation_gateway
{

/**
 * @enum error_code
 * @brief Error codes carried in error_info::code
 *
 * Codes are negative to stay clear of the positive codes used by
 * common_system and thread_system.
 */
enum class error_code : int
{
	validation_error = -1001,          ///< Bad input, message names the field
	external_service_error = -1002,    ///< Provider or transport failure
	external_service_timeout = -1003,  ///< Provider call exceeded its deadline
	schema_translation_failed = -1004, ///< No translator for a version pair
	workflow_execution_failed = -1005, ///< Orchestration failure
	internal_error = -1006,            ///< Unexpected failure
	not_found = -1007,                 ///< Unknown id
	conflict = -1008,                  ///< Invalid state transition
	rate_limited = -1009,              ///< Admission rejected
	circuit_open = -1010,              ///< Provider connection is broken
	storage_error = -1011              ///< Repository failure
};

/**
 * @brief Convert error_code to string
 */
constexpr const char* to_string(error_code code) noexcept
{
	switch (code)
	{
	case error_code::validation_error:
		return "validation_error";
	case error_code::external_service_error:
		return "external_service_error";
	case error_code::external_service_timeout:
		return "external_service_timeout";
	case error_code::schema_translation_failed:
		return "schema_translation_failed";
	case error_code::workflow_execution_failed:
		return "workflow_execution_failed";
	case error_code::internal_error:
		return "internal_error";
	case error_code::not_found:
		return "not_found";
	case error_code::conflict:
		return "conflict";
	case error_code::rate_limited:
		return "rate_limited";
	case error_code::circuit_open:
		return "circuit_open";
	case error_code::storage_error:
		return "storage_error";
	default:
		return "unknown";
	}
}

/**
 * @brief Map a raw error_info code back to error_code
 * @return The matching code, or error_code::internal_error for foreign codes
 */
[[nodiscard]] error_code error_kind_of(const kcenon::common::error_info& error) noexcept;

/**
 * @brief Check whether an error may succeed when retried
 *
 * Only transport failures and timeouts are retryable. Validation,
 * translation and state errors are deterministic.
 */
[[nodiscard]] bool is_retryable(const kcenon::common::error_info& error) noexcept;

/**
 * @brief HTTP status an embedding route layer should answer with
 */
[[nodiscard]] uint16_t to_http_status(error_code code) noexcept;

[[nodiscard]] kcenon::common::error_info make_error(error_code code,
													const std::string& message,
													const std::string& module);

[[nodiscard]] kcenon::common::error_info make_validation_error(const std::string& module,
															   const std::string& field,
															   const std::string& message);

[[nodiscard]] kcenon::common::error_info make_external_service_error(
	const std::string& module, const std::string& service, const std::string& message);

[[nodiscard]] kcenon::common::error_info make_timeout_error(const std::string& module,
															const std::string& service,
															uint32_t timeout_ms);

[[nodiscard]] kcenon::common::error_info make_translation_error(const std::string& module,
																const std::string& source_version,
																const std::string& target_version);

} // namespace federation_gateway
