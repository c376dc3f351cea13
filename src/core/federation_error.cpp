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

#include <kcenon/federation_gateway/core/federation_error.h>

namespace federation_gateway
{

error_code error_kind_of(const kcenon::common::error_info& error) noexcept
{
	switch (static_cast<error_code>(error.code))
	{
	case error_code::validation_error:
	case error_code::external_service_error:
	case error_code::external_service_timeout:
	case error_code::schema_translation_failed:
	case error_code::workflow_execution_failed:
	case error_code::internal_error:
	case error_code::not_found:
	case error_code::conflict:
	case error_code::rate_limited:
	case error_code::circuit_open:
	case error_code::storage_error:
		return static_cast<error_code>(error.code);
	default:
		return error_code::internal_error;
	}
}

bool is_retryable(const kcenon::common::error_info& error) noexcept
{
	auto kind = error_kind_of(error);
	return kind == error_code::external_service_error
		   || kind == error_code::external_service_timeout;
}

uint16_t to_http_status(error_code code) noexcept
{
	switch (code)
	{
	case error_code::validation_error:
		return 400;
	case error_code::external_service_error:
		return 502;
	case error_code::external_service_timeout:
		return 504;
	case error_code::schema_translation_failed:
		return 422;
	case error_code::not_found:
		return 404;
	case error_code::conflict:
		return 409;
	case error_code::rate_limited:
		return 429;
	case error_code::circuit_open:
		return 503;
	case error_code::workflow_execution_failed:
	case error_code::internal_error:
	case error_code::storage_error:
	default:
		return 500;
	}
}

kcenon::common::error_info make_error(error_code code,
									  const std::string& message,
									  const std::string& module)
{
	return kcenon::common::error_info{ static_cast<int>(code), message, module };
}

kcenon::common::error_info make_validation_error(const std::string& module,
												 const std::string& field,
												 const std::string& message)
{
	return make_error(error_code::validation_error,
					  "Validation failed for '" + field + "': " + message, module);
}

kcenon::common::error_info make_external_service_error(const std::string& module,
													   const std::string& service,
													   const std::string& message)
{
	return make_error(error_code::external_service_error,
					  "External service '" + service + "' failed: " + message, module);
}

kcenon::common::error_info make_timeout_error(const std::string& module,
											  const std::string& service,
											  uint32_t timeout_ms)
{
	return make_error(error_code::external_service_timeout,
					  "External service '" + service + "' timed out after "
						  + std::to_string(timeout_ms) + "ms",
					  module);
}

kcenon::common::error_info make_translation_error(const std::string& module,
												  const std::string& source_version,
												  const std::string& target_version)
{
	return make_error(error_code::schema_translation_failed,
					  "No translator available for " + source_version + " -> " + target_version,
					  module);
}

} // namespace federation_gateway
