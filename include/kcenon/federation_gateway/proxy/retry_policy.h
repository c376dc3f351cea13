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
 * @file retry_policy.h
 * @brief Exponential backoff helpers shared by the proxy and workflow steps
 */

#pragma once

#include "proxy_types.h"

#include <chrono>
#include <cstdint>
#include <functional>

namespace federation_gateway::proxy
{

/**
 * @class retry_policy
 * @brief Backoff schedule derived from a retry_config
 *
 * Usage Example:
 * @code
 * retry_policy policy(config.retry);
 * for (uint32_t attempt = 0; attempt < policy.max_attempts(); ++attempt) {
 *     auto result = call();
 *     if (result.is_ok() || !policy.should_retry(result.error(), attempt)) {
 *         break;
 *     }
 *     policy.wait(attempt);
 * }
 * @endcode
 */
class retry_policy
{
public:
	explicit retry_policy(const retry_config& config = retry_config{});

	/**
	 * @brief Delay before the retry that follows failed attempt `attempt`
	 *
	 * base_delay * multiplier^attempt, capped at max_delay, jittered when
	 * enabled.
	 */
	[[nodiscard]] std::chrono::milliseconds next_delay(uint32_t attempt) const;

	/**
	 * @brief Whether another attempt should follow failed attempt `attempt`
	 */
	[[nodiscard]] bool should_retry(const kcenon::common::error_info& error,
									uint32_t attempt) const noexcept;

	/**
	 * @brief Sleep for next_delay(attempt)
	 *
	 * The sleep is split into 100ms slices. When `interrupted` returns true
	 * between slices the wait ends early.
	 *
	 * @return false if the wait was interrupted
	 */
	bool wait(uint32_t attempt, const std::function<bool()>& interrupted = {}) const;

	[[nodiscard]] uint32_t max_attempts() const noexcept;

	[[nodiscard]] const retry_config& config() const noexcept { return config_; }

private:
	retry_config config_;
};

} // namespace federation_gateway::proxy
