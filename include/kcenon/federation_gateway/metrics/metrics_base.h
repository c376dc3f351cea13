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
 * @file metrics_base.h
 * @brief Common utilities for metrics and health summaries
 *
 * Provides the helpers every component uses when it exposes health()
 * and metrics():
 * - Running averages and rate calculations with divide-by-zero protection
 * - Health classification from a success rate
 *
 * ## Thread Safety
 * All functions are stateless and operate on values passed by the caller;
 * they are safe for concurrent calls.
 *
 * @code
 * using namespace federation_gateway::metrics;
 *
 * double rate = metrics_utils::calculate_rate(successes, total);
 * auto state = classify_health(rate, total);
 * @endcode
 */

#pragma once

#include <cstdint>

namespace federation_gateway::metrics
{

/**
 * @struct metrics_utils
 * @brief Static utility functions for metrics calculations
 */
struct metrics_utils
{
	/**
	 * @brief Fold a new sample into a running average
	 * @param average Current average over count - 1 samples
	 * @param sample New sample
	 * @param count Number of samples including the new one
	 * @return Updated average
	 */
	[[nodiscard]] static double running_average(double average, double sample,
												uint64_t count) noexcept
	{
		if (count == 0)
		{
			return 0.0;
		}
		return (average * static_cast<double>(count - 1) + sample) / static_cast<double>(count);
	}

	/**
	 * @brief Calculate average of accumulated microseconds in milliseconds
	 * @return Average in milliseconds, or 0.0 if count is zero
	 */
	[[nodiscard]] static double average_us_to_ms(uint64_t total_us, uint64_t count) noexcept
	{
		if (count == 0)
		{
			return 0.0;
		}
		return static_cast<double>(total_us) / static_cast<double>(count) / 1000.0;
	}

	/**
	 * @brief Calculate percentage rate
	 * @param numerator The count of successful/target items
	 * @param denominator The total count
	 * @param default_value Value to return when denominator is zero (default: 100.0)
	 * @return Rate as percentage (0.0 - 100.0)
	 */
	[[nodiscard]] static double calculate_rate(uint64_t numerator, uint64_t denominator,
											   double default_value = 100.0) noexcept
	{
		if (denominator == 0)
		{
			return default_value;
		}
		return static_cast<double>(numerator) / static_cast<double>(denominator) * 100.0;
	}

};

/**
 * @enum health_state
 * @brief Coarse component health reported by health()
 */
enum class health_state : uint8_t
{
	healthy = 1,
	degraded = 2,
	unhealthy = 3
};

constexpr const char* to_string(health_state state) noexcept
{
	switch (state)
	{
	case health_state::healthy:
		return "healthy";
	case health_state::degraded:
		return "degraded";
	case health_state::unhealthy:
		return "unhealthy";
	default:
		return "unknown";
	}
}

/**
 * @brief Classify health from a success rate percentage
 *
 * Fewer than min_samples observations always count as healthy.
 * Below 50% is unhealthy, below 90% degraded.
 */
[[nodiscard]] constexpr health_state classify_health(double success_rate,
													 uint64_t samples,
													 uint64_t min_samples = 10) noexcept
{
	if (samples < min_samples)
	{
		return health_state::healthy;
	}
	if (success_rate < 50.0)
	{
		return health_state::unhealthy;
	}
	if (success_rate < 90.0)
	{
		return health_state::degraded;
	}
	return health_state::healthy;
}

} // namespace federation_gateway::metrics
