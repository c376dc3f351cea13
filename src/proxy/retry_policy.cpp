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

#include <kcenon/federation_gateway/proxy/retry_policy.h>

#include <kcenon/federation_gateway/core/federation_error.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

namespace federation_gateway::proxy
{

namespace
{

constexpr std::chrono::milliseconds WAIT_SLICE{ 100 };

double jitter_factor()
{
	thread_local std::mt19937 generator{ std::random_device{}() };
	std::uniform_real_distribution<double> distribution(0.5, 1.0);
	return distribution(generator);
}

} // namespace

retry_policy::retry_policy(const retry_config& config) : config_(config)
{
}

std::chrono::milliseconds retry_policy::next_delay(uint32_t attempt) const
{
	auto delay = static_cast<double>(config_.base_delay.count())
				 * std::pow(config_.multiplier, static_cast<double>(attempt));
	delay = std::min(delay, static_cast<double>(config_.max_delay.count()));

	if (config_.jitter)
	{
		delay *= jitter_factor();
	}

	return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

bool retry_policy::should_retry(const kcenon::common::error_info& error,
								uint32_t attempt) const noexcept
{
	return attempt + 1 < max_attempts() && is_retryable(error);
}

bool retry_policy::wait(uint32_t attempt, const std::function<bool()>& interrupted) const
{
	auto remaining = next_delay(attempt);

	while (remaining.count() > 0)
	{
		if (interrupted && interrupted())
		{
			return false;
		}

		auto slice = std::min(remaining, WAIT_SLICE);
		std::this_thread::sleep_for(slice);
		remaining -= slice;
	}

	return !(interrupted && interrupted());
}

uint32_t retry_policy::max_attempts() const noexcept
{
	return std::max<uint32_t>(config_.max_attempts, 1);
}

} // namespace federation_gateway::proxy
