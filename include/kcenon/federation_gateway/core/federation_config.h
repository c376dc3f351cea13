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
 * @file federation_config.h
 * @brief Gateway configuration structures
 *
 * Aggregates the configuration of every component. Configuration can be
 * loaded from a key = value file or constructed programmatically.
 *
 * ## Thread Safety
 * Configuration structs are plain data structures with no internal
 * synchronization. They are intended to be created and populated before
 * the gateway is constructed, then read concurrently.
 *
 * @code
 * using namespace federation_gateway;
 *
 * // Load from file
 * auto config = federation_config::load_from_file("gateway.conf");
 * if (config.has_value()) {
 *     if (!config->validate()) {
 *         for (const auto& err : config->validation_errors()) {
 *             std::cerr << "Config error: " << err << std::endl;
 *         }
 *     }
 * }
 *
 * // Or construct programmatically
 * auto cfg = federation_config::default_config();
 * cfg.rate_limit.client.requests_per_second = 50;
 * cfg.proxy.auto_register_servers = true;
 * @endcode
 *
 * Recognized keys:
 * - name
 * - logging.level, logging.enable_console
 * - rate_limit.enabled, rate_limit.exempt_paths (comma separated)
 * - rate_limit.{global,client}.{requests_per_second, requests_per_minute,
 *   requests_per_hour, concurrent_requests, window_size_seconds}
 * - proxy.{request_timeout_ms, connection_timeout_ms, idle_timeout_ms,
 *   auto_register_servers, default_address_base, default_protocol_version}
 * - proxy.retry.{max_attempts, base_delay_ms, max_delay_ms, multiplier, jitter}
 * - proxy.circuit_breaker.{enabled, degraded_threshold, failure_threshold,
 *   success_threshold, open_timeout_ms, half_open_max_calls}
 * - translation.cache.{enabled, max_entries, ttl_seconds},
 *   translation.max_history_per_key
 * - workflow.{max_parallel_steps, step_path_prefix, cost_header, protocol_version}
 */

#pragma once

#include <kcenon/federation_gateway/admission/rate_limiter.h>
#include <kcenon/federation_gateway/proxy/proxy_types.h>
#include <kcenon/federation_gateway/translation/translation_cache.h>
#include <kcenon/federation_gateway/workflow/workflow_engine.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace federation_gateway
{

/**
 * @struct logging_config
 * @brief Logging configuration
 */
struct logging_config
{
	std::string level = "info";  ///< Log level (debug, info, warn, error)
	bool enable_console = true;  ///< Attach a console logger
};

/**
 * @struct translation_config
 * @brief Schema translation service configuration
 */
struct translation_config
{
	translation::translation_cache_config cache;
	size_t max_history_per_key = 1000; ///< History records kept per version pair
};

/**
 * @struct federation_config
 * @brief Main gateway configuration
 */
struct federation_config
{
	std::string name = "federation_gateway";      ///< Gateway instance name
	logging_config logging;                       ///< Logging configuration
	admission::rate_limiter_config rate_limit;    ///< Admission limits
	proxy::proxy_config proxy;                    ///< Pool, retry and circuit breaker
	translation_config translation;               ///< Schema translation service
	workflow::workflow_engine_config workflow;    ///< Workflow engine limits

	/**
	 * @brief Load configuration from a key = value file
	 * @param path Path to the configuration file
	 * @return Loaded configuration, or std::nullopt if the file cannot be
	 *         read or a value does not parse
	 */
	static std::optional<federation_config> load_from_file(const std::string& path);

	/**
	 * @brief Create a default configuration
	 */
	static federation_config default_config();

	/**
	 * @brief Validate the configuration
	 * @return true if configuration is valid
	 */
	bool validate() const;

	/**
	 * @brief Get validation error messages
	 */
	std::vector<std::string> validation_errors() const;
};

} // namespace federation_gateway
