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
 * @file console_logger.h
 * @brief Console logger implementation for federation_gateway
 *
 * Provides an ILogger implementation that writes to stdout/stderr, plus
 * the helpers components use to log through an optional logger.
 *
 * Features:
 * - Implements kcenon::common::interfaces::ILogger
 * - Thread-safe console output
 * - Configurable log levels, parsed from configuration strings
 * - Timestamps, level and component prefixes
 */

#pragma once

#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace federation_gateway::logging
{

/**
 * @class console_logger
 * @brief Console logger implementing the ILogger interface
 *
 * Messages at warning and above go to stderr, everything else to stdout.
 * Each line carries a timestamp, the level and, when set, the component
 * name the logger was created for.
 *
 * Thread Safety:
 * - All logging methods are thread-safe
 * - Level changes are atomic
 *
 * Usage:
 * @code
 *   auto logger = federation_gateway::logging::create_console_logger(
 *       kcenon::common::interfaces::log_level::debug, "proxy");
 *   logging::emit(logger, kcenon::common::interfaces::log_level::info,
 *                 std::string("Provider registered"));
 * @endcode
 */
class console_logger : public kcenon::common::interfaces::ILogger
{
public:
	/**
	 * @brief Construct a console logger
	 * @param min_level Minimum log level to output (default: info)
	 * @param component Component name printed with every line (may be empty)
	 */
	explicit console_logger(
		kcenon::common::interfaces::log_level min_level
		= kcenon::common::interfaces::log_level::info,
		std::string component = "");

	~console_logger() override = default;

	console_logger(const console_logger&) = delete;
	console_logger& operator=(const console_logger&) = delete;

	kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
								   const std::string& message) override;

	kcenon::common::VoidResult log(
		kcenon::common::interfaces::log_level level,
		std::string_view message,
		const kcenon::common::source_location& loc
		= kcenon::common::source_location::current()) override;

	kcenon::common::VoidResult log(
		const kcenon::common::interfaces::log_entry& entry) override;

	bool is_enabled(kcenon::common::interfaces::log_level level) const override;

	kcenon::common::VoidResult set_level(
		kcenon::common::interfaces::log_level level) override;

	kcenon::common::interfaces::log_level get_level() const override;

	kcenon::common::VoidResult flush() override;

	[[nodiscard]] const std::string& component() const noexcept { return component_; }

private:
	void write_message(kcenon::common::interfaces::log_level level,
					   const std::string& message,
					   const std::string& file = "",
					   int line = 0);

	std::string get_timestamp() const;

	std::atomic<kcenon::common::interfaces::log_level> min_level_;
	std::string component_;
	mutable std::mutex output_mutex_;
};

/**
 * @brief Factory function to create a console logger
 * @param min_level Minimum log level (default: info)
 * @param component Component name prefix
 * @return Shared pointer to ILogger
 */
std::shared_ptr<kcenon::common::interfaces::ILogger> create_console_logger(
	kcenon::common::interfaces::log_level min_level
	= kcenon::common::interfaces::log_level::info,
	const std::string& component = "");

/**
 * @brief Parse a configuration level name
 * @param name One of "trace", "debug", "info", "warn", "warning", "error", "critical"
 * @return Matching level, or std::nullopt for unknown names
 */
[[nodiscard]] std::optional<kcenon::common::interfaces::log_level> parse_log_level(
	const std::string& name);

/**
 * @brief Log through an optional logger
 *
 * Does nothing when logger is null or the level is disabled. Logging
 * failures are ignored; they never affect the calling operation.
 */
void emit(const std::shared_ptr<kcenon::common::interfaces::ILogger>& logger,
		  kcenon::common::interfaces::log_level level,
		  const std::string& message);

} // namespace federation_gateway::logging
