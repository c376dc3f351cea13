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

#include <kcenon/federation_gateway/core/federation_config.h>

#include <kcenon/federation_gateway/logging/console_logger.h>
#include <kcenon/federation_gateway/proxy/protocol_translator.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace federation_gateway
{

namespace
{

void trim(std::string& s)
{
	s.erase(0, s.find_first_not_of(" \t\r\n"));
	s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

bool parse_bool(const std::string& value)
{
	if (value == "true" || value == "1")
	{
		return true;
	}
	if (value == "false" || value == "0")
	{
		return false;
	}
	throw std::invalid_argument("not a boolean: " + value);
}

uint32_t parse_u32(const std::string& value)
{
	if (!value.empty() && value[0] == '-')
	{
		throw std::invalid_argument("negative value: " + value);
	}
	return static_cast<uint32_t>(std::stoul(value));
}

std::vector<std::string> parse_list(const std::string& value)
{
	std::vector<std::string> items;
	std::stringstream stream(value);
	std::string item;
	while (std::getline(stream, item, ','))
	{
		trim(item);
		if (!item.empty())
		{
			items.push_back(item);
		}
	}
	return items;
}

// Returns false for keys that are not part of a rate limit section.
bool apply_rate_limit_key(admission::rate_limit_config& limits,
						  const std::string& key,
						  const std::string& value)
{
	if (key == "requests_per_second")
	{
		limits.requests_per_second = parse_u32(value);
	}
	else if (key == "requests_per_minute")
	{
		limits.requests_per_minute = parse_u32(value);
	}
	else if (key == "requests_per_hour")
	{
		limits.requests_per_hour = parse_u32(value);
	}
	else if (key == "concurrent_requests")
	{
		limits.concurrent_requests = parse_u32(value);
	}
	else if (key == "window_size_seconds")
	{
		limits.window_size = std::chrono::seconds(parse_u32(value));
	}
	else
	{
		return false;
	}
	return true;
}

void apply_key(federation_config& config, const std::string& key, const std::string& value)
{
	static const std::string global_prefix = "rate_limit.global.";
	static const std::string client_prefix = "rate_limit.client.";

	if (key == "name")
	{
		config.name = value;
	}
	else if (key == "logging.level")
	{
		config.logging.level = value;
	}
	else if (key == "logging.enable_console")
	{
		config.logging.enable_console = parse_bool(value);
	}
	else if (key == "rate_limit.enabled")
	{
		config.rate_limit.enabled = parse_bool(value);
	}
	else if (key == "rate_limit.exempt_paths")
	{
		config.rate_limit.exempt_paths = parse_list(value);
	}
	else if (key.compare(0, global_prefix.size(), global_prefix) == 0)
	{
		apply_rate_limit_key(config.rate_limit.global, key.substr(global_prefix.size()), value);
	}
	else if (key.compare(0, client_prefix.size(), client_prefix) == 0)
	{
		apply_rate_limit_key(config.rate_limit.client, key.substr(client_prefix.size()), value);
	}
	else if (key == "proxy.request_timeout_ms")
	{
		config.proxy.request_timeout = std::chrono::milliseconds(parse_u32(value));
	}
	else if (key == "proxy.connection_timeout_ms")
	{
		config.proxy.connection_timeout = std::chrono::milliseconds(parse_u32(value));
	}
	else if (key == "proxy.idle_timeout_ms")
	{
		config.proxy.idle_timeout = std::chrono::milliseconds(parse_u32(value));
	}
	else if (key == "proxy.auto_register_servers")
	{
		config.proxy.auto_register_servers = parse_bool(value);
	}
	else if (key == "proxy.default_address_base")
	{
		config.proxy.default_address_base = value;
	}
	else if (key == "proxy.default_protocol_version")
	{
		config.proxy.default_protocol_version = value;
	}
	else if (key == "proxy.retry.max_attempts")
	{
		config.proxy.retry.max_attempts = parse_u32(value);
	}
	else if (key == "proxy.retry.base_delay_ms")
	{
		config.proxy.retry.base_delay = std::chrono::milliseconds(parse_u32(value));
	}
	else if (key == "proxy.retry.max_delay_ms")
	{
		config.proxy.retry.max_delay = std::chrono::milliseconds(parse_u32(value));
	}
	else if (key == "proxy.retry.multiplier")
	{
		config.proxy.retry.multiplier = std::stod(value);
	}
	else if (key == "proxy.retry.jitter")
	{
		config.proxy.retry.jitter = parse_bool(value);
	}
	else if (key == "proxy.circuit_breaker.enabled")
	{
		config.proxy.circuit_breaker.enabled = parse_bool(value);
	}
	else if (key == "proxy.circuit_breaker.degraded_threshold")
	{
		config.proxy.circuit_breaker.degraded_threshold = parse_u32(value);
	}
	else if (key == "proxy.circuit_breaker.failure_threshold")
	{
		config.proxy.circuit_breaker.failure_threshold = parse_u32(value);
	}
	else if (key == "proxy.circuit_breaker.success_threshold")
	{
		config.proxy.circuit_breaker.success_threshold = parse_u32(value);
	}
	else if (key == "proxy.circuit_breaker.open_timeout_ms")
	{
		config.proxy.circuit_breaker.open_timeout = std::chrono::milliseconds(parse_u32(value));
	}
	else if (key == "proxy.circuit_breaker.half_open_max_calls")
	{
		config.proxy.circuit_breaker.half_open_max_calls = parse_u32(value);
	}
	else if (key == "translation.cache.enabled")
	{
		config.translation.cache.enabled = parse_bool(value);
	}
	else if (key == "translation.cache.max_entries")
	{
		config.translation.cache.max_entries = parse_u32(value);
	}
	else if (key == "translation.cache.ttl_seconds")
	{
		config.translation.cache.ttl = std::chrono::seconds(parse_u32(value));
	}
	else if (key == "translation.max_history_per_key")
	{
		config.translation.max_history_per_key = parse_u32(value);
	}
	else if (key == "workflow.max_parallel_steps")
	{
		config.workflow.max_parallel_steps = parse_u32(value);
	}
	else if (key == "workflow.step_path_prefix")
	{
		config.workflow.step_path_prefix = value;
	}
	else if (key == "workflow.cost_header")
	{
		config.workflow.cost_header = value;
	}
	else if (key == "workflow.protocol_version")
	{
		config.workflow.protocol_version = value;
	}
}

void check_limits(const admission::rate_limit_config& limits,
				  const std::string& section,
				  std::vector<std::string>& errors)
{
	if (limits.window_size.count() <= 0)
	{
		errors.push_back(section + ".window_size_seconds must be greater than 0");
	}
	if (limits.requests_per_second > 0 && limits.requests_per_minute > 0
		&& limits.requests_per_second > limits.requests_per_minute)
	{
		errors.push_back(section + ".requests_per_second cannot exceed requests_per_minute");
	}
	if (limits.requests_per_minute > 0 && limits.requests_per_hour > 0
		&& limits.requests_per_minute > limits.requests_per_hour)
	{
		errors.push_back(section + ".requests_per_minute cannot exceed requests_per_hour");
	}
}

} // namespace

std::optional<federation_config> federation_config::load_from_file(const std::string& path)
{
	if (!std::filesystem::exists(path))
	{
		// Error will be logged by caller with appropriate context
		return std::nullopt;
	}

	std::ifstream file(path);
	if (!file.is_open())
	{
		return std::nullopt;
	}

	federation_config config = default_config();

	std::string line;
	while (std::getline(file, line))
	{
		trim(line);

		// Skip comments and empty lines
		if (line.empty() || line[0] == '#')
		{
			continue;
		}

		auto delimiter_pos = line.find('=');
		if (delimiter_pos == std::string::npos)
		{
			continue;
		}

		std::string key = line.substr(0, delimiter_pos);
		std::string value = line.substr(delimiter_pos + 1);
		trim(key);
		trim(value);

		try
		{
			apply_key(config, key, value);
		}
		catch (const std::exception&)
		{
			// Unparseable value; the caller reports the file as invalid
			return std::nullopt;
		}
	}

	return config;
}

federation_config federation_config::default_config()
{
	federation_config config;
	// All defaults are set in the struct definitions
	return config;
}

bool federation_config::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> federation_config::validation_errors() const
{
	std::vector<std::string> errors;

	if (name.empty())
	{
		errors.push_back("Gateway name cannot be empty");
	}

	// Rate limits
	check_limits(rate_limit.global, "rate_limit.global", errors);
	check_limits(rate_limit.client, "rate_limit.client", errors);

	// Proxy
	if (proxy.request_timeout.count() <= 0)
	{
		errors.push_back("proxy.request_timeout_ms must be greater than 0");
	}
	if (!proxy::protocol_translator::is_supported(proxy.default_protocol_version))
	{
		errors.push_back("Unsupported proxy.default_protocol_version: "
						 + proxy.default_protocol_version);
	}
	if (proxy.auto_register_servers && proxy.default_address_base.empty())
	{
		errors.push_back("proxy.default_address_base is required when auto_register_servers is on");
	}
	if (proxy.retry.max_attempts == 0)
	{
		errors.push_back("proxy.retry.max_attempts must be at least 1");
	}
	if (proxy.retry.multiplier < 1.0)
	{
		errors.push_back("proxy.retry.multiplier must be at least 1.0");
	}
	if (proxy.retry.base_delay > proxy.retry.max_delay)
	{
		errors.push_back("proxy.retry.base_delay_ms cannot exceed max_delay_ms");
	}

	const auto& breaker = proxy.circuit_breaker;
	if (breaker.enabled)
	{
		if (breaker.failure_threshold == 0)
		{
			errors.push_back("proxy.circuit_breaker.failure_threshold must be greater than 0");
		}
		if (breaker.degraded_threshold > breaker.failure_threshold)
		{
			errors.push_back(
				"proxy.circuit_breaker.degraded_threshold cannot exceed failure_threshold");
		}
		if (breaker.success_threshold == 0)
		{
			errors.push_back("proxy.circuit_breaker.success_threshold must be greater than 0");
		}
		if (breaker.half_open_max_calls == 0)
		{
			errors.push_back("proxy.circuit_breaker.half_open_max_calls must be greater than 0");
		}
	}

	// Translation
	if (translation.cache.enabled && translation.cache.max_entries == 0)
	{
		errors.push_back("translation.cache.max_entries must be greater than 0");
	}
	if (translation.max_history_per_key == 0)
	{
		errors.push_back("translation.max_history_per_key must be greater than 0");
	}

	// Workflow
	if (workflow.max_parallel_steps == 0)
	{
		errors.push_back("workflow.max_parallel_steps must be greater than 0");
	}
	if (!proxy::protocol_translator::is_supported(workflow.protocol_version))
	{
		errors.push_back("Unsupported workflow.protocol_version: " + workflow.protocol_version);
	}

	// Logging
	if (!logging::parse_log_level(logging.level))
	{
		errors.push_back("Invalid log level: " + logging.level
						 + " (valid: debug, info, warn, error)");
	}

	return errors;
}

} // namespace federation_gateway
