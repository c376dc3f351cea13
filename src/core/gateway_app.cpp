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

#include <kcenon/federation_gateway/gateway_app.h>

#include <kcenon/federation_gateway/core/federation_error.h>
#include <kcenon/federation_gateway/logging/console_logger.h>
#include <kcenon/federation_gateway/metrics/metrics_base.h>
#include <kcenon/federation_gateway/proxy/protocol_translator.h>
#include <kcenon/federation_gateway/storage/memory_repositories.h>

#include <algorithm>

namespace federation_gateway
{

namespace
{

constexpr const char* MODULE = "gateway_app";

using kcenon::common::interfaces::log_level;

int severity(const Json::Value& health)
{
	auto status = health["status"].asString();
	if (status == metrics::to_string(metrics::health_state::unhealthy))
	{
		return static_cast<int>(metrics::health_state::unhealthy);
	}
	if (status == metrics::to_string(metrics::health_state::degraded))
	{
		return static_cast<int>(metrics::health_state::degraded);
	}
	return static_cast<int>(metrics::health_state::healthy);
}

kcenon::common::error_info rejection_error(const std::string& client_id,
										   const admission::admission_result& result)
{
	std::string message = "Rate limit exceeded for client '" + client_id + "'";
	if (result.violation)
	{
		message += ": " + std::string(admission::to_string(*result.violation)) + " ("
				   + admission::to_string(result.scope) + ") "
				   + std::to_string(result.current_usage) + "/" + std::to_string(result.limit);
	}
	message += ", retry after " + std::to_string(result.retry_after_ms) + " ms";
	return make_error(error_code::rate_limited, message, MODULE);
}

} // namespace

gateway_app::gateway_app(const federation_config& config,
						 std::shared_ptr<proxy::provider_transport> transport,
						 std::shared_ptr<storage::workflow_repository> workflows,
						 std::shared_ptr<storage::translation_repository> translations)
	: config_(config)
{
	if (!workflows)
	{
		workflows = std::make_shared<storage::memory_workflow_repository>();
	}
	if (!translations)
	{
		translations = std::make_shared<storage::memory_translation_repository>(
			config_.translation.max_history_per_key);
	}

	limiter_ = std::make_shared<admission::rate_limiter>(config_.rate_limit);

	// One registry serves both inline proxy translation and the service
	registry_ = translation::translator_registry::with_defaults();

	pool_ = std::make_shared<proxy::connection_pool>(config_.proxy);
	proxy_ = std::make_shared<proxy::mcp_proxy>(
		pool_, std::make_shared<proxy::protocol_translator>(registry_), std::move(transport));

	translation_engine_ = std::make_shared<translation::schema_translation_engine>(
		registry_, std::move(translations), config_.translation.cache);

	workflow_engine_
		= std::make_shared<workflow::workflow_engine>(proxy_, std::move(workflows), config_.workflow);

	setup_logging();
}

kcenon::common::Result<std::shared_ptr<gateway_app>> gateway_app::create(
	const federation_config& config,
	std::shared_ptr<proxy::provider_transport> transport,
	std::shared_ptr<storage::workflow_repository> workflows,
	std::shared_ptr<storage::translation_repository> translations)
{
	if (!transport)
	{
		return make_validation_error(MODULE, "transport", "must not be null");
	}

	auto errors = config.validation_errors();
	if (!errors.empty())
	{
		std::string message;
		for (const auto& error : errors)
		{
			message += (message.empty() ? "" : "; ") + error;
		}
		return make_validation_error(MODULE, "config", message);
	}

	return std::make_shared<gateway_app>(config, std::move(transport), std::move(workflows),
										 std::move(translations));
}

void gateway_app::setup_logging()
{
	if (!config_.logging.enable_console)
	{
		return;
	}

	auto level = logging::parse_log_level(config_.logging.level).value_or(log_level::info);

	limiter_->set_logger(logging::create_console_logger(level, "rate_limiter"));
	pool_->set_logger(logging::create_console_logger(level, "connection_pool"));
	proxy_->set_logger(logging::create_console_logger(level, "proxy"));
	translation_engine_->set_logger(logging::create_console_logger(level, "schema_translation"));
	workflow_engine_->set_logger(logging::create_console_logger(level, "workflow_engine"));

	logging::emit(logging::create_console_logger(level, "gateway"), log_level::info,
				  "Gateway '" + config_.name + "' initialized");
}

// ============================================================================
// Admission
// ============================================================================

template <typename T, typename Operation>
kcenon::common::Result<T> gateway_app::admitted(const request_context& context,
												Operation&& operation)
{
	if (limiter_->is_exempt(context.path))
	{
		return operation();
	}

	auto admission = limiter_->check_and_admit(context.client_id);
	if (!admission.admitted)
	{
		return rejection_error(context.client_id, admission);
	}

	admission::admission_ticket ticket(*limiter_, context.client_id);
	return operation();
}

// ============================================================================
// Entry points
// ============================================================================

kcenon::common::Result<proxy::proxy_response> gateway_app::proxy_request(
	const request_context& context,
	const std::string& server_id,
	const proxy::proxy_request& request)
{
	return admitted<proxy::proxy_response>(
		context, [&]() { return proxy_->proxy_request(server_id, request); });
}

kcenon::common::Result<proxy::proxy_response> gateway_app::route(
	const request_context& context, const proxy::proxy_request& request)
{
	return admitted<proxy::proxy_response>(context,
										   [&]() { return proxy_->route_request(request); });
}

kcenon::common::Result<translation::schema_translation_response> gateway_app::translate_schema(
	const request_context& context, const translation::schema_translation_request& request)
{
	return admitted<translation::schema_translation_response>(
		context, [&]() { return translation_engine_->translate_schema(request); });
}

kcenon::common::Result<workflow::federated_workflow> gateway_app::create_workflow(
	const request_context& context, workflow::federated_workflow definition)
{
	if (definition.client_id.empty())
	{
		definition.client_id = context.client_id;
	}

	return admitted<workflow::federated_workflow>(
		context, [&]() { return workflow_engine_->create_workflow(std::move(definition)); });
}

kcenon::common::Result<workflow::workflow_execution> gateway_app::execute_workflow(
	const request_context& context, const std::string& workflow_id)
{
	return admitted<workflow::workflow_execution>(
		context, [&]() { return workflow_engine_->execute_workflow(workflow_id); });
}

kcenon::common::Result<workflow::workflow_execution> gateway_app::cancel_workflow(
	const request_context& context, const std::string& workflow_id)
{
	return admitted<workflow::workflow_execution>(
		context, [&]() { return workflow_engine_->cancel_workflow(workflow_id); });
}

kcenon::common::Result<workflow::workflow_status> gateway_app::workflow_status(
	const request_context& context, const std::string& workflow_id)
{
	return admitted<workflow::workflow_status>(
		context, [&]() { return workflow_engine_->get_status(workflow_id); });
}

// ============================================================================
// Observability
// ============================================================================

Json::Value gateway_app::health() const
{
	const auto& limiter_metrics = limiter_->metrics();

	Json::Value limiter(Json::objectValue);
	limiter["status"] = metrics::to_string(metrics::health_state::healthy);
	limiter["enabled"] = limiter_->config().enabled;
	limiter["tracked_clients"] = Json::UInt64(limiter_->tracked_clients());
	limiter["rejection_rate"] = limiter_metrics.rejection_rate();

	Json::Value components(Json::objectValue);
	components["rate_limiter"] = limiter;
	components["proxy"] = proxy_->health();
	components["schema_translation"] = translation_engine_->health();
	components["workflow"] = workflow_engine_->health();

	int worst = static_cast<int>(metrics::health_state::healthy);
	for (const auto& name : components.getMemberNames())
	{
		worst = std::max(worst, severity(components[name]));
	}

	Json::Value result(Json::objectValue);
	result["name"] = config_.name;
	result["status"] = metrics::to_string(static_cast<metrics::health_state>(worst));
	result["components"] = components;
	return result;
}

Json::Value gateway_app::metrics() const
{
	const auto& limiter_metrics = limiter_->metrics();

	Json::Value limiter(Json::objectValue);
	limiter["rate_limit_checks_total"]
		= Json::UInt64(limiter_metrics.total_checks.load(std::memory_order_relaxed));
	limiter["rate_limit_admitted"]
		= Json::UInt64(limiter_metrics.admitted.load(std::memory_order_relaxed));
	limiter["rate_limit_rejected_global"]
		= Json::UInt64(limiter_metrics.rejected_global.load(std::memory_order_relaxed));
	limiter["rate_limit_rejected_client"]
		= Json::UInt64(limiter_metrics.rejected_client.load(std::memory_order_relaxed));
	limiter["rate_limit_rejected_per_second"]
		= Json::UInt64(limiter_metrics.rejected_per_second.load(std::memory_order_relaxed));
	limiter["rate_limit_rejected_per_minute"]
		= Json::UInt64(limiter_metrics.rejected_per_minute.load(std::memory_order_relaxed));
	limiter["rate_limit_rejected_per_hour"]
		= Json::UInt64(limiter_metrics.rejected_per_hour.load(std::memory_order_relaxed));
	limiter["rate_limit_rejected_concurrent"]
		= Json::UInt64(limiter_metrics.rejected_concurrent.load(std::memory_order_relaxed));
	limiter["rate_limit_completions"]
		= Json::UInt64(limiter_metrics.completions.load(std::memory_order_relaxed));
	limiter["rate_limit_tracked_clients"] = Json::UInt64(limiter_->tracked_clients());

	Json::Value result(Json::objectValue);
	result["rate_limiter"] = limiter;
	result["proxy"] = proxy_->metrics();
	result["schema_translation"] = translation_engine_->metrics();
	result["workflow"] = workflow_engine_->metrics();
	return result;
}

// ============================================================================
// Components
// ============================================================================

void gateway_app::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	limiter_->set_logger(logger);
	pool_->set_logger(logger);
	proxy_->set_logger(logger);
	translation_engine_->set_logger(logger);
	workflow_engine_->set_logger(std::move(logger));
}

std::shared_ptr<kcenon::common::interfaces::IExecutor> gateway_app::get_executor() const
{
	return executor_;
}

void gateway_app::set_executor(std::shared_ptr<kcenon::common::interfaces::IExecutor> executor)
{
	executor_ = executor;
	workflow_engine_->set_executor(std::move(executor));
}

} // namespace federation_gateway
