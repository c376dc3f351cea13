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
 * @file gateway_app.h
 * @brief Federation gateway application facade
 *
 * Defines the long-lived context an embedding process constructs once. It
 * owns every component and applies admission control around each entry
 * point:
 * - Rate limiting per client with an admission ticket held for the call
 * - Proxying to providers with inline protocol translation
 * - Schema translation as a service
 * - Workflow definition, execution and cancellation
 * - Aggregated health and metrics
 *
 * Components share one translator registry: the proxy's inline translator
 * and the schema translation engine resolve the same version pairs.
 */

#pragma once

#include "core/federation_config.h"

#include <kcenon/federation_gateway/admission/rate_limiter.h>
#include <kcenon/federation_gateway/proxy/mcp_proxy.h>
#include <kcenon/federation_gateway/storage/repositories.h>
#include <kcenon/federation_gateway/translation/schema_translation_engine.h>
#include <kcenon/federation_gateway/workflow/workflow_engine.h>

#include <kcenon/common/interfaces/executor_interface.h>
#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <json/json.h>

#include <memory>
#include <string>

namespace federation_gateway
{

/**
 * @struct request_context
 * @brief Caller identity and request path used for admission
 */
struct request_context
{
	std::string client_id; ///< Rate limiting key
	std::string path;      ///< Exempt paths bypass the limiter
};

/**
 * @class gateway_app
 * @brief Owns the gateway components and mediates every call through them
 *
 * Thread Safety:
 * - All entry points are thread-safe; the components synchronize internally
 * - set_logger() and set_executor() are meant to be called before serving
 *
 * Usage Example:
 * @code
 *   auto gateway = federation_gateway::gateway_app::create(config, transport);
 *   if (gateway.is_err()) {
 *       return 1;
 *   }
 *   auto& app = *gateway.value();
 *   app.connections().register_server("search", "http://search:9000", "2.0");
 *
 *   auto response = app.proxy_request({ "client-a", "/tools/call" }, "search", request);
 * @endcode
 */
class gateway_app
{
public:
	/**
	 * @brief Construct the gateway
	 * @param config Gateway configuration (not validated here)
	 * @param transport Outbound provider transport
	 * @param workflows Workflow repository, in-memory when null
	 * @param translations Translation repository, in-memory when null
	 */
	gateway_app(const federation_config& config,
				std::shared_ptr<proxy::provider_transport> transport,
				std::shared_ptr<storage::workflow_repository> workflows = nullptr,
				std::shared_ptr<storage::translation_repository> translations = nullptr);

	// Non-copyable, non-movable
	gateway_app(const gateway_app&) = delete;
	gateway_app& operator=(const gateway_app&) = delete;
	gateway_app(gateway_app&&) = delete;
	gateway_app& operator=(gateway_app&&) = delete;

	/**
	 * @brief Validate the configuration, then construct the gateway
	 * @return The gateway, or a validation error listing every problem
	 */
	static kcenon::common::Result<std::shared_ptr<gateway_app>> create(
		const federation_config& config,
		std::shared_ptr<proxy::provider_transport> transport,
		std::shared_ptr<storage::workflow_repository> workflows = nullptr,
		std::shared_ptr<storage::translation_repository> translations = nullptr);

	// ========================================================================
	// Entry points
	// ========================================================================

	/**
	 * @brief Forward a request to a named provider
	 */
	[[nodiscard]] kcenon::common::Result<proxy::proxy_response> proxy_request(
		const request_context& context,
		const std::string& server_id,
		const proxy::proxy_request& request);

	/**
	 * @brief Forward a request to the provider owning its path prefix
	 */
	[[nodiscard]] kcenon::common::Result<proxy::proxy_response> route(
		const request_context& context, const proxy::proxy_request& request);

	[[nodiscard]] kcenon::common::Result<translation::schema_translation_response>
	translate_schema(const request_context& context,
					 const translation::schema_translation_request& request);

	/**
	 * @brief Create a workflow owned by the calling client
	 *
	 * An empty client_id on the definition is filled from the context.
	 */
	[[nodiscard]] kcenon::common::Result<workflow::federated_workflow> create_workflow(
		const request_context& context, workflow::federated_workflow definition);

	[[nodiscard]] kcenon::common::Result<workflow::workflow_execution> execute_workflow(
		const request_context& context, const std::string& workflow_id);

	[[nodiscard]] kcenon::common::Result<workflow::workflow_execution> cancel_workflow(
		const request_context& context, const std::string& workflow_id);

	[[nodiscard]] kcenon::common::Result<workflow::workflow_status> workflow_status(
		const request_context& context, const std::string& workflow_id);

	// ========================================================================
	// Observability
	// ========================================================================

	/**
	 * @brief Component health in one document
	 *
	 * The top-level status is the worst component status.
	 */
	[[nodiscard]] Json::Value health() const;

	/**
	 * @brief Component metrics in one document, keyed by component
	 */
	[[nodiscard]] Json::Value metrics() const;

	// ========================================================================
	// Components
	// ========================================================================

	[[nodiscard]] const federation_config& config() const noexcept { return config_; }

	[[nodiscard]] admission::rate_limiter& limiter() noexcept { return *limiter_; }

	[[nodiscard]] proxy::connection_pool& connections() noexcept { return *pool_; }

	[[nodiscard]] proxy::mcp_proxy& provider_proxy() noexcept { return *proxy_; }

	[[nodiscard]] translation::schema_translation_engine& translations() noexcept
	{
		return *translation_engine_;
	}

	[[nodiscard]] workflow::workflow_engine& workflows() noexcept { return *workflow_engine_; }

	/**
	 * @brief Attach one logger to every component
	 */
	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

	/**
	 * @brief Get the executor used for workflow steps
	 * @return Shared pointer to executor, or nullptr if not set
	 */
	std::shared_ptr<kcenon::common::interfaces::IExecutor> get_executor() const;

	/**
	 * @brief Set the executor for workflow steps
	 */
	void set_executor(std::shared_ptr<kcenon::common::interfaces::IExecutor> executor);

private:
	/**
	 * @brief Run an operation under admission control
	 *
	 * Exempt paths run without touching the limiter. A rejection returns a
	 * rate_limited error; an admitted call holds its ticket until the
	 * operation returns.
	 */
	template <typename T, typename Operation>
	kcenon::common::Result<T> admitted(const request_context& context, Operation&& operation);

	/**
	 * @brief Create per-component console loggers from the logging section
	 */
	void setup_logging();

	federation_config config_;

	std::shared_ptr<admission::rate_limiter> limiter_;
	std::shared_ptr<translation::translator_registry> registry_;
	std::shared_ptr<proxy::connection_pool> pool_;
	std::shared_ptr<proxy::mcp_proxy> proxy_;
	std::shared_ptr<translation::schema_translation_engine> translation_engine_;
	std::shared_ptr<workflow::workflow_engine> workflow_engine_;

	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor_;
};

} // namespace federation_gateway
