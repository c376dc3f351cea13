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

#include <kcenon/federation_gateway/workflow/workflow_types.h>

#include <array>

namespace federation_gateway::workflow
{

namespace
{

constexpr std::array<step_kind, 9> BUILT_IN_KINDS{
	step_kind::llm_inference,	   step_kind::data_transformation, step_kind::api_call,
	step_kind::database_operation, step_kind::file_operation,	   step_kind::notification,
	step_kind::conditional,		   step_kind::loop,				   step_kind::parallel,
};

} // namespace

std::string step_type::name() const
{
	if (kind == step_kind::custom)
	{
		return custom_name;
	}
	return to_string(kind);
}

bool step_type::runs_locally() const noexcept
{
	switch (kind)
	{
	case step_kind::data_transformation:
	case step_kind::conditional:
	case step_kind::loop:
	case step_kind::parallel:
		return true;
	default:
		return false;
	}
}

step_type step_type::parse(const std::string& name)
{
	for (auto kind : BUILT_IN_KINDS)
	{
		if (name == to_string(kind))
		{
			return step_type{ kind, {} };
		}
	}
	return step_type{ step_kind::custom, name };
}

} // namespace federation_gateway::workflow
