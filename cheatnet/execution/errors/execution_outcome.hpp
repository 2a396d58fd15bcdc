// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <cheatnet/core/config.hpp>
#include <cheatnet/core/felt.hpp>
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/cheats/cheat_registry.hpp>
#include <cheatnet/execution/errors/command_error.hpp>
#include <cheatnet/execution/resources/resource_accountant.hpp>
#include <cheatnet/execution/state/provider_error.hpp>
#include <cheatnet/execution/syscalls/syscall_handler_base.hpp>

#include <string>
#include <variant>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

struct ExecutionSuccess
{
    std::vector<Felt> ret_data{};
    std::vector<Event> events{};
    std::vector<L2ToL1Message> l2_to_l1_messages{};
    ResourceReport resource_report{};
};

struct ExecutionRevert
{
    std::string reason{};
};

struct EngineError
{
    std::string detail{};
};

struct ProviderFailure
{
    ProviderError kind{ProviderError::Unknown};
};

/// Exactly one alternative per executed top level call
using ExecutionOutcome =
    std::variant<ExecutionSuccess, ExecutionRevert, EngineError, ProviderFailure>;

/// Sorts the raw result of a call into an outcome; `success` carries the
/// captured data of a successful run
ExecutionOutcome
make_execution_outcome(Result<CallInfo> const &, ExecutionSuccess success);

/// Error of a failed outcome; must not be called on ExecutionSuccess
CommandError to_command_error(ExecutionOutcome const &);

CHEATNET_NAMESPACE_END
