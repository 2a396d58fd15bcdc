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

#include <cheatnet/core/assert.h>
#include <cheatnet/core/config.hpp>
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/engine/execution_engine.hpp>
#include <cheatnet/execution/errors/command_error.hpp>
#include <cheatnet/execution/errors/execution_outcome.hpp>
#include <cheatnet/execution/syscalls/syscall_handler_base.hpp>

#include <utility>
#include <variant>

CHEATNET_NAMESPACE_BEGIN

ExecutionOutcome make_execution_outcome(
    Result<CallInfo> const &res, ExecutionSuccess success)
{
    if (res.has_error()) {
        auto const error = classify(res.error());
        if (error.kind == CommandErrorKind::Provider) {
            return ProviderFailure{.kind = error.provider};
        }
        return EngineError{.detail = error.detail};
    }
    auto const &info = res.value();
    switch (info.status) {
    case EngineStatus::Success:
        success.ret_data = info.ret_data;
        return success;
    case EngineStatus::Revert:
        return ExecutionRevert{
            .reason = info.detail.empty()
                          ? format_revert_reason(info.ret_data)
                          : info.detail};
    case EngineStatus::Fault:
        break;
    }
    return EngineError{.detail = info.detail};
}

CommandError to_command_error(ExecutionOutcome const &outcome)
{
    if (auto const *const revert = std::get_if<ExecutionRevert>(&outcome)) {
        return CommandError::reverted(revert->reason);
    }
    if (auto const *const fault = std::get_if<EngineError>(&outcome)) {
        return CommandError::unhandleable(fault->detail);
    }
    if (auto const *const failure = std::get_if<ProviderFailure>(&outcome)) {
        return CommandError::provider_error(failure->kind);
    }
    CHEATNET_ABORT("successful outcome has no error");
}

CHEATNET_NAMESPACE_END
