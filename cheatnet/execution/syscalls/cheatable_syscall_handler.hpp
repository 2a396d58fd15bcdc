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
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/cheats/cheat_registry.hpp>
#include <cheatnet/execution/engine/execution_engine.hpp>
#include <cheatnet/execution/syscalls/syscall_handler_base.hpp>

#include <optional>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

/**
 * Syscall handler of a cheated run. Environment queries, contract calls and
 * class resolution consult the registry for the executing contract before
 * falling back to the default behaviour; events and L2 to L1 messages always
 * go through and are additionally captured while the registry collects them.
 */
class CheatableSyscallHandler final : public SyscallHandlerBase
{
    CheatRegistry &registry_;

protected:
    ContractAddress caller_address() override;

    BlockInfo block_info() override;

    Result<std::optional<ClassHash>>
    resolve_class_hash(ContractAddress const &) override;

public:
    CheatableSyscallHandler(
        CachedState &, CheatRegistry &, ExecutionEngine &, BlockInfo const &);

    Result<CallInfo> call_entry_point(EntryPointCall const &) override;

    Result<void>
    emit_event(std::vector<Felt> keys, std::vector<Felt> data) override;

    Result<void> send_message_to_l1(
        Felt const &to_address, std::vector<Felt> payload) override;
};

CHEATNET_NAMESPACE_END
