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

#include <cheatnet/core/config.hpp>
#include <cheatnet/core/felt.hpp>
#include <cheatnet/core/fmt/felt_fmt.hpp> // NOLINT
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/cheats/cheat_registry.hpp>
#include <cheatnet/execution/contract/compiled_class.hpp>
#include <cheatnet/execution/engine/execution_engine.hpp>
#include <cheatnet/execution/syscalls/cheatable_syscall_handler.hpp>
#include <cheatnet/execution/syscalls/syscall_handler_base.hpp>

#include <quill/Quill.h>

#include <optional>
#include <utility>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

CheatableSyscallHandler::CheatableSyscallHandler(
    CachedState &state, CheatRegistry &registry, ExecutionEngine &engine,
    BlockInfo const &block_info)
    : SyscallHandlerBase{state, engine, block_info}
    , registry_{registry}
{
}

ContractAddress CheatableSyscallHandler::caller_address()
{
    if (auto const *const prank =
            registry_.lookup<CallerOverride>(executing_address())) {
        return prank->caller;
    }
    return SyscallHandlerBase::caller_address();
}

BlockInfo CheatableSyscallHandler::block_info()
{
    auto info = SyscallHandlerBase::block_info();
    if (auto const *const cheat =
            registry_.lookup<BlockInfoOverride>(executing_address())) {
        info.block_number = cheat->block_number.value_or(info.block_number);
        info.block_timestamp =
            cheat->block_timestamp.value_or(info.block_timestamp);
        info.sequencer_address =
            cheat->sequencer_address.value_or(info.sequencer_address);
    }
    return info;
}

Result<std::optional<ClassHash>>
CheatableSyscallHandler::resolve_class_hash(ContractAddress const &address)
{
    BOOST_OUTCOME_TRY(
        auto const deployed, SyscallHandlerBase::resolve_class_hash(address));
    if (!deployed.has_value()) {
        return deployed;
    }
    if (auto const *const replaced =
            registry_.lookup<BytecodeOverride>(address)) {
        return std::optional<ClassHash>{replaced->class_hash};
    }
    return deployed;
}

Result<CallInfo>
CheatableSyscallHandler::call_entry_point(EntryPointCall const &call)
{
    if (call.entry_point_type == EntryPointType::External) {
        if (auto const *const mock = registry_.lookup<MockedCall>(
                call.contract_address, call.selector)) {
            LOG_DEBUG(
                "mocked call to {} selector {}",
                call.contract_address,
                call.selector);
            return CallInfo{.ret_data = mock->ret_data};
        }
    }
    return SyscallHandlerBase::call_entry_point(call);
}

Result<void> CheatableSyscallHandler::emit_event(
    std::vector<Felt> keys, std::vector<Felt> data)
{
    BOOST_OUTCOME_TRY(
        SyscallHandlerBase::emit_event(std::move(keys), std::move(data)));
    registry_.record_event(emitted().back());
    return outcome::success();
}

Result<void> CheatableSyscallHandler::send_message_to_l1(
    Felt const &to_address, std::vector<Felt> payload)
{
    BOOST_OUTCOME_TRY(
        SyscallHandlerBase::send_message_to_l1(to_address, std::move(payload)));
    registry_.record_message(sent().back());
    return outcome::success();
}

CHEATNET_NAMESPACE_END
