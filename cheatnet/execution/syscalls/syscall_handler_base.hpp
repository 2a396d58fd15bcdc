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
#include <cheatnet/execution/resources/vm_resources.hpp>
#include <cheatnet/execution/syscalls/syscall_handler.hpp>

#include <optional>
#include <string>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

class CachedState;

struct CallInfo
{
    EngineStatus status{EngineStatus::Success};
    std::vector<Felt> ret_data{};
    std::string detail{};
};

/**
 * Default syscall behaviour over a CachedState. Every entry point run opens
 * a state frame that is accepted on success and rejected on revert or fault,
 * together with the events and messages the frame produced.
 */
class SyscallHandlerBase : public SyscallHandler
{
    struct Frame
    {
        ContractAddress address;
        ContractAddress caller;
        EntryPointSelector selector;
    };

    ExecutionEngine &engine_;
    BlockInfo const block_info_;

    std::vector<Frame> frames_{};
    std::vector<Event> events_{};
    std::vector<L2ToL1Message> messages_{};
    VmResources resources_{};
    SyscallCounts syscalls_{};

    // first syscall failure, reported in place of the engine's outcome
    Result<void> failure_{outcome::success()};
    std::optional<std::string> fault_{};

    Frame const &frame() const;

    Result<void>::error_type record_failure(Result<void>::error_type);

protected:
    CachedState &state_;

    void count(SyscallKind);

    std::vector<Event> const &emitted() const
    {
        return events_;
    }

    std::vector<L2ToL1Message> const &sent() const
    {
        return messages_;
    }

    ContractAddress const &executing_address() const
    {
        return frame().address;
    }

    virtual ContractAddress caller_address();

    virtual BlockInfo block_info();

    virtual Result<std::optional<ClassHash>>
    resolve_class_hash(ContractAddress const &);

public:
    SyscallHandlerBase(CachedState &, ExecutionEngine &, BlockInfo const &);

    virtual ~SyscallHandlerBase() = default;

    /// Runs the entry point the call names on the class deployed at its
    /// address. Fails with ContractNotFound for an empty address.
    virtual Result<CallInfo> call_entry_point(EntryPointCall const &);

    std::vector<Event> take_events();

    std::vector<L2ToL1Message> take_messages();

    VmResources const &vm_resources() const
    {
        return resources_;
    }

    SyscallCounts const &syscall_counts() const
    {
        return syscalls_;
    }

    virtual Result<Felt> storage_read(StorageKey const &) override;

    virtual Result<void>
    storage_write(StorageKey const &, Felt const &value) override;

    virtual Result<ExecutionInfo> get_execution_info() override;

    virtual Result<CallResult> call_contract(
        ContractAddress const &, EntryPointSelector const &,
        Calldata const &) override;

    virtual Result<void>
    emit_event(std::vector<Felt> keys, std::vector<Felt> data) override;

    virtual Result<void> send_message_to_l1(
        Felt const &to_address, std::vector<Felt> payload) override;

    virtual Result<void> replace_class(ClassHash const &) override;
};

CHEATNET_NAMESPACE_END
