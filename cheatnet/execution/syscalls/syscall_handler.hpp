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

#include <vector>

CHEATNET_NAMESPACE_BEGIN

struct ExecutionInfo
{
    BlockInfo block_info{};
    ContractAddress caller_address{};
    ContractAddress contract_address{};
    EntryPointSelector entry_point_selector{};
};

struct CallResult
{
    bool failed{false};
    std::vector<Felt> ret_data{};
};

/// Syscalls a running entry point issues, always on behalf of the innermost
/// executing contract
class SyscallHandler
{
public:
    virtual ~SyscallHandler() = default;

    virtual Result<Felt> storage_read(StorageKey const &) = 0;

    virtual Result<void>
    storage_write(StorageKey const &, Felt const &value) = 0;

    virtual Result<ExecutionInfo> get_execution_info() = 0;

    virtual Result<CallResult> call_contract(
        ContractAddress const &, EntryPointSelector const &,
        Calldata const &) = 0;

    virtual Result<void>
    emit_event(std::vector<Felt> keys, std::vector<Felt> data) = 0;

    virtual Result<void>
    send_message_to_l1(Felt const &to_address, std::vector<Felt> payload) = 0;

    virtual Result<void> replace_class(ClassHash const &) = 0;
};

CHEATNET_NAMESPACE_END
