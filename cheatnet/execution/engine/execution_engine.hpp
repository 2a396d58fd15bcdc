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
#include <cheatnet/execution/contract/compiled_class.hpp>
#include <cheatnet/execution/resources/vm_resources.hpp>

#include <cstdint>
#include <string>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

class SyscallHandler;

struct EntryPointCall
{
    /// Address whose storage the code runs against
    ContractAddress contract_address{};
    ContractAddress caller_address{};
    EntryPointType entry_point_type{EntryPointType::External};
    EntryPointSelector selector{};
    Calldata calldata{};
};

enum class EngineStatus : uint8_t
{
    Success = 0,
    Revert,
    Fault,
};

struct EngineOutput
{
    EngineStatus status{EngineStatus::Success};
    /// Return values, or the panic data of a revert
    std::vector<Felt> ret_data{};
    /// Diagnostic of a fault
    std::string detail{};
    VmResources resources{};
};

/**
 * The Cairo VM. Runs one entry point of a compiled class, reaching state and
 * the environment only through the syscall handler. A syscall that returns
 * an error aborts the run; the engine then reports a fault and the handler
 * surfaces the syscall error in its place. Exceptions thrown by the engine
 * are reported as faults carrying their message.
 */
struct ExecutionEngine
{
    virtual ~ExecutionEngine() = default;

    virtual EngineOutput execute(
        CompiledClass const &, EntryPoint const &, EntryPointCall const &,
        SyscallHandler &) = 0;
};

CHEATNET_NAMESPACE_END
