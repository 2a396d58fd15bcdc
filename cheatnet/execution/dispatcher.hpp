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
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/cheats/cheat_registry.hpp>
#include <cheatnet/execution/contract/artifacts.hpp>
#include <cheatnet/execution/engine/execution_engine.hpp>
#include <cheatnet/execution/errors/command_error.hpp>
#include <cheatnet/execution/errors/execution_outcome.hpp>
#include <cheatnet/execution/resources/fee_schedule.hpp>
#include <cheatnet/execution/resources/resource_accountant.hpp>
#include <cheatnet/execution/state/provider.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

class CachedState;
class CheatableSyscallHandler;
struct CompiledClassHasher;

/// Caller of top level operations unless a cheat says otherwise
inline constexpr ContractAddress TEST_ADDRESS{
    0x3219347210837402, 0x172498723497};

/// How long a submitted transaction is polled for before giving up
struct TransactionWait
{
    uint32_t retries{100};
    std::chrono::milliseconds retry_interval{5000};
};

struct DeclareOutcome
{
    ClassHash class_hash{};
    std::optional<Felt> transaction_hash{};
    ResourceReport resource_report{};
};

struct DeployOutcome
{
    ContractAddress contract_address{};
    ResourceReport resource_report{};
};

struct CallOutcome
{
    std::vector<Felt> ret_data{};
    std::vector<Event> events{};
    std::vector<L2ToL1Message> l2_to_l1_messages{};
    ResourceReport resource_report{};
};

using InvokeOutcome = CallOutcome;

struct DeclareDeployOutcome
{
    ClassHash class_hash{};
    ContractAddress contract_address{};
    ResourceReport resource_report{};
};

/**
 * Runs declare, deploy, call and invoke against the engine with cheats in
 * effect. Operations are strictly sequential. Each one runs in its own state
 * frame: it is committed only on success (and never for call). The fee
 * estimate comes from the run itself, so the ceiling is checked after the
 * engine ran but before anything is committed; a run over the ceiling leaves
 * state and capture buffers untouched. Ceilings and estimates are hundredths
 * of a gas unit.
 */
class Dispatcher
{
    CachedState &state_;
    CheatRegistry &registry_;
    ExecutionEngine &engine_;
    BlockInfo block_info_;
    FeeSchedule const &schedule_;
    ContractAddress caller_{TEST_ADDRESS};
    Provider *live_provider_{nullptr};
    CompiledClassHasher *class_hasher_{nullptr};
    std::optional<Felt> live_max_fee_{};
    TransactionWait wait_{};

    template <typename Body>
    CommandResult<ExecutionSuccess> transact(
        OperationKind, std::optional<uint64_t> const &max_fee, bool persist,
        Body &&, bool runs_constructor = false);

    /// Provider errors keep the error data sent by the node
    CommandError live_error(Result<void>::error_type const &) const;

    CommandResult<std::optional<Felt>>
    submit_declare(std::string const &sierra, std::string const &casm);

    CommandResult<void> wait_for_transaction(Felt const &transaction_hash);

public:
    Dispatcher(
        CachedState &, CheatRegistry &, ExecutionEngine &, BlockInfo const &,
        FeeSchedule const & = fee_schedule());

    Dispatcher(Dispatcher const &) = delete;
    Dispatcher &operator=(Dispatcher const &) = delete;

    /**
     * Declares are additionally submitted to the network through `provider`
     * and awaited until the node accepts or rejects them. `max_fee` is a fee
     * token amount; without one the provider estimates it.
     */
    void set_live_provider(
        Provider &provider, CompiledClassHasher &hasher,
        std::optional<Felt> const &max_fee = std::nullopt)
    {
        live_provider_ = &provider;
        class_hasher_ = &hasher;
        live_max_fee_ = max_fee;
    }

    void set_transaction_wait(TransactionWait const &wait)
    {
        wait_ = wait;
    }

    void set_caller(ContractAddress const &caller)
    {
        caller_ = caller;
    }

    BlockInfo const &block_info() const
    {
        return block_info_;
    }

    CommandResult<DeclareOutcome> declare(
        std::string_view contract_name, ArtifactProvider const &,
        std::optional<uint64_t> const &max_fee = std::nullopt);

    /// Without a salt every deploy gets a fresh one
    CommandResult<DeployOutcome> deploy(
        ClassHash const &, Calldata const &constructor_calldata,
        std::optional<Felt> const &salt = std::nullopt,
        std::optional<uint64_t> const &max_fee = std::nullopt);

    /// Read only: state writes of the call are always discarded
    CommandResult<CallOutcome> call(
        ContractAddress const &, EntryPointSelector const &, Calldata const &,
        std::optional<uint64_t> const &max_fee = std::nullopt);

    CommandResult<InvokeOutcome> invoke(
        ContractAddress const &, EntryPointSelector const &, Calldata const &,
        std::optional<uint64_t> const &max_fee = std::nullopt);

    CommandResult<DeclareDeployOutcome> declare_and_deploy(
        std::string_view contract_name, ArtifactProvider const &,
        Calldata const &constructor_calldata,
        std::optional<uint64_t> const &max_fee = std::nullopt);

    /// Executes the queued L1 handler messages in FIFO order, one result per
    /// message
    std::vector<CommandResult<CallOutcome>> deliver_l1_handlers();
};

CHEATNET_NAMESPACE_END
