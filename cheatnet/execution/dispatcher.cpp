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
#include <cheatnet/core/felt.hpp>
#include <cheatnet/core/fmt/felt_fmt.hpp> // NOLINT
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/cheats/cheat_registry.hpp>
#include <cheatnet/execution/contract/artifacts.hpp>
#include <cheatnet/execution/contract/compiled_class.hpp>
#include <cheatnet/execution/contract/contract_address.hpp>
#include <cheatnet/execution/dispatcher.hpp>
#include <cheatnet/execution/engine/execution_engine.hpp>
#include <cheatnet/execution/errors/command_error.hpp>
#include <cheatnet/execution/errors/execution_outcome.hpp>
#include <cheatnet/execution/resources/fee_schedule.hpp>
#include <cheatnet/execution/resources/resource_accountant.hpp>
#include <cheatnet/execution/state/cached_state.hpp>
#include <cheatnet/execution/state/provider.hpp>
#include <cheatnet/execution/state/provider_error.hpp>
#include <cheatnet/execution/syscalls/cheatable_syscall_handler.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

Dispatcher::Dispatcher(
    CachedState &state, CheatRegistry &registry, ExecutionEngine &engine,
    BlockInfo const &block_info, FeeSchedule const &schedule)
    : state_{state}
    , registry_{registry}
    , engine_{engine}
    , block_info_{block_info}
    , schedule_{schedule}
{
}

template <typename Body>
CommandResult<ExecutionSuccess> Dispatcher::transact(
    OperationKind const kind, std::optional<uint64_t> const &max_fee,
    bool const persist, Body &&body, bool const runs_constructor)
{
    auto const captures = registry_.capture_mark();
    CheatableSyscallHandler handler{state_, registry_, engine_, block_info_};

    state_.push();
    Result<CallInfo> const res = body(handler);
    auto report = kind == OperationKind::Deploy
                      ? estimate_deploy_resources(
                            schedule_,
                            runs_constructor,
                            handler.vm_resources(),
                            handler.syscall_counts())
                      : estimate_resources(
                            schedule_,
                            kind,
                            handler.vm_resources(),
                            handler.syscall_counts());

    auto outcome = make_execution_outcome(
        res,
        ExecutionSuccess{
            .events = handler.take_events(),
            .l2_to_l1_messages = handler.take_messages(),
            .resource_report = report});
    auto *const success = std::get_if<ExecutionSuccess>(&outcome);
    if (success == nullptr) {
        state_.pop_reject();
        registry_.rewind_captures(captures);
        auto error = to_command_error(outcome);
        LOG_DEBUG("operation failed: {}", error.message());
        return error;
    }
    if (max_fee.has_value() && report.gas_centi > *max_fee) {
        state_.pop_reject();
        registry_.rewind_captures(captures);
        LOG_WARNING(
            "estimated fee {} exceeds the max fee {}",
            format_gas(report.gas_centi),
            format_gas(*max_fee));
        return CommandError::fee_exceeded(report.gas_centi, *max_fee);
    }
    if (persist) {
        state_.pop_accept();
    }
    else {
        state_.pop_reject();
    }
    return std::move(*success);
}

CommandError
Dispatcher::live_error(Result<void>::error_type const &error) const
{
    auto command_error = classify(error);
    if (command_error.kind == CommandErrorKind::Provider) {
        command_error.detail = live_provider_->last_error_data();
    }
    return command_error;
}

CommandResult<void>
Dispatcher::wait_for_transaction(Felt const &transaction_hash)
{
    for (uint32_t attempt = 0; attempt < wait_.retries; ++attempt) {
        if (attempt > 0) {
            std::this_thread::sleep_for(wait_.retry_interval);
        }
        auto const status =
            live_provider_->get_transaction_status(transaction_hash);
        if (status.has_error()) {
            if (status.error() == ProviderError::TransactionHashNotFound) {
                LOG_DEBUG("transaction {} not found yet", transaction_hash);
                continue;
            }
            return live_error(status.error());
        }
        switch (status.value().finality) {
        case FinalityStatus::Received:
            LOG_DEBUG("transaction {} received", transaction_hash);
            continue;
        case FinalityStatus::Rejected:
            return CommandError::rejected();
        case FinalityStatus::AcceptedOnL2:
        case FinalityStatus::AcceptedOnL1:
            break;
        }
        if (status.value().execution == ExecutionStatus::Reverted) {
            return CommandError::reverted(status.value().revert_reason);
        }
        return outcome::success();
    }
    return CommandError::unhandleable(fmt::format(
        "Failed to get transaction with hash = {}; Transaction rejected, not "
        "received or sync is slow",
        transaction_hash));
}

CommandResult<std::optional<Felt>> Dispatcher::submit_declare(
    std::string const &sierra, std::string const &casm)
{
    if (live_provider_ == nullptr) {
        return std::optional<Felt>{};
    }
    CHEATNET_ASSERT(class_hasher_ != nullptr);
    auto const compiled_class_hash = class_hasher_->compiled_class_hash(casm);
    if (compiled_class_hash.has_error()) {
        return classify(compiled_class_hash.error());
    }
    auto const nonce = state_.get_nonce(caller_);
    if (nonce.has_error()) {
        return classify(nonce.error());
    }
    auto const tx_hash = live_provider_->add_declare_transaction(
        DeclareTransaction{
            .sierra = sierra,
            .compiled_class_hash = compiled_class_hash.value(),
            .sender_address = caller_,
            .max_fee = live_max_fee_,
            .nonce = nonce.value()});
    if (tx_hash.has_error()) {
        return live_error(tx_hash.error());
    }
    LOG_INFO("declare transaction {} submitted", tx_hash.value());

    BOOST_OUTCOME_TRY(wait_for_transaction(tx_hash.value()));
    if (auto const res = state_.increment_nonce(caller_); res.has_error()) {
        return classify(res.error());
    }
    return std::optional<Felt>{tx_hash.value()};
}

CommandResult<DeclareOutcome> Dispatcher::declare(
    std::string_view const contract_name, ArtifactProvider const &artifacts,
    std::optional<uint64_t> const &max_fee)
{
    auto const contract = artifacts.lookup(contract_name);
    if (!contract.has_value()) {
        return CommandError::artifacts_not_found(std::string{contract_name});
    }
    if (auto const res = validate_sierra_class(contract->sierra);
        res.has_error()) {
        return classify(res.error());
    }
    auto cls = parse_compiled_class(contract->casm);
    if (cls.has_error()) {
        return classify(cls.error());
    }
    auto const class_hash = compute_class_hash(cls.value());

    auto const existing = state_.get_class(class_hash);
    if (existing.has_error()) {
        return classify(existing.error());
    }
    if (existing.value()) {
        return CommandError::provider_error(ProviderError::ClassAlreadyDeclared);
    }

    auto const report = estimate_resources(
        schedule_, OperationKind::Declare, VmResources{}, SyscallCounts{});
    if (max_fee.has_value() && report.gas_centi > *max_fee) {
        return CommandError::fee_exceeded(report.gas_centi, *max_fee);
    }

    BOOST_OUTCOME_TRY(
        auto const tx_hash,
        submit_declare(contract->sierra, contract->casm));

    state_.set_class(
        class_hash,
        std::make_shared<CompiledClass const>(std::move(cls).value()));
    LOG_INFO("declared {} with class hash {}", contract_name, class_hash);
    return DeclareOutcome{
        .class_hash = class_hash,
        .transaction_hash = tx_hash,
        .resource_report = report};
}

CommandResult<DeployOutcome> Dispatcher::deploy(
    ClassHash const &class_hash, Calldata const &constructor_calldata,
    std::optional<Felt> const &salt, std::optional<uint64_t> const &max_fee)
{
    auto const cls = state_.get_class(class_hash);
    if (cls.has_error()) {
        return classify(cls.error());
    }
    if (!cls.value()) {
        return CommandError::provider_error(ProviderError::ClassHashNotFound);
    }
    auto const &compiled = *cls.value();

    ContractAddress address{};
    BOOST_OUTCOME_TRY(
        auto executed,
        transact(
            OperationKind::Deploy,
            max_fee,
            true,
            [&](CheatableSyscallHandler &handler) -> Result<CallInfo> {
                address = calculate_contract_address(
                    salt.has_value() ? *salt : state_.next_deploy_salt(),
                    class_hash,
                    constructor_calldata,
                    caller_);
                BOOST_OUTCOME_TRY(
                    auto const occupied, state_.get_class_hash_at(address));
                if (occupied.has_value()) {
                    return CallInfo{
                        .status = EngineStatus::Revert,
                        .detail = fmt::format(
                            "contract already deployed at address {}",
                            address)};
                }
                state_.set_class_hash_at(address, class_hash);
                if (!compiled.has_constructor()) {
                    if (!constructor_calldata.empty()) {
                        return CallInfo{
                            .status = EngineStatus::Revert,
                            .detail = "Cannot pass calldata to a contract "
                                      "with no constructor"};
                    }
                    return CallInfo{};
                }
                return handler.call_entry_point(EntryPointCall{
                    .contract_address = address,
                    .caller_address = caller_,
                    .entry_point_type = EntryPointType::Constructor,
                    .selector = compiled.constructor.front().selector,
                    .calldata = constructor_calldata});
            },
            compiled.has_constructor()));

    LOG_INFO(
        "deployed class {} at {}, gas {}",
        class_hash,
        address,
        format_gas(executed.resource_report.gas_centi));
    return DeployOutcome{
        .contract_address = address,
        .resource_report = std::move(executed.resource_report)};
}

CommandResult<CallOutcome> Dispatcher::call(
    ContractAddress const &address, EntryPointSelector const &selector,
    Calldata const &calldata, std::optional<uint64_t> const &max_fee)
{
    BOOST_OUTCOME_TRY(
        auto executed,
        transact(
            OperationKind::Call,
            max_fee,
            false,
            [&](CheatableSyscallHandler &handler) {
                return handler.call_entry_point(EntryPointCall{
                    .contract_address = address,
                    .caller_address = caller_,
                    .entry_point_type = EntryPointType::External,
                    .selector = selector,
                    .calldata = calldata});
            }));
    return CallOutcome{
        .ret_data = std::move(executed.ret_data),
        .events = std::move(executed.events),
        .l2_to_l1_messages = std::move(executed.l2_to_l1_messages),
        .resource_report = std::move(executed.resource_report)};
}

CommandResult<InvokeOutcome> Dispatcher::invoke(
    ContractAddress const &address, EntryPointSelector const &selector,
    Calldata const &calldata, std::optional<uint64_t> const &max_fee)
{
    BOOST_OUTCOME_TRY(
        auto executed,
        transact(
            OperationKind::Invoke,
            max_fee,
            true,
            [&](CheatableSyscallHandler &handler) {
                return handler.call_entry_point(EntryPointCall{
                    .contract_address = address,
                    .caller_address = caller_,
                    .entry_point_type = EntryPointType::External,
                    .selector = selector,
                    .calldata = calldata});
            }));
    LOG_DEBUG(
        "invoked {} on {}, gas {}",
        selector,
        address,
        format_gas(executed.resource_report.gas_centi));
    return InvokeOutcome{
        .ret_data = std::move(executed.ret_data),
        .events = std::move(executed.events),
        .l2_to_l1_messages = std::move(executed.l2_to_l1_messages),
        .resource_report = std::move(executed.resource_report)};
}

CommandResult<DeclareDeployOutcome> Dispatcher::declare_and_deploy(
    std::string_view const contract_name, ArtifactProvider const &artifacts,
    Calldata const &constructor_calldata, std::optional<uint64_t> const &max_fee)
{
    BOOST_OUTCOME_TRY(
        auto const declared, declare(contract_name, artifacts, max_fee));
    BOOST_OUTCOME_TRY(
        auto deployed,
        deploy(declared.class_hash, constructor_calldata, std::nullopt, max_fee));
    return DeclareDeployOutcome{
        .class_hash = declared.class_hash,
        .contract_address = deployed.contract_address,
        .resource_report = std::move(deployed.resource_report)};
}

std::vector<CommandResult<CallOutcome>> Dispatcher::deliver_l1_handlers()
{
    std::vector<CommandResult<CallOutcome>> results;
    while (auto message = registry_.pop_l1_handler()) {
        Calldata calldata;
        calldata.reserve(message->payload.size() + 1);
        calldata.push_back(message->from_address);
        calldata.insert(
            calldata.end(), message->payload.begin(), message->payload.end());

        auto executed = transact(
            OperationKind::L1Handler,
            std::nullopt,
            true,
            [&](CheatableSyscallHandler &handler) {
                return handler.call_entry_point(EntryPointCall{
                    .contract_address = message->target,
                    .caller_address = Felt{0},
                    .entry_point_type = EntryPointType::L1Handler,
                    .selector = message->selector,
                    .calldata = std::move(calldata)});
            });
        if (executed.has_error()) {
            results.emplace_back(std::move(executed).error());
            continue;
        }
        auto &success = executed.value();
        results.emplace_back(CallOutcome{
            .ret_data = std::move(success.ret_data),
            .events = std::move(success.events),
            .l2_to_l1_messages = std::move(success.l2_to_l1_messages),
            .resource_report = std::move(success.resource_report)});
    }
    return results;
}

CHEATNET_NAMESPACE_END
