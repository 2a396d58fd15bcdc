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
#include <cheatnet/core/likely.h>
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/cheats/cheat_registry.hpp>
#include <cheatnet/execution/contract/compiled_class.hpp>
#include <cheatnet/execution/engine/execution_engine.hpp>
#include <cheatnet/execution/resources/vm_resources.hpp>
#include <cheatnet/execution/state/cached_state.hpp>
#include <cheatnet/execution/state/provider_error.hpp>
#include <cheatnet/execution/syscalls/syscall_handler.hpp>
#include <cheatnet/execution/syscalls/syscall_handler_base.hpp>

#include <quill/Quill.h>

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

SyscallHandlerBase::SyscallHandlerBase(
    CachedState &state, ExecutionEngine &engine, BlockInfo const &block_info)
    : engine_{engine}
    , block_info_{block_info}
    , state_{state}
{
}

SyscallHandlerBase::Frame const &SyscallHandlerBase::frame() const
{
    CHEATNET_ASSERT(!frames_.empty(), "syscall outside of an entry point");
    return frames_.back();
}

Result<void>::error_type
SyscallHandlerBase::record_failure(Result<void>::error_type error)
{
    if (!failure_.has_error()) {
        failure_ = error.clone();
    }
    return error;
}

void SyscallHandlerBase::count(SyscallKind const kind)
{
    ++syscalls_[kind];
}

ContractAddress SyscallHandlerBase::caller_address()
{
    return frame().caller;
}

BlockInfo SyscallHandlerBase::block_info()
{
    return block_info_;
}

Result<std::optional<ClassHash>>
SyscallHandlerBase::resolve_class_hash(ContractAddress const &address)
{
    return state_.get_class_hash_at(address);
}

Result<CallInfo> SyscallHandlerBase::call_entry_point(EntryPointCall const &call)
{
    BOOST_OUTCOME_TRY(
        auto const class_hash, resolve_class_hash(call.contract_address));
    if (CHEATNET_UNLIKELY(!class_hash.has_value())) {
        return ProviderError::ContractNotFound;
    }
    BOOST_OUTCOME_TRY(auto const cls, state_.get_class(*class_hash));
    if (CHEATNET_UNLIKELY(!cls)) {
        return ProviderError::ClassHashNotFound;
    }
    auto const *const entry_point =
        cls->find_entry_point(call.entry_point_type, call.selector);
    if (entry_point == nullptr) {
        LOG_DEBUG(
            "{} entry point {} not found in class {}",
            to_string(call.entry_point_type),
            call.selector,
            *class_hash);
        return CallInfo{
            .status = EngineStatus::Revert,
            .ret_data = {felt_from_short_string("ENTRYPOINT_NOT_FOUND").value()}};
    }

    if (frames_.empty()) {
        failure_ = outcome::success();
        fault_.reset();
    }
    auto const events_mark = events_.size();
    auto const messages_mark = messages_.size();
    frames_.push_back(Frame{
        .address = call.contract_address,
        .caller = call.caller_address,
        .selector = call.selector});
    state_.push();

    EngineOutput output;
    try {
        output = engine_.execute(*cls, *entry_point, call, *this);
    }
    catch (std::exception const &e) {
        output = EngineOutput{.status = EngineStatus::Fault, .detail = e.what()};
    }
    frames_.pop_back();
    resources_ += output.resources;

    if (failure_.has_error() || fault_.has_value()) {
        state_.pop_reject();
        events_.resize(events_mark);
        messages_.resize(messages_mark);
        if (failure_.has_error()) {
            return failure_.error().clone();
        }
        return CallInfo{.status = EngineStatus::Fault, .detail = *fault_};
    }

    if (output.status == EngineStatus::Success) {
        state_.pop_accept();
    }
    else {
        state_.pop_reject();
        events_.resize(events_mark);
        messages_.resize(messages_mark);
        if (output.status == EngineStatus::Fault) {
            LOG_WARNING(
                "engine fault in {}: {}", call.contract_address, output.detail);
            fault_ = output.detail;
        }
    }
    return CallInfo{
        .status = output.status,
        .ret_data = std::move(output.ret_data),
        .detail = std::move(output.detail)};
}

std::vector<Event> SyscallHandlerBase::take_events()
{
    return std::exchange(events_, {});
}

std::vector<L2ToL1Message> SyscallHandlerBase::take_messages()
{
    return std::exchange(messages_, {});
}

Result<Felt> SyscallHandlerBase::storage_read(StorageKey const &key)
{
    count(SyscallKind::StorageRead);
    auto res = state_.get_storage(frame().address, key);
    if (CHEATNET_UNLIKELY(res.has_error())) {
        return record_failure(std::move(res).error());
    }
    return res;
}

Result<void>
SyscallHandlerBase::storage_write(StorageKey const &key, Felt const &value)
{
    count(SyscallKind::StorageWrite);
    state_.set_storage(frame().address, key, value);
    return outcome::success();
}

Result<ExecutionInfo> SyscallHandlerBase::get_execution_info()
{
    count(SyscallKind::GetExecutionInfo);
    return ExecutionInfo{
        .block_info = block_info(),
        .caller_address = caller_address(),
        .contract_address = frame().address,
        .entry_point_selector = frame().selector};
}

Result<CallResult> SyscallHandlerBase::call_contract(
    ContractAddress const &address, EntryPointSelector const &selector,
    Calldata const &calldata)
{
    count(SyscallKind::CallContract);
    auto res = call_entry_point(EntryPointCall{
        .contract_address = address,
        .caller_address = frame().address,
        .entry_point_type = EntryPointType::External,
        .selector = selector,
        .calldata = calldata});
    if (CHEATNET_UNLIKELY(res.has_error())) {
        return record_failure(std::move(res).error());
    }
    auto &info = res.value();
    return CallResult{
        .failed = info.status != EngineStatus::Success,
        .ret_data = std::move(info.ret_data)};
}

Result<void>
SyscallHandlerBase::emit_event(std::vector<Felt> keys, std::vector<Felt> data)
{
    count(SyscallKind::EmitEvent);
    events_.push_back(Event{
        .from_address = frame().address,
        .keys = std::move(keys),
        .data = std::move(data)});
    return outcome::success();
}

Result<void> SyscallHandlerBase::send_message_to_l1(
    Felt const &to_address, std::vector<Felt> payload)
{
    count(SyscallKind::SendMessageToL1);
    messages_.push_back(L2ToL1Message{
        .from_address = frame().address,
        .to_address = to_address,
        .payload = std::move(payload)});
    return outcome::success();
}

Result<void> SyscallHandlerBase::replace_class(ClassHash const &class_hash)
{
    count(SyscallKind::ReplaceClass);
    auto res = state_.get_class(class_hash);
    if (CHEATNET_UNLIKELY(res.has_error())) {
        return record_failure(std::move(res).error());
    }
    if (CHEATNET_UNLIKELY(!res.value())) {
        return record_failure(
            Result<void>::error_type{ProviderError::ClassHashNotFound});
    }
    state_.set_class_hash_at(frame().address, class_hash);
    return outcome::success();
}

CHEATNET_NAMESPACE_END
