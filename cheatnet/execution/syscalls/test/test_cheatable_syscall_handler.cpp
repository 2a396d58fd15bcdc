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

#include <cheatnet/core/felt.hpp>
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/cheats/cheat_registry.hpp>
#include <cheatnet/execution/contract/compiled_class.hpp>
#include <cheatnet/execution/engine/execution_engine.hpp>
#include <cheatnet/execution/resources/vm_resources.hpp>
#include <cheatnet/execution/state/cached_state.hpp>
#include <cheatnet/execution/state/provider_error.hpp>
#include <cheatnet/execution/state/state_reader.hpp>
#include <cheatnet/execution/syscalls/cheatable_syscall_handler.hpp>
#include <cheatnet/execution/syscalls/syscall_handler.hpp>
#include <cheatnet/execution/test/fakes.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace cheatnet;

namespace
{
    ContractAddress const A{0xa};
    ContractAddress const B{0xb};
    ClassHash const CLASS_A{0x1a};
    ClassHash const CLASS_B{0x1b};
    ClassHash const CLASS_C{0x1c};
    Felt const TAG_A{1};
    Felt const TAG_B{2};
    Felt const TAG_C{3};
    StorageKey const KEY{0x42};

    EntryPointSelector const WHO = selector_from_name("who");
    EntryPointSelector const WHEN = selector_from_name("when");
    EntryPointSelector const FORWARD = selector_from_name("forward");
    EntryPointSelector const NOISY = selector_from_name("noisy");
    EntryPointSelector const UPGRADE = selector_from_name("upgrade");
    EntryPointSelector const HANDLE = selector_from_name("handle");

    EngineOutput who(EntryPointCall const &, SyscallHandler &h)
    {
        auto const info = h.get_execution_info().value();
        return EngineOutput{.ret_data = {info.caller_address}};
    }

    EngineOutput when(EntryPointCall const &, SyscallHandler &h)
    {
        auto const info = h.get_execution_info().value();
        return EngineOutput{
            .ret_data = {
                Felt{info.block_info.block_number},
                Felt{info.block_info.block_timestamp},
                info.block_info.sequencer_address}};
    }

    fake::Script forward_to(ContractAddress const &target)
    {
        return [target](EntryPointCall const &call, SyscallHandler &h) {
            auto const res = h.call_contract(target, call.selector, {});
            if (res.has_error()) {
                return fake::fault("call failed");
            }
            if (res.value().failed) {
                return fake::revert(res.value().ret_data);
            }
            return EngineOutput{.ret_data = res.value().ret_data};
        };
    }

    struct CheatableSyscallHandlerTest : public testing::Test
    {
        DictStateReader reader{};
        CachedState state{reader};
        CheatRegistry registry{};
        fake::Engine engine{};
        CheatableSyscallHandler handler{state, registry, engine, BlockInfo{}};

        void SetUp() override
        {
            reader.insert_class(
                CLASS_A,
                fake::make_class(
                    TAG_A, {WHO, WHEN, FORWARD, NOISY, UPGRADE}, std::nullopt,
                    {HANDLE}));
            reader.insert_class(CLASS_B, fake::make_class(TAG_B, {WHO, NOISY}));
            reader.insert_class(CLASS_C, fake::make_class(TAG_C, {WHO}));
            reader.insert_contract(A, CLASS_A);
            reader.insert_contract(B, CLASS_B);

            engine.on(TAG_A, WHO, who);
            engine.on(TAG_A, WHEN, when);
            engine.on(TAG_B, WHO, who);
            engine.on(TAG_A, FORWARD, [](auto const &, auto &h) {
                auto const res = h.call_contract(B, WHO, {});
                if (res.has_error() || res.value().failed) {
                    return fake::fault("forward failed");
                }
                return EngineOutput{.ret_data = res.value().ret_data};
            });
            engine.on(TAG_C, WHO, [](auto const &, auto &) {
                return EngineOutput{.ret_data = {TAG_C}};
            });
        }

        Result<CallInfo> call(
            ContractAddress const &address, EntryPointSelector const &selector,
            EntryPointType const type = EntryPointType::External)
        {
            return handler.call_entry_point(EntryPointCall{
                .contract_address = address,
                .caller_address = Felt{0xcafe},
                .entry_point_type = type,
                .selector = selector});
        }
    };
}

TEST_F(CheatableSyscallHandlerTest, caller_is_the_call_origin)
{
    auto const res = call(A, WHO);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().status, EngineStatus::Success);
    EXPECT_EQ(res.value().ret_data, std::vector<Felt>{Felt{0xcafe}});

    auto const nested = call(A, FORWARD);
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(nested.value().ret_data, std::vector<Felt>{A});
}

TEST_F(CheatableSyscallHandlerTest, targeted_caller_does_not_leak)
{
    registry.apply_cheat(
        CheatScope::target(A), CallerOverride{.caller = Felt{0x123}});

    EXPECT_EQ(call(A, WHO).value().ret_data, std::vector<Felt>{Felt{0x123}});
    // B runs on behalf of A and sees A's real address
    EXPECT_EQ(call(A, FORWARD).value().ret_data, std::vector<Felt>{A});
    EXPECT_EQ(call(B, WHO).value().ret_data, std::vector<Felt>{Felt{0xcafe}});
}

TEST_F(CheatableSyscallHandlerTest, global_caller_reaches_nested_calls)
{
    registry.apply_cheat(
        CheatScope::global(), CallerOverride{.caller = Felt{0x123}});

    EXPECT_EQ(call(A, WHO).value().ret_data, std::vector<Felt>{Felt{0x123}});
    EXPECT_EQ(
        call(A, FORWARD).value().ret_data, std::vector<Felt>{Felt{0x123}});

    registry.apply_cheat(
        CheatScope::target(B), CallerOverride{.caller = Felt{0x456}});
    EXPECT_EQ(
        call(A, FORWARD).value().ret_data, std::vector<Felt>{Felt{0x456}});
}

TEST_F(CheatableSyscallHandlerTest, block_info_fields_override_independently)
{
    BlockInfo const defaults{};
    registry.apply_cheat(
        CheatScope::target(A), BlockInfoOverride{.block_timestamp = 77});

    auto const ret = call(A, WHEN).value().ret_data;
    ASSERT_EQ(ret.size(), 3u);
    EXPECT_EQ(ret[0], Felt{defaults.block_number});
    EXPECT_EQ(ret[1], Felt{77});
    EXPECT_EQ(ret[2], defaults.sequencer_address);

    registry.apply_cheat(
        CheatScope::target(A),
        BlockInfoOverride{
            .block_number = 5, .sequencer_address = ContractAddress{0x99}});
    auto const again = call(A, WHEN).value().ret_data;
    EXPECT_EQ(again[0], Felt{5});
    EXPECT_EQ(again[1], Felt{defaults.block_timestamp});
    EXPECT_EQ(again[2], ContractAddress{0x99});
}

TEST_F(CheatableSyscallHandlerTest, mocked_call_skips_the_engine)
{
    registry.apply_cheat(
        CheatScope::target(A),
        MockedCall{.selector = WHO, .ret_data = {Felt{7}, Felt{8}}});

    auto const res = call(A, WHO);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().ret_data, (std::vector<Felt>{Felt{7}, Felt{8}}));
    EXPECT_EQ(engine.runs, 0u);

    // other selectors of the same contract still run
    EXPECT_EQ(call(A, WHEN).value().status, EngineStatus::Success);
    EXPECT_EQ(engine.runs, 1u);
}

TEST_F(CheatableSyscallHandlerTest, mocked_nested_call)
{
    registry.apply_cheat(
        CheatScope::target(B), MockedCall{.selector = WHO, .ret_data = {Felt{7}}});

    auto const res = call(A, FORWARD);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().ret_data, std::vector<Felt>{Felt{7}});
    EXPECT_EQ(engine.runs, 1u);
}

TEST_F(CheatableSyscallHandlerTest, mocks_apply_to_external_calls_only)
{
    engine.on(TAG_A, HANDLE, [](auto const &, auto &) {
        return EngineOutput{.ret_data = {Felt{1}}};
    });
    registry.apply_cheat(
        CheatScope::global(), MockedCall{.selector = HANDLE, .ret_data = {}});

    auto const res = call(A, HANDLE, EntryPointType::L1Handler);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().ret_data, std::vector<Felt>{Felt{1}});
    EXPECT_EQ(engine.runs, 1u);
}

TEST_F(CheatableSyscallHandlerTest, bytecode_override)
{
    registry.apply_cheat(
        CheatScope::target(A), BytecodeOverride{.class_hash = CLASS_C});
    EXPECT_EQ(call(A, WHO).value().ret_data, std::vector<Felt>{TAG_C});
    EXPECT_EQ(call(B, WHO).value().ret_data, std::vector<Felt>{Felt{0xcafe}});

    registry.cancel_cheat(CheatKind::Bytecode, CheatScope::target(A));
    EXPECT_EQ(call(A, WHO).value().ret_data, std::vector<Felt>{Felt{0xcafe}});
}

TEST_F(CheatableSyscallHandlerTest, revert_discards_frame_output)
{
    engine.on(TAG_A, NOISY, [](auto const &, auto &h) {
        (void)h.emit_event({Felt{1}}, {Felt{10}});
        (void)h.storage_write(KEY, Felt{100});
        auto const res = h.call_contract(B, NOISY, {});
        if (res.has_error() || !res.value().failed) {
            return fake::fault("expected a failed call");
        }
        return EngineOutput{};
    });
    engine.on(TAG_B, NOISY, [](auto const &, auto &h) {
        (void)h.emit_event({Felt{2}}, {Felt{20}});
        (void)h.send_message_to_l1(Felt{0xe1}, {Felt{3}});
        (void)h.storage_write(KEY, Felt{200});
        return fake::revert({felt_from_short_string("nope").value()});
    });
    registry.start_spy();
    registry.start_message_collection();

    auto const res = call(A, NOISY);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().status, EngineStatus::Success);

    auto const events = handler.take_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].from_address, A);
    EXPECT_TRUE(handler.take_messages().empty());
    EXPECT_EQ(state.get_storage(A, KEY).value(), Felt{100});
    EXPECT_EQ(state.get_storage(B, KEY).value(), Felt{0});

    // the spy records at emit time, before the inner frame reverted
    ASSERT_EQ(registry.events().size(), 2u);
    EXPECT_EQ(registry.events()[1].from_address, B);
    EXPECT_EQ(registry.l2_to_l1_messages().size(), 1u);
}

TEST_F(CheatableSyscallHandlerTest, spy_filter_by_emitter)
{
    engine.on(TAG_A, NOISY, [](auto const &, auto &h) {
        (void)h.emit_event({Felt{1}}, {});
        (void)h.call_contract(B, NOISY, {});
        return EngineOutput{};
    });
    engine.on(TAG_B, NOISY, [](auto const &, auto &h) {
        (void)h.emit_event({Felt{2}}, {});
        return EngineOutput{};
    });
    registry.start_spy(SpyFilter{.addresses = {B}});

    ASSERT_TRUE(call(A, NOISY).has_value());
    ASSERT_EQ(registry.events().size(), 1u);
    EXPECT_EQ(registry.events()[0].from_address, B);
    EXPECT_EQ(handler.take_events().size(), 2u);
}

TEST_F(CheatableSyscallHandlerTest, replace_class)
{
    engine.on(TAG_A, UPGRADE, [](auto const &call, auto &h) {
        if (h.replace_class(call.calldata.front()).has_error()) {
            return fake::fault("replace_class failed");
        }
        return EngineOutput{};
    });

    auto const missing = handler.call_entry_point(EntryPointCall{
        .contract_address = A, .selector = UPGRADE, .calldata = {Felt{0xdead}}});
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(missing.error(), ProviderError::ClassHashNotFound);
    EXPECT_EQ(state.get_class_hash_at(A).value(), CLASS_A);

    auto const replaced = handler.call_entry_point(EntryPointCall{
        .contract_address = A, .selector = UPGRADE, .calldata = {CLASS_C}});
    ASSERT_TRUE(replaced.has_value());
    EXPECT_EQ(state.get_class_hash_at(A).value(), CLASS_C);
    EXPECT_EQ(call(A, WHO).value().ret_data, std::vector<Felt>{TAG_C});
}

TEST_F(CheatableSyscallHandlerTest, engine_exception_is_a_fault)
{
    auto const res = call(B, NOISY);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().status, EngineStatus::Fault);
    EXPECT_EQ(res.value().detail, "no script for entry point");
}

TEST_F(CheatableSyscallHandlerTest, missing_contract_and_entry_point)
{
    auto const res = call(ContractAddress{0x404}, WHO);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), ProviderError::ContractNotFound);

    auto const entry_point = call(B, WHEN);
    ASSERT_TRUE(entry_point.has_value());
    EXPECT_EQ(entry_point.value().status, EngineStatus::Revert);
    EXPECT_EQ(
        entry_point.value().ret_data,
        std::vector<Felt>{felt_from_short_string("ENTRYPOINT_NOT_FOUND").value()});
    EXPECT_EQ(engine.runs, 0u);
}

TEST_F(CheatableSyscallHandlerTest, syscall_counts)
{
    engine.on(TAG_A, NOISY, [](auto const &, auto &h) {
        (void)h.storage_read(KEY);
        (void)h.storage_write(KEY, Felt{1});
        (void)h.storage_write(KEY, Felt{2});
        (void)h.get_execution_info();
        return EngineOutput{.resources = {.n_steps = 126}};
    });

    ASSERT_TRUE(call(A, NOISY).has_value());
    auto const &counts = handler.syscall_counts();
    EXPECT_EQ(counts.at(SyscallKind::StorageRead), 1u);
    EXPECT_EQ(counts.at(SyscallKind::StorageWrite), 2u);
    EXPECT_EQ(counts.at(SyscallKind::GetExecutionInfo), 1u);
    EXPECT_FALSE(counts.contains(SyscallKind::CallContract));
    EXPECT_EQ(handler.vm_resources().n_steps, 126u);
}
