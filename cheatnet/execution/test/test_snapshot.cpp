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
#include <cheatnet/execution/block_info.hpp>
#include <cheatnet/execution/cheats/cheat_registry.hpp>
#include <cheatnet/execution/contract/artifacts.hpp>
#include <cheatnet/execution/dispatcher.hpp>
#include <cheatnet/execution/engine/execution_engine.hpp>
#include <cheatnet/execution/snapshot.hpp>
#include <cheatnet/execution/state/cached_state.hpp>
#include <cheatnet/execution/state/state_reader.hpp>
#include <cheatnet/execution/syscalls/syscall_handler.hpp>
#include <cheatnet/execution/test/fakes.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace cheatnet;

namespace
{
    ContractAddress const COUNTER{0xc0};
    ClassHash const COUNTER_CLASS{0xc1a55};
    Felt const TAG{0x77};
    StorageKey const KEY{0x1};
    EntryPointSelector const BUMP = selector_from_name("bump");

    struct SnapshotTest : public testing::Test
    {
        DictStateReader reader{};
        CachedState state{reader};
        CheatRegistry registry{};
        fake::Engine engine{};
        Dispatcher dispatcher{state, registry, engine, BlockInfo{}};
        SnapshotManager snapshots{state, registry};

        void SetUp() override
        {
            reader.insert_class(COUNTER_CLASS, fake::make_class(TAG, {BUMP}));
            reader.insert_contract(COUNTER, COUNTER_CLASS);
            engine.on(TAG, BUMP, [](auto const &, auto &h) {
                auto const value = h.storage_read(KEY).value();
                (void)h.storage_write(KEY, value + 1);
                return EngineOutput{.ret_data = {value + 1}};
            });
        }

        Felt counter()
        {
            return state.get_storage(COUNTER, KEY).value();
        }

        void bump()
        {
            ASSERT_TRUE(dispatcher.invoke(COUNTER, BUMP, {}).has_value());
        }
    };
}

TEST_F(SnapshotTest, restore_round_trip)
{
    bump();
    registry.apply_cheat(
        CheatScope::target(COUNTER), CallerOverride{.caller = Felt{1}});

    CachedState const state_before = state;
    CheatRegistry const registry_before = registry;
    auto const snapshot = snapshots.snapshot();
    snapshots.restore(snapshot);

    EXPECT_TRUE(state == state_before);
    EXPECT_TRUE(registry == registry_before);
    EXPECT_EQ(counter(), Felt{1});
}

TEST_F(SnapshotTest, restore_erases_later_mutations)
{
    bump();
    auto const snapshot = snapshots.snapshot();
    CachedState const state_before = state;
    CheatRegistry const registry_before = registry;

    bump();
    bump();
    state.set_class(Felt{0xabc}, std::make_shared<CompiledClass const>());
    state.set_class_hash_at(Felt{0xdef}, Felt{0xabc});
    registry.apply_cheat(
        CheatScope::global(), BlockInfoOverride{.block_number = 9});
    registry.start_spy();
    EXPECT_EQ(counter(), Felt{3});

    snapshots.restore(snapshot);
    EXPECT_TRUE(state == state_before);
    EXPECT_TRUE(registry == registry_before);
    EXPECT_EQ(counter(), Felt{1});
    EXPECT_EQ(state.get_class(Felt{0xabc}).value(), nullptr);
    EXPECT_FALSE(state.get_class_hash_at(Felt{0xdef}).value().has_value());
    EXPECT_EQ(registry.active_cheats(), 0u);
    EXPECT_FALSE(registry.spying());
}

TEST_F(SnapshotTest, restore_is_repeatable)
{
    auto const snapshot = snapshots.snapshot();
    for (int i = 0; i < 3; ++i) {
        bump();
        bump();
        EXPECT_EQ(counter(), Felt{2});
        snapshots.restore(snapshot);
        EXPECT_EQ(counter(), Felt{0});
    }
}

TEST_F(SnapshotTest, snapshots_are_independent)
{
    auto const zero = snapshots.snapshot();
    bump();
    auto const one = snapshots.snapshot();
    bump();

    snapshots.restore(zero);
    EXPECT_EQ(counter(), Felt{0});
    snapshots.restore(one);
    EXPECT_EQ(counter(), Felt{1});
    EXPECT_EQ(one->state.version(), 0u);

    // a discarded branch leaves earlier snapshots intact
    bump();
    snapshots.restore(zero);
    bump();
    EXPECT_EQ(counter(), Felt{1});
    snapshots.restore(one);
    bump();
    EXPECT_EQ(counter(), Felt{2});
}

TEST_F(SnapshotTest, deploy_salts_rewind)
{
    auto const snapshot = snapshots.snapshot();
    auto const first = state.next_deploy_salt();
    snapshots.restore(snapshot);
    EXPECT_EQ(state.next_deploy_salt(), first);
}
