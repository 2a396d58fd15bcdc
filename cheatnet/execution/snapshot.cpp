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
#include <cheatnet/execution/cheats/cheat_registry.hpp>
#include <cheatnet/execution/snapshot.hpp>
#include <cheatnet/execution/state/cached_state.hpp>

#include <quill/Quill.h>

#include <memory>

CHEATNET_NAMESPACE_BEGIN

SnapshotManager::SnapshotManager(CachedState &state, CheatRegistry &registry)
    : state_{state}
    , registry_{registry}
{
}

Snapshot SnapshotManager::snapshot() const
{
    CHEATNET_ASSERT(state_.version() == 0, "snapshot inside an operation");
    return std::make_shared<SnapshotData const>(
        SnapshotData{.state = state_, .registry = registry_});
}

void SnapshotManager::restore(Snapshot const &snapshot)
{
    CHEATNET_ASSERT(snapshot != nullptr);
    CHEATNET_ASSERT(state_.version() == 0, "restore inside an operation");
    state_ = snapshot->state;
    registry_ = snapshot->registry;
    LOG_DEBUG(
        "restored snapshot with {} active cheats",
        registry_.active_cheats());
}

CHEATNET_NAMESPACE_END
