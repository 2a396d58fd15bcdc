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
#include <cheatnet/execution/cheats/cheat_registry.hpp>
#include <cheatnet/execution/state/cached_state.hpp>

#include <memory>

CHEATNET_NAMESPACE_BEGIN

struct SnapshotData
{
    CachedState state;
    CheatRegistry registry;
};

using Snapshot = std::shared_ptr<SnapshotData const>;

/**
 * Checkpoints the state and cheats of a run between operations.
 *
 * A snapshot is an immutable deep copy. Restoring copies it back into the
 * live objects, so a snapshot can be restored any number of times and
 * restoring one never affects another.
 */
class SnapshotManager
{
    CachedState &state_;
    CheatRegistry &registry_;

public:
    SnapshotManager(CachedState &, CheatRegistry &);

    Snapshot snapshot() const;

    void restore(Snapshot const &);
};

CHEATNET_NAMESPACE_END
