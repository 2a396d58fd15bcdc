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
#include <cheatnet/execution/contract/compiled_class.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <memory>
#include <optional>

CHEATNET_NAMESPACE_BEGIN

struct StorageSlot
{
    ContractAddress address{};
    StorageKey key{};

    friend bool operator==(StorageSlot const &, StorageSlot const &) = default;
};

static_assert(sizeof(StorageSlot) == 64);

struct StorageSlotHash
{
    using is_avalanching = void;

    uint64_t operator()(StorageSlot const &slot) const noexcept
    {
        return ankerl::unordered_dense::detail::wyhash::hash(
            &slot, sizeof(slot));
    }
};

/**
 * Source of committed contract state underneath a CachedState. An empty
 * optional (or a null class pointer) means the entity does not exist; an
 * error means the read itself failed and may be retried.
 */
struct StateReader
{
    virtual ~StateReader() = default;

    virtual Result<std::optional<Felt>>
    read_storage(ContractAddress const &, StorageKey const &) = 0;

    virtual Result<std::optional<Nonce>> read_nonce(ContractAddress const &) = 0;

    virtual Result<std::optional<ClassHash>>
    read_class_hash_at(ContractAddress const &) = 0;

    virtual Result<std::shared_ptr<CompiledClass const>>
    read_class(ClassHash const &) = 0;
};

/// In memory reader used for local (non fork) runs
class DictStateReader final : public StateReader
{
    template <typename K, typename V, typename H = FeltHash>
    using Map = ankerl::unordered_dense::segmented_map<K, V, H>;

    Map<StorageSlot, Felt, StorageSlotHash> storage_{};
    Map<ContractAddress, Nonce> nonces_{};
    Map<ContractAddress, ClassHash> class_hashes_{};
    Map<ClassHash, std::shared_ptr<CompiledClass const>> classes_{};

public:
    void insert_storage(
        ContractAddress const &, StorageKey const &, Felt const &value);
    void insert_nonce(ContractAddress const &, Nonce const &);
    void insert_contract(ContractAddress const &, ClassHash const &);
    void insert_class(ClassHash const &, CompiledClass);

    Result<std::optional<Felt>>
    read_storage(ContractAddress const &, StorageKey const &) override;

    Result<std::optional<Nonce>> read_nonce(ContractAddress const &) override;

    Result<std::optional<ClassHash>>
    read_class_hash_at(ContractAddress const &) override;

    Result<std::shared_ptr<CompiledClass const>>
    read_class(ClassHash const &) override;
};

CHEATNET_NAMESPACE_END
