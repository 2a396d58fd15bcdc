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
#include <cheatnet/execution/contract/compiled_class.hpp>
#include <cheatnet/execution/state/provider.hpp>
#include <cheatnet/execution/state/state_reader.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <memory>
#include <optional>

CHEATNET_NAMESPACE_BEGIN

/**
 * Read only view of a remote chain pinned to one block. Every entity is
 * fetched at most once: found and not found results are both cached, failed
 * requests are not, so a later read retries the fetch.
 */
class ForkStateReader final : public StateReader
{
    template <typename K, typename V, typename H = FeltHash>
    using Map = ankerl::unordered_dense::segmented_map<K, V, H>;

    Provider &provider_;
    BlockId const block_id_;

    Map<StorageSlot, std::optional<Felt>, StorageSlotHash> storage_{};
    Map<ContractAddress, std::optional<Nonce>> nonces_{};
    Map<ContractAddress, std::optional<ClassHash>> class_hashes_{};
    Map<ClassHash, std::shared_ptr<CompiledClass const>> classes_{};
    std::optional<BlockInfo> block_info_{};

    uint64_t requests_{0};

public:
    ForkStateReader(Provider &, BlockId);

    ForkStateReader(ForkStateReader &&) = delete;
    ForkStateReader(ForkStateReader const &) = delete;
    ForkStateReader &operator=(ForkStateReader &&) = delete;
    ForkStateReader &operator=(ForkStateReader const &) = delete;

    BlockId const &block_id() const
    {
        return block_id_;
    }

    /// Number of requests issued to the provider so far
    uint64_t request_count() const
    {
        return requests_;
    }

    Result<BlockInfo> read_block_info();

    Result<std::optional<Felt>>
    read_storage(ContractAddress const &, StorageKey const &) override;

    Result<std::optional<Nonce>> read_nonce(ContractAddress const &) override;

    Result<std::optional<ClassHash>>
    read_class_hash_at(ContractAddress const &) override;

    Result<std::shared_ptr<CompiledClass const>>
    read_class(ClassHash const &) override;
};

CHEATNET_NAMESPACE_END
