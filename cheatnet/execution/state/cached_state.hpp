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
#include <cheatnet/execution/state/state_reader.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

/**
 * Mutable contract state of one run, layered over a StateReader.
 *
 * Reads look at local writes first, then at values already fetched from the
 * reader, and only then ask the reader (memoizing the answer). Writes never
 * reach the reader. push() opens a frame; while one is open every write
 * journals the value it replaces, pop_accept() hands the frame's journal to
 * its parent and pop_reject() replays it backwards.
 *
 * Copies share the reader and deep copy everything else.
 */
class CachedState
{
public:
    using ClassPtr = std::shared_ptr<CompiledClass const>;

private:
    template <typename K, typename V, typename H = FeltHash>
    using Map = ankerl::unordered_dense::segmented_map<K, V, H>;

    StateReader *reader_;

    // values seen from the reader
    Map<StorageSlot, Felt, StorageSlotHash> original_storage_{};
    Map<ContractAddress, Nonce> original_nonces_{};
    Map<ContractAddress, std::optional<ClassHash>> original_class_hashes_{};
    Map<ClassHash, ClassPtr> original_classes_{};

    // local writes
    Map<StorageSlot, Felt, StorageSlotHash> storage_{};
    Map<ContractAddress, Nonce> nonces_{};
    Map<ContractAddress, ClassHash> class_hashes_{};
    Map<ClassHash, ClassPtr> classes_{};
    uint64_t deploy_salt_{0};

    // empty `previous` means the key had no local write
    struct StorageWritten
    {
        StorageSlot slot;
        std::optional<Felt> previous;
    };

    struct NonceWritten
    {
        ContractAddress address;
        std::optional<Nonce> previous;
    };

    struct DeployedWritten
    {
        ContractAddress address;
        std::optional<ClassHash> previous;
    };

    struct ClassWritten
    {
        ClassHash class_hash;
        std::optional<ClassPtr> previous;
    };

    struct SaltDrawn
    {
        uint64_t previous;
    };

    using JournalEntry = std::variant<
        StorageWritten, NonceWritten, DeployedWritten, ClassWritten, SaltDrawn>;

    std::vector<JournalEntry> journal_{};
    // journal size at each open frame
    std::vector<size_t> checkpoints_{};

    template <typename Entry, typename Writes, typename Key>
    void journal(Writes const &, Key const &);

    void undo(JournalEntry &);

public:
    explicit CachedState(StateReader &);

    StateReader &reader()
    {
        return *reader_;
    }

    /// Number of open frames
    size_t version() const
    {
        return checkpoints_.size();
    }

    /// Unset storage reads as zero
    Result<Felt> get_storage(ContractAddress const &, StorageKey const &);

    void set_storage(
        ContractAddress const &, StorageKey const &, Felt const &value);

    /// Null when the class was never declared
    Result<ClassPtr> get_class(ClassHash const &);

    void set_class(ClassHash const &, ClassPtr);

    Result<Nonce> get_nonce(ContractAddress const &);

    Result<void> increment_nonce(ContractAddress const &);

    /// Empty when nothing is deployed at the address
    Result<std::optional<ClassHash>> get_class_hash_at(ContractAddress const &);

    void set_class_hash_at(ContractAddress const &, ClassHash const &);

    /// Distinct salt for every deploy that does not supply one
    Felt next_deploy_salt();

    void push();

    void pop_accept();

    void pop_reject();

    /// Compares local writes; values merely fetched from the reader are not
    /// part of the observable state
    friend bool operator==(CachedState const &, CachedState const &);
};

CHEATNET_NAMESPACE_END
