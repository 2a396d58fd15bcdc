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
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/contract/compiled_class.hpp>
#include <cheatnet/execution/state/cached_state.hpp>
#include <cheatnet/execution/state/state_reader.hpp>

#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

CHEATNET_ANONYMOUS_NAMESPACE_BEGIN

template <typename T>
bool same_value(T const &a, T const &b)
{
    return a == b;
}

template <typename T>
bool same_value(std::shared_ptr<T> const &a, std::shared_ptr<T> const &b)
{
    if (a == b) {
        return true;
    }
    return a && b && *a == *b;
}

template <typename Map>
bool same_writes(Map const &a, Map const &b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (auto const &[key, value] : a) {
        auto const it = b.find(key);
        if (it == b.end() || !same_value(value, it->second)) {
            return false;
        }
    }
    return true;
}

template <typename Map, typename Key, typename Value>
void restore(Map &map, Key const &key, std::optional<Value> &previous)
{
    if (previous.has_value()) {
        map.insert_or_assign(key, std::move(*previous));
    }
    else {
        map.erase(key);
    }
}

CHEATNET_ANONYMOUS_NAMESPACE_END

CHEATNET_NAMESPACE_BEGIN

CachedState::CachedState(StateReader &reader)
    : reader_{&reader}
{
}

template <typename Entry, typename Writes, typename Key>
void CachedState::journal(Writes const &map, Key const &key)
{
    if (checkpoints_.empty()) {
        return;
    }
    std::optional<typename Writes::mapped_type> previous;
    if (auto const it = map.find(key); it != map.end()) {
        previous = it->second;
    }
    journal_.emplace_back(Entry{key, std::move(previous)});
}

void CachedState::undo(JournalEntry &entry)
{
    std::visit(
        [this](auto &e) {
            using E = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<E, StorageWritten>) {
                restore(storage_, e.slot, e.previous);
            }
            else if constexpr (std::is_same_v<E, NonceWritten>) {
                restore(nonces_, e.address, e.previous);
            }
            else if constexpr (std::is_same_v<E, DeployedWritten>) {
                restore(class_hashes_, e.address, e.previous);
            }
            else if constexpr (std::is_same_v<E, ClassWritten>) {
                restore(classes_, e.class_hash, e.previous);
            }
            else {
                static_assert(std::is_same_v<E, SaltDrawn>);
                deploy_salt_ = e.previous;
            }
        },
        entry);
}

Result<Felt>
CachedState::get_storage(ContractAddress const &address, StorageKey const &key)
{
    StorageSlot const slot{address, key};
    if (auto const it = storage_.find(slot); it != storage_.end()) {
        return it->second;
    }
    if (auto const it = original_storage_.find(slot);
        it != original_storage_.end()) {
        return it->second;
    }
    BOOST_OUTCOME_TRY(auto const value, reader_->read_storage(address, key));
    Felt const felt = value.value_or(Felt{0});
    original_storage_.emplace(slot, felt);
    return felt;
}

void CachedState::set_storage(
    ContractAddress const &address, StorageKey const &key, Felt const &value)
{
    StorageSlot const slot{address, key};
    journal<StorageWritten>(storage_, slot);
    storage_.insert_or_assign(slot, value);
}

Result<CachedState::ClassPtr>
CachedState::get_class(ClassHash const &class_hash)
{
    if (auto const it = classes_.find(class_hash); it != classes_.end()) {
        return it->second;
    }
    if (auto const it = original_classes_.find(class_hash);
        it != original_classes_.end()) {
        return it->second;
    }
    BOOST_OUTCOME_TRY(auto cls, reader_->read_class(class_hash));
    original_classes_.emplace(class_hash, cls);
    return cls;
}

void CachedState::set_class(ClassHash const &class_hash, ClassPtr cls)
{
    CHEATNET_ASSERT(cls);
    journal<ClassWritten>(classes_, class_hash);
    classes_.insert_or_assign(class_hash, std::move(cls));
}

Result<Nonce> CachedState::get_nonce(ContractAddress const &address)
{
    if (auto const it = nonces_.find(address); it != nonces_.end()) {
        return it->second;
    }
    if (auto const it = original_nonces_.find(address);
        it != original_nonces_.end()) {
        return it->second;
    }
    BOOST_OUTCOME_TRY(auto const value, reader_->read_nonce(address));
    Nonce const nonce = value.value_or(Nonce{0});
    original_nonces_.emplace(address, nonce);
    return nonce;
}

Result<void> CachedState::increment_nonce(ContractAddress const &address)
{
    BOOST_OUTCOME_TRY(auto const nonce, get_nonce(address));
    journal<NonceWritten>(nonces_, address);
    nonces_.insert_or_assign(address, nonce + 1);
    return outcome::success();
}

Result<std::optional<ClassHash>>
CachedState::get_class_hash_at(ContractAddress const &address)
{
    if (auto const it = class_hashes_.find(address); it != class_hashes_.end()) {
        return std::optional<ClassHash>{it->second};
    }
    if (auto const it = original_class_hashes_.find(address);
        it != original_class_hashes_.end()) {
        return it->second;
    }
    BOOST_OUTCOME_TRY(auto const value, reader_->read_class_hash_at(address));
    original_class_hashes_.emplace(address, value);
    return value;
}

void CachedState::set_class_hash_at(
    ContractAddress const &address, ClassHash const &class_hash)
{
    journal<DeployedWritten>(class_hashes_, address);
    class_hashes_.insert_or_assign(address, class_hash);
}

Felt CachedState::next_deploy_salt()
{
    if (!checkpoints_.empty()) {
        journal_.emplace_back(SaltDrawn{deploy_salt_});
    }
    return Felt{deploy_salt_++};
}

void CachedState::push()
{
    checkpoints_.push_back(journal_.size());
}

void CachedState::pop_accept()
{
    CHEATNET_ASSERT(!checkpoints_.empty());

    checkpoints_.pop_back();
    // nothing above the outermost frame can roll back anymore
    if (checkpoints_.empty()) {
        journal_.clear();
    }
}

void CachedState::pop_reject()
{
    CHEATNET_ASSERT(!checkpoints_.empty());

    auto const mark = checkpoints_.back();
    checkpoints_.pop_back();
    while (journal_.size() > mark) {
        undo(journal_.back());
        journal_.pop_back();
    }
}

bool operator==(CachedState const &a, CachedState const &b)
{
    return same_writes(a.storage_, b.storage_) &&
           same_writes(a.nonces_, b.nonces_) &&
           same_writes(a.class_hashes_, b.class_hashes_) &&
           same_writes(a.classes_, b.classes_) &&
           a.deploy_salt_ == b.deploy_salt_;
}

CHEATNET_NAMESPACE_END
