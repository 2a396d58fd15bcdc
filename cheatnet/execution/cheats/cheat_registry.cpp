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
#include <cheatnet/execution/cheats/cheat_registry.hpp>

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <utility>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

bool SpyFilter::matches(ContractAddress const &address) const
{
    return addresses.empty() ||
           std::find(addresses.begin(), addresses.end(), address) !=
               addresses.end();
}

uint64_t CheatRegistry::KeyHash::operator()(Key const &key) const noexcept
{
    unsigned char bytes[2 + sizeof(Felt) * 2];
    bytes[0] = static_cast<unsigned char>(key.kind);
    bytes[1] = static_cast<unsigned char>(key.scope.kind);
    std::memcpy(&bytes[2], &key.scope.address, sizeof(Felt));
    std::memcpy(&bytes[2 + sizeof(Felt)], &key.selector, sizeof(Felt));
    return ankerl::unordered_dense::detail::wyhash::hash(bytes, sizeof(bytes));
}

CheatRegistry::Key
CheatRegistry::key_for(Cheat const &cheat, CheatScope const &scope)
{
    Key key{.kind = kind_of(cheat), .scope = scope};
    if (auto const *const mock = std::get_if<MockedCall>(&cheat)) {
        key.selector = mock->selector;
    }
    return key;
}

Cheat const *CheatRegistry::find(
    CheatKind const kind, ContractAddress const &executing,
    EntryPointSelector const &selector) const
{
    if (cheats_.empty()) {
        return nullptr;
    }
    Key key{
        .kind = kind,
        .scope = CheatScope::target(executing),
        .selector = kind == CheatKind::MockCall ? selector : Felt{0}};
    if (auto const it = cheats_.find(key); it != cheats_.end()) {
        return &it->second.cheat;
    }
    key.scope = CheatScope::global();
    if (auto const it = cheats_.find(key); it != cheats_.end()) {
        return &it->second.cheat;
    }
    return nullptr;
}

void CheatRegistry::apply_cheat(
    CheatScope const &scope, Cheat cheat, CheatLifetime const lifetime)
{
    auto const key = key_for(cheat, scope);
    cheats_.insert_or_assign(
        key, Entry{.cheat = std::move(cheat), .lifetime = lifetime});
}

size_t CheatRegistry::cancel_cheat(
    CheatKind const kind, CheatScope const &scope,
    std::optional<EntryPointSelector> const &selector)
{
    if (kind != CheatKind::MockCall || selector.has_value()) {
        Key const key{
            .kind = kind, .scope = scope, .selector = selector.value_or(0)};
        return cheats_.erase(key);
    }
    std::vector<Key> removals;
    for (auto const &[key, entry] : cheats_) {
        if (key.kind == kind && key.scope == scope) {
            removals.push_back(key);
        }
    }
    for (auto const &key : removals) {
        cheats_.erase(key);
    }
    return removals.size();
}

void CheatRegistry::cancel_all_cheats()
{
    std::vector<Key> removals;
    for (auto const &[key, entry] : cheats_) {
        if (entry.lifetime == CheatLifetime::UntilCanceled) {
            removals.push_back(key);
        }
    }
    for (auto const &key : removals) {
        cheats_.erase(key);
    }
}

void CheatRegistry::start_spy(SpyFilter filter)
{
    spy_ = std::move(filter);
}

void CheatRegistry::stop_spy()
{
    spy_.reset();
}

void CheatRegistry::record_event(Event const &event)
{
    if (spy_.has_value() && spy_->matches(event.from_address)) {
        events_.push_back(event);
    }
}

std::vector<Event> CheatRegistry::take_events()
{
    return std::exchange(events_, {});
}

void CheatRegistry::start_message_collection()
{
    collecting_messages_ = true;
}

void CheatRegistry::stop_message_collection()
{
    collecting_messages_ = false;
}

void CheatRegistry::record_message(L2ToL1Message const &message)
{
    if (collecting_messages_) {
        messages_.push_back(message);
    }
}

std::vector<L2ToL1Message> CheatRegistry::take_l2_to_l1_messages()
{
    return std::exchange(messages_, {});
}

void CheatRegistry::rewind_captures(CaptureMark const &mark)
{
    CHEATNET_ASSERT(mark.events <= events_.size());
    CHEATNET_ASSERT(mark.messages <= messages_.size());
    events_.resize(mark.events);
    messages_.resize(mark.messages);
}

void CheatRegistry::enqueue_l1_handler(L1HandlerMessage message)
{
    l1_handlers_.push_back(std::move(message));
}

std::optional<L1HandlerMessage> CheatRegistry::pop_l1_handler()
{
    if (l1_handlers_.empty()) {
        return std::nullopt;
    }
    auto message = std::move(l1_handlers_.front());
    l1_handlers_.pop_front();
    return message;
}

bool operator==(CheatRegistry const &a, CheatRegistry const &b)
{
    if (a.cheats_.size() != b.cheats_.size()) {
        return false;
    }
    for (auto const &[key, entry] : a.cheats_) {
        auto const it = b.cheats_.find(key);
        if (it == b.cheats_.end() || !(it->second == entry)) {
            return false;
        }
    }
    return a.spy_ == b.spy_ && a.events_ == b.events_ &&
           a.collecting_messages_ == b.collecting_messages_ &&
           a.messages_ == b.messages_ && a.l1_handlers_ == b.l1_handlers_;
}

CHEATNET_NAMESPACE_END
