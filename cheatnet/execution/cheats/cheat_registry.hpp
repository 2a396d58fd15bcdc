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

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

struct CallerOverride
{
    ContractAddress caller{};

    friend bool operator==(CallerOverride const &, CallerOverride const &) =
        default;
};

/// Unset fields fall through to the real block info
struct BlockInfoOverride
{
    std::optional<uint64_t> block_number{};
    std::optional<uint64_t> block_timestamp{};
    std::optional<ContractAddress> sequencer_address{};

    friend bool
    operator==(BlockInfoOverride const &, BlockInfoOverride const &) = default;
};

/// Runs the contract with the code of another declared class
struct BytecodeOverride
{
    ClassHash class_hash{};

    friend bool
    operator==(BytecodeOverride const &, BytecodeOverride const &) = default;
};

struct MockedCall
{
    EntryPointSelector selector{};
    std::vector<Felt> ret_data{};

    friend bool operator==(MockedCall const &, MockedCall const &) = default;
};

using Cheat =
    std::variant<CallerOverride, BlockInfoOverride, BytecodeOverride, MockedCall>;

/// Indexes match the alternatives of Cheat
enum class CheatKind : uint8_t
{
    Caller = 0,
    BlockInfo,
    Bytecode,
    MockCall,
};

inline CheatKind kind_of(Cheat const &cheat)
{
    return static_cast<CheatKind>(cheat.index());
}

template <typename T>
inline constexpr CheatKind cheat_kind_v = [] {
    if constexpr (std::is_same_v<T, CallerOverride>) {
        return CheatKind::Caller;
    }
    else if constexpr (std::is_same_v<T, BlockInfoOverride>) {
        return CheatKind::BlockInfo;
    }
    else if constexpr (std::is_same_v<T, BytecodeOverride>) {
        return CheatKind::Bytecode;
    }
    else {
        static_assert(std::is_same_v<T, MockedCall>);
        return CheatKind::MockCall;
    }
}();

enum class ScopeKind : uint8_t
{
    Target = 0,
    Global,
};

struct CheatScope
{
    ScopeKind kind{ScopeKind::Global};
    ContractAddress address{};

    static CheatScope global()
    {
        return CheatScope{};
    }

    static CheatScope target(ContractAddress const &address)
    {
        return CheatScope{.kind = ScopeKind::Target, .address = address};
    }

    friend bool operator==(CheatScope const &, CheatScope const &) = default;
};

enum class CheatLifetime : uint8_t
{
    UntilCanceled = 0,
    Indefinite,
};

struct Event
{
    ContractAddress from_address{};
    std::vector<Felt> keys{};
    std::vector<Felt> data{};

    friend bool operator==(Event const &, Event const &) = default;
};

struct L2ToL1Message
{
    ContractAddress from_address{};
    Felt to_address{};
    std::vector<Felt> payload{};

    friend bool operator==(L2ToL1Message const &, L2ToL1Message const &) =
        default;
};

struct L1HandlerMessage
{
    ContractAddress target{};
    EntryPointSelector selector{};
    Felt from_address{};
    std::vector<Felt> payload{};

    friend bool operator==(L1HandlerMessage const &, L1HandlerMessage const &) =
        default;
};

/// Empty address list captures every emitter
struct SpyFilter
{
    std::vector<ContractAddress> addresses{};

    bool matches(ContractAddress const &) const;

    friend bool operator==(SpyFilter const &, SpyFilter const &) = default;
};

/**
 * Overrides and capture buffers of one run.
 *
 * Cheats are keyed by (kind, scope) plus the selector for mocked calls. A
 * lookup for the executing contract C tries Target(C) first, then Global.
 */
class CheatRegistry
{
    struct Key
    {
        CheatKind kind{};
        CheatScope scope{};
        EntryPointSelector selector{};

        friend bool operator==(Key const &, Key const &) = default;
    };

    struct KeyHash
    {
        using is_avalanching = void;

        uint64_t operator()(Key const &) const noexcept;
    };

    struct Entry
    {
        Cheat cheat;
        CheatLifetime lifetime{CheatLifetime::UntilCanceled};

        friend bool operator==(Entry const &, Entry const &) = default;
    };

    ankerl::unordered_dense::segmented_map<Key, Entry, KeyHash> cheats_{};

    std::optional<SpyFilter> spy_{};
    std::vector<Event> events_{};

    bool collecting_messages_{false};
    std::vector<L2ToL1Message> messages_{};

    std::deque<L1HandlerMessage> l1_handlers_{};

    static Key key_for(Cheat const &, CheatScope const &);

    Cheat const *find(
        CheatKind, ContractAddress const &executing,
        EntryPointSelector const &selector) const;

public:
    /// Re-applying the same kind and scope overwrites the previous value
    void apply_cheat(
        CheatScope const &, Cheat,
        CheatLifetime = CheatLifetime::UntilCanceled);

    /// Removes the cheat of that kind and scope whatever its lifetime. For
    /// mocked calls an empty selector removes every mock of the scope.
    /// Returns the number of entries removed.
    size_t cancel_cheat(
        CheatKind, CheatScope const &,
        std::optional<EntryPointSelector> const &selector = std::nullopt);

    /// Removes every UntilCanceled cheat; Indefinite ones stay
    void cancel_all_cheats();

    size_t active_cheats() const
    {
        return cheats_.size();
    }

    template <typename T>
    T const *lookup(
        ContractAddress const &executing,
        EntryPointSelector const &selector = {}) const
    {
        auto const *const cheat = find(cheat_kind_v<T>, executing, selector);
        return cheat ? std::get_if<T>(cheat) : nullptr;
    }

    void start_spy(SpyFilter = {});
    void stop_spy();

    bool spying() const
    {
        return spy_.has_value();
    }

    /// Appends the event if spying and the filter accepts its emitter
    void record_event(Event const &);

    std::vector<Event> const &events() const
    {
        return events_;
    }

    std::vector<Event> take_events();

    void start_message_collection();
    void stop_message_collection();

    void record_message(L2ToL1Message const &);

    std::vector<L2ToL1Message> const &l2_to_l1_messages() const
    {
        return messages_;
    }

    std::vector<L2ToL1Message> take_l2_to_l1_messages();

    /// Capture buffer sizes. Recording events and messages is the only
    /// mutation an operation makes, so rewinding to a mark undoes it.
    struct CaptureMark
    {
        size_t events{0};
        size_t messages{0};
    };

    CaptureMark capture_mark() const
    {
        return {events_.size(), messages_.size()};
    }

    void rewind_captures(CaptureMark const &);

    void enqueue_l1_handler(L1HandlerMessage);

    std::optional<L1HandlerMessage> pop_l1_handler();

    size_t pending_l1_handlers() const
    {
        return l1_handlers_.size();
    }

    friend bool operator==(CheatRegistry const &, CheatRegistry const &);
};

CHEATNET_NAMESPACE_END
