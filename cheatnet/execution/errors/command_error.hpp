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
#include <cheatnet/execution/state/provider_error.hpp>

#include <boost/outcome/basic_result.hpp>
#include <boost/outcome/policy/terminate.hpp>

#include <cstdint>
#include <string>
#include <vector>

CHEATNET_NAMESPACE_BEGIN

enum class CommandErrorKind : uint8_t
{
    Unhandleable = 0,
    ArtifactsNotFound,
    FeeExceeded,
    TransactionRejected,
    TransactionReverted,
    Provider,
};

/// Closed taxonomy of everything a dispatcher operation can fail with
struct CommandError
{
    CommandErrorKind kind{CommandErrorKind::Unhandleable};
    ProviderError provider{ProviderError::Unknown};
    /// contract name, revert reason, error data sent by the node or
    /// unhandleable detail
    std::string detail{};
    uint64_t fee_estimate{0};
    uint64_t max_fee{0};

    static CommandError unhandleable(std::string detail);
    static CommandError artifacts_not_found(std::string contract_name);
    /// Both amounts in hundredths of a gas unit
    static CommandError fee_exceeded(uint64_t estimate, uint64_t max_fee);
    static CommandError rejected();
    static CommandError reverted(std::string reason);
    static CommandError provider_error(ProviderError, std::string data = {});

    std::string message() const;

    friend bool operator==(CommandError const &, CommandError const &) = default;
};

template <typename T>
using CommandResult =
    outcome::basic_result<T, CommandError, outcome::policy::terminate>;

/// Fixed message of a provider error; unlisted kinds read "Unknown RPC error"
std::string provider_error_message(ProviderError);

/// Collapses a library error into the taxonomy: provider errors keep their
/// kind, anything else becomes Unhandleable with the error message
CommandError classify(Result<void>::error_type const &);

/// Renders panic data, printable short strings as text and the rest as hex
std::string format_revert_reason(std::vector<Felt> const &panic_data);

std::string format_gas(uint64_t centi);

CHEATNET_NAMESPACE_END
