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

#include <cheatnet/core/basic_formatter.hpp>
#include <cheatnet/core/config.hpp>
#include <cheatnet/core/felt.hpp>
#include <cheatnet/core/result.hpp>
#include <cheatnet/execution/errors/command_error.hpp>
#include <cheatnet/execution/state/provider_error.hpp>

#include <quill/bundled/fmt/format.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

CHEATNET_ANONYMOUS_NAMESPACE_BEGIN

bool is_printable(std::string const &s)
{
    if (s.empty()) {
        return false;
    }
    for (char const c : s) {
        if (c < 0x20 || c > 0x7e) {
            return false;
        }
    }
    return true;
}

CHEATNET_ANONYMOUS_NAMESPACE_END

CHEATNET_NAMESPACE_BEGIN

CommandError CommandError::unhandleable(std::string detail)
{
    return CommandError{
        .kind = CommandErrorKind::Unhandleable, .detail = std::move(detail)};
}

CommandError CommandError::artifacts_not_found(std::string contract_name)
{
    return CommandError{
        .kind = CommandErrorKind::ArtifactsNotFound,
        .detail = std::move(contract_name)};
}

CommandError
CommandError::fee_exceeded(uint64_t const estimate, uint64_t const max_fee)
{
    return CommandError{
        .kind = CommandErrorKind::FeeExceeded,
        .fee_estimate = estimate,
        .max_fee = max_fee};
}

CommandError CommandError::rejected()
{
    return CommandError{.kind = CommandErrorKind::TransactionRejected};
}

CommandError CommandError::reverted(std::string reason)
{
    return CommandError{
        .kind = CommandErrorKind::TransactionReverted,
        .detail = std::move(reason)};
}

CommandError
CommandError::provider_error(ProviderError const error, std::string data)
{
    return CommandError{
        .kind = CommandErrorKind::Provider,
        .provider = error,
        .detail = std::move(data)};
}

std::string CommandError::message() const
{
    switch (kind) {
    case CommandErrorKind::ArtifactsNotFound:
        return fmt::format(
            "Failed to find {} artifact in starknet_artifacts.json file. "
            "Please make sure you have specified correct package using "
            "`--package` flag and that you have enabled sierra and casm code "
            "generation in Scarb.toml",
            detail);
    case CommandErrorKind::FeeExceeded:
        return fmt::format(
            "Estimated fee {} exceeds the max fee {}",
            format_gas(fee_estimate),
            format_gas(max_fee));
    case CommandErrorKind::TransactionRejected:
        return "Transaction has been rejected";
    case CommandErrorKind::TransactionReverted:
        return fmt::format("Transaction has been reverted = {}", detail);
    case CommandErrorKind::Provider:
        if (detail.empty()) {
            return provider_error_message(provider);
        }
        return fmt::format("{} = {}", provider_error_message(provider), detail);
    case CommandErrorKind::Unhandleable:
        break;
    }
    return detail;
}

std::string provider_error_message(ProviderError const error)
{
    if (error == ProviderError::Success) {
        return "Unknown RPC error";
    }
    // the status code domain carries the message table
    return Result<void>::error_type{error}.message().c_str();
}

CommandError classify(Result<void>::error_type const &error)
{
    for (auto i = static_cast<int>(ProviderError::FailedToReceiveTransaction);
         i <= static_cast<int>(ProviderError::MalformedResponse);
         ++i) {
        auto const kind = static_cast<ProviderError>(i);
        if (error == kind) {
            return CommandError::provider_error(kind);
        }
    }
    return CommandError::unhandleable(error.message().c_str());
}

std::string format_revert_reason(std::vector<Felt> const &panic_data)
{
    std::string reason;
    for (auto const &word : panic_data) {
        if (!reason.empty()) {
            reason += ", ";
        }
        auto const text = short_string_from_felt(word);
        reason += is_printable(text) ? text : to_hex(word);
    }
    return reason;
}

std::string format_gas(uint64_t const centi)
{
    return fmt::format("{}.{:02}", centi / 100, centi % 100);
}

CHEATNET_NAMESPACE_END
