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

#include <cheatnet/execution/state/provider_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<cheatnet::ProviderError>::mapping> const &
quick_status_code_from_enum<cheatnet::ProviderError>::value_mappings()
{
    using cheatnet::ProviderError;

    static std::initializer_list<mapping> const v = {
        {ProviderError::Success, "success", {errc::success}},
        {ProviderError::FailedToReceiveTransaction,
         "Node failed to receive transaction",
         {}},
        {ProviderError::ContractNotFound,
         "There is no contract at the specified address",
         {}},
        {ProviderError::BlockNotFound, "Block was not found", {}},
        {ProviderError::TransactionHashNotFound,
         "Transaction with provided hash was not found (does not exist)",
         {}},
        {ProviderError::InvalidTransactionIndex,
         "There is no transaction with such an index",
         {}},
        {ProviderError::ClassHashNotFound,
         "Provided class hash does not exist",
         {}},
        {ProviderError::ContractError,
         "An error occurred in the called contract",
         {}},
        {ProviderError::InvalidTransactionNonce,
         "Invalid transaction nonce",
         {}},
        {ProviderError::InsufficientMaxFee,
         "Max fee is smaller than the minimal transaction cost",
         {}},
        {ProviderError::InsufficientAccountBalance,
         "Account balance is too small to cover transaction fee",
         {}},
        {ProviderError::ClassAlreadyDeclared,
         "Contract with the same class hash is already declared",
         {}},
        {ProviderError::TransactionExecutionError,
         "Transaction execution error",
         {}},
        {ProviderError::ValidationFailure, "Contract failed the validation", {}},
        {ProviderError::CompilationFailed,
         "Contract failed to compile in starknet",
         {}},
        {ProviderError::ContractClassSizeIsTooLarge,
         "Contract class size is too large",
         {}},
        {ProviderError::NonAccount, "No account", {}},
        {ProviderError::DuplicateTx, "Transaction already exists", {}},
        {ProviderError::CompiledClassHashMismatch,
         "Compiled class hash mismatch",
         {}},
        {ProviderError::UnsupportedTxVersion,
         "Unsupported transaction version",
         {}},
        {ProviderError::UnsupportedContractClassVersion,
         "Unsupported contract class version",
         {}},
        {ProviderError::Unknown, "Unknown RPC error", {}},
        {ProviderError::RequestFailed, "Failed to reach the node", {}},
        {ProviderError::MalformedResponse,
         "Node returned a malformed response",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
