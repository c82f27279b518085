// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlServerType.hpp"
#include "SqlTemplateError.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <string>
#include <string_view>

class SqlConnection;

/// How a quote-close character that is part of an identifier is written inside the quotes.
enum class SqlQuoteEscapeRule : std::uint8_t
{
    /// The quote-close character cannot appear inside an identifier at all.
    DISALLOW,

    /// The quote-close character is written twice, as in SQL-92 delimited identifiers.
    DOUBLE,
};

/// Dialect rules for delimiting identifiers and for which identifiers are acceptable.
///
/// An identifier is accepted when it is non-empty, not longer than maxIdentifierLength (if non-zero),
/// and every character is an ASCII letter, an ASCII digit, '_' or one of extraNameCharacters.
/// Control characters and the statement terminator ';' are never accepted, whatever extraNameCharacters says.
/// The quote-close character is accepted only when listed in extraNameCharacters and escapeRule is DOUBLE.
struct SqlIdentifierQuoting
{
    char openQuote = '"';
    char closeQuote = '"';
    SqlQuoteEscapeRule escapeRule = SqlQuoteEscapeRule::DOUBLE;
    std::string extraNameCharacters;
    std::size_t maxIdentifierLength = 0;

    bool operator==(SqlIdentifierQuoting const&) const noexcept = default;

    /// Checks that the given raw identifier can be quoted safely under these rules.
    [[nodiscard]] SQLIDENT_API SqlTemplateResult<void> Validate(std::string_view identifier) const;

    /// Quotes an identifier that passed Validate().
    [[nodiscard]] SQLIDENT_API std::string Quote(std::string_view identifier) const;

    /// Quotes every identifier that passed Validate() and joins them with ", ".
    template <std::ranges::input_range Identifiers>
        requires std::convertible_to<std::ranges::range_reference_t<Identifiers>, std::string_view>
    [[nodiscard]] std::string QuoteList(Identifiers&& identifiers) const
    {
        std::string result;
        for (auto&& element: identifiers)
        {
            // The element may be a temporary string; view it only while it is alive.
            auto const identifier = std::string_view(element);
            if (!result.empty())
                result += ", ";
            result += Quote(identifier);
        }
        return result;
    }

    /// Built-in rules for the given server product.
    [[nodiscard]] SQLIDENT_API static SqlIdentifierQuoting const& ForServer(SqlServerType serverType) noexcept;

    /// Rules as reported by the driver behind the given connection.
    ///
    /// Fails with METADATA_UNAVAILABLE if the driver cannot be queried or does not support quoted identifiers.
    [[nodiscard]] SQLIDENT_API static SqlTemplateResult<SqlIdentifierQuoting> FromConnection(
        SqlConnection const& connection);
};
