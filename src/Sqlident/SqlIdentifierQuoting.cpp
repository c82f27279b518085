// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"
#include "SqlIdentifierQuoting.hpp"

#include <algorithm>
#include <format>

namespace
{

constexpr bool IsAsciiAlphaNumeric(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

constexpr bool IsControlCharacter(char c) noexcept
{
    auto const byte = static_cast<unsigned char>(c);
    return byte < 0x20 || byte == 0x7F;
}

std::string DescribeCharacter(char c)
{
    auto const byte = static_cast<unsigned char>(c);
    if (IsControlCharacter(c) || byte >= 0x80)
        return std::format("byte 0x{:02X}", byte);
    return std::format("character '{}'", c);
}

} // namespace

SqlTemplateResult<void> SqlIdentifierQuoting::Validate(std::string_view identifier) const
{
    if (identifier.empty())
        return std::unexpected { SqlTemplateError::InvalidIdentifier({}, "identifier is empty") };

    if (maxIdentifierLength != 0 && identifier.size() > maxIdentifierLength)
        return std::unexpected { SqlTemplateError::InvalidIdentifier(
            std::string(identifier),
            std::format("identifier exceeds the maximum length of {} characters", maxIdentifierLength)) };

    for (char const c: identifier)
    {
        if (IsAsciiAlphaNumeric(c) || c == '_')
            continue;

        if (IsControlCharacter(c) || c == ';')
            return std::unexpected { SqlTemplateError::InvalidIdentifier(
                std::string(identifier), std::format("{} is not allowed", DescribeCharacter(c))) };

        if (c == closeQuote && escapeRule == SqlQuoteEscapeRule::DISALLOW)
            return std::unexpected { SqlTemplateError::InvalidIdentifier(
                std::string(identifier), std::format("quote character '{}' cannot be escaped", c)) };

        if (static_cast<unsigned char>(c) >= 0x80 || !extraNameCharacters.contains(c))
            return std::unexpected { SqlTemplateError::InvalidIdentifier(
                std::string(identifier), std::format("{} is not an identifier character", DescribeCharacter(c))) };
    }

    return {};
}

std::string SqlIdentifierQuoting::Quote(std::string_view identifier) const
{
    std::string result;
    result.reserve(identifier.size() + 2);
    result += openQuote;
    for (char const c: identifier)
    {
        if (c == closeQuote)
            result += closeQuote;
        result += c;
    }
    result += closeQuote;
    return result;
}

SqlIdentifierQuoting const& SqlIdentifierQuoting::ForServer(SqlServerType serverType) noexcept
{
    // clang-format off
    static SqlIdentifierQuoting const ansi { .openQuote = '"', .closeQuote = '"', .escapeRule = SqlQuoteEscapeRule::DOUBLE, .extraNameCharacters = "", .maxIdentifierLength = 0 };
    static SqlIdentifierQuoting const sqlite { .openQuote = '"', .closeQuote = '"', .escapeRule = SqlQuoteEscapeRule::DOUBLE, .extraNameCharacters = "$", .maxIdentifierLength = 0 };
    static SqlIdentifierQuoting const postgres { .openQuote = '"', .closeQuote = '"', .escapeRule = SqlQuoteEscapeRule::DOUBLE, .extraNameCharacters = "$", .maxIdentifierLength = 63 };
    static SqlIdentifierQuoting const sqlServer { .openQuote = '[', .closeQuote = ']', .escapeRule = SqlQuoteEscapeRule::DOUBLE, .extraNameCharacters = "@#$", .maxIdentifierLength = 128 };
    static SqlIdentifierQuoting const mysql { .openQuote = '`', .closeQuote = '`', .escapeRule = SqlQuoteEscapeRule::DOUBLE, .extraNameCharacters = "$", .maxIdentifierLength = 64 };
    static SqlIdentifierQuoting const oracle { .openQuote = '"', .closeQuote = '"', .escapeRule = SqlQuoteEscapeRule::DISALLOW, .extraNameCharacters = "$#", .maxIdentifierLength = 128 };
    // clang-format on

    switch (serverType)
    {
        case SqlServerType::SQLITE:
            return sqlite;
        case SqlServerType::POSTGRESQL:
            return postgres;
        case SqlServerType::MICROSOFT_SQL:
            return sqlServer;
        case SqlServerType::MYSQL:
            return mysql;
        case SqlServerType::ORACLE:
            return oracle;
        case SqlServerType::UNKNOWN:
            break;
    }
    return ansi;
}

SqlTemplateResult<SqlIdentifierQuoting> SqlIdentifierQuoting::FromConnection(SqlConnection const& connection)
{
    if (!connection.IsAlive())
        return std::unexpected { SqlTemplateError::MetadataUnavailable("connection is not open") };

    // The escape rule is not exposed through ODBC, so it comes from the server product.
    auto quoting = ForServer(connection.ServerType());

    try
    {
        auto const quoteString = connection.IdentifierQuoteChar();
        if (quoteString.empty() || quoteString == " ")
            return std::unexpected { SqlTemplateError::MetadataUnavailable(
                std::format("driver for {} does not support quoted identifiers", connection.ServerType())) };

        if (quoteString.size() != 1)
            return std::unexpected { SqlTemplateError::MetadataUnavailable(
                std::format("unsupported identifier quote string \"{}\"", quoteString)) };

        quoting.openQuote = quoteString.front();
        quoting.closeQuote = quoteString.front();
        if (quoting.openQuote == '[')
            quoting.closeQuote = ']';

        for (char const c: connection.SpecialCharacters())
            if (!quoting.extraNameCharacters.contains(c))
                quoting.extraNameCharacters += c;

        if (auto const maxLength = connection.MaxColumnNameLength(); maxLength != 0)
            quoting.maxIdentifierLength = maxLength;
    }
    catch (SqlException const& e)
    {
        return std::unexpected { SqlTemplateError::MetadataUnavailable("driver metadata query failed", e.info()) };
    }

    return quoting;
}
