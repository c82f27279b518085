// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <format>
#include <string_view>

/// The database server product behind an ODBC connection.
enum class SqlServerType : std::uint8_t
{
    UNKNOWN,
    MICROSOFT_SQL,
    POSTGRESQL,
    ORACLE,
    SQLITE,
    MYSQL,
};

/// Product name as servers report it in SQL_DBMS_NAME.
constexpr std::string_view ProductName(SqlServerType type) noexcept
{
    using namespace std::string_view_literals;
    switch (type)
    {
        case SqlServerType::MICROSOFT_SQL:
            return "Microsoft SQL Server"sv;
        case SqlServerType::POSTGRESQL:
            return "PostgreSQL"sv;
        case SqlServerType::ORACLE:
            return "Oracle"sv;
        case SqlServerType::SQLITE:
            return "SQLite"sv;
        case SqlServerType::MYSQL:
            return "MySQL"sv;
        case SqlServerType::UNKNOWN:
            break;
    }
    return "Unknown"sv;
}

template <>
struct std::formatter<SqlServerType>: std::formatter<std::string_view>
{
    auto format(SqlServerType type, format_context& ctx) const -> format_context::iterator
    {
        return std::formatter<std::string_view>::format(ProductName(type), ctx);
    }
};
