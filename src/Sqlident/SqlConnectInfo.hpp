// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <chrono>
#include <format>
#include <map>
#include <string>
#include <string_view>

/// Represents an ODBC connection string.
struct SqlConnectionString
{
    std::string value;

    SQLIDENT_API auto operator<=>(SqlConnectionString const&) const noexcept = default;

    /// Returns the connection string with any password value masked.
    [[nodiscard]] SQLIDENT_API std::string Sanitized() const;

    SQLIDENT_API static std::string SanitizePwd(std::string_view input);
};

using SqlConnectionStringMap = std::map<std::string, std::string>;

/// Parses an ODBC connection string into a map of upper-cased keys to values.
SQLIDENT_API SqlConnectionStringMap ParseConnectionString(SqlConnectionString const& connectionString);

/// Builds an ODBC connection string from a map.
SQLIDENT_API SqlConnectionString BuildConnectionString(SqlConnectionStringMap const& map);

/// Represents a connection data source as a DSN, username, password, and timeout.
struct SqlConnectionDataSource
{
    std::string datasource;
    std::string username;
    std::string password;
    std::chrono::seconds timeout { 5 };

    [[nodiscard]] SqlConnectionString ToConnectionString() const
    {
        return SqlConnectionString { .value = std::format("DSN={};UID={};PWD={};TIMEOUT={}",
                                                          datasource,
                                                          username,
                                                          password,
                                                          timeout.count()) };
    }

    SQLIDENT_API auto operator<=>(SqlConnectionDataSource const&) const noexcept = default;
};
