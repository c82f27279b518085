// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlConnectInfo.hpp"
#include "SqlError.hpp"
#include "SqlIdentifierQuoting.hpp"
#include "SqlLogger.hpp"
#include "SqlServerType.hpp"
#include "SqlTemplateError.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <source_location>
#include <string>

#include <sql.h>
#include <sqlext.h>
#include <sqlspi.h>
#include <sqltypes.h>

/// An ODBC connection, owning its environment and connection handles.
///
/// Besides running statements, the connection is where the identifier pipeline gets its
/// quoting metadata from (see IdentifierQuoting()).
class SQLIDENT_API SqlConnection final
{
  public:
    /// Connects to DefaultConnectionString(). On failure the connection stays closed and
    /// LastError() tells why.
    SqlConnection();

    /// Connects to the given connection string, or stays closed if none is given.
    explicit SqlConnection(std::optional<SqlConnectionString> connectionString);

    SqlConnection(SqlConnection&& /*other*/) noexcept;
    SqlConnection& operator=(SqlConnection&& /*other*/) noexcept;
    SqlConnection(SqlConnection const& /*other*/) = delete;
    SqlConnection& operator=(SqlConnection const& /*other*/) = delete;
    ~SqlConnection() noexcept;

    static SqlConnectionString const& DefaultConnectionString() noexcept;
    static void SetDefaultConnectionString(SqlConnectionString const& connectionString) noexcept;

    /// Installs a callback that runs right after every successful connect.
    static void SetPostConnectedHook(std::function<void(SqlConnection&)> hook);

    /// Process-unique number of this connection. Moving a connection keeps its number.
    [[nodiscard]] uint64_t ConnectionId() const noexcept
    {
        return m_connectionId;
    }

    bool Connect(SqlConnectionDataSource const& dataSource) noexcept;
    bool Connect(SqlConnectionString connectionString) noexcept;

    /// Disconnects and releases the handles. Safe to call more than once.
    void Close() noexcept;

    [[nodiscard]] bool IsAlive() const noexcept;

    [[nodiscard]] SqlConnectionString const& ConnectionString() const noexcept
    {
        return m_connectionString;
    }

    [[nodiscard]] SqlErrorInfo LastError() const;

    // {{{ driver metadata (SQLGetInfo); these throw SqlException on failure

    /// SQL_DBMS_NAME, e.g. "PostgreSQL".
    [[nodiscard]] std::string ServerName() const;

    /// SQL_DBMS_VER.
    [[nodiscard]] std::string ServerVersion() const;

    /// SQL_DATABASE_NAME: the current database or catalog.
    [[nodiscard]] std::string DatabaseName() const;

    /// SQL_USER_NAME: the user as known to the database, which may differ from the login name.
    [[nodiscard]] std::string UserName() const;

    /// The server product, detected from ServerName() on connect.
    [[nodiscard]] SqlServerType ServerType() const noexcept
    {
        return m_serverType;
    }

    /// SQL_IDENTIFIER_QUOTE_CHAR. A single space means quoted identifiers are not supported.
    [[nodiscard]] std::string IdentifierQuoteChar() const;

    /// SQL_SPECIAL_CHARACTERS: characters other than letters, digits and underscore allowed in names.
    [[nodiscard]] std::string SpecialCharacters() const;

    /// SQL_MAX_COLUMN_NAME_LEN, 0 when the driver sets no limit.
    [[nodiscard]] std::size_t MaxColumnNameLength() const;

    // }}}

    /// Quoting rules for this server, with the driver's metadata taking precedence over the
    /// built-in dialect table.
    [[nodiscard]] SqlTemplateResult<SqlIdentifierQuoting> IdentifierQuoting() const
    {
        return SqlIdentifierQuoting::FromConnection(*this);
    }

    [[nodiscard]] SQLHDBC NativeHandle() const noexcept
    {
        return m_hDbc;
    }

    /// Throws SqlException carrying LastError() unless the given ODBC result denotes success.
    void RequireSuccess(SQLRETURN sqlResult,
                        std::source_location sourceLocation = std::source_location::current()) const;

  private:
    bool ConnectionEstablished(SQLRETURN sqlResult);
    [[nodiscard]] std::string GetInfoString(SQLUSMALLINT infoType, std::source_location sourceLocation) const;

    SQLHENV m_hEnv {};
    SQLHDBC m_hDbc {};
    uint64_t m_connectionId;
    SqlServerType m_serverType = SqlServerType::UNKNOWN;
    SqlConnectionString m_connectionString;
};
