// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"

#include <array>
#include <atomic>
#include <string_view>
#include <utility>

using namespace std::string_view_literals;

namespace
{

SqlConnectionString gDefaultConnectionString {};
std::atomic<uint64_t> gNextConnectionId { 1 };
std::function<void(SqlConnection&)> gPostConnectedHook {};

SqlServerType DetectServerType(std::string_view dbmsName) noexcept
{
    constexpr auto knownTypes = std::array {
        SqlServerType::MICROSOFT_SQL,
        SqlServerType::POSTGRESQL,
        SqlServerType::ORACLE,
        SqlServerType::SQLITE,
        SqlServerType::MYSQL,
    };

    for (auto const type: knownTypes)
        if (dbmsName.contains(ProductName(type)))
            return type;

    // MariaDB speaks the MySQL dialect.
    if (dbmsName.contains("MariaDB"sv))
        return SqlServerType::MYSQL;

    return SqlServerType::UNKNOWN;
}

} // namespace

SqlConnection::SqlConnection():
    SqlConnection(gDefaultConnectionString)
{
}

SqlConnection::SqlConnection(std::optional<SqlConnectionString> connectionString):
    m_connectionId { gNextConnectionId++ }
{
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &m_hEnv)))
    {
        SqlLogger::GetLogger().OnError(SqlError::FAILURE);
        m_hEnv = {};
        return;
    }

    SQLSetEnvAttr(m_hEnv, SQL_ATTR_ODBC_VERSION, reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0);

    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_DBC, m_hEnv, &m_hDbc)))
    {
        SqlLogger::GetLogger().OnError(SqlErrorInfo::FromHandle(SQL_HANDLE_ENV, m_hEnv));
        m_hDbc = {};
        return;
    }

    if (connectionString)
        Connect(std::move(*connectionString));
}

SqlConnection::SqlConnection(SqlConnection&& other) noexcept:
    m_hEnv { std::exchange(other.m_hEnv, {}) },
    m_hDbc { std::exchange(other.m_hDbc, {}) },
    m_connectionId { other.m_connectionId },
    m_serverType { other.m_serverType },
    m_connectionString { std::move(other.m_connectionString) }
{
}

SqlConnection& SqlConnection::operator=(SqlConnection&& other) noexcept
{
    if (this != &other)
    {
        Close();
        m_hEnv = std::exchange(other.m_hEnv, {});
        m_hDbc = std::exchange(other.m_hDbc, {});
        m_connectionId = other.m_connectionId;
        m_serverType = other.m_serverType;
        m_connectionString = std::move(other.m_connectionString);
    }
    return *this;
}

SqlConnection::~SqlConnection() noexcept
{
    Close();
}

SqlConnectionString const& SqlConnection::DefaultConnectionString() noexcept
{
    return gDefaultConnectionString;
}

void SqlConnection::SetDefaultConnectionString(SqlConnectionString const& connectionString) noexcept
{
    gDefaultConnectionString = connectionString;
}

void SqlConnection::SetPostConnectedHook(std::function<void(SqlConnection&)> hook)
{
    gPostConnectedHook = std::move(hook);
}

bool SqlConnection::Connect(SqlConnectionDataSource const& dataSource) noexcept
{
    if (!m_hDbc)
        return false;

    SQLDisconnect(m_hDbc);

    // NOLINTNEXTLINE(performance-no-int-to-ptr)
    auto const timeout = reinterpret_cast<SQLPOINTER>(static_cast<SQLULEN>(dataSource.timeout.count()));
    if (!SQL_SUCCEEDED(SQLSetConnectAttrA(m_hDbc, SQL_LOGIN_TIMEOUT, timeout, 0)))
    {
        SqlLogger::GetLogger().OnError(LastError());
        return false;
    }

    m_connectionString = dataSource.ToConnectionString();
    return ConnectionEstablished(SQLConnectA(m_hDbc,
                                             (SQLCHAR*) dataSource.datasource.data(),
                                             static_cast<SQLSMALLINT>(dataSource.datasource.size()),
                                             (SQLCHAR*) dataSource.username.data(),
                                             static_cast<SQLSMALLINT>(dataSource.username.size()),
                                             (SQLCHAR*) dataSource.password.data(),
                                             static_cast<SQLSMALLINT>(dataSource.password.size())));
}

bool SqlConnection::Connect(SqlConnectionString connectionString) noexcept
{
    if (!m_hDbc)
        return false;

    SQLDisconnect(m_hDbc);

    m_connectionString = std::move(connectionString);
    auto& text = m_connectionString.value;
    return ConnectionEstablished(SQLDriverConnectA(m_hDbc,
                                                   nullptr,
                                                   reinterpret_cast<SQLCHAR*>(text.data()),
                                                   static_cast<SQLSMALLINT>(text.size()),
                                                   nullptr,
                                                   0,
                                                   nullptr,
                                                   SQL_DRIVER_NOPROMPT));
}

// Finishes either Connect() overload.
bool SqlConnection::ConnectionEstablished(SQLRETURN sqlResult)
{
    if (!SQL_SUCCEEDED(sqlResult))
    {
        SqlLogger::GetLogger().OnError(LastError());
        m_serverType = SqlServerType::UNKNOWN;
        return false;
    }

    SQLSetConnectAttrA(m_hDbc, SQL_ATTR_AUTOCOMMIT, reinterpret_cast<SQLPOINTER>(SQL_AUTOCOMMIT_ON), SQL_IS_UINTEGER);

    auto dbmsName = std::array<SQLCHAR, 128> {};
    auto const rc = SQLGetInfoA(
        m_hDbc, SQL_DBMS_NAME, dbmsName.data(), static_cast<SQLSMALLINT>(dbmsName.size()), nullptr);
    m_serverType = SQL_SUCCEEDED(rc) ? DetectServerType(reinterpret_cast<char const*>(dbmsName.data()))
                                     : SqlServerType::UNKNOWN;

    SqlLogger::GetLogger().OnConnectionOpened(*this);

    if (gPostConnectedHook)
        gPostConnectedHook(*this);

    return true;
}

SqlErrorInfo SqlConnection::LastError() const
{
    return SqlErrorInfo::FromConnection(m_hDbc);
}

void SqlConnection::Close() noexcept
{
    if (m_hDbc)
    {
        SqlLogger::GetLogger().OnConnectionClosed(*this);
        SQLDisconnect(m_hDbc);
        SQLFreeHandle(SQL_HANDLE_DBC, std::exchange(m_hDbc, {}));
    }

    if (m_hEnv)
        SQLFreeHandle(SQL_HANDLE_ENV, std::exchange(m_hEnv, {}));
}

bool SqlConnection::IsAlive() const noexcept
{
    if (!m_hDbc)
        return false;

    SQLUINTEGER dead {};
    return SQL_SUCCEEDED(SQLGetConnectAttrA(m_hDbc, SQL_ATTR_CONNECTION_DEAD, &dead, 0, nullptr))
           && dead == SQL_CD_FALSE;
}

void SqlConnection::RequireSuccess(SQLRETURN sqlResult, std::source_location sourceLocation) const
{
    if (!SQL_SUCCEEDED(sqlResult))
        throw SqlException(LastError(), sourceLocation);
}

std::string SqlConnection::GetInfoString(SQLUSMALLINT infoType, std::source_location sourceLocation) const
{
    // A too small buffer is truncated but reports the full length, so a second call can fetch it all.
    auto text = std::string(64, '\0');
    SQLSMALLINT length {};
    for (auto attempt = 0; attempt < 2; ++attempt)
    {
        RequireSuccess(
            SQLGetInfoA(m_hDbc, infoType, text.data(), static_cast<SQLSMALLINT>(text.size()), &length), sourceLocation);
        if (static_cast<std::size_t>(length) < text.size())
            break;
        text.resize(static_cast<std::size_t>(length) + 1);
    }
    text.resize(static_cast<std::size_t>(length));
    return text;
}

std::string SqlConnection::ServerName() const
{
    return GetInfoString(SQL_DBMS_NAME, std::source_location::current());
}

std::string SqlConnection::ServerVersion() const
{
    return GetInfoString(SQL_DBMS_VER, std::source_location::current());
}

std::string SqlConnection::DatabaseName() const
{
    return GetInfoString(SQL_DATABASE_NAME, std::source_location::current());
}

std::string SqlConnection::UserName() const
{
    return GetInfoString(SQL_USER_NAME, std::source_location::current());
}

std::string SqlConnection::IdentifierQuoteChar() const
{
    return GetInfoString(SQL_IDENTIFIER_QUOTE_CHAR, std::source_location::current());
}

std::string SqlConnection::SpecialCharacters() const
{
    return GetInfoString(SQL_SPECIAL_CHARACTERS, std::source_location::current());
}

std::size_t SqlConnection::MaxColumnNameLength() const
{
    SQLUSMALLINT maxLength {};
    RequireSuccess(SQLGetInfoA(m_hDbc, SQL_MAX_COLUMN_NAME_LEN, &maxLength, sizeof(maxLength), nullptr));
    return maxLength;
}
