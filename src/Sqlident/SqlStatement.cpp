// SPDX-License-Identifier: Apache-2.0

#include "SqlStatement.hpp"

#include <utility>

SqlStatement::SqlStatement():
    m_ownedConnection { std::make_unique<SqlConnection>() },
    m_connection { m_ownedConnection.get() }
{
    // A failed default connect has already been reported, and leaves the statement dead.
    if (m_connection->NativeHandle())
        RequireSuccess(SQLAllocHandle(SQL_HANDLE_STMT, m_connection->NativeHandle(), &m_hStmt));
}

SqlStatement::SqlStatement(SqlConnection& connection):
    m_connection { &connection }
{
    connection.RequireSuccess(SQLAllocHandle(SQL_HANDLE_STMT, connection.NativeHandle(), &m_hStmt));
}

SqlStatement::SqlStatement(SqlStatement&& other) noexcept:
    m_ownedConnection { std::move(other.m_ownedConnection) },
    m_connection { std::exchange(other.m_connection, nullptr) },
    m_hStmt { std::exchange(other.m_hStmt, SQL_NULL_HSTMT) },
    m_preparedQuery { std::move(other.m_preparedQuery) },
    m_expectedParameterCount { other.m_expectedParameterCount }
{
}

SqlStatement& SqlStatement::operator=(SqlStatement&& other) noexcept
{
    if (this != &other)
    {
        ReleaseHandle();
        m_ownedConnection = std::move(other.m_ownedConnection);
        m_connection = std::exchange(other.m_connection, nullptr);
        m_hStmt = std::exchange(other.m_hStmt, SQL_NULL_HSTMT);
        m_preparedQuery = std::move(other.m_preparedQuery);
        m_expectedParameterCount = other.m_expectedParameterCount;
    }
    return *this;
}

SqlStatement::~SqlStatement() noexcept
{
    ReleaseHandle();
}

void SqlStatement::ReleaseHandle() noexcept
{
    if (m_hStmt == SQL_NULL_HSTMT)
        return;

    SqlLogger::GetLogger().OnFetchEnd();
    SQLFreeHandle(SQL_HANDLE_STMT, std::exchange(m_hStmt, SQL_NULL_HSTMT));
}

bool SqlStatement::IsAlive() const noexcept
{
    return m_hStmt != SQL_NULL_HSTMT && m_connection && m_connection->IsAlive();
}

SqlErrorInfo SqlStatement::LastError() const
{
    return SqlErrorInfo::FromStatement(m_hStmt);
}

void SqlStatement::Prepare(std::string_view query, std::source_location location)
{
    SqlLogger::GetLogger().OnPrepare(query);

    m_preparedQuery.assign(query);
    m_expectedParameterCount = 0;

    // Drop the bindings of the previous statement.
    RequireSuccess(SQLFreeStmt(m_hStmt, SQL_RESET_PARAMS), location);
    RequireSuccess(SQLFreeStmt(m_hStmt, SQL_UNBIND), location);

    RequireSuccess(SQLPrepareA(m_hStmt, (SQLCHAR*) query.data(), static_cast<SQLINTEGER>(query.size())), location);
    RequireSuccess(SQLNumParams(m_hStmt, &m_expectedParameterCount), location);
}

void SqlStatement::ExecuteDirect(std::string_view const& query, std::source_location location)
{
    if (query.empty())
        return;

    m_preparedQuery.clear();
    m_expectedParameterCount = 0;
    SqlLogger::GetLogger().OnExecuteDirect(query);

    RequireSuccess(SQLExecDirectA(m_hStmt, (SQLCHAR*) query.data(), static_cast<SQLINTEGER>(query.size())), location);
}

size_t SqlStatement::NumColumnsAffected() const
{
    SQLSMALLINT count {};
    RequireSuccess(SQLNumResultCols(m_hStmt, &count));
    return static_cast<size_t>(count);
}

bool SqlStatement::FetchRow()
{
    auto const sqlResult = SQLFetch(m_hStmt);
    if (sqlResult == SQL_NO_DATA)
    {
        CloseCursor();
        return false;
    }

    RequireSuccess(sqlResult);
    SqlLogger::GetLogger().OnFetchRow();
    return true;
}

void SqlStatement::CloseCursor() noexcept
{
    SQLFreeStmt(m_hStmt, SQL_CLOSE);
    SqlLogger::GetLogger().OnFetchEnd();
}

void SqlStatement::RequireSuccess(SQLRETURN sqlResult, std::source_location sourceLocation) const
{
    if (SQL_SUCCEEDED(sqlResult))
        return;

    auto errorInfo = LastError();

    // 07009: invalid descriptor index, i.e. the caller asked for a column or parameter that does not exist.
    if (errorInfo.sqlState == "07009")
    {
        SqlLogger::GetLogger().OnError(errorInfo, sourceLocation);
        throw std::invalid_argument(std::format("Invalid column or parameter index: {}", errorInfo));
    }

    throw SqlException(std::move(errorInfo), sourceLocation);
}
