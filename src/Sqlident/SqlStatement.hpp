// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlConnection.hpp"
#include "SqlDataBinder.hpp"
#include "SqlLogger.hpp"

#include <cstddef>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

#include <sql.h>
#include <sqlext.h>
#include <sqlspi.h>
#include <sqltypes.h>

/// An ODBC statement handle on a connection.
///
/// A statement is either prepared once and then executed any number of times, or run directly
/// with ExecuteDirect(). Result rows are read with FetchRow() and the column getters; the cursor
/// closes itself once FetchRow() runs past the last row.
///
/// Failing ODBC calls throw SqlException. A parameter count that does not match the prepared
/// statement throws std::invalid_argument.
class SqlStatement final
{
  public:
    /// Opens its own connection to SqlConnection::DefaultConnectionString().
    SQLIDENT_API SqlStatement();

    /// Uses the given connection, which must outlive the statement.
    SQLIDENT_API explicit SqlStatement(SqlConnection& connection);

    SQLIDENT_API SqlStatement(SqlStatement&& /*other*/) noexcept;
    SQLIDENT_API SqlStatement& operator=(SqlStatement&& /*other*/) noexcept;
    SqlStatement(SqlStatement const& /*other*/) = delete;
    SqlStatement& operator=(SqlStatement const& /*other*/) = delete;
    SQLIDENT_API ~SqlStatement() noexcept;

    [[nodiscard]] SQLIDENT_API bool IsAlive() const noexcept;

    [[nodiscard]] SqlConnection& Connection() noexcept
    {
        return *m_connection;
    }

    [[nodiscard]] SqlConnection const& Connection() const noexcept
    {
        return *m_connection;
    }

    [[nodiscard]] SQLIDENT_API SqlErrorInfo LastError() const;

    [[nodiscard]] SQLHSTMT NativeHandle() const noexcept
    {
        return m_hStmt;
    }

    /// Compiles the query on the driver and records how many input parameters it takes.
    /// Any open result set must have been consumed or closed before.
    SQLIDENT_API void Prepare(std::string_view query, std::source_location location = std::source_location::current());

    /// The text given to the last Prepare(), or empty after ExecuteDirect().
    [[nodiscard]] std::string const& PreparedQuery() const noexcept
    {
        return m_preparedQuery;
    }

    /// Binds the arguments in order to the prepared statement's `?` markers and executes it.
    template <SqlInputParameterBinder... Args>
    void Execute(Args const&... args);

    SQLIDENT_API void ExecuteDirect(std::string_view const& query,
                                    std::source_location location = std::source_location::current());

    /// Number of columns in the current result set.
    [[nodiscard]] SQLIDENT_API size_t NumColumnsAffected() const;

    /// Advances to the next row. Returns false, and closes the cursor, at the end of the result set.
    [[nodiscard]] SQLIDENT_API bool FetchRow();

    SQLIDENT_API void CloseCursor() noexcept;

    /// Reads a column of the current row. Columns are numbered from 1.
    template <SqlGetColumnNativeType T>
    [[nodiscard]] T GetColumn(SQLUSMALLINT column) const
    {
        return GetNullableColumn<T>(column).value_or(T {});
    }

    /// Reads a column of the current row, yielding std::nullopt for NULL.
    template <SqlGetColumnNativeType T>
    [[nodiscard]] std::optional<T> GetNullableColumn(SQLUSMALLINT column) const;

  private:
    SQLIDENT_API void RequireSuccess(SQLRETURN sqlResult,
                                     std::source_location sourceLocation = std::source_location::current()) const;
    void ReleaseHandle() noexcept;

    std::unique_ptr<SqlConnection> m_ownedConnection;
    SqlConnection* m_connection {};
    SQLHSTMT m_hStmt {};
    std::string m_preparedQuery;
    SQLSMALLINT m_expectedParameterCount {};
};

template <SqlInputParameterBinder... Args>
void SqlStatement::Execute(Args const&... args)
{
    if (static_cast<std::size_t>(m_expectedParameterCount) != sizeof...(args))
    {
        SqlLogger::GetLogger().OnError(SqlError::INVALID_ARGUMENT);
        throw std::invalid_argument { std::format(
            "Statement takes {} parameters, but {} were given", m_expectedParameterCount, sizeof...(args)) };
    }

    auto& logger = SqlLogger::GetLogger();
    SQLUSMALLINT position = 1;
    auto const bindOne = [&]<typename Arg>(Arg const& arg) {
        logger.OnBindInputParameter({}, SqlDataBinder<Arg>::Inspect(arg));
        RequireSuccess(SqlDataBinder<Arg>::InputParameter(m_hStmt, position++, arg));
    };
    (bindOne(args), ...);

    logger.OnExecute(m_preparedQuery);
    RequireSuccess(SQLExecute(m_hStmt));
}

template <SqlGetColumnNativeType T>
std::optional<T> SqlStatement::GetNullableColumn(SQLUSMALLINT column) const
{
    auto value = T {};
    SQLLEN indicator {};
    RequireSuccess(SqlDataBinder<T>::GetColumn(m_hStmt, column, &value, &indicator));
    if (indicator == SQL_NULL_DATA)
        return std::nullopt;
    return { std::move(value) };
}
