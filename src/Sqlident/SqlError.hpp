// SPDX-License-Identifier: Apache-2.0
#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"

#include <cstdint>
#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <system_error>

#include <sql.h>
#include <sqlext.h>
#include <sqlspi.h>
#include <sqltypes.h>

/// ODBC return codes, plus the failures the driver layer detects on its own.
enum class SqlError : std::int16_t
{
    SUCCESS = SQL_SUCCESS,
    SUCCESS_WITH_INFO = SQL_SUCCESS_WITH_INFO,
    NODATA = SQL_NO_DATA,
    FAILURE = SQL_ERROR,
    INVALID_HANDLE = SQL_INVALID_HANDLE,
    STILL_EXECUTING = SQL_STILL_EXECUTING,
    NEED_DATA = SQL_NEED_DATA,
    PARAM_DATA_AVAILABLE = SQL_PARAM_DATA_AVAILABLE,
    UNSUPPORTED_TYPE = 1'000,
    INVALID_ARGUMENT = 1'001,
};

struct SqlErrorCategory: std::error_category
{
    static SqlErrorCategory const& get() noexcept
    {
        static SqlErrorCategory const category;
        return category;
    }

    [[nodiscard]] const char* name() const noexcept override
    {
        return "Sqlident.ODBC";
    }

    [[nodiscard]] SQLIDENT_API std::string message(int code) const override;
};

template <>
struct std::is_error_code_enum<SqlError>: public std::true_type
{
};

inline std::error_code make_error_code(SqlError e)
{
    return { static_cast<int>(e), SqlErrorCategory::get() };
}

/// First diagnostic record of a failed ODBC call.
struct SqlErrorInfo
{
    SQLINTEGER nativeErrorCode {};
    std::string sqlState;
    std::string message;

    [[nodiscard]] SQLIDENT_API static SqlErrorInfo FromConnection(SQLHDBC hDbc);
    [[nodiscard]] SQLIDENT_API static SqlErrorInfo FromStatement(SQLHSTMT hStmt);

    /// Reads the diagnostic record of any handle type. A handle without diagnostics yields an
    /// empty SQLSTATE and message.
    [[nodiscard]] SQLIDENT_API static SqlErrorInfo FromHandle(SQLSMALLINT handleType, SQLHANDLE handle);
};

/// Thrown by the driver layer when an ODBC call fails. The logger sees the error on construction.
class SQLIDENT_API SqlException: public std::runtime_error
{
  public:
    explicit SqlException(SqlErrorInfo info, std::source_location sourceLocation = std::source_location::current());

    [[nodiscard]] SqlErrorInfo const& info() const noexcept
    {
        return _info;
    }

  private:
    SqlErrorInfo _info;
};

template <>
struct std::formatter<SqlError>: formatter<std::string>
{
    auto format(SqlError value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(make_error_code(value).message(), ctx);
    }
};

template <>
struct std::formatter<SqlErrorInfo>: formatter<std::string>
{
    auto format(SqlErrorInfo const& info, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(
            std::format("{} ({}) - {}", info.sqlState, info.nativeErrorCode, info.message), ctx);
    }
};
