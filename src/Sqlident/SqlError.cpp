// SPDX-License-Identifier: Apache-2.0

#include "SqlError.hpp"
#include "SqlLogger.hpp"

#include <array>

std::string SqlErrorCategory::message(int code) const
{
    using namespace std::string_literals;
    switch (static_cast<SqlError>(code))
    {
        case SqlError::SUCCESS:
            return "SQL_SUCCESS"s;
        case SqlError::SUCCESS_WITH_INFO:
            return "SQL_SUCCESS_WITH_INFO"s;
        case SqlError::NODATA:
            return "SQL_NO_DATA"s;
        case SqlError::FAILURE:
            return "SQL_ERROR"s;
        case SqlError::INVALID_HANDLE:
            return "SQL_INVALID_HANDLE"s;
        case SqlError::STILL_EXECUTING:
            return "SQL_STILL_EXECUTING"s;
        case SqlError::NEED_DATA:
            return "SQL_NEED_DATA"s;
        case SqlError::PARAM_DATA_AVAILABLE:
            return "SQL_PARAM_DATA_AVAILABLE"s;
        case SqlError::UNSUPPORTED_TYPE:
            return "Unsupported data type"s;
        case SqlError::INVALID_ARGUMENT:
            return "Invalid argument"s;
    }
    return std::format("ODBC return code {}", code);
}

SqlErrorInfo SqlErrorInfo::FromConnection(SQLHDBC hDbc)
{
    return FromHandle(SQL_HANDLE_DBC, hDbc);
}

SqlErrorInfo SqlErrorInfo::FromStatement(SQLHSTMT hStmt)
{
    return FromHandle(SQL_HANDLE_STMT, hStmt);
}

SqlErrorInfo SqlErrorInfo::FromHandle(SQLSMALLINT handleType, SQLHANDLE handle)
{
    auto state = std::array<SQLCHAR, SQL_SQLSTATE_SIZE + 1> {};
    auto info = SqlErrorInfo {};

    // The first call reports the message length, the second one fetches the full message.
    SQLSMALLINT messageLength {};
    auto rc = SQLGetDiagRecA(handleType, handle, 1, state.data(), &info.nativeErrorCode, nullptr, 0, &messageLength);
    if (!SQL_SUCCEEDED(rc))
        return info;

    info.message.resize(static_cast<size_t>(messageLength) + 1);
    rc = SQLGetDiagRecA(handleType,
                        handle,
                        1,
                        state.data(),
                        &info.nativeErrorCode,
                        reinterpret_cast<SQLCHAR*>(info.message.data()),
                        static_cast<SQLSMALLINT>(info.message.size()),
                        &messageLength);
    info.message.resize(SQL_SUCCEEDED(rc) ? static_cast<size_t>(messageLength) : 0);
    info.sqlState = reinterpret_cast<char const*>(state.data());
    return info;
}

SqlException::SqlException(SqlErrorInfo info, std::source_location sourceLocation):
    std::runtime_error(std::format("{}", info)),
    _info { std::move(info) }
{
    SqlLogger::GetLogger().OnError(_info, sourceLocation);
}
