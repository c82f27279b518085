// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

template <typename>
struct SqlDataBinder;

// clang-format off
template <typename T>
concept SqlInputParameterBinder = requires(SQLHSTMT hStmt, SQLUSMALLINT column, T const& value) {
    { SqlDataBinder<T>::InputParameter(hStmt, column, value) } -> std::same_as<SQLRETURN>;
    { SqlDataBinder<T>::Inspect(value) } -> std::convertible_to<std::string_view>;
};

template <typename T>
concept SqlGetColumnNativeType = requires(SQLHSTMT hStmt, SQLUSMALLINT column, T* result, SQLLEN* indicator) {
    { SqlDataBinder<T>::GetColumn(hStmt, column, result, indicator) } -> std::same_as<SQLRETURN>;
};
// clang-format on

template <typename T, SQLSMALLINT TheCType, SQLSMALLINT TheSqlType>
struct SqlSimpleDataBinder
{
    static SQLIDENT_FORCE_INLINE SQLRETURN InputParameter(SQLHSTMT stmt, SQLUSMALLINT column, T const& value) noexcept
    {
        return SQLBindParameter(
            stmt, column, SQL_PARAM_INPUT, TheCType, TheSqlType, 0, 0, (SQLPOINTER) &value, 0, nullptr);
    }

    static SQLIDENT_FORCE_INLINE SQLRETURN GetColumn(SQLHSTMT stmt,
                                                     SQLUSMALLINT column,
                                                     T* result,
                                                     SQLLEN* indicator) noexcept
    {
        return SQLGetData(stmt, column, TheCType, result, 0, indicator);
    }

    static SQLIDENT_FORCE_INLINE std::string Inspect(T value)
    {
        return std::to_string(value);
    }
};

// clang-format off
template <> struct SqlDataBinder<int16_t>: SqlSimpleDataBinder<int16_t, SQL_C_SSHORT, SQL_SMALLINT> {};
template <> struct SqlDataBinder<int32_t>: SqlSimpleDataBinder<int32_t, SQL_C_SLONG, SQL_INTEGER> {};
template <> struct SqlDataBinder<int64_t>: SqlSimpleDataBinder<int64_t, SQL_C_SBIGINT, SQL_BIGINT> {};
template <> struct SqlDataBinder<double>: SqlSimpleDataBinder<double, SQL_C_DOUBLE, SQL_DOUBLE> {};
#if !defined(_WIN32) && !defined(__APPLE__)
template <> struct SqlDataBinder<long long>: SqlSimpleDataBinder<long long, SQL_C_SBIGINT, SQL_BIGINT> {};
#endif
// clang-format on

template <>
struct SqlDataBinder<std::string_view>
{
    static SQLIDENT_FORCE_INLINE SQLRETURN InputParameter(SQLHSTMT stmt,
                                                          SQLUSMALLINT column,
                                                          std::string_view const& value) noexcept
    {
        return SQLBindParameter(stmt,
                                column,
                                SQL_PARAM_INPUT,
                                SQL_C_CHAR,
                                SQL_VARCHAR,
                                value.size(),
                                0,
                                (SQLPOINTER) value.data(),
                                0,
                                nullptr);
    }

    static SQLIDENT_FORCE_INLINE std::string_view Inspect(std::string_view value) noexcept
    {
        return value;
    }
};

template <std::size_t N>
struct SqlDataBinder<char[N]>
{
    static SQLIDENT_FORCE_INLINE SQLRETURN InputParameter(SQLHSTMT stmt,
                                                          SQLUSMALLINT column,
                                                          char const (&value)[N]) noexcept
    {
        return SqlDataBinder<std::string_view>::InputParameter(stmt, column, std::string_view(value, N - 1));
    }

    static SQLIDENT_FORCE_INLINE std::string_view Inspect(char const (&value)[N]) noexcept
    {
        return { value, N - 1 };
    }
};

template <>
struct SqlDataBinder<std::string>
{
    static SQLIDENT_FORCE_INLINE SQLRETURN InputParameter(SQLHSTMT stmt,
                                                          SQLUSMALLINT column,
                                                          std::string const& value) noexcept
    {
        return SqlDataBinder<std::string_view>::InputParameter(stmt, column, std::string_view(value));
    }

    // Reads the column in chunks, since the driver does not tell the total length up front.
    static SQLRETURN GetColumn(SQLHSTMT stmt, SQLUSMALLINT column, std::string* result, SQLLEN* indicator) noexcept
    {
        result->clear();

        char buffer[256];
        while (true)
        {
            SQLRETURN const sqlResult = SQLGetData(stmt, column, SQL_C_CHAR, buffer, sizeof(buffer), indicator);
            if (sqlResult == SQL_NO_DATA)
                return SQL_SUCCESS;
            if (!SQL_SUCCEEDED(sqlResult))
                return sqlResult;
            if (*indicator == SQL_NULL_DATA)
                return sqlResult;

            auto const chunkSize = (*indicator == SQL_NO_TOTAL || *indicator >= (SQLLEN) sizeof(buffer))
                                       ? sizeof(buffer) - 1
                                       : static_cast<std::size_t>(*indicator);
            result->append(buffer, chunkSize);

            if (sqlResult == SQL_SUCCESS)
                return sqlResult;
        }
    }

    static SQLIDENT_FORCE_INLINE std::string_view Inspect(std::string const& value) noexcept
    {
        return value;
    }
};
