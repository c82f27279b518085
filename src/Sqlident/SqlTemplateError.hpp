// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlError.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <system_error>

/// Failure kinds of the identifier template pipeline.
enum class SqlTemplateErrorCode : std::uint8_t
{
    /// A bound value is not a safe identifier for the target dialect.
    INVALID_IDENTIFIER = 1,

    /// An identifier list was bound with zero elements.
    EMPTY_IDENTIFIER_LIST,

    /// Assembly reached a template parameter that has no binding.
    UNBOUND_PARAMETER,

    /// The driver could not provide identifier quoting metadata.
    METADATA_UNAVAILABLE,

    /// The driver rejected the assembled SQL text.
    DRIVER_COMPILATION_FAILURE,
};

struct SqlTemplateErrorCategory: std::error_category
{
    static SqlTemplateErrorCategory const& get() noexcept
    {
        static SqlTemplateErrorCategory const category;
        return category;
    }

    [[nodiscard]] const char* name() const noexcept override
    {
        return "Sqlident.Template";
    }

    [[nodiscard]] SQLIDENT_API std::string message(int code) const override;
};

template <>
struct std::is_error_code_enum<SqlTemplateErrorCode>: public std::true_type
{
};

inline std::error_code make_error_code(SqlTemplateErrorCode e)
{
    return { static_cast<int>(e), SqlTemplateErrorCategory::get() };
}

/// Describes why a template operation failed.
///
/// The parameter name and the offending value are filled in where the failing operation knows them.
/// For DRIVER_COMPILATION_FAILURE, driverInfo holds the driver's diagnostic record as reported.
struct SqlTemplateError
{
    SqlTemplateErrorCode code {};
    std::string parameterName;
    std::string value;
    std::string message;
    std::optional<SqlErrorInfo> driverInfo;

    [[nodiscard]] std::error_code ErrorCode() const noexcept
    {
        return make_error_code(code);
    }

    [[nodiscard]] SQLIDENT_API static SqlTemplateError InvalidIdentifier(std::string value, std::string reason);
    [[nodiscard]] SQLIDENT_API static SqlTemplateError EmptyIdentifierList(std::string parameterName);
    [[nodiscard]] SQLIDENT_API static SqlTemplateError UnboundParameter(std::string parameterName);
    [[nodiscard]] SQLIDENT_API static SqlTemplateError MetadataUnavailable(std::string reason,
                                                                          std::optional<SqlErrorInfo> driverInfo = {});
    [[nodiscard]] SQLIDENT_API static SqlTemplateError DriverCompilationFailure(SqlErrorInfo driverInfo);
};

template <typename T>
using SqlTemplateResult = std::expected<T, SqlTemplateError>;

template <>
struct std::formatter<SqlTemplateErrorCode>: formatter<std::string>
{
    auto format(SqlTemplateErrorCode value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(SqlTemplateErrorCategory::get().message(static_cast<int>(value)), ctx);
    }
};

template <>
struct std::formatter<SqlTemplateError>: formatter<std::string>
{
    auto format(SqlTemplateError const& error, format_context& ctx) const -> format_context::iterator
    {
        if (error.driverInfo)
            return formatter<std::string>::format(
                std::format("{}: {} [{}]", error.code, error.message, *error.driverInfo), ctx);
        return formatter<std::string>::format(std::format("{}: {}", error.code, error.message), ctx);
    }
};
