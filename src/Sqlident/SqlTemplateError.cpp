// SPDX-License-Identifier: Apache-2.0

#include "SqlTemplateError.hpp"

std::string SqlTemplateErrorCategory::message(int code) const
{
    using namespace std::string_literals;
    switch (static_cast<SqlTemplateErrorCode>(code))
    {
        case SqlTemplateErrorCode::INVALID_IDENTIFIER:
            return "Invalid identifier"s;
        case SqlTemplateErrorCode::EMPTY_IDENTIFIER_LIST:
            return "Empty identifier list"s;
        case SqlTemplateErrorCode::UNBOUND_PARAMETER:
            return "Unbound parameter"s;
        case SqlTemplateErrorCode::METADATA_UNAVAILABLE:
            return "Identifier quoting metadata unavailable"s;
        case SqlTemplateErrorCode::DRIVER_COMPILATION_FAILURE:
            return "Driver failed to compile statement"s;
    }
    return std::format("Template error code {}", code);
}

SqlTemplateError SqlTemplateError::InvalidIdentifier(std::string value, std::string reason)
{
    auto message = std::format("Identifier \"{}\" rejected: {}", value, reason);
    return SqlTemplateError {
        .code = SqlTemplateErrorCode::INVALID_IDENTIFIER,
        .parameterName = {},
        .value = std::move(value),
        .message = std::move(message),
        .driverInfo = std::nullopt,
    };
}

SqlTemplateError SqlTemplateError::EmptyIdentifierList(std::string parameterName)
{
    auto message = std::format("Identifier list for parameter \"{}\" cannot be empty.", parameterName);
    return SqlTemplateError {
        .code = SqlTemplateErrorCode::EMPTY_IDENTIFIER_LIST,
        .parameterName = std::move(parameterName),
        .value = {},
        .message = std::move(message),
        .driverInfo = std::nullopt,
    };
}

SqlTemplateError SqlTemplateError::UnboundParameter(std::string parameterName)
{
    auto message = std::format("Unset parameter: {}", parameterName);
    return SqlTemplateError {
        .code = SqlTemplateErrorCode::UNBOUND_PARAMETER,
        .parameterName = std::move(parameterName),
        .value = {},
        .message = std::move(message),
        .driverInfo = std::nullopt,
    };
}

SqlTemplateError SqlTemplateError::MetadataUnavailable(std::string reason, std::optional<SqlErrorInfo> driverInfo)
{
    return SqlTemplateError {
        .code = SqlTemplateErrorCode::METADATA_UNAVAILABLE,
        .parameterName = {},
        .value = {},
        .message = std::move(reason),
        .driverInfo = std::move(driverInfo),
    };
}

SqlTemplateError SqlTemplateError::DriverCompilationFailure(SqlErrorInfo driverInfo)
{
    auto message = driverInfo.message;
    return SqlTemplateError {
        .code = SqlTemplateErrorCode::DRIVER_COMPILATION_FAILURE,
        .parameterName = {},
        .value = {},
        .message = std::move(message),
        .driverInfo = std::move(driverInfo),
    };
}
