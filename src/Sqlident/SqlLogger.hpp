// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlError.hpp"
#include "SqlTemplateError.hpp"

#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>

class SqlConnection;

/// Receives the events of the driver layer and of the identifier template pipeline.
///
/// One logger is current per process (see GetLogger() and SetLogger()); the null logger is
/// current until another one is set.
class SQLIDENT_API SqlLogger
{
  public:
    /// Whether the values of driver input parameters are passed to OnBind().
    enum class SupportBindLogging : uint8_t
    {
        No,
        Yes
    };

    SqlLogger() = default;
    SqlLogger(SqlLogger const& /*other*/) = default;
    SqlLogger(SqlLogger&& /*other*/) = default;
    SqlLogger& operator=(SqlLogger const& /*other*/) = default;
    SqlLogger& operator=(SqlLogger&& /*other*/) = default;
    virtual ~SqlLogger() = default;

    explicit SqlLogger(SupportBindLogging supportBindLogging):
        _supportsBindLogging { supportBindLogging == SupportBindLogging::Yes }
    {
    }

    virtual void OnWarning(std::string_view const& message) = 0;

    // {{{ driver events

    /// An ODBC call returned the given code, or a call was made with invalid arguments.
    virtual void OnError(SqlError errorCode, std::source_location sourceLocation = std::source_location::current()) = 0;

    /// An ODBC call failed with the given diagnostic record.
    virtual void OnError(SqlErrorInfo const& errorInfo,
                         std::source_location sourceLocation = std::source_location::current()) = 0;

    virtual void OnConnectionOpened(SqlConnection const& connection) = 0;
    virtual void OnConnectionClosed(SqlConnection const& connection) = 0;

    virtual void OnExecuteDirect(std::string_view const& query) = 0;
    virtual void OnPrepare(std::string_view const& query) = 0;

    /// Forwards a driver input parameter to OnBind(), if this logger asked for them.
    void OnBindInputParameter(std::string_view const& name, std::string_view value)
    {
        if (_supportsBindLogging)
            OnBind(name, std::string(value));
    }

    /// A driver input parameter was bound. The name is empty for positional parameters.
    virtual void OnBind(std::string_view const& name, std::string value) = 0;

    virtual void OnExecute(std::string_view const& query) = 0;
    virtual void OnFetchRow() = 0;

    /// The result set was consumed or closed.
    virtual void OnFetchEnd() = 0;

    // }}}

    // {{{ identifier template events

    /// A template operation failed. The error is also returned to the caller.
    virtual void OnTemplateError(SqlTemplateError const& error,
                                 std::source_location sourceLocation = std::source_location::current()) = 0;

    /// An identifier parameter received its validated and quoted text.
    virtual void OnBindIdentifier(std::string_view const& name, std::string_view const& quotedText) = 0;

    /// A template was assembled into SQL text.
    virtual void OnAssemble(std::string_view const& sqlText) = 0;

    // }}}

    class Null;

    /// The logger that ignores every event.
    static Null& NullLogger() noexcept;

    /// Writes warnings and errors to standard output.
    static SqlLogger& StandardLogger();

    /// Writes every event to standard output, including statement timings and bound values.
    static SqlLogger& TraceLogger();

    static SqlLogger& GetLogger();

    /// Makes the given logger current. The caller keeps ownership and must keep it alive
    /// while it is current.
    static void SetLogger(SqlLogger& logger);

  private:
    bool _supportsBindLogging = false;
};

class SqlLogger::Null: public SqlLogger
{
  public:
    void OnWarning(std::string_view const& /*message*/) override {}
    void OnError(SqlError /*errorCode*/, std::source_location /*sourceLocation*/) override {}
    void OnError(SqlErrorInfo const& /*errorInfo*/, std::source_location /*sourceLocation*/) override {}
    void OnConnectionOpened(SqlConnection const& /*connection*/) override {}
    void OnConnectionClosed(SqlConnection const& /*connection*/) override {}
    void OnExecuteDirect(std::string_view const& /*query*/) override {}
    void OnPrepare(std::string_view const& /*query*/) override {}
    void OnBind(std::string_view const& /*name*/, std::string /*value*/) override {}
    void OnExecute(std::string_view const& /*query*/) override {}
    void OnFetchRow() override {}
    void OnFetchEnd() override {}
    void OnTemplateError(SqlTemplateError const& /*error*/, std::source_location /*sourceLocation*/) override {}
    void OnBindIdentifier(std::string_view const& /*name*/, std::string_view const& /*quotedText*/) override {}
    void OnAssemble(std::string_view const& /*sqlText*/) override {}
};
