// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"
#include "SqlConnection.hpp"
#include "SqlLogger.hpp"

#include <chrono>
#include <format>
#include <memory>
#include <print>
#include <ranges>
#include <utility>
#include <vector>
#include <version>

#if __has_include(<stacktrace>)
    #include <stacktrace>
#endif

namespace
{

using NameValuePairs = std::vector<std::pair<std::string, std::string>>;

// Renders "a=1, b=2", or "1, 2" for unnamed values.
std::string JoinPairs(NameValuePairs const& pairs)
{
    std::string result;
    for (auto const& [name, value]: pairs)
    {
        if (!result.empty())
            result += ", ";
        if (name.empty())
            result += value;
        else
            result += std::format("{}={}", name, value);
    }
    return result;
}

class SqlStandardLogger: public SqlLogger
{
  public:
    explicit SqlStandardLogger(SupportBindLogging supportBindLogging = SupportBindLogging::No):
        SqlLogger { supportBindLogging }
    {
    }

    void OnWarning(std::string_view const& message) override
    {
        Write("Warning", "{}", message);
    }

    void OnError(SqlError error, std::source_location /*sourceLocation*/) override
    {
        Write("Error", "{}", error);
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location /*sourceLocation*/) override
    {
        Write("Error", "SQLSTATE {}, native error {}: {}", errorInfo.sqlState, errorInfo.nativeErrorCode, errorInfo.message);
    }

    void OnTemplateError(SqlTemplateError const& error, std::source_location /*sourceLocation*/) override
    {
        if (error.parameterName.empty())
            Write("Error", "{}", error);
        else
            Write("Error", ":{}: {}", error.parameterName, error);
    }

    void OnConnectionOpened(SqlConnection const& /*connection*/) override {}
    void OnConnectionClosed(SqlConnection const& /*connection*/) override {}
    void OnExecuteDirect(std::string_view const& /*query*/) override {}
    void OnPrepare(std::string_view const& /*query*/) override {}
    void OnBind(std::string_view const& /*name*/, std::string /*value*/) override {}
    void OnExecute(std::string_view const& /*query*/) override {}
    void OnFetchRow() override {}
    void OnFetchEnd() override {}
    void OnBindIdentifier(std::string_view const& /*name*/, std::string_view const& /*quotedText*/) override {}
    void OnAssemble(std::string_view const& /*sqlText*/) override {}

  protected:
    template <typename... Args>
    void Write(std::string_view label, std::format_string<Args...> const& fmt, Args&&... args)
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::println("[{:%F %T}] {}: {}", now, label, std::format(fmt, std::forward<Args>(args)...));
    }

    void WriteSourceLocation(std::source_location sourceLocation)
    {
        std::println("    at {}:{} ({})", sourceLocation.file_name(), sourceLocation.line(), sourceLocation.function_name());
    }
};

class SqlTraceLogger: public SqlStandardLogger
{
    // The statement whose result set is currently open, if any.
    struct Statement
    {
        std::string query;
        std::chrono::steady_clock::time_point startedAt {};
        NameValuePairs binds;
        size_t rowCount {};
        bool executing = false;
    };

    Statement _statement;
    NameValuePairs _pendingBinds;

  public:
    explicit SqlTraceLogger(SupportBindLogging supportBindLogging = SupportBindLogging::Yes):
        SqlStandardLogger { supportBindLogging }
    {
    }

    void OnError(SqlError error, std::source_location sourceLocation) override
    {
        SqlStandardLogger::OnError(error, sourceLocation);
        WriteErrorContext(sourceLocation);
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        SqlStandardLogger::OnError(errorInfo, sourceLocation);
        WriteErrorContext(sourceLocation);
        _statement = {};
        _pendingBinds.clear();
    }

    void OnTemplateError(SqlTemplateError const& error, std::source_location sourceLocation) override
    {
        SqlStandardLogger::OnTemplateError(error, sourceLocation);
        WriteSourceLocation(sourceLocation);
    }

    void OnConnectionOpened(SqlConnection const& connection) override
    {
        Write("Connect", "#{} {} ({})", connection.ConnectionId(), connection.ConnectionString().Sanitized(), connection.ServerType());
    }

    void OnConnectionClosed(SqlConnection const& connection) override
    {
        Flush();
        Write("Close", "#{}", connection.ConnectionId());
    }

    // Several templates may be in use at once, so bindings are written as they happen and not
    // collected for the next assembly.
    void OnBindIdentifier(std::string_view const& name, std::string_view const& quotedText) override
    {
        Write("Bind", ":{} = {}", name, quotedText);
    }

    void OnAssemble(std::string_view const& sqlText) override
    {
        Write("Assemble", "{}", sqlText);
    }

    void OnPrepare(std::string_view const& query) override
    {
        Flush();
        _statement.query = query;
    }

    void OnExecuteDirect(std::string_view const& query) override
    {
        Flush();
        _statement.query = query;
        Start();
    }

    void OnBind(std::string_view const& name, std::string value) override
    {
        _pendingBinds.emplace_back(name, std::move(value));
    }

    void OnExecute(std::string_view const& query) override
    {
        // A prepared statement may be executed again without its result set being consumed.
        Flush();
        _statement.query = query;
        _statement.binds = std::exchange(_pendingBinds, {});
        Start();
    }

    void OnFetchRow() override
    {
        ++_statement.rowCount;
    }

    void OnFetchEnd() override
    {
        Flush();
    }

  private:
    void Start()
    {
        _statement.executing = true;
        _statement.rowCount = 0;
        _statement.startedAt = std::chrono::steady_clock::now();
    }

    // Reports the statement that ran last and forgets about it.
    void Flush()
    {
        if (!_statement.executing)
            return;

        auto const elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now()
                                                                                   - _statement.startedAt);
        auto const rows = _statement.rowCount == 1 ? std::string("1 row") : std::format("{} rows", _statement.rowCount);

        if (_statement.binds.empty())
            Write("Execute", "{:.3f} ms, {}: {}", elapsed.count() / 1'000.0, rows, _statement.query);
        else
            Write("Execute",
                  "{:.3f} ms, {}: {} WITH [{}]",
                  elapsed.count() / 1'000.0,
                  rows,
                  _statement.query,
                  JoinPairs(_statement.binds));

        _statement.executing = false;
        _statement.rowCount = 0;
        _statement.binds.clear();
    }

    void WriteErrorContext(std::source_location sourceLocation)
    {
        WriteSourceLocation(sourceLocation);
        if (!_statement.query.empty())
            std::println("    query: {}", _statement.query);

#if __has_include(<stacktrace>) && defined(__cpp_lib_stacktrace)
        auto const stackTrace = std::stacktrace::current(2, 20);
        for (auto const& [index, entry]: std::views::enumerate(stackTrace))
            std::println("    #{:<2} {}", index, std::to_string(entry));
#endif
    }
};

} // namespace

SqlLogger::Null& SqlLogger::NullLogger() noexcept
{
    static SqlLogger::Null theNullLogger {};
    return theNullLogger;
}

SqlLogger& SqlLogger::StandardLogger()
{
    static auto theStandardLogger = std::make_unique<SqlStandardLogger>();
    return *theStandardLogger;
}

SqlLogger& SqlLogger::TraceLogger()
{
    static auto theTraceLogger = std::make_unique<SqlTraceLogger>(SupportBindLogging::Yes);
    return *theTraceLogger;
}

static SqlLogger* theCurrentLogger = &SqlLogger::NullLogger();

SqlLogger& SqlLogger::GetLogger()
{
    return *theCurrentLogger;
}

void SqlLogger::SetLogger(SqlLogger& logger)
{
    theCurrentLogger = &logger;
}
