// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include <Sqlident/SqlConnectInfo.hpp>
#include <Sqlident/SqlConnection.hpp>
#include <Sqlident/SqlDataBinder.hpp>
#include <Sqlident/SqlIdentifierTemplate.hpp>
#include <Sqlident/SqlLogger.hpp>
#include <Sqlident/SqlStatement.hpp>

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <format>
#include <ostream>
#include <print>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

#if __has_include(<stacktrace>)
    #include <stacktrace>
#endif

#if !defined(_WIN32) && !defined(_WIN64)
    #include <unistd.h>
#endif

#include <sql.h>
#include <sqlext.h>
#include <sqlspi.h>
#include <sqltypes.h>

// {{{ Catch2 printers

inline std::ostream& operator<<(std::ostream& os, SqlTemplateError const& error)
{
    return os << std::format("SqlTemplateError {{ {} }}", error);
}

inline std::ostream& operator<<(std::ostream& os, SqlTemplateErrorCode code)
{
    return os << std::format("{}", code);
}

inline std::ostream& operator<<(std::ostream& os, SqlIdentifierQuoting const& quoting)
{
    return os << std::format("SqlIdentifierQuoting {{ {}{} escape: {}, extra: \"{}\", max: {} }}",
                             quoting.openQuote,
                             quoting.closeQuote,
                             quoting.escapeRule == SqlQuoteEscapeRule::DOUBLE ? "double" : "disallow",
                             quoting.extraNameCharacters,
                             quoting.maxIdentifierLength);
}

// }}}

// In-memory SQLite through the sqliteodbc driver (http://www.ch-werner.de/sqliteodbc/).
// Every connection opens a fresh, empty database.
auto const inline DefaultTestConnectionString = SqlConnectionString {
#if defined(_WIN32) || defined(_WIN64)
    .value = "DRIVER={SQLite3 ODBC Driver};Database=file::memory:",
#else
    .value = "DRIVER=SQLite3;Database=file::memory:",
#endif
};

/// Installs the logger for the lifetime of the object, then restores the previous one.
template <typename Logger>
class ScopedSqlLogger: public Logger
{
  public:
    ScopedSqlLogger():
        m_previous { SqlLogger::GetLogger() }
    {
        SqlLogger::SetLogger(*this);
    }

    ScopedSqlLogger(ScopedSqlLogger const&) = delete;
    ScopedSqlLogger(ScopedSqlLogger&&) = delete;
    ScopedSqlLogger& operator=(ScopedSqlLogger const&) = delete;
    ScopedSqlLogger& operator=(ScopedSqlLogger&&) = delete;

    ~ScopedSqlLogger() override
    {
        SqlLogger::SetLogger(m_previous);
    }

  private:
    SqlLogger& m_previous;
};

using ScopedSqlNullLogger = ScopedSqlLogger<SqlLogger::Null>;

/// Keeps what the identifier pipeline reported, so tests can assert on it.
class SqlRecordingLogger: public SqlLogger::Null
{
  public:
    std::vector<std::string> warnings;
    std::vector<SqlTemplateError> templateErrors;
    std::vector<std::string> assembled;

    void OnWarning(std::string_view const& message) override
    {
        warnings.emplace_back(message);
    }

    void OnTemplateError(SqlTemplateError const& error, std::source_location /*sourceLocation*/) override
    {
        templateErrors.push_back(error);
    }

    void OnAssemble(std::string_view const& sqlText) override
    {
        assembled.emplace_back(sqlText);
    }
};

using ScopedSqlRecordingLogger = ScopedSqlLogger<SqlRecordingLogger>;

#if !defined(_WIN32) && !defined(_WIN64)
/// Redirects the process' standard output into a temporary file until Text() is called.
class ScopedStdoutCapture
{
  public:
    ScopedStdoutCapture():
        m_file { std::tmpfile() }
    {
        if (!m_file)
            return;
        std::fflush(stdout);
        m_savedStdout = dup(STDOUT_FILENO);
        dup2(fileno(m_file), STDOUT_FILENO);
    }

    ScopedStdoutCapture(ScopedStdoutCapture const&) = delete;
    ScopedStdoutCapture(ScopedStdoutCapture&&) = delete;
    ScopedStdoutCapture& operator=(ScopedStdoutCapture const&) = delete;
    ScopedStdoutCapture& operator=(ScopedStdoutCapture&&) = delete;

    ~ScopedStdoutCapture()
    {
        Restore();
        if (m_file)
            std::fclose(m_file);
    }

    [[nodiscard]] bool IsCapturing() const noexcept
    {
        return m_file != nullptr;
    }

    /// Ends the capture and returns everything written so far.
    std::string Text()
    {
        Restore();
        if (!m_file)
            return {};

        std::string text;
        char buffer[512];
        std::rewind(m_file);
        while (auto const count = std::fread(buffer, 1, sizeof(buffer), m_file))
            text.append(buffer, count);
        return text;
    }

  private:
    void Restore()
    {
        if (m_savedStdout < 0)
            return;
        std::fflush(stdout);
        dup2(m_savedStdout, STDOUT_FILENO);
        close(m_savedStdout);
        m_savedStdout = -1;
    }

    std::FILE* m_file;
    int m_savedStdout = -1;
};
#endif

/// The logger installed while the test suite runs.
///
/// Driver errors and warnings surface as Catch2 warnings. Everything else is attached to the
/// next assertion as unscoped info, which Catch2 prints only when that assertion fails.
class TestSuiteSqlLogger: public SqlLogger::Null
{
  public:
    static TestSuiteSqlLogger& Instance() noexcept
    {
        static TestSuiteSqlLogger theLogger;
        return theLogger;
    }

    void OnWarning(std::string_view const& message) override
    {
        WARN(std::string(message));
    }

    void OnError(SqlError error, std::source_location sourceLocation) override
    {
        WARN(std::format("SQL error: {}", error));
        Trace(sourceLocation);
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        WARN(std::format("SQL error: {}", errorInfo));
        Trace(sourceLocation);
    }

    // Most template failures are the expected outcome of the test at hand.
    void OnTemplateError(SqlTemplateError const& error, std::source_location /*sourceLocation*/) override
    {
        Info("template error: {}", error);
    }

    void OnBindIdentifier(std::string_view const& name, std::string_view const& quotedText) override
    {
        Info(":{} -> {}", name, quotedText);
    }

    void OnAssemble(std::string_view const& sqlText) override
    {
        Info("assembled: {}", sqlText);
    }

    void OnPrepare(std::string_view const& query) override
    {
        m_query = query;
    }

    void OnExecuteDirect(std::string_view const& query) override
    {
        m_query = query;
        Info("execute directly: {}", query);
    }

    void OnExecute(std::string_view const& query) override
    {
        Info("execute: {}", query);
    }

  private:
    template <typename... Args>
    static void Info(std::format_string<Args...> const& fmt, Args&&... args)
    {
        UNSCOPED_INFO(std::format("[Sqlident] {}", std::format(fmt, std::forward<Args>(args)...)));
    }

    void Trace(std::source_location sourceLocation)
    {
        Info("at {}:{}", sourceLocation.file_name(), sourceLocation.line());
        if (!m_query.empty())
            Info("last query: {}", m_query);

#if __has_include(<stacktrace>) && defined(__cpp_lib_stacktrace)
        for (auto const& [depth, frame]: std::views::enumerate(std::stacktrace::current(1, 25)))
            Info("  #{:<2} {}", depth, std::to_string(frame));
#endif
    }

    std::string m_query;
};

/// Base of every test case that talks to a database.
///
/// Without a reachable database these tests are skipped; the pure ones still run.
class SqlTestFixture
{
  public:
    static inline bool odbcTrace = false;
    static inline bool databaseAvailable = false;

    using MainProgramArgs = std::tuple<int, char**>;

    /// Consumes the test driver's own options from the front of the command line and leaves the
    /// rest for Catch2. Returns an exit code instead when the program should stop.
    static std::variant<MainProgramArgs, int> Initialize(int argc, char** argv)
    {
        using namespace std::string_view_literals;

        SqlLogger::SetLogger(TestSuiteSqlLogger::Instance());

        auto consumed = 0;
        while (consumed + 1 < argc)
        {
            auto const arg = std::string_view(argv[consumed + 1]);
            if (arg == "--trace-sql"sv)
                SqlLogger::SetLogger(SqlLogger::TraceLogger());
            else if (arg == "--trace-odbc"sv)
                odbcTrace = true;
            else if (arg == "--help"sv || arg == "-h"sv)
            {
                std::println("{} [--trace-sql] [--trace-odbc] [[--] [Catch2 flags ...]]", argv[0]);
                return { EXIT_SUCCESS };
            }
            else if (arg != "--"sv)
                break;
            ++consumed;
            if (arg == "--"sv)
                break;
        }

        // Catch2 expects the program name in front of its own arguments.
        argv[consumed] = argv[0];

        SqlConnection::SetDefaultConnectionString(ConnectionStringFromEnvironment());
        SqlConnection::SetPostConnectedHook(&SqlTestFixture::PostConnectedHook);

        auto connection = SqlConnection();
        databaseAvailable = connection.IsAlive();
        if (databaseAvailable)
            std::println("Running test cases against: {} ({}) (identified as: {})",
                         connection.ServerName(),
                         connection.ServerVersion(),
                         connection.ServerType());
        else
            std::println("No database reachable, skipping driver tests: {}", connection.LastError());

        return MainProgramArgs { argc - consumed, argv + consumed };
    }

    static void PostConnectedHook(SqlConnection& connection)
    {
#if !defined(_WIN32) && !defined(_WIN64)
        if (!odbcTrace)
            return;
        SQLSetConnectAttrA(connection.NativeHandle(), SQL_ATTR_TRACEFILE, (SQLPOINTER) "/dev/stdout", SQL_NTS);
        SQLSetConnectAttrA(
            connection.NativeHandle(), SQL_ATTR_TRACE, (SQLPOINTER) SQL_OPT_TRACE_ON, SQL_IS_UINTEGER);
#else
        (void) connection;
#endif
    }

    SqlTestFixture()
    {
        if (!databaseAvailable)
            SKIP("No database connection available");
        REQUIRE(SqlConnection().IsAlive());
    }

    SqlTestFixture(SqlTestFixture const&) = delete;
    SqlTestFixture(SqlTestFixture&&) = delete;
    SqlTestFixture& operator=(SqlTestFixture const&) = delete;
    SqlTestFixture& operator=(SqlTestFixture&&) = delete;
    virtual ~SqlTestFixture() = default;

  private:
    static SqlConnectionString ConnectionStringFromEnvironment()
    {
#if defined(_MSC_VER)
        char* value = nullptr;
        size_t length = 0;
        _dupenv_s(&value, &length, "ODBC_CONNECTION_STRING");
        auto const text = std::string(value ? value : "");
        std::free(value);
#else
        auto const* value = std::getenv("ODBC_CONNECTION_STRING");
        auto const text = std::string(value ? value : "");
#endif

        if (text.empty())
        {
            std::println("Using default ODBC connection string: '{}'", DefaultTestConnectionString.value);
            return DefaultTestConnectionString;
        }

        std::println("Using ODBC connection string: '{}'", SqlConnectionString::SanitizePwd(text));
        return SqlConnectionString { text };
    }
};
