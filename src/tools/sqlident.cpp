// SPDX-License-Identifier: Apache-2.0

#include <Sqlident/SqlConnectInfo.hpp>
#include <Sqlident/SqlConnection.hpp>
#include <Sqlident/SqlIdentifierTemplate.hpp>
#include <Sqlident/SqlLogger.hpp>
#include <Sqlident/SqlStatement.hpp>

#include <cstdlib>
#include <optional>
#include <print>
#include <ranges>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace
{

struct Binding
{
    std::string_view name;
    std::vector<std::string_view> values;
    bool isList = false;
};

std::optional<SqlServerType> ParseDialect(std::string_view name)
{
    using namespace std::string_view_literals;
    if (name == "ansi"sv)
        return SqlServerType::UNKNOWN;
    if (name == "sqlite"sv)
        return SqlServerType::SQLITE;
    if (name == "postgresql"sv)
        return SqlServerType::POSTGRESQL;
    if (name == "mssql"sv)
        return SqlServerType::MICROSOFT_SQL;
    if (name == "mysql"sv)
        return SqlServerType::MYSQL;
    if (name == "oracle"sv)
        return SqlServerType::ORACLE;
    return std::nullopt;
}

// Splits "name=value" at the first '='.
std::optional<Binding> ParseBinding(std::string_view argument, bool isList)
{
    auto const separator = argument.find('=');
    if (separator == std::string_view::npos || separator == 0)
        return std::nullopt;

    auto binding = Binding { .name = argument.substr(0, separator), .values = {}, .isList = isList };
    auto const value = argument.substr(separator + 1);
    if (!isList)
        binding.values.push_back(value);
    else if (!value.empty())
        for (auto const part: std::views::split(value, ','))
            binding.values.emplace_back(part.begin(), part.end());
    return binding;
}

} // end namespace

struct Configuration
{
    std::string_view connectionString;
    SqlServerType dialect = SqlServerType::UNKNOWN;
    std::string_view templateText;
    std::vector<Binding> bindings;
};

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::variant<Configuration, int> ParseArguments(int argc, char const* argv[])
{
    using namespace std::string_view_literals;
    auto config = Configuration {};

    int i = 1;

    for (; i < argc; ++i)
    {
        if (argv[i] == "--trace-sql"sv)
            SqlLogger::SetLogger(SqlLogger::TraceLogger());
        else if (argv[i] == "--connection-string"sv)
        {
            if (++i >= argc)
                return { EXIT_FAILURE };
            config.connectionString = argv[i];
        }
        else if (argv[i] == "--dialect"sv)
        {
            if (++i >= argc)
                return { EXIT_FAILURE };
            auto const dialect = ParseDialect(argv[i]);
            if (!dialect)
            {
                std::println("Unknown dialect: {}", argv[i]);
                return { EXIT_FAILURE };
            }
            config.dialect = *dialect;
        }
        else if (argv[i] == "--bind"sv || argv[i] == "--bind-list"sv)
        {
            auto const isList = argv[i] == "--bind-list"sv;
            if (++i >= argc)
                return { EXIT_FAILURE };
            auto binding = ParseBinding(argv[i], isList);
            if (!binding)
            {
                std::println("Invalid binding (expected NAME=VALUE): {}", argv[i]);
                return { EXIT_FAILURE };
            }
            config.bindings.emplace_back(std::move(*binding));
        }
        else if (argv[i] == "--help"sv || argv[i] == "-h"sv)
        {
            std::println("Usage: {} [options] TEMPLATE", argv[0]);
            std::println("Options:");
            std::println("  --trace-sql               Enable SQL tracing");
            std::println("  --connection-string STR   ODBC connection string to prepare the statement against");
            std::println("  --dialect NAME            Quoting rules: ansi, sqlite, postgresql, mssql, mysql, oracle");
            std::println("  --bind NAME=VALUE         Bind an identifier");
            std::println("  --bind-list NAME=A,B,...  Bind an identifier list");
            std::println("  --help, -h                Display this information");
            std::println("");
            std::println("Without --connection-string, ODBC_CONNECTION_STRING is used if set.");
            std::println("Without either, the SQL text is assembled for the selected dialect only.");
            return { EXIT_SUCCESS };
        }
        else if (argv[i] == "--"sv)
        {
            ++i;
            break;
        }
        else if (argv[i][0] == '-')
        {
            std::println("Unknown option: {}", argv[i]);
            return { EXIT_FAILURE };
        }
        else
            break;
    }

    if (i + 1 != argc)
    {
        std::println("Expected exactly one template argument. Use --help for usage.");
        return { EXIT_FAILURE };
    }
    config.templateText = argv[i];

    if (config.connectionString.empty())
        if (auto const* s = std::getenv("ODBC_CONNECTION_STRING"); s && *s)
            config.connectionString = s;

    return { config };
}

bool BindAll(SqlIdentifierTemplate& tmpl, std::vector<Binding> const& bindings)
{
    for (auto const& binding: bindings)
    {
        auto const result = binding.isList ? tmpl.BindIdentifiers(binding.name, binding.values)
                                           : tmpl.BindIdentifier(binding.name, binding.values.front());
        if (!result)
        {
            std::println("Failed to bind parameter \"{}\": {}", binding.name, result.error());
            return false;
        }
    }
    return true;
}

int RenderOffline(Configuration const& config)
{
    auto tmpl = SqlIdentifierTemplate { SqlIdentifierQuoting::ForServer(config.dialect), config.templateText };
    if (!BindAll(tmpl, config.bindings))
        return EXIT_FAILURE;

    auto const sql = tmpl.ToSql();
    if (!sql)
    {
        std::println("{}", sql.error());
        return EXIT_FAILURE;
    }

    std::println("{}", *sql);
    return EXIT_SUCCESS;
}

int PrepareOnline(Configuration const& config)
{
    auto const connectionString = SqlConnectionString { std::string(config.connectionString) };
    SqlConnection::SetDefaultConnectionString(connectionString);

    auto connection = SqlConnection {};
    if (!connection.IsAlive())
    {
        std::println("Failed to connect to {}: {}", connectionString.Sanitized(), connection.LastError());
        return EXIT_FAILURE;
    }

    auto tmpl = SqlIdentifierTemplate::Create(connection, config.templateText);
    if (!tmpl)
    {
        std::println("{}", tmpl.error());
        return EXIT_FAILURE;
    }

    if (!BindAll(*tmpl, config.bindings))
        return EXIT_FAILURE;

    auto const stmt = tmpl->Prepare(connection);
    if (!stmt)
    {
        std::println("{}", stmt.error());
        return EXIT_FAILURE;
    }

    std::println("Server         : {} ({})", connection.ServerName(), connection.ServerType());
    std::println("Identifiers    : {}", tmpl->Parameters().size());
    std::println("{}", stmt->PreparedQuery());
    return EXIT_SUCCESS;
}

int main(int argc, char const* argv[])
{
    // Warnings and errors go to the console unless --trace-sql asks for more.
    SqlLogger::SetLogger(SqlLogger::StandardLogger());

    auto const configOpt = ParseArguments(argc, argv);
    if (auto const* exitCode = std::get_if<int>(&configOpt))
        return *exitCode;
    auto const& config = std::get<Configuration>(configOpt);

    if (config.connectionString.empty())
        return RenderOffline(config);

    return PrepareOnline(config);
}
