// SPDX-License-Identifier: Apache-2.0

#include <Sqlident/SqlConnectInfo.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

TEST_CASE("SanitizePwd", "[SqlConnectInfo]")
{
    CHECK(SqlConnectionString::SanitizePwd("DRIVER=SQLite3;PWD=secret;UID=me") == "DRIVER=SQLite3;PWD=***;UID=me");
    CHECK(SqlConnectionString::SanitizePwd("Pwd=secret") == "Pwd=***");
    CHECK(SqlConnectionString::SanitizePwd("DSN=x;UID=me") == "DSN=x;UID=me");
    CHECK(SqlConnectionString::SanitizePwd("") == "");

    auto const connectionString = SqlConnectionString { "DSN=x; pwd =hunter2" };
    CHECK(connectionString.Sanitized() == "DSN=x; pwd =***");
}

TEST_CASE("ParseConnectionString", "[SqlConnectInfo]")
{
    auto const map = ParseConnectionString(SqlConnectionString { "Driver={SQLite3}; database = file::memory: ;flag" });
    CHECK(map.size() == 2);
    CHECK(map.at("DRIVER") == "SQLite3");
    CHECK(map.at("DATABASE") == "file::memory:");
}

TEST_CASE("BuildConnectionString", "[SqlConnectInfo]")
{
    auto const map = SqlConnectionStringMap {
        { "DRIVER", "SQLite3" },
        { "DATABASE", "file::memory:" },
    };
    auto const connectionString = BuildConnectionString(map);
    CHECK(connectionString.value == "DATABASE={file::memory:};DRIVER={SQLite3}");
    CHECK(ParseConnectionString(connectionString) == map);
}

TEST_CASE("SqlConnectionDataSource", "[SqlConnectInfo]")
{
    auto const dataSource = SqlConnectionDataSource {
        .datasource = "test",
        .username = "me",
        .password = "secret",
        .timeout = std::chrono::seconds(10),
    };
    auto const connectionString = dataSource.ToConnectionString();
    CHECK(connectionString.value == "DSN=test;UID=me;PWD=secret;TIMEOUT=10");
    CHECK(connectionString.Sanitized() == "DSN=test;UID=me;PWD=***;TIMEOUT=10");
}
