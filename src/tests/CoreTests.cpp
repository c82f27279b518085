// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <Sqlident/SqlConnection.hpp>
#include <Sqlident/SqlDataBinder.hpp>
#include <Sqlident/SqlStatement.hpp>

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <stdexcept>

// NOLINTBEGIN(readability-container-size-empty)

#if defined(_MSC_VER)
    // Disable the warning C4834: discarding return value of function with 'nodiscard' attribute.
    // Because we are simply testing and demonstrating the library and not using it in production code.
    #pragma warning(disable : 4834)
#endif

using namespace std::string_view_literals;

int main(int argc, char** argv)
{
    auto result = SqlTestFixture::Initialize(argc, argv);
    if (auto const* exitCode = std::get_if<int>(&result))
        return *exitCode;

    std::tie(argc, argv) = std::get<SqlTestFixture::MainProgramArgs>(result);

    return Catch::Session().run(argc, argv);
}

TEST_CASE_METHOD(SqlTestFixture, "select: get columns")
{
    auto stmt = SqlStatement {};
    stmt.ExecuteDirect("SELECT 42");
    REQUIRE(stmt.FetchRow());
    REQUIRE(stmt.GetColumn<int>(1) == 42);
    REQUIRE(!stmt.FetchRow());
}

TEST_CASE_METHOD(SqlTestFixture, "select: get nullable and string columns")
{
    auto stmt = SqlStatement {};
    stmt.ExecuteDirect("SELECT NULL, 'Hello'");
    REQUIRE(stmt.NumColumnsAffected() == 2);
    REQUIRE(stmt.FetchRow());
    CHECK(!stmt.GetNullableColumn<int>(1).has_value());
    CHECK(stmt.GetColumn<std::string>(2) == "Hello");
    CHECK(!stmt.FetchRow());
}

TEST_CASE_METHOD(SqlTestFixture, "move semantics", "[SqlConnection]")
{
    auto a = SqlConnection {};
    CHECK(a.IsAlive());

    auto b = std::move(a);
    CHECK(!a.IsAlive());
    CHECK(b.IsAlive());

    auto c = SqlConnection(std::move(b));
    CHECK(!a.IsAlive());
    CHECK(!b.IsAlive());
    CHECK(c.IsAlive());
}

TEST_CASE_METHOD(SqlTestFixture, "move semantics", "[SqlStatement]")
{
    auto conn = SqlConnection {};

    auto const TestRun = [](SqlStatement& stmt) {
        stmt.ExecuteDirect("SELECT 42");
        REQUIRE(stmt.FetchRow());
        CHECK(stmt.GetColumn<int>(1) == 42);
        CHECK(!stmt.FetchRow());
    };

    auto a = SqlStatement { conn };
    CHECK(&conn == &a.Connection());
    CHECK(a.Connection().IsAlive());
    TestRun(a);

    auto b = std::move(a);
    CHECK(!a.IsAlive());
    CHECK(&conn == &b.Connection());
    TestRun(b);

    auto c = SqlStatement(std::move(b));
    CHECK(!b.IsAlive());
    CHECK(c.IsAlive());
    TestRun(c);
}

TEST_CASE_METHOD(SqlTestFixture, "connection metadata", "[SqlConnection]")
{
    auto conn = SqlConnection {};
    CHECK(!conn.ServerName().empty());
    CHECK_NOTHROW(conn.ServerVersion());
    CHECK_NOTHROW(conn.DatabaseName());
    CHECK_NOTHROW(conn.UserName());
    CHECK(conn.ConnectionString() == SqlConnection::DefaultConnectionString());

    auto const quoteChar = conn.IdentifierQuoteChar();
    INFO(std::format("Identifier quote: '{}', special characters: '{}', max column name length: {}",
                     quoteChar,
                     conn.SpecialCharacters(),
                     conn.MaxColumnNameLength()));
    CHECK(!quoteChar.empty());
}

TEST_CASE_METHOD(SqlTestFixture, "execute: parameter count mismatch")
{
    auto logger = ScopedSqlNullLogger {};
    auto stmt = SqlStatement {};
    stmt.Prepare("SELECT ?");
    CHECK_THROWS_AS(stmt.Execute(), std::invalid_argument);
    CHECK_THROWS_AS(stmt.Execute(1, 2), std::invalid_argument);
}

TEST_CASE_METHOD(SqlTestFixture, "execute: driver error")
{
    auto logger = ScopedSqlNullLogger {};
    auto stmt = SqlStatement {};
    try
    {
        stmt.ExecuteDirect("THIS IS NOT SQL");
        FAIL("Expected an SqlException");
    }
    catch (SqlException const& e)
    {
        CHECK(!e.info().message.empty());
        CHECK(e.info().sqlState.size() == 5);
    }
}

TEST_CASE_METHOD(SqlTestFixture, "post connected hook", "[SqlConnection]")
{
    auto called = 0;
    SqlConnection::SetPostConnectedHook([&](SqlConnection&) { ++called; });
    {
        auto conn = SqlConnection {};
        CHECK(conn.IsAlive());
    }
    SqlConnection::SetPostConnectedHook(&SqlTestFixture::PostConnectedHook);
    CHECK(called == 1);
}

TEST_CASE("connect failure reports error", "[SqlConnection]")
{
    auto logger = ScopedSqlNullLogger {};
    auto conn = SqlConnection { std::nullopt };
    CHECK(!conn.Connect(SqlConnectionString { "DRIVER={NoSuchDriverInstalled}" }));
    CHECK(!conn.IsAlive());
    CHECK(!conn.LastError().message.empty());
}

TEST_CASE("SqlError formatting", "[SqlError]")
{
    CHECK(std::format("{}", SqlError::FAILURE) == "SQL_ERROR");
    CHECK(std::error_code(SqlError::INVALID_ARGUMENT).category().name() == "Sqlident.ODBC"sv);

    auto const info = SqlErrorInfo { .nativeErrorCode = 7, .sqlState = "42S02", .message = "no such table" };
    CHECK(std::format("{}", info) == "42S02 (7) - no such table");
}

// NOLINTEND(readability-container-size-empty)
