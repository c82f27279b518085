// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlIdentifierQuoting.hpp"
#include "SqlLogger.hpp"
#include "SqlTemplateError.hpp"
#include "SqlTemplateText.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

class SqlConnection;
class SqlStatement;

/// A templated SQL statement that allows for safely setting SQL identifiers.
///
/// The template is ordinary SQL with driver placeholders ("?"), plus identifier parameters such as
/// ":columnName" (see SqlTemplateText). Each identifier parameter is bound to a validated and quoted
/// identifier (or identifier list), and the assembled SQL text is then handed to the driver.
///
/// @code
/// auto tmpl = SqlIdentifierTemplate::Create(connection, "SELECT MAX(:col) FROM mytable WHERE name = ?");
/// auto stmt = SqlStatement { connection };
/// auto result = tmpl.and_then([&](SqlIdentifierTemplate& t) { return t.BindIdentifier("col", columnName); })
///                   .and_then([&](SqlIdentifierTemplate& t) { return t.Prepare(stmt); });
/// if (result)
///     stmt.Execute("foo");
/// @endcode
///
/// Parameters take the place of entire identifiers. In "SELECT * FROM :prefix_table" the parameter is
/// "prefix" and "_table" stays literal text, which yields invalid SQL once "prefix" is quoted.
/// Bind the whole name instead.
///
/// Bindings are kept per name; binding a name again replaces the previous value, and binding a name that
/// does not occur in the template has no effect on the assembled text.
/// Instances are not thread-safe.
class [[nodiscard]] SqlIdentifierTemplate
{
  public:
    using BindResult = SqlTemplateResult<std::reference_wrapper<SqlIdentifierTemplate>>;

    /// Constructs a template that quotes identifiers according to the given rules.
    SQLIDENT_API SqlIdentifierTemplate(SqlIdentifierQuoting quoting, std::string_view templateText);

    /// Constructs a template that quotes identifiers as the driver behind the connection requires.
    ///
    /// Fails with METADATA_UNAVAILABLE if the driver cannot provide its identifier quoting rules.
    [[nodiscard]] SQLIDENT_API static SqlTemplateResult<SqlIdentifierTemplate> Create(SqlConnection const& connection,
                                                                                    std::string_view templateText);

    /// Binds a single identifier to the named parameter.
    ///
    /// @param name  The parameter name, without the leading ':'.
    /// @param value The raw, unquoted identifier.
    ///
    /// Fails with INVALID_IDENTIFIER if the value is not a safe identifier, in which case any previous binding
    /// of that name is kept.
    [[nodiscard]] SQLIDENT_API BindResult BindIdentifier(std::string_view name, std::string_view value);

    /// Binds a comma-separated list of identifiers to the named parameter, e.g. for column lists.
    ///
    /// Fails with EMPTY_IDENTIFIER_LIST if no values are given, or with INVALID_IDENTIFIER if any value
    /// is not a safe identifier.
    template <std::ranges::input_range Identifiers>
        requires std::convertible_to<std::ranges::range_reference_t<Identifiers>, std::string_view>
    [[nodiscard]] BindResult BindIdentifiers(std::string_view name, Identifiers&& values);

    [[nodiscard]] BindResult BindIdentifiers(std::string_view name, std::initializer_list<std::string_view> values)
    {
        return BindIdentifiers<std::initializer_list<std::string_view> const&>(name, values);
    }

    /// Tests whether a binding exists for the given name.
    [[nodiscard]] SQLIDENT_API bool IsBound(std::string_view name) const noexcept;

    /// Assembles the SQL text from the template and the current bindings.
    ///
    /// Fails with UNBOUND_PARAMETER, naming the first parameter in template order that has no binding.
    [[nodiscard]] SQLIDENT_API SqlTemplateResult<std::string> ToSql() const;

    /// Assembles the SQL text and prepares it on the given statement.
    ///
    /// Nothing is sent to the driver if assembly fails. Fails with DRIVER_COMPILATION_FAILURE, carrying
    /// the driver's diagnostic record, if the driver rejects the text.
    [[nodiscard]] SQLIDENT_API SqlTemplateResult<void> Prepare(SqlStatement& stmt) const;

    /// Assembles the SQL text and prepares it on a new statement of the given connection.
    ///
    /// Allocating the statement is driver-layer work and throws SqlException on failure, like any
    /// other SqlStatement construction.
    [[nodiscard]] SQLIDENT_API SqlTemplateResult<SqlStatement> Prepare(SqlConnection& connection) const;

    [[nodiscard]] SqlIdentifierQuoting const& Quoting() const noexcept
    {
        return m_quoting;
    }

    [[nodiscard]] std::string const& Text() const noexcept
    {
        return m_template.Text();
    }

    [[nodiscard]] std::vector<std::string> const& Parameters() const noexcept
    {
        return m_template.Parameters();
    }

  private:
    SQLIDENT_API BindResult Fail(SqlTemplateError error, std::string_view name) const;
    SQLIDENT_API BindResult Store(std::string_view name, std::string quotedText);

    SqlIdentifierQuoting m_quoting;
    SqlTemplateText m_template;
    std::map<std::string, std::string, std::less<>> m_bindings;
};

template <std::ranges::input_range Identifiers>
    requires std::convertible_to<std::ranges::range_reference_t<Identifiers>, std::string_view>
SqlIdentifierTemplate::BindResult SqlIdentifierTemplate::BindIdentifiers(std::string_view name,
                                                                         Identifiers&& values)
{
    // Each element is validated and quoted in the same step, so the quoted text is the validated text,
    // also for ranges that produce a fresh string on every dereference.
    std::string quotedList;
    std::size_t count = 0;
    for (auto&& element: values)
    {
        auto const value = std::string_view(element);
        if (auto const valid = m_quoting.Validate(value); !valid)
            return Fail(valid.error(), name);
        if (count++ != 0)
            quotedList += ", ";
        quotedList += m_quoting.Quote(value);
    }

    if (count == 0)
        return Fail(SqlTemplateError::EmptyIdentifierList(std::string(name)), name);

    return Store(name, std::move(quotedList));
}
