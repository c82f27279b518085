// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <string>
#include <string_view>
#include <vector>

/// SQL text split into literal segments and the identifier parameters between them.
///
/// A parameter is written as ':' followed by one or more ASCII letters or digits, e.g. ":tableName".
/// The name is the maximal run of alphanumerics after the colon, so ":foo-10" is the parameter "foo"
/// followed by the literal "-10", and ":schema.:table" is two parameters separated by ".".
/// A ':' that is not followed by an alphanumeric character is literal text.
///
/// Literals()[i] precedes Parameters()[i]. There is one more literal than parameters,
/// except when the text ends with a parameter, in which case both counts are equal.
class [[nodiscard]] SqlTemplateText
{
  public:
    /// The character introducing an identifier parameter.
    static constexpr char Marker = ':';

    /// Splits the given text. Never fails.
    SQLIDENT_API static SqlTemplateText Parse(std::string_view text);

    [[nodiscard]] std::string const& Text() const noexcept
    {
        return m_text;
    }

    [[nodiscard]] std::vector<std::string> const& Literals() const noexcept
    {
        return m_literals;
    }

    /// Parameter names in order of appearance, without the marker. Repeated names appear once per occurrence.
    [[nodiscard]] std::vector<std::string> const& Parameters() const noexcept
    {
        return m_parameters;
    }

    /// Tests whether the given name occurs at least once.
    [[nodiscard]] SQLIDENT_API bool HasParameter(std::string_view name) const noexcept;

  private:
    SqlTemplateText() = default;

    std::string m_text;
    std::vector<std::string> m_literals;
    std::vector<std::string> m_parameters;
};
