// SPDX-License-Identifier: Apache-2.0

#include "SqlTemplateText.hpp"

#include <algorithm>

namespace
{

constexpr bool IsParameterNameChar(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

} // namespace

SqlTemplateText SqlTemplateText::Parse(std::string_view text)
{
    auto result = SqlTemplateText {};
    result.m_text = std::string(text);

    size_t literalStart = 0;
    size_t pos = 0;

    while (pos < text.size())
    {
        if (text[pos] != Marker || pos + 1 >= text.size() || !IsParameterNameChar(text[pos + 1]))
        {
            ++pos;
            continue;
        }

        auto nameEnd = pos + 1;
        while (nameEnd < text.size() && IsParameterNameChar(text[nameEnd]))
            ++nameEnd;

        result.m_literals.emplace_back(text.substr(literalStart, pos - literalStart));
        result.m_parameters.emplace_back(text.substr(pos + 1, nameEnd - pos - 1));

        pos = nameEnd;
        literalStart = nameEnd;
    }

    if (literalStart < text.size() || result.m_parameters.empty())
        result.m_literals.emplace_back(text.substr(literalStart));

    return result;
}

bool SqlTemplateText::HasParameter(std::string_view name) const noexcept
{
    return std::ranges::find(m_parameters, name) != m_parameters.end();
}
