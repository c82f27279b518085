// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <string>
#include <string_view>

namespace
{

constexpr std::string_view DropBraces(std::string_view value) noexcept
{
    if (value.size() >= 2 && value.front() == '{' && value.back() == '}')
    {
        value.remove_prefix(1);
        value.remove_suffix(1);
    }
    return value;
}

constexpr std::string_view Trim(std::string_view value) noexcept
{
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
        value.remove_prefix(1);

    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
        value.remove_suffix(1);

    return value;
}

std::string ToUpperCaseString(std::string_view input)
{
    std::string result { input };
    std::ranges::transform(result, result.begin(), [](char c) { return (char) std::toupper((unsigned char) c); });
    return result;
}

auto SplitPairs(std::string_view input)
{
    return input | std::views::split(';')
           | std::views::transform([](auto pairView) { return std::string_view(pairView.begin(), pairView.end()); });
}

} // end namespace

std::string SqlConnectionString::Sanitized() const
{
    return SanitizePwd(value);
}

std::string SqlConnectionString::SanitizePwd(std::string_view input)
{
    std::string result;
    result.reserve(input.size());

    for (auto const pair: SplitPairs(input))
    {
        if (!result.empty())
            result += ';';

        auto const separatorPosition = pair.find('=');
        if (separatorPosition != std::string_view::npos
            && ToUpperCaseString(Trim(pair.substr(0, separatorPosition))) == "PWD")
            result += std::format("{}=***", pair.substr(0, separatorPosition));
        else
            result += pair;
    }

    return result;
}

SqlConnectionStringMap ParseConnectionString(SqlConnectionString const& connectionString)
{
    SqlConnectionStringMap result;

    for (auto const pair: SplitPairs(connectionString.value))
    {
        auto const separatorPosition = pair.find('=');
        if (separatorPosition == std::string_view::npos)
            continue;

        auto const key = Trim(pair.substr(0, separatorPosition));
        auto const value = DropBraces(Trim(pair.substr(separatorPosition + 1)));
        result.insert_or_assign(ToUpperCaseString(key), std::string(value));
    }

    return result;
}

SqlConnectionString BuildConnectionString(SqlConnectionStringMap const& map)
{
    SqlConnectionString result;

    for (auto const& [key, value]: map)
    {
        std::string_view const delimiter = result.value.empty() ? "" : ";";
        result.value += std::format("{}{}={{{}}}", delimiter, key, value);
    }

    return result;
}
