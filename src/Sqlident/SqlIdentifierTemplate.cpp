// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"
#include "SqlIdentifierTemplate.hpp"
#include "SqlStatement.hpp"

#include <format>

SqlIdentifierTemplate::SqlIdentifierTemplate(SqlIdentifierQuoting quoting, std::string_view templateText):
    m_quoting { std::move(quoting) },
    m_template { SqlTemplateText::Parse(templateText) }
{
}

SqlTemplateResult<SqlIdentifierTemplate> SqlIdentifierTemplate::Create(SqlConnection const& connection,
                                                                       std::string_view templateText)
{
    auto quoting = connection.IdentifierQuoting();
    if (!quoting)
    {
        SqlLogger::GetLogger().OnTemplateError(quoting.error());
        return std::unexpected { std::move(quoting.error()) };
    }

    return SqlIdentifierTemplate { std::move(*quoting), templateText };
}

SqlIdentifierTemplate::BindResult SqlIdentifierTemplate::BindIdentifier(std::string_view name, std::string_view value)
{
    if (auto const valid = m_quoting.Validate(value); !valid)
        return Fail(valid.error(), name);

    return Store(name, m_quoting.Quote(value));
}

SqlIdentifierTemplate::BindResult SqlIdentifierTemplate::Fail(SqlTemplateError error, std::string_view name) const
{
    error.parameterName = std::string(name);
    SqlLogger::GetLogger().OnTemplateError(error);
    return std::unexpected { std::move(error) };
}

SqlIdentifierTemplate::BindResult SqlIdentifierTemplate::Store(std::string_view name, std::string quotedText)
{
    SqlLogger::GetLogger().OnBindIdentifier(name, quotedText);
    m_bindings.insert_or_assign(std::string(name), std::move(quotedText));
    return std::ref(*this);
}

bool SqlIdentifierTemplate::IsBound(std::string_view name) const noexcept
{
    return m_bindings.contains(name);
}

SqlTemplateResult<std::string> SqlIdentifierTemplate::ToSql() const
{
    auto const& literals = m_template.Literals();
    auto const& parameters = m_template.Parameters();

    std::string sql;
    sql.reserve(m_template.Text().size());

    for (size_t i = 0; i < parameters.size(); ++i)
    {
        auto const binding = m_bindings.find(parameters[i]);
        if (binding == m_bindings.end())
        {
            auto error = SqlTemplateError::UnboundParameter(parameters[i]);
            SqlLogger::GetLogger().OnTemplateError(error);
            return std::unexpected { std::move(error) };
        }
        sql += literals[i];
        sql += binding->second;
    }

    if (literals.size() > parameters.size())
        sql += literals.back();

    for (auto const& [name, _]: m_bindings)
        if (!m_template.HasParameter(name))
            SqlLogger::GetLogger().OnWarning(
                std::format("Identifier parameter \"{}\" is bound but does not occur in the template.", name));

    SqlLogger::GetLogger().OnAssemble(sql);
    return sql;
}

SqlTemplateResult<void> SqlIdentifierTemplate::Prepare(SqlStatement& stmt) const
{
    auto sql = ToSql();
    if (!sql)
        return std::unexpected { std::move(sql.error()) };

    try
    {
        stmt.Prepare(*sql);
    }
    catch (SqlException const& e)
    {
        // Already reported to the logger when the exception was raised.
        return std::unexpected { SqlTemplateError::DriverCompilationFailure(e.info()) };
    }

    return {};
}

SqlTemplateResult<SqlStatement> SqlIdentifierTemplate::Prepare(SqlConnection& connection) const
{
    auto stmt = SqlStatement { connection };
    if (auto result = Prepare(stmt); !result)
        return std::unexpected { std::move(result.error()) };
    return stmt;
}
