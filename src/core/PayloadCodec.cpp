#include "qrpass/core/PayloadCodec.hpp"
#include <QChar>
#include <QString>
#include <algorithm>
#include <array>

namespace qrpass::core
{
namespace
{

[[nodiscard]] QString fromUtf8(std::string_view raw)
{
    return QString::fromUtf8(raw.data(), static_cast<qsizetype>(raw.size()));
}

[[nodiscard]] bool containsLineBreak(std::string_view s) noexcept
{
    return s.find_first_of("\r\n") != std::string_view::npos;
}

[[nodiscard]] bool isValidTextField(std::string_view raw)
{
    if (containsLineBreak(raw))
    {
        return false;
    }
    // trimmed() strips every Unicode space (NBSP, U+3000, ...), not just ASCII.
    const auto codePoints{ fromUtf8(raw).trimmed().toUcs4() };
    return static_cast<std::size_t>(codePoints.size()) >= g_minTextFieldChars;
}

[[nodiscard]] std::optional<std::string> takeLabeled(std::string_view line, std::string_view label)
{
    if (!line.starts_with(label))
    {
        return std::nullopt;
    }
    return std::string{ line.substr(label.size()) };
}

} // namespace

std::string_view describe(ValidationError error) noexcept
{
    switch (error)
    {
    case ValidationError::InvalidName:
        return "name must contain at least 2 characters";
    case ValidationError::InvalidId:
        return "employee id must contain digits only";
    case ValidationError::InvalidDepartment:
        return "department must contain at least 2 characters";
    }
    return "invalid input";
}

bool PayloadCodec::isValidName(std::string_view raw)
{
    return isValidTextField(raw);
}

bool PayloadCodec::isValidEmployeeId(std::string_view raw)
{
    // Any Unicode decimal digit (Nd) counts, so Arabic-Indic ids such as "١٢٣" are accepted.
    const auto codePoints{ fromUtf8(raw).toUcs4() };
    if (codePoints.isEmpty())
    {
        return false;
    }
    return std::all_of(codePoints.cbegin(), codePoints.cend(),
                       [](auto c) { return QChar::isDigit(static_cast<char32_t>(c)); });
}

bool PayloadCodec::isValidDepartment(std::string_view raw)
{
    return isValidTextField(raw);
}

ValidationResult<EmployeeRecord> PayloadCodec::validate(const EmployeeFields& fields)
{
    if (!isValidName(fields.name))
    {
        return ValidationError::InvalidName;
    }
    if (!isValidEmployeeId(fields.employeeId))
    {
        return ValidationError::InvalidId;
    }
    if (!isValidDepartment(fields.department))
    {
        return ValidationError::InvalidDepartment;
    }

    return EmployeeRecord{
        .name = fields.name,
        .employeeId = fields.employeeId,
        .department = fields.department,
        .notes = fields.notes,
    };
}

std::string PayloadCodec::serialize(const EmployeeRecord& record)
{
    std::string out{};
    out.reserve(g_nameLabel.size() + g_employeeIdLabel.size() + g_departmentLabel.size() + g_notesLabel.size() +
                record.name.size() + record.employeeId.size() + record.department.size() + record.notes.size() + 3U);

    out.append(g_nameLabel).append(record.name);
    out.push_back('\n');
    out.append(g_employeeIdLabel).append(record.employeeId);
    out.push_back('\n');
    out.append(g_departmentLabel).append(record.department);
    if (!record.notes.empty())
    {
        out.push_back('\n');
        out.append(g_notesLabel).append(record.notes);
    }
    return out;
}

std::optional<EmployeeRecord> PayloadCodec::parse(std::string_view text)
{
    // The first three lines are fixed; everything after the third newline is the notes line.
    std::array<std::string_view, 3> lines{};
    std::string_view rest{ text };
    for (std::size_t i{}; i < lines.size(); ++i)
    {
        const auto nl{ rest.find('\n') };
        if (nl == std::string_view::npos)
        {
            if (i + 1U != lines.size())
            {
                return std::nullopt;
            }
            lines[i] = rest;
            rest = {};
            break;
        }
        lines[i] = rest.substr(0, nl);
        rest.remove_prefix(nl + 1U);
        if (i + 1U == lines.size() && rest.empty())
        {
            // "...\n" with nothing after it: a notes line was started but is missing its label.
            return std::nullopt;
        }
    }

    auto name{ takeLabeled(lines[0], g_nameLabel) };
    auto employeeId{ takeLabeled(lines[1], g_employeeIdLabel) };
    auto department{ takeLabeled(lines[2], g_departmentLabel) };
    if (!name || !employeeId || !department)
    {
        return std::nullopt;
    }

    EmployeeRecord record{
        .name = std::move(*name),
        .employeeId = std::move(*employeeId),
        .department = std::move(*department),
        .notes = {},
    };

    if (!rest.empty())
    {
        auto notes{ takeLabeled(rest, g_notesLabel) };
        if (!notes || notes->empty())
        {
            return std::nullopt;
        }
        record.notes = std::move(*notes);
    }
    return record;
}

} // namespace qrpass::core
