#include "qrpass/core/PayloadCodec.hpp"
#include <gtest/gtest.h>
#include <string>
#include <variant>

using qrpass::core::EmployeeFields;
using qrpass::core::EmployeeRecord;
using qrpass::core::PayloadCodec;
using qrpass::core::ValidationError;

namespace
{

EmployeeFields validFields()
{
    return EmployeeFields{ .name = "أحمد علي", .employeeId = "12345", .department = "المالية", .notes = {} };
}

ValidationError errorOf(const EmployeeFields& fields)
{
    const auto result{ PayloadCodec::validate(fields) };
    EXPECT_TRUE(std::holds_alternative<ValidationError>(result));
    return std::get<ValidationError>(result);
}

} // namespace

TEST(PayloadCodec, AcceptsValidFieldsVerbatim)
{
    auto fields{ validFields() };
    fields.name = "  أحمد علي ";
    fields.notes = "مدير";

    const auto result{ PayloadCodec::validate(fields) };
    ASSERT_TRUE(std::holds_alternative<EmployeeRecord>(result));
    const auto& record{ std::get<EmployeeRecord>(result) };
    EXPECT_EQ(record.name, "  أحمد علي ");
    EXPECT_EQ(record.employeeId, "12345");
    EXPECT_EQ(record.department, "المالية");
    EXPECT_EQ(record.notes, "مدير");
}

TEST(PayloadCodec, NameNeedsTwoCharactersAfterTrimming)
{
    auto fields{ validFields() };
    fields.name = " أ ";
    EXPECT_EQ(errorOf(fields), ValidationError::InvalidName);

    fields.name = "";
    EXPECT_EQ(errorOf(fields), ValidationError::InvalidName);

    // Two Arabic letters are four UTF-8 bytes but two characters.
    fields.name = "أب";
    EXPECT_TRUE(std::holds_alternative<EmployeeRecord>(PayloadCodec::validate(fields)));
}

TEST(PayloadCodec, TrimmingCoversUnicodeSpaces)
{
    auto fields{ validFields() };
    // No-break space and ideographic space around a single letter.
    fields.name = "\u00A0أ\u00A0";
    EXPECT_EQ(errorOf(fields), ValidationError::InvalidName);
    fields.name = "\u3000أ\u3000";
    EXPECT_EQ(errorOf(fields), ValidationError::InvalidName);
    fields.name = "\u00A0\u3000";
    EXPECT_EQ(errorOf(fields), ValidationError::InvalidName);

    fields = validFields();
    fields.department = "\u3000ق\u00A0";
    EXPECT_EQ(errorOf(fields), ValidationError::InvalidDepartment);

    fields.department = "\u00A0قسم\u00A0";
    EXPECT_TRUE(std::holds_alternative<EmployeeRecord>(PayloadCodec::validate(fields)));
}

TEST(PayloadCodec, IdMustBeDigitsOnlyWithoutWhitespace)
{
    auto fields{ validFields() };
    for (const char* bad : { "", "12A45", " 123", "123 ", "-1", "1.5", "\u00A0123", "١٢٣ ", "\u3000١٢٣", "١٢x" })
    {
        fields.employeeId = bad;
        EXPECT_EQ(errorOf(fields), ValidationError::InvalidId) << bad;
    }
    fields.employeeId = "0007";
    EXPECT_TRUE(std::holds_alternative<EmployeeRecord>(PayloadCodec::validate(fields)));
}

TEST(PayloadCodec, IdAcceptsAnyDecimalDigitScript)
{
    auto fields{ validFields() };
    // Arabic-Indic, Extended Arabic-Indic (Persian) and a mix with ASCII.
    for (const char* good : { "١٢٣", "۱۲۳", "12٣" })
    {
        fields.employeeId = good;
        EXPECT_TRUE(std::holds_alternative<EmployeeRecord>(PayloadCodec::validate(fields))) << good;
    }
    EXPECT_TRUE(PayloadCodec::isValidEmployeeId("٠٠٧"));
    // Superscript two is a digit character but not a decimal digit.
    EXPECT_FALSE(PayloadCodec::isValidEmployeeId("\u00B2"));
}

TEST(PayloadCodec, DepartmentNeedsTwoCharacters)
{
    auto fields{ validFields() };
    fields.department = "\tق\n";
    EXPECT_EQ(errorOf(fields), ValidationError::InvalidDepartment);
}

TEST(PayloadCodec, StopsAtFirstFailureInFieldOrder)
{
    const EmployeeFields allBad{ .name = "x", .employeeId = "abc", .department = "", .notes = {} };
    EXPECT_EQ(errorOf(allBad), ValidationError::InvalidName);

    EmployeeFields idAndDept{ validFields() };
    idAndDept.employeeId = "abc";
    idAndDept.department = "";
    EXPECT_EQ(errorOf(idAndDept), ValidationError::InvalidId);
}

TEST(PayloadCodec, RejectsLineBreaksInRequiredFields)
{
    auto fields{ validFields() };
    fields.name = "أحمد\nعلي";
    EXPECT_EQ(errorOf(fields), ValidationError::InvalidName);

    fields = validFields();
    fields.department = "الموارد\r\nالبشرية";
    EXPECT_EQ(errorOf(fields), ValidationError::InvalidDepartment);
}

TEST(PayloadCodec, SerializesFixedLabeledLines)
{
    const EmployeeRecord record{ .name = "سارة", .employeeId = "42", .department = "تقنية المعلومات", .notes = {} };
    EXPECT_EQ(PayloadCodec::serialize(record), "الاسم: سارة\nالرقم الوظيفي: 42\nالقسم: تقنية المعلومات");
}

TEST(PayloadCodec, AppendsNotesLineOnlyWhenPresent)
{
    EmployeeRecord record{ .name = "سارة", .employeeId = "42", .department = "تقنية", .notes = "مناوبة ليلية" };
    EXPECT_EQ(PayloadCodec::serialize(record),
              "الاسم: سارة\nالرقم الوظيفي: 42\nالقسم: تقنية\nمعلومات إضافية: مناوبة ليلية");
}

TEST(PayloadCodec, ParseRecoversSerializedRecord)
{
    const EmployeeRecord withNotes{ .name = " Ali ", .employeeId = "900", .department = "HR", .notes = "a\nb" };
    const EmployeeRecord withoutNotes{ .name = "علي", .employeeId = "1", .department = "قسم", .notes = {} };

    for (const auto& record : { withNotes, withoutNotes })
    {
        const auto parsed{ PayloadCodec::parse(PayloadCodec::serialize(record)) };
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, record);
    }
}

TEST(PayloadCodec, ParseRejectsMalformedText)
{
    EXPECT_FALSE(PayloadCodec::parse("").has_value());
    EXPECT_FALSE(PayloadCodec::parse("الاسم: a\nالرقم الوظيفي: 1").has_value());
    EXPECT_FALSE(PayloadCodec::parse("الرقم الوظيفي: 1\nالاسم: a\nالقسم: b").has_value());
    EXPECT_FALSE(PayloadCodec::parse("الاسم: a\nالرقم الوظيفي: 1\nالقسم: b\n").has_value());
    EXPECT_FALSE(PayloadCodec::parse("الاسم: a\nالرقم الوظيفي: 1\nالقسم: b\nnotes: c").has_value());
}
