#ifndef INCLUDE_QRPASS_CORE_PAYLOADCODEC_HPP
#define INCLUDE_QRPASS_CORE_PAYLOADCODEC_HPP

#include "qrpass/core/EmployeeRecord.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace qrpass::core
{

template <class T> using ValidationResult = std::variant<T, ValidationError>;

// Line labels of the canonical plaintext. Any consumer that decrypts an
// envelope parses these, so they must never change.
inline constexpr std::string_view g_nameLabel{ "الاسم: " };
inline constexpr std::string_view g_employeeIdLabel{ "الرقم الوظيفي: " };
inline constexpr std::string_view g_departmentLabel{ "القسم: " };
inline constexpr std::string_view g_notesLabel{ "معلومات إضافية: " };

inline constexpr std::size_t g_minTextFieldChars{ 2U };

class PayloadCodec final
{
public:
    // Checks name, id and department in that order and stops at the first failure.
    [[nodiscard]] static ValidationResult<EmployeeRecord> validate(const EmployeeFields& fields);

    // At least two characters once Unicode white space is trimmed; no line breaks.
    [[nodiscard]] static bool isValidName(std::string_view raw);
    // One or more Unicode decimal digits and nothing else.
    [[nodiscard]] static bool isValidEmployeeId(std::string_view raw);
    [[nodiscard]] static bool isValidDepartment(std::string_view raw);

    [[nodiscard]] static std::string serialize(const EmployeeRecord& record);

    // Inverse of serialize(). Returns std::nullopt if labels, order or line count do not match.
    [[nodiscard]] static std::optional<EmployeeRecord> parse(std::string_view text);
};


} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_PAYLOADCODEC_HPP
