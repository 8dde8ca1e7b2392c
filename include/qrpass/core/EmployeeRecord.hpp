#ifndef INCLUDE_QRPASS_CORE_EMPLOYEERECORD_HPP
#define INCLUDE_QRPASS_CORE_EMPLOYEERECORD_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace qrpass::core
{

// Raw form values as typed by the user, before validation.
struct EmployeeFields final
{
    std::string name;
    std::string employeeId;
    std::string department;
    std::string notes;
};

// A record that passed validation. Values are kept verbatim (untrimmed).
struct EmployeeRecord final
{
    std::string name;
    std::string employeeId;
    std::string department;
    std::string notes;

    friend bool operator==(const EmployeeRecord&, const EmployeeRecord&) = default;
};

enum class ValidationError : std::uint8_t
{
    InvalidName,
    InvalidId,
    InvalidDepartment,
};

[[nodiscard]] std::string_view describe(ValidationError error) noexcept;

} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_EMPLOYEERECORD_HPP
