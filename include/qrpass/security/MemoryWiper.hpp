#ifndef INCLUDE_QRPASS_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_QRPASS_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>

namespace qrpass::security
{
// Zeroes `bytes` with a platform primitive the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// Wipes the characters currently held by `text` and empties it. Capacity is kept.
void secureWipe(std::string& text) noexcept;

// Wipes a plaintext string on every exit path of the scope that owns it.
class PlaintextWipe final
{
public:
    explicit PlaintextWipe(std::string& text) noexcept : m_text{ &text }
    {
    }

    ~PlaintextWipe()
    {
        secureWipe(*m_text);
    }

    PlaintextWipe(const PlaintextWipe&) = delete;
    PlaintextWipe& operator=(const PlaintextWipe&) = delete;
    PlaintextWipe(PlaintextWipe&&) = delete;
    PlaintextWipe& operator=(PlaintextWipe&&) = delete;

private:
    std::string* m_text;
};
} // namespace qrpass::security
#endif // INCLUDE_QRPASS_SECURITY_MEMORYWIPER_HPP
