#ifndef INCLUDE_QRPASS_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_QRPASS_SECURITY_ZEROALLOCATOR_HPP

#include "qrpass/security/MemoryWiper.hpp"
#include <cstddef>
#include <memory>
#include <span>
#include <type_traits>

namespace qrpass::security
{
// Backs SecureBuffer: key bytes and decrypted plaintext are zeroed before their
// storage goes back to the heap, including the old block a vector grows out of.
template <class T> class ZeroAllocator
{
    static_assert(std::is_trivially_copyable_v<T>, "ZeroAllocator holds raw key or text bytes only");

public:
    using value_type = T;
    using is_always_equal = std::true_type;

    ZeroAllocator() noexcept = default;

    template <class U> ZeroAllocator(const ZeroAllocator<U>&) noexcept // NOLINT(google-explicit-constructor)
    {
    }

    // Throws std::bad_array_new_length when `n` elements cannot be addressed.
    [[nodiscard]] T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        return std::allocator<T>{}.allocate(n);
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        secureWipe(std::span<T>{ p, n });
        std::allocator<T>{}.deallocate(p, n);
    }

    friend bool operator==(const ZeroAllocator&, const ZeroAllocator&) noexcept
    {
        return true;
    }
};

} // namespace qrpass::security

#endif // INCLUDE_QRPASS_SECURITY_ZEROALLOCATOR_HPP
