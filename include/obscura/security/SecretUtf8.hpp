#ifndef INCLUDE_OBSCURA_SECURITY_SECRETUTF8_HPP
#define INCLUDE_OBSCURA_SECURITY_SECRETUTF8_HPP

#include "obscura/security/MemoryLock.hpp"
#include "obscura/security/SecretVec.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace obscura::security
{
// Secret text. The content is valid UTF-8 at all times: it is checked on the way in, and the only
// in-place edits offered are ASCII case changes, which cannot break an encoding.
class SecretUtf8 final
{
public:
    SecretUtf8() noexcept = default;

    // Throw std::invalid_argument if text is not valid UTF-8, or is a null pointer.
    explicit SecretUtf8(std::string_view text);
    explicit SecretUtf8(const char* text);
    // The source string is wiped once its content has been copied.
    explicit SecretUtf8(std::string&& text);

    [[nodiscard]] static std::optional<SecretUtf8> tryFrom(std::string_view text);

    [[nodiscard]] std::string_view unsecure() const noexcept;

    void makeAsciiUppercase() noexcept;
    void makeAsciiLowercase() noexcept;

    // Hands out an ordinary, unprotected copy. Keeping it secret is the caller's job from here on;
    // the copy is not wiped by this library. The wrapper is left empty.
    [[nodiscard]] std::string intoUnsecure() &&;

    // Wipes the whole capacity; the text becomes empty.
    void zeroOut() noexcept;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_bytes.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_bytes.empty();
    }

    [[nodiscard]] bool isLocked() const noexcept
    {
        return m_bytes.isLocked();
    }

    [[nodiscard]] LockStatus lockStatus() const noexcept
    {
        return m_bytes.lockStatus();
    }

    // Read-only byte view, for hashing and encoding.
    [[nodiscard]] const SecretBytes& bytes() const noexcept
    {
        return m_bytes;
    }

    [[nodiscard]] friend bool operator==(const SecretUtf8& a, const SecretUtf8& b) noexcept
    {
        return a.m_bytes == b.m_bytes;
    }

    friend std::ostream& operator<<(std::ostream& os, [[maybe_unused]] const SecretUtf8& s)
    {
        return os << g_kRedacted;
    }

private:
    struct Validated final
    {
    };

    SecretUtf8(Validated, std::string_view text);

    SecretBytes m_bytes;
};

} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_SECRETUTF8_HPP
