// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#ifndef GOSSAMER_HASH_HPP
#define GOSSAMER_HASH_HPP

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace Gossamer::Membership {

    /**
     * @brief SHA3-256 lenyomat (32 bájt).
     */
    struct Hash {
        static constexpr size_t SIZE = 32;

        std::array<uint8_t, SIZE> bytes{};

        bool operator==(const Hash& other) const { return bytes == other.bytes; }
        bool operator!=(const Hash& other) const { return bytes != other.bytes; }
        bool operator<(const Hash& other) const { return bytes < other.bytes; }

        // Lowercase hex, 64 chars.
        std::string toHex() const;

        // Első 8 hex karakter, naplózáshoz.
        std::string shortHex() const { return toHex().substr(0, 8); }
    };

    class HashError : public std::runtime_error {
    public:
        explicit HashError(const std::string& what)
            : std::runtime_error("Hash error: " + what) {}
    };

    /**
     * @brief SHA3-256 a megadott bájtsorozaton.
     * @throws HashError ha az OpenSSL digest hívás hibát jelez.
     */
    Hash computeHash(const std::string& data);

} // namespace Gossamer::Membership

#endif // GOSSAMER_HASH_HPP
