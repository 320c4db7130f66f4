/**
 * @file uuid.hpp
 * @brief UUID generation for unique identification
 *
 * Identifies assets, tracks, elements, cues and jobs. Cross references
 * between them are always by UUID, never by pointer.
 */

#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace spl {

/**
 * @brief 128-bit random UUID (v4)
 */
class UUID {
public:
    /// Create a null (all zero) UUID
    UUID() : m_data{} {}

    /// Generate a new random UUID
    static UUID generate();

    /// Parse "550e8400-e29b-41d4-a716-446655440000"; nullopt when malformed
    static std::optional<UUID> parse(const std::string& str);

    /// Lenient parse, returns the null UUID when malformed
    static UUID fromString(const std::string& str);

    std::string toString() const;

    /// First 8 hex digits, for log lines
    std::string shortString() const { return toString().substr(0, 8); }

    bool isNull() const;

    bool operator==(const UUID& other) const { return m_data == other.m_data; }
    bool operator!=(const UUID& other) const { return m_data != other.m_data; }
    bool operator<(const UUID& other) const { return m_data < other.m_data; }

    const std::array<uint8_t, 16>& data() const { return m_data; }

private:
    std::array<uint8_t, 16> m_data;
};

inline std::ostream& operator<<(std::ostream& os, const UUID& uuid) {
    return os << uuid.toString();
}

} // namespace spl

namespace std {
template<>
struct hash<spl::UUID> {
    size_t operator()(const spl::UUID& uuid) const {
        const auto& data = uuid.data();
        size_t h = 0;
        for (size_t i = 0; i < 16; ++i) {
            h ^= std::hash<uint8_t>{}(data[i]) + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
};
} // namespace std
