/**
 * @file uuid.cpp
 * @brief UUID implementation
 */

#include <splice/core/uuid.hpp>

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace spl {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

UUID UUID::generate() {
    UUID uuid;

    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    uint64_t high = dist(gen);
    uint64_t low = dist(gen);

    // Version 4, RFC 4122 variant
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    for (int i = 0; i < 8; ++i) {
        uuid.m_data[i] = static_cast<uint8_t>((high >> (56 - i * 8)) & 0xFF);
        uuid.m_data[8 + i] = static_cast<uint8_t>((low >> (56 - i * 8)) & 0xFF);
    }

    return uuid;
}

std::optional<UUID> UUID::parse(const std::string& str) {
    if (str.length() != 36) {
        return std::nullopt;
    }

    UUID uuid;
    size_t byte = 0;
    for (size_t i = 0; i < str.length();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (str[i] != '-') return std::nullopt;
            ++i;
            continue;
        }
        int hi = hexValue(str[i]);
        int lo = hexValue(str[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        uuid.m_data[byte++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }

    return uuid;
}

UUID UUID::fromString(const std::string& str) {
    return parse(str).value_or(UUID());
}

std::string UUID::toString() const {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');

    for (size_t i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::setw(2) << static_cast<int>(m_data[i]);
    }

    return ss.str();
}

bool UUID::isNull() const {
    for (uint8_t byte : m_data) {
        if (byte != 0) return false;
    }
    return true;
}

} // namespace spl
