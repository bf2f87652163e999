#include "mcpx/session/session.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace mcpx {

bool is_valid_session_id(std::string_view session_id) noexcept {
    constexpr std::size_t max_session_id_length = 256;
    if (session_id.empty() || session_id.size() > max_session_id_length) {
        return false;
    }
    for (const char c : session_id) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x21 || byte > 0x7E) {
            return false;
        }
    }
    return true;
}

std::string generate_session_id() {
    // 128 bits, every one drawn from the OS entropy source.
    thread_local std::random_device entropy;
    constexpr std::array<char, 16> digits = {
        '0', '1', '2', '3', '4', '5', '6', '7',
        '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
    };
    constexpr int words = 4;
    constexpr int nibbles_per_word = 8;

    std::string id;
    id.reserve(words * nibbles_per_word);
    for (int word = 0; word < words; ++word) {
        std::uint32_t bits = static_cast<std::uint32_t>(entropy());
        for (int nibble = 0; nibble < nibbles_per_word; ++nibble) {
            id.push_back(digits[bits & 0xF]);
            bits >>= 4;
        }
    }
    return id;
}

}  // namespace mcpx
