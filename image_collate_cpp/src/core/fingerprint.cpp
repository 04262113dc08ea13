#include "image_collate/core/types.hpp"

#include <bitset>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace image_collate {

std::string Fingerprint::to_hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << bits;
    return oss.str();
}

std::optional<Fingerprint> Fingerprint::from_hex(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    if (begin == end || end - begin > 16) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (size_t i = begin; i < end; ++i) {
        const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
        int digit = 0;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            digit = 10 + (c - 'a');
        } else {
            return std::nullopt;
        }
        value = (value << 4) | static_cast<uint64_t>(digit);
    }

    Fingerprint f;
    f.bits = value;
    return f;
}

int Fingerprint::hamming_distance(const Fingerprint& other) const {
    return static_cast<int>(std::bitset<64>(bits ^ other.bits).count());
}

} // namespace image_collate
