#include "tapcore/helpers.hpp"

namespace tapcore {
namespace helpers {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_hex(const std::string& bytes) {
    std::string hex;
    hex.reserve(bytes.size() * 2);

    static const char hex_chars[] = "0123456789abcdef";
    for (unsigned char c : bytes) {
        hex.push_back(hex_chars[c >> 4]);
        hex.push_back(hex_chars[c & 0x0f]);
    }
    return hex;
}

std::string form_decode(const std::string& component) {
    std::string decoded;
    decoded.reserve(component.size());

    for (size_t i = 0; i < component.size(); ++i) {
        char c = component[i];
        if (c == '+') {
            decoded.push_back(' ');
        } else if (c == '%' && i + 2 < component.size()) {
            int hi = hex_value(component[i + 1]);
            int lo = hex_value(component[i + 2]);
            if (hi < 0 || lo < 0) {
                decoded.push_back(c);
                continue;
            }
            decoded.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            decoded.push_back(c);
        }
    }
    return decoded;
}

} // namespace helpers
} // namespace tapcore
