#include "layercast/core/base64.h"

namespace layercast::core {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

template <typename Bytes>
std::string encode_bytes(const Bytes& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 2 < bytes.size()) {
        const unsigned int chunk = (static_cast<unsigned char>(bytes[i]) << 16) |
                                   (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                                   static_cast<unsigned char>(bytes[i + 2]);
        out += kAlphabet[(chunk >> 18) & 0x3F];
        out += kAlphabet[(chunk >> 12) & 0x3F];
        out += kAlphabet[(chunk >> 6) & 0x3F];
        out += kAlphabet[chunk & 0x3F];
        i += 3;
    }

    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const unsigned int chunk = static_cast<unsigned char>(bytes[i]) << 16;
        out += kAlphabet[(chunk >> 18) & 0x3F];
        out += kAlphabet[(chunk >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const unsigned int chunk = (static_cast<unsigned char>(bytes[i]) << 16) |
                                   (static_cast<unsigned char>(bytes[i + 1]) << 8);
        out += kAlphabet[(chunk >> 18) & 0x3F];
        out += kAlphabet[(chunk >> 12) & 0x3F];
        out += kAlphabet[(chunk >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

}  // namespace

std::string base64_encode(const std::vector<std::uint8_t>& bytes) {
    return encode_bytes(bytes);
}

std::string base64_encode(const std::string& bytes) {
    return encode_bytes(bytes);
}

bool base64_decode(const std::string& input, std::vector<std::uint8_t>& output) {
    output.clear();
    output.reserve(input.size() * 3 / 4);
    unsigned int val = 0;
    int valb = -8;
    for (char c : input) {
        if (c == '=') break;
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        const int d = decode_char(c);
        if (d < 0) return false;
        val = (val << 6) + static_cast<unsigned>(d);
        valb += 6;
        if (valb >= 0) {
            output.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return true;
}

}  // namespace layercast::core
