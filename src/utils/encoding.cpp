/**
 * @file encoding.cpp
 * @brief Encoding utilities implementation
 *
 * Implements encoding/decoding functions for:
 * - Base64 (standard alphabet)
 * - UTF-8 text and code points
 * - Big integer conversions
 * - Integer lists
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "tbrsa/utils/encoding.h"
#include <cctype>
#include <cstring>

// ============================================================================
// Internal Constants
// ============================================================================

static const char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Lookup table for Base64 decoding (-1 = invalid, -2 = padding '=', -3 = whitespace)
static const int8_t BASE64_DECODE[256] = {
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-3,-3,-1,-1,-3,-1,-1,  // 0x00-0x0F (\t,\n,\r)
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0x10-0x1F
    -3,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,62,-1,-1,-1,63,  // 0x20-0x2F (space,+,/)
    52,53,54,55,56,57,58,59,60,61,-1,-1,-1,-2,-1,-1,  // 0x30-0x3F (0-9,=)
    -1, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,  // 0x40-0x4F (A-O)
    15,16,17,18,19,20,21,22,23,24,25,-1,-1,-1,-1,-1,  // 0x50-0x5F (P-Z)
    -1,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,  // 0x60-0x6F (a-o)
    41,42,43,44,45,46,47,48,49,50,51,-1,-1,-1,-1,-1,  // 0x70-0x7F (p-z)
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0x80-0x8F
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0x90-0x9F
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0xA0-0xAF
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0xB0-0xBF
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0xC0-0xCF
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0xD0-0xDF
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0xE0-0xEF
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1   // 0xF0-0xFF
};

// ============================================================================
// C API: Base64 Encoding/Decoding
// ============================================================================

extern "C" {

size_t tbrsa_base64_encoded_len(size_t input_len) {
    return ((input_len + 2) / 3) * 4;
}

size_t tbrsa_base64_encode(const uint8_t* data, size_t len, char* b64, size_t b64_size) {
    if ((data == nullptr && len > 0) || b64 == nullptr) {
        return 0;
    }

    size_t out_len = tbrsa_base64_encoded_len(len);
    if (b64_size < out_len + 1) {
        return 0;
    }

    size_t i = 0, j = 0;
    uint8_t buf[3];
    size_t buf_len = 0;

    while (i < len) {
        buf[buf_len++] = data[i++];

        if (buf_len == 3) {
            b64[j++] = BASE64_CHARS[(buf[0] >> 2) & 0x3F];
            b64[j++] = BASE64_CHARS[((buf[0] << 4) | (buf[1] >> 4)) & 0x3F];
            b64[j++] = BASE64_CHARS[((buf[1] << 2) | (buf[2] >> 6)) & 0x3F];
            b64[j++] = BASE64_CHARS[buf[2] & 0x3F];
            buf_len = 0;
        }
    }

    // Handle remaining bytes
    if (buf_len == 1) {
        b64[j++] = BASE64_CHARS[(buf[0] >> 2) & 0x3F];
        b64[j++] = BASE64_CHARS[(buf[0] << 4) & 0x3F];
        b64[j++] = '=';
        b64[j++] = '=';
    } else if (buf_len == 2) {
        b64[j++] = BASE64_CHARS[(buf[0] >> 2) & 0x3F];
        b64[j++] = BASE64_CHARS[((buf[0] << 4) | (buf[1] >> 4)) & 0x3F];
        b64[j++] = BASE64_CHARS[(buf[1] << 2) & 0x3F];
        b64[j++] = '=';
    }

    b64[j] = '\0';
    return j;
}

tbrsa_error_t tbrsa_base64_decode(const char* b64, size_t b64_len,
                                  uint8_t* data, size_t data_size,
                                  size_t* out_len) {
    if (b64 == nullptr || out_len == nullptr) {
        return TBRSA_ERROR_INVALID_PARAM;
    }
    *out_len = 0;

    if (b64_len == 0) {
        b64_len = strlen(b64);
    }

    // First pass: validate and count significant characters
    size_t symbols = 0, padding = 0;
    for (size_t i = 0; i < b64_len; i++) {
        int8_t val = BASE64_DECODE[static_cast<uint8_t>(b64[i])];
        if (val == -3) continue;
        if (val == -1) return TBRSA_ERROR_INVALID_PARAM;
        if (val == -2) {
            padding++;
        } else if (padding > 0) {
            return TBRSA_ERROR_INVALID_PARAM;  // data after '='
        }
        symbols++;
    }

    if (symbols % 4 != 0 || padding > 2) {
        return TBRSA_ERROR_INVALID_PARAM;
    }

    size_t need = (symbols / 4) * 3 - padding;
    if (need > 0 && (data == nullptr || data_size < need)) {
        return TBRSA_ERROR_BUFFER_TOO_SMALL;
    }

    // Second pass: decode
    size_t j = 0;
    uint32_t acc = 0;
    int bits = 0;
    for (size_t i = 0; i < b64_len; i++) {
        int8_t val = BASE64_DECODE[static_cast<uint8_t>(b64[i])];
        if (val == -3) continue;
        if (val == -2) break;

        acc = (acc << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            data[j++] = static_cast<uint8_t>((acc >> bits) & 0xFF);
        }
    }

    *out_len = j;
    return TBRSA_SUCCESS;
}

} // extern "C"

// ============================================================================
// C++ API
// ============================================================================

namespace tbrsa {
namespace encoding {

// ============================================================================
// Base64 Encoding (C++ API)
// ============================================================================

std::string base64Encode(const ByteVec& data) {
    return base64Encode(data.data(), data.size());
}

std::string base64Encode(const uint8_t* data, size_t len) {
    size_t out_len = tbrsa_base64_encoded_len(len);
    std::string result(out_len, '\0');
    tbrsa_base64_encode(data, len, &result[0], result.size() + 1);
    return result;
}

ByteVec base64Decode(const std::string& b64) {
    ByteVec result(tbrsa_base64_encoded_len(b64.size()));
    size_t decoded = 0;
    tbrsa_error_t rc = tbrsa_base64_decode(b64.c_str(), b64.size(),
                                           result.data(), result.size(), &decoded);
    if (rc != TBRSA_SUCCESS) {
        throw EncodingError("Invalid Base64 string");
    }
    result.resize(decoded);
    return result;
}

bool isValidBase64(const std::string& str) noexcept {
    size_t decoded = 0;
    ByteVec scratch(str.size());
    return tbrsa_base64_decode(str.c_str(), str.size(), scratch.data(),
                               scratch.size(), &decoded) == TBRSA_SUCCESS;
}

// ============================================================================
// UTF-8 (C++ API)
// ============================================================================

namespace {

bool is_scalar_value(char32_t cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

/**
 * @return bytes consumed, 0 on malformed input
 */
size_t decode_one(const std::string& s, size_t pos, char32_t& cp) {
    const auto b0 = static_cast<unsigned char>(s[pos]);
    size_t len;
    char32_t min;

    if (b0 < 0x80) {
        cp = b0;
        return 1;
    } else if ((b0 & 0xE0) == 0xC0) {
        len = 2; min = 0x80; cp = b0 & 0x1F;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3; min = 0x800; cp = b0 & 0x0F;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4; min = 0x10000; cp = b0 & 0x07;
    } else {
        return 0;
    }

    if (pos + len > s.size()) return 0;
    for (size_t k = 1; k < len; k++) {
        const auto b = static_cast<unsigned char>(s[pos + k]);
        if ((b & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (b & 0x3F);
    }

    // Overlong forms, surrogates and out-of-range values
    if (cp < min || !is_scalar_value(cp)) return 0;
    return len;
}

} // namespace

CodePoints utf8Decode(const std::string& text) {
    CodePoints out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        size_t used = decode_one(text, pos, cp);
        if (used == 0) {
            throw EncodingError("Invalid UTF-8 sequence at byte " + std::to_string(pos));
        }
        out.push_back(cp);
        pos += used;
    }
    return out;
}

bool utf8Append(std::string& out, char32_t cp) {
    if (!is_scalar_value(cp)) return false;

    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return true;
}

std::string utf8Encode(const CodePoints& cps) {
    std::string out;
    out.reserve(cps.size());
    for (char32_t cp : cps) {
        if (!utf8Append(out, cp)) {
            throw EncodingError("Not a Unicode scalar value: " +
                                std::to_string(static_cast<unsigned long>(cp)));
        }
    }
    return out;
}

bool isValidUtf8(const std::string& text) noexcept {
    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        size_t used = decode_one(text, pos, cp);
        if (used == 0) return false;
        pos += used;
    }
    return true;
}

// ============================================================================
// Big Integer Conversions (C++ API)
// ============================================================================

ZZ bytesToInteger(const ByteVec& bytes) {
    ZZ value;
    if (!bytes.empty()) {
        mpz_import(value.get_mpz_t(), bytes.size(), 1, 1, 1, 0, bytes.data());
    }
    return value;
}

ByteVec integerToBytes(const ZZ& value) {
    if (value < 0) {
        throw EncodingError("integerToBytes: negative value");
    }
    if (value == 0) return ByteVec();

    ByteVec out((mpz_sizeinbase(value.get_mpz_t(), 2) + 7) / 8);
    size_t written = 0;
    mpz_export(out.data(), &written, 1, 1, 1, 0, value.get_mpz_t());
    out.resize(written);
    return out;
}

// ============================================================================
// Integer Lists (C++ API)
// ============================================================================

std::string formatIntegerList(const std::vector<ZZ>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) out += ", ";
        out += values[i].get_str();
    }
    return out;
}

std::vector<ZZ> parseIntegerList(const std::string& text) {
    std::vector<ZZ> out;
    std::string token;

    auto flush = [&]() {
        if (token.empty()) return;
        ZZ v;
        size_t start = (token[0] == '-' || token[0] == '+') ? 1 : 0;
        if (start == token.size() ||
            token.find_first_not_of("0123456789", start) != std::string::npos ||
            v.set_str(token[0] == '+' ? token.substr(1) : token, 10) != 0) {
            throw EncodingError("Invalid integer in list: '" + token + "'");
        }
        out.push_back(v);
        token.clear();
    };

    for (size_t i = 0; i < text.size(); i++) {
        const char c = text[i];
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else if ((c == '[' && out.empty() && token.empty()) ||
                   (c == ']' && text.find_first_not_of(" \t\r\n", i + 1) == std::string::npos)) {
            flush();
        } else {
            token += c;
        }
    }
    flush();
    return out;
}

} // namespace encoding
} // namespace tbrsa
