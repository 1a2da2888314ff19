/**
 * @file encoding.h
 * @brief Encoding utilities for converting between text, bytes and integers
 *
 * Provides encoding/decoding utilities for:
 * - Base64 (standard alphabet, padded)
 * - UTF-8 text <-> Unicode code points
 * - Big-endian bytes <-> big integers
 * - Ciphertext integer lists <-> text
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TBRSA_UTILS_ENCODING_H
#define TBRSA_UTILS_ENCODING_H

#include "tbrsa/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Base64 Encoding/Decoding (C API)
// ============================================================================

/**
 * @brief Calculate Base64 encoded length (without terminator)
 */
TBRSA_API size_t tbrsa_base64_encoded_len(size_t input_len);

/**
 * @brief Encode binary data to Base64 string (standard alphabet)
 *
 * @param data Input binary data
 * @param len Length of input data
 * @param b64 Output buffer (must be at least ((len+2)/3)*4+1 bytes)
 * @param b64_size Size of output buffer
 * @return Number of characters written (excluding null terminator), 0 on error
 */
TBRSA_API size_t tbrsa_base64_encode(const uint8_t* data, size_t len, char* b64, size_t b64_size);

/**
 * @brief Decode Base64 string to binary data
 *
 * Whitespace is ignored. Input must be padded to a multiple of 4.
 *
 * @param b64 Input Base64 string
 * @param b64_len Length of Base64 string (0 for null-terminated)
 * @param data Output buffer
 * @param data_size Size of output buffer
 * @param out_len Receives the number of bytes written
 * @return TBRSA_SUCCESS, TBRSA_ERROR_INVALID_PARAM or TBRSA_ERROR_BUFFER_TOO_SMALL
 */
TBRSA_API tbrsa_error_t tbrsa_base64_decode(const char* b64, size_t b64_len,
                                            uint8_t* data, size_t data_size,
                                            size_t* out_len);

#ifdef __cplusplus
}
#endif

// ============================================================================
// C++ API
// ============================================================================
#ifdef __cplusplus

#include "tbrsa/core/types.h"
#include "tbrsa/math/arith.h"
#include <string>
#include <vector>
#include <stdexcept>

namespace tbrsa {
namespace encoding {

/**
 * @brief Malformed input to one of the decoders
 */
class EncodingError : public std::invalid_argument {
public:
    explicit EncodingError(const std::string& msg) : std::invalid_argument(msg) {}
};

// ============================================================================
// Base64 Encoding (C++ API)
// ============================================================================

std::string base64Encode(const ByteVec& data);
std::string base64Encode(const uint8_t* data, size_t len);

/**
 * @brief Decode Base64
 * @throws EncodingError on an invalid character, length or padding
 */
ByteVec base64Decode(const std::string& b64);

bool isValidBase64(const std::string& str) noexcept;

// ============================================================================
// UTF-8 (C++ API)
// ============================================================================

/**
 * @brief Decode UTF-8 into code points
 * @throws EncodingError on truncated, overlong or surrogate sequences
 */
CodePoints utf8Decode(const std::string& text);

/**
 * @brief Encode code points as UTF-8
 * @throws EncodingError for surrogates or values above U+10FFFF
 */
std::string utf8Encode(const CodePoints& cps);

/**
 * @brief Append one code point to @p out
 * @return false if @p cp is not a Unicode scalar value
 */
bool utf8Append(std::string& out, char32_t cp);

bool isValidUtf8(const std::string& text) noexcept;

// ============================================================================
// Big Integer Conversions (C++ API)
// ============================================================================

/**
 * @brief Interpret bytes as a big-endian unsigned integer (empty -> 0)
 */
ZZ bytesToInteger(const ByteVec& bytes);

/**
 * @brief Minimal big-endian byte string of a non-negative integer (0 -> empty)
 * @throws EncodingError for negative input
 */
ByteVec integerToBytes(const ZZ& value);

// ============================================================================
// Integer Lists (C++ API)
// ============================================================================

/**
 * @brief Join decimal integers with ", "
 */
std::string formatIntegerList(const std::vector<ZZ>& values);

/**
 * @brief Parse decimal integers separated by commas and/or whitespace
 *
 * Surrounding brackets, as printed by Python or JSON, are accepted.
 *
 * @throws EncodingError on any other token
 */
std::vector<ZZ> parseIntegerList(const std::string& text);

} // namespace encoding
} // namespace tbrsa

#endif // __cplusplus

#endif // TBRSA_UTILS_ENCODING_H
