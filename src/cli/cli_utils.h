/**
 * @file cli_utils.h
 * @brief Common utility functions for tbrsa CLI commands
 *
 * @author tbrsa Development Team
 * @date 2026-10-19
 */

#ifndef TBRSA_CLI_UTILS_H
#define TBRSA_CLI_UTILS_H

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <stdexcept>

#include "tbrsa/crypto/rsa/rsa_types.h"

namespace tbrsa {
namespace cli {

/**
 * @brief Read whole file as text
 */
inline std::string read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }
    return std::string(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

/**
 * @brief Parse a decimal integer option value
 */
inline ZZ parse_integer(const std::string& text, const std::string& option) {
    ZZ v;
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos ||
        v.set_str(text, 10) != 0) {
        throw std::invalid_argument("Option " + option + " expects a non-negative integer, got '" +
                                    text + "'");
    }
    return v;
}

/**
 * @brief Strip one trailing newline left by files written with echo
 */
inline std::string chomp(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

inline void print_keypair(std::ostream& os, const rsa::RSAKeyPair& kp) {
    os << "e = " << kp.e.get_str() << "\n";
    os << "n = " << kp.n.get_str() << "\n";
    os << "d = " << kp.d.get_str() << "\n";
}

} // namespace cli
} // namespace tbrsa

#endif // TBRSA_CLI_UTILS_H
