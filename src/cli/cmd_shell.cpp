/**
 * @file cmd_shell.cpp
 * @brief Interactive shell subcommand for the tbrsa CLI
 *
 * Holds one tbrsa::Session for the lifetime of the process. The key pair
 * lives in memory only and is wiped on "clear" and on exit.
 *
 * @author tbrsa Development Team
 * @date 2026-10-19
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "tbrsa/session.h"
#include "tbrsa/version.h"
#include "tbrsa/utils/encoding.h"

#include "cli_utils.h"
using tbrsa::cli::parse_integer;

namespace {

void print_shell_help() {
    std::cout << "Commands:\n";
    std::cout << "  gen <p> <q> [e]        Build a key pair from two primes\n";
    std::cout << "  genbits <bits> [e]     Build a key pair from random primes\n";
    std::cout << "  pub                    Show the public key\n";
    std::cout << "  enc <text>             Encrypt text per character\n";
    std::cout << "  dec [list|last]        Decrypt a ciphertext list (default: last)\n";
    std::cout << "  benc <text>            Encrypt text as one Base64 block\n";
    std::cout << "  bdec [b64|last]        Decrypt a Base64 block (default: last)\n";
    std::cout << "  clear                  Wipe keys and ciphertexts\n";
    std::cout << "  help                   Show this list\n";
    std::cout << "  quit                   Leave the shell\n";
}

/// Text following the command word, with leading blanks removed
std::string rest_of_line(const std::string& line, const std::string& word) {
    std::string rest = line.substr(line.find(word) + word.size());
    size_t start = rest.find_first_not_of(" \t");
    return start == std::string::npos ? std::string() : rest.substr(start);
}

std::vector<std::string> split_words(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string w;
    while (iss >> w) {
        words.push_back(w);
    }
    return words;
}

/**
 * @brief Run one shell line against the session
 * @return false when the shell should exit
 */
bool dispatch(tbrsa::Session& session, const std::string& line) {
    std::vector<std::string> words = split_words(line);
    if (words.empty()) {
        return true;
    }
    const std::string& cmd = words[0];

    if (cmd == "quit" || cmd == "exit") {
        return false;
    } else if (cmd == "help") {
        print_shell_help();
    } else if (cmd == "gen") {
        if (words.size() < 3 || words.size() > 4) {
            throw std::invalid_argument("usage: gen <p> <q> [e]");
        }
        tbrsa::ZZ e = words.size() == 4 ? parse_integer(words[3], "e") : tbrsa::ZZ(0);
        tbrsa::cli::print_keypair(std::cout, session.generate_keys(
            parse_integer(words[1], "p"), parse_integer(words[2], "q"), e));
    } else if (cmd == "genbits") {
        if (words.size() < 2 || words.size() > 3) {
            throw std::invalid_argument("usage: genbits <bits> [e]");
        }
        tbrsa::ZZ bits = parse_integer(words[1], "bits");
        if (!bits.fits_uint_p()) {
            throw std::invalid_argument("bits is out of range");
        }
        tbrsa::ZZ e = words.size() == 3 ? parse_integer(words[2], "e")
                                        : tbrsa::ZZ(TBRSA_DEFAULT_PUBLIC_EXPONENT);
        tbrsa::cli::print_keypair(std::cout, session.generate_random_keys(bits.get_ui(), e));
    } else if (cmd == "pub") {
        std::cout << session.public_key().to_string() << "\n";
    } else if (cmd == "enc") {
        tbrsa::rsa::Ciphertext ct = session.encrypt(rest_of_line(line, cmd));
        std::cout << tbrsa::encoding::formatIntegerList(ct) << "\n";
    } else if (cmd == "dec") {
        std::string arg = rest_of_line(line, cmd);
        if (arg.empty() || arg == "last") {
            if (session.last_ciphertext().empty()) {
                throw std::logic_error("No ciphertext yet. Use enc first.");
            }
            std::cout << session.decrypt(session.last_ciphertext()) << "\n";
        } else {
            std::cout << session.decrypt(tbrsa::encoding::parseIntegerList(arg)) << "\n";
        }
    } else if (cmd == "benc") {
        std::cout << session.encrypt_text(rest_of_line(line, cmd)) << "\n";
    } else if (cmd == "bdec") {
        std::string arg = rest_of_line(line, cmd);
        if (arg.empty() || arg == "last") {
            if (session.last_block_ciphertext().empty()) {
                throw std::logic_error("No block ciphertext yet. Use benc first.");
            }
            arg = session.last_block_ciphertext();
        }
        std::cout << session.decrypt_text(arg) << "\n";
    } else if (cmd == "clear") {
        session.clear();
        std::cout << "Session cleared.\n";
    } else {
        std::cerr << "Unknown command '" << cmd << "'. Type help for a list.\n";
    }
    return true;
}

} // namespace

/**
 * @brief shell subcommand handler
 */
int cmd_shell(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            std::cout << "\nUsage: tbrsa shell\n\n";
            print_shell_help();
            return 0;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        return 1;
    }

    tbrsa::Session session;
    std::cout << "tbrsa shell " << TBRSA_VERSION_STRING << ". Type help for commands.\n";

    std::string line;
    while (std::cout << "tbrsa> " << std::flush, std::getline(std::cin, line)) {
        try {
            if (!dispatch(session, line)) {
                break;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
        }
    }
    return 0;
}
