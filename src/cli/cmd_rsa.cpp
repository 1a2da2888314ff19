/**
 * @file cmd_rsa.cpp
 * @brief genkey / encrypt / decrypt subcommands for the tbrsa CLI
 *
 * Usage:
 *   tbrsa genkey -p 61 -q 53 -e 17
 *   tbrsa genkey -bits 64
 *   tbrsa encrypt -e 17 -n 3233 -in "HELLO"
 *   tbrsa decrypt -d 2753 -n 3233 -in "2790, 1313"
 *
 * Keys are printed, never stored; pass them back on the command line.
 *
 * @author tbrsa Development Team
 * @date 2026-10-19
 */

#include <iostream>
#include <string>

#include "tbrsa/crypto/rsa/rsa_encrypt.h"
#include "tbrsa/crypto/rsa/rsa_keygen.h"
#include "tbrsa/utils/encoding.h"

// Use shared CLI utilities
#include "cli_utils.h"
using tbrsa::cli::chomp;
using tbrsa::cli::parse_integer;
using tbrsa::cli::read_file;

/**
 * @brief Print genkey subcommand help
 */
void print_genkey_help() {
    std::cout << "\nUsage: tbrsa genkey [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -p <prime>        First prime\n";
    std::cout << "  -q <prime>        Second prime (distinct from p)\n";
    std::cout << "  -bits <n>         Draw random primes for an n-bit modulus instead\n";
    std::cout << "  -e <exponent>     Public exponent (default: chosen automatically,\n";
    std::cout << "                    65537 with -bits)\n";
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  tbrsa genkey -p 61 -q 53 -e 17\n";
    std::cout << "  tbrsa genkey -bits 128\n\n";
}

/**
 * @brief Print encrypt subcommand help
 */
void print_encrypt_help() {
    std::cout << "\nUsage: tbrsa encrypt [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -e <exponent>     Public exponent (required)\n";
    std::cout << "  -n <modulus>      Modulus (required)\n";
    std::cout << "  -in <text>        Plaintext\n";
    std::cout << "  -infile <file>    Read plaintext from file\n";
    std::cout << "  -block            Encrypt the whole message as one integer (Base64 output)\n";
    std::cout << "  --help            Show this help message\n\n";
}

/**
 * @brief Print decrypt subcommand help
 */
void print_decrypt_help() {
    std::cout << "\nUsage: tbrsa decrypt [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d <exponent>     Private exponent (required)\n";
    std::cout << "  -n <modulus>      Modulus (required)\n";
    std::cout << "  -in <ciphertext>  Comma-separated integers, or Base64 with -block\n";
    std::cout << "  -infile <file>    Read ciphertext from file\n";
    std::cout << "  -block            Input is a Base64 block ciphertext\n";
    std::cout << "  --help            Show this help message\n\n";
}

/**
 * @brief genkey subcommand handler
 */
int cmd_genkey(int argc, char* argv[]) {
    std::string p_arg, q_arg, e_arg, bits_arg;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-p" && i + 1 < argc) {
            p_arg = argv[++i];
        } else if (arg == "-q" && i + 1 < argc) {
            q_arg = argv[++i];
        } else if (arg == "-e" && i + 1 < argc) {
            e_arg = argv[++i];
        } else if (arg == "-bits" && i + 1 < argc) {
            bits_arg = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_genkey_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_genkey_help();
            return 1;
        }
    }

    const bool from_primes = !p_arg.empty() || !q_arg.empty();
    if (from_primes == !bits_arg.empty() || (from_primes && (p_arg.empty() || q_arg.empty()))) {
        std::cerr << "Error: Give either both -p and -q, or -bits\n";
        print_genkey_help();
        return 1;
    }

    try {
        tbrsa::rsa::RSAKeyPair kp;
        if (from_primes) {
            tbrsa::ZZ e = e_arg.empty() ? tbrsa::ZZ(0) : parse_integer(e_arg, "-e");
            kp = tbrsa::rsa::generate_keypair(parse_integer(p_arg, "-p"),
                                              parse_integer(q_arg, "-q"), e);
        } else {
            tbrsa::ZZ e = e_arg.empty() ? tbrsa::ZZ(TBRSA_DEFAULT_PUBLIC_EXPONENT)
                                        : parse_integer(e_arg, "-e");
            tbrsa::ZZ bits = parse_integer(bits_arg, "-bits");
            if (!bits.fits_uint_p()) {
                throw std::invalid_argument("Option -bits is out of range");
            }
            std::cerr << "[INFO] Drawing random primes for a " << bits_arg << "-bit modulus\n";
            kp = tbrsa::rsa::generate_random_keypair(bits.get_ui(), e);
        }

        tbrsa::cli::print_keypair(std::cout, kp);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

/**
 * @brief encrypt subcommand handler
 */
int cmd_encrypt(int argc, char* argv[]) {
    std::string e_arg, n_arg, text, input_file;
    bool have_text = false;
    bool block = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-e" && i + 1 < argc) {
            e_arg = argv[++i];
        } else if (arg == "-n" && i + 1 < argc) {
            n_arg = argv[++i];
        } else if (arg == "-in" && i + 1 < argc) {
            text = argv[++i];
            have_text = true;
        } else if (arg == "-infile" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (arg == "-block") {
            block = true;
        } else if (arg == "--help" || arg == "-h") {
            print_encrypt_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_encrypt_help();
            return 1;
        }
    }

    if (e_arg.empty() || n_arg.empty() || have_text == !input_file.empty()) {
        std::cerr << "Error: Missing required arguments (-e, -n, and one of -in/-infile)\n";
        print_encrypt_help();
        return 1;
    }

    try {
        if (!input_file.empty()) {
            text = chomp(read_file(input_file));
        }
        tbrsa::rsa::RSAPublicKey pub(parse_integer(n_arg, "-n"), parse_integer(e_arg, "-e"));

        if (block) {
            std::cout << tbrsa::rsa::encrypt_text(text, pub) << "\n";
        } else {
            std::cout << tbrsa::encoding::formatIntegerList(tbrsa::rsa::encrypt(text, pub)) << "\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

/**
 * @brief decrypt subcommand handler
 */
int cmd_decrypt(int argc, char* argv[]) {
    std::string d_arg, n_arg, input, input_file;
    bool have_input = false;
    bool block = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-d" && i + 1 < argc) {
            d_arg = argv[++i];
        } else if (arg == "-n" && i + 1 < argc) {
            n_arg = argv[++i];
        } else if (arg == "-in" && i + 1 < argc) {
            input = argv[++i];
            have_input = true;
        } else if (arg == "-infile" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (arg == "-block") {
            block = true;
        } else if (arg == "--help" || arg == "-h") {
            print_decrypt_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_decrypt_help();
            return 1;
        }
    }

    if (d_arg.empty() || n_arg.empty() || have_input == !input_file.empty()) {
        std::cerr << "Error: Missing required arguments (-d, -n, and one of -in/-infile)\n";
        print_decrypt_help();
        return 1;
    }

    try {
        if (!input_file.empty()) {
            input = read_file(input_file);
        }
        tbrsa::rsa::RSAPrivateKey priv(parse_integer(n_arg, "-n"), parse_integer(d_arg, "-d"));

        if (block) {
            std::cout << tbrsa::rsa::decrypt_text(input, priv) << "\n";
        } else {
            tbrsa::rsa::Ciphertext ct = tbrsa::encoding::parseIntegerList(input);
            std::cout << tbrsa::rsa::decrypt(ct, priv) << "\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
