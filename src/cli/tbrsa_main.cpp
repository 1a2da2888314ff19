/**
 * @file tbrsa_main.cpp
 * @brief tbrsa Command-Line Interface - Main Entry Point
 *
 * tbrsa (Textbook RSA) CLI Tool
 *
 * Usage:
 *   tbrsa <command> [options]
 *
 * Commands:
 *   genkey       Build a key pair from two primes or random primes
 *   encrypt      Encrypt text with a public key (e, n)
 *   decrypt      Decrypt ciphertext with a private key (d, n)
 *   shell        Interactive session holding one key pair
 *   version      Display version information
 *   help         Show help message
 *
 * @author tbrsa Development Team
 * @date 2026-10-19
 * @version 1.2.0
 * @copyright Apache License 2.0
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "tbrsa/tbrsa.h"

// Subcommand handlers (forward declarations)
int cmd_genkey(int argc, char* argv[]);
int cmd_encrypt(int argc, char* argv[]);
int cmd_decrypt(int argc, char* argv[]);
int cmd_shell(int argc, char* argv[]);
void cmd_version();
void cmd_help();

// Version information
constexpr const char* TBRSA_VERSION_CLI = TBRSA_VERSION_STRING;

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: tbrsa <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  genkey       Generate a key pair (from -p/-q or -bits)\n";
    std::cout << "  encrypt      Encrypt text per character or as one block\n";
    std::cout << "  decrypt      Decrypt a ciphertext list or a Base64 block\n";
    std::cout << "  shell        Interactive session (keys kept in memory only)\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  tbrsa genkey -p 61 -q 53 -e 17\n";
    std::cout << "  tbrsa encrypt -e 17 -n 3233 -in A\n";
    std::cout << "  tbrsa decrypt -d 2753 -n 3233 -in 2790\n";
    std::cout << "  tbrsa shell\n\n";
    std::cout << "For command-specific help, use: tbrsa <command> --help\n\n";
    std::cout << "Textbook RSA without padding. For learning only, never for real data.\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << TBRSA_LIBRARY_NAME << " - " << TBRSA_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << TBRSA_VERSION_CLI << "\n";
    std::cout << "Release Date: " << TBRSA_RELEASE_DATE << "\n";
    std::cout << "Build Type:   " << TBRSA_BUILD_TYPE << "\n";
    std::cout << "Platform:     " << TBRSA_PLATFORM_NAME << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Dependencies:\n";
    std::cout << "  - GMP " << gmp_version << " (GNU Multiple Precision Arithmetic)\n";
    std::cout << "\n";
}

/**
 * @brief Display help message (alias for print_usage)
 */
void cmd_help() {
    print_usage();
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command(argv[1]);

    // Case-insensitive matching
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (command == "genkey" || command == "gen") {
        return cmd_genkey(argc - 1, argv + 1);
    }
    else if (command == "encrypt" || command == "enc") {
        return cmd_encrypt(argc - 1, argv + 1);
    }
    else if (command == "decrypt" || command == "dec") {
        return cmd_decrypt(argc - 1, argv + 1);
    }
    else if (command == "shell") {
        return cmd_shell(argc - 1, argv + 1);
    }
    else if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    }
    else if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
        return 0;
    }
    else {
        std::cerr << "\nError: Unknown command '" << command << "'\n";
        print_usage();
        return 1;
    }
}
