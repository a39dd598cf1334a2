#pragma once

#include <string>
#include <string_view>

#include "vm.hxx"

namespace brisk {

inline bool isBfChar(char c) {
    switch (c) {
        case '+':
        case '-':
        case '>':
        case '<':
        case '[':
        case ']':
        case '.':
        case ',':
            return true;
        default:
            return false;
    }
}

// Keeps only the eight instruction characters of code.
std::string compact(std::string_view code);

/// @brief Translates source text into a program with every bracket pair resolved.
/// @param code Raw source. Characters other than the eight instructions are ignored.
/// @param program Receives the translated instructions. Left untouched when translation fails.
/// @return Status::UnmatchedClose at the offending ']' or Status::UnmatchedOpen at the earliest
/// unclosed '['. Positions count instruction characters only.
Outcome translate(std::string_view code, Program& program);

// One instruction per line: "index: MNEMONIC [target]".
std::string disassemble(const Program& program);

}  // namespace brisk
