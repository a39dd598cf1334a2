#pragma once

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

#include "vm.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

// Runs code against tape starting at cellPtr and returns everything written by '.'.
inline std::string runCode(std::string_view code, brisk::Tape& tape, size_t& cellPtr,
                       const std::string& input = "", brisk::Outcome* outcomeOut = nullptr,
                       std::uint64_t stepLimit = 0, brisk::ProfileInfo* profile = nullptr) {
    std::istringstream in(input);
    std::ostringstream out;
    brisk::Outcome outcome = brisk::run(code, tape, cellPtr, in, out, stepLimit, profile);
    if (outcomeOut) *outcomeOut = outcome;
    return out.str();
}
