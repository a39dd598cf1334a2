/*
    Brisk - A small brainfuck interpreter
    Program source and console input helpers
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <istream>
#include <streambuf>
#include <string>

namespace brisk {

// Reads and compacts BF source (keeps only +-<>[],.) using a memory-mapped file when possible.
// Returns true on success; on error, 'err' is set and 'out' left unchanged.
bool readBfFileCompacted(const std::string& filename, std::string& out, std::string& err);

/// @brief Stream buffer that answers every read with the first non-blank character of the next
/// line of an upstream stream. A blank line or the end of the upstream stream reads as EOF.
class LineInputBuf : public std::streambuf {
   public:
    explicit LineInputBuf(std::istream& upstream) : upstream_(upstream) {}

   protected:
    int_type underflow() override;

   private:
    std::istream& upstream_;
    char current_ = 0;
};

}  // namespace brisk
