#pragma once

#include <cstdint>
#include <iostream>
#include <string_view>

#include "vm.hxx"

namespace brisk {

class Tape;

/// @brief Runs a translated program until the instruction pointer passes the last instruction or
/// a fault occurs.
/// @param program Output of translate(). Not modified.
/// @param tape Cells to operate on. Grows to the right as needed, keeps its contents on return,
/// including after a fault.
/// @param cellPtr Data pointer. Read on entry, updated on return.
/// @param in Source for ','. End of stream aborts the run with Status::InputExhausted.
/// @param out Sink for '.'. Flushed after every byte.
/// @param stepLimit Abort with Status::StepLimit instead of executing more than this many
/// instructions. 0 disables the check.
/// @param profile Optional instruction count, wall time and final tape length.
/// @return Status::Ok, or the fault with the index of the offending instruction.
Outcome execute(const Program& program, Tape& tape, size_t& cellPtr, std::istream& in = std::cin,
                std::ostream& out = std::cout, std::uint64_t stepLimit = 0,
                ProfileInfo* profile = nullptr);

// translate() followed by execute(). Translation faults are returned without touching the tape.
Outcome run(std::string_view code, Tape& tape, size_t& cellPtr, std::istream& in = std::cin,
            std::ostream& out = std::cout, std::uint64_t stepLimit = 0,
            ProfileInfo* profile = nullptr);

}  // namespace brisk
