/*
    Brisk - A small brainfuck interpreter
    VM API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define BRISK_DEFAULT_TAPE_SIZE 1024
#define BRISK_TAPE_GROWTH 128
#define BRISK_TAPE_WARN_BYTES (1ull << 30)  // 1 GiB
// Hard limit to prevent uncontrolled memory allocation from user inputs.
// Growth past this limit aborts the run with Status::TapeLimit.
#define BRISK_TAPE_MAX_BYTES (1ull << 31)  // 2 GiB

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace brisk {

enum class insType : uint8_t {
    MOV_RGT,
    MOV_LFT,
    INC,
    DEC,
    PUT_CHR,
    RAD_CHR,
    JMP_ZER,
    JMP_NOT_ZER,
};

// target is only meaningful for JMP_ZER/JMP_NOT_ZER: the index of the partner bracket.
struct instruction {
    insType op = insType{};
    size_t target = 0;

    bool operator==(const instruction&) const = default;
};

struct Program {
    std::vector<instruction> instructions;

    bool empty() const noexcept { return instructions.empty(); }
    size_t size() const noexcept { return instructions.size(); }
    const instruction& operator[](size_t i) const { return instructions[i]; }

    bool operator==(const Program&) const = default;
};

enum class Status : int {
    Ok = 0,
    UnmatchedClose = 1,
    UnmatchedOpen = 2,
    OutOfBounds = 3,
    InputExhausted = 4,
    TapeLimit = 5,
    StepLimit = 6,
};

// position is the filtered source index for translation faults and the
// instruction pointer for runtime faults.
struct Outcome {
    Status status = Status::Ok;
    size_t position = 0;

    explicit operator bool() const noexcept { return status == Status::Ok; }
};

const char* describe(Status status) noexcept;

struct EngineConfig {
    size_t tapeSize = BRISK_DEFAULT_TAPE_SIZE;
    size_t tapeGrowth = BRISK_TAPE_GROWTH;
    size_t tapeLimit = static_cast<size_t>(BRISK_TAPE_MAX_BYTES);
    std::uint64_t stepLimit = 0;  // 0 = unlimited
};

struct ProfileInfo {
    std::uint64_t instructions = 0;
    double seconds = 0.0;
    size_t tapeCells = 0;
};

}  // namespace brisk

#include "vm/memory.hxx"
#include "vm/translator.hxx"
#include "vm/executor.hxx"
