/*
    Brisk - A small brainfuck interpreter
    VM implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "vm.hxx"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace brisk {

const char* describe(Status status) noexcept {
    switch (status) {
        case Status::Ok:
            return "OK";
        case Status::UnmatchedClose:
            return "Unmatched close bracket";
        case Status::UnmatchedOpen:
            return "Unmatched open bracket";
        case Status::OutOfBounds:
            return "Data pointer moved left of cell 0";
        case Status::InputExhausted:
            return "No input available";
        case Status::TapeLimit:
            return "Tape cannot grow any further";
        case Status::StepLimit:
            return "Step limit reached";
    }
    return "Unknown error";
}

Outcome execute(const Program& program, Tape& tape, size_t& cellPtr, std::istream& in,
                std::ostream& out, std::uint64_t stepLimit, ProfileInfo* profile) {
    static void* jtable[] = {&&_MOV_RGT, &&_MOV_LFT, &&_INC,     &&_DEC,
                             &&_PUT_CHR, &&_RAD_CHR, &&_JMP_ZER, &&_JMP_NOT_ZER};

    std::chrono::steady_clock::time_point start;
    if (profile) start = std::chrono::steady_clock::now();

    const instruction* const insp = program.instructions.data();
    const size_t count = program.size();
    size_t ip = 0;
    std::uint64_t steps = 0;
    Outcome result{};
    int ch = 0;

    // A caller may hand over a pointer past the end of a fresh tape.
    while (cellPtr >= tape.size()) {
        if (!tape.grow()) {
            result = {Status::TapeLimit, 0};
            goto _FINISH;
        }
    }

#define DISPATCH()                                      \
    if (ip >= count) goto _FINISH;                      \
    if (stepLimit && steps >= stepLimit) [[unlikely]] { \
        result = {Status::StepLimit, ip};               \
        goto _FINISH;                                   \
    }                                                   \
    ++steps;                                            \
    goto* jtable[static_cast<size_t>(insp[ip].op)]

#define NEXT() \
    ++ip;      \
    DISPATCH()

    DISPATCH();

_MOV_RGT:
    if (++cellPtr >= tape.size()) [[unlikely]] {
        if (!tape.grow()) {
            --cellPtr;
            result = {Status::TapeLimit, ip};
            goto _FINISH;
        }
    }
    NEXT();

_MOV_LFT:
    if (cellPtr == 0) [[unlikely]] {
        result = {Status::OutOfBounds, ip};
        goto _FINISH;
    }
    --cellPtr;
    NEXT();

_INC:
    ++tape[cellPtr];
    NEXT();

_DEC:
    --tape[cellPtr];
    NEXT();

_PUT_CHR:
    out.put(static_cast<char>(tape[cellPtr]));
    out.flush();
    NEXT();

_RAD_CHR:
    ch = in.get();
    if (ch == std::char_traits<char>::eof()) {
        result = {Status::InputExhausted, ip};
        goto _FINISH;
    }
    tape[cellPtr] = static_cast<uint8_t>(ch);
    NEXT();

_JMP_ZER:
    if (!tape[cellPtr]) ip = insp[ip].target;
    NEXT();

_JMP_NOT_ZER:
    // Land on the matching '[' itself so it re-tests the cell.
    if (tape[cellPtr]) {
        ip = insp[ip].target;
        DISPATCH();
    }
    NEXT();

#undef NEXT
#undef DISPATCH

_FINISH:
    if (profile) {
        profile->instructions = steps;
        profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        profile->tapeCells = tape.size();
    }
    return result;
}

Outcome run(std::string_view code, Tape& tape, size_t& cellPtr, std::istream& in,
            std::ostream& out, std::uint64_t stepLimit, ProfileInfo* profile) {
    Program program;
    if (Outcome translated = translate(code, program); !translated) return translated;
    return execute(program, tape, cellPtr, in, out, stepLimit, profile);
}

}  // namespace brisk
