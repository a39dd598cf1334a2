/*
    Brisk - A small brainfuck interpreter
    Source to instruction translation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vm.hxx"

namespace {
constexpr std::array<const char*, 8> mnemonics = {"MOV_RGT", "MOV_LFT", "INC",     "DEC",
                                                  "PUT_CHR", "RAD_CHR", "JMP_ZER", "JMP_NOT_ZER"};
}  // namespace

namespace brisk {

std::string compact(std::string_view code) {
    std::string out;
    out.reserve(code.size());
    for (char c : code) {
        if (isBfChar(c)) out.push_back(c);
    }
    return out;
}

Outcome translate(std::string_view code, Program& program) {
    std::vector<instruction> instructions;
    instructions.reserve(code.size());
    std::vector<size_t> stack;

    for (char c : code) {
        switch (c) {
            case '>':
                instructions.push_back({insType::MOV_RGT});
                break;
            case '<':
                instructions.push_back({insType::MOV_LFT});
                break;
            case '+':
                instructions.push_back({insType::INC});
                break;
            case '-':
                instructions.push_back({insType::DEC});
                break;
            case '.':
                instructions.push_back({insType::PUT_CHR});
                break;
            case ',':
                instructions.push_back({insType::RAD_CHR});
                break;
            case '[':
                stack.push_back(instructions.size());
                instructions.push_back({insType::JMP_ZER});
                break;
            case ']': {
                if (stack.empty()) return {Status::UnmatchedClose, instructions.size()};
                const size_t start = stack.back();
                stack.pop_back();
                instructions[start].target = instructions.size();
                instructions.push_back({insType::JMP_NOT_ZER, start});
                break;
            }
            default:
                break;
        }
    }
    if (!stack.empty()) return {Status::UnmatchedOpen, stack.front()};

    instructions.shrink_to_fit();
    program.instructions = std::move(instructions);
    return {};
}

std::string disassemble(const Program& program) {
    std::string out;
    for (size_t i = 0; i < program.size(); ++i) {
        const instruction& inst = program[i];
        out += std::to_string(i);
        out += ": ";
        out += mnemonics[static_cast<size_t>(inst.op)];
        if (inst.op == insType::JMP_ZER || inst.op == insType::JMP_NOT_ZER) {
            out += ' ';
            out += std::to_string(inst.target);
        }
        out += '\n';
    }
    return out;
}

}  // namespace brisk
