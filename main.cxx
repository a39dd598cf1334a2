/*
    Brisk - A small brainfuck interpreter
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "cpp-terminal/color.hpp"
#include "cpp-terminal/style.hpp"
#include "repl.hxx"
#include "source.hxx"
#include "vm.hxx"

namespace {
constexpr int exitUsage = 64;
constexpr int exitNoInput = 66;

void printError(std::string_view msg) {
    std::cerr << Term::color_fg(Term::Color::Name::Red)
              << "ERROR:" << Term::color_fg(Term::Color::Name::Default) << ' ' << msg << std::endl;
}

void printWarning(std::string_view msg) {
    std::cerr << Term::color_fg(Term::Color::Name::Yellow)
              << "WARNING:" << Term::color_fg(Term::Color::Name::Default) << ' ' << msg
              << std::endl;
}

void printFault(const brisk::Outcome& outcome) {
    printError(std::string(brisk::describe(outcome.status)) + " at instruction " +
               std::to_string(outcome.position));
}

struct CmdArgs {
    std::string filename;
    std::string evalCode;
    std::vector<std::string> positional;
    bool hasEval = false;
    bool dumpMemory = false;
    bool help = false;
    bool invalid = false;
    bool lineInput = false;
    bool disassemble = false;
    bool profile = false;
    brisk::EngineConfig engine;
};

// Parses a decimal count; prints why it was rejected otherwise.
bool parseCount(const char* val, const char* what, std::uint64_t& outVal, bool allowZero) {
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(val, &end, 10);
    if (val[0] == '-' || end == val || *end != '\0' || (!allowZero && parsed == 0)) {
        std::cerr << what << (allowZero ? " must be a non-negative integer: "
                                        : " must be a positive integer: ")
                  << val << std::endl;
        return false;
    }
    outVal = parsed;
    return true;
}

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    bool onlyCode = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        std::uint64_t n = 0;
        if (onlyCode || arg.empty() || arg[0] != '-') {
            args.positional.emplace_back(arg);
        } else if (arg == "--") {
            onlyCode = true;
        } else if (arg == "-e" && i + 1 < argc) {
            args.evalCode = argv[++i];
            args.hasEval = true;
            args.filename.clear();
        } else if ((arg == "-i" || arg == "-f" || arg == "--file") && i + 1 < argc) {
            const char* path = argv[++i];
            if (!args.hasEval) args.filename = path;
        } else if (arg == "-dm") {
            args.dumpMemory = true;
        } else if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-l") {
            args.lineInput = true;
        } else if (arg == "-dis") {
            args.disassemble = true;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (arg == "-ts" && i + 1 < argc) {
            if (parseCount(argv[++i], "Tape size", n, false))
                args.engine.tapeSize = static_cast<std::size_t>(n);
            else
                args.invalid = true;
        } else if (arg == "-tg" && i + 1 < argc) {
            if (parseCount(argv[++i], "Tape growth", n, false))
                args.engine.tapeGrowth = static_cast<std::size_t>(n);
            else
                args.invalid = true;
        } else if (arg == "-sl" && i + 1 < argc) {
            if (parseCount(argv[++i], "Step limit", n, true))
                args.engine.stepLimit = n;
            else
                args.invalid = true;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            args.invalid = true;
        }
    }
    return args;
}

void printHelp(const char* prog) {
    std::cout << Term::style(Term::Style::Bold) << "Usage:" << Term::style(Term::Style::Reset)
              << ' ' << prog << " [options] [code...]\n"
              << "Options:\n"
              << "  -e <code>        Execute Brainfuck code directly\n"
              << "  -i <file>        Execute code from file (also -f, --file)\n"
              << "  -dm              Dump memory after program\n"
              << "  -ts <size>       Initial tape size in cells (default "
              << BRISK_DEFAULT_TAPE_SIZE << ")\n"
              << "  -tg <size>       Tape growth increment in cells (default "
              << BRISK_TAPE_GROWTH << ")\n"
              << "  -sl <count>      Stop after this many instructions (0 = never)\n"
              << "  -l               Read one character per input line for ','\n"
              << "  -dis             Print the translated instructions and exit\n"
              << "  --profile        Print execution profile\n"
              << "  -h               Show this help message\n"
              << "  --               Treat every following argument as code\n"
              << "Without code or a file the interactive REPL starts." << std::endl;
}

std::string joinCode(const std::vector<std::string>& parts) {
    std::string code;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) code += ' ';
        code += parts[i];
    }
    return code;
}
}  // namespace

int main(int argc, char* argv[]) {
    CmdArgs opts = parseArgs(argc, argv);
    if (opts.invalid) {
        printHelp(argv[0]);
        return exitUsage;
    }
    if (opts.help) {
        printHelp(argv[0]);
        return 0;
    }
    brisk::EngineConfig& cfg = opts.engine;
    if (cfg.tapeSize > cfg.tapeLimit) {
        printError("Requested tape exceeds maximum allowed size (" +
                   std::to_string(cfg.tapeLimit >> 20) + " MiB)");
        return exitUsage;
    }
    if (cfg.tapeSize > BRISK_TAPE_WARN_BYTES) {
        printWarning("Tape allocation ~" + std::to_string(cfg.tapeSize >> 20) +
                     " MiB may exceed system memory");
    }

    std::string code;
    if (opts.hasEval) {
        code = opts.evalCode;
    } else if (!opts.filename.empty()) {
        std::string err;
        if (!brisk::readBfFileCompacted(opts.filename, code, err)) {
            printError(err + ": " + opts.filename);
            return exitNoInput;
        }
    } else if (!opts.positional.empty()) {
        code = joinCode(opts.positional);
    } else {
#ifdef BRISK_ENABLE_REPL
        ReplSession session(ReplConfig{cfg, true, false, 0});
        return runRepl(session);
#else
        printHelp(argv[0]);
        return 0;
#endif
    }

    brisk::Program program;
    if (brisk::Outcome translated = brisk::translate(code, program); !translated) {
        printFault(translated);
        return static_cast<int>(translated.status);
    }
    if (opts.disassemble) {
        std::cout << brisk::disassemble(program);
        return 0;
    }

    brisk::Tape tape(cfg);
    size_t cellPtr = 0;
    brisk::LineInputBuf lineBuf(std::cin);
    std::istream lineIn(&lineBuf);
    std::istream& in = opts.lineInput ? lineIn : std::cin;
    brisk::ProfileInfo prof;
    brisk::ProfileInfo* profPtr = opts.profile ? &prof : nullptr;

    brisk::Outcome outcome =
        brisk::execute(program, tape, cellPtr, in, std::cout, cfg.stepLimit, profPtr);
    if (!outcome) printFault(outcome);
    if (opts.dumpMemory) dumpMemory(tape, cellPtr);
    if (opts.profile) {
        std::cout << "Instructions executed: " << prof.instructions << std::endl;
        std::cout << "Elapsed time: " << prof.seconds << "s" << std::endl;
        std::cout << "Tape cells: " << prof.tapeCells << std::endl;
    }
    return static_cast<int>(outcome.status);
}
