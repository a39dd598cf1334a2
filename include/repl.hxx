/*
    Brisk - A small brainfuck interpreter
    REPL API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "vm.hxx"

struct ReplConfig {
    brisk::EngineConfig engine;
    bool highlightChanges;
    bool searchActive;
    uint64_t searchValue;
};

// Tape and data pointer survive from one line to the next.
struct ReplSession {
    explicit ReplSession(const ReplConfig& config) : cfg(config), tape(config.engine) {}

    ReplConfig cfg;
    brisk::Tape tape;
    size_t cellPtr = 0;
    std::vector<size_t> changed;
};

void dumpMemory(const brisk::Tape& tape, size_t cellPtr, std::ostream& out = std::cout,
                const std::vector<size_t>* changed = nullptr, bool highlight = false,
                bool searchActive = false, uint64_t searchValue = 0);

void reportOutcome(const brisk::Outcome& outcome, std::ostream& out = std::cout);

/// @brief Handles one line of REPL input: a ':' command, or code to run against the session tape.
/// @param in Source for ',' while the code runs. Its error state is cleared afterwards.
/// @return false once the user asked to quit.
bool handleReplLine(const std::string& line, ReplSession& session, std::istream& in = std::cin,
                    std::ostream& out = std::cout);

#ifdef BRISK_ENABLE_REPL
int runRepl(ReplSession& session);
#endif  // BRISK_ENABLE_REPL
