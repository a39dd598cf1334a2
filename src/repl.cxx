/*
    Brisk - A small brainfuck interpreter
    Simple line-based REPL implementation using linenoise-ng
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "repl.hxx"

#ifdef BRISK_ENABLE_REPL
#include <linenoise.h>
#endif

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "ansi.hxx"

namespace {
namespace ansi = brisk::ansi;

bool parseSwitch(std::istringstream& iss, bool& flag) {
    std::string val;
    iss >> val;
    if (val == "on") {
        flag = true;
    } else if (val == "off") {
        flag = false;
    } else {
        return false;
    }
    return true;
}

void rebuildTape(ReplSession& session) {
    session.tape = brisk::Tape(session.cfg.engine);
    session.cellPtr = 0;
    session.changed.clear();
}
}  // namespace

void dumpMemory(const brisk::Tape& tape, size_t cellPtr, std::ostream& out,
                const std::vector<size_t>* changed, bool highlight, bool searchActive,
                uint64_t searchValue) {
    if (tape.size() == 0) {
        out << "Memory dump:" << '\n' << "<empty>" << std::endl;
        return;
    }
    size_t lastNonEmpty = tape.size() - 1;
    while (lastNonEmpty > cellPtr && lastNonEmpty > 0 && !tape[lastNonEmpty]) {
        --lastNonEmpty;
    }
    out << "Memory dump:" << '\n'
        << ansi::underline << "row+col |0  |1  |2  |3  |4  |5  |6  |7  |8  |9  |" << ansi::reset
        << std::endl;
    size_t end = std::max(lastNonEmpty, std::min(cellPtr, tape.size() - 1));
    for (size_t i = 0, row = 0; i <= end; ++i) {
        if (i % 10 == 0) {
            if (row) out << std::endl;
            std::string rowStr = std::to_string(row);
            size_t rowPad = rowStr.length() < 8 ? 8 - rowStr.length() : 0;
            out << rowStr << std::string(rowPad, ' ') << "|";
            row += 10;
        }
        bool changedCell = highlight && changed &&
                           std::find(changed->begin(), changed->end(), i) != changed->end();
        bool match = searchActive && static_cast<uint64_t>(tape[i]) == searchValue;
        const auto& color = i == cellPtr  ? ansi::green
                            : match       ? ansi::red
                            : changedCell ? ansi::yellow
                                          : ansi::reset;
        std::string cellStr = std::to_string(tape[i]);
        size_t cellPad = cellStr.length() < 3 ? 3 - cellStr.length() : 0;
        out << color << cellStr << ansi::reset << std::string(cellPad, ' ') << "|";
    }
    out << ansi::reset << std::endl;
}

void reportOutcome(const brisk::Outcome& outcome, std::ostream& out) {
    if (outcome) return;
    out << ansi::red << "ERROR:" << ansi::reset << ' ' << brisk::describe(outcome.status)
        << " at instruction " << outcome.position << std::endl;
}

bool handleReplLine(const std::string& input, ReplSession& session, std::istream& in,
                    std::ostream& out) {
    ReplConfig& cfg = session.cfg;
    if (input.empty()) return true;
    if (input[0] == ':') {
        std::istringstream iss(input.substr(1));
        std::string cmd;
        iss >> cmd;
        if (cmd == "q" || cmd == "quit") {
            return false;
        } else if (cmd == "dump") {
            dumpMemory(session.tape, session.cellPtr, out, &session.changed, cfg.highlightChanges,
                       cfg.searchActive, cfg.searchValue);
        } else if (cmd == "help") {
            out << "Commands:\n"
                << ":dump              show memory\n"
                << ":size N            new tape of N cells\n"
                << ":growth N          grow the tape N cells at a time\n"
                << ":limit N           stop after N instructions (0 = never)\n"
                << ":highlight on|off  highlight changed cells\n"
                << ":search off|VAL    highlight cells equal to VAL\n"
                << ":reset             clear memory and pointer\n"
                << ":q                 quit" << std::endl;
        } else if (cmd == "size") {
            size_t n{};
            if (iss >> n && n > 0 && n <= cfg.engine.tapeLimit) {
                cfg.engine.tapeSize = n;
                rebuildTape(session);
            } else {
                out << "Invalid size" << std::endl;
            }
        } else if (cmd == "growth") {
            size_t n{};
            if (iss >> n && n > 0) {
                cfg.engine.tapeGrowth = n;
                session.tape.setGrowth(n);
            } else {
                out << "Invalid growth" << std::endl;
            }
        } else if (cmd == "limit") {
            uint64_t n{};
            if (iss >> n) {
                cfg.engine.stepLimit = n;
            } else {
                out << "Invalid limit" << std::endl;
            }
        } else if (cmd == "highlight") {
            if (!parseSwitch(iss, cfg.highlightChanges)) {
                out << "Expected on or off" << std::endl;
            } else if (!cfg.highlightChanges) {
                session.changed.clear();
            }
        } else if (cmd == "search") {
            std::string val;
            if (!(iss >> val) || val == "off") {
                cfg.searchActive = false;
            } else {
                std::istringstream num(val);
                uint64_t v{};
                if (num >> v && num.eof() && v <= 255) {
                    cfg.searchValue = v;
                    cfg.searchActive = true;
                } else {
                    out << "Invalid search value" << std::endl;
                    cfg.searchActive = false;
                }
            }
        } else if (cmd == "reset") {
            session.tape.reset();
            session.cellPtr = 0;
            session.changed.clear();
        } else {
            out << "Unknown command" << std::endl;
        }
        return true;
    }

    std::vector<uint8_t> prevCells;
    if (cfg.highlightChanges) prevCells = session.tape.cells();
    brisk::Outcome outcome =
        brisk::run(input, session.tape, session.cellPtr, in, out, cfg.engine.stepLimit);
    in.clear();
    reportOutcome(outcome, out);
    if (cfg.highlightChanges) {
        session.changed.clear();
        const auto& cells = session.tape.cells();
        size_t limit = std::min(prevCells.size(), cells.size());
        for (size_t i = 0; i < limit; ++i) {
            if (cells[i] != prevCells[i]) session.changed.push_back(i);
        }
        for (size_t i = limit; i < cells.size(); ++i) {
            if (cells[i]) session.changed.push_back(i);
        }
    }
    return true;
}

#ifdef BRISK_ENABLE_REPL
namespace {
constexpr int historyLen = 100;
}

int runRepl(ReplSession& session) {
    linenoiseHistorySetMaxLen(historyLen);
    while (true) {
        char* line = linenoise("$ ");
        if (line == nullptr) {
            std::cout << std::endl;
            break;  // Ctrl-D or Ctrl-C
        }
        std::string input(line);
        linenoiseHistoryAdd(line);
        std::free(line);
        if (!handleReplLine(input, session)) break;
    }
    return 0;
}
#endif  // BRISK_ENABLE_REPL
