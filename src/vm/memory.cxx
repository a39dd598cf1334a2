/*
    Brisk - A small brainfuck interpreter
    Tape storage
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "vm/memory.hxx"

#include <algorithm>
#include <new>
#include <stdexcept>

namespace brisk {

Tape::Tape(size_t initialSize, size_t growth, size_t limit)
    : initial_(initialSize), growth_(growth), limit_(limit) {
    if (initialSize == 0) throw std::invalid_argument("tape size must be positive");
    if (growth == 0) throw std::invalid_argument("tape growth must be positive");
    if (limit < initialSize) throw std::invalid_argument("tape limit is below the tape size");
    cells_.assign(initialSize, 0);
}

Tape::Tape(const EngineConfig& cfg) : Tape(cfg.tapeSize, cfg.tapeGrowth, cfg.tapeLimit) {}

bool Tape::grow() {
    if (cells_.size() >= limit_) return false;
    const size_t step = std::min(growth_, limit_ - cells_.size());
    try {
        cells_.resize(cells_.size() + step, 0);
    } catch (const std::bad_alloc&) {
        return false;
    } catch (const std::length_error&) {
        return false;
    }
    return true;
}

void Tape::setGrowth(size_t growth) {
    if (growth == 0) throw std::invalid_argument("tape growth must be positive");
    growth_ = growth;
}

void Tape::reset() {
    cells_.assign(initial_, 0);
    cells_.shrink_to_fit();
}

}  // namespace brisk
