#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "vm.hxx"

namespace brisk {

/// @brief Byte tape owned by the caller of execute(). Grows to the right in fixed increments and
/// never shrinks while a program runs.
class Tape {
   public:
    /// @param initialSize Number of zeroed cells to start with. Must be positive.
    /// @param growth Number of cells appended whenever the data pointer runs off the end. Must be
    /// positive.
    /// @param limit Hard cap on the number of cells; growth past it fails.
    explicit Tape(size_t initialSize = BRISK_DEFAULT_TAPE_SIZE, size_t growth = BRISK_TAPE_GROWTH,
                  size_t limit = static_cast<size_t>(BRISK_TAPE_MAX_BYTES));
    explicit Tape(const EngineConfig& cfg);

    uint8_t& operator[](size_t i) { return cells_[i]; }
    uint8_t operator[](size_t i) const { return cells_[i]; }

    size_t size() const noexcept { return cells_.size(); }
    size_t growth() const noexcept { return growth_; }
    size_t limit() const noexcept { return limit_; }
    const std::vector<uint8_t>& cells() const noexcept { return cells_; }

    // Appends one growth increment of zeroed cells. Returns false when the limit is reached or
    // the allocation fails; the tape is left unchanged in that case.
    bool grow();
    // Changes the increment used by later calls to grow(). Existing cells are kept.
    void setGrowth(size_t growth);
    // Back to the initial size with every cell zeroed.
    void reset();

   private:
    std::vector<uint8_t> cells_;
    size_t initial_;
    size_t growth_;
    size_t limit_;
};

}  // namespace brisk
