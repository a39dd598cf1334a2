#include <cassert>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "helpers.hxx"
#include "vm.hxx"

using brisk::Tape;

static void test_defaults() {
    Tape tape;
    assert(tape.size() == BRISK_DEFAULT_TAPE_SIZE);
    assert(tape.growth() == BRISK_TAPE_GROWTH);
    for (size_t i = 0; i < tape.size(); ++i) assert(tape[i] == 0);

    brisk::EngineConfig cfg;
    cfg.tapeSize = 16;
    cfg.tapeGrowth = 4;
    Tape fromConfig(cfg);
    assert(fromConfig.size() == 16);
    assert(fromConfig.growth() == 4);
}

static void test_growth_on_move() {
    Tape tape(1, 3);
    size_t ptr = 0;
    brisk::Outcome o;
    runCode(">", tape, ptr, "", &o);
    assert(o);
    assert(ptr == 1);
    assert(tape.size() == 4);

    runCode(">>>", tape, ptr, "", &o);
    assert(o);
    assert(ptr == 4);
    assert(tape.size() == 7);
}

static void test_new_cells_are_zero() {
    Tape tape(4, 2);
    size_t ptr = 0;
    std::string right(100, '>');
    std::string out = runCode(right + ".", tape, ptr);
    assert(ptr == 100);
    assert(tape.size() == 102);
    assert(out == std::string(1, '\0'));
    for (size_t i = 0; i < tape.size(); ++i) assert(tape[i] == 0);
}

static void test_never_shrinks() {
    Tape tape(2, 2);
    size_t ptr = 0;
    runCode(">>>>+<<<<", tape, ptr);
    assert(ptr == 0);
    assert(tape.size() == 6);
    assert(tape[4] == 1);
}

static void test_reset() {
    Tape tape(2, 2);
    size_t ptr = 0;
    runCode("+>>>+", tape, ptr);
    assert(tape.size() == 4);
    tape.reset();
    assert(tape.size() == 2);
    assert(tape[0] == 0);
    assert(tape[1] == 0);
}

static void test_limit_clamps_growth() {
    Tape tape(2, 2, 3);
    assert(tape.grow());
    assert(tape.size() == 3);
    assert(!tape.grow());
    assert(tape.size() == 3);
}

static void test_set_growth() {
    Tape tape(2, 2);
    size_t ptr = 0;
    runCode("+>+", tape, ptr);
    tape.setGrowth(5);
    assert(tape.growth() == 5);
    assert(tape.size() == 2);
    assert(tape[0] == 1 && tape[1] == 1);
    runCode(">", tape, ptr);
    assert(tape.size() == 7);
    assert(tape[0] == 1 && tape[1] == 1);

    bool threw = false;
    try {
        tape.setGrowth(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(tape.growth() == 5);
}

static void test_invalid_parameters() {
    bool threw = false;
    try {
        Tape tape(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Tape tape(8, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Tape tape(8, 8, 4);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    test_defaults();
    test_growth_on_move();
    test_new_cells_are_zero();
    test_never_shrinks();
    test_reset();
    test_limit_clamps_growth();
    test_set_growth();
    test_invalid_parameters();
    return 0;
}
