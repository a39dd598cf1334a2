#include <cassert>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>

#include "helpers.hxx"
#include "vm.hxx"

using brisk::Outcome;
using brisk::Status;
using brisk::Tape;

static void test_output() {
    Tape tape;
    size_t ptr = 0;
    Outcome o;
    std::string out = runCode("++.", tape, ptr, "", &o);
    assert(o);
    assert(out == std::string(1, '\x02'));
}

static void test_loops() {
    Tape tape;
    size_t ptr = 0;
    runCode("+[>+<-]", tape, ptr);
    assert(tape[0] == 0);
    assert(tape[1] == 1);
    assert(ptr == 0);

    runCode("++[>++<-]", tape, ptr);
    assert(tape[0] == 0);
    assert(tape[1] == 5);
}

static void test_nested_loops() {
    Tape tape;
    size_t ptr = 0;
    runCode("++[>++[>+<-]<-]", tape, ptr);
    assert(tape[0] == 0);
    assert(tape[1] == 0);
    assert(tape[2] == 4);
}

static void test_skipped_loop() {
    Tape tape;
    size_t ptr = 0;
    // A zero cell skips the body and resumes right after the closing bracket.
    runCode("[+]+", tape, ptr);
    assert(tape[0] == 1);
    runCode("[-]>[]+", tape, ptr);
    assert(tape[0] == 0);
    assert(tape[1] == 1);
}

static void test_io() {
    Tape tape;
    size_t ptr = 0;
    std::string out = runCode(",.", tape, ptr, "A");
    assert(out == "A");
    assert(tape[0] == 'A');

    out = runCode(",.", tape, ptr, "\xff");
    assert(tape[0] == 255);
    assert(out == "\xff");

    runCode(",", tape, ptr, std::string(1, '\0'));
    assert(tape[0] == 0);
}

static void test_input_exhausted() {
    Tape tape;
    size_t ptr = 0;
    Outcome o;
    tape[0] = 42;
    runCode(",", tape, ptr, "", &o);
    assert(o.status == Status::InputExhausted);
    assert(o.position == 0);
    assert(tape[0] == 42);

    runCode(",>,>,", tape, ptr, "ab", &o);
    assert(o.status == Status::InputExhausted);
    assert(o.position == 4);
    assert(tape[0] == 'a');
    assert(tape[1] == 'b');
    assert(ptr == 2);
}

static void test_wrapping() {
    Tape tape;
    size_t ptr = 0;
    runCode("-", tape, ptr);
    assert(tape[0] == 255);
    runCode("+", tape, ptr);
    assert(tape[0] == 0);

    std::string up(256, '+');
    runCode(up, tape, ptr);
    assert(tape[0] == 0);
}

static void test_boundary_checks() {
    {
        Tape tape;
        size_t ptr = 0;
        Outcome o;
        runCode("<", tape, ptr, "", &o);
        assert(o.status == Status::OutOfBounds);
        assert(o.position == 0);
        assert(ptr == 0);
    }
    {
        Tape tape;
        size_t ptr = 0;
        Outcome o;
        std::string out = runCode("+.><<+", tape, ptr, "", &o);
        assert(o.status == Status::OutOfBounds);
        assert(o.position == 4);
        assert(out == std::string(1, '\x01'));
        assert(tape[0] == 1);
    }
}

static void test_starting_pointer() {
    Tape tape(4, 4);
    size_t ptr = 10;
    Outcome o;
    runCode("+", tape, ptr, "", &o);
    assert(o);
    assert(tape.size() == 12);
    assert(tape[10] == 1);
}

static void test_state_survives_runs() {
    Tape tape;
    size_t ptr = 0;
    runCode("+++>", tape, ptr);
    runCode("++<+", tape, ptr);
    assert(tape[0] == 4);
    assert(tape[1] == 2);
    assert(ptr == 0);
}

static void test_translation_fault_leaves_tape() {
    Tape tape;
    size_t ptr = 0;
    Outcome o;
    runCode("+++>]", tape, ptr, "", &o);
    assert(o.status == Status::UnmatchedClose);
    assert(o.position == 4);
    assert(tape[0] == 0);
    assert(ptr == 0);
}

static void test_every_byte() {
    Tape tape;
    size_t ptr = 0;
    std::string out = runCode("+[.+]", tape, ptr);
    std::string expected;
    for (int i = 1; i < 256; ++i) expected.push_back(static_cast<char>(i));
    assert(out.size() == 255);
    assert(hashOutput(out) == hashOutput(expected));
}

static void test_hello_world() {
    Tape tape;
    size_t ptr = 0;
    const std::string hello =
        "++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---.+++++++..+++.>>.<-.<.+++.------"
        ".--------.>>+.>++.";
    std::string out = runCode(hello, tape, ptr);
    assert(out == "Hello World!\n");
}

static void test_step_limit() {
    Tape tape;
    size_t ptr = 0;
    Outcome o;
    runCode("+[]", tape, ptr, "", &o, 100);
    assert(o.status == Status::StepLimit);
    assert(o.position == 1 || o.position == 2);

    tape.reset();
    runCode("+++", tape, ptr, "", &o, 3);
    assert(o);
    assert(tape[0] == 3);

    tape.reset();
    runCode("+++", tape, ptr, "", &o, 2);
    assert(o.status == Status::StepLimit);
    assert(o.position == 2);
    assert(tape[0] == 2);
}

static void test_profile() {
    Tape tape(8, 8);
    size_t ptr = 0;
    brisk::ProfileInfo profile;
    runCode("++[>+<-]", tape, ptr, "", nullptr, 0, &profile);
    // 2 increments, then the loop body twice with the re-test of '[' each time.
    assert(profile.instructions == 2 + 1 + 2 * 5 + 1);
    assert(profile.seconds >= 0.0);
    assert(profile.tapeCells == 8);
}

static void test_execute_program_directly() {
    brisk::Program program;
    assert(brisk::translate(",[.,]", program));
    Tape tape;
    size_t ptr = 0;
    std::istringstream in("echo");
    std::ostringstream out;
    Outcome o = brisk::execute(program, tape, ptr, in, out);
    assert(o.status == Status::InputExhausted);
    assert(out.str() == "echo");
}

int main() {
    test_output();
    test_loops();
    test_nested_loops();
    test_skipped_loop();
    test_io();
    test_input_exhausted();
    test_wrapping();
    test_boundary_checks();
    test_starting_pointer();
    test_state_survives_runs();
    test_translation_fault_leaves_tape();
    test_every_byte();
    test_hello_world();
    test_step_limit();
    test_profile();
    test_execute_program_directly();
    return 0;
}
