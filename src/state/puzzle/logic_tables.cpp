/// @file logic_tables.cpp
/// @brief Truth-table puzzles: the Or tutorial and the Xor fabrication task

#include "state/puzzle/catalog.hpp"

#include <functional>
#include <string>
#include <utility>

namespace tachy::puzzle {

namespace {

constexpr uint32_t NUM_ROWS = 4;

std::vector<Interface> two_input_interfaces() {
    return {
        {"In1", Direction::WEST, InterfacePosition::center(),
         {{"In1", PortFlow::SOURCE, PortColor::BEHAVIOR, WireSize::ONE}}},
        {"In2", Direction::SOUTH, InterfacePosition::center(),
         {{"In2", PortFlow::SOURCE, PortColor::BEHAVIOR, WireSize::ONE}}},
        {"Out", Direction::EAST, InterfacePosition::center(),
         {{"Out", PortFlow::SINK, PortColor::BEHAVIOR, WireSize::ONE}}},
    };
}

/// Drives (in1, in2) through 00, 10, 01, 11 and checks the output of each
/// row against `expected`. The table is [in1, in2, out] per row, with the
/// out column filled in as the run progresses.
class TruthTableEval : public PuzzleEval {
  public:
    using Rule = std::function<uint32_t(uint32_t, uint32_t)>;

    TruthTableEval(const InterfaceSlots& slots, Rule expected, std::string_view title)
        : expected_(std::move(expected)) {
        expect_slot_layout(slots, {1, 1, 1}, title);
        input1_ = slots[0][0].slot;
        input2_ = slots[1][0].slot;
        output_ = slots[2][0].slot;
        output_port_ = slots[2][0].loc;
        for (uint32_t row = 0; row < NUM_ROWS; ++row) {
            table_.push_back(row & 1);
            table_.push_back((row >> 1) & 1);
            table_.push_back(expected_(row & 1, (row >> 1) & 1));
        }
    }

    void begin_time_step(CircuitState& state) override {
        const uint32_t row = state.time_step();
        if (row < NUM_ROWS) {
            state.send_behavior(input1_, row & 1);
            state.send_behavior(input2_, (row >> 1) & 1);
        }
    }

    void end_cycle(CircuitState& state) override {
        const uint32_t row = state.time_step();
        if (row >= NUM_ROWS) {
            return;
        }
        const uint32_t in1 = state.recv_behavior(input1_);
        const uint32_t in2 = state.recv_behavior(input2_);
        const uint32_t expected = expected_(in1, in2);
        const uint32_t actual = state.recv_behavior(output_);
        table_[3 * row + 2] = actual;
        if (actual != expected) {
            state.report_error(output_port_,
                               "Expected output " + std::to_string(expected) + " for inputs " +
                                   std::to_string(in1) + " and " + std::to_string(in2) +
                                   ", but output was " + std::to_string(actual) + ".",
                               false);
        }
    }

    bool task_is_completed(const CircuitState& state) const override {
        return state.time_step() >= NUM_ROWS;
    }

    std::vector<uint64_t> verification_data() const override { return table_; }

  private:
    Rule expected_;
    size_t input1_ = 0;
    size_t input2_ = 0;
    size_t output_ = 0;
    WireLoc output_port_;
    std::vector<uint64_t> table_;
};

class TutorialOrPuzzle : public Puzzle {
  public:
    std::string_view title() const override { return "1-Bit Or Gate"; }
    PuzzleKind kind() const override { return PuzzleKind::TUTORIAL; }
    std::string_view description() const override {
        return "Build a 1-bit OR gate out of AND and NOT gates.";
    }
    bool allows_events() const override { return false; }
    std::vector<Interface> interfaces() const override { return two_input_interfaces(); }
    CoordsSize initial_board_size() const override { return {8, 6}; }

    std::unique_ptr<PuzzleEval> new_eval(const InterfaceSlots& slots) const override {
        return std::make_unique<TruthTableEval>(
            slots, [](uint32_t a, uint32_t b) { return a | b; }, title());
    }

  protected:
    std::set<ChipKind> disallowed_chips() const override { return {ChipKind::OR, ChipKind::XOR}; }
};

class FabricateXorPuzzle : public Puzzle {
  public:
    std::string_view title() const override { return "1-Bit Xor Gate"; }
    PuzzleKind kind() const override { return PuzzleKind::FABRICATE; }
    std::string_view description() const override {
        return "Output 1 if exactly one input is 1, and 0 if the inputs are equal.";
    }
    bool allows_events() const override { return false; }
    std::vector<Interface> interfaces() const override { return two_input_interfaces(); }
    CoordsSize initial_board_size() const override { return {8, 6}; }

    std::unique_ptr<PuzzleEval> new_eval(const InterfaceSlots& slots) const override {
        return std::make_unique<TruthTableEval>(
            slots, [](uint32_t a, uint32_t b) { return a ^ b; }, title());
    }
};

} // namespace

std::unique_ptr<Puzzle> new_tutorial_or() {
    return std::make_unique<TutorialOrPuzzle>();
}

std::unique_ptr<Puzzle> new_fabricate_xor() {
    return std::make_unique<FabricateXorPuzzle>();
}

} // namespace tachy::puzzle
