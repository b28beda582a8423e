/// @file special.cpp
/// @brief Break, Ram, Display, Button, and Toggle evaluators

#include "state/chip/chip_evals.hpp"

#include "util/debug_log.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tachy::chip {

namespace {

class BreakEval : public ChipEval {
  public:
    BreakEval(size_t input, size_t output, Coords coords)
        : input_(input), output_(output), coords_(coords) {}

    void eval(CircuitState& state) override {
        if (auto value = state.recv_event(input_)) {
            state.send_event(output_, *value);
            state.breakpoint(coords_);
        }
    }

  private:
    size_t input_;
    size_t output_;
    Coords coords_;
};

/// Words shared by the two halves of a dual-port Ram. Each word remembers
/// the (time step, subcycle) of its last write so that two writes in the
/// same subcycle can be caught.
struct RamStorage {
    struct Word {
        uint32_t value = 0;
        bool written = false;
        uint32_t time_step = 0;
        uint32_t subcycle = 0;
    };

    explicit RamStorage(size_t num_words) : words(num_words) {}

    std::vector<Word> words;
};

/// One port of a Ram: reads the addressed word onto its output and writes
/// the word when its data event fires
class RamEval : public ChipEval {
  public:
    RamEval(size_t address, size_t data, size_t output, std::shared_ptr<RamStorage> storage)
        : address_(address), data_(data), output_(output), storage_(std::move(storage)) {}

    void eval(CircuitState& state) override {
        const size_t address = state.recv_behavior(address_) % storage_->words.size();
        auto& word = storage_->words[address];
        if (auto value = state.recv_event(data_)) {
            if (word.written && word.time_step == state.time_step() &&
                word.subcycle == state.subcycle()) {
                state.fatal_error(data_, "Two values were written to RAM address " +
                                             std::to_string(address) + " in the same cycle.");
            }
            word.value = *value;
            word.written = true;
            word.time_step = state.time_step();
            word.subcycle = state.subcycle();
        }
        state.send_behavior(output_, word.value);
    }

  private:
    size_t address_;
    size_t data_;
    size_t output_;
    std::shared_ptr<RamStorage> storage_;
};

/// Emits one event per subcycle while presses are pending
class ButtonEval : public ChipEval {
  public:
    ButtonEval(size_t output, Coords coords, CircuitInteraction* interact)
        : output_(output), coords_(coords), interact_(interact) {}

    void eval(CircuitState& state) override {
        while (interact_->take_press(coords_)) {
            ++press_count_;
        }
        if (press_count_ > 0) {
            debug_log("Button at (%d, %d) fired, %u press(es) left", coords_.x, coords_.y,
                      press_count_ - 1);
            --press_count_;
            state.send_event(output_, 0);
        }
    }

    bool needs_another_cycle(const CircuitState& state) override {
        (void)state;
        return press_count_ > 0;
    }

  private:
    size_t output_;
    Coords coords_;
    CircuitInteraction* interact_;
    uint32_t press_count_ = 0;
};

class ToggleEval : public ChipEval {
  public:
    ToggleEval(size_t output, Coords coords, bool value, CircuitInteraction* interact)
        : output_(output), coords_(coords), value_(value), interact_(interact) {}

    void eval(CircuitState& state) override {
        while (interact_->take_press(coords_)) {
            value_ = !value_;
            debug_log("Toggle at (%d, %d) is now %d", coords_.x, coords_.y,
                      value_ ? 1 : 0);
        }
        state.send_behavior(output_, value_ ? 1u : 0u);
    }

  private:
    size_t output_;
    Coords coords_;
    bool value_;
    CircuitInteraction* interact_;
};

} // namespace

std::vector<ChipEvalEntry> new_special_evals(ChipType type, Coords coords,
                                             const std::vector<PortSlot>& slots,
                                             CircuitInteraction* interact) {
    switch (type.kind) {
    case ChipKind::BREAK:
        return single_eval<BreakEval>({1}, slots[0].slot, slots[1].slot, coords);
    case ChipKind::RAM: {
        const size_t num_words = size_t{1} << num_bits(slots[0].size);
        auto storage = std::make_shared<RamStorage>(num_words);
        std::vector<ChipEvalEntry> entries;
        entries.push_back(
            {{2}, std::make_unique<RamEval>(slots[0].slot, slots[1].slot, slots[2].slot, storage)});
        entries.push_back(
            {{5}, std::make_unique<RamEval>(slots[3].slot, slots[4].slot, slots[5].slot, storage)});
        return entries;
    }
    case ChipKind::DISPLAY:
        return {};
    case ChipKind::BUTTON:
    case ChipKind::TOGGLE:
        if (interact == nullptr) {
            throw std::invalid_argument(type.to_string() + " needs an interaction buffer");
        }
        if (type.kind == ChipKind::BUTTON) {
            return single_eval<ButtonEval>({0}, slots[0].slot, coords, interact);
        }
        return single_eval<ToggleEval>({0}, slots[0].slot, coords, type.value != 0, interact);
    default:
        throw std::invalid_argument("Not a special chip: " + type.to_string());
    }
}

} // namespace tachy::chip
