/// @file heliostat.cpp
/// @brief The heliostat automation task and its deterministic RNG

#include "state/puzzle/catalog.hpp"

#include <cmath>

namespace tachy::puzzle {

namespace {

constexpr uint64_t RNG_SEED = 0x4f3173b1f817227fULL;
constexpr uint32_t RETARGET_PERIOD = 20;
constexpr uint32_t INITIAL_ENERGY = 1000;
constexpr uint32_t ENERGY_PER_STEP = 85;
constexpr uint32_t TARGET_ENERGY = 5000;
constexpr uint32_t MAX_POSITION = 0xf;

/// Marsaglia's multiply-with-carry generator. Stable across platforms and
/// standard library versions, unlike <random> distributions.
class SimpleRng {
  public:
    explicit SimpleRng(uint64_t seed)
        : z_(0x159a55e5u ^ static_cast<uint32_t>(seed & 0xffffffffu)),
          w_(0x1f123bb5u ^ static_cast<uint32_t>(seed >> 32)) {}

    uint32_t next_u32() {
        z_ = 36969u * (z_ & 0xffffu) + (z_ >> 16);
        w_ = 18000u * (w_ & 0xffffu) + (w_ >> 16);
        return (z_ << 16) | (w_ & 0xffffu);
    }

    uint32_t next_u4() { return next_u32() & 0xfu; }

  private:
    uint32_t z_;
    uint32_t w_;
};

struct Point {
    uint32_t x;
    uint32_t y;
};

/// Steers a mirror toward an optimal position that moves every 20 steps.
/// Energy accrues each step and drains with distance from the optimum; the
/// task completes once enough energy is banked.
class HeliostatEval : public PuzzleEval {
  public:
    explicit HeliostatEval(const InterfaceSlots& slots) : rng_(RNG_SEED) {
        expect_slot_layout(slots, {2, 3}, "Heliostat");
        opt_x_ = slots[0][0].slot;
        opt_y_ = slots[0][1].slot;
        pos_x_ = slots[1][0].slot;
        pos_y_ = slots[1][1].slot;
        motor_ = slots[1][2].slot;
    }

    void begin_time_step(CircuitState& state) override {
        if (state.time_step() % RETARGET_PERIOD == 0) {
            const uint32_t x = rng_.next_u4();
            const uint32_t y = rng_.next_u4();
            opt_ = {x, y};
        }
        state.send_behavior(opt_x_, opt_.x);
        state.send_behavior(opt_y_, opt_.y);
        state.send_behavior(pos_x_, pos_.x);
        state.send_behavior(pos_y_, pos_.y);
    }

    void end_time_step(CircuitState& state) override {
        const double dx = 10.0 * (static_cast<double>(pos_.x) - static_cast<double>(opt_.x));
        const double dy = 10.0 * (static_cast<double>(pos_.y) - static_cast<double>(opt_.y));
        const auto dist = static_cast<uint32_t>(std::floor(std::sqrt(dx * dx + dy * dy)));
        energy_ += ENERGY_PER_STEP;
        energy_ = energy_ > dist ? energy_ - dist : 0;

        switch (state.recv_behavior(motor_)) {
        case 0x8:
            if (pos_.y < MAX_POSITION) {
                pos_.y += 1;
            }
            break;
        case 0x4:
            if (pos_.y > 0) {
                pos_.y -= 1;
            }
            break;
        case 0x2:
            if (pos_.x > 0) {
                pos_.x -= 1;
            }
            break;
        case 0x1:
            if (pos_.x < MAX_POSITION) {
                pos_.x += 1;
            }
            break;
        default:
            break;
        }
    }

    bool task_is_completed(const CircuitState& state) const override {
        (void)state;
        return energy_ >= TARGET_ENERGY;
    }

    EvalScore score_kind() const override { return EvalScore::TIME_STEPS; }

    std::vector<uint64_t> verification_data() const override {
        return {opt_.x, opt_.y, pos_.x, pos_.y, energy_};
    }

  private:
    size_t opt_x_ = 0;
    size_t opt_y_ = 0;
    size_t pos_x_ = 0;
    size_t pos_y_ = 0;
    size_t motor_ = 0;
    Point opt_{3, 7};
    Point pos_{15, 15};
    uint32_t energy_ = INITIAL_ENERGY;
    SimpleRng rng_;
};

class HeliostatPuzzle : public Puzzle {
  public:
    std::string_view title() const override { return "Heliostat"; }
    PuzzleKind kind() const override { return PuzzleKind::AUTOMATE; }
    std::string_view description() const override {
        return "Automate the ship's heliostat to reflect sunlight onto the solar panels at the "
               "optimal angle.";
    }
    bool allows_events() const override { return false; }

    std::vector<Interface> interfaces() const override {
        return {
            {"Sensor", Direction::SOUTH, InterfacePosition::left(0),
             {{"OptX", PortFlow::SOURCE, PortColor::BEHAVIOR, WireSize::FOUR},
              {"OptY", PortFlow::SOURCE, PortColor::BEHAVIOR, WireSize::FOUR}}},
            {"Motor", Direction::SOUTH, InterfacePosition::right(0),
             {{"PosX", PortFlow::SOURCE, PortColor::BEHAVIOR, WireSize::FOUR},
              {"PosY", PortFlow::SOURCE, PortColor::BEHAVIOR, WireSize::FOUR},
              {"Motor", PortFlow::SINK, PortColor::BEHAVIOR, WireSize::FOUR}}},
        };
    }

    CoordsSize initial_board_size() const override { return {8, 6}; }

    std::unique_ptr<PuzzleEval> new_eval(const InterfaceSlots& slots) const override {
        return std::make_unique<HeliostatEval>(slots);
    }
};

} // namespace

std::unique_ptr<Puzzle> new_automate_heliostat() {
    return std::make_unique<HeliostatPuzzle>();
}

} // namespace tachy::puzzle
