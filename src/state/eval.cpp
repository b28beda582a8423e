/// @file eval.cpp
/// @brief Evaluator scheduling and the subcycle/cycle/time-step driver

#include "state/eval.hpp"

#include "state/chip/chip_data.hpp"
#include "state/topsort.hpp"
#include "util/debug_log.hpp"

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace tachy {

namespace {

std::string loc_text(const WireLoc& loc) {
    return "(" + std::to_string(loc.coords.x) + ", " + std::to_string(loc.coords.y) + ") " +
           std::string(direction_name(loc.dir));
}

/// One evaluator as the scheduler sees it
struct EvalNode {
    size_t chip;
    std::vector<size_t> outputs;
};

} // namespace

std::vector<BuildError> schedule_blueprint(CircuitBlueprint& blueprint) {
    // Instantiate once to learn which ports each evaluator writes. The
    // scratch buffer only has to outlive this loop.
    CircuitInteraction scratch;
    std::vector<EvalNode> nodes;
    for (size_t c = 0; c < blueprint.chips.size(); ++c) {
        const auto& chip = blueprint.chips[c];
        for (auto& entry : new_chip_evals(chip.type, chip.coords, chip.slots, &scratch)) {
            nodes.push_back({c, std::move(entry.outputs)});
        }
    }

    std::map<size_t, size_t> producer_of;
    for (size_t n = 0; n < nodes.size(); ++n) {
        const auto& slots = blueprint.chips[nodes[n].chip].slots;
        for (size_t port : nodes[n].outputs) {
            producer_of.emplace(slots.at(port).slot, n);
        }
    }

    // For every node, the slots it reads within the same subcycle
    std::vector<std::set<size_t>> inputs(nodes.size());
    std::vector<std::set<size_t>> successors(nodes.size());
    for (size_t n = 0; n < nodes.size(); ++n) {
        const auto& chip = blueprint.chips[nodes[n].chip];
        const ChipData data = chip_data(chip.type);
        for (const auto& [sink, source] : data.dependencies) {
            bool writes_source = false;
            for (size_t port : nodes[n].outputs) {
                writes_source = writes_source || port == source;
            }
            if (!writes_source) {
                continue;
            }
            const size_t slot = chip.slots.at(sink).slot;
            inputs[n].insert(slot);
            auto producer = producer_of.find(slot);
            if (producer != producer_of.end()) {
                successors[producer->second].insert(n);
            }
        }
    }

    const TopologicalGroups sorted = topological_groups(successors);
    blueprint.schedule.clear();
    for (const auto& group : sorted.groups) {
        blueprint.schedule.insert(blueprint.schedule.end(), group.begin(), group.end());
    }

    std::vector<BuildError> errors;
    if (sorted.leftover.empty()) {
        return errors;
    }
    const std::set<size_t> leftover(sorted.leftover.begin(), sorted.leftover.end());
    std::set<size_t> loop_slots;
    for (size_t n : sorted.leftover) {
        for (size_t slot : inputs[n]) {
            auto producer = producer_of.find(slot);
            if (producer != producer_of.end() && leftover.count(producer->second) != 0) {
                loop_slots.insert(slot);
            }
        }
    }
    for (size_t slot : loop_slots) {
        const WireLoc& loc = blueprint.slot_locs.at(slot);
        errors.push_back({BuildErrorKind::COMBINATIONAL_LOOP,
                          "The wire at " + loc_text(loc) +
                              " is part of a loop with no Delay or Clock chip to break it.",
                          slot, loc});
    }
    return errors;
}

std::string_view step_outcome_name(StepOutcome outcome) {
    switch (outcome) {
    case StepOutcome::STEPPED:
        return "Stepped";
    case StepOutcome::BREAKPOINT:
        return "Breakpoint";
    case StepOutcome::COMPLETED:
        return "Completed";
    case StepOutcome::ERRORED:
        return "Errored";
    }
    return "Unknown";
}

// --- CircuitEval ---

CircuitEval::CircuitEval(CircuitBlueprint blueprint, const Puzzle& puzzle, Prefs prefs,
                         ScoreReporter reporter)
    : blueprint_(std::move(blueprint)), puzzle_(&puzzle), prefs_(std::move(prefs)),
      reporter_(std::move(reporter)), interaction_(std::make_unique<CircuitInteraction>()),
      state_(blueprint_.slot_sizes, blueprint_.slot_locs) {
    build_runtime();
}

void CircuitEval::build_runtime() {
    evals_.clear();
    for (const auto& chip : blueprint_.chips) {
        for (auto& entry : new_chip_evals(chip.type, chip.coords, chip.slots, interaction_.get())) {
            evals_.push_back(std::move(entry.eval));
        }
    }
    for (size_t index : blueprint_.schedule) {
        if (index >= evals_.size()) {
            throw std::logic_error("Schedule refers to evaluator " + std::to_string(index) +
                                   " but only " + std::to_string(evals_.size()) + " exist");
        }
    }
    puzzle_eval_ = puzzle_->new_eval(blueprint_.interface_slots);
}

void CircuitEval::reset() {
    interaction_->clear();
    state_ = CircuitState(blueprint_.slot_sizes, blueprint_.slot_locs);
    cycle_in_progress_ = false;
    subcycles_in_cycle_ = 0;
    errored_ = false;
    score_.reset();
    errors_.clear();
    breakpoints_.clear();
    build_runtime();
}

double CircuitEval::seconds_per_time_step() const {
    if (prefs_.seconds_per_time_step_override) {
        return *prefs_.seconds_per_time_step_override;
    }
    return puzzle_eval_->seconds_per_time_step();
}

StepOutcome CircuitEval::terminal_outcome() const {
    return errored_ ? StepOutcome::ERRORED : StepOutcome::COMPLETED;
}

bool CircuitEval::collect_state() {
    for (auto& error : state_.take_errors()) {
        errors_.push_back(std::move(error));
    }
    const std::vector<Coords> fired = state_.take_breakpoints();
    breakpoints_.insert(breakpoints_.end(), fired.begin(), fired.end());
    return !fired.empty();
}

StepOutcome CircuitEval::step_subcycle() {
    if (errored_ || score_) {
        return terminal_outcome();
    }

    if (!cycle_in_progress_) {
        cycle_in_progress_ = true;
        subcycles_in_cycle_ = 0;
        state_.set_subcycle(0);
        state_.clear_last_events();
        puzzle_eval_->begin_time_step(state_);
    } else {
        state_.clear_events();
        state_.set_subcycle(subcycles_in_cycle_);
        puzzle_eval_->begin_additional_cycle(state_);
    }

    for (size_t index : blueprint_.schedule) {
        evals_[index]->eval(state_);
    }

    bool another = false;
    for (size_t index : blueprint_.schedule) {
        if (evals_[index]->needs_another_cycle(state_)) {
            another = true;
        }
    }
    puzzle_eval_->end_subcycle(state_);
    if (puzzle_eval_->needs_another_cycle(state_)) {
        another = true;
    }
    ++subcycles_in_cycle_;

    if (another && !state_.has_fatal_error() &&
        subcycles_in_cycle_ >= prefs_.max_subcycles_per_cycle) {
        state_.report_error(std::nullopt,
                            "The circuit did not settle within " +
                                std::to_string(prefs_.max_subcycles_per_cycle) + " subcycles.",
                            true);
    }
    bool hit_breakpoint = collect_state();

    if (!another && !state_.has_fatal_error()) {
        finish_time_step();
        hit_breakpoint = collect_state() || hit_breakpoint;
    }

    if (state_.has_fatal_error()) {
        errored_ = true;
        cycle_in_progress_ = false;
        debug_log("Evaluation stopped by a fatal error at time step %u",
                  state_.time_step());
        return StepOutcome::ERRORED;
    }
    if (!cycle_in_progress_ && puzzle_eval_->task_is_completed(state_)) {
        complete();
        return StepOutcome::COMPLETED;
    }
    return hit_breakpoint ? StepOutcome::BREAKPOINT : StepOutcome::STEPPED;
}

void CircuitEval::finish_time_step() {
    puzzle_eval_->end_cycle(state_);
    state_.clear_events();
    for (auto& eval : evals_) {
        eval->on_time_step();
    }
    puzzle_eval_->end_time_step(state_);
    state_.set_time_step(state_.time_step() + 1);
    state_.set_subcycle(0);
    cycle_in_progress_ = false;
}

void CircuitEval::complete() {
    uint32_t score = 0;
    switch (puzzle_eval_->score_kind()) {
    case EvalScore::WIRE_LENGTH:
        score = blueprint_.wire_length;
        break;
    case EvalScore::TIME_STEPS:
        score = state_.time_step();
        break;
    case EvalScore::VALUE:
        score = puzzle_eval_->score_value();
        break;
    }
    score_ = score;
    debug_log("\"%s\" completed after %u time steps, score %u (%s)",
              std::string(puzzle_->title()).c_str(), state_.time_step(), score,
              std::string(eval_score_name(puzzle_eval_->score_kind())).c_str());
    if (reporter_) {
        reporter_(puzzle_->title(), score);
    }
}

StepOutcome CircuitEval::step_cycle() {
    do {
        const StepOutcome outcome = step_subcycle();
        if (outcome == StepOutcome::COMPLETED || outcome == StepOutcome::ERRORED) {
            return outcome;
        }
        if (outcome == StepOutcome::BREAKPOINT && prefs_.stop_at_breakpoints) {
            return outcome;
        }
    } while (cycle_in_progress_);
    return StepOutcome::STEPPED;
}

StepOutcome CircuitEval::step_time_step() {
    return step_cycle();
}

} // namespace tachy
