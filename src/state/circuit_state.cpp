/// @file circuit_state.cpp
/// @brief Slot storage, event exclusivity, and the interaction buffer

#include "state/circuit_state.hpp"

#include <stdexcept>
#include <utility>

namespace tachy {

void CircuitInteraction::press(Coords coords, uint32_t count) {
    if (count == 0) {
        return;
    }
    presses_[coords] += count;
}

bool CircuitInteraction::take_press(Coords coords) {
    auto it = presses_.find(coords);
    if (it == presses_.end()) {
        return false;
    }
    if (--it->second == 0) {
        presses_.erase(it);
    }
    return true;
}

uint32_t CircuitInteraction::pending(Coords coords) const {
    auto it = presses_.find(coords);
    return it == presses_.end() ? 0 : it->second;
}

CircuitState::CircuitState(std::vector<WireSize> sizes, std::vector<WireLoc> locs)
    : sizes_(std::move(sizes)), locs_(std::move(locs)) {
    if (sizes_.size() != locs_.size()) {
        throw std::invalid_argument("CircuitState needs one location per slot");
    }
    behaviors_.assign(sizes_.size(), 0);
    events_.assign(sizes_.size(), std::nullopt);
    last_events_.assign(sizes_.size(), std::nullopt);
    analogs_.assign(sizes_.size(), Fixed::zero());
}

void CircuitState::send_behavior(size_t slot, uint32_t value) {
    behaviors_.at(slot) = value & mask(sizes_.at(slot));
}

void CircuitState::send_event(size_t slot, uint32_t value) {
    auto& event = events_.at(slot);
    if (event.has_value()) {
        fatal_error(slot, "Two events were sent on the same wire in one subcycle.");
        return;
    }
    event = value & mask(sizes_[slot]);
    last_events_[slot] = event;
}

void CircuitState::report_error(size_t slot, std::string message, bool fatal) {
    report_error(std::optional<WireLoc>(locs_.at(slot)), std::move(message), fatal);
}

void CircuitState::report_error(std::optional<WireLoc> port, std::string message, bool fatal) {
    errors_.push_back(EvalError{time_step_, port, std::move(message), fatal});
    has_fatal_ = has_fatal_ || fatal;
}

void CircuitState::clear_events() {
    for (auto& event : events_) {
        event.reset();
    }
}

void CircuitState::clear_last_events() {
    for (auto& event : last_events_) {
        event.reset();
    }
}

std::vector<EvalError> CircuitState::take_errors() {
    std::vector<EvalError> errors;
    errors.swap(errors_);
    return errors;
}

std::vector<Coords> CircuitState::take_breakpoints() {
    std::vector<Coords> breakpoints;
    breakpoints.swap(breakpoints_);
    return breakpoints;
}

} // namespace tachy
