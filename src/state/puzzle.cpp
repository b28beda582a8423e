/// @file puzzle.cpp
/// @brief Puzzle names, allowed chip sets, and the catalog registry

#include "state/puzzle.hpp"

#include "state/puzzle/catalog.hpp"

#include <stdexcept>

namespace tachy {

std::string_view puzzle_kind_name(PuzzleKind kind) {
    switch (kind) {
    case PuzzleKind::TUTORIAL:
        return "Tutorial";
    case PuzzleKind::FABRICATE:
        return "Fabricate";
    case PuzzleKind::AUTOMATE:
        return "Automate";
    case PuzzleKind::SANDBOX:
        return "Sandbox";
    }
    return "Unknown";
}

std::string_view eval_score_name(EvalScore score) {
    switch (score) {
    case EvalScore::WIRE_LENGTH:
        return "Wire Length";
    case EvalScore::TIME_STEPS:
        return "Time";
    case EvalScore::VALUE:
        return "Value";
    }
    return "Unknown";
}

std::set<ChipKind> Puzzle::allowed_chips() const {
    const std::set<ChipKind> disallowed = disallowed_chips();
    const bool events = allows_events();
    std::set<ChipKind> allowed;
    for (const auto& [category, kinds] : chip_categories()) {
        for (ChipKind kind : kinds) {
            if ((events || !is_event_chip(kind)) && disallowed.count(kind) == 0) {
                allowed.insert(kind);
            }
        }
    }
    return allowed;
}

// --- Catalog ---

namespace {

struct CatalogEntry {
    PuzzleId id;
    std::unique_ptr<Puzzle> puzzle;
};

const std::vector<CatalogEntry>& catalog_entries() {
    static const std::vector<CatalogEntry> entries = [] {
        std::vector<CatalogEntry> list;
        list.push_back({PuzzleId::TUTORIAL_OR, puzzle::new_tutorial_or()});
        list.push_back({PuzzleId::FABRICATE_XOR, puzzle::new_fabricate_xor()});
        list.push_back({PuzzleId::AUTOMATE_HELIOSTAT, puzzle::new_automate_heliostat()});
        list.push_back({PuzzleId::SANDBOX_BEHAVIOR, puzzle::new_sandbox_behavior()});
        list.push_back({PuzzleId::SANDBOX_EVENT, puzzle::new_sandbox_event()});
        return list;
    }();
    return entries;
}

} // namespace

const std::vector<PuzzleId>& puzzle_catalog() {
    static const std::vector<PuzzleId> ids = [] {
        std::vector<PuzzleId> list;
        for (const auto& entry : catalog_entries()) {
            list.push_back(entry.id);
        }
        return list;
    }();
    return ids;
}

const Puzzle& puzzle_for(PuzzleId id) {
    for (const auto& entry : catalog_entries()) {
        if (entry.id == id) {
            return *entry.puzzle;
        }
    }
    throw std::invalid_argument("Unknown puzzle id");
}

std::string_view puzzle_id_name(PuzzleId id) {
    switch (id) {
    case PuzzleId::TUTORIAL_OR:
        return "TutorialOr";
    case PuzzleId::FABRICATE_XOR:
        return "FabricateXor";
    case PuzzleId::AUTOMATE_HELIOSTAT:
        return "AutomateHeliostat";
    case PuzzleId::SANDBOX_BEHAVIOR:
        return "SandboxBehavior";
    case PuzzleId::SANDBOX_EVENT:
        return "SandboxEvent";
    }
    return "Unknown";
}

std::vector<PuzzleId> unlocked_puzzles(const PuzzleUnlockPredicate& is_unlocked) {
    std::vector<PuzzleId> unlocked;
    for (PuzzleId id : puzzle_catalog()) {
        if (id == PuzzleId::TUTORIAL_OR || (is_unlocked && is_unlocked(id))) {
            unlocked.push_back(id);
        }
    }
    return unlocked;
}

} // namespace tachy
