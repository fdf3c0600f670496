#include "capacity_resolver.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

// Byte-mode thresholds at level L and the version each one selects
constexpr int TIER_THRESHOLDS[] = {106, 271, 520, 858, 1273, 1732, 2303, 2953};
constexpr int TIER_VERSIONS[]   = {5, 10, 15, 20, 25, 30, 35, 40};
constexpr int TIER_COUNT = sizeof(TIER_THRESHOLDS) / sizeof(TIER_THRESHOLDS[0]);
constexpr int MAX_VERSION = 40;

constexpr double PRINT_DPI = 72.0;

int scaled_threshold(int index, ErrorCorrection level) {
    return static_cast<int>(std::floor(TIER_THRESHOLDS[index] * tier_modifier(level)));
}

int modules_per_side(int version) {
    return 17 + 4 * version;
}

} // namespace

int capacity_ceiling(ErrorCorrection level) {
    switch (level) {
        case ErrorCorrection::Low: return 2953;
        case ErrorCorrection::Medium: return 2331;
        case ErrorCorrection::High: return 1273;
    }
    return 2953;
}

double tier_modifier(ErrorCorrection level) {
    switch (level) {
        case ErrorCorrection::Low: return 1.0;
        case ErrorCorrection::Medium: return 0.75;
        case ErrorCorrection::High: return 0.4;
    }
    return 1.0;
}

TierSelection select_tier(int capacity, ErrorCorrection level) {
    const double modifier = tier_modifier(level);
    for (int i = 0; i < TIER_COUNT; ++i) {
        if (capacity <= TIER_THRESHOLDS[i] * modifier)
            return {TIER_VERSIONS[i], capacity};
    }
    // Top tier: the level ceiling is what version 40 really holds
    return {MAX_VERSION, std::min(capacity, capacity_ceiling(level))};
}

int max_legible_version(const PhysicalConstraint& constraint) {
    if (constraint.module_width <= 0.0)
        throw std::invalid_argument("module width must be positive");

    const double max_modules = constraint.available_size / constraint.module_width + 1e-9;
    for (int i = TIER_COUNT - 1; i >= 0; --i) {
        if (modules_per_side(TIER_VERSIONS[i]) <= max_modules)
            return TIER_VERSIONS[i];
    }
    return 0;
}

std::optional<PhysicalConstraint> medium_constraint(PrintMedium medium) {
    const double dot = 1.0 / PRINT_DPI;
    switch (medium) {
        case PrintMedium::Png: return std::nullopt;
        case PrintMedium::Letter: return PhysicalConstraint{3.5, dot};
        case PrintMedium::IndexCard: return PhysicalConstraint{2.5, dot};
        case PrintMedium::PlayingCard: return PhysicalConstraint{2.0, dot};
    }
    return std::nullopt;
}

CapacityResolution resolve_capacity(int requested,
                                    ErrorCorrection level,
                                    const std::optional<PhysicalConstraint>& constraint,
                                    bool force_capacity) {
    if (requested <= 0)
        throw std::invalid_argument("capacity must be positive");

    CapacityResolution res;
    res.requested = requested;
    res.capacity = std::min(requested, capacity_ceiling(level));
    res.clamped_to_ceiling = res.capacity < requested;
    res.version = select_tier(res.capacity, level).version;

    if (!constraint)
        return res;

    res.legible_version = max_legible_version(*constraint);
    if (res.version <= res.legible_version)
        return res;

    if (force_capacity) {
        res.override_applied = true;
        return res;
    }

    // Walk the ladder downwards one threshold at a time
    int capacity = res.capacity;
    for (int i = TIER_COUNT - 1; i >= 0; --i) {
        int step = scaled_threshold(i, level);
        if (step >= capacity)
            continue;
        capacity = step;
        if (TIER_VERSIONS[i] <= res.legible_version)
            break;
    }

    res.downgraded = capacity < res.capacity;
    res.capacity = capacity;
    res.version = select_tier(capacity, level).version;
    return res;
}
