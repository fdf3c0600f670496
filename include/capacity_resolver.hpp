#ifndef QRDRIVE_CAPACITY_RESOLVER_HPP
#define QRDRIVE_CAPACITY_RESOLVER_HPP

#include "session_config.hpp"
#include <optional>

// Printable area for one code and the smallest module a printer/scanner pair
// can still resolve, in the same linear unit (e.g. inches)
struct PhysicalConstraint {
    double available_size;
    double module_width;
};

struct TierSelection {
    int version;   // QR version 5..40
    int capacity;  // capacity after fitting the tier
};

struct CapacityResolution {
    int requested = 0;
    int capacity = 0;             // effective bytes per frame
    int version = 0;              // tier implied by capacity
    int legible_version = 0;      // 0 when unconstrained (or nothing is legible)
    bool clamped_to_ceiling = false;
    bool downgraded = false;
    bool override_applied = false; // downgrade was needed but suppressed
};

// Hard per-frame byte ceiling for a level (QR version 40, byte mode)
int capacity_ceiling(ErrorCorrection level);

// Scale applied to the Low-level thresholds of the tier ladder
double tier_modifier(ErrorCorrection level);

// Smallest tier whose scaled threshold holds capacity, else version 40
TierSelection select_tier(int capacity, ErrorCorrection level);

// Largest ladder version whose module grid fits the constraint; 0 if none
int max_legible_version(const PhysicalConstraint& constraint);

std::optional<PhysicalConstraint> medium_constraint(PrintMedium medium);

CapacityResolution resolve_capacity(int requested,
                                    ErrorCorrection level,
                                    const std::optional<PhysicalConstraint>& constraint = std::nullopt,
                                    bool force_capacity = false);

#endif // QRDRIVE_CAPACITY_RESOLVER_HPP
