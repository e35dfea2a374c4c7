#include "types.hpp"
#include "spora/errors.hpp"
#include "spora/hex.hpp"
#include <algorithm>

namespace spora {

const char* to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::active: return "active";
        case NodeStatus::offline: return "offline";
        case NodeStatus::dead: return "dead";
    }
    return "unknown";
}

const char* to_string(RedundancyLevel level) {
    switch (level) {
        case RedundancyLevel::minimum: return "minimum";
        case RedundancyLevel::standard: return "standard";
        case RedundancyLevel::maximum: return "maximum";
        case RedundancyLevel::custom: return "custom";
    }
    return "unknown";
}

RedundancyLevel parse_redundancy_level(const std::string& name) {
    if (name == "minimum") return RedundancyLevel::minimum;
    if (name == "standard") return RedundancyLevel::standard;
    if (name == "maximum") return RedundancyLevel::maximum;
    if (name == "custom") return RedundancyLevel::custom;
    throw InvalidRedundancyError("Invalid redundancy level: " + name);
}

const RedundancyTier& tier_for(RedundancyLevel level) {
    static const RedundancyTier minimum{"minimum", 5, 2, 1.0};
    static const RedundancyTier standard{"standard", 15, 4, 1.8};
    static const RedundancyTier maximum{"maximum", 30, 8, 3.0};

    switch (level) {
        case RedundancyLevel::minimum: return minimum;
        case RedundancyLevel::standard: return standard;
        case RedundancyLevel::maximum: return maximum;
        case RedundancyLevel::custom: break;
    }
    throw InvalidRedundancyError("Custom redundancy has no catalog tier");
}

RedundancyTier custom_tier(std::uint32_t copies) {
    if (copies < kAbsoluteRedundancyFloor) {
        throw InvalidRedundancyError("Custom redundancy must be at least " +
                                     std::to_string(kAbsoluteRedundancyFloor) + ", got " +
                                     std::to_string(copies));
    }
    RedundancyTier tier;
    tier.name = "custom";
    tier.copies = copies;
    tier.regions = std::max<std::uint32_t>(2, copies / 5);
    tier.cost_multiplier = static_cast<double>(copies) / 5.0;
    return tier;
}

RedundancyTier resolve_tier(const StoragePreference& preference) {
    if (preference.level == RedundancyLevel::custom) {
        if (!preference.custom_copies) {
            throw InvalidRedundancyError("Custom redundancy requires a copy count");
        }
        return custom_tier(*preference.custom_copies);
    }
    return tier_for(preference.level);
}

std::string make_file_id() {
    return "file_" + hex::encode(crypto::random_bytes(16));
}

std::string make_chunk_id(const std::string& file_id, std::uint32_t index) {
    return file_id + "." + std::to_string(index);
}

std::int64_t to_unix_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_unix_ms(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace spora
