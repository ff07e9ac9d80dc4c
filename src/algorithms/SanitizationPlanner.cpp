#include "algorithms/SanitizationPlanner.hpp"

#include "services/StorageClassifier.hpp"
#include "util/Logger.hpp"

#include <initializer_list>
#include <string>

namespace {

auto passes(std::initializer_list<Pattern> patterns, size_t buffer_size) -> std::vector<PassSpec> {
    std::vector<PassSpec> specs;
    specs.reserve(patterns.size());
    for (const auto pattern : patterns) {
        specs.push_back(PassSpec{pattern, buffer_size, true});
    }
    return specs;
}

}  // namespace

auto SanitizationPlanner::plan(SanitizationStandard standard, StorageKind kind, bool verify)
    -> PassPlan {
    const auto buffer_size = StorageClassifier::buffer_size_hint(kind);
    const bool solid_state = kind == StorageKind::SolidState;

    PassPlan plan;
    plan.standard = standard;
    plan.storage_kind = kind;
    plan.verify = verify;
    plan.strategy_label = strategy_label(standard, kind);

    switch (standard) {
        case SanitizationStandard::NIST_CLEAR:
            plan.passes = passes({Pattern::Random}, buffer_size);
            break;
        case SanitizationStandard::NIST_PURGE:
            plan.passes = solid_state
                              ? passes({Pattern::Random}, buffer_size)
                              : passes({Pattern::Zero, Pattern::One, Pattern::Random}, buffer_size);
            break;
        case SanitizationStandard::DOD_LEGACY:
            plan.passes = passes({Pattern::Zero, Pattern::One, Pattern::Random}, buffer_size);
            break;
    }

    LOG_DEBUG("Planner", plan.strategy_label + ": " + std::to_string(plan.pass_count()) +
                             (plan.pass_count() == 1 ? " pass" : " passes"));
    return plan;
}

auto SanitizationPlanner::strategy_label(SanitizationStandard standard, StorageKind kind)
    -> std::string {
    std::string label;
    switch (kind) {
        case StorageKind::Rotational:
            label = "HDD";
            break;
        case StorageKind::SolidState:
            label = "SSD/NVMe";
            break;
        case StorageKind::Unknown:
            label = "Unknown";
            break;
    }

    switch (standard) {
        case SanitizationStandard::NIST_CLEAR:
            return label + " (clear)";
        case SanitizationStandard::NIST_PURGE:
            return label + " (purge)";
        case SanitizationStandard::DOD_LEGACY:
            return label + " (dod)";
    }
    return label;
}
