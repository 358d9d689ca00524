#include "scrape/target_translator.hpp"

#include <utility>

TargetSets translateTargets(const std::string& instanceID,
                            const std::vector<DiscoveryTarget>& targets)
{
    TargetGroup group;
    group.Source = instanceID;
    group.Targets.reserve(targets.size());
    for (const auto& target : targets) {
        group.Targets.emplace_back(target.begin(), target.end());
    }

    TargetSets sets;
    sets[instanceID].push_back(std::move(group));
    return sets;
}
