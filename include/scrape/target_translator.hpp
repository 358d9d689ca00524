#pragma once
#include <string>
#include <vector>

#include "scrape/scrape_type.h"

// 把发现到的目标整体映射为一个 TargetGroup，source 与 key 都是实例 ID。
// 空输入也会产出一个空组，引擎据此清掉之前的目标。
TargetSets translateTargets(const std::string& instanceID,
                            const std::vector<DiscoveryTarget>& targets);
