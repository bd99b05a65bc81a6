#pragma once

#include <optional>

// Closed set of deltas an event, event choice or action can carry.
// An empty field means "no effect on that statistic".
struct EffectBundle {
    std::optional<int> treasury;
    std::optional<int> pollution;
    std::optional<int> vitality;
    std::optional<int> trust;
    std::optional<double> growthRate;
    std::optional<int> incomeBase;

    bool empty() const {
        return !treasury && !pollution && !vitality && !trust && !growthRate && !incomeBase;
    }
};
