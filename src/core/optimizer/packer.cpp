#include "packer.h"

#include "best_fit_decreasing.h"
#include "bottom_left_fill.h"
#include "guillotine.h"

namespace cl {
namespace optimizer {

const char* algorithmName(Algorithm algorithm) {
    switch (algorithm) {
    case Algorithm::BottomLeftFill:
        return "bottom_left_fill";
    case Algorithm::BestFitDecreasing:
        return "best_fit_decreasing";
    case Algorithm::GuillotineSplit:
        return "guillotine_split";
    }
    return "unknown";
}

std::optional<Algorithm> algorithmFromName(std::string_view name) {
    for (Algorithm algorithm : ALL_ALGORITHMS) {
        if (name == algorithmName(algorithm)) {
            return algorithm;
        }
    }
    return std::nullopt;
}

std::unique_ptr<Packer> Packer::create(Algorithm algorithm) {
    switch (algorithm) {
    case Algorithm::BottomLeftFill:
        return std::make_unique<BottomLeftFillPacker>();
    case Algorithm::BestFitDecreasing:
        return std::make_unique<BestFitDecreasingPacker>();
    case Algorithm::GuillotineSplit:
        return std::make_unique<GuillotinePacker>();
    }
    return nullptr;
}

} // namespace optimizer
} // namespace cl
