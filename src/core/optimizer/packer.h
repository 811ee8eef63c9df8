#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "cutting_sheet.h"
#include "sheet.h"

namespace cl {
namespace optimizer {

// Placement strategies
enum class Algorithm { BottomLeftFill, BestFitDecreasing, GuillotineSplit };

// Every strategy, in the order comparisons evaluate them
inline constexpr std::array<Algorithm, 3> ALL_ALGORITHMS = {
    Algorithm::BottomLeftFill, Algorithm::BestFitDecreasing, Algorithm::GuillotineSplit};

// "bottom_left_fill", "best_fit_decreasing", "guillotine_split"
const char* algorithmName(Algorithm algorithm);
std::optional<Algorithm> algorithmFromName(std::string_view name);

// Output of one strategy run. On success every input piece is on exactly one
// sheet and no sheet is empty. When a piece cannot go onto even a fresh sheet
// the run stops, sheets is cleared and unplaceable holds a copy of that piece.
struct PackResult {
    std::vector<CuttingSheet> sheets;
    std::optional<Rectangle> unplaceable;

    bool success() const { return !unplaceable.has_value(); }
};

// Abstract packing strategy
class Packer {
  public:
    virtual ~Packer() = default;

    virtual Algorithm algorithm() const = 0;

    // Pack every piece onto as many sheets as needed. Sheets point into
    // pieces, which must outlive the result.
    virtual PackResult pack(const std::vector<Rectangle>& pieces,
                            const SheetTemplate& sheet) const = 0;

    // Factory (nullptr for a value outside the enum)
    static std::unique_ptr<Packer> create(Algorithm algorithm);
};

}  // namespace optimizer
}  // namespace cl
