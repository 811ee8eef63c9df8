#pragma once

#include <vector>

#include "packer.h"

namespace cl {
namespace optimizer {

// Guillotine algorithm - restricts cuts to guillotine patterns
// (straight through cuts), which is what a panel saw can actually do
class GuillotinePacker : public Packer {
  public:
    GuillotinePacker() = default;

    Algorithm algorithm() const override { return Algorithm::GuillotineSplit; }

    PackResult pack(const std::vector<Rectangle>& pieces,
                    const SheetTemplate& sheet) const override;

  private:
    struct Region {
        f64 x, y, width, height;
    };

    // Fill one sheet starting from the whole-sheet region. Placed pieces are
    // removed from pending.
    void fillSheet(CuttingSheet& sheet, std::vector<const Rectangle*>& pending) const;
};

}  // namespace optimizer
}  // namespace cl
