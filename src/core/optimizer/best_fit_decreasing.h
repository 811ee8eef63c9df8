#pragma once

#include "packer.h"

namespace cl {
namespace optimizer {

// Best Fit Decreasing: one pass over the pending pieces per sheet, each piece
// going to its lowest-waste position if it has one. Skipped pieces are not
// retried on the same sheet. Cheaper than bottom-left fill, sometimes one
// sheet worse.
class BestFitDecreasingPacker : public Packer {
  public:
    BestFitDecreasingPacker() = default;

    Algorithm algorithm() const override { return Algorithm::BestFitDecreasing; }

    PackResult pack(const std::vector<Rectangle>& pieces,
                    const SheetTemplate& sheet) const override;
};

}  // namespace optimizer
}  // namespace cl
