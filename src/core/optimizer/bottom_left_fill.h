#pragma once

#include "packer.h"

namespace cl {
namespace optimizer {

// Bottom-left fill: keeps rescanning the pending pieces against the current
// sheet, restarting from the largest after every placement, until a full pass
// places nothing. Then opens the next sheet.
class BottomLeftFillPacker : public Packer {
  public:
    BottomLeftFillPacker() = default;

    Algorithm algorithm() const override { return Algorithm::BottomLeftFill; }

    PackResult pack(const std::vector<Rectangle>& pieces,
                    const SheetTemplate& sheet) const override;
};

}  // namespace optimizer
}  // namespace cl
