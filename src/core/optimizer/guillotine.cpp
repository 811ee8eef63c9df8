#include "guillotine.h"

#include "../utils/log.h"
#include "optimizer_utils.h"

namespace cl {
namespace optimizer {

PackResult GuillotinePacker::pack(const std::vector<Rectangle>& pieces,
                                  const SheetTemplate& sheetTemplate) const {
    PackResult result;

    // Expanded pieces sorted by area (decreasing)
    auto pending = sortByAreaDescending(pieces);

    while (!pending.empty()) {
        CuttingSheet sheet(sheetTemplate);
        fillSheet(sheet, pending);

        if (sheet.empty()) {
            log::warningf("Guillotine", "Empty sheet after split, '%s' does not fit",
                          pending.front()->id.c_str());
            result.sheets.clear();
            result.unplaceable = *pending.front();
            return result;
        }

        log::debugf("Guillotine", "Closed sheet %zu with %zu pieces (%.2f%%)",
                    result.sheets.size() + 1, sheet.placements().size(), sheet.utilization());
        result.sheets.push_back(std::move(sheet));
    }

    return result;
}

void GuillotinePacker::fillSheet(CuttingSheet& sheet,
                                 std::vector<const Rectangle*>& pending) const {
    const f64 kerf = sheet.kerfWidth();

    // Depth-first over free regions; the right-hand leftover of a cut is
    // finished before the leftover above it.
    std::vector<Region> stack;
    stack.push_back({0.0, 0.0, sheet.width(), sheet.height()});

    while (!stack.empty() && !pending.empty()) {
        Region region = stack.back();
        stack.pop_back();

        if (region.width <= 0.0 || region.height <= 0.0) {
            continue;
        }

        // Largest pending piece that fits (pending is area-sorted)
        auto best = pending.end();
        bool rotated = false;
        for (auto it = pending.begin(); it != pending.end(); ++it) {
            const Rectangle& rect = **it;
            if (rect.width <= region.width + PLACEMENT_EPSILON &&
                rect.height <= region.height + PLACEMENT_EPSILON) {
                best = it;
                rotated = false;
                break;
            }
            if (rect.rotatable && rect.height <= region.width + PLACEMENT_EPSILON &&
                rect.width <= region.height + PLACEMENT_EPSILON) {
                best = it;
                rotated = true;
                break;
            }
        }

        if (best == pending.end()) {
            continue;
        }

        const Rectangle& rect = **best;
        if (!sheet.place(rect, region.x, region.y, rotated)) {
            log::warningf("Guillotine", "Region at (%.1f, %.1f) rejected '%s'", region.x,
                          region.y, rect.id.c_str());
            continue;
        }
        pending.erase(best);

        f64 pieceWidth = rotated ? rect.height : rect.width;
        f64 pieceHeight = rotated ? rect.width : rect.height;

        // Straight cut along the top of the piece, then one along its right side
        f64 rightWidth = region.width - pieceWidth - kerf;
        f64 topHeight = region.height - pieceHeight - kerf;

        if (topHeight > 0.0) {
            stack.push_back({region.x, region.y + pieceHeight + kerf, region.width, topHeight});
        }
        if (rightWidth > 0.0) {
            stack.push_back({region.x + pieceWidth + kerf, region.y, rightWidth, pieceHeight});
        }
    }
}

} // namespace optimizer
} // namespace cl
