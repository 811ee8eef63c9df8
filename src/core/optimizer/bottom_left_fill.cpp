#include "bottom_left_fill.h"

#include "../utils/log.h"
#include "optimizer_utils.h"

namespace cl {
namespace optimizer {

PackResult BottomLeftFillPacker::pack(const std::vector<Rectangle>& pieces,
                                      const SheetTemplate& sheetTemplate) const {
    PackResult result;
    auto pending = sortByAreaDescending(pieces);

    while (!pending.empty()) {
        CuttingSheet sheet(sheetTemplate);

        bool placedAny = true;
        while (placedAny && !pending.empty()) {
            placedAny = false;

            for (auto it = pending.begin(); it != pending.end(); ++it) {
                const Rectangle& rect = **it;
                auto position = sheet.findBestPosition(rect);
                if (position && sheet.place(rect, position->x, position->y, position->rotated)) {
                    pending.erase(it);
                    placedAny = true;
                    break;
                }
            }
        }

        if (sheet.empty()) {
            // A fresh sheet took nothing: the largest pending piece cannot fit at all
            log::warningf("BottomLeftFill", "Empty sheet after pass, '%s' does not fit",
                          pending.front()->id.c_str());
            result.sheets.clear();
            result.unplaceable = *pending.front();
            return result;
        }

        log::debugf("BottomLeftFill", "Closed sheet %zu with %zu pieces (%.2f%%)",
                    result.sheets.size() + 1, sheet.placements().size(), sheet.utilization());
        result.sheets.push_back(std::move(sheet));
    }

    return result;
}

} // namespace optimizer
} // namespace cl
