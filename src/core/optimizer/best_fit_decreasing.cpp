#include "best_fit_decreasing.h"

#include "../utils/log.h"
#include "optimizer_utils.h"

namespace cl {
namespace optimizer {

PackResult BestFitDecreasingPacker::pack(const std::vector<Rectangle>& pieces,
                                         const SheetTemplate& sheetTemplate) const {
    PackResult result;

    // Expanded pieces sorted by area (decreasing)
    auto pending = sortByAreaDescending(pieces);

    while (!pending.empty()) {
        CuttingSheet sheet(sheetTemplate);

        // Single pass: each piece gets one chance on this sheet
        std::vector<const Rectangle*> deferred;
        deferred.reserve(pending.size());
        for (const Rectangle* rect : pending) {
            auto position = sheet.findBestPosition(*rect);
            if (!position || !sheet.place(*rect, position->x, position->y, position->rotated)) {
                deferred.push_back(rect);
            }
        }

        // Only keep the sheet if it has placements
        if (sheet.empty()) {
            log::warningf("BestFitDecreasing", "Empty sheet after pass, '%s' does not fit",
                          deferred.front()->id.c_str());
            result.sheets.clear();
            result.unplaceable = *deferred.front();
            return result;
        }

        log::debugf("BestFitDecreasing", "Closed sheet %zu with %zu pieces, %zu deferred",
                    result.sheets.size() + 1, sheet.placements().size(), deferred.size());
        result.sheets.push_back(std::move(sheet));
        pending = std::move(deferred);
    }

    return result;
}

} // namespace optimizer
} // namespace cl
