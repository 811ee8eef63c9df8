#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../types.h"
#include "packer.h"

namespace cl {
namespace optimizer {

// A placed piece as handed to the visualization layer
struct PieceReport {
    std::string id;
    std::string name;
    f64 x = 0.0;
    f64 y = 0.0;
    f64 effectiveWidth = 0.0;  // After rotation
    f64 effectiveHeight = 0.0;
    bool rotated = false;
    std::string colorTag;
};

// Result for a single sheet
struct SheetReport {
    int id = 0; // 1-based
    f64 sheetWidth = 0.0;
    f64 sheetHeight = 0.0;
    std::string materialRef;
    f64 thickness = 0.0;
    std::vector<PieceReport> pieces;
    f64 utilizationPercent = 0.0;
    f64 wastePercent = 0.0;
    f64 usedAreaM2 = 0.0;
    f64 totalAreaM2 = 0.0;
};

struct ReportSummary {
    int totalSheets = 0;
    f64 totalPieceAreaM2 = 0.0;
    f64 totalSheetAreaM2 = 0.0;
    f64 overallUtilizationPercent = 0.0;
    f64 overallWastePercent = 0.0;
    Algorithm algorithmUsed = Algorithm::BottomLeftFill;
};

// Complete cut plan result
struct CutReport {
    std::vector<SheetReport> sheets;
    ReportSummary summary;

    usize pieceCount() const {
        usize count = 0;
        for (const auto& sheet : sheets) {
            count += sheet.pieces.size();
        }
        return count;
    }
};

// "hsl(H, 70%, 80%)" with the hue taken from a hash of the name
std::string colorTagFor(std::string_view name);

// Flatten packed sheets into the report. pieces is the full expanded input,
// used for the total piece area.
CutReport buildReport(const std::vector<CuttingSheet>& sheets,
                      const std::vector<Rectangle>& pieces, Algorithm algorithm);

} // namespace optimizer
} // namespace cl
