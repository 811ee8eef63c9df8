#include "cut_report.h"

#include "../utils/hash.h"

namespace cl {
namespace optimizer {

std::string colorTagFor(std::string_view name) {
    u64 hue = hash::fnv1a(name) % 360;
    return "hsl(" + std::to_string(hue) + ", 70%, 80%)";
}

CutReport buildReport(const std::vector<CuttingSheet>& sheets,
                      const std::vector<Rectangle>& pieces, Algorithm algorithm) {
    CutReport report;
    report.sheets.reserve(sheets.size());

    f64 totalSheetArea = 0.0;
    for (usize i = 0; i < sheets.size(); ++i) {
        const CuttingSheet& sheet = sheets[i];

        SheetReport sr;
        sr.id = static_cast<int>(i) + 1;
        sr.sheetWidth = sheet.width();
        sr.sheetHeight = sheet.height();
        sr.materialRef = sheet.materialRef();
        sr.thickness = sheet.thickness();
        sr.utilizationPercent = sheet.utilization();
        sr.wastePercent = sheet.waste();
        sr.usedAreaM2 = mm2ToM2(sheet.usedArea());
        sr.totalAreaM2 = mm2ToM2(sheet.totalArea());

        sr.pieces.reserve(sheet.placements().size());
        for (const auto& placed : sheet.placements()) {
            PieceReport piece;
            piece.id = placed.rect->id;
            piece.name = placed.rect->name;
            piece.x = placed.x;
            piece.y = placed.y;
            piece.effectiveWidth = placed.getWidth();
            piece.effectiveHeight = placed.getHeight();
            piece.rotated = placed.rotated;
            piece.colorTag = colorTagFor(placed.rect->name);
            sr.pieces.push_back(std::move(piece));
        }

        totalSheetArea += sheet.totalArea();
        report.sheets.push_back(std::move(sr));
    }

    f64 totalPieceArea = 0.0;
    for (const auto& piece : pieces) {
        totalPieceArea += piece.area();
    }

    ReportSummary& summary = report.summary;
    summary.totalSheets = static_cast<int>(sheets.size());
    summary.totalPieceAreaM2 = mm2ToM2(totalPieceArea);
    summary.totalSheetAreaM2 = mm2ToM2(totalSheetArea);
    summary.overallUtilizationPercent =
        totalSheetArea > 0.0 ? totalPieceArea / totalSheetArea * 100.0 : 0.0;
    summary.overallWastePercent = 100.0 - summary.overallUtilizationPercent;
    summary.algorithmUsed = algorithm;

    return report;
}

} // namespace optimizer
} // namespace cl
