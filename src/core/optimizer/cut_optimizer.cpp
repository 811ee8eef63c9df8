#include "cut_optimizer.h"

#include <algorithm>
#include <cmath>
#include <set>

#include "../utils/log.h"
#include "../utils/string_utils.h"
#include "optimizer_utils.h"

namespace cl {
namespace optimizer {

namespace {

constexpr f64 SHEET_PENALTY_POINTS = 5.0;
constexpr f64 THICKNESS_TOLERANCE = 0.01; // mm

OptimizeError inputError(const std::string& field, const std::string& message) {
    OptimizeError error;
    error.kind = ErrorKind::InvalidInput;
    error.field = field;
    error.message = message;
    return error;
}

// NaN-safe "> 0"
bool isPositive(f64 value) {
    return value > 0.0 && std::isfinite(value);
}

std::string partField(usize index, const char* member) {
    return "parts[" + std::to_string(index) + "]." + member;
}

OptimizeError unplaceableError(const Rectangle& rect, const SheetTemplate& sheet) {
    OptimizeError error;
    error.kind = ErrorKind::UnplaceablePiece;
    error.field = "parts";
    error.pieceId = rect.id;
    error.pieceName = rect.name;
    error.pieceWidth = rect.width;
    error.pieceHeight = rect.height;
    error.sheetWidth = sheet.width;
    error.sheetHeight = sheet.height;
    error.message = "piece '" + rect.id + "' (" + rect.name + ") is " +
                    str::formatMm(rect.width) + " x " + str::formatMm(rect.height) +
                    " mm and does not fit a " + str::formatMm(sheet.width) + " x " +
                    str::formatMm(sheet.height) + " mm sheet in " +
                    (rect.rotatable ? "either orientation" : "its only allowed orientation");
    return error;
}

} // namespace

SheetTemplate CuttingOptimizer::makeTemplate(f64 sheetWidth, f64 sheetHeight,
                                             const std::string& materialRef,
                                             f64 thickness) const {
    SheetTemplate sheet(sheetWidth, sheetHeight, m_kerfWidth);
    sheet.materialRef = materialRef;
    sheet.thickness = thickness;
    return sheet;
}

std::optional<OptimizeError> CuttingOptimizer::validate(const std::vector<Part>& components,
                                                        const SheetTemplate& sheet) {
    if (!isPositive(sheet.width)) {
        return inputError("sheetWidth",
                          "sheet width must be positive (got " + str::formatMm(sheet.width) + ")");
    }
    if (!isPositive(sheet.height)) {
        return inputError("sheetHeight", "sheet height must be positive (got " +
                                             str::formatMm(sheet.height) + ")");
    }
    if (!isPositive(sheet.thickness)) {
        return inputError("thickness", "sheet thickness must be positive (got " +
                                           str::formatMm(sheet.thickness) + ")");
    }
    if (!(sheet.kerfWidth >= 0.0) || !std::isfinite(sheet.kerfWidth)) {
        return inputError("kerfWidth", "kerf width must be zero or positive (got " +
                                           str::formatMm(sheet.kerfWidth) + ")");
    }
    if (components.empty()) {
        return inputError("parts", "part list is empty");
    }

    std::set<std::string> names;
    for (usize i = 0; i < components.size(); ++i) {
        const Part& part = components[i];

        if (part.name.empty()) {
            return inputError(partField(i, "name"), "part " + std::to_string(i) + " has no name");
        }
        if (!names.insert(part.name).second) {
            return inputError(partField(i, "name"),
                              "part name '" + part.name + "' is used more than once");
        }
        if (!isPositive(part.length)) {
            return inputError(partField(i, "length"), "part '" + part.name +
                                                          "' length must be positive (got " +
                                                          str::formatMm(part.length) + ")");
        }
        if (!isPositive(part.width)) {
            return inputError(partField(i, "width"), "part '" + part.name +
                                                         "' width must be positive (got " +
                                                         str::formatMm(part.width) + ")");
        }
        if (part.quantity <= 0) {
            return inputError(partField(i, "quantity"),
                              "part '" + part.name + "' quantity must be at least 1 (got " +
                                  std::to_string(part.quantity) + ")");
        }
        // 0 thickness / empty material = cut from whatever the sheet is
        if (part.thickness < 0.0 || !std::isfinite(part.thickness)) {
            return inputError(partField(i, "thickness"),
                              "part '" + part.name + "' thickness must not be negative (got " +
                                  str::formatMm(part.thickness) + ")");
        }
        if (part.thickness > 0.0 &&
            std::abs(part.thickness - sheet.thickness) > THICKNESS_TOLERANCE) {
            return inputError(partField(i, "thickness"),
                              "part '" + part.name + "' is " + str::formatMm(part.thickness) +
                                  " mm thick but the sheet is " +
                                  str::formatMm(sheet.thickness) + " mm");
        }
        if (!part.materialRef.empty() && part.materialRef != sheet.materialRef) {
            return inputError(partField(i, "materialRef"),
                              "part '" + part.name + "' needs material '" + part.materialRef +
                                  "' but the sheet is '" + sheet.materialRef + "'");
        }
    }

    return std::nullopt;
}

OptimizeResult CuttingOptimizer::optimize(const std::vector<Part>& components, f64 sheetWidth,
                                          f64 sheetHeight, const std::string& materialRef,
                                          f64 thickness, Algorithm algorithm) const {
    return optimize(components, makeTemplate(sheetWidth, sheetHeight, materialRef, thickness),
                    algorithm);
}

OptimizeResult CuttingOptimizer::optimize(const std::vector<Part>& components,
                                          const SheetTemplate& sheet,
                                          std::string_view algorithmName) const {
    auto algorithm = optimizer::algorithmFromName(algorithmName);
    if (!algorithm) {
        OptimizeResult result;
        result.error = inputError("algorithm", "unknown algorithm '" + std::string(algorithmName) +
                                                   "' (expected bottom_left_fill, "
                                                   "best_fit_decreasing or guillotine_split)");
        log::errorf("Optimizer", "Rejected run: %s", result.error.message.c_str());
        return result;
    }
    return optimize(components, sheet, *algorithm);
}

OptimizeResult CuttingOptimizer::optimize(const std::vector<Part>& components,
                                          const SheetTemplate& sheet,
                                          Algorithm algorithm) const {
    OptimizeResult result;

    auto packer = Packer::create(algorithm);
    if (!packer) {
        result.error = inputError("algorithm", "unknown algorithm value " +
                                                   std::to_string(static_cast<int>(algorithm)));
        log::errorf("Optimizer", "Rejected run: %s", result.error.message.c_str());
        return result;
    }

    if (auto error = validate(components, sheet)) {
        result.error = *error;
        log::errorf("Optimizer", "Rejected run: %s", result.error.message.c_str());
        return result;
    }

    ExpandResult expanded = expandParts(components);
    if (!expanded.success) {
        usize index = static_cast<usize>(expanded.failedPartIndex);
        result.error = inputError(partField(index, "quantity"), expanded.error);
        log::errorf("Optimizer", "Rejected run: %s", result.error.message.c_str());
        return result;
    }
    // Pieces without a material inherit the sheet's
    for (auto& rect : expanded.rectangles) {
        if (rect.materialRef.empty()) {
            rect.materialRef = sheet.materialRef;
        }
    }

    log::debugf("Optimizer", "Packing %zu pieces with %s on %.1f x %.1f (kerf %.2f)",
                expanded.rectangles.size(), algorithmName(algorithm), sheet.width, sheet.height,
                sheet.kerfWidth);

    PackResult packed = packer->pack(expanded.rectangles, sheet);
    if (!packed.success()) {
        result.error = unplaceableError(*packed.unplaceable, sheet);
        log::errorf("Optimizer", "Run failed: %s", result.error.message.c_str());
        return result;
    }

    result.report = buildReport(packed.sheets, expanded.rectangles, algorithm);
    result.success = true;

    log::infof("Optimizer", "%s: %zu pieces on %d sheet(s), %.2f%% utilization",
               algorithmName(algorithm), expanded.rectangles.size(),
               result.report.summary.totalSheets,
               result.report.summary.overallUtilizationPercent);
    return result;
}

ComparisonResult CuttingOptimizer::compareAlgorithms(const std::vector<Part>& components,
                                                     f64 sheetWidth, f64 sheetHeight,
                                                     const std::string& materialRef,
                                                     f64 thickness) const {
    return compareAlgorithms(components,
                             makeTemplate(sheetWidth, sheetHeight, materialRef, thickness));
}

ComparisonResult CuttingOptimizer::compareAlgorithms(const std::vector<Part>& components,
                                                     const SheetTemplate& sheet) const {
    ComparisonResult comparison;

    for (Algorithm algorithm : ALL_ALGORITHMS) {
        OptimizeResult run = optimize(components, sheet, algorithm);
        if (!run.success) {
            comparison.error = run.error;
            comparison.results.clear();
            return comparison;
        }

        AlgorithmScore entry;
        entry.algorithm = algorithm;
        entry.summary = run.report.summary;
        entry.score = optimizationScore(run.report.sheets);
        comparison.results.push_back(entry);
    }

    // Highest score wins; fewer sheets, then evaluation order, break ties
    const AlgorithmScore* best = &comparison.results.front();
    for (const auto& entry : comparison.results) {
        if (entry.score > best->score ||
            (entry.score == best->score &&
             entry.summary.totalSheets < best->summary.totalSheets)) {
            best = &entry;
        }
    }
    comparison.bestAlgorithm = best->algorithm;
    comparison.success = true;

    log::infof("Optimizer", "Best algorithm: %s (score %.2f)", algorithmName(best->algorithm),
               best->score);
    return comparison;
}

f64 CuttingOptimizer::optimizationScore(const std::vector<SheetReport>& sheets) {
    if (sheets.empty()) {
        return 0.0;
    }

    f64 totalUtilization = 0.0;
    for (const auto& sheet : sheets) {
        totalUtilization += sheet.utilizationPercent;
    }
    f64 average = totalUtilization / static_cast<f64>(sheets.size());

    f64 penalty = static_cast<f64>(sheets.size() - 1) * SHEET_PENALTY_POINTS;
    return std::clamp(average - penalty, 0.0, 100.0);
}

} // namespace optimizer
} // namespace cl
