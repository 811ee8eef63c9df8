// CutLayout - Cutting Optimizer Tests

#include <gtest/gtest.h>

#include <algorithm>
#include <map>

#include "core/optimizer/cut_list_file.h"
#include "core/optimizer/cut_optimizer.h"
#include "core/optimizer/optimizer_utils.h"

using namespace cl::optimizer;

namespace {

constexpr double kThickness = 18.0;

SheetTemplate makeSheet(double w, double h, double kerf = 3.0, const std::string& material = "mdf") {
    SheetTemplate sheet(w, h, kerf);
    sheet.materialRef = material;
    sheet.thickness = kThickness;
    return sheet;
}

// Sheet-level invariants every successful report must satisfy
void expectConsistentReport(const CutReport& report, const std::vector<Part>& parts) {
    std::map<std::string, int> placedIds;
    double usedTotal = 0.0;
    double sheetTotal = 0.0;

    for (size_t s = 0; s < report.sheets.size(); ++s) {
        const SheetReport& sheet = report.sheets[s];
        EXPECT_EQ(sheet.id, static_cast<int>(s) + 1);
        EXPECT_FALSE(sheet.pieces.empty());

        EXPECT_GE(sheet.utilizationPercent, 0.0);
        EXPECT_LE(sheet.utilizationPercent, 100.0 + 1e-9);
        EXPECT_NEAR(sheet.wastePercent, 100.0 - sheet.utilizationPercent, 1e-9);

        for (size_t i = 0; i < sheet.pieces.size(); ++i) {
            const PieceReport& a = sheet.pieces[i];
            placedIds[a.id]++;

            // Containment
            EXPECT_GE(a.x, 0.0);
            EXPECT_GE(a.y, 0.0);
            EXPECT_LE(a.x + a.effectiveWidth, sheet.sheetWidth + PLACEMENT_EPSILON) << a.id;
            EXPECT_LE(a.y + a.effectiveHeight, sheet.sheetHeight + PLACEMENT_EPSILON) << a.id;

            // No overlap
            for (size_t j = i + 1; j < sheet.pieces.size(); ++j) {
                const PieceReport& b = sheet.pieces[j];
                bool separated = a.x + a.effectiveWidth <= b.x + PLACEMENT_EPSILON ||
                                 b.x + b.effectiveWidth <= a.x + PLACEMENT_EPSILON ||
                                 a.y + a.effectiveHeight <= b.y + PLACEMENT_EPSILON ||
                                 b.y + b.effectiveHeight <= a.y + PLACEMENT_EPSILON;
                EXPECT_TRUE(separated) << a.id << " overlaps " << b.id;
            }
        }

        usedTotal += sheet.usedAreaM2;
        sheetTotal += sheet.totalAreaM2;
    }

    // Conservation
    ExpandResult expanded = expandParts(parts);
    ASSERT_TRUE(expanded.success);
    std::map<std::string, int> expectedIds;
    for (const auto& rect : expanded.rectangles) {
        expectedIds[rect.id]++;
    }
    EXPECT_EQ(placedIds, expectedIds);

    const ReportSummary& summary = report.summary;
    EXPECT_EQ(summary.totalSheets, static_cast<int>(report.sheets.size()));
    EXPECT_NEAR(summary.totalPieceAreaM2, usedTotal, 1e-9);
    EXPECT_NEAR(summary.totalSheetAreaM2, sheetTotal, 1e-9);
    EXPECT_GE(summary.overallUtilizationPercent, 0.0);
    EXPECT_LE(summary.overallUtilizationPercent, 100.0 + 1e-9);
    EXPECT_NEAR(summary.overallWastePercent, 100.0 - summary.overallUtilizationPercent, 1e-9);
}

std::vector<Part> cabinetParts() {
    std::vector<Part> parts = {
        Part("Side", 720.0, 560.0, 4),     Part("Shelf", 764.0, 540.0, 6),
        Part("Back", 800.0, 720.0, 2),     Part("Door", 715.0, 397.0, 4, false),
        Part("Kick", 800.0, 100.0, 3),     Part("Drawer Front", 396.0, 180.0, 6),
        Part("Stretcher", 764.0, 90.0, 8),
    };
    parts[1].priority = 3;
    return parts;
}

class EveryAlgorithm : public ::testing::TestWithParam<Algorithm> {};

} // namespace

// --- Properties that hold for every strategy ---

TEST_P(EveryAlgorithm, CabinetJobIsConsistent) {
    CuttingOptimizer optimizer;
    auto parts = cabinetParts();

    OptimizeResult result = optimizer.optimize(parts, makeSheet(2750.0, 1830.0), GetParam());

    ASSERT_TRUE(result.success) << result.error.message;
    expectConsistentReport(result.report, parts);
    EXPECT_EQ(result.report.summary.algorithmUsed, GetParam());
}

TEST_P(EveryAlgorithm, SingleSmallPart) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("Panel", 600.0, 300.0)};

    OptimizeResult result = optimizer.optimize(parts, 2750.0, 1830.0, "mdf", kThickness, GetParam());

    ASSERT_TRUE(result.success) << result.error.message;
    expectConsistentReport(result.report, parts);
    ASSERT_EQ(result.report.sheets.size(), 1u);
    ASSERT_EQ(result.report.sheets[0].pieces.size(), 1u);

    const PieceReport& piece = result.report.sheets[0].pieces[0];
    EXPECT_EQ(piece.id, "Panel_1");
    EXPECT_EQ(piece.name, "Panel");
    EXPECT_DOUBLE_EQ(piece.effectiveWidth, 600.0);
    EXPECT_DOUBLE_EQ(piece.effectiveHeight, 300.0);

    EXPECT_NEAR(result.report.sheets[0].utilizationPercent, 600.0 * 300.0 / (2750.0 * 1830.0) * 100.0,
                1e-9);
    EXPECT_NEAR(result.report.sheets[0].utilizationPercent, 3.58, 0.01);
    EXPECT_NEAR(result.report.summary.totalPieceAreaM2, 0.18, 1e-12);
    EXPECT_NEAR(result.report.summary.totalSheetAreaM2, 5.0325, 1e-12);
}

TEST_P(EveryAlgorithm, ExactTilingWithoutKerf) {
    CuttingOptimizer optimizer(0.0);
    std::vector<Part> parts = {Part("Square", 900.0, 900.0, 4)};

    OptimizeResult result = optimizer.optimize(parts, 1800.0, 1800.0, "mdf", kThickness, GetParam());

    ASSERT_TRUE(result.success) << result.error.message;
    expectConsistentReport(result.report, parts);
    ASSERT_EQ(result.report.summary.totalSheets, 1);
    EXPECT_EQ(result.report.sheets[0].pieces.size(), 4u);
    EXPECT_DOUBLE_EQ(result.report.summary.overallUtilizationPercent, 100.0);
    EXPECT_DOUBLE_EQ(result.report.summary.overallWastePercent, 0.0);
}

TEST_P(EveryAlgorithm, OneAndAHalfSheetsOfPartsNeedTwoSheets) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("Slat", 1000.0, 150.0, 10)};

    OptimizeResult result = optimizer.optimize(parts, makeSheet(1000.0, 1000.0), GetParam());

    ASSERT_TRUE(result.success) << result.error.message;
    expectConsistentReport(result.report, parts);
    EXPECT_EQ(result.report.summary.totalSheets, 2);
    EXPECT_NEAR(result.report.summary.totalPieceAreaM2, 1.5, 1e-12);
    EXPECT_NEAR(result.report.summary.overallUtilizationPercent, 75.0, 1e-9);
}

TEST_P(EveryAlgorithm, LargerSheetNeverNeedsMoreSheets) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("Slat", 1000.0, 150.0, 10)};

    OptimizeResult small = optimizer.optimize(parts, makeSheet(1000.0, 1000.0), GetParam());
    OptimizeResult large = optimizer.optimize(parts, makeSheet(2000.0, 2000.0), GetParam());

    ASSERT_TRUE(small.success);
    ASSERT_TRUE(large.success);
    EXPECT_LE(large.report.summary.totalSheets, small.report.summary.totalSheets);
}

TEST_P(EveryAlgorithm, SameInputGivesIdenticalReport) {
    CuttingOptimizer optimizer;
    auto parts = cabinetParts();
    SheetTemplate sheet = makeSheet(2440.0, 1220.0);

    OptimizeResult first = optimizer.optimize(parts, sheet, GetParam());
    OptimizeResult second = optimizer.optimize(parts, sheet, GetParam());

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(cl::reportToJson(first.report).dump(), cl::reportToJson(second.report).dump());
}

TEST_P(EveryAlgorithm, NonRotatablePiecesNeverRotated) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("Grain", 900.0, 300.0, 8, false), Part("Filler", 250.0, 200.0, 10)};

    OptimizeResult result = optimizer.optimize(parts, makeSheet(1220.0, 2440.0), GetParam());

    ASSERT_TRUE(result.success) << result.error.message;
    expectConsistentReport(result.report, parts);
    for (const auto& sheet : result.report.sheets) {
        for (const auto& piece : sheet.pieces) {
            if (piece.name.rfind("Grain", 0) == 0) {
                EXPECT_FALSE(piece.rotated) << piece.id;
                EXPECT_DOUBLE_EQ(piece.effectiveWidth, 900.0);
            }
        }
    }
}

TEST_P(EveryAlgorithm, OversizedLockedPartIsUnplaceable) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("Rail", 3000.0, 100.0, 1, false)};

    OptimizeResult result = optimizer.optimize(parts, makeSheet(2750.0, 1830.0), GetParam());

    ASSERT_FALSE(result.success);
    EXPECT_TRUE(result.report.sheets.empty());
    EXPECT_EQ(result.error.kind, ErrorKind::UnplaceablePiece);
    EXPECT_EQ(result.error.pieceId, "Rail_1");
    EXPECT_EQ(result.error.pieceName, "Rail");
    EXPECT_DOUBLE_EQ(result.error.pieceWidth, 3000.0);
    EXPECT_DOUBLE_EQ(result.error.pieceHeight, 100.0);
    EXPECT_DOUBLE_EQ(result.error.sheetWidth, 2750.0);
    EXPECT_DOUBLE_EQ(result.error.sheetHeight, 1830.0);
    EXPECT_NE(result.error.message.find("its only allowed orientation"), std::string::npos);
}

TEST_P(EveryAlgorithm, PartTooLongInBothOrientationsIsUnplaceable) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("Small", 200.0, 200.0, 3), Part("Beam", 3000.0, 100.0)};

    OptimizeResult result = optimizer.optimize(parts, makeSheet(2750.0, 1830.0), GetParam());

    ASSERT_FALSE(result.success);
    EXPECT_TRUE(result.report.sheets.empty());
    EXPECT_EQ(result.error.kind, ErrorKind::UnplaceablePiece);
    EXPECT_EQ(result.error.pieceId, "Beam_1");
    EXPECT_NE(result.error.message.find("either orientation"), std::string::npos);
}

TEST_P(EveryAlgorithm, EmptyPartListRejected) {
    CuttingOptimizer optimizer;

    OptimizeResult result = optimizer.optimize({}, makeSheet(2750.0, 1830.0), GetParam());

    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, ErrorKind::InvalidInput);
    EXPECT_EQ(result.error.field, "parts");
    EXPECT_TRUE(result.report.sheets.empty());
}

INSTANTIATE_TEST_SUITE_P(Strategies, EveryAlgorithm, ::testing::ValuesIn(ALL_ALGORITHMS),
                         [](const ::testing::TestParamInfo<Algorithm>& info) {
                             std::string name = algorithmName(info.param);
                             name.erase(std::remove(name.begin(), name.end(), '_'), name.end());
                             return name;
                         });

// --- Input validation ---

TEST(CuttingOptimizer, RejectsNonPositiveSheetDimensions) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("A", 100.0, 100.0)};

    auto width = optimizer.optimize(parts, makeSheet(0.0, 1000.0), Algorithm::BottomLeftFill);
    auto height = optimizer.optimize(parts, makeSheet(1000.0, -5.0), Algorithm::BottomLeftFill);

    ASSERT_FALSE(width.success);
    EXPECT_EQ(width.error.field, "sheetWidth");
    ASSERT_FALSE(height.success);
    EXPECT_EQ(height.error.field, "sheetHeight");
    EXPECT_NE(height.error.message.find("-5"), std::string::npos);
}

TEST(CuttingOptimizer, RejectsMissingSheetThickness) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("A", 100.0, 100.0)};

    auto result = optimizer.optimize(parts, 1000.0, 1000.0, "mdf", 0.0, Algorithm::BottomLeftFill);

    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.error.field, "thickness");
}

TEST(CuttingOptimizer, RejectsNegativeKerf) {
    CuttingOptimizer optimizer(-1.0);
    std::vector<Part> parts = {Part("A", 100.0, 100.0)};

    auto result = optimizer.optimize(parts, 1000.0, 1000.0, "mdf", kThickness,
                                     Algorithm::BottomLeftFill);

    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, ErrorKind::InvalidInput);
    EXPECT_EQ(result.error.field, "kerfWidth");
}

TEST(CuttingOptimizer, RejectsBadPartFields) {
    CuttingOptimizer optimizer;
    SheetTemplate sheet = makeSheet(1000.0, 1000.0);

    std::vector<Part> zeroQty = {Part("A", 100.0, 100.0), Part("B", 100.0, 100.0, 0)};
    std::vector<Part> badLength = {Part("A", -100.0, 100.0)};
    std::vector<Part> badWidth = {Part("A", 100.0, 0.0)};
    std::vector<Part> noName = {Part("", 100.0, 100.0)};
    std::vector<Part> duplicate = {Part("A", 100.0, 100.0), Part("A", 200.0, 100.0)};

    EXPECT_EQ(optimizer.optimize(zeroQty, sheet, Algorithm::BottomLeftFill).error.field,
              "parts[1].quantity");
    EXPECT_EQ(optimizer.optimize(badLength, sheet, Algorithm::BottomLeftFill).error.field,
              "parts[0].length");
    EXPECT_EQ(optimizer.optimize(badWidth, sheet, Algorithm::BottomLeftFill).error.field,
              "parts[0].width");
    EXPECT_EQ(optimizer.optimize(noName, sheet, Algorithm::BottomLeftFill).error.field,
              "parts[0].name");
    EXPECT_EQ(optimizer.optimize(duplicate, sheet, Algorithm::BottomLeftFill).error.field,
              "parts[1].name");
}

TEST(CuttingOptimizer, PartThicknessMustMatchSheet) {
    CuttingOptimizer optimizer;
    SheetTemplate sheet = makeSheet(1000.0, 1000.0);

    Part matching("A", 100.0, 100.0);
    matching.thickness = kThickness;
    Part inherited("B", 100.0, 100.0);
    Part thin("C", 100.0, 100.0);
    thin.thickness = 12.0;

    EXPECT_TRUE(optimizer.optimize({matching, inherited}, sheet, Algorithm::BottomLeftFill).success);

    auto result = optimizer.optimize({matching, thin}, sheet, Algorithm::BottomLeftFill);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.error.field, "parts[1].thickness");
}

TEST(CuttingOptimizer, PartMaterialMustMatchSheet) {
    CuttingOptimizer optimizer;
    SheetTemplate sheet = makeSheet(1000.0, 1000.0, 3.0, "birch_ply");

    Part inherited("A", 100.0, 100.0);
    Part matching("B", 100.0, 100.0);
    matching.materialRef = "birch_ply";
    Part other("C", 100.0, 100.0);
    other.materialRef = "oak";

    auto ok = optimizer.optimize({inherited, matching}, sheet, Algorithm::BottomLeftFill);
    ASSERT_TRUE(ok.success);
    EXPECT_EQ(ok.report.sheets[0].materialRef, "birch_ply");
    EXPECT_DOUBLE_EQ(ok.report.sheets[0].thickness, kThickness);

    auto result = optimizer.optimize({inherited, other}, sheet, Algorithm::BottomLeftFill);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.error.field, "parts[1].materialRef");
}

TEST(CuttingOptimizer, UnknownAlgorithmNameRejected) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("A", 100.0, 100.0)};

    auto result = optimizer.optimize(parts, makeSheet(1000.0, 1000.0), "genetic");

    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, ErrorKind::InvalidInput);
    EXPECT_EQ(result.error.field, "algorithm");
    EXPECT_NE(result.error.message.find("genetic"), std::string::npos);
}

TEST(CuttingOptimizer, AlgorithmByName) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("A", 100.0, 100.0)};

    auto result = optimizer.optimize(parts, makeSheet(1000.0, 1000.0), "guillotine_split");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.report.summary.algorithmUsed, Algorithm::GuillotineSplit);
}

TEST(CuttingOptimizer, SixArgumentFormUsesOwnKerf) {
    CuttingOptimizer tight(0.0);
    CuttingOptimizer kerfed(3.0);
    std::vector<Part> parts = {Part("Half", 500.0, 1000.0, 2)};

    auto a = tight.optimize(parts, 1000.0, 1000.0, "mdf", kThickness, Algorithm::BottomLeftFill);
    auto b = kerfed.optimize(parts, 1000.0, 1000.0, "mdf", kThickness, Algorithm::BottomLeftFill);

    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    EXPECT_EQ(a.report.summary.totalSheets, 1);
    EXPECT_EQ(b.report.summary.totalSheets, 2);
}

TEST(CuttingOptimizer, ReportNamesMultiUnitPieces) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("Shelf", 700.0, 300.0, 2)};

    auto result = optimizer.optimize(parts, makeSheet(2750.0, 1830.0), Algorithm::BottomLeftFill);

    ASSERT_TRUE(result.success);
    std::vector<std::string> names;
    for (const auto& piece : result.report.sheets[0].pieces) {
        names.push_back(piece.name);
        EXPECT_EQ(piece.colorTag, colorTagFor(piece.name));
    }
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"Shelf 1", "Shelf 2"}));
}

// --- Scoring / comparison ---

TEST(CuttingOptimizer, ScoreAveragesUtilizationWithSheetPenalty) {
    std::vector<SheetReport> sheets(2);
    sheets[0].utilizationPercent = 90.0;
    sheets[1].utilizationPercent = 60.0;

    EXPECT_DOUBLE_EQ(CuttingOptimizer::optimizationScore(sheets), 70.0);
}

TEST(CuttingOptimizer, ScoreSingleSheetHasNoPenalty) {
    std::vector<SheetReport> sheets(1);
    sheets[0].utilizationPercent = 42.5;

    EXPECT_DOUBLE_EQ(CuttingOptimizer::optimizationScore(sheets), 42.5);
}

TEST(CuttingOptimizer, ScoreClampedAtZero) {
    std::vector<SheetReport> sheets(30);
    for (auto& sheet : sheets) {
        sheet.utilizationPercent = 50.0;
    }

    EXPECT_DOUBLE_EQ(CuttingOptimizer::optimizationScore(sheets), 0.0);
    EXPECT_DOUBLE_EQ(CuttingOptimizer::optimizationScore({}), 0.0);
}

TEST(CuttingOptimizer, CompareRunsEveryStrategy) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("Slat", 1000.0, 150.0, 10)};

    ComparisonResult comparison = optimizer.compareAlgorithms(parts, makeSheet(1000.0, 1000.0));

    ASSERT_TRUE(comparison.success) << comparison.error.message;
    ASSERT_EQ(comparison.results.size(), ALL_ALGORITHMS.size());
    for (size_t i = 0; i < ALL_ALGORITHMS.size(); ++i) {
        EXPECT_EQ(comparison.results[i].algorithm, ALL_ALGORITHMS[i]);
        EXPECT_EQ(comparison.results[i].summary.totalSheets, 2);
        EXPECT_NEAR(comparison.results[i].score, 70.0, 1e-9);
    }

    // All tied, so the first evaluated wins
    EXPECT_EQ(comparison.bestAlgorithm, Algorithm::BottomLeftFill);
}

TEST(CuttingOptimizer, CompareBestHasMinimalSheetCount) {
    CuttingOptimizer optimizer;
    auto parts = cabinetParts();

    ComparisonResult comparison =
        optimizer.compareAlgorithms(parts, 2750.0, 1830.0, "mdf", kThickness);

    ASSERT_TRUE(comparison.success) << comparison.error.message;
    int minSheets = comparison.results.front().summary.totalSheets;
    double bestScore = comparison.results.front().score;
    const AlgorithmScore* winner = nullptr;
    for (const auto& entry : comparison.results) {
        minSheets = std::min(minSheets, entry.summary.totalSheets);
        bestScore = std::max(bestScore, entry.score);
        if (entry.algorithm == comparison.bestAlgorithm) {
            winner = &entry;
        }
    }

    ASSERT_NE(winner, nullptr);
    EXPECT_DOUBLE_EQ(winner->score, bestScore);
    EXPECT_EQ(winner->summary.totalSheets, minSheets);
}

TEST(CuttingOptimizer, CompareStopsOnInvalidInput) {
    CuttingOptimizer optimizer;

    ComparisonResult comparison = optimizer.compareAlgorithms({}, makeSheet(1000.0, 1000.0));

    EXPECT_FALSE(comparison.success);
    EXPECT_EQ(comparison.error.field, "parts");
    EXPECT_TRUE(comparison.results.empty());
}

TEST(CuttingOptimizer, OptimizerIsReusable) {
    CuttingOptimizer optimizer;
    std::vector<Part> parts = {Part("A", 500.0, 500.0, 3)};

    auto failed = optimizer.optimize({}, makeSheet(1000.0, 1000.0), Algorithm::BestFitDecreasing);
    auto ok = optimizer.optimize(parts, makeSheet(1000.0, 1000.0), Algorithm::BestFitDecreasing);

    EXPECT_FALSE(failed.success);
    ASSERT_TRUE(ok.success);
    expectConsistentReport(ok.report, parts);
}
