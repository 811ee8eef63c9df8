#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cut_report.h"
#include "packer.h"
#include "sheet.h"

namespace cl {
namespace optimizer {

enum class ErrorKind {
    InvalidInput,     // Rejected before packing
    UnplaceablePiece, // A piece fits no sheet orientation
    NotScheduled,     // Batch job the worker pool did not accept
};

struct OptimizeError {
    ErrorKind kind = ErrorKind::InvalidInput;
    std::string field;   // Offending input field, e.g. "sheetWidth", "parts[2].quantity"
    std::string message; // Human-readable description

    // Filled for UnplaceablePiece
    std::string pieceId;
    std::string pieceName;
    f64 pieceWidth = 0.0;
    f64 pieceHeight = 0.0;
    f64 sheetWidth = 0.0;
    f64 sheetHeight = 0.0;
};

// Either a complete report (success) or an error, never a partial report
struct OptimizeResult {
    bool success = false;
    OptimizeError error;
    CutReport report;
};

struct AlgorithmScore {
    Algorithm algorithm = Algorithm::BottomLeftFill;
    ReportSummary summary;
    f64 score = 0.0; // 0-100
};

struct ComparisonResult {
    bool success = false;
    OptimizeError error;
    std::vector<AlgorithmScore> results; // In ALL_ALGORITHMS order
    Algorithm bestAlgorithm = Algorithm::BottomLeftFill;
};

// Orchestrates a cutting-layout run: validates input, expands quantities,
// dispatches to the selected strategy and assembles the report.
// Holds no state beyond the default kerf, so one instance may serve
// concurrent calls.
class CuttingOptimizer {
  public:
    explicit CuttingOptimizer(f64 kerfWidth = DEFAULT_KERF_WIDTH) : m_kerfWidth(kerfWidth) {}

    f64 kerfWidth() const { return m_kerfWidth; }

    // Uses this optimizer's kerf
    OptimizeResult optimize(const std::vector<Part>& components, f64 sheetWidth,
                            f64 sheetHeight, const std::string& materialRef, f64 thickness,
                            Algorithm algorithm) const;

    // Uses the template's kerf
    OptimizeResult optimize(const std::vector<Part>& components, const SheetTemplate& sheet,
                            Algorithm algorithm) const;

    // Algorithm given by name; an unknown name is an input error
    OptimizeResult optimize(const std::vector<Part>& components, const SheetTemplate& sheet,
                            std::string_view algorithmName) const;

    // Run every strategy on the same input and score each
    ComparisonResult compareAlgorithms(const std::vector<Part>& components, f64 sheetWidth,
                                       f64 sheetHeight, const std::string& materialRef,
                                       f64 thickness) const;
    ComparisonResult compareAlgorithms(const std::vector<Part>& components,
                                       const SheetTemplate& sheet) const;

    // Average per-sheet utilization minus 5 points per sheet beyond the first,
    // clamped to [0, 100]. 0 for no sheets.
    static f64 optimizationScore(const std::vector<SheetReport>& sheets);

    // Input checks done before any packing; nullopt when the input is usable
    static std::optional<OptimizeError> validate(const std::vector<Part>& components,
                                                 const SheetTemplate& sheet);

  private:
    SheetTemplate makeTemplate(f64 sheetWidth, f64 sheetHeight, const std::string& materialRef,
                               f64 thickness) const;

    f64 m_kerfWidth = DEFAULT_KERF_WIDTH;
};

}  // namespace optimizer
}  // namespace cl
