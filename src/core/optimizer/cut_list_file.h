#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../types.h"
#include "cut_optimizer.h"
#include "cut_report.h"
#include "sheet.h"

namespace cl {

// One optimization request as read from a job file
struct CutJob {
    std::string name;
    optimizer::SheetTemplate sheet;
    std::vector<optimizer::Part> parts;
    std::string algorithm; // Unvalidated; the optimizer rejects unknown names
};

// JSON job files in, JSON reports out. Reports are a hand-off format for
// renderers and cost calculators and are never read back.
class CutListFile {
  public:
    // Sheet fields and the algorithm missing from the file fall back to the
    // given defaults. nullopt (logged) when the file is unreadable or malformed.
    static std::optional<CutJob> loadJob(const Path& filePath,
                                         const optimizer::SheetTemplate& defaults,
                                         const std::string& defaultAlgorithm);

    static std::optional<CutJob> parseJob(std::string_view text,
                                          const optimizer::SheetTemplate& defaults,
                                          const std::string& defaultAlgorithm,
                                          const std::string& fallbackName);

    [[nodiscard]] static bool saveReport(const Path& filePath, const optimizer::CutReport& report);
};

// Output contract for visualization and cost collaborators
nlohmann::json reportToJson(const optimizer::CutReport& report);
nlohmann::json summaryToJson(const optimizer::ReportSummary& summary);
nlohmann::json comparisonToJson(const optimizer::ComparisonResult& comparison);
nlohmann::json errorToJson(const optimizer::OptimizeError& error);

} // namespace cl
