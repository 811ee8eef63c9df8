#include "cut_list_file.h"

#include <cstdint>
#include <limits>

#include "../utils/file_utils.h"
#include "../utils/log.h"

namespace cl {

using json = nlohmann::json;

namespace {

const char* errorKindName(optimizer::ErrorKind kind) {
    switch (kind) {
    case optimizer::ErrorKind::InvalidInput:
        return "invalid_input";
    case optimizer::ErrorKind::UnplaceablePiece:
        return "unplaceable_piece";
    case optimizer::ErrorKind::NotScheduled:
        return "not_scheduled";
    }
    return "unknown";
}

// nlohmann converts floats and out-of-range integers to int without complaint,
// so counts are checked for an exact integer that fits before reading
bool readCount(const json& part, const char* key, int fallback, int& out) {
    auto it = part.find(key);
    if (it == part.end()) {
        out = fallback;
        return true;
    }

    constexpr std::int64_t lo = std::numeric_limits<int>::min();
    constexpr std::int64_t hi = std::numeric_limits<int>::max();
    bool fits = false;
    std::int64_t value = 0;
    if (it->is_number_unsigned()) {
        std::uint64_t raw = it->get<std::uint64_t>();
        fits = raw <= static_cast<std::uint64_t>(hi);
        value = fits ? static_cast<std::int64_t>(raw) : 0;
    } else if (it->is_number_integer()) {
        value = it->get<std::int64_t>();
        fits = value >= lo && value <= hi;
    }

    if (!fits) {
        log::errorf("CutListFile", "Part '%s': %s must be a whole number, got %s",
                    part.value("name", std::string{}).c_str(), key, it->dump().c_str());
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

} // namespace

std::optional<CutJob> CutListFile::loadJob(const Path& filePath,
                                           const optimizer::SheetTemplate& defaults,
                                           const std::string& defaultAlgorithm) {
    auto text = file::readText(filePath);
    if (!text) {
        log::errorf("CutListFile", "Failed to read job file: %s", filePath.string().c_str());
        return std::nullopt;
    }
    return parseJob(*text, defaults, defaultAlgorithm, file::getStem(filePath));
}

std::optional<CutJob> CutListFile::parseJob(std::string_view text,
                                            const optimizer::SheetTemplate& defaults,
                                            const std::string& defaultAlgorithm,
                                            const std::string& fallbackName) {
    CutJob job;

    try {
        auto doc = json::parse(text.begin(), text.end());
        if (!doc.is_object()) {
            log::errorf("CutListFile", "Job '%s' is not a JSON object", fallbackName.c_str());
            return std::nullopt;
        }

        job.name = doc.value("name", fallbackName);
        job.algorithm = doc.value("algorithm", defaultAlgorithm);

        // Sheet
        job.sheet = defaults;
        if (doc.contains("sheet")) {
            const auto& s = doc["sheet"];
            job.sheet.width = s.value("width", defaults.width);
            job.sheet.height = s.value("height", defaults.height);
            job.sheet.thickness = s.value("thickness", defaults.thickness);
            job.sheet.kerfWidth = s.value("kerf", defaults.kerfWidth);
            job.sheet.materialRef = s.value("material_ref", defaults.materialRef);
        }

        // Parts
        if (!doc.contains("parts") || !doc["parts"].is_array()) {
            log::errorf("CutListFile", "Job '%s' has no parts array", job.name.c_str());
            return std::nullopt;
        }
        for (const auto& p : doc["parts"]) {
            optimizer::Part part;
            part.name = p.value("name", std::string{});
            part.length = p.value("length", 0.0);
            part.width = p.value("width", 0.0);
            part.thickness = p.value("thickness", 0.0);
            if (!readCount(p, "quantity", 1, part.quantity) ||
                !readCount(p, "priority", 1, part.priority)) {
                return std::nullopt;
            }
            part.materialRef = p.value("material_ref", std::string{});
            part.rotatable = p.value("rotatable", true);
            job.parts.push_back(part);
        }
    } catch (const json::exception& e) {
        log::errorf("CutListFile", "JSON parse error in %s: %s", fallbackName.c_str(), e.what());
        return std::nullopt;
    }

    log::debugf("CutListFile", "Loaded job '%s' with %zu parts", job.name.c_str(),
                job.parts.size());
    return job;
}

bool CutListFile::saveReport(const Path& filePath, const optimizer::CutReport& report) {
    if (!file::ensureParentDirectory(filePath)) {
        return false;
    }

    if (!file::replaceText(filePath, reportToJson(report).dump(2))) {
        log::errorf("CutListFile", "Failed to write report: %s", filePath.string().c_str());
        return false;
    }
    return true;
}

json summaryToJson(const optimizer::ReportSummary& summary) {
    return {
        {"totalSheets", summary.totalSheets},
        {"totalPieceAreaM2", summary.totalPieceAreaM2},
        {"totalSheetAreaM2", summary.totalSheetAreaM2},
        {"overallUtilizationPercent", summary.overallUtilizationPercent},
        {"overallWastePercent", summary.overallWastePercent},
        {"algorithmUsed", optimizer::algorithmName(summary.algorithmUsed)}
    };
}

json reportToJson(const optimizer::CutReport& report) {
    json doc;

    auto& sheetsArr = doc["sheets"];
    sheetsArr = json::array();
    for (const auto& sheet : report.sheets) {
        json sheetObj;
        sheetObj["id"] = sheet.id;
        sheetObj["sheetWidth"] = sheet.sheetWidth;
        sheetObj["sheetHeight"] = sheet.sheetHeight;
        sheetObj["materialRef"] = sheet.materialRef;
        sheetObj["thickness"] = sheet.thickness;

        auto& piecesArr = sheetObj["pieces"];
        piecesArr = json::array();
        for (const auto& piece : sheet.pieces) {
            piecesArr.push_back({
                {"id", piece.id},
                {"name", piece.name},
                {"x", piece.x},
                {"y", piece.y},
                {"effectiveWidth", piece.effectiveWidth},
                {"effectiveHeight", piece.effectiveHeight},
                {"rotated", piece.rotated},
                {"colorTag", piece.colorTag}
            });
        }

        sheetObj["utilizationPercent"] = sheet.utilizationPercent;
        sheetObj["wastePercent"] = sheet.wastePercent;
        sheetObj["usedAreaM2"] = sheet.usedAreaM2;
        sheetObj["totalAreaM2"] = sheet.totalAreaM2;
        sheetsArr.push_back(sheetObj);
    }

    doc["summary"] = summaryToJson(report.summary);
    return doc;
}

json comparisonToJson(const optimizer::ComparisonResult& comparison) {
    json doc;

    auto& resultsArr = doc["results"];
    resultsArr = json::array();
    for (const auto& entry : comparison.results) {
        resultsArr.push_back({
            {"algorithm", optimizer::algorithmName(entry.algorithm)},
            {"score", entry.score},
            {"summary", summaryToJson(entry.summary)}
        });
    }

    doc["bestAlgorithm"] = optimizer::algorithmName(comparison.bestAlgorithm);
    return doc;
}

json errorToJson(const optimizer::OptimizeError& error) {
    json err = {
        {"kind", errorKindName(error.kind)},
        {"field", error.field},
        {"message", error.message}
    };

    if (error.kind == optimizer::ErrorKind::UnplaceablePiece) {
        err["pieceId"] = error.pieceId;
        err["pieceName"] = error.pieceName;
        err["pieceWidth"] = error.pieceWidth;
        err["pieceHeight"] = error.pieceHeight;
        err["sheetWidth"] = error.sheetWidth;
        err["sheetHeight"] = error.sheetHeight;
    }

    return {{"error", err}};
}

} // namespace cl
