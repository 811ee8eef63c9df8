#include "cutting_sheet.h"

#include <algorithm>
#include <limits>

namespace cl {
namespace optimizer {

CuttingSheet::CuttingSheet(const SheetTemplate& sheetTemplate) : m_template(sheetTemplate) {}

bool CuttingSheet::canPlace(const Rectangle& rect, f64 x, f64 y, bool rotated) const {
    // Grain-locked pieces only go down in their declared orientation
    if (rotated && !rect.rotatable) {
        return false;
    }

    PlacedRectangle candidate{&rect, x, y, rotated};

    if (x < -PLACEMENT_EPSILON || y < -PLACEMENT_EPSILON) {
        return false;
    }
    if (candidate.getRight() > m_template.width + PLACEMENT_EPSILON ||
        candidate.getTop() > m_template.height + PLACEMENT_EPSILON) {
        return false;
    }

    for (const auto& placed : m_placements) {
        if (candidate.overlaps(placed)) {
            return false;
        }
    }

    return true;
}

bool CuttingSheet::place(const Rectangle& rect, f64 x, f64 y, bool rotated) {
    if (!canPlace(rect, x, y, rotated)) {
        return false;
    }
    m_placements.push_back({&rect, x, y, rotated});
    return true;
}

std::optional<Position> CuttingSheet::findBestPosition(const Rectangle& rect) const {
    std::optional<Position> best;
    f64 bestScore = std::numeric_limits<f64>::max();

    for (const auto& [x, y] : candidatePositions()) {
        if (canPlace(rect, x, y, false)) {
            f64 score = wasteScore(rect, x, y, false);
            if (score < bestScore) {
                bestScore = score;
                best = Position{x, y, false};
            }
        }

        if (rect.rotatable && canPlace(rect, x, y, true)) {
            f64 score = wasteScore(rect, x, y, true);
            if (score < bestScore) {
                bestScore = score;
                best = Position{x, y, true};
            }
        }
    }

    return best;
}

std::vector<std::pair<f64, f64>> CuttingSheet::candidatePositions() const {
    const f64 kerf = m_template.kerfWidth;

    std::vector<std::pair<f64, f64>> positions;
    positions.reserve(1 + m_placements.size() * 3);
    positions.emplace_back(0.0, 0.0);

    for (const auto& placed : m_placements) {
        positions.emplace_back(placed.getRight() + kerf, placed.y);
        positions.emplace_back(placed.x, placed.getTop() + kerf);
        positions.emplace_back(placed.getRight() + kerf, placed.getTop() + kerf);
    }

    positions.erase(std::remove_if(positions.begin(), positions.end(),
                                   [this](const std::pair<f64, f64>& p) {
                                       return p.first < 0.0 || p.first >= m_template.width ||
                                              p.second < 0.0 || p.second >= m_template.height;
                                   }),
                    positions.end());
    return positions;
}

f64 CuttingSheet::wasteScore(const Rectangle& rect, f64 x, f64 y, bool rotated) const {
    f64 width = rotated ? rect.height : rect.width;
    f64 height = rotated ? rect.width : rect.height;

    f64 rightWaste = std::max(0.0, m_template.width - (x + width));
    f64 topWaste = std::max(0.0, m_template.height - (y + height));

    return rightWaste * height + topWaste * width;
}

f64 CuttingSheet::usedArea() const {
    f64 area = 0.0;
    for (const auto& placed : m_placements) {
        area += placed.rect->area();
    }
    return area;
}

f64 CuttingSheet::utilization() const {
    f64 total = totalArea();
    return total > 0.0 ? usedArea() / total * 100.0 : 0.0;
}

} // namespace optimizer
} // namespace cl
