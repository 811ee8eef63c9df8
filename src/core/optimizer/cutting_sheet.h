#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sheet.h"

namespace cl {
namespace optimizer {

// One stock sheet instance being filled by a packing strategy.
// Placements are append-only and kept in placement order.
class CuttingSheet {
  public:
    explicit CuttingSheet(const SheetTemplate& sheetTemplate);

    f64 width() const { return m_template.width; }
    f64 height() const { return m_template.height; }
    f64 thickness() const { return m_template.thickness; }
    f64 kerfWidth() const { return m_template.kerfWidth; }
    const std::string& materialRef() const { return m_template.materialRef; }

    const std::vector<PlacedRectangle>& placements() const { return m_placements; }
    bool empty() const { return m_placements.empty(); }

    // Bounds and overlap test only. Kerf is not applied here; strategies
    // add it when generating candidate coordinates. Both tests allow
    // PLACEMENT_EPSILON (1e-6 mm): an overlap or overhang that small is
    // accepted as float rounding.
    bool canPlace(const Rectangle& rect, f64 x, f64 y, bool rotated) const;

    // Commits a legal placement. Returns false and leaves the sheet unchanged otherwise.
    // The sheet keeps a pointer to rect.
    bool place(const Rectangle& rect, f64 x, f64 y, bool rotated);

    // Lowest waste score over all candidate positions and allowed rotations
    std::optional<Position> findBestPosition(const Rectangle& rect) const;

    // Origin plus right/above/corner points of every placed piece (offset by kerf),
    // limited to points inside the sheet
    std::vector<std::pair<f64, f64>> candidatePositions() const;

    // Leftover strip areas to the right of and above the piece at (x, y)
    f64 wasteScore(const Rectangle& rect, f64 x, f64 y, bool rotated) const;

    f64 usedArea() const;
    f64 totalArea() const { return m_template.area(); }
    f64 utilization() const; // percent, 0 for a zero-area sheet
    f64 waste() const { return 100.0 - utilization(); }

  private:
    SheetTemplate m_template;
    std::vector<PlacedRectangle> m_placements;
};

} // namespace optimizer
} // namespace cl
