#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include "sheet.h"

namespace cl {
namespace optimizer {

struct ExpandResult {
    bool success = false;
    std::string error;
    int failedPartIndex = -1;
    std::vector<Rectangle> rectangles;
};

// Expand parts by quantity into one Rectangle per physical cut, preserving part
// order then instance order. Each Part with quantity N produces N entries with
// ids "<name>_1" .. "<name>_N". A part with a non-positive quantity or dimension
// fails the whole expansion.
inline ExpandResult expandParts(const std::vector<Part>& parts) {
    ExpandResult result;

    for (int i = 0; i < static_cast<int>(parts.size()); ++i) {
        const Part& part = parts[static_cast<usize>(i)];
        if (part.quantity <= 0) {
            result.error = "part '" + part.name + "' has quantity " +
                           std::to_string(part.quantity) + " (must be at least 1)";
            result.failedPartIndex = i;
            result.rectangles.clear();
            return result;
        }
        if (part.length <= 0.0 || part.width <= 0.0) {
            result.error = "part '" + part.name + "' has a non-positive length or width";
            result.failedPartIndex = i;
            result.rectangles.clear();
            return result;
        }

        for (int j = 1; j <= part.quantity; ++j) {
            Rectangle rect;
            rect.id = part.name + "_" + std::to_string(j);
            rect.name = part.quantity > 1 ? part.name + " " + std::to_string(j) : part.name;
            rect.width = part.length;
            rect.height = part.width;
            rect.materialRef = part.materialRef;
            rect.priority = part.priority;
            rect.rotatable = part.rotatable;
            result.rectangles.push_back(std::move(rect));
        }
    }

    result.success = true;
    return result;
}

// Pending-piece order shared by every strategy: area descending, then priority
// descending, then input order (stable).
inline std::vector<const Rectangle*> sortByAreaDescending(const std::vector<Rectangle>& pieces) {
    std::vector<const Rectangle*> sorted;
    sorted.reserve(pieces.size());
    for (const auto& piece : pieces) {
        sorted.push_back(&piece);
    }

    std::stable_sort(sorted.begin(), sorted.end(), [](const Rectangle* a, const Rectangle* b) {
        if (a->area() != b->area()) {
            return a->area() > b->area();
        }
        return a->priority > b->priority;
    });

    return sorted;
}

} // namespace optimizer
} // namespace cl
