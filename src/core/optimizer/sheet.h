#pragma once

#include <string>
#include <vector>

#include "../types.h"

namespace cl {
namespace optimizer {

inline constexpr f64 DEFAULT_KERF_WIDTH = 3.0; // mm

// Tolerance for float rounding in bounds and overlap tests (mm)
inline constexpr f64 PLACEMENT_EPSILON = 1e-6;

// A part record from the cut list, before quantity expansion
struct Part {
    std::string name;
    f64 length = 0.0;    // mm, becomes the piece width on the sheet
    f64 width = 0.0;     // mm, becomes the piece height on the sheet
    f64 thickness = 0.0; // mm
    int quantity = 1;
    std::string materialRef; // Empty = same as the sheet
    int priority = 1;        // Higher is placed first among equal areas
    bool rotatable = true;   // false locks grain direction

    Part() = default;
    Part(const std::string& name_, f64 length_, f64 width_, int qty = 1, bool rotatable_ = true)
        : name(name_), length(length_), width(width_), quantity(qty), rotatable(rotatable_) {}

    f64 area() const { return length * width; }
};

// Stock sheet parameters shared by every sheet opened during a run
struct SheetTemplate {
    f64 width = 0.0;
    f64 height = 0.0;
    std::string materialRef;
    f64 thickness = 0.0;
    f64 kerfWidth = DEFAULT_KERF_WIDTH; // Blade cut margin

    SheetTemplate() = default;
    SheetTemplate(f64 w, f64 h, f64 kerf = DEFAULT_KERF_WIDTH)
        : width(w), height(h), kerfWidth(kerf) {}

    f64 area() const { return width * height; }
};

// One physical piece to cut (a single unit of a part)
struct Rectangle {
    std::string id;   // "<part>_<n>", unique per run
    std::string name; // Display name
    f64 width = 0.0;
    f64 height = 0.0;
    std::string materialRef;
    int priority = 1;
    bool rotatable = true;

    f64 area() const { return width * height; }

    // True if the piece fits a container in at least one allowed orientation
    bool fitsIn(f64 containerWidth, f64 containerHeight) const {
        if (width <= containerWidth + PLACEMENT_EPSILON &&
            height <= containerHeight + PLACEMENT_EPSILON) {
            return true;
        }
        return rotatable && height <= containerWidth + PLACEMENT_EPSILON &&
               width <= containerHeight + PLACEMENT_EPSILON;
    }
};

// Candidate or committed position of a piece on a sheet
struct Position {
    f64 x = 0.0;
    f64 y = 0.0;
    bool rotated = false;
};

// A piece bound to a position on a sheet. The Rectangle is not owned and
// must outlive the sheet holding this placement.
struct PlacedRectangle {
    const Rectangle* rect = nullptr;
    f64 x = 0.0; // Lower-left corner
    f64 y = 0.0;
    bool rotated = false; // 90 degree rotation

    f64 getWidth() const { return rotated ? rect->height : rect->width; }
    f64 getHeight() const { return rotated ? rect->width : rect->height; }
    f64 getRight() const { return x + getWidth(); }
    f64 getTop() const { return y + getHeight(); }

    // Strict interior intersection; shared edges and intrusions up to
    // PLACEMENT_EPSILON do not count
    bool overlaps(const PlacedRectangle& other) const {
        return !(getRight() <= other.x + PLACEMENT_EPSILON ||
                 other.getRight() <= x + PLACEMENT_EPSILON ||
                 getTop() <= other.y + PLACEMENT_EPSILON ||
                 other.getTop() <= y + PLACEMENT_EPSILON);
    }
};

} // namespace optimizer
} // namespace cl
