#include "contour_assembler.hpp"
#include <common/logging.hpp>

namespace spinlogo {

Curve ContourAssembler::truncate_before(const Curve& piece, const Vec2& fillet_center) {
    if (piece.empty()) {
        return {};
    }
    size_t k = closest_index(piece, fillet_center);
    return Curve(piece.begin(), piece.begin() + static_cast<std::ptrdiff_t>(k) + 1);
}

Curve ContourAssembler::truncate_after(const Curve& piece, const Vec2& fillet_center) {
    if (piece.empty()) {
        return {};
    }
    size_t k = closest_index(piece, fillet_center);
    return Curve(piece.begin() + static_cast<std::ptrdiff_t>(k), piece.end());
}

Curve ContourAssembler::slice_between(const Curve& piece,
                                      const Vec2& first_center,
                                      const Vec2& second_center) {
    if (piece.empty()) {
        return {};
    }
    size_t first = closest_index(piece, first_center);
    size_t last = closest_index(piece, second_center);
    if (first > last) {
        logging::get_logger()->warn(
            "ContourAssembler: slice start {} comes after end {}", first, last);
        return {};
    }
    return Curve(piece.begin() + static_cast<std::ptrdiff_t>(first),
                 piece.begin() + static_cast<std::ptrdiff_t>(last) + 1);
}

ContourAssembler& ContourAssembler::append(const Curve& piece) {
    // Avoid duplicating the joint point if continuing from a previous piece
    size_t start_idx = points_.empty() ? 0 : 1;
    for (size_t i = start_idx; i < piece.size(); ++i) {
        points_.push_back(piece[i]);
    }
    ++pieces_;
    return *this;
}

}  // namespace spinlogo
