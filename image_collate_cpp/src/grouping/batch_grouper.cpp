#include "image_collate/grouping/batch_grouper.hpp"
#include "image_collate/core/errors.hpp"

#include <algorithm>
#include <iterator>

namespace image_collate::grouping {

double color_distance_from_gray(const Color3d& rgb) {
    return (rgb - Color3d(128.0, 128.0, 128.0)).norm();
}

bool similarity_order_less(const ImageRecord& a, const ImageRecord& b) {
    if (a.blackness != b.blackness) return a.blackness > b.blackness;
    if (a.whiteness != b.whiteness) return a.whiteness < b.whiteness;

    const double da = color_distance_from_gray(a.dominant_color);
    const double db = color_distance_from_gray(b.dominant_color);
    if (da != db) return da < db;

    if (a.filename != b.filename) return a.filename < b.filename;
    return a.fingerprint < b.fingerprint;
}

void sort_by_similarity(std::vector<ImageRecord>& pool) {
    std::stable_sort(pool.begin(), pool.end(), similarity_order_less);
}

GroupingResult group_into_batches(std::vector<ImageRecord> pool, int capacity) {
    if (capacity < 1) {
        throw ValidationError("grid capacity must be >= 1");
    }

    GroupingResult result;
    const size_t cap = static_cast<size_t>(capacity);
    if (pool.size() < cap) {
        result.leftover = std::move(pool);
        return result;
    }

    sort_by_similarity(pool);

    const size_t full = (pool.size() / cap) * cap;
    for (size_t start = 0; start < full; start += cap) {
        std::vector<ImageRecord> batch;
        batch.reserve(cap);
        std::move(pool.begin() + static_cast<std::ptrdiff_t>(start),
                  pool.begin() + static_cast<std::ptrdiff_t>(start + cap),
                  std::back_inserter(batch));
        result.batches.push_back(std::move(batch));
    }
    std::move(pool.begin() + static_cast<std::ptrdiff_t>(full), pool.end(),
              std::back_inserter(result.leftover));
    return result;
}

} // namespace image_collate::grouping
