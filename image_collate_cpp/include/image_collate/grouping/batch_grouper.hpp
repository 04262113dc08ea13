#pragma once

#include "image_collate/core/types.hpp"

#include <vector>

namespace image_collate::grouping {

// L2 distance of the dominant color from mid gray (128,128,128).
double color_distance_from_gray(const Color3d& rgb);

// Strict total order: darkest first, then least white, then closest to
// neutral gray, then filename, then fingerprint.
bool similarity_order_less(const ImageRecord& a, const ImageRecord& b);

void sort_by_similarity(std::vector<ImageRecord>& pool);

struct GroupingResult {
    std::vector<std::vector<ImageRecord>> batches; // each exactly `capacity` long
    std::vector<ImageRecord> leftover;             // fewer than `capacity`
};

// Sorts the whole pool and slices it into full batches. A pool smaller
// than capacity is returned untouched in `leftover`.
GroupingResult group_into_batches(std::vector<ImageRecord> pool, int capacity);

} // namespace image_collate::grouping
