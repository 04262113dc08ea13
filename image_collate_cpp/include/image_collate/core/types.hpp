#pragma once

#include <Eigen/Dense>
#include <opencv2/core.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace image_collate {

namespace fs = std::filesystem;

// Color vectors are stored in R,G,B order.
using Color3d = Eigen::Vector3d;

// 64-bit perceptual fingerprint (8x8 DCT hash)
struct Fingerprint {
    uint64_t bits = 0;

    bool operator==(const Fingerprint& other) const { return bits == other.bits; }
    bool operator!=(const Fingerprint& other) const { return bits != other.bits; }
    bool operator<(const Fingerprint& other) const { return bits < other.bits; }

    // 16 lowercase hex digits, most significant bit first
    std::string to_hex() const;
    static std::optional<Fingerprint> from_hex(const std::string& s);

    int hamming_distance(const Fingerprint& other) const;
};

// Grid layout and per-cell working resolution
struct GridSpec {
    int rows = 4;
    int cols = 4;
    int cell_width = 512;
    int cell_height = 512;

    int capacity() const { return rows * cols; }
};

// One processed candidate image
struct ImageRecord {
    std::string filename;
    Fingerprint fingerprint;
    Color3d dominant_color = Color3d::Zero();
    double whiteness = 0.0;
    double blackness = 0.0;
    cv::Mat pixels;  // BGR, working resolution; released after compositing
};

// One unit of discovery/grouping. An empty subcategory is the category root.
struct SubcategoryUnit {
    std::string category;
    std::optional<std::string> subcategory;
    fs::path dir;
    std::string label;  // name used in output files and ledger rows

    bool is_root() const { return !subcategory.has_value(); }
};

// One ledger row
struct LedgerEntry {
    std::string category;
    std::string subcategory;
    int batch_number = 0;
    Fingerprint fingerprint;
    std::string filename;
};

// Pipeline phase enumeration
enum class Phase {
    DISCOVER = 0,
    LEDGER_LOAD = 1,
    EXTRACT = 2,
    RENDER = 3,
    LEDGER_APPEND = 4,
    DRAIN = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::DISCOVER: return "DISCOVER";
        case Phase::LEDGER_LOAD: return "LEDGER_LOAD";
        case Phase::EXTRACT: return "EXTRACT";
        case Phase::RENDER: return "RENDER";
        case Phase::LEDGER_APPEND: return "LEDGER_APPEND";
        case Phase::DRAIN: return "DRAIN";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace image_collate

namespace std {

template <>
struct hash<image_collate::Fingerprint> {
    size_t operator()(const image_collate::Fingerprint& f) const noexcept {
        return std::hash<uint64_t>{}(f.bits);
    }
};

} // namespace std
