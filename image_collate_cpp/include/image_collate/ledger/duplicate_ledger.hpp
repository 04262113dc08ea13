#pragma once

#include "image_collate/core/types.hpp"

#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace image_collate::ledger {

inline constexpr const char* kLedgerHeader = "Category,Subcategory,BatchNumber,Fingerprint,Filename";

// RFC 4180 field quoting: fields containing ',', '"', CR or LF are quoted.
std::string format_csv_row(const std::vector<std::string>& fields);

// Reads one record (which may span lines inside quotes). Returns false at EOF.
bool read_csv_record(std::istream& in, std::vector<std::string>& fields);

/**
 * Append-only record of accepted fingerprints.
 *
 * The in-memory index maps fingerprint -> most recent batch number and is
 * shared by the extraction workers. check_and_mark() is the only call the
 * workers make; load() and append() are coordinator-only.
 */
class DuplicateLedger {
public:
    explicit DuplicateLedger(fs::path path);

    // Replays the backing file. A missing file is an empty ledger.
    // Throws LedgerError on unreadable files or malformed rows.
    void load();

    // Atomically: true if the fingerprint is already ledgered or reserved
    // in this run; otherwise reserves it and returns false.
    bool check_and_mark(const Fingerprint& fp);

    // Drops in-run reservations that will not be committed.
    void release(const std::vector<Fingerprint>& fps);

    // Durably appends entries and promotes their reservations into the index.
    // Throws LedgerError when the backing file cannot be written.
    void append(const std::vector<LedgerEntry>& entries);

    bool contains(const Fingerprint& fp) const;
    std::optional<int> batch_of(const Fingerprint& fp) const;

    // 1 + highest batch number recorded for (category, subcategory).
    int next_batch_number(const std::string& category, const std::string& subcategory) const;

    size_t size() const;
    size_t reserved_count() const;
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    mutable std::mutex mutex_;
    std::unordered_map<Fingerprint, int> index_;
    std::unordered_set<Fingerprint> reserved_;
    std::map<std::pair<std::string, std::string>, int> last_batch_;
};

} // namespace image_collate::ledger
