#include "image_collate/ledger/duplicate_ledger.hpp"
#include "image_collate/core/errors.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace image_collate::ledger {

std::string format_csv_row(const std::vector<std::string>& fields) {
    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += ',';
        const std::string& f = fields[i];
        if (f.find_first_of(",\"\r\n") == std::string::npos) {
            line += f;
            continue;
        }
        line += '"';
        for (char c : f) {
            if (c == '"') line += '"';
            line += c;
        }
        line += '"';
    }
    return line;
}

bool read_csv_record(std::istream& in, std::vector<std::string>& fields) {
    fields.clear();
    if (in.peek() == std::char_traits<char>::eof()) return false;

    std::string field;
    bool quoted = false;
    bool any = false;
    char c;
    while (in.get(c)) {
        any = true;
        if (quoted) {
            if (c == '"') {
                if (in.peek() == '"') {
                    in.get(c);
                    field += '"';
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
            continue;
        }
        if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else if (c == '\r') {
            if (in.peek() == '\n') in.get(c);
            break;
        } else if (c == '\n') {
            break;
        } else {
            field += c;
        }
    }
    if (!any) return false;
    fields.push_back(field);
    return true;
}

DuplicateLedger::DuplicateLedger(fs::path path) : path_(std::move(path)) {}

void DuplicateLedger::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    reserved_.clear();
    last_batch_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) throw LedgerError("cannot stat " + path_.string() + ": " + ec.message());
        return;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw LedgerError("cannot open " + path_.string());
    }

    std::vector<std::string> fields;
    size_t line_no = 0;
    while (read_csv_record(in, fields)) {
        ++line_no;
        if (line_no == 1) continue; // header, whatever its spelling
        if (fields.size() == 1 && fields[0].empty()) continue;
        if (fields.size() < 5) {
            throw LedgerError(path_.string() + ":" + std::to_string(line_no) +
                              ": expected 5 fields, got " + std::to_string(fields.size()));
        }

        int batch = 0;
        try {
            size_t pos = 0;
            batch = std::stoi(fields[2], &pos);
            if (pos != fields[2].size() || batch < 1) throw std::invalid_argument(fields[2]);
        } catch (const std::exception&) {
            throw LedgerError(path_.string() + ":" + std::to_string(line_no) +
                              ": bad batch number '" + fields[2] + "'");
        }

        auto fp = Fingerprint::from_hex(fields[3]);
        if (!fp) {
            throw LedgerError(path_.string() + ":" + std::to_string(line_no) +
                              ": bad fingerprint '" + fields[3] + "'");
        }

        index_[*fp] = batch;
        auto& last = last_batch_[{fields[0], fields[1]}];
        last = std::max(last, batch);
    }
    if (in.bad()) {
        throw LedgerError("read failed: " + path_.string());
    }
}

bool DuplicateLedger::check_and_mark(const Fingerprint& fp) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_.count(fp) > 0) return true;
    return !reserved_.insert(fp).second;
}

void DuplicateLedger::release(const std::vector<Fingerprint>& fps) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& fp : fps) {
        reserved_.erase(fp);
    }
}

void DuplicateLedger::append(const std::vector<LedgerEntry>& entries) {
    if (entries.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    const bool exists = fs::exists(path_, ec);
    const auto size = exists ? fs::file_size(path_, ec) : 0;
    if (ec) {
        throw LedgerError("cannot stat " + path_.string() + ": " + ec.message());
    }

    bool need_newline = false;
    if (size > 0) {
        std::ifstream tail(path_, std::ios::binary);
        if (!tail) throw LedgerError("cannot open " + path_.string());
        tail.seekg(-1, std::ios::end);
        char last = 0;
        tail.get(last);
        need_newline = (last != '\n');
    }

    std::ofstream out(path_, std::ios::binary | std::ios::app);
    if (!out) {
        throw LedgerError("cannot open for append: " + path_.string());
    }

    if (size == 0) {
        out << kLedgerHeader << "\n";
    } else if (need_newline) {
        out << "\n";
    }
    for (const auto& e : entries) {
        out << format_csv_row({e.category, e.subcategory, std::to_string(e.batch_number),
                               e.fingerprint.to_hex(), e.filename})
            << "\n";
    }
    out.flush();
    if (!out) {
        throw LedgerError("write failed: " + path_.string());
    }

    for (const auto& e : entries) {
        reserved_.erase(e.fingerprint);
        index_[e.fingerprint] = e.batch_number;
        auto& last = last_batch_[{e.category, e.subcategory}];
        last = std::max(last, e.batch_number);
    }
}

bool DuplicateLedger::contains(const Fingerprint& fp) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(fp) > 0;
}

std::optional<int> DuplicateLedger::batch_of(const Fingerprint& fp) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(fp);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

int DuplicateLedger::next_batch_number(const std::string& category,
                                       const std::string& subcategory) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_batch_.find({category, subcategory});
    return it == last_batch_.end() ? 1 : it->second + 1;
}

size_t DuplicateLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

size_t DuplicateLedger::reserved_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_.size();
}

} // namespace image_collate::ledger
