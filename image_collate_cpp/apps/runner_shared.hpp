#pragma once

#include <filesystem>
#include <fstream>
#include <ostream>
#include <streambuf>
#include <string>

namespace image_collate::runner {

// --ledger is used as given; the config value is taken relative to the
// output directory unless absolute.
std::filesystem::path resolve_ledger_path(const std::string &cli_value,
                                          const std::string &config_value,
                                          const std::filesystem::path &output_dir);

// <logs_dir>/summary_<run_id>.json; one file per run next to its config copy.
std::filesystem::path summary_path(const std::filesystem::path &logs_dir,
                                   const std::string &run_id);

// Creates logs_dir, copies the run config as config_<run_id>.yaml and opens
// run_events.jsonl for append. A failed config copy is only a warning on err.
// Returns false when the directory or the event log cannot be opened.
bool open_run_logs(const std::filesystem::path &logs_dir,
                   const std::string &config_path, const std::string &run_id,
                   std::ofstream &events, std::ostream &err);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace image_collate::runner
