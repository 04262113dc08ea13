#include "runner_shared.hpp"

#include "image_collate/core/utils.hpp"

#include <cstdio>

namespace image_collate::runner {

namespace fs = std::filesystem;

fs::path resolve_ledger_path(const std::string &cli_value,
                             const std::string &config_value,
                             const fs::path &output_dir) {
  const fs::path p = cli_value.empty() ? fs::path(config_value) : fs::path(cli_value);
  if (p.is_absolute() || !cli_value.empty())
    return p;
  return output_dir / p;
}

fs::path summary_path(const fs::path &logs_dir, const std::string &run_id) {
  return logs_dir / ("summary_" + run_id + ".json");
}

bool open_run_logs(const fs::path &logs_dir, const std::string &config_path,
                   const std::string &run_id, std::ofstream &events,
                   std::ostream &err) {
  std::error_code ec;
  fs::create_directories(logs_dir, ec);
  if (ec) {
    err << "Error: cannot create " << logs_dir.string() << ": " << ec.message()
        << std::endl;
    return false;
  }

  try {
    if (!config_path.empty()) {
      core::copy_config(config_path, logs_dir / ("config_" + run_id + ".yaml"));
    }
  } catch (const fs::filesystem_error &e) {
    err << "Warning: cannot copy config: " << e.what() << std::endl;
  }

  events.open(logs_dir / "run_events.jsonl", std::ios::app);
  if (!events) {
    err << "Error: cannot open event log in " << logs_dir.string() << std::endl;
    return false;
  }
  return true;
}

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace image_collate::runner
