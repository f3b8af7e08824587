#include "edfconv/csv_io.hpp"

#include "edfconv/channel_select.hpp"
#include "edfconv/errors.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>

namespace edfconv {

std::string csv_escape(const std::string& s) {
  bool need_quotes = false;
  for (char c : s) {
    if (c == ',' || c == '"' || c == '\n' || c == '\r') {
      need_quotes = true;
      break;
    }
  }
  if (!need_quotes) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

// Enough significant digits for every double to read back unchanged.
static void write_value(std::ostream& o, double v) {
  o << std::defaultfloat << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
}

void write_signal_csv(std::ostream& o, const SignalStore& store, const CsvExportOptions& opts) {
  const std::vector<std::size_t> sel = select_channels(store, opts.channels);

  o.imbue(std::locale::classic());

  // Header
  bool first = true;
  if (opts.include_time) {
    o << "Time";
    first = false;
  }
  for (std::size_t ch : sel) {
    if (!first) o << ",";
    o << csv_escape(store.channel(ch).descriptor.label);
    first = false;
  }
  o << "\n";

  // Per selected column: index of the next sample still to be written.
  std::vector<std::size_t> next(sel.size(), 0);

  const std::vector<double>& times = store.time_axis();
  for (std::size_t row = 0; row < times.size(); ++row) {
    bool col_first = true;
    if (opts.include_time) {
      write_value(o, times[row]);
      col_first = false;
    }
    for (std::size_t k = 0; k < sel.size(); ++k) {
      if (!col_first) o << ",";
      col_first = false;

      const std::size_t ch = sel[k];
      const std::vector<double>& x = store.channel(ch).samples;
      if (next[k] < x.size() && store.time_index(ch, next[k]) == row) {
        write_value(o, x[next[k]]);
        ++next[k];
      }
      // else: no sample at this time stamp, leave the cell empty.
    }
    o << "\n";
  }

  if (!o) throw ExportIOError("CSV stream write failed");
}

void write_signal_csv(const std::string& path, const SignalStore& store, const CsvExportOptions& opts) {
  // Validate the selection before touching the destination.
  (void)select_channels(store, opts.channels);

  std::ofstream o(std::filesystem::u8path(path), std::ios::binary);
  if (!o) throw ExportIOError("cannot open CSV for writing: " + path);

  write_signal_csv(o, store, opts);
  o.flush();
  if (!o) throw ExportIOError("failed while writing CSV: " + path);
}

} // namespace edfconv
