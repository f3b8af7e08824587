#pragma once

#include "edfconv/signal_store.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace edfconv {

struct CsvExportOptions {
  // Write a leading "Time" column (seconds from recording start).
  bool include_time{true};

  // Channels to export, in output order. Empty => all channels in header order.
  std::vector<std::string> channels;
};

// Escape a string for inclusion in a CSV cell.
// - Quotes are doubled.
// - The cell is wrapped in quotes if it contains: comma, quote, or newline.
std::string csv_escape(const std::string& s);

// Write a time-series CSV.
//
// Output format:
//   Time,<ch1>,<ch2>,...
//   0,...
//
// One row per time-axis point. A channel sampled below the highest rate has a
// value only in the rows matching its own sample times (SignalStore::time_index);
// its other cells are left empty, never zero.
//
// Numeric output uses the classic "C" locale and max_digits10 significant
// digits, so times and samples parse back to the exact stored doubles.
//
// Throws UnknownChannelError for an unknown label (before anything is written)
// and ExportIOError when the destination cannot be written.
void write_signal_csv(std::ostream& o, const SignalStore& store,
                      const CsvExportOptions& opts = CsvExportOptions{});
void write_signal_csv(const std::string& path, const SignalStore& store,
                      const CsvExportOptions& opts = CsvExportOptions{});

} // namespace edfconv
