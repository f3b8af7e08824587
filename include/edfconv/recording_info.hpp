#pragma once

#include "edfconv/signal_store.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace edfconv {

// Summary of a decoded recording (the get_info() query).
struct RecordingInfo {
  std::string filename;                 // file name without directories
  std::size_t n_channels{0};            // signal channels (annotations excluded)
  std::vector<std::string> channel_names;
  double sampling_rate_hz{0.0};         // highest per-channel rate
  double duration_seconds{0.0};         // time of the last time-axis point
  std::size_t n_samples{0};             // time-axis length
  std::optional<std::string> start_datetime; // ISO-8601, absent if unparseable

  std::size_t n_records{0};
  double record_duration_seconds{0.0};
  std::vector<std::string> uncalibrated_channels;
  std::size_t n_events{0};
};

RecordingInfo summarize_recording(const SignalStore& store, const std::string& path);

// Extra (key, raw JSON value) members appended after the summary fields.
using JsonMembers = std::vector<std::pair<std::string, std::string>>;

// JSON object for `info`. Members are emitted one per line, indented by
// `indent` spaces (0 => compact single line).
std::string recording_info_json(const RecordingInfo& info, int indent = 0,
                                const JsonMembers& extra = JsonMembers{});

} // namespace edfconv
