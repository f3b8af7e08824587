#pragma once

#include "edfconv/signal_store.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace edfconv {

struct JsonExportOptions {
  // Emit the "metadata" object (info summary, channel descriptors, events,
  // warnings).
  bool include_metadata{true};

  // Channels to export, in output order. Empty => all channels in header order.
  std::vector<std::string> channels;
};

// Write the recording as JSON:
//
//   {
//     "metadata": { ...get_info() fields..., "channels": [...], "events": [...], "warnings": [...] },
//     "data": { "times": [...], "channels": { "<label>": [...], ... } }
//   }
//
// Each channel array keeps its own length; lower-rate channels are not padded.
// A repeated label is keyed "<label>_2", "<label>_3", ... in data.channels; the
// metadata channel list keeps the labels as recorded.
// `source_path` only feeds metadata.filename.
//
// Throws UnknownChannelError for an unknown label (before anything is written)
// and ExportIOError when the destination cannot be written.
void write_signal_json(std::ostream& o, const SignalStore& store, const std::string& source_path,
                       const JsonExportOptions& opts = JsonExportOptions{});
void write_signal_json(const std::string& path, const SignalStore& store, const std::string& source_path,
                       const JsonExportOptions& opts = JsonExportOptions{});

} // namespace edfconv
