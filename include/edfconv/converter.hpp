#pragma once

#include "edfconv/csv_io.hpp"
#include "edfconv/json_export.hpp"
#include "edfconv/npz_writer.hpp"
#include "edfconv/recording_info.hpp"
#include "edfconv/signal_store.hpp"

#include <string>
#include <vector>

namespace edfconv {

// Selected channels plus the shared time axis.
// samples[i] belongs to labels[i] and keeps that channel's own length.
struct SignalData {
  std::vector<std::string> labels;
  std::vector<std::vector<double>> samples;
  std::vector<double> times;
};

// One channel with the time stamp of each of its samples.
struct ChannelData {
  ChannelDescriptor descriptor;
  std::vector<double> samples;
  std::vector<double> times; // same length as samples
};

// Loads an EDF file once and answers queries / exports against the decoded
// SignalStore. Construction decodes the whole file (and fails the same way
// load_edf does); afterwards the object is read-only and exports may be
// retried without re-decoding.
class EDFConverter {
public:
  explicit EDFConverter(const std::string& path);

  const std::string& path() const { return path_; }
  const SignalStore& store() const { return store_; }

  RecordingInfo get_info() const;

  // Empty `channels` => every channel in header order.
  // Throws UnknownChannelError naming the first unknown label.
  SignalData get_data(const std::vector<std::string>& channels = {}) const;

  // Throws UnknownChannelError if `label` is absent.
  ChannelData get_channel_data(const std::string& label) const;

  void to_csv(const std::string& output_path, const CsvExportOptions& opts = CsvExportOptions{}) const;
  void to_json(const std::string& output_path, const JsonExportOptions& opts = JsonExportOptions{}) const;
  void to_npz(const std::string& output_path, const NpzExportOptions& opts = NpzExportOptions{}) const;

private:
  std::string path_;
  SignalStore store_;
};

} // namespace edfconv
