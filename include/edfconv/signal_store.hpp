#pragma once

#include "edfconv/types.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace edfconv {

struct ChannelSignal {
  ChannelDescriptor descriptor;
  std::size_t source_index{0}; // index in RecordingDescriptor::channels
  std::vector<double> samples; // physical units, length = samples_per_record * n_records
};

// Decoded recording: calibrated per-channel buffers plus a shared time axis.
//
// - channels() holds every non-annotation signal in header order.
// - time_axis() has max(samples_per_record) * n_records points with a uniform
//   step of record_duration / max(samples_per_record).
// - Lower-rate channels are not resampled: they simply have fewer samples.
//   time_index() maps a channel sample to its row on the time axis.
//
// A SignalStore is only produced by build_signal_store() and is read-only
// afterwards, so it can be shared between concurrent readers.
class SignalStore {
public:
  const RecordingDescriptor& descriptor() const { return desc_; }
  const std::vector<ChannelSignal>& channels() const { return channels_; }
  const std::vector<double>& time_axis() const { return time_axis_; }
  const std::vector<AnnotationEvent>& events() const { return events_; }
  const std::vector<std::string>& warnings() const { return warnings_; }

  std::size_t n_channels() const { return channels_.size(); }
  std::size_t n_records() const { return n_records_; }
  std::size_t max_samples_per_record() const { return max_spr_; }

  // Highest per-channel sampling rate (Hz); 0 when there are no signals.
  double sampling_rate_hz() const;

  const ChannelSignal& channel(std::size_t i) const { return channels_.at(i); }
  std::vector<std::string> channel_labels() const;
  std::vector<std::string> uncalibrated_labels() const;

  // First channel whose label equals `label` exactly.
  std::optional<std::size_t> find_channel(const std::string& label) const;

  // Row of time_axis() holding sample `sample` of channel `ch`.
  std::size_t time_index(std::size_t ch, std::size_t sample) const;

private:
  friend SignalStore build_signal_store(std::istream& in, RecordingDescriptor desc);

  SignalStore() = default;

  RecordingDescriptor desc_;
  std::vector<ChannelSignal> channels_;
  std::vector<double> time_axis_;
  std::vector<AnnotationEvent> events_;
  std::vector<std::string> warnings_;
  std::size_t n_records_{0};
  std::size_t max_spr_{0};
};

// Decode every data record from `in` (positioned at the first record) and
// assemble the store.
//
// Any RecordError aborts the whole build; no partial store is returned.
SignalStore build_signal_store(std::istream& in, RecordingDescriptor desc);

} // namespace edfconv
