#include "edfconv/signal_store.hpp"

#include "edfconv/annotations.hpp"
#include "edfconv/calibrator.hpp"
#include "edfconv/errors.hpp"
#include "edfconv/record_decoder.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace edfconv {

double SignalStore::sampling_rate_hz() const {
  if (max_spr_ == 0 || !(desc_.record_duration_seconds > 0.0)) return 0.0;
  return static_cast<double>(max_spr_) / desc_.record_duration_seconds;
}

std::vector<std::string> SignalStore::channel_labels() const {
  std::vector<std::string> out;
  out.reserve(channels_.size());
  for (const auto& c : channels_) out.push_back(c.descriptor.label);
  return out;
}

std::vector<std::string> SignalStore::uncalibrated_labels() const {
  std::vector<std::string> out;
  for (const auto& c : channels_) {
    if (!c.descriptor.calibrated) out.push_back(c.descriptor.label);
  }
  return out;
}

std::optional<std::size_t> SignalStore::find_channel(const std::string& label) const {
  for (std::size_t i = 0; i < channels_.size(); ++i) {
    if (channels_[i].descriptor.label == label) return i;
  }
  return std::nullopt;
}

std::size_t SignalStore::time_index(std::size_t ch, std::size_t sample) const {
  const std::size_t k = static_cast<std::size_t>(channels_.at(ch).descriptor.samples_per_record);
  if (k == 0) return 0;
  const std::size_t r = sample / k;
  const std::size_t j = sample % k;
  // Sample j of a k-sample record sits at time j * duration / k, i.e. row
  // j * M / k within the record's M rows (exact when M is a multiple of k).
  return r * max_spr_ + (j * max_spr_) / k;
}

SignalStore build_signal_store(std::istream& in, RecordingDescriptor desc) {
  SignalStore store;
  store.desc_ = std::move(desc);
  const RecordingDescriptor& d = store.desc_;

  // A declared record count is checked against the bytes actually present
  // before any buffer is sized from it.
  bool sized_by_header = false;
  if (d.n_data_records > 0) {
    if (const std::optional<unsigned long long> available = stream_bytes_remaining(in)) {
      const unsigned long long bpr = d.bytes_per_record();
      const unsigned long long complete = *available / bpr;
      if (complete < static_cast<unsigned long long>(d.n_data_records)) {
        throw RecordError("record " + std::to_string(complete) + " at byte offset " +
                          std::to_string(static_cast<unsigned long long>(d.header_bytes) + complete * bpr) +
                          " is truncated: " + std::to_string(*available) +
                          " bytes follow the header but " + std::to_string(d.n_data_records) +
                          " declared records of " + std::to_string(bpr) + " bytes are required");
      }
      sized_by_header = true;
    }
  }

  // Map header channel index -> store channel index (annotations excluded).
  std::vector<long> store_index(d.channels.size(), -1);
  std::vector<Calibration> cal(d.channels.size());
  for (std::size_t ch = 0; ch < d.channels.size(); ++ch) {
    const ChannelDescriptor& c = d.channels[ch];
    if (c.is_annotation) continue;
    store_index[ch] = static_cast<long>(store.channels_.size());
    cal[ch] = calibration_for(c);

    ChannelSignal sig;
    sig.descriptor = c;
    sig.source_index = ch;
    if (sized_by_header) {
      sig.samples.reserve(static_cast<std::size_t>(c.samples_per_record) *
                          static_cast<std::size_t>(d.n_data_records));
    }
    store.channels_.push_back(std::move(sig));
    store.max_spr_ = std::max(store.max_spr_, static_cast<std::size_t>(c.samples_per_record));
  }

  RecordDecoder decoder(in, d);
  while (std::optional<DataRecord> rec = decoder.next()) {
    for (std::size_t ch = 0; ch < d.channels.size(); ++ch) {
      if (d.channels[ch].is_annotation) {
        std::vector<AnnotationEvent> ev =
            parse_edfplus_annotations_record(annotation_bytes(rec->digital[ch]));
        store.events_.insert(store.events_.end(), ev.begin(), ev.end());
        continue;
      }
      append_physical(rec->digital[ch], cal[ch],
                      &store.channels_[static_cast<std::size_t>(store_index[ch])].samples);
    }
  }
  store.n_records_ = decoder.records_decoded();

  for (const ChannelSignal& sig : store.channels_) {
    const std::size_t expected =
        static_cast<std::size_t>(sig.descriptor.samples_per_record) * store.n_records_;
    if (sig.samples.size() != expected) {
      throw RecordError("channel '" + sig.descriptor.label + "' decoded " +
                        std::to_string(sig.samples.size()) + " samples, expected " +
                        std::to_string(expected));
    }
  }

  const std::size_t n_time = store.max_spr_ * store.n_records_;
  store.time_axis_.resize(n_time);
  if (store.max_spr_ > 0) {
    const double step = d.record_duration_seconds / static_cast<double>(store.max_spr_);
    for (std::size_t i = 0; i < n_time; ++i) {
      store.time_axis_[i] = static_cast<double>(i) * step;
    }
  }

  std::stable_sort(store.events_.begin(), store.events_.end(),
                   [](const AnnotationEvent& a, const AnnotationEvent& b) {
                     return a.onset_sec < b.onset_sec;
                   });

  store.warnings_ = d.warnings;
  if (d.n_data_records < 0) {
    store.warnings_.push_back("header declares an unknown number of data records; " +
                              std::to_string(store.n_records_) + " records were read until end of file");
  }
  if (decoder.has_trailing_bytes()) {
    store.warnings_.push_back("bytes after the last of " + std::to_string(store.n_records_) +
                              " declared data records were ignored");
  }
  if (d.reserved == "EDF+D") {
    store.warnings_.push_back("EDF+D (discontinuous) recording: the time axis assumes contiguous data records");
  }

  return store;
}

} // namespace edfconv
