#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace edfconv {

// Sizes of the EDF header blocks (bytes).
constexpr std::size_t kFixedHeaderBytes = 256;
constexpr std::size_t kChannelHeaderBytes = 256; // per channel, summed over all field arrays

// One signal ("channel") as declared in the per-channel header block.
struct ChannelDescriptor {
  std::string label;
  std::string transducer_type;
  std::string physical_unit;
  std::string prefilter;

  double physical_min{0.0};
  double physical_max{0.0};
  int digital_min{0};
  int digital_max{0};

  int samples_per_record{0};

  // False when digital_max <= digital_min or physical_max == physical_min.
  // Such a channel keeps identity scaling; consumers must surface the flag.
  bool calibrated{true};

  // EDF+ "EDF Annotations" signal (TAL bytes rather than samples).
  bool is_annotation{false};
};

// Parsed EDF header. Immutable once built by parse_edf_header().
struct RecordingDescriptor {
  std::string version;
  std::string patient_id;
  std::string recording_id;
  std::string start_date;     // "dd.mm.yy"
  std::string start_time;     // "hh.mm.ss"
  std::string start_datetime; // "dd.mm.yy hh.mm.ss"
  std::string reserved;       // "EDF+C" / "EDF+D" for EDF+ files

  long long header_bytes{0};
  long long n_data_records{-1}; // -1 => unknown, read until EOF
  double record_duration_seconds{0.0};

  std::vector<ChannelDescriptor> channels; // on-disk interleave order

  // Notes recorded while parsing (e.g. uncalibrated channels).
  std::vector<std::string> warnings;

  std::size_t n_channels() const { return channels.size(); }

  // Sum of samples_per_record over all channels (16-bit words per record).
  std::size_t samples_per_record_total() const {
    std::size_t n = 0;
    for (const auto& c : channels) n += static_cast<std::size_t>(c.samples_per_record);
    return n;
  }

  std::size_t bytes_per_record() const { return samples_per_record_total() * 2u; }

  bool is_edfplus() const { return reserved.rfind("EDF+", 0) == 0; }
};

// One decoded data record: digital[ch] has channels[ch].samples_per_record values.
struct DataRecord {
  std::size_t index{0};
  std::vector<std::vector<int16_t>> digital;
};

// EDF+ annotations are exposed as (onset, duration, text) relative to the
// recording start.
//
// Notes:
// - duration_sec is 0 for point events or when the duration is not present.
// - onset_sec can be fractional.
struct AnnotationEvent {
  double onset_sec{0.0};
  double duration_sec{0.0};
  std::string text;
};

} // namespace edfconv
