#include "edfconv/edf_header.hpp"

#include "edfconv/errors.hpp"
#include "edfconv/utils.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace edfconv {

namespace {

struct FieldSpec {
  const char* name;
  std::size_t width;
};

// Fixed header (256 bytes).
constexpr FieldSpec kVersion{"version", 8};
constexpr FieldSpec kPatientId{"patient_id", 80};
constexpr FieldSpec kRecordingId{"recording_id", 80};
constexpr FieldSpec kStartDate{"start_date", 8};
constexpr FieldSpec kStartTime{"start_time", 8};
constexpr FieldSpec kHeaderBytes{"header_bytes", 8};
constexpr FieldSpec kReserved{"reserved", 44};
constexpr FieldSpec kNumRecords{"n_data_records", 8};
constexpr FieldSpec kRecordDuration{"record_duration", 8};
constexpr FieldSpec kNumChannels{"n_channels", 4};

// Per-channel field arrays, in on-disk order. Each array holds one slot per
// channel.
enum ChannelField {
  kLabel = 0,
  kTransducer,
  kPhysicalUnit,
  kPhysicalMin,
  kPhysicalMax,
  kDigitalMin,
  kDigitalMax,
  kPrefilter,
  kSamplesPerRecord,
  kChannelReserved,
  kNumChannelFields
};

constexpr std::array<FieldSpec, kNumChannelFields> kChannelFields = {{
    {"label", 16},
    {"transducer_type", 80},
    {"physical_unit", 8},
    {"physical_min", 8},
    {"physical_max", 8},
    {"digital_min", 8},
    {"digital_max", 8},
    {"prefilter", 80},
    {"samples_per_record", 8},
    {"reserved", 32},
}};

constexpr std::size_t channel_fields_width() {
  std::size_t n = 0;
  for (const auto& f : kChannelFields) n += f.width;
  return n;
}

static_assert(channel_fields_width() == kChannelHeaderBytes,
              "per-channel field widths must sum to 256 bytes");

} // namespace

static std::string field_context(const FieldSpec& f, std::size_t offset) {
  return "field '" + std::string(f.name) + "' at byte offset " + std::to_string(offset);
}

static std::string channel_context(const FieldSpec& f, std::size_t offset,
                                   std::size_t ch, const std::string& label) {
  std::string s = "field '" + std::string(f.name) + "' of channel " + std::to_string(ch);
  if (!label.empty()) s += " ('" + label + "')";
  s += " at byte offset " + std::to_string(offset);
  return s;
}

// Numeric fields go through the strict helpers; any failure becomes a
// HeaderError with the field context attached.
static long long parse_integer_field(const std::string& raw, const std::string& context) {
  try {
    return to_int64(raw);
  } catch (const std::exception&) {
    throw HeaderError(context + ": not an integer: '" + trim_right(raw) + "'");
  }
}

static double parse_number_field(const std::string& raw, const std::string& context) {
  try {
    return to_double(raw);
  } catch (const std::exception&) {
    throw HeaderError(context + ": not a number: '" + trim_right(raw) + "'");
  }
}

// Digital limits are integers, but some writers emit "-32768.0".
static int parse_digital_field(const std::string& raw, const std::string& context) {
  const double v = parse_number_field(raw, context);
  if (v != std::floor(v) || v < -2147483648.0 || v > 2147483647.0) {
    throw HeaderError(context + ": not an integer: '" + trim_right(raw) + "'");
  }
  return static_cast<int>(v);
}

static bool is_annotation_label(const std::string& label) {
  return to_lower(trim(label)) == "edf annotations";
}

RecordingDescriptor parse_edf_header(const std::string& raw_bytes) {
  if (raw_bytes.size() < kFixedHeaderBytes) {
    throw HeaderError("file too short for the fixed header (" + std::to_string(raw_bytes.size()) +
                      " bytes, need " + std::to_string(kFixedHeaderBytes) + ")");
  }
  if (static_cast<unsigned char>(raw_bytes[0]) == 0xFF) {
    throw HeaderError("version byte 0xFF indicates a 24-bit BDF file, not EDF");
  }

  std::size_t pos = 0;
  auto take = [&](const FieldSpec& f) {
    std::string s = raw_bytes.substr(pos, f.width);
    pos += f.width;
    return s;
  };

  RecordingDescriptor d;
  d.version = trim_right(take(kVersion));
  d.patient_id = trim_right(take(kPatientId));
  d.recording_id = trim_right(take(kRecordingId));
  d.start_date = trim_right(take(kStartDate));
  d.start_time = trim_right(take(kStartTime));
  d.start_datetime = d.start_date + " " + d.start_time;

  const std::size_t header_bytes_off = pos;
  d.header_bytes = parse_integer_field(take(kHeaderBytes), field_context(kHeaderBytes, header_bytes_off));

  d.reserved = trim_right(take(kReserved));

  const std::size_t n_records_off = pos;
  d.n_data_records = parse_integer_field(take(kNumRecords), field_context(kNumRecords, n_records_off));
  if (d.n_data_records < -1) {
    throw HeaderError(field_context(kNumRecords, n_records_off) +
                      ": negative value " + std::to_string(d.n_data_records) + " (only -1 means unknown)");
  }

  const std::size_t duration_off = pos;
  d.record_duration_seconds =
      parse_number_field(take(kRecordDuration), field_context(kRecordDuration, duration_off));
  if (!(d.record_duration_seconds > 0.0)) {
    throw HeaderError(field_context(kRecordDuration, duration_off) +
                      ": must be > 0 (got " + json_number(d.record_duration_seconds) + ")");
  }

  const std::size_t n_channels_off = pos;
  const long long n_channels =
      parse_integer_field(take(kNumChannels), field_context(kNumChannels, n_channels_off));
  if (n_channels <= 0) {
    throw HeaderError(field_context(kNumChannels, n_channels_off) +
                      ": must be > 0 (got " + std::to_string(n_channels) + ")");
  }

  const std::size_t ns = static_cast<std::size_t>(n_channels);
  const long long expected_header_bytes =
      static_cast<long long>(kFixedHeaderBytes + kChannelHeaderBytes * ns);
  if (d.header_bytes != expected_header_bytes) {
    throw HeaderError(field_context(kHeaderBytes, header_bytes_off) + ": declares " +
                      std::to_string(d.header_bytes) + " bytes but " + std::to_string(ns) +
                      " channels require 256 + 256 * " + std::to_string(ns) + " = " +
                      std::to_string(expected_header_bytes));
  }

  const std::size_t block_bytes = kChannelHeaderBytes * ns;
  if (raw_bytes.size() - kFixedHeaderBytes < block_bytes) {
    throw HeaderError("per-channel header block truncated: " + std::to_string(ns) +
                      " channels need " + std::to_string(block_bytes) + " bytes after offset 256, got " +
                      std::to_string(raw_bytes.size() - kFixedHeaderBytes));
  }

  // Single field-major pass: for each field array, slot i belongs to channel i.
  d.channels.resize(ns);
  std::size_t array_base = kFixedHeaderBytes;
  for (std::size_t fi = 0; fi < kChannelFields.size(); ++fi) {
    const FieldSpec& f = kChannelFields[fi];
    for (std::size_t ch = 0; ch < ns; ++ch) {
      const std::size_t off = array_base + ch * f.width;
      const std::string slot = raw_bytes.substr(off, f.width);
      ChannelDescriptor& c = d.channels[ch];
      switch (static_cast<ChannelField>(fi)) {
        case kLabel:
          c.label = trim_right(slot);
          c.is_annotation = is_annotation_label(c.label);
          break;
        case kTransducer:
          c.transducer_type = trim_right(slot);
          break;
        case kPhysicalUnit:
          c.physical_unit = trim_right(slot);
          break;
        case kPhysicalMin:
          c.physical_min = parse_number_field(slot, channel_context(f, off, ch, c.label));
          break;
        case kPhysicalMax:
          c.physical_max = parse_number_field(slot, channel_context(f, off, ch, c.label));
          break;
        case kDigitalMin:
          c.digital_min = parse_digital_field(slot, channel_context(f, off, ch, c.label));
          break;
        case kDigitalMax:
          c.digital_max = parse_digital_field(slot, channel_context(f, off, ch, c.label));
          break;
        case kPrefilter:
          c.prefilter = trim_right(slot);
          break;
        case kSamplesPerRecord: {
          const std::string ctx = channel_context(f, off, ch, c.label);
          const long long n = parse_integer_field(slot, ctx);
          if (n < 0 || n > 0x7FFFFFFFLL) {
            throw HeaderError(ctx + ": invalid value " + std::to_string(n));
          }
          c.samples_per_record = static_cast<int>(n);
          break;
        }
        case kChannelReserved:
        case kNumChannelFields:
          break;
      }
    }
    array_base += f.width * ns;
  }

  if (d.samples_per_record_total() == 0) {
    throw HeaderError("no channel declares any samples per record");
  }

  for (std::size_t ch = 0; ch < ns; ++ch) {
    ChannelDescriptor& c = d.channels[ch];
    if (c.is_annotation) continue;
    const bool digital_ok = c.digital_max > c.digital_min;
    const bool physical_ok = c.physical_max != c.physical_min;
    if (digital_ok && physical_ok) continue;

    c.calibrated = false;
    std::string why;
    if (!digital_ok) {
      why = "digital_max (" + std::to_string(c.digital_max) + ") <= digital_min (" +
            std::to_string(c.digital_min) + ")";
    } else {
      why = "physical_max == physical_min (" + json_number(c.physical_min) + ")";
    }
    d.warnings.push_back("channel " + std::to_string(ch) + " ('" + c.label +
                         "') is uncalibrated: " + why + "; digital values are passed through unscaled");
  }

  return d;
}

RecordingDescriptor read_edf_header(std::istream& in) {
  std::string raw(kFixedHeaderBytes, '\0');
  in.read(&raw[0], static_cast<std::streamsize>(raw.size()));
  const std::size_t got = static_cast<std::size_t>(in.gcount());
  if (got < kFixedHeaderBytes) {
    throw HeaderError("file too short for the fixed header (" + std::to_string(got) +
                      " bytes, need " + std::to_string(kFixedHeaderBytes) + ")");
  }

  // Channel count decides how much more to read. parse_edf_header re-validates it.
  const std::size_t n_channels_off = kFixedHeaderBytes - kNumChannels.width;
  const long long n_channels =
      parse_integer_field(raw.substr(n_channels_off, kNumChannels.width),
                          field_context(kNumChannels, n_channels_off));
  if (n_channels > 0) {
    const std::size_t block = kChannelHeaderBytes * static_cast<std::size_t>(n_channels);
    raw.resize(kFixedHeaderBytes + block);
    in.read(&raw[kFixedHeaderBytes], static_cast<std::streamsize>(block));
    raw.resize(kFixedHeaderBytes + static_cast<std::size_t>(in.gcount()));
  }
  in.clear();

  return parse_edf_header(raw);
}

static bool parse_two_digit_triplet(const std::string& s, int* a, int* b, int* c) {
  // "dd.mm.yy" / "hh.mm.ss"
  if (s.size() != 8 || s[2] != '.' || s[5] != '.') return false;
  const int idx[6] = {0, 1, 3, 4, 6, 7};
  for (int i : idx) {
    if (std::isdigit(static_cast<unsigned char>(s[static_cast<std::size_t>(i)])) == 0) return false;
  }
  *a = (s[0] - '0') * 10 + (s[1] - '0');
  *b = (s[3] - '0') * 10 + (s[4] - '0');
  *c = (s[6] - '0') * 10 + (s[7] - '0');
  return true;
}

std::optional<std::string> start_datetime_iso8601(const RecordingDescriptor& desc) {
  int day = 0, month = 0, yy = 0;
  int hour = 0, minute = 0, second = 0;
  if (!parse_two_digit_triplet(desc.start_date, &day, &month, &yy)) return std::nullopt;
  if (!parse_two_digit_triplet(desc.start_time, &hour, &minute, &second)) return std::nullopt;
  if (day < 1 || day > 31 || month < 1 || month > 12) return std::nullopt;
  if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

  const int year = (yy >= 85) ? (1900 + yy) : (2000 + yy);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                year, month, day, hour, minute, second);
  return std::string(buf);
}

double channel_sampling_rate_hz(const RecordingDescriptor& desc, std::size_t ch) {
  if (ch >= desc.channels.size() || !(desc.record_duration_seconds > 0.0)) return 0.0;
  return static_cast<double>(desc.channels[ch].samples_per_record) / desc.record_duration_seconds;
}

double max_sampling_rate_hz(const RecordingDescriptor& desc) {
  double fs = 0.0;
  for (std::size_t ch = 0; ch < desc.channels.size(); ++ch) {
    if (desc.channels[ch].is_annotation) continue;
    const double r = channel_sampling_rate_hz(desc, ch);
    if (r > fs) fs = r;
  }
  return fs;
}

} // namespace edfconv
