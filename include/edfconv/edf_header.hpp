#pragma once

#include "edfconv/types.hpp"

#include <istream>
#include <optional>
#include <string>

namespace edfconv {

// Parse an EDF header from raw bytes.
//
// `raw_bytes` must start at byte 0 of the file and contain at least the fixed
// 256-byte header plus the 256 * n_channels byte per-channel block. Extra bytes
// (e.g. the data records) are ignored.
//
// The per-channel block is field-major on disk (all labels, then all
// transducer types, ...). It is parsed in a single pass where slot i of every
// field array feeds channel i.
//
// Throws HeaderError when:
// - a numeric field does not parse (never coerced to zero)
// - the channel count is not positive
// - header_bytes != 256 + 256 * n_channels
// - the per-channel block is incomplete
// - n_data_records < -1, record duration <= 0, or samples_per_record < 0
// - no channel contributes any samples per record
// - the file is a 24-bit BDF (version byte 0xFF)
//
// Channels violating the calibration invariant are kept with calibrated=false
// and a warning is appended to RecordingDescriptor::warnings.
RecordingDescriptor parse_edf_header(const std::string& raw_bytes);

// Read exactly the header bytes from a stream positioned at the start of the
// file and parse them. On return the stream is positioned at the first data
// record.
RecordingDescriptor read_edf_header(std::istream& in);

// Start date/time as ISO-8601 local time ("YYYY-MM-DDTHH:MM:SS").
//
// EDF stores a two digit year; 85-99 map to 19xx, 00-84 map to 20xx.
// Returns nullopt when the date or time field is malformed.
std::optional<std::string> start_datetime_iso8601(const RecordingDescriptor& desc);

// Effective sampling rate of a channel (samples_per_record / record duration).
double channel_sampling_rate_hz(const RecordingDescriptor& desc, std::size_t ch);

// Highest per-channel sampling rate among non-annotation channels (0 if none).
double max_sampling_rate_hz(const RecordingDescriptor& desc);

} // namespace edfconv
