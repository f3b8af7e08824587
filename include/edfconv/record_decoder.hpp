#pragma once

#include "edfconv/types.hpp"

#include <cstddef>
#include <istream>
#include <optional>

namespace edfconv {

// Decode one data record from `in`.
//
// A record is sum(samples_per_record) little-endian int16 words in
// channel-major order (all of channel 0, then all of channel 1, ...).
//
// The record is read in bounded chunks, so a header declaring a huge record
// size cannot force a large allocation before any data has been seen.
//
// Returns nullopt on a clean end of stream (no byte available at the record
// boundary). Throws RecordError when the stream ends inside the record.
// `record_index` is only used for the returned DataRecord and for error context.
std::optional<DataRecord> decode_next_record(std::istream& in,
                                             const RecordingDescriptor& desc,
                                             std::size_t record_index);

// Bytes between the current read position and the end of `in`, or nullopt
// when the stream cannot seek. The read position is left unchanged.
std::optional<unsigned long long> stream_bytes_remaining(std::istream& in);

// Lazy record producer over a stream positioned at the first data record.
//
// - If the header declares n_data_records >= 0, exactly that many records are
//   produced; a stream ending earlier is a RecordError.
// - If n_data_records == -1, records are produced until end of stream and
//   records_decoded() becomes the authoritative count.
//
// Not restartable: the stream is consumed. The decoder does not own the stream
// or the descriptor; both must outlive it.
class RecordDecoder {
public:
  RecordDecoder(std::istream& in, const RecordingDescriptor& desc);

  std::optional<DataRecord> next();

  std::size_t records_decoded() const { return next_index_; }
  bool finished() const { return finished_; }

  // True when bytes remain after the last declared record.
  bool has_trailing_bytes() const { return trailing_bytes_; }

private:
  std::istream& in_;
  const RecordingDescriptor& desc_;
  std::size_t next_index_{0};
  bool finished_{false};
  bool trailing_bytes_{false};
};

} // namespace edfconv
