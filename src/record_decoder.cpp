#include "edfconv/record_decoder.hpp"

#include "edfconv/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace edfconv {

namespace {

constexpr std::size_t kReadChunkBytes = 1u << 20;

} // namespace

static int16_t i16_le(const unsigned char* p) {
  return static_cast<int16_t>(static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8));
}

static unsigned long long record_offset(const RecordingDescriptor& desc, std::size_t record_index) {
  return static_cast<unsigned long long>(desc.header_bytes) +
         static_cast<unsigned long long>(record_index) *
             static_cast<unsigned long long>(desc.bytes_per_record());
}

// Describe where a short read stopped, in terms of channel and sample.
static std::string truncation_context(const RecordingDescriptor& desc, std::size_t got_bytes) {
  std::size_t word = got_bytes / 2u;
  for (std::size_t ch = 0; ch < desc.channels.size(); ++ch) {
    const std::size_t n = static_cast<std::size_t>(desc.channels[ch].samples_per_record);
    if (word < n) {
      return "inside channel " + std::to_string(ch) + " ('" + desc.channels[ch].label +
             "') at sample " + std::to_string(word) + " of " + std::to_string(n);
    }
    word -= n;
  }
  return "at the end of the record";
}

std::optional<DataRecord> decode_next_record(std::istream& in,
                                             const RecordingDescriptor& desc,
                                             std::size_t record_index) {
  const std::size_t need = desc.bytes_per_record();
  if (need == 0) throw RecordError("bytes_per_record computed as 0");

  std::vector<unsigned char> buf;
  std::size_t got = 0;
  while (got < need) {
    const std::size_t chunk = std::min(need - got, kReadChunkBytes);
    buf.resize(got + chunk);
    in.read(reinterpret_cast<char*>(buf.data() + got), static_cast<std::streamsize>(chunk));
    const std::size_t n = static_cast<std::size_t>(in.gcount());
    got += n;
    if (n < chunk) break;
  }

  if (got == 0) return std::nullopt;
  if (got < need) {
    throw RecordError("record " + std::to_string(record_index) + " at byte offset " +
                      std::to_string(record_offset(desc, record_index)) + " is truncated: got " +
                      std::to_string(got) + " of " + std::to_string(need) + " bytes, stream ended " +
                      truncation_context(desc, got));
  }

  DataRecord rec;
  rec.index = record_index;
  rec.digital.resize(desc.channels.size());

  const unsigned char* p = buf.data();
  for (std::size_t ch = 0; ch < desc.channels.size(); ++ch) {
    const std::size_t n = static_cast<std::size_t>(desc.channels[ch].samples_per_record);
    std::vector<int16_t>& out = rec.digital[ch];
    out.resize(n);
    for (std::size_t j = 0; j < n; ++j) {
      out[j] = i16_le(p);
      p += 2;
    }
  }
  return rec;
}

std::optional<unsigned long long> stream_bytes_remaining(std::istream& in) {
  const std::streamoff here = in.tellg();
  if (here < 0) return std::nullopt;

  in.seekg(0, std::ios::end);
  const std::streamoff end = in.tellg();
  in.clear();
  in.seekg(here, std::ios::beg);
  if (!in || end < here) {
    in.clear();
    return std::nullopt;
  }
  return static_cast<unsigned long long>(end - here);
}

RecordDecoder::RecordDecoder(std::istream& in, const RecordingDescriptor& desc)
  : in_(in), desc_(desc) {}

std::optional<DataRecord> RecordDecoder::next() {
  if (finished_) return std::nullopt;

  const bool declared = desc_.n_data_records >= 0;
  if (declared && next_index_ == static_cast<std::size_t>(desc_.n_data_records)) {
    finished_ = true;
    trailing_bytes_ = in_.peek() != std::char_traits<char>::eof();
    in_.clear();
    return std::nullopt;
  }

  std::optional<DataRecord> rec = decode_next_record(in_, desc_, next_index_);
  if (!rec) {
    finished_ = true;
    if (declared) {
      throw RecordError("stream ended at byte offset " +
                        std::to_string(record_offset(desc_, next_index_)) + " after " +
                        std::to_string(next_index_) + " of " + std::to_string(desc_.n_data_records) +
                        " declared records");
    }
    return std::nullopt;
  }

  ++next_index_;
  return rec;
}

} // namespace edfconv
