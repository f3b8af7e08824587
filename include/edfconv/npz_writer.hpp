#pragma once

#include "edfconv/signal_store.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace edfconv {

// Minimal NumPy .npz writer.
//
// An .npz file is a ZIP archive whose members are .npy arrays. Members are
// written as NPY format 1.0 and compressed with zlib deflate (as
// numpy.savez_compressed does) unless `compress` is false.
//
// Limitations:
// - no ZIP64 (each member and the archive must stay below 4 GiB, < 65535 members)
// - string arrays are written as fixed-width little-endian UTF-32 ('<U<n>'),
//   one code point per input byte (EDF labels are ASCII)
class NpzWriter {
public:
  explicit NpzWriter(bool compress = true) : compress_(compress) {}

  // 1-D float64 array.
  void add_array(const std::string& name, const std::vector<double>& values);

  // 0-D float64 scalar.
  void add_scalar(const std::string& name, double value);

  // 1-D unicode string array.
  void add_strings(const std::string& name, const std::vector<std::string>& values);

  std::size_t size() const { return entries_.size(); }

  // Serialize the archive (local headers, central directory, end record).
  std::string archive_bytes() const;

  // Throws ExportIOError when the file cannot be written.
  void write(const std::string& path) const;

private:
  struct Entry {
    std::string name;   // member file name, including ".npy"
    std::string data;   // stored bytes (deflated when method == 8)
    uint32_t crc{0};
    uint32_t raw_size{0};
    uint16_t method{0};
  };

  void add_member(const std::string& name, const std::string& npy);

  bool compress_{true};
  std::vector<Entry> entries_;
};

struct NpzExportOptions {
  // Channels to export, in output order. Empty => all channels in header order.
  std::vector<std::string> channels;

  bool compress{true};
};

// Write the recording as an .npz archive:
// - one float64 array per channel, named by its label ('/' and '\' replaced by
//   '_'; a clash with another member gets a numeric suffix)
// - "times": the shared time axis
// - "sampling_rate": scalar, highest per-channel rate (Hz)
// - "channel_names": the exported labels in order
//
// Channels of different lengths are never stacked into one matrix.
//
// Throws UnknownChannelError for an unknown label (before anything is written)
// and ExportIOError when the destination cannot be written.
void write_signal_npz(const std::string& path, const SignalStore& store,
                      const NpzExportOptions& opts = NpzExportOptions{});

} // namespace edfconv
