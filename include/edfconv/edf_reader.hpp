#pragma once

#include "edfconv/signal_store.hpp"

#include <string>

namespace edfconv {

// EDF (16-bit) reader.
// - parses and validates the header (see parse_edf_header)
// - decodes every data record into physical units using per-channel scaling
// - supports "unknown number of records" (-1) by reading until end of file
// - keeps each channel at its own sampling rate (no resampling)
// - parses EDF+ annotation channels ("EDF Annotations") into SignalStore::events
//
// The file is opened and closed inside read(); nothing keeps it open
// afterwards.
class EDFReader {
public:
  SignalStore read(const std::string& path);
};

// Convenience wrapper around EDFReader::read.
// Throws FileNotFoundError if `path` does not name a regular file.
SignalStore load_edf(const std::string& path);

// Decode an EDF image held in memory (header + data records).
SignalStore load_edf_from_memory(const std::string& bytes);

} // namespace edfconv
