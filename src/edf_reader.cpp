#include "edfconv/edf_reader.hpp"

#include "edfconv/edf_header.hpp"
#include "edfconv/errors.hpp"
#include "edfconv/utils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace edfconv {

static SignalStore decode_stream(std::istream& in) {
  RecordingDescriptor desc = read_edf_header(in);

  // read_edf_header consumed exactly header_bytes; seek anyway so a stream
  // that was handed to us mid-way cannot shift every record.
  in.seekg(static_cast<std::streamoff>(desc.header_bytes), std::ios::beg);
  if (!in) throw RecordError("failed to seek to the first data record at byte offset " +
                             std::to_string(desc.header_bytes));

  return build_signal_store(in, std::move(desc));
}

SignalStore EDFReader::read(const std::string& path) {
  if (!file_exists(path)) throw FileNotFoundError(path);

  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw Error("Failed to open EDF: " + path);

  return decode_stream(f);
}

SignalStore load_edf(const std::string& path) {
  EDFReader r;
  return r.read(path);
}

SignalStore load_edf_from_memory(const std::string& bytes) {
  std::istringstream in(bytes, std::ios::in | std::ios::binary);
  return decode_stream(in);
}

} // namespace edfconv
