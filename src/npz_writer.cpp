#include "edfconv/npz_writer.hpp"

#include "edfconv/channel_select.hpp"
#include "edfconv/errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

namespace edfconv {

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50u;
constexpr uint32_t kCentralHeaderSig = 0x02014b50u;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50u;
constexpr uint16_t kZipVersion = 20;
constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflate = 8;
// MS-DOS timestamp for 1980-01-01 00:00:00 (archives are reproducible).
constexpr uint16_t kDosTime = 0;
constexpr uint16_t kDosDate = (1u << 5) | 1u;
constexpr uint64_t kZip32Max = 0xFFFFFFFFull;

} // namespace

static void put_u16(std::string* s, uint16_t v) {
  s->push_back(static_cast<char>(v & 0xFFu));
  s->push_back(static_cast<char>((v >> 8) & 0xFFu));
}

static void put_u32(std::string* s, uint32_t v) {
  for (int i = 0; i < 4; ++i) s->push_back(static_cast<char>((v >> (8 * i)) & 0xFFu));
}

static void put_f64(std::string* s, double v) {
  uint64_t u = 0;
  std::memcpy(&u, &v, sizeof(u));
  for (int i = 0; i < 8; ++i) s->push_back(static_cast<char>((u >> (8 * i)) & 0xFFu));
}

// NPY format 1.0 preamble: magic, version, header length, then a Python dict
// literal padded with spaces and terminated by '\n' so the data starts on a
// 64-byte boundary.
static std::string npy_header(const std::string& descr, const std::string& shape) {
  std::string dict = "{'descr': '" + descr + "', 'fortran_order': False, 'shape': " + shape + ", }";
  const std::size_t unpadded = 10 + dict.size() + 1;
  const std::size_t padded = ((unpadded + 63) / 64) * 64;
  dict.append(padded - unpadded, ' ');
  dict.push_back('\n');

  std::string out("\x93NUMPY", 6);
  out.push_back('\x01');
  out.push_back('\x00');
  put_u16(&out, static_cast<uint16_t>(dict.size()));
  out += dict;
  return out;
}

static uint32_t crc32_of(const std::string& bytes) {
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(bytes.data()), static_cast<uInt>(bytes.size()));
  return static_cast<uint32_t>(crc);
}

// Raw deflate stream (no zlib header), as required by ZIP method 8.
static std::string deflate_raw(const std::string& in) {
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw ExportIOError("zlib deflateInit2 failed");
  }

  std::string out(static_cast<std::size_t>(deflateBound(&zs, static_cast<uLong>(in.size()))), '\0');
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
  zs.avail_in = static_cast<uInt>(in.size());
  zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
  zs.avail_out = static_cast<uInt>(out.size());

  const int rc = deflate(&zs, Z_FINISH);
  const uLong produced = zs.total_out;
  deflateEnd(&zs);
  if (rc != Z_STREAM_END) {
    throw ExportIOError("zlib deflate failed (code " + std::to_string(rc) + ")");
  }
  out.resize(static_cast<std::size_t>(produced));
  return out;
}

void NpzWriter::add_member(const std::string& name, const std::string& npy) {
  if (entries_.size() >= 0xFFFFu) {
    throw ExportIOError("too many arrays for a ZIP32 archive");
  }
  if (static_cast<uint64_t>(npy.size()) >= kZip32Max) {
    throw ExportIOError("array '" + name + "' exceeds the 4 GiB ZIP32 member limit");
  }

  Entry e;
  e.name = name + ".npy";
  e.raw_size = static_cast<uint32_t>(npy.size());
  e.crc = crc32_of(npy);
  e.method = kMethodStored;
  if (compress_) {
    std::string z = deflate_raw(npy);
    if (z.size() < npy.size()) {
      e.data = std::move(z);
      e.method = kMethodDeflate;
    }
  }
  if (e.method == kMethodStored) e.data = npy;
  entries_.push_back(std::move(e));
}

void NpzWriter::add_array(const std::string& name, const std::vector<double>& values) {
  std::string npy = npy_header("<f8", "(" + std::to_string(values.size()) + ",)");
  npy.reserve(npy.size() + values.size() * 8u);
  for (double v : values) put_f64(&npy, v);
  add_member(name, npy);
}

void NpzWriter::add_scalar(const std::string& name, double value) {
  std::string npy = npy_header("<f8", "()");
  put_f64(&npy, value);
  add_member(name, npy);
}

void NpzWriter::add_strings(const std::string& name, const std::vector<std::string>& values) {
  std::size_t width = 1;
  for (const auto& v : values) width = std::max(width, v.size());

  std::string npy = npy_header("<U" + std::to_string(width), "(" + std::to_string(values.size()) + ",)");
  for (const auto& v : values) {
    for (std::size_t i = 0; i < width; ++i) {
      const uint32_t cp = (i < v.size()) ? static_cast<unsigned char>(v[i]) : 0u;
      put_u32(&npy, cp);
    }
  }
  add_member(name, npy);
}

std::string NpzWriter::archive_bytes() const {
  std::string out;
  std::vector<uint32_t> offsets;
  offsets.reserve(entries_.size());

  for (const Entry& e : entries_) {
    if (static_cast<uint64_t>(out.size()) >= kZip32Max) {
      throw ExportIOError("archive exceeds the 4 GiB ZIP32 limit");
    }
    offsets.push_back(static_cast<uint32_t>(out.size()));
    put_u32(&out, kLocalHeaderSig);
    put_u16(&out, kZipVersion);
    put_u16(&out, 0); // flags
    put_u16(&out, e.method);
    put_u16(&out, kDosTime);
    put_u16(&out, kDosDate);
    put_u32(&out, e.crc);
    put_u32(&out, static_cast<uint32_t>(e.data.size()));
    put_u32(&out, e.raw_size);
    put_u16(&out, static_cast<uint16_t>(e.name.size()));
    put_u16(&out, 0); // extra field length
    out += e.name;
    out += e.data;
  }

  const uint64_t cd_offset = out.size();
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    const Entry& e = entries_[i];
    put_u32(&out, kCentralHeaderSig);
    put_u16(&out, kZipVersion); // version made by
    put_u16(&out, kZipVersion); // version needed
    put_u16(&out, 0);
    put_u16(&out, e.method);
    put_u16(&out, kDosTime);
    put_u16(&out, kDosDate);
    put_u32(&out, e.crc);
    put_u32(&out, static_cast<uint32_t>(e.data.size()));
    put_u32(&out, e.raw_size);
    put_u16(&out, static_cast<uint16_t>(e.name.size()));
    put_u16(&out, 0); // extra
    put_u16(&out, 0); // comment
    put_u16(&out, 0); // disk number start
    put_u16(&out, 0); // internal attributes
    put_u32(&out, 0); // external attributes
    put_u32(&out, offsets[i]);
    out += e.name;
  }
  const uint64_t cd_size = out.size() - cd_offset;
  if (cd_offset >= kZip32Max || cd_size >= kZip32Max) {
    throw ExportIOError("archive exceeds the 4 GiB ZIP32 limit");
  }

  put_u32(&out, kEndOfCentralDirSig);
  put_u16(&out, 0); // this disk
  put_u16(&out, 0); // disk with central directory
  put_u16(&out, static_cast<uint16_t>(entries_.size()));
  put_u16(&out, static_cast<uint16_t>(entries_.size()));
  put_u32(&out, static_cast<uint32_t>(cd_size));
  put_u32(&out, static_cast<uint32_t>(cd_offset));
  put_u16(&out, 0); // comment length
  return out;
}

void NpzWriter::write(const std::string& path) const {
  const std::string bytes = archive_bytes();

  std::ofstream o(std::filesystem::u8path(path), std::ios::binary);
  if (!o) throw ExportIOError("cannot open NPZ for writing: " + path);
  o.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  o.flush();
  if (!o) throw ExportIOError("failed while writing NPZ: " + path);
}

// Archive member base name for a channel label ('/' and '\\' would create
// directories inside the ZIP).
static std::string npz_member_base(const std::string& label, std::size_t index) {
  std::string base = label;
  std::replace(base.begin(), base.end(), '/', '_');
  std::replace(base.begin(), base.end(), '\\', '_');
  if (base.empty()) base = "channel_" + std::to_string(index);
  return base;
}

void write_signal_npz(const std::string& path, const SignalStore& store, const NpzExportOptions& opts) {
  const std::vector<std::size_t> sel = select_channels(store, opts.channels);

  std::vector<std::string> labels;
  std::vector<std::string> bases;
  labels.reserve(sel.size());
  bases.reserve(sel.size());
  for (std::size_t ch : sel) {
    labels.push_back(store.channel(ch).descriptor.label);
    bases.push_back(npz_member_base(labels.back(), ch));
  }
  const std::vector<std::string> members =
      unique_names(bases, {"times", "sampling_rate", "channel_names"});

  NpzWriter w(opts.compress);
  for (std::size_t k = 0; k < sel.size(); ++k) {
    w.add_array(members[k], store.channel(sel[k]).samples);
  }
  w.add_array("times", store.time_axis());
  w.add_scalar("sampling_rate", store.sampling_rate_hz());
  w.add_strings("channel_names", labels);

  w.write(path);
}

} // namespace edfconv
