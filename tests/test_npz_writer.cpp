#include "edfconv/edf_reader.hpp"
#include "edfconv/errors.hpp"
#include "edfconv/npz_writer.hpp"

#include "edf_fixture.hpp"
#include "test_support.hpp"

#include <zlib.h>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace edfconv;
using namespace edfconv_test;

static uint32_t u16_at(const std::string& s, std::size_t off) {
  return static_cast<uint32_t>(static_cast<unsigned char>(s[off])) |
         (static_cast<uint32_t>(static_cast<unsigned char>(s[off + 1])) << 8);
}

static uint32_t u32_at(const std::string& s, std::size_t off) {
  return u16_at(s, off) | (u16_at(s, off + 2) << 16);
}

static std::string inflate_raw(const std::string& in, std::size_t out_size) {
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  assert(inflateInit2(&zs, -MAX_WBITS) == Z_OK);
  std::string out(out_size, '\0');
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
  zs.avail_in = static_cast<uInt>(in.size());
  zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
  zs.avail_out = static_cast<uInt>(out.size());
  const int rc = inflate(&zs, Z_FINISH);
  inflateEnd(&zs);
  assert(rc == Z_STREAM_END);
  return out;
}

struct Member {
  uint16_t method{0};
  std::string npy;
};

// Walk the local file headers and return every member, decompressed and
// CRC-checked. Also checks the end-of-central-directory entry count.
static std::map<std::string, Member> read_members(const std::string& zip, std::vector<std::string>* order) {
  std::map<std::string, Member> out;
  std::size_t pos = 0;
  while (pos + 4 <= zip.size() && u32_at(zip, pos) == 0x04034b50u) {
    const uint16_t method = static_cast<uint16_t>(u16_at(zip, pos + 8));
    assert(u16_at(zip, pos + 12) == 33); // DOS date 1980-01-01
    const uint32_t crc = u32_at(zip, pos + 14);
    const uint32_t comp = u32_at(zip, pos + 18);
    const uint32_t raw = u32_at(zip, pos + 22);
    const uint32_t name_len = u16_at(zip, pos + 26);
    const uint32_t extra_len = u16_at(zip, pos + 28);
    const std::string name = zip.substr(pos + 30, name_len);
    const std::string data = zip.substr(pos + 30 + name_len + extra_len, comp);

    Member m;
    m.method = method;
    if (method == 0) {
      assert(comp == raw);
      m.npy = data;
    } else {
      assert(method == 8);
      m.npy = inflate_raw(data, raw);
    }
    const uLong c = crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(m.npy.data()),
                          static_cast<uInt>(m.npy.size()));
    assert(static_cast<uint32_t>(c) == crc);

    if (order) order->push_back(name);
    out[name] = m;
    pos += 30 + name_len + extra_len + comp;
  }

  assert(u32_at(zip, pos) == 0x02014b50u);
  const std::size_t eocd = zip.size() - 22;
  assert(u32_at(zip, eocd) == 0x06054b50u);
  assert(u16_at(zip, eocd + 10) == out.size());
  assert(u32_at(zip, eocd + 16) == pos);
  return out;
}

static std::string npy_dict(const std::string& npy) {
  assert(npy.compare(0, 6, "\x93NUMPY") == 0);
  assert(npy[6] == 1 && npy[7] == 0);
  const std::size_t hlen = u16_at(npy, 8);
  assert((10 + hlen) % 64 == 0);
  assert(npy[10 + hlen - 1] == '\n');
  return npy.substr(10, hlen);
}

static std::vector<double> npy_f8(const std::string& npy) {
  const std::size_t start = 10 + u16_at(npy, 8);
  assert((npy.size() - start) % 8 == 0);
  std::vector<double> out((npy.size() - start) / 8);
  std::memcpy(out.data(), npy.data() + start, out.size() * 8);
  return out;
}

static std::string read_all(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

int main() {
  const SignalStore s = load_edf_from_memory(two_rate_edf());

  // Channel arrays keep their own lengths; times/sampling_rate/channel_names follow.
  {
    const std::string path = "test_edfconv_export.npz";
    write_signal_npz(path, s);
    const std::string zip = read_all(path);
    std::remove(path.c_str());

    std::vector<std::string> order;
    const auto members = read_members(zip, &order);
    assert(order.size() == 5);
    assert(order[0] == "A.npy");
    assert(order[1] == "B.npy");
    assert(order[2] == "times.npy");
    assert(order[3] == "sampling_rate.npy");
    assert(order[4] == "channel_names.npy");

    const Member& a = members.at("A.npy");
    assert(contains(npy_dict(a.npy), "'descr': '<f8'"));
    assert(contains(npy_dict(a.npy), "'shape': (12,)"));
    const std::vector<double> va = npy_f8(a.npy);
    assert(va.size() == 12);
    assert(va[11] == 11.0);

    const std::vector<double> vb = npy_f8(members.at("B.npy").npy);
    assert(vb.size() == 6);
    assert(vb[0] == 100.0 && vb[5] == 105.0);

    const std::vector<double> t = npy_f8(members.at("times.npy").npy);
    assert(t.size() == 12);
    assert(t[1] == 0.25);

    const Member& fs = members.at("sampling_rate.npy");
    assert(contains(npy_dict(fs.npy), "'shape': ()"));
    assert(npy_f8(fs.npy).size() == 1 && npy_f8(fs.npy)[0] == 4.0);

    const Member& names = members.at("channel_names.npy");
    assert(contains(npy_dict(names.npy), "'descr': '<U1'"));
    assert(contains(npy_dict(names.npy), "'shape': (2,)"));
    const std::size_t start = 10 + u16_at(names.npy, 8);
    assert(names.npy.size() - start == 8);
    assert(u32_at(names.npy, start) == 'A');
    assert(u32_at(names.npy, start + 4) == 'B');
  }

  // Member names: separators replaced, reserved names and duplicates suffixed.
  {
    FixtureHeader h;
    for (const char* label : {"times", "X", "X", "a/b"}) {
      FixtureChannel c;
      c.label = label;
      c.samples_per_record = 1;
      h.channels.push_back(c);
    }
    std::string bytes = edf_header_bytes(h);
    append_record(&bytes, {{1}, {2}, {3}, {4}});
    const SignalStore s2 = load_edf_from_memory(bytes);

    const std::string path = "test_edfconv_names.npz";
    NpzExportOptions opts;
    opts.compress = false;
    write_signal_npz(path, s2, opts);
    std::vector<std::string> order;
    const auto members = read_members(read_all(path), &order);
    std::remove(path.c_str());

    assert(order.size() == 7);
    assert(order[0] == "times_2.npy");
    assert(order[1] == "X.npy");
    assert(order[2] == "X_2.npy");
    assert(order[3] == "a_b.npy");
    for (const auto& kv : members) assert(kv.second.method == 0);
    assert(npy_f8(members.at("X_2.npy").npy)[0] == 3.0);
    assert(contains(npy_dict(members.at("channel_names.npy").npy), "'descr': '<U5'"));
  }

  // Large, repetitive arrays are deflated; tiny ones may stay stored.
  {
    NpzWriter w(true);
    w.add_array("zeros", std::vector<double>(4096, 0.0));
    const std::string zip = w.archive_bytes();
    assert(zip.size() < 4096 * 8 / 4);
    const auto members = read_members(zip, nullptr);
    assert(members.at("zeros.npy").method == 8);
    assert(npy_f8(members.at("zeros.npy").npy).size() == 4096);
  }

  // Selection.
  {
    const std::string path = "test_edfconv_sel.npz";
    NpzExportOptions opts;
    opts.channels = {"B"};
    write_signal_npz(path, s, opts);
    std::vector<std::string> order;
    read_members(read_all(path), &order);
    std::remove(path.c_str());
    assert(order.size() == 4);
    assert(order[0] == "B.npy");

    opts.channels = {"B", "nope"};
    const std::string bad = "test_edfconv_bad.npz";
    assert(throws_as<UnknownChannelError>([&] { write_signal_npz(bad, s, opts); }));
    assert(!std::filesystem::exists(bad));
  }

  assert(throws_as<ExportIOError>([&] { write_signal_npz("no_such_dir_edfconv/x.npz", s); }));

  std::cout << "test_npz_writer passed\n";
  return 0;
}
