#include "edfconv/converter.hpp"
#include "edfconv/edf_reader.hpp"
#include "edfconv/errors.hpp"

#include "edf_fixture.hpp"
#include "test_support.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace edfconv;
using namespace edfconv_test;

static std::string make_temp_path() {
  return "test_tmp_edf_reader.edf";
}

int main() {
  const std::string path = make_temp_path();
  assert(write_bytes(path, two_rate_edf()));

  // File load matches the in-memory decode.
  {
    const SignalStore s = load_edf(path);
    assert(s.n_channels() == 2);
    assert(s.channel(0).samples.size() == 12);
    assert(s.channel(1).samples.size() == 6);
    assert(s.time_axis().size() == 12);

    EDFReader reader;
    const SignalStore s2 = reader.read(path);
    assert(s2.channel(1).samples == s.channel(1).samples);
  }

  // Missing file.
  {
    bool threw = false;
    try {
      load_edf("does_not_exist_edfconv.edf");
    } catch (const FileNotFoundError& e) {
      threw = true;
      assert(e.path() == "does_not_exist_edfconv.edf");
      assert(contains(e.what(), "does_not_exist_edfconv.edf"));
    }
    assert(threw);

    // A directory is not an EDF file either.
    std::filesystem::create_directories("test_tmp_edf_dir.edf");
    assert(throws_as<FileNotFoundError>([] { load_edf("test_tmp_edf_dir.edf"); }));
    std::filesystem::remove("test_tmp_edf_dir.edf");
  }

  // Converter queries.
  {
    const EDFConverter conv(path);
    assert(conv.path() == path);

    const RecordingInfo info = conv.get_info();
    assert(info.filename == path);
    assert(info.n_channels == 2);
    assert(info.sampling_rate_hz == 4.0);
    assert(info.n_samples == 12);
    assert(info.duration_seconds == 2.75);

    const SignalData all = conv.get_data();
    assert(all.labels.size() == 2);
    assert(all.samples[0].size() == 12);
    assert(all.samples[1].size() == 6);
    assert(all.times.size() == 12);

    const SignalData only_b = conv.get_data({"B"});
    assert(only_b.labels.size() == 1 && only_b.labels[0] == "B");
    assert(only_b.samples[0][2] == 102.0);
    assert(throws_as<UnknownChannelError>([&] { conv.get_data({"B", "Q"}); }));

    const ChannelData b = conv.get_channel_data("B");
    assert(b.descriptor.label == "B");
    assert(b.samples.size() == 6);
    assert(b.times.size() == 6);
    assert(b.times[0] == 0.0);
    assert(b.times[1] == 0.5);
    assert(b.times[5] == 2.5);

    std::string what;
    assert(throws_as<UnknownChannelError>([&] { conv.get_channel_data("C3"); }, &what));
    assert(contains(what, "'C3'"));

    // Exports can be retried without re-decoding.
    const std::string out = "test_tmp_edf_reader_out.csv";
    conv.to_csv(out);
    conv.to_csv(out);
    assert(std::filesystem::file_size(out) > 0);
    std::remove(out.c_str());
  }

  // Truncated file: the error carries the record position.
  {
    std::string bytes = two_rate_edf();
    bytes.resize(bytes.size() - 5);
    const std::string bad = "test_tmp_edf_reader_trunc.edf";
    assert(write_bytes(bad, bytes));
    std::string what;
    assert(throws_as<RecordError>([&] { load_edf(bad); }, &what));
    assert(contains(what, "record 2"));
    std::remove(bad.c_str());
  }

  // Header-only garbage.
  {
    const std::string bad = "test_tmp_edf_reader_garbage.edf";
    assert(write_bytes(bad, std::string(300, 'x')));
    assert(throws_as<HeaderError>([&] { load_edf(bad); }));
    std::remove(bad.c_str());
  }

  std::remove(path.c_str());

  std::cout << "test_edf_reader passed\n";
  return 0;
}
