#include "edfconv/edf_reader.hpp"
#include "edfconv/errors.hpp"
#include "edfconv/signal_store.hpp"

#include "edf_fixture.hpp"
#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <string>

using namespace edfconv;
using namespace edfconv_test;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-12; }

// One EEG channel (2 samples/record, gain 0.5) plus an annotation signal.
static std::string edfplus_with_events() {
  FixtureHeader h;
  h.reserved = "EDF+C";
  h.n_records = "2";
  h.record_duration = "2";
  FixtureChannel eeg;
  eeg.label = "EEG Cz";
  eeg.samples_per_record = 2;
  eeg.physical_min = "-100";
  eeg.physical_max = "100";
  eeg.digital_min = "-200";
  eeg.digital_max = "200";
  FixtureChannel ann;
  ann.label = "EDF Annotations";
  ann.samples_per_record = 8;
  ann.unit = "";
  ann.physical_min = "-1";
  ann.physical_max = "1";
  h.channels = {eeg, ann};

  std::string bytes = edf_header_bytes(h);
  append_record(&bytes, {{10, -10}, text_words(std::string("+0\x14\x14\0+1.5\x14" "late\x14", 15), 8)});
  append_record(&bytes, {{20, -20}, text_words(std::string("+2\x14\x14\0+0.5\x14" "early\x14", 16), 8)});
  return bytes;
}

int main() {
  // Mixed rates: 4 and 2 samples per 1 s record, 3 records.
  {
    const SignalStore s = load_edf_from_memory(two_rate_edf());
    assert(s.n_channels() == 2);
    assert(s.n_records() == 3);
    assert(s.max_samples_per_record() == 4);
    assert(s.sampling_rate_hz() == 4.0);

    assert(s.channel(0).descriptor.label == "A");
    assert(s.channel(0).samples.size() == 12);
    assert(s.channel(1).descriptor.label == "B");
    assert(s.channel(1).samples.size() == 6);
    for (std::size_t i = 0; i < 12; ++i) assert(s.channel(0).samples[i] == static_cast<double>(i));
    for (std::size_t i = 0; i < 6; ++i) assert(s.channel(1).samples[i] == 100.0 + static_cast<double>(i));

    const auto& t = s.time_axis();
    assert(t.size() == 12);
    for (std::size_t i = 0; i < t.size(); ++i) assert(near(t[i], 0.25 * static_cast<double>(i)));

    // B's samples land on every other row.
    assert(s.time_index(1, 0) == 0);
    assert(s.time_index(1, 1) == 2);
    assert(s.time_index(1, 2) == 4);
    assert(s.time_index(1, 5) == 10);
    assert(s.time_index(0, 7) == 7);

    assert(s.find_channel("B") && *s.find_channel("B") == 1);
    assert(!s.find_channel("b"));
    assert(s.warnings().empty());
    assert(s.events().empty());
    assert(s.uncalibrated_labels().empty());
  }

  // Annotation signals become events and are not exposed as channels.
  {
    const SignalStore s = load_edf_from_memory(edfplus_with_events());
    assert(s.descriptor().n_channels() == 2);
    assert(s.n_channels() == 1);
    assert(s.channel(0).descriptor.label == "EEG Cz");
    assert(s.channel(0).source_index == 0);
    assert(s.channel(0).samples.size() == 4);
    assert(near(s.channel(0).samples[0], 5.0));
    assert(near(s.channel(0).samples[1], -5.0));
    assert(near(s.channel(0).samples[2], 10.0));
    assert(near(s.channel(0).samples[3], -10.0));

    assert(s.time_axis().size() == 4);
    assert(near(s.time_axis()[1], 1.0));
    assert(s.sampling_rate_hz() == 1.0);

    assert(s.events().size() == 2);
    assert(s.events()[0].text == "early");
    assert(s.events()[0].onset_sec == 0.5);
    assert(s.events()[1].text == "late");
    assert(s.events()[1].onset_sec == 1.5);
  }

  // Unknown record count: the count read becomes authoritative.
  {
    FixtureHeader h;
    h.n_records = "-1";
    FixtureChannel a;
    a.label = "A";
    a.samples_per_record = 2;
    h.channels = {a};
    std::string bytes = edf_header_bytes(h);
    for (int r = 0; r < 5; ++r) append_record(&bytes, {{static_cast<int16_t>(r), 0}});

    const SignalStore s = load_edf_from_memory(bytes);
    assert(s.n_records() == 5);
    assert(s.channel(0).samples.size() == 10);
    assert(s.time_axis().size() == 10);
    assert(s.warnings().size() == 1);
    assert(contains(s.warnings()[0], "unknown number of data records"));
  }

  // Uncalibrated channel: identity values, flag and warning carried through.
  {
    FixtureHeader h;
    FixtureChannel a;
    a.label = "Flat";
    a.samples_per_record = 2;
    a.digital_min = "7";
    a.digital_max = "7";
    a.physical_min = "-1";
    a.physical_max = "1";
    h.channels = {a};
    std::string bytes = edf_header_bytes(h);
    append_record(&bytes, {{300, -300}});

    const SignalStore s = load_edf_from_memory(bytes);
    assert(s.channel(0).samples[0] == 300.0);
    assert(s.channel(0).samples[1] == -300.0);
    assert(!s.channel(0).descriptor.calibrated);
    assert(s.uncalibrated_labels().size() == 1);
    assert(s.warnings().size() == 1);
  }

  // Extra bytes after the declared records.
  {
    std::string bytes = two_rate_edf();
    bytes += "junk";
    const SignalStore s = load_edf_from_memory(bytes);
    assert(s.n_records() == 3);
    assert(s.warnings().size() == 1);
  }

  // Truncated data: no partial store.
  {
    std::string bytes = two_rate_edf();
    bytes.resize(bytes.size() - 3);
    assert(throws_as<RecordError>([&] { load_edf_from_memory(bytes); }));
  }

  // Header sizes far beyond the data present: RecordError, never a huge allocation.
  {
    FixtureHeader h;
    h.n_records = "99999999";
    FixtureChannel a;
    a.label = "A";
    a.samples_per_record = 99999999;
    h.channels = {a};
    std::string bytes = edf_header_bytes(h);
    append_record(&bytes, {{1, 2}});

    std::string what;
    assert(throws_as<RecordError>([&] { load_edf_from_memory(bytes); }, &what));
    assert(contains(what, "record 0"));
    assert(contains(what, "byte offset 512"));
    assert(contains(what, "4 bytes follow the header"));
  }
  {
    FixtureHeader h;
    h.n_records = "99999999";
    for (int i = 0; i < 8; ++i) {
      FixtureChannel c;
      c.label = "C" + std::to_string(i);
      c.samples_per_record = 9999999;
      h.channels.push_back(c);
    }
    std::string bytes = edf_header_bytes(h);
    append_record(&bytes, {{1, 2}});
    assert(throws_as<RecordError>([&] { load_edf_from_memory(bytes); }));

    // Same sizes with an unknown record count: the record itself is short.
    h.n_records = "-1";
    std::string unknown = edf_header_bytes(h);
    append_record(&unknown, {{1, 2}});
    std::string what;
    assert(throws_as<RecordError>([&] { load_edf_from_memory(unknown); }, &what));
    assert(contains(what, "record 0"));
    assert(contains(what, "channel 0"));
  }

  std::cout << "test_signal_store passed\n";
  return 0;
}
