#include "edfconv/converter.hpp"
#include "edfconv/edf_header.hpp"
#include "edfconv/utils.hpp"
#include "edfconv/version.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace edfconv;

namespace {

struct Args {
  std::string input_path;
  bool json{false};

  // Optional detail sections.
  bool channels{false};
  bool events{false};
};

static void print_help() {
  std::cout
    << "edfconv_info_cli\n\n"
    << "Print a summary of an EDF recording: channel list, sampling rate, duration,\n"
    << "sample count and start date/time.\n\n"
    << "Usage:\n"
    << "  edfconv_info_cli --input file.edf\n"
    << "  edfconv_info_cli --input file.edf --json\n\n"
    << "Options:\n"
    << "  --input PATH             Input EDF\n"
    << "  --channels               Print per-channel header details\n"
    << "  --events                 Print EDF+ annotations\n"
    << "  --json                   Output JSON (useful for scripts)\n"
    << "  --version                Print version and exit\n"
    << "  -h, --help               Show this help\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "edfconv_info_cli " << version_string() << "\n";
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
    } else if (arg == "--channels") {
      a.channels = true;
    } else if (arg == "--events") {
      a.events = true;
    } else if (arg == "--json") {
      a.json = true;
    } else if (a.input_path.empty() && !starts_with(arg, "-")) {
      a.input_path = arg;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

static std::string join(const std::vector<std::string>& v) {
  std::string s;
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) s += ", ";
    s += v[i];
  }
  return s;
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (args.input_path.empty()) {
      print_help();
      return 1;
    }

    const EDFConverter conv(args.input_path);
    const SignalStore& store = conv.store();
    const RecordingInfo info = conv.get_info();

    for (const auto& w : store.warnings()) {
      std::cerr << "edfconv_info_cli: WARNING: " << w << "\n";
    }

    if (args.json) {
      std::cout << recording_info_json(info, 2) << "\n";
      return 0;
    }

    std::cout << "\nEDF File Information:\n";
    std::cout << std::string(50, '-') << "\n";
    std::cout << "filename: " << info.filename << "\n";
    std::cout << "n_channels: " << info.n_channels << "\n";
    std::cout << "channel_names: " << join(info.channel_names) << "\n";
    std::cout << "sampling_rate: " << std::setprecision(12) << info.sampling_rate_hz << "\n";
    std::cout << "duration_seconds: " << std::setprecision(12) << info.duration_seconds << "\n";
    std::cout << "n_samples: " << info.n_samples << "\n";
    std::cout << "measurement_date: " << (info.start_datetime ? *info.start_datetime : "None") << "\n";
    std::cout << "n_records: " << info.n_records << "\n";
    std::cout << "record_duration_seconds: " << std::setprecision(12) << info.record_duration_seconds << "\n";
    if (!info.uncalibrated_channels.empty()) {
      std::cout << "uncalibrated_channels: " << join(info.uncalibrated_channels) << "\n";
    }

    if (args.channels) {
      const RecordingDescriptor& d = store.descriptor();
      std::cout << "Channels:\n";
      for (std::size_t i = 0; i < store.n_channels(); ++i) {
        const ChannelSignal& sig = store.channel(i);
        const ChannelDescriptor& c = sig.descriptor;
        std::cout << "  - " << c.label
                  << " unit=" << c.physical_unit
                  << " fs=" << std::setprecision(10) << channel_sampling_rate_hz(d, sig.source_index)
                  << " samples=" << sig.samples.size()
                  << " phys=[" << c.physical_min << ", " << c.physical_max << "]"
                  << " dig=[" << c.digital_min << ", " << c.digital_max << "]"
                  << (c.calibrated ? "" : " UNCALIBRATED") << "\n";
      }
    }

    if (args.events) {
      std::cout << "Events: " << store.events().size() << "\n";
      for (const auto& ev : store.events()) {
        std::cout << "  - onset=" << std::setprecision(6) << ev.onset_sec
                  << "s, dur=" << std::setprecision(6) << ev.duration_sec
                  << "s, text=\"" << ev.text << "\"\n";
      }
    }

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "edfconv_info_cli error: " << e.what() << "\n";
    return 1;
  }
}
