#include "edfconv/channel_select.hpp"
#include "edfconv/converter.hpp"
#include "edfconv/utils.hpp"
#include "edfconv/version.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace edfconv;

namespace {

struct Args {
  std::string input_path;
  std::string output_path; // empty => <input stem>.<ext> in the current directory
  std::string format{"csv"};
  std::vector<std::string> channels;
  bool write_time{true};
  bool write_metadata{true};
  bool compress{true};
};

static void print_help() {
  std::cout
      << "edfconv_convert_cli\n\n"
      << "Convert an EDF recording to CSV, JSON or a NumPy .npz archive.\n\n"
      << "Usage:\n"
      << "  edfconv_convert_cli --input <file.edf> [--format csv|json|npz] [options]\n\n"
      << "Options:\n"
      << "  --format <fmt>               Output format: csv (default), json, npz (alias: numpy).\n"
      << "  --output <path>              Output file (default: <input stem>.<ext> in the current directory).\n"
      << "  --channels <A,B,...>         Export only these channels, in this order.\n"
      << "  --no-time                    CSV: do not write the leading Time column.\n"
      << "  --no-metadata                JSON: omit the metadata object.\n"
      << "  --no-compress                NPZ: store arrays without deflate compression.\n"
      << "  --version                    Print version and exit.\n"
      << "  -h, --help                   Show help.\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "edfconv_convert_cli " << version_string() << "\n";
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
    } else if ((arg == "--output" || arg == "--out") && i + 1 < argc) {
      a.output_path = argv[++i];
    } else if (arg == "--format" && i + 1 < argc) {
      a.format = to_lower(argv[++i]);
    } else if (arg == "--channels" && i + 1 < argc) {
      a.channels = parse_channel_list(argv[++i]);
    } else if (arg == "--no-time") {
      a.write_time = false;
    } else if (arg == "--no-metadata") {
      a.write_metadata = false;
    } else if (arg == "--no-compress") {
      a.compress = false;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }

  if (a.input_path.empty()) {
    print_help();
    throw std::runtime_error("Missing required --input");
  }
  if (a.format == "numpy") a.format = "npz";
  if (a.format != "csv" && a.format != "json" && a.format != "npz") {
    throw std::runtime_error("Unknown format: " + a.format + " (available: csv, json, npz)");
  }
  return a;
}

static std::string default_output_path(const std::string& input, const std::string& format) {
  const std::filesystem::path p = std::filesystem::u8path(input);
  return p.stem().u8string() + "." + format;
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    const std::string out =
        args.output_path.empty() ? default_output_path(args.input_path, args.format) : args.output_path;

    const EDFConverter conv(args.input_path);
    for (const auto& w : conv.store().warnings()) {
      std::cerr << "edfconv_convert_cli: WARNING: " << w << "\n";
    }

    ensure_parent_dir(out);

    if (args.format == "csv") {
      CsvExportOptions opts;
      opts.include_time = args.write_time;
      opts.channels = args.channels;
      conv.to_csv(out, opts);
      std::cout << "CSV file saved to: " << out << "\n";
    } else if (args.format == "json") {
      JsonExportOptions opts;
      opts.include_metadata = args.write_metadata;
      opts.channels = args.channels;
      conv.to_json(out, opts);
      std::cout << "JSON file saved to: " << out << "\n";
    } else {
      NpzExportOptions opts;
      opts.channels = args.channels;
      opts.compress = args.compress;
      conv.to_npz(out, opts);
      std::cout << "NumPy file saved to: " << out << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "edfconv_convert_cli error: " << e.what() << "\n";
    return 1;
  }
}
