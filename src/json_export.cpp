#include "edfconv/json_export.hpp"

#include "edfconv/channel_select.hpp"
#include "edfconv/edf_header.hpp"
#include "edfconv/errors.hpp"
#include "edfconv/recording_info.hpp"
#include "edfconv/utils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace edfconv {

static void write_number_array(std::ostream& o, const std::vector<double>& v) {
  o << "[";
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) o << ", ";
    o << json_number(v[i]);
  }
  o << "]";
}

static std::string channels_metadata_json(const SignalStore& store) {
  std::ostringstream oss;
  oss << "[";
  for (std::size_t i = 0; i < store.n_channels(); ++i) {
    const ChannelSignal& sig = store.channel(i);
    const ChannelDescriptor& c = sig.descriptor;
    if (i) oss << ",";
    oss << "\n    {"
        << "\"label\": \"" << json_escape(c.label) << "\""
        << ", \"transducer_type\": \"" << json_escape(c.transducer_type) << "\""
        << ", \"physical_unit\": \"" << json_escape(c.physical_unit) << "\""
        << ", \"prefilter\": \"" << json_escape(c.prefilter) << "\""
        << ", \"physical_min\": " << json_number(c.physical_min)
        << ", \"physical_max\": " << json_number(c.physical_max)
        << ", \"digital_min\": " << c.digital_min
        << ", \"digital_max\": " << c.digital_max
        << ", \"samples_per_record\": " << c.samples_per_record
        << ", \"sampling_rate\": " << json_number(channel_sampling_rate_hz(store.descriptor(), sig.source_index))
        << ", \"n_samples\": " << sig.samples.size()
        << ", \"calibrated\": " << (c.calibrated ? "true" : "false")
        << "}";
  }
  if (store.n_channels() > 0) oss << "\n  ";
  oss << "]";
  return oss.str();
}

static std::string events_json(const SignalStore& store) {
  std::ostringstream oss;
  oss << "[";
  for (std::size_t i = 0; i < store.events().size(); ++i) {
    const AnnotationEvent& ev = store.events()[i];
    if (i) oss << ", ";
    oss << "{\"onset_sec\": " << json_number(ev.onset_sec)
        << ", \"duration_sec\": " << json_number(ev.duration_sec)
        << ", \"text\": \"" << json_escape(ev.text) << "\"}";
  }
  oss << "]";
  return oss.str();
}

static std::string string_array_json(const std::vector<std::string>& v) {
  std::string s = "[";
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) s += ", ";
    s += "\"" + json_escape(v[i]) + "\"";
  }
  return s + "]";
}

// Shift every line after the first by `pad` so a nested object lines up.
static std::string indent_nested(const std::string& s, const std::string& pad) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    out.push_back(c);
    if (c == '\n') out += pad;
  }
  return out;
}

void write_signal_json(std::ostream& o, const SignalStore& store, const std::string& source_path,
                       const JsonExportOptions& opts) {
  const std::vector<std::size_t> sel = select_channels(store, opts.channels);

  o << "{\n";
  if (opts.include_metadata) {
    const RecordingInfo info = summarize_recording(store, source_path);
    const JsonMembers extra = {
        {"patient_id", "\"" + json_escape(store.descriptor().patient_id) + "\""},
        {"recording_id", "\"" + json_escape(store.descriptor().recording_id) + "\""},
        {"channels", channels_metadata_json(store)},
        {"events", events_json(store)},
        {"warnings", string_array_json(store.warnings())},
    };
    o << "  \"metadata\": " << indent_nested(recording_info_json(info, 2, extra), "  ") << ",\n";
  }

  o << "  \"data\": {\n";
  o << "    \"times\": ";
  write_number_array(o, store.time_axis());
  o << ",\n";
  std::vector<std::string> labels;
  labels.reserve(sel.size());
  for (std::size_t ch : sel) labels.push_back(store.channel(ch).descriptor.label);
  const std::vector<std::string> keys = unique_names(labels);

  o << "    \"channels\": {";
  for (std::size_t k = 0; k < sel.size(); ++k) {
    o << (k ? ",\n" : "\n");
    o << "      \"" << json_escape(keys[k]) << "\": ";
    write_number_array(o, store.channel(sel[k]).samples);
  }
  if (!sel.empty()) o << "\n    ";
  o << "}\n";
  o << "  }\n";
  o << "}\n";

  if (!o) throw ExportIOError("JSON stream write failed");
}

void write_signal_json(const std::string& path, const SignalStore& store, const std::string& source_path,
                       const JsonExportOptions& opts) {
  (void)select_channels(store, opts.channels);

  std::ofstream o(std::filesystem::u8path(path), std::ios::binary);
  if (!o) throw ExportIOError("cannot open JSON for writing: " + path);

  write_signal_json(o, store, source_path, opts);
  o.flush();
  if (!o) throw ExportIOError("failed while writing JSON: " + path);
}

} // namespace edfconv
