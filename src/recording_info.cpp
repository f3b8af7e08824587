#include "edfconv/recording_info.hpp"

#include "edfconv/edf_header.hpp"
#include "edfconv/utils.hpp"

#include <filesystem>
#include <sstream>

namespace edfconv {

RecordingInfo summarize_recording(const SignalStore& store, const std::string& path) {
  RecordingInfo info;
  info.filename = std::filesystem::u8path(path).filename().u8string();
  info.n_channels = store.n_channels();
  info.channel_names = store.channel_labels();
  info.sampling_rate_hz = store.sampling_rate_hz();
  info.n_samples = store.time_axis().size();
  info.duration_seconds = store.time_axis().empty() ? 0.0 : store.time_axis().back();
  info.start_datetime = start_datetime_iso8601(store.descriptor());
  info.n_records = store.n_records();
  info.record_duration_seconds = store.descriptor().record_duration_seconds;
  info.uncalibrated_channels = store.uncalibrated_labels();
  info.n_events = store.events().size();
  return info;
}

static std::string json_string_array(const std::vector<std::string>& v) {
  std::string s = "[";
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) s += ", ";
    s += "\"" + json_escape(v[i]) + "\"";
  }
  s += "]";
  return s;
}

std::string recording_info_json(const RecordingInfo& info, int indent, const JsonMembers& extra) {
  const std::string pad = indent > 0 ? std::string(static_cast<std::size_t>(indent), ' ') : std::string();
  const std::string nl = indent > 0 ? "\n" : "";
  const std::string sep = indent > 0 ? ",\n" : ", ";

  std::ostringstream oss;
  oss << "{" << nl;
  oss << pad << "\"filename\": \"" << json_escape(info.filename) << "\"" << sep;
  oss << pad << "\"n_channels\": " << info.n_channels << sep;
  oss << pad << "\"channel_names\": " << json_string_array(info.channel_names) << sep;
  oss << pad << "\"sampling_rate\": " << json_number(info.sampling_rate_hz) << sep;
  oss << pad << "\"duration_seconds\": " << json_number(info.duration_seconds) << sep;
  oss << pad << "\"n_samples\": " << info.n_samples << sep;
  oss << pad << "\"measurement_date\": ";
  if (info.start_datetime) {
    oss << "\"" << json_escape(*info.start_datetime) << "\"";
  } else {
    oss << "null";
  }
  oss << sep;
  oss << pad << "\"n_records\": " << info.n_records << sep;
  oss << pad << "\"record_duration_seconds\": " << json_number(info.record_duration_seconds) << sep;
  oss << pad << "\"uncalibrated_channels\": " << json_string_array(info.uncalibrated_channels) << sep;
  oss << pad << "\"n_events\": " << info.n_events;
  for (const auto& m : extra) {
    oss << sep << pad << "\"" << json_escape(m.first) << "\": " << m.second;
  }
  oss << nl;
  oss << "}";
  return oss.str();
}

} // namespace edfconv
