#include "edfconv/annotations.hpp"

#include "edfconv/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace edfconv {

namespace {

constexpr uint8_t kTalEnd = 0x00;
constexpr uint8_t kFieldSep = 0x14;
constexpr uint8_t kDurationSep = 0x15;

} // namespace

std::vector<uint8_t> annotation_bytes(const std::vector<int16_t>& words) {
  std::vector<uint8_t> bytes(words.size() * 2u);
  for (std::size_t i = 0; i < words.size(); ++i) {
    const uint16_t u = static_cast<uint16_t>(words[i]);
    bytes[2 * i] = static_cast<uint8_t>(u & 0xFFu);
    bytes[2 * i + 1] = static_cast<uint8_t>(u >> 8);
  }
  return bytes;
}

// Onset and duration are decimal seconds; the onset always carries a sign.
static bool parse_seconds(const std::string& field, double* out) {
  std::string s = trim(field);
  if (!s.empty() && s[0] == '+') s.erase(0, 1);
  if (s.empty()) return false;
  try {
    *out = to_double(s);
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

// One TAL: onset[0x15 duration]0x14[text 0x14]...
static void parse_tal(const std::string& tal, std::vector<AnnotationEvent>* out) {
  const std::vector<std::string> fields = split(tal, static_cast<char>(kFieldSep));
  if (fields.size() < 2) return;

  const std::size_t dur_pos = fields[0].find(static_cast<char>(kDurationSep));
  double onset = 0.0;
  if (!parse_seconds(fields[0].substr(0, dur_pos), &onset)) return;

  double duration = 0.0;
  if (dur_pos != std::string::npos && !parse_seconds(fields[0].substr(dur_pos + 1), &duration)) {
    duration = 0.0;
  }

  // An empty text list is the per-record timekeeping TAL.
  for (std::size_t i = 1; i < fields.size(); ++i) {
    std::string text = trim(fields[i]);
    if (text.empty()) continue;
    AnnotationEvent ev;
    ev.onset_sec = onset;
    ev.duration_sec = duration;
    ev.text = std::move(text);
    out->push_back(std::move(ev));
  }
}

std::vector<AnnotationEvent> parse_edfplus_annotations_record(const std::vector<uint8_t>& record_bytes) {
  std::vector<AnnotationEvent> out;

  std::size_t i = 0;
  while (i < record_bytes.size()) {
    if (record_bytes[i] == kTalEnd) {
      ++i;
      continue;
    }
    const auto tal_end = std::find(record_bytes.begin() + static_cast<std::ptrdiff_t>(i),
                                   record_bytes.end(), kTalEnd);
    const std::size_t j = static_cast<std::size_t>(tal_end - record_bytes.begin());
    if (record_bytes[i] == '+' || record_bytes[i] == '-') {
      parse_tal(std::string(record_bytes.begin() + static_cast<std::ptrdiff_t>(i), tal_end), &out);
    }
    i = j;
  }

  std::sort(out.begin(), out.end(), [](const AnnotationEvent& a, const AnnotationEvent& b) {
    if (a.onset_sec != b.onset_sec) return a.onset_sec < b.onset_sec;
    if (a.duration_sec != b.duration_sec) return a.duration_sec < b.duration_sec;
    return a.text < b.text;
  });
  return out;
}

} // namespace edfconv
