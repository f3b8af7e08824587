#include "edfconv/utils.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace edfconv {

static bool is_pad(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string::npos) return std::string();
  const auto last = s.find_last_not_of(" \t\r\n\f\v");
  return s.substr(first, last - first + 1);
}

std::string trim_right(const std::string& s) {
  std::string out = s;
  while (!out.empty() && (is_pad(out.back()) || out.back() == '\0')) out.pop_back();
  return out;
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::size_t start = 0;
  for (;;) {
    const std::size_t pos = s.find(delim, start);
    if (pos == std::string::npos) {
      out.push_back(s.substr(start));
      break;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  if (s.empty()) out.clear();
  return out;
}

std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

long long to_int64(const std::string& s) {
  const std::string t = trim(s);
  if (t.empty()) throw std::runtime_error("Expected an integer, got an empty field");

  // strtoll accepts leading blanks and a sign; everything else must be digits.
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(t.c_str(), &end, 10);
  if (end == t.c_str() || *end != '\0') {
    throw std::runtime_error("Expected an integer, got '" + s + "'");
  }
  if (errno == ERANGE) throw std::runtime_error("Integer out of range: '" + s + "'");
  return v;
}

double to_double(const std::string& s) {
  const std::string t = trim(s);
  if (t.empty()) throw std::runtime_error("Expected a number, got an empty field");

  // Classic locale: '.' is the only decimal separator, "0,5" is rejected.
  std::istringstream iss(t);
  iss.imbue(std::locale::classic());
  double v = 0.0;
  if (!(iss >> v) || !(iss >> std::ws).eof()) {
    throw std::runtime_error("Expected a number, got '" + s + "'");
  }
  if (!std::isfinite(v)) throw std::runtime_error("Number is not finite: '" + s + "'");
  return v;
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(std::filesystem::u8path(path), ec);
}

void ensure_parent_dir(const std::string& path) {
  const std::filesystem::path parent = std::filesystem::u8path(path).parent_path();
  if (parent.empty()) return;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  // A failure here surfaces as ExportIOError when the file is opened.
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default: {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(uc));
          out += buf;
        } else {
          out.push_back(c); // UTF-8 bytes pass through
        }
        break;
      }
    }
  }
  return out;
}

std::string json_number(double x) {
  if (!std::isfinite(x)) return "null";
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss.precision(std::numeric_limits<double>::max_digits10);
  oss << x;
  return oss.str();
}

} // namespace edfconv
