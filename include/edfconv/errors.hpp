#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace edfconv {

// Error taxonomy.
//
// Everything thrown by the library derives from Error (itself a
// std::runtime_error), so callers that only want a message can keep catching
// std::exception, while tools that want to react per category can catch the
// concrete types.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// The input path does not resolve to a readable file.
class FileNotFoundError : public Error {
public:
  explicit FileNotFoundError(const std::string& path)
    : Error("EDF file not found: " + path), path_(path) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

// Malformed or self-inconsistent EDF header.
class HeaderError : public Error {
public:
  explicit HeaderError(const std::string& what) : Error("EDF header error: " + what) {}
};

// Short or corrupt data record.
class RecordError : public Error {
public:
  explicit RecordError(const std::string& what) : Error("EDF record error: " + what) {}
};

// A requested channel label does not exist in the recording.
class UnknownChannelError : public Error {
public:
  UnknownChannelError(const std::string& label, const std::vector<std::string>& available);

  const std::string& label() const { return label_; }
  const std::vector<std::string>& available() const { return available_; }

private:
  std::string label_;
  std::vector<std::string> available_;
};

// Export destination could not be written.
class ExportIOError : public Error {
public:
  explicit ExportIOError(const std::string& what) : Error("Export failed: " + what) {}
};

} // namespace edfconv
