#include "edfconv/errors.hpp"

namespace edfconv {

static std::string unknown_channel_message(const std::string& label,
                                           const std::vector<std::string>& available) {
  std::string msg = "Channel '" + label + "' not found. Available channels: [";
  for (std::size_t i = 0; i < available.size(); ++i) {
    if (i) msg += ", ";
    msg += "'" + available[i] + "'";
  }
  msg += "]";
  return msg;
}

UnknownChannelError::UnknownChannelError(const std::string& label,
                                         const std::vector<std::string>& available)
  : Error(unknown_channel_message(label, available)), label_(label), available_(available) {}

} // namespace edfconv
