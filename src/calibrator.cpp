#include "edfconv/calibrator.hpp"

namespace edfconv {

Calibration calibration_for(const ChannelDescriptor& channel) {
  Calibration cal;
  if (!channel.calibrated || channel.digital_max <= channel.digital_min ||
      channel.physical_max == channel.physical_min) {
    return cal;
  }
  cal.calibrated = true;
  cal.physical_min = channel.physical_min;
  cal.digital_min = static_cast<double>(channel.digital_min);
  cal.gain = (channel.physical_max - channel.physical_min) /
             (static_cast<double>(channel.digital_max) - static_cast<double>(channel.digital_min));
  return cal;
}

double to_physical(int digital_value, const ChannelDescriptor& channel) {
  return calibration_for(channel).apply(static_cast<double>(digital_value));
}

void append_physical(const std::vector<int16_t>& digital, const Calibration& cal,
                     std::vector<double>* out) {
  if (!out) return;
  out->reserve(out->size() + digital.size());
  for (int16_t v : digital) {
    out->push_back(cal.apply(static_cast<double>(v)));
  }
}

} // namespace edfconv
