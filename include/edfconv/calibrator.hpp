#pragma once

#include "edfconv/types.hpp"

#include <cstdint>
#include <vector>

namespace edfconv {

// Per-channel linear map from digital to physical units:
//
//   physical = physical_min + (digital - digital_min) * (physical_max - physical_min)
//                                                      / (digital_max - digital_min)
//
// Each channel uses its own min/max pair. Channels with calibrated == false
// (see ChannelDescriptor) use identity scaling.
struct Calibration {
  double physical_min{0.0};
  double digital_min{0.0};
  double gain{1.0};
  bool calibrated{false};

  double apply(double digital) const {
    if (!calibrated) return digital;
    return physical_min + (digital - digital_min) * gain;
  }
};

Calibration calibration_for(const ChannelDescriptor& channel);

double to_physical(int digital_value, const ChannelDescriptor& channel);

// Calibrate a block of digital samples and append them to `out`.
void append_physical(const std::vector<int16_t>& digital, const Calibration& cal,
                     std::vector<double>* out);

} // namespace edfconv
