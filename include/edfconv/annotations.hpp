#pragma once

#include "edfconv/types.hpp"

#include <cstdint>
#include <vector>

namespace edfconv {

// Recover the TAL byte stream of an "EDF Annotations" signal from its decoded
// 16-bit words. Each word carries two consecutive file bytes (low byte first).
std::vector<uint8_t> annotation_bytes(const std::vector<int16_t>& words);

// Parse a single EDF+ annotation channel datarecord (TAL data) into events.
//
// Tolerant to trailing 0x00 padding. Record-start markers (TALs with empty
// text) are ignored. Entries whose onset does not parse are skipped.
std::vector<AnnotationEvent> parse_edfplus_annotations_record(const std::vector<uint8_t>& record_bytes);

} // namespace edfconv
