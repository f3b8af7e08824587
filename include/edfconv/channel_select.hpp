#pragma once

#include "edfconv/signal_store.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace edfconv {

// Resolve channel labels to SignalStore channel indices.
//
// - An empty list selects every channel in header order.
// - Otherwise the result follows the caller's order, not the header's.
// - Labels match exactly (EDF labels are trimmed of trailing padding).
//
// Throws UnknownChannelError for the first label that does not exist, even if
// the other requested labels are valid.
std::vector<std::size_t> select_channels(const SignalStore& store,
                                         const std::vector<std::string>& labels);

// Split a comma-separated CLI channel list ("Fz,Cz,EEG Pz") into labels.
// Surrounding whitespace is trimmed; empty entries are dropped.
std::vector<std::string> parse_channel_list(const std::string& s);

// Output keys for exported channels. A name already used (or listed in
// `taken`) gets "_2", "_3", ... appended, so duplicate labels stay distinct.
std::vector<std::string> unique_names(const std::vector<std::string>& names,
                                      std::set<std::string> taken = std::set<std::string>{});

} // namespace edfconv
