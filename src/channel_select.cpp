#include "edfconv/channel_select.hpp"

#include "edfconv/errors.hpp"
#include "edfconv/utils.hpp"

namespace edfconv {

std::vector<std::size_t> select_channels(const SignalStore& store,
                                         const std::vector<std::string>& labels) {
  std::vector<std::size_t> out;
  if (labels.empty()) {
    out.reserve(store.n_channels());
    for (std::size_t i = 0; i < store.n_channels(); ++i) out.push_back(i);
    return out;
  }

  out.reserve(labels.size());
  for (const auto& label : labels) {
    const std::optional<std::size_t> idx = store.find_channel(label);
    if (!idx) throw UnknownChannelError(label, store.channel_labels());
    out.push_back(*idx);
  }
  return out;
}

std::vector<std::string> parse_channel_list(const std::string& s) {
  std::vector<std::string> out;
  for (const auto& part : split(s, ',')) {
    const std::string t = trim(part);
    if (!t.empty()) out.push_back(t);
  }
  return out;
}

std::vector<std::string> unique_names(const std::vector<std::string>& names,
                                      std::set<std::string> taken) {
  std::vector<std::string> out;
  out.reserve(names.size());
  for (const auto& base : names) {
    std::string name = base;
    for (int n = 2; taken.count(name) != 0; ++n) {
      name = base + "_" + std::to_string(n);
    }
    taken.insert(name);
    out.push_back(name);
  }
  return out;
}

} // namespace edfconv
