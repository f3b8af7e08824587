#include "edfconv/converter.hpp"

#include "edfconv/channel_select.hpp"
#include "edfconv/edf_reader.hpp"
#include "edfconv/errors.hpp"

namespace edfconv {

EDFConverter::EDFConverter(const std::string& path)
  : path_(path), store_(load_edf(path)) {}

RecordingInfo EDFConverter::get_info() const {
  return summarize_recording(store_, path_);
}

SignalData EDFConverter::get_data(const std::vector<std::string>& channels) const {
  const std::vector<std::size_t> sel = select_channels(store_, channels);

  SignalData out;
  out.labels.reserve(sel.size());
  out.samples.reserve(sel.size());
  for (std::size_t ch : sel) {
    out.labels.push_back(store_.channel(ch).descriptor.label);
    out.samples.push_back(store_.channel(ch).samples);
  }
  out.times = store_.time_axis();
  return out;
}

ChannelData EDFConverter::get_channel_data(const std::string& label) const {
  const std::optional<std::size_t> idx = store_.find_channel(label);
  if (!idx) throw UnknownChannelError(label, store_.channel_labels());

  const ChannelSignal& sig = store_.channel(*idx);
  ChannelData out;
  out.descriptor = sig.descriptor;
  out.samples = sig.samples;
  out.times.reserve(sig.samples.size());
  for (std::size_t i = 0; i < sig.samples.size(); ++i) {
    out.times.push_back(store_.time_axis()[store_.time_index(*idx, i)]);
  }
  return out;
}

void EDFConverter::to_csv(const std::string& output_path, const CsvExportOptions& opts) const {
  write_signal_csv(output_path, store_, opts);
}

void EDFConverter::to_json(const std::string& output_path, const JsonExportOptions& opts) const {
  write_signal_json(output_path, store_, path_, opts);
}

void EDFConverter::to_npz(const std::string& output_path, const NpzExportOptions& opts) const {
  write_signal_npz(output_path, store_, opts);
}

} // namespace edfconv
