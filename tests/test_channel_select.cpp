#include "edfconv/channel_select.hpp"
#include "edfconv/edf_reader.hpp"
#include "edfconv/errors.hpp"

#include "edf_fixture.hpp"
#include "test_support.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace edfconv;
using namespace edfconv_test;

int main() {
  const SignalStore s = load_edf_from_memory(two_rate_edf());

  // Empty selection => header order.
  {
    const std::vector<std::size_t> sel = select_channels(s, {});
    assert(sel.size() == 2);
    assert(sel[0] == 0 && sel[1] == 1);
  }

  // Caller order is preserved.
  {
    const std::vector<std::size_t> sel = select_channels(s, {"B", "A"});
    assert(sel.size() == 2);
    assert(sel[0] == 1 && sel[1] == 0);
  }

  // Unknown label among valid ones: the error names it and lists the rest.
  {
    bool threw = false;
    try {
      select_channels(s, {"A", "Cz", "B"});
    } catch (const UnknownChannelError& e) {
      threw = true;
      assert(e.label() == "Cz");
      assert(e.available().size() == 2);
      const std::string msg = e.what();
      assert(contains(msg, "'Cz'"));
      assert(contains(msg, "['A', 'B']"));
    }
    assert(threw);

    // Matching is exact.
    assert(throws_as<UnknownChannelError>([&] { select_channels(s, {"a"}); }));
    assert(throws_as<UnknownChannelError>([&] { select_channels(s, {"A "}); }));
  }

  // Comma lists from the command line.
  {
    const std::vector<std::string> v = parse_channel_list(" EEG Fz, B,,C ");
    assert(v.size() == 3);
    assert(v[0] == "EEG Fz");
    assert(v[1] == "B");
    assert(v[2] == "C");
    assert(parse_channel_list("").empty());
    assert(parse_channel_list(" , ").empty());
  }

  // Output keys for repeated labels.
  {
    const std::vector<std::string> v = unique_names({"A", "B", "A", "A"});
    assert(v.size() == 4);
    assert(v[0] == "A" && v[1] == "B" && v[2] == "A_2" && v[3] == "A_3");

    const std::vector<std::string> r = unique_names({"times", "X"}, {"times"});
    assert(r[0] == "times_2");
    assert(r[1] == "X");
  }

  std::cout << "test_channel_select passed\n";
  return 0;
}
