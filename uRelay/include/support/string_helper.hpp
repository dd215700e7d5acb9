#pragma once

#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace uRelay::Support {
struct StringHelper {
  // Adapted string_view substring algorithm from
  // https://www.bfilipek.com/2018/07/string-view-perf-followup.html
  static std::list<std::string_view> string_split(std::string_view input,
                                                  const char* split = ",") {
    size_t pos = 0;
    std::list<std::string_view> substrings;
    while (pos < input.size()) {
      const auto end_pos = input.find_first_of(split, pos);
      if (pos != end_pos) {
        substrings.emplace_back(input.substr(pos, end_pos - pos));
      }
      if (end_pos == std::string_view::npos) {
        break;
      }
      pos = end_pos + 1;
    }
    return substrings;
  }

  // Splits "host:port". The port has to be in [1, 65535].
  static std::optional<std::pair<std::string, uint16_t>> split_host_port(
      std::string_view input) {
    const auto split_pos = input.find_last_of(':');
    if (split_pos == std::string_view::npos || split_pos == 0 ||
        split_pos + 1 == input.size()) {
      return std::nullopt;
    }
    uint32_t port = 0;
    for (char c : input.substr(split_pos + 1)) {
      if (c < '0' || c > '9') {
        return std::nullopt;
      }
      port = port * 10 + static_cast<uint32_t>(c - '0');
      if (port > 65535) {
        return std::nullopt;
      }
    }
    if (port == 0) {
      return std::nullopt;
    }
    return std::make_pair(std::string(input.substr(0, split_pos)),
                          static_cast<uint16_t>(port));
  }
};

}  // namespace uRelay::Support
