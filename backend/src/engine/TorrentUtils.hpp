#pragma once

#include <libtorrent/info_hash.hpp>
#include <libtorrent/sha1_hash.hpp>
#include <libtorrent/torrent_handle.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tl::engine {

constexpr int kSha1Bytes = static_cast<int>(libtorrent::sha1_hash::size());

inline int hex_digit_value(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

inline std::optional<libtorrent::sha1_hash> sha1_from_hex(std::string_view value) {
  if (value.size() != static_cast<std::size_t>(kSha1Bytes) * 2) {
    return std::nullopt;
  }
  libtorrent::sha1_hash result;
  for (int i = 0; i < kSha1Bytes; ++i) {
    int high = hex_digit_value(value[2 * i]);
    int low = hex_digit_value(value[2 * i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    result[i] = static_cast<std::uint8_t>((high << 4) | low);
  }
  return result;
}

inline std::string info_hash_to_hex(libtorrent::sha1_hash const &hash) {
  constexpr char kHexDigits[] = "0123456789abcdef";
  std::string result;
  result.reserve(kSha1Bytes * 2);
  for (int i = 0; i < kSha1Bytes; ++i) {
    auto byte = static_cast<unsigned char>(hash[i]);
    result.push_back(kHexDigits[byte >> 4]);
    result.push_back(kHexDigits[byte & 0x0F]);
  }
  return result;
}

inline std::string info_hash_to_hex(libtorrent::info_hash_t const &info) {
  return info_hash_to_hex(info.get_best());
}

// Transfers are keyed by lowercase hex; accepts either case from callers.
inline std::optional<std::string> normalize_info_hash(std::string_view value) {
  auto parsed = sha1_from_hex(value);
  if (!parsed) {
    return std::nullopt;
  }
  return info_hash_to_hex(*parsed);
}

inline std::optional<std::string> hash_from_handle(libtorrent::torrent_handle const &handle) {
  if (!handle.is_valid()) {
    return std::nullopt;
  }
  auto const best = handle.info_hashes().get_best();
  if (best.is_all_zeros()) {
    return std::nullopt;
  }
  return info_hash_to_hex(best);
}

inline bool is_magnet_uri(std::string_view value) {
  constexpr std::string_view kScheme = "magnet:";
  if (value.size() < kScheme.size()) {
    return false;
  }
  return std::equal(kScheme.begin(), kScheme.end(), value.begin(),
                    [](char expected, char actual) {
                      return expected == static_cast<char>(std::tolower(
                                             static_cast<unsigned char>(actual)));
                    });
}

} // namespace tl::engine
