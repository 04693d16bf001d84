#ifndef MEDIAPREP_CORE_BASE64_HPP_
#define MEDIAPREP_CORE_BASE64_HPP_

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace mediaprep::core {

// Standard alphabet with '=' padding. Used when a preview is returned inline
// instead of being written to `output_path`.
inline std::string EncodeBase64(std::span<const unsigned char> bytes) {
  static constexpr char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string out;
  out.reserve(((bytes.size() + 2U) / 3U) * 4U);

  std::size_t i = 0;
  for (; i + 3U <= bytes.size(); i += 3U) {
    const std::uint32_t chunk = (static_cast<std::uint32_t>(bytes[i]) << 16U) |
                                (static_cast<std::uint32_t>(bytes[i + 1U]) << 8U) |
                                static_cast<std::uint32_t>(bytes[i + 2U]);
    out.push_back(kAlphabet[(chunk >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(chunk >> 12U) & 0x3FU]);
    out.push_back(kAlphabet[(chunk >> 6U) & 0x3FU]);
    out.push_back(kAlphabet[chunk & 0x3FU]);
  }

  const std::size_t remaining = bytes.size() - i;
  if (remaining == 1U) {
    const std::uint32_t chunk = static_cast<std::uint32_t>(bytes[i]) << 16U;
    out.push_back(kAlphabet[(chunk >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(chunk >> 12U) & 0x3FU]);
    out += "==";
  } else if (remaining == 2U) {
    const std::uint32_t chunk = (static_cast<std::uint32_t>(bytes[i]) << 16U) |
                                (static_cast<std::uint32_t>(bytes[i + 1U]) << 8U);
    out.push_back(kAlphabet[(chunk >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(chunk >> 12U) & 0x3FU]);
    out.push_back(kAlphabet[(chunk >> 6U) & 0x3FU]);
    out.push_back('=');
  }
  return out;
}

} // namespace mediaprep::core

#endif // MEDIAPREP_CORE_BASE64_HPP_
