#ifndef PACKFORGE_CORE_JSON_UTILS_HPP_
#define PACKFORGE_CORE_JSON_UTILS_HPP_

#include <string>
#include <string_view>

namespace packforge::core {

// Appends `input` to `out` as the body of a JSON string literal (no quotes).
// Bytes >= 0x80 pass through untouched, so UTF-8 text stays UTF-8.
inline void AppendEscapedJson(std::string_view input, std::string& out) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out += "\\u00";
        out.push_back(kHexDigits[as_unsigned >> 4U]);
        out.push_back(kHexDigits[as_unsigned & 0x0FU]);
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
}

} // namespace packforge::core

#endif // PACKFORGE_CORE_JSON_UTILS_HPP_
