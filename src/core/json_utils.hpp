#ifndef SCENEVAULT_CORE_JSON_UTILS_HPP_
#define SCENEVAULT_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace scenevault::core {

// Shared JSON string escaping for record, view and request writers.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

// Round-trip safe double formatting. Non-finite values have no JSON form.
inline std::string FormatJsonDouble(double value) {
  if (!std::isfinite(value)) {
    return "0";
  }

  std::ostringstream out;
  out << std::setprecision(17) << value;
  return out.str();
}

} // namespace scenevault::core

#endif // SCENEVAULT_CORE_JSON_UTILS_HPP_
