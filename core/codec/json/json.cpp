/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <fmt/format.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>

#include "common/logger.hpp"

namespace andamio::codec::json {
  using rapidjson::ParseFlag;
  using rapidjson::SizeType;
  using rapidjson::StringBuffer;

  namespace {
    common::Logger logger() {
      static const common::Logger log{common::createLogger("json")};
      return log;
    }

    void writeEscaped(std::string &out, std::string_view str) {
      out.push_back('"');
      for (const auto ch : str) {
        const auto c{static_cast<unsigned char>(ch)};
        switch (c) {
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
          default:
            if (c < 0x20) {
              out += fmt::format("\\u{:04x}", c);
            } else {
              out.push_back(ch);
            }
        }
      }
      out.push_back('"');
    }

    /**
     * Writer with ECMAScript string and number forms.
     * Value::Accept dispatches statically on handler type, so hiding base
     * methods is enough.
     */
    class JsWriter : public rapidjson::Writer<StringBuffer> {
     public:
      using Base = rapidjson::Writer<StringBuffer>;
      using Base::Base;

      bool Double(double d) {
        const auto str{formatNumber(d)};
        return RawValue(str.data(),
                        str.size(),
                        std::isfinite(d) ? rapidjson::kNumberType
                                         : rapidjson::kNullType);
      }

      bool String(const Ch *str, SizeType length, bool = false) {
        std::string escaped;
        escaped.reserve(length + 2);
        writeEscaped(escaped, {str, length});
        return RawValue(
            escaped.data(), escaped.size(), rapidjson::kStringType);
      }

      bool Key(const Ch *str, SizeType length, bool copy = false) {
        return String(str, length, copy);
      }
    };
  }  // namespace

  outcome::result<Document> parse(std::string_view input) {
    Document doc;
    doc.Parse<ParseFlag::kParseFullPrecisionFlag>(input.data(), input.size());
    if (doc.HasParseError()) {
      logger()->debug("parse error at offset {}: {}",
                      doc.GetErrorOffset(),
                      rapidjson::GetParseError_En(doc.GetParseError()));
      return JsonError::kParse;
    }
    return std::move(doc);
  }

  std::string format(JIn j) {
    StringBuffer buffer;
    JsWriter writer{buffer};
    j->Accept(writer);
    return {buffer.GetString(), buffer.GetSize()};
  }

  std::string formatNumber(double value) {
    if (!std::isfinite(value)) {
      return "null";
    }
    if (value == 0) {
      // -0 too
      return "0";
    }
    // shortest round-trip representation, then reshaped into ECMAScript form
    const auto repr{fmt::format("{}", std::abs(value))};
    const auto e_pos{repr.find('e')};
    const auto mantissa{repr.substr(0, e_pos)};
    int exponent{0};
    if (e_pos != std::string::npos) {
      exponent = std::stoi(repr.substr(e_pos + 1));
    }

    std::string digits;
    int point{};
    const auto dot{mantissa.find('.')};
    if (dot == std::string::npos) {
      digits = mantissa;
      point = static_cast<int>(mantissa.size());
    } else {
      digits = mantissa.substr(0, dot) + mantissa.substr(dot + 1);
      point = static_cast<int>(dot);
    }
    point += exponent;
    const auto leading{digits.find_first_not_of('0')};
    digits.erase(0, leading);
    point -= static_cast<int>(leading);
    digits.erase(digits.find_last_not_of('0') + 1);

    const auto k{static_cast<int>(digits.size())};
    const auto n{point};
    std::string out{value < 0 ? "-" : ""};
    if (k <= n && n <= 21) {
      out += digits;
      out.append(n - k, '0');
    } else if (0 < n && n <= 21) {
      out += digits.substr(0, n);
      out += '.';
      out += digits.substr(n);
    } else if (-6 < n && n <= 0) {
      out += "0.";
      out.append(-n, '0');
      out += digits;
    } else {
      const auto e{n - 1};
      out += digits[0];
      if (k > 1) {
        out += '.';
        out += digits.substr(1);
      }
      out += fmt::format("e{}{}", e < 0 ? '-' : '+', std::abs(e));
    }
    return out;
  }

  outcome::result<std::vector<std::string>> jStrings(JIn j) {
    if (!j->IsArray()) {
      return JsonError::kWrongType;
    }
    std::vector<std::string> strings;
    strings.reserve(j->Size());
    for (const auto &it : j->GetArray()) {
      if (!it.IsString()) {
        return JsonError::kWrongType;
      }
      strings.emplace_back(it.GetString(), it.GetStringLength());
    }
    return strings;
  }
}  // namespace andamio::codec::json
