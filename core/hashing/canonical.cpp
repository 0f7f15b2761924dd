/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashing/canonical.hpp"

#include <algorithm>
#include <optional>

namespace andamio::hashing {
  using codec::json::Value;
  using Allocator = Document::AllocatorType;

  namespace {
    bool isWhitespace(char32_t c) {
      switch (c) {
        case 0x09:
        case 0x0A:
        case 0x0B:
        case 0x0C:
        case 0x0D:
        case 0x20:
        case 0xA0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
        case 0xFEFF:
          return true;
        default:
          return c >= 0x2000 && c <= 0x200A;
      }
    }

    /**
     * Decodes code point of at most 3 bytes starting at str[pos].
     * Whitespace code points are all below U+10000, so longer and malformed
     * sequences are reported as nullopt.
     */
    std::optional<std::pair<char32_t, size_t>> decodeAt(std::string_view str,
                                                        size_t pos) {
      const auto byte{[&](size_t i) {
        return static_cast<uint8_t>(str[pos + i]);
      }};
      const auto cont{[&](size_t i) {
        return pos + i < str.size() && (byte(i) & 0xC0) == 0x80;
      }};
      const auto lead{byte(0)};
      if (lead < 0x80) {
        return std::make_pair(char32_t{lead}, size_t{1});
      }
      if ((lead & 0xE0) == 0xC0 && cont(1)) {
        return std::make_pair(
            static_cast<char32_t>(((lead & 0x1F) << 6) | (byte(1) & 0x3F)),
            size_t{2});
      }
      if ((lead & 0xF0) == 0xE0 && cont(1) && cont(2)) {
        return std::make_pair(
            static_cast<char32_t>(((lead & 0x0F) << 12)
                                  | ((byte(1) & 0x3F) << 6)
                                  | (byte(2) & 0x3F)),
            size_t{3});
      }
      return std::nullopt;
    }

    void normalize(const Value &in, Value &out, Allocator &allocator) {
      if (in.IsString()) {
        const auto trimmed{
            trimWhitespace({in.GetString(), in.GetStringLength()})};
        out.SetString(trimmed.data(),
                      static_cast<rapidjson::SizeType>(trimmed.size()),
                      allocator);
      } else if (in.IsArray()) {
        out.SetArray();
        out.Reserve(in.Size(), allocator);
        for (const auto &item : in.GetArray()) {
          Value normalized;
          normalize(item, normalized, allocator);
          out.PushBack(normalized, allocator);
        }
      } else if (in.IsObject()) {
        std::vector<Value::ConstMemberIterator> members;
        members.reserve(in.MemberCount());
        for (auto it{in.MemberBegin()}; it != in.MemberEnd(); ++it) {
          members.push_back(it);
        }
        const auto key{[](const auto &it) {
          return std::string_view{it->name.GetString(),
                                  it->name.GetStringLength()};
        }};
        // stable: among duplicates the last parsed one stays last
        std::stable_sort(
            members.begin(), members.end(), [&](const auto &l, const auto &r) {
              return key(l) < key(r);
            });
        out.SetObject();
        for (size_t i{0}; i < members.size(); ++i) {
          if (i + 1 < members.size() && key(members[i]) == key(members[i + 1])) {
            continue;
          }
          Value name;
          name.SetString(members[i]->name.GetString(),
                         members[i]->name.GetStringLength(),
                         allocator);
          Value normalized;
          normalize(members[i]->value, normalized, allocator);
          out.AddMember(name, normalized, allocator);
        }
      } else {
        out.CopyFrom(in, allocator);
      }
    }
  }  // namespace

  std::string_view trimWhitespace(std::string_view str) {
    size_t begin{0};
    while (begin < str.size()) {
      const auto decoded{decodeAt(str, begin)};
      if (!decoded || !isWhitespace(decoded->first)) {
        break;
      }
      begin += decoded->second;
    }
    auto end{str.size()};
    while (end > begin) {
      // step back to lead byte of last code point
      auto start{end - 1};
      while (start > begin && end - start < 3
             && (static_cast<uint8_t>(str[start]) & 0xC0) == 0x80) {
        --start;
      }
      const auto decoded{decodeAt(str.substr(0, end), start)};
      if (!decoded || start + decoded->second != end
          || !isWhitespace(decoded->first)) {
        break;
      }
      end = start;
    }
    return str.substr(begin, end - begin);
  }

  Document normalizeForHashing(JIn value) {
    Document doc;
    normalize(*value, doc, doc.GetAllocator());
    return doc;
  }
}  // namespace andamio::hashing
