#include "kild/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace kild::common {

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned code = 0;
      if (i + 4 < raw.size()) {
        const auto *first = raw.data() + i + 1;
        auto [ptr, ec] = std::from_chars(first, first + 4, code, 16);
        if (ec == std::errc() && ptr == first + 4 && code < 0x80) {
          out.push_back(static_cast<char>(code));
          i += 4;
          break;
        }
      }
      out += "\\u";
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::optional<JsonFlatMap> json_parse_flat(const std::string &input) {
  const std::string json = [&input] {
    std::size_t begin = json_skip_ws(input, 0);
    std::size_t end = input.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
      --end;
    }
    return input.substr(begin, end - begin);
  }();
  if (json.size() < 2 || json.front() != '{' || json.back() != '}') {
    return std::nullopt;
  }

  JsonFlatMap result;
  std::size_t pos = 1;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      return std::nullopt;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return std::nullopt;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return std::nullopt;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      return std::nullopt;
    }

    JsonValue value;
    const char lead = json[pos];
    if (lead == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        return std::nullopt;
      }
      value.type = JsonType::String;
      value.text = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (lead == '{' || lead == '[') {
      const char close = (lead == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, lead, close);
      if (end == std::string::npos) {
        return std::nullopt;
      }
      value.type = lead == '{' ? JsonType::Object : JsonType::Array;
      value.text = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t start = pos;
      while (pos < json.size() && json[pos] != ',' && json[pos] != '}' &&
             std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
        ++pos;
      }
      value.text = json.substr(start, pos - start);
      if (value.text == "null") {
        value.type = JsonType::Null;
      } else if (value.text == "true" || value.text == "false") {
        value.type = JsonType::Bool;
      } else if (!value.text.empty() &&
                 (value.text.front() == '-' ||
                  std::isdigit(static_cast<unsigned char>(value.text.front())) != 0)) {
        value.type = JsonType::Number;
      } else {
        return std::nullopt;
      }
    }
    result[key] = std::move(value);
  }

  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

std::optional<std::string> json_string_field(const JsonFlatMap &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || it->second.type != JsonType::String) {
    return std::nullopt;
  }
  return it->second.text;
}

std::optional<std::uint64_t> json_u64_field(const JsonFlatMap &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || it->second.type != JsonType::Number) {
    return std::nullopt;
  }
  const std::string &text = it->second.text;
  std::uint64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<bool> json_bool_field(const JsonFlatMap &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || it->second.type != JsonType::Bool) {
    return std::nullopt;
  }
  return it->second.text == "true";
}

void JsonObjectWriter::append_key(const std::string &key) {
  if (!body_.empty()) {
    body_.push_back(',');
  }
  body_ += "\"" + json_escape(key) + "\":";
}

JsonObjectWriter &JsonObjectWriter::add_string(const std::string &key, const std::string &value) {
  append_key(key);
  body_ += "\"" + json_escape(value) + "\"";
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add_optional_string(const std::string &key,
                                                        const std::optional<std::string> &value) {
  if (!value.has_value()) {
    return add_raw(key, "null");
  }
  return add_string(key, *value);
}

JsonObjectWriter &JsonObjectWriter::add_number(const std::string &key, const std::uint64_t value) {
  return add_raw(key, std::to_string(value));
}

JsonObjectWriter &
JsonObjectWriter::add_optional_number(const std::string &key,
                                      const std::optional<std::uint64_t> &value) {
  if (!value.has_value()) {
    return add_raw(key, "null");
  }
  return add_number(key, *value);
}

JsonObjectWriter &JsonObjectWriter::add_bool(const std::string &key, const bool value) {
  return add_raw(key, value ? "true" : "false");
}

JsonObjectWriter &JsonObjectWriter::add_raw(const std::string &key, const std::string &raw_json) {
  append_key(key);
  body_ += raw_json;
  return *this;
}

std::string JsonObjectWriter::str() const { return "{" + body_ + "}"; }

} // namespace kild::common
