#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kild::common {

[[nodiscard]] std::string json_escape(const std::string &value);

[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

enum class JsonType { String, Number, Bool, Null, Object, Array };

struct JsonValue {
  JsonType type = JsonType::Null;
  std::string text;
};

using JsonFlatMap = std::unordered_map<std::string, JsonValue>;

/// Parse a JSON object into its top-level members. Returns nullopt on malformed input.
[[nodiscard]] std::optional<JsonFlatMap> json_parse_flat(const std::string &json);

[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

[[nodiscard]] std::optional<std::string> json_string_field(const JsonFlatMap &object,
                                                           const std::string &key);
[[nodiscard]] std::optional<std::uint64_t> json_u64_field(const JsonFlatMap &object,
                                                          const std::string &key);
[[nodiscard]] std::optional<bool> json_bool_field(const JsonFlatMap &object,
                                                  const std::string &key);

class JsonObjectWriter {
public:
  JsonObjectWriter &add_string(const std::string &key, const std::string &value);
  JsonObjectWriter &add_optional_string(const std::string &key,
                                        const std::optional<std::string> &value);
  JsonObjectWriter &add_number(const std::string &key, std::uint64_t value);
  JsonObjectWriter &add_optional_number(const std::string &key,
                                        const std::optional<std::uint64_t> &value);
  JsonObjectWriter &add_bool(const std::string &key, bool value);
  JsonObjectWriter &add_raw(const std::string &key, const std::string &raw_json);

  [[nodiscard]] std::string str() const;

private:
  void append_key(const std::string &key);

  std::string body_;
};

} // namespace kild::common
