#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "maimwire/common.hpp"
#include "maimwire/errors.hpp"

namespace maimwire {

// Platform ids arrive either as integers (QQ numbers) or strings; the kind is kept so a
// record re-serializes exactly as it was received.
using Identifier = std::variant<std::int64_t, std::string>;

inline std::string to_string(const Identifier& id) {
  if (const auto* n = std::get_if<std::int64_t>(&id)) {
    return std::to_string(*n);
  }
  return std::get<std::string>(id);
}

inline constexpr const char* kSegList = "seglist";

struct Seg {
  std::string type;
  std::variant<std::string, std::vector<Seg>> data;

  static Seg text(std::string s) { return Seg{"text", std::move(s)}; }
  static Seg image(std::string base64) { return Seg{"image", std::move(base64)}; }
  static Seg emoji(std::string base64) { return Seg{"emoji", std::move(base64)}; }
  static Seg at(std::string target) { return Seg{"at", std::move(target)}; }
  static Seg reply(std::string message_id) { return Seg{"reply", std::move(message_id)}; }
  static Seg voice(std::string base64) { return Seg{"voice", std::move(base64)}; }
  static Seg list(std::vector<Seg> items) { return Seg{kSegList, std::move(items)}; }

  bool is_list() const { return std::holds_alternative<std::vector<Seg>>(data); }
  const std::string& payload() const { return std::get<std::string>(data); }
  const std::vector<Seg>& items() const { return std::get<std::vector<Seg>>(data); }
};

inline bool operator==(const Seg& a, const Seg& b) { return a.type == b.type && a.data == b.data; }

struct UserInfo {
  std::string platform;
  Identifier user_id;
  std::optional<std::string> nickname;
  std::optional<std::string> card_name;

  bool operator==(const UserInfo&) const = default;
};

struct GroupInfo {
  std::string platform;
  Identifier group_id;
  std::optional<std::string> name;

  bool operator==(const GroupInfo&) const = default;
};

struct FormatInfo {
  std::vector<std::string> content_format;
  std::vector<std::string> accept_format;

  bool contains(const std::string& kind) const {
    return std::find(content_format.begin(), content_format.end(), kind) != content_format.end();
  }
  bool accepts(const std::string& kind) const {
    return std::find(accept_format.begin(), accept_format.end(), kind) != accept_format.end();
  }

  bool operator==(const FormatInfo&) const = default;
};

struct TemplateInfo {
  std::map<std::string, std::string> template_items;
  std::optional<std::string> template_name;
  bool template_default{true};

  bool operator==(const TemplateInfo&) const = default;
};

struct MessageInfo {
  std::string platform;
  std::optional<Identifier> message_id;
  double time{0.0};
  UserInfo user_info;
  std::optional<GroupInfo> group_info;
  std::optional<FormatInfo> format_info;
  std::optional<TemplateInfo> template_info;
  std::optional<json> additional_config;  // any JSON value; null is omitted on the wire

  bool operator==(const MessageInfo&) const = default;
};

struct Message {
  MessageInfo info;
  Seg content;
  std::optional<std::string> raw_text;

  bool operator==(const Message&) const = default;
};

inline Message make_message(const std::string& platform, Identifier user_id, Seg content) {
  Message m;
  m.info.platform = platform;
  m.info.time = now_seconds();
  m.info.user_info.platform = platform;
  m.info.user_info.user_id = std::move(user_id);
  m.content = std::move(content);
  return m;
}

// Leaf kinds in first-appearance order; suitable for FormatInfo::content_format.
inline std::vector<std::string> collect_kinds(const Seg& seg) {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  std::vector<const Seg*> stack{&seg};
  while (!stack.empty()) {
    const Seg* cur = stack.back();
    stack.pop_back();
    if (cur->is_list()) {
      const auto& items = cur->items();
      for (auto it = items.rbegin(); it != items.rend(); ++it) {
        stack.push_back(&*it);
      }
      continue;
    }
    if (seen.insert(cur->type).second) {
      out.push_back(cur->type);
    }
  }
  return out;
}

inline std::string plain_text(const Seg& seg) {
  if (seg.is_list()) {
    std::string out;
    for (const auto& child : seg.items()) {
      out += plain_text(child);
    }
    return out;
  }
  return seg.type == "text" ? seg.payload() : std::string();
}

namespace detail {

// Present and not null.
inline const json* field(const json& obj, const char* key) {
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

inline std::optional<std::string> optional_string(const json& obj, const char* key) {
  const json* v = field(obj, key);
  if (!v || !v->is_string()) {
    return std::nullopt;
  }
  return v->get<std::string>();
}

inline std::string required_string(const json& obj, const char* key, const char* where) {
  const json* v = field(obj, key);
  if (!v || !v->is_string()) {
    throw MalformedMessage(std::string(where) + "." + key + " is missing");
  }
  return v->get<std::string>();
}

inline json identifier_to_json(const Identifier& id) {
  if (const auto* n = std::get_if<std::int64_t>(&id)) {
    return *n;
  }
  return std::get<std::string>(id);
}

// Integers beyond the int64 range are kept as their decimal text.
inline Identifier identifier_from_json(const json& v, const std::string& name) {
  constexpr auto kMaxSigned = static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)());
  if (v.is_number_unsigned() && v.get<std::uint64_t>() > kMaxSigned) {
    return Identifier{std::to_string(v.get<std::uint64_t>())};
  }
  if (v.is_number_integer()) {
    return Identifier{v.get<std::int64_t>()};
  }
  if (v.is_string()) {
    return Identifier{v.get<std::string>()};
  }
  throw MalformedMessage(name + " must be an integer or a string");
}

inline Identifier required_identifier(const json& obj, const char* key, const char* where) {
  const json* v = field(obj, key);
  const std::string name = std::string(where) + "." + key;
  if (!v) {
    throw MalformedMessage(name + " is missing");
  }
  return identifier_from_json(*v, name);
}

inline std::vector<std::string> string_list(const json& obj, const char* key) {
  std::vector<std::string> out;
  const json* v = field(obj, key);
  if (!v || !v->is_array()) {
    return out;
  }
  for (const auto& item : *v) {
    if (item.is_string()) {
      out.push_back(item.get<std::string>());
    }
  }
  return out;
}

}  // namespace detail

inline json segment_to_json(const Seg& seg) {
  json j;
  j["type"] = seg.type;
  if (seg.is_list()) {
    json items = json::array();
    for (const auto& child : seg.items()) {
      items.push_back(segment_to_json(child));
    }
    j["data"] = std::move(items);
  } else {
    j["data"] = seg.payload();
  }
  return j;
}

inline Seg segment_from_json(const json& j) {
  if (!j.is_object()) {
    throw MalformedMessage("segment is not an object");
  }
  Seg seg;
  seg.type = detail::required_string(j, "type", "message_segment");
  const json* data = detail::field(j, "data");

  if (seg.type == kSegList) {
    if (!data || !data->is_array()) {
      throw MalformedMessage("seglist payload is not a list of segments");
    }
    std::vector<Seg> items;
    items.reserve(data->size());
    for (const auto& child : *data) {
      items.push_back(segment_from_json(child));
    }
    seg.data = std::move(items);
    return seg;
  }

  if (!data) {
    seg.data = std::string();
  } else if (data->is_string()) {
    seg.data = data->get<std::string>();
  } else if (data->is_number()) {
    seg.data = data->dump();
  } else {
    throw MalformedMessage("payload of '" + seg.type + "' segment is not a string");
  }
  return seg;
}

inline json serialize(const MessageInfo& info) {
  json user;
  user["platform"] = info.user_info.platform;
  user["user_id"] = detail::identifier_to_json(info.user_info.user_id);
  if (info.user_info.nickname) {
    user["user_nickname"] = *info.user_info.nickname;
  }
  if (info.user_info.card_name) {
    user["user_cardname"] = *info.user_info.card_name;
  }

  json j;
  j["platform"] = info.platform;
  if (info.message_id) {
    j["message_id"] = detail::identifier_to_json(*info.message_id);
  }
  j["time"] = info.time;
  j["user_info"] = std::move(user);

  if (info.group_info) {
    json group;
    group["platform"] = info.group_info->platform;
    group["group_id"] = detail::identifier_to_json(info.group_info->group_id);
    if (info.group_info->name) {
      group["group_name"] = *info.group_info->name;
    }
    j["group_info"] = std::move(group);
  }
  if (info.format_info) {
    j["format_info"] = {{"content_format", info.format_info->content_format},
                        {"accept_format", info.format_info->accept_format}};
  }
  if (info.template_info) {
    json tpl;
    tpl["template_items"] = info.template_info->template_items;
    if (info.template_info->template_name) {
      tpl["template_name"] = *info.template_info->template_name;
    }
    tpl["template_default"] = info.template_info->template_default;
    j["template_info"] = std::move(tpl);
  }
  if (info.additional_config && !info.additional_config->is_null()) {
    j["additional_config"] = *info.additional_config;
  }
  return j;
}

inline MessageInfo deserialize_info(const json& j) {
  if (!j.is_object()) {
    throw MalformedMessage("message_info is missing");
  }
  MessageInfo info;
  info.platform = detail::required_string(j, "platform", "message_info");
  if (const json* id = detail::field(j, "message_id")) {
    info.message_id = detail::identifier_from_json(*id, "message_info.message_id");
  }
  if (const json* t = detail::field(j, "time"); t && t->is_number()) {
    info.time = t->get<double>();
  }

  const json* user = detail::field(j, "user_info");
  if (!user || !user->is_object()) {
    throw MalformedMessage("message_info.user_info.user_id is missing");
  }
  info.user_info.platform = detail::required_string(*user, "platform", "user_info");
  info.user_info.user_id = detail::required_identifier(*user, "user_id", "user_info");
  info.user_info.nickname = detail::optional_string(*user, "user_nickname");
  info.user_info.card_name = detail::optional_string(*user, "user_cardname");

  if (const json* group = detail::field(j, "group_info"); group && group->is_object()) {
    GroupInfo g;
    g.platform = detail::optional_string(*group, "platform").value_or(info.platform);
    g.group_id = detail::required_identifier(*group, "group_id", "group_info");
    g.name = detail::optional_string(*group, "group_name");
    info.group_info = std::move(g);
  }

  if (const json* fmt = detail::field(j, "format_info"); fmt && fmt->is_object()) {
    FormatInfo f;
    f.content_format = detail::string_list(*fmt, "content_format");
    f.accept_format = detail::string_list(*fmt, "accept_format");
    info.format_info = std::move(f);
  }

  if (const json* tpl = detail::field(j, "template_info"); tpl && tpl->is_object()) {
    TemplateInfo t;
    if (const json* items = detail::field(*tpl, "template_items"); items && items->is_object()) {
      for (auto it = items->begin(); it != items->end(); ++it) {
        if (it.value().is_string()) {
          t.template_items[it.key()] = it.value().get<std::string>();
        }
      }
    }
    t.template_name = detail::optional_string(*tpl, "template_name");
    if (const json* d = detail::field(*tpl, "template_default"); d && d->is_boolean()) {
      t.template_default = d->get<bool>();
    }
    info.template_info = std::move(t);
  }

  if (const json* extra = detail::field(j, "additional_config")) {
    info.additional_config = *extra;
  }
  return info;
}

inline json serialize(const Message& m) {
  json j;
  j["message_info"] = serialize(m.info);
  j["message_segment"] = segment_to_json(m.content);
  if (m.raw_text) {
    j["raw_message"] = *m.raw_text;
  }
  return j;
}

inline Message deserialize(const json& j) {
  if (!j.is_object()) {
    throw MalformedMessage("record is not an object");
  }
  const json* info = detail::field(j, "message_info");
  if (!info) {
    throw MalformedMessage("message_info is missing");
  }
  const json* segment = detail::field(j, "message_segment");
  if (!segment) {
    throw MalformedMessage("message_segment.type is missing");
  }

  Message m;
  m.info = deserialize_info(*info);
  m.content = segment_from_json(*segment);
  m.raw_text = detail::optional_string(j, "raw_message");
  return m;
}

// One frame's worth of text. Invalid UTF-8 in payloads is replaced rather than thrown.
inline std::string encode(const Message& m) {
  return serialize(m).dump(-1, ' ', false, json::error_handler_t::replace);
}

inline Message decode(const std::string& text) {
  const json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    throw MalformedMessage("frame is not valid JSON");
  }
  return deserialize(j);
}

}  // namespace maimwire
