// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "remote/value.hpp"

#include <limits>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace nvr {
namespace remote {

namespace {

// ordered_json keeps map entries in wire order
using Json = nlohmann::ordered_json;

Json ToJson(const RemoteValue& value);

// Map keys must be strings in JSON. Non-text keys are rendered first.
std::string KeyText(const RemoteValue& key) {
  if (const auto* text = std::get_if<std::string>(&key.data)) {
    return *text;
  }
  if (const auto* bytes = std::get_if<RemoteBytes>(&key.data)) {
    return bytes->data;
  }
  return FormatForDisplay(key);
}

Json ToJson(const RemoteValue& value) {
  return std::visit(
      [](const auto& v) -> Json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return nullptr;
        } else if constexpr (std::is_same_v<T, RemoteBytes>) {
          return v.data;
        } else if constexpr (std::is_same_v<T, RemoteArray>) {
          Json arr = Json::array();
          for (const auto& item : v) {
            arr.push_back(ToJson(item));
          }
          return arr;
        } else if constexpr (std::is_same_v<T, RemoteMap>) {
          Json obj = Json::object();
          for (const auto& entry : v) {
            obj[KeyText(entry.key)] = ToJson(entry.value);
          }
          return obj;
        } else if constexpr (std::is_same_v<T, RemoteExt>) {
          auto handle = ExtHandle(v);
          if (handle) {
            return *handle;
          }
          return nullptr;
        } else {
          return v;
        }
      },
      value.data);
}

}  // namespace

bool RemoteValue::operator==(const RemoteValue& other) const {
  return data == other.data;
}

RemoteValue FromMsgpack(const msgpack::object& obj) {
  switch (obj.type) {
  case msgpack::type::NIL:
    return RemoteValue::Nil();
  case msgpack::type::BOOLEAN:
    return RemoteValue::Boolean(obj.via.boolean);
  case msgpack::type::POSITIVE_INTEGER:
    if (obj.via.u64 <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return RemoteValue::Integer(static_cast<int64_t>(obj.via.u64));
    }
    return RemoteValue::Unsigned(obj.via.u64);
  case msgpack::type::NEGATIVE_INTEGER:
    return RemoteValue::Integer(obj.via.i64);
  case msgpack::type::FLOAT32:
  case msgpack::type::FLOAT64:
    return RemoteValue::Float(obj.via.f64);
  case msgpack::type::STR:
    return RemoteValue::Text(std::string(obj.via.str.ptr, obj.via.str.size));
  case msgpack::type::BIN:
    return RemoteValue::Bytes(std::string(obj.via.bin.ptr, obj.via.bin.size));
  case msgpack::type::ARRAY: {
    RemoteArray items;
    items.reserve(obj.via.array.size);
    for (uint32_t i = 0; i < obj.via.array.size; ++i) {
      items.push_back(FromMsgpack(obj.via.array.ptr[i]));
    }
    return RemoteValue::Array(std::move(items));
  }
  case msgpack::type::MAP: {
    RemoteMap entries;
    entries.reserve(obj.via.map.size);
    for (uint32_t i = 0; i < obj.via.map.size; ++i) {
      const msgpack::object_kv& kv = obj.via.map.ptr[i];
      entries.push_back(RemoteMapEntry{FromMsgpack(kv.key), FromMsgpack(kv.val)});
    }
    return RemoteValue::Map(std::move(entries));
  }
  case msgpack::type::EXT:
    return RemoteValue::Ext(obj.via.ext.type(), std::string(obj.via.ext.data(), obj.via.ext.size));
  }
  return RemoteValue::Nil();
}

RemoteValue DecodeByteStrings(const RemoteValue& value) {
  if (const auto* bytes = std::get_if<RemoteBytes>(&value.data)) {
    return RemoteValue::Text(bytes->data);
  }
  if (const auto* items = std::get_if<RemoteArray>(&value.data)) {
    RemoteArray decoded;
    decoded.reserve(items->size());
    for (const auto& item : *items) {
      decoded.push_back(DecodeByteStrings(item));
    }
    return RemoteValue::Array(std::move(decoded));
  }
  if (const auto* entries = std::get_if<RemoteMap>(&value.data)) {
    RemoteMap decoded;
    decoded.reserve(entries->size());
    for (const auto& entry : *entries) {
      decoded.push_back(RemoteMapEntry{DecodeByteStrings(entry.key), DecodeByteStrings(entry.value)});
    }
    return RemoteValue::Map(std::move(decoded));
  }
  return value;
}

std::optional<int64_t> ExtHandle(const RemoteExt& ext) {
  if (ext.data.empty()) {
    return std::nullopt;
  }
  try {
    msgpack::object_handle handle = msgpack::unpack(ext.data.data(), ext.data.size());
    const msgpack::object& obj = handle.get();
    if (obj.type == msgpack::type::POSITIVE_INTEGER || obj.type == msgpack::type::NEGATIVE_INTEGER) {
      return obj.as<int64_t>();
    }
  } catch (const msgpack::unpack_error&) {
    // Not a packed integer
  } catch (const msgpack::type_error&) {
    // Positive value beyond int64_t
  }
  return std::nullopt;
}

std::string FormatForDisplay(const RemoteValue& value) {
  if (const auto* text = std::get_if<std::string>(&value.data)) {
    return *text;
  }
  if (const auto* bytes = std::get_if<RemoteBytes>(&value.data)) {
    return bytes->data;
  }
  // Invalid UTF-8 from the editor is replaced rather than thrown on
  return ToJson(value).dump(-1, ' ', false, Json::error_handler_t::replace);
}

}  // namespace remote
}  // namespace nvr
