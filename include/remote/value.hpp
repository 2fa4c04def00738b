// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 RemoteValue — a decoded msgpack object returned by the editor

 Closed set of alternatives mirroring the msgpack type system. Text and raw
 bytes are kept apart because older servers send every string as bin; call
 DecodeByteStrings() before presenting a value to the user.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <msgpack.hpp>

namespace nvr {
namespace remote {

struct RemoteValue;
struct RemoteMapEntry;

struct RemoteBytes {
  std::string data;
  bool operator==(const RemoteBytes&) const = default;
};

// msgpack extension value. Neovim uses these for buffer, window and tabpage handles.
struct RemoteExt {
  int8_t type = 0;
  std::string data;
  bool operator==(const RemoteExt&) const = default;
};

using RemoteArray = std::vector<RemoteValue>;
using RemoteMap = std::vector<RemoteMapEntry>;  // keeps wire order

struct RemoteValue {
  using Storage = std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string, RemoteBytes,
                               RemoteArray, RemoteMap, RemoteExt>;

  Storage data;

  RemoteValue() = default;
  RemoteValue(Storage storage);

  static RemoteValue Nil() { return RemoteValue(); }
  static RemoteValue Boolean(bool b);
  static RemoteValue Integer(int64_t i);
  static RemoteValue Unsigned(uint64_t u);
  static RemoteValue Float(double d);
  static RemoteValue Text(std::string s);
  static RemoteValue Bytes(std::string b);
  static RemoteValue Array(RemoteArray a);
  static RemoteValue Map(RemoteMap m);
  static RemoteValue Ext(int8_t type, std::string payload);

  bool is_nil() const { return std::holds_alternative<std::monostate>(data); }
  bool is_text() const { return std::holds_alternative<std::string>(data); }
  bool is_bytes() const { return std::holds_alternative<RemoteBytes>(data); }
  bool is_array() const { return std::holds_alternative<RemoteArray>(data); }
  bool is_map() const { return std::holds_alternative<RemoteMap>(data); }

  bool operator==(const RemoteValue& other) const;
};

struct RemoteMapEntry {
  RemoteValue key;
  RemoteValue value;
  bool operator==(const RemoteMapEntry&) const = default;
};

inline RemoteValue::RemoteValue(Storage storage) : data(std::move(storage)) {}

inline RemoteValue RemoteValue::Boolean(bool b) { return RemoteValue(Storage(b)); }
inline RemoteValue RemoteValue::Integer(int64_t i) { return RemoteValue(Storage(i)); }
inline RemoteValue RemoteValue::Unsigned(uint64_t u) { return RemoteValue(Storage(u)); }
inline RemoteValue RemoteValue::Float(double d) { return RemoteValue(Storage(d)); }
inline RemoteValue RemoteValue::Text(std::string s) { return RemoteValue(Storage(std::move(s))); }
inline RemoteValue RemoteValue::Bytes(std::string b) { return RemoteValue(Storage(RemoteBytes{std::move(b)})); }
inline RemoteValue RemoteValue::Array(RemoteArray a) { return RemoteValue(Storage(std::move(a))); }
inline RemoteValue RemoteValue::Map(RemoteMap m) { return RemoteValue(Storage(std::move(m))); }
inline RemoteValue RemoteValue::Ext(int8_t type, std::string payload) {
  return RemoteValue(Storage(RemoteExt{type, std::move(payload)}));
}

// Convert a msgpack object into a RemoteValue. Never throws on well-formed objects.
RemoteValue FromMsgpack(const msgpack::object& obj);

// Copy of value with every bytes member, at any depth and including map keys, turned into text.
RemoteValue DecodeByteStrings(const RemoteValue& value);

// Integer handle carried by a Neovim extension value, if its payload is a packed integer.
std::optional<int64_t> ExtHandle(const RemoteExt& ext);

// Text for printing: strings verbatim, everything else as compact JSON.
std::string FormatForDisplay(const RemoteValue& value);

}  // namespace remote
}  // namespace nvr
