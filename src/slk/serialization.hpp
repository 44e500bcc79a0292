// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "slk/streams.hpp"
#include "utils/cast.hpp"
#include "utils/endian.hpp"
#include "utils/exceptions.hpp"

// The namespace name stands for SaveLoadKit.
namespace rangekv::slk {

static_assert(std::is_same_v<std::uint8_t, char> || std::is_same_v<std::uint8_t, unsigned char>,
              "The slk library requires uint8_t to be implemented as char or "
              "unsigned char.");

/// Exception that will be thrown if an object can't be decoded from the byte
/// stream.
class SlkDecodeException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(SlkDecodeException)
};

// Forward declarations for all recursive `Save` and `Load` functions must be
// here because C++ doesn't know how to resolve the function call if it isn't in
// the global namespace.

template <typename T>
void Save(const std::vector<T> &obj, Builder *builder);
template <typename T>
void Load(std::vector<T> *obj, Reader *reader);

template <typename T, typename Cmp>
void Save(const std::set<T, Cmp> &obj, Builder *builder);
template <typename T, typename Cmp>
void Load(std::set<T, Cmp> *obj, Reader *reader);

template <typename K, typename V, typename Cmp>
void Save(const std::map<K, V, Cmp> &obj, Builder *builder);
template <typename K, typename V, typename Cmp>
void Load(std::map<K, V, Cmp> *obj, Reader *reader);

template <typename T>
void Save(const std::optional<T> &obj, Builder *builder);
template <typename T>
void Load(std::optional<T> *obj, Reader *reader);

template <typename A, typename B>
void Save(const std::pair<A, B> &obj, Builder *builder);
template <typename A, typename B>
void Load(std::pair<A, B> *obj, Reader *reader);

template <typename... Ts>
void Save(const std::variant<Ts...> &obj, Builder *builder);
template <typename... Ts>
void Load(std::variant<Ts...> *obj, Reader *reader);

// Implementation of serialization for primitive types.

#define MAKE_PRIMITIVE_SAVE(primitive_type)                                                 \
  inline void Save(primitive_type obj, Builder *builder) {                                  \
    primitive_type obj_encoded = utils::HostToLittleEndian(obj);                            \
    builder->Save(reinterpret_cast<const uint8_t *>(&obj_encoded), sizeof(primitive_type)); \
  }

MAKE_PRIMITIVE_SAVE(bool)
MAKE_PRIMITIVE_SAVE(char)
MAKE_PRIMITIVE_SAVE(int8_t)
MAKE_PRIMITIVE_SAVE(uint8_t)
MAKE_PRIMITIVE_SAVE(int16_t)
MAKE_PRIMITIVE_SAVE(uint16_t)
MAKE_PRIMITIVE_SAVE(int32_t)
MAKE_PRIMITIVE_SAVE(uint32_t)
MAKE_PRIMITIVE_SAVE(int64_t)
MAKE_PRIMITIVE_SAVE(uint64_t)

#undef MAKE_PRIMITIVE_SAVE

#define MAKE_PRIMITIVE_LOAD(primitive_type)                                          \
  inline void Load(primitive_type *obj, Reader *reader) {                            \
    primitive_type obj_encoded;                                                      \
    reader->Load(reinterpret_cast<uint8_t *>(&obj_encoded), sizeof(primitive_type)); \
    *obj = utils::LittleEndianToHost(obj_encoded);                                   \
  }

MAKE_PRIMITIVE_LOAD(bool)
MAKE_PRIMITIVE_LOAD(char)
MAKE_PRIMITIVE_LOAD(int8_t)
MAKE_PRIMITIVE_LOAD(uint8_t)
MAKE_PRIMITIVE_LOAD(int16_t)
MAKE_PRIMITIVE_LOAD(uint16_t)
MAKE_PRIMITIVE_LOAD(int32_t)
MAKE_PRIMITIVE_LOAD(uint32_t)
MAKE_PRIMITIVE_LOAD(int64_t)
MAKE_PRIMITIVE_LOAD(uint64_t)

#undef MAKE_PRIMITIVE_LOAD

/// Enumerations are stored as their underlying integer. Values outside of the
/// declared range are the caller's concern.
template <typename T>
requires std::is_enum_v<T>
inline void Save(T obj, Builder *builder) { Save(utils::UnderlyingCast(obj), builder); }

template <typename T>
requires std::is_enum_v<T>
inline void Load(T *obj, Reader *reader) {
  std::underlying_type_t<T> value;
  Load(&value, reader);
  *obj = static_cast<T>(value);
}

// Implementation of serialization of complex types.

inline void Save(const std::string_view obj, Builder *builder) {
  uint64_t size = obj.size();
  Save(size, builder);
  builder->Save(reinterpret_cast<const uint8_t *>(obj.data()), size);
}

inline void Save(const std::string &obj, Builder *builder) { Save(std::string_view{obj}, builder); }

inline void Load(std::string *obj, Reader *reader) {
  uint64_t size = 0;
  Load(&size, reader);
  *obj = std::string(size, '\0');
  reader->Load(reinterpret_cast<uint8_t *>(obj->data()), size);
}

template <typename T>
inline void Save(const std::vector<T> &obj, Builder *builder) {
  uint64_t size = obj.size();
  Save(size, builder);
  for (const auto &item : obj) {
    Save(item, builder);
  }
}

template <typename T>
inline void Load(std::vector<T> *obj, Reader *reader) {
  uint64_t size = 0;
  Load(&size, reader);
  obj->clear();
  obj->reserve(std::min<uint64_t>(size, 1024));
  for (uint64_t i = 0; i < size; ++i) {
    T item;
    Load(&item, reader);
    obj->push_back(std::move(item));
  }
}

template <typename T, typename Cmp>
inline void Save(const std::set<T, Cmp> &obj, Builder *builder) {
  uint64_t size = obj.size();
  Save(size, builder);
  for (const auto &item : obj) {
    Save(item, builder);
  }
}

template <typename T, typename Cmp>
inline void Load(std::set<T, Cmp> *obj, Reader *reader) {
  uint64_t size = 0;
  Load(&size, reader);
  obj->clear();
  for (uint64_t i = 0; i < size; ++i) {
    T item;
    Load(&item, reader);
    obj->emplace(std::move(item));
  }
}

template <typename K, typename V, typename Cmp>
inline void Save(const std::map<K, V, Cmp> &obj, Builder *builder) {
  uint64_t size = obj.size();
  Save(size, builder);
  for (const auto &item : obj) {
    Save(item.first, builder);
    Save(item.second, builder);
  }
}

template <typename K, typename V, typename Cmp>
inline void Load(std::map<K, V, Cmp> *obj, Reader *reader) {
  uint64_t size = 0;
  Load(&size, reader);
  obj->clear();
  for (uint64_t i = 0; i < size; ++i) {
    K key;
    V value;
    Load(&key, reader);
    Load(&value, reader);
    obj->emplace(std::move(key), std::move(value));
  }
}

template <typename T>
inline void Save(const std::optional<T> &obj, Builder *builder) {
  Save(obj.has_value(), builder);
  if (obj) Save(*obj, builder);
}

template <typename T>
inline void Load(std::optional<T> *obj, Reader *reader) {
  bool exists = false;
  Load(&exists, reader);
  if (exists) {
    T item;
    Load(&item, reader);
    obj->emplace(std::move(item));
  } else {
    *obj = std::nullopt;
  }
}

template <typename A, typename B>
inline void Save(const std::pair<A, B> &obj, Builder *builder) {
  Save(obj.first, builder);
  Save(obj.second, builder);
}

template <typename A, typename B>
inline void Load(std::pair<A, B> *obj, Reader *reader) {
  A first;
  B second;
  Load(&first, reader);
  Load(&second, reader);
  *obj = std::pair<A, B>(std::move(first), std::move(second));
}

/// Variants are stored as the alternative index followed by the alternative.
template <typename... Ts>
inline void Save(const std::variant<Ts...> &obj, Builder *builder) {
  static_assert(sizeof...(Ts) < 256, "Too many variant alternatives for SLK");
  Save(static_cast<uint8_t>(obj.index()), builder);
  std::visit([builder](const auto &alternative) { Save(alternative, builder); }, obj);
}

namespace detail {
template <typename TVariant, size_t I = 0>
void LoadVariantAlternative(TVariant *obj, size_t index, Reader *reader) {
  if constexpr (I < std::variant_size_v<TVariant>) {
    if (index == I) {
      std::variant_alternative_t<I, TVariant> alternative;
      Load(&alternative, reader);
      obj->template emplace<I>(std::move(alternative));
      return;
    }
    LoadVariantAlternative<TVariant, I + 1>(obj, index, reader);
  } else {
    throw SlkDecodeException("Variant alternative index {} is out of range!", index);
  }
}
}  // namespace detail

template <typename... Ts>
inline void Load(std::variant<Ts...> *obj, Reader *reader) {
  uint8_t index = 0;
  Load(&index, reader);
  detail::LoadVariantAlternative(obj, index, reader);
}

/// Serializes `obj` into a complete, finalized SLK stream.
template <typename T>
std::string SaveToString(const T &obj) {
  std::string out;
  Builder builder([&out](const uint8_t *data, size_t size, bool /*have_more*/) {
    out.append(reinterpret_cast<const char *>(data), size);
  });
  Save(obj, &builder);
  builder.Finalize();
  return out;
}

/// Decodes a complete SLK stream produced by `SaveToString`.
/// @throw SlkReaderException, SlkDecodeException on malformed input.
template <typename T>
void LoadFromString(std::string_view data, T *obj) {
  Reader reader(reinterpret_cast<const uint8_t *>(data.data()), data.size());
  Load(obj, &reader);
  reader.Finalize();
}

}  // namespace rangekv::slk
