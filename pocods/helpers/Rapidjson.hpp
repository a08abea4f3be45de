/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cstdint>
#include <cstring>

#include <map>
#include <string>
#include <vector>

#define RAPIDJSON_NAMESPACE pocods_rapidjson
#define RAPIDJSON_HAS_STDSTRING 1

#include <rapidjson/rapidjson.h>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace pocods {

using std::map;
using std::string;
using std::vector;

/// rapidjson::Document's default MemoryPoolAllocator crashes on some platforms
/// as documented in https://github.com/cocos2d/cocos2d-x/issues/16492
using JUtf8Encoding = pocods_rapidjson::UTF8<>;
using JCrtAllocator = pocods_rapidjson::CrtAllocator;
using JDocument = pocods_rapidjson::GenericDocument<JUtf8Encoding, JCrtAllocator>;
using JValue = pocods_rapidjson::GenericValue<JUtf8Encoding, JCrtAllocator>;
using JStringRef = pocods_rapidjson::GenericStringRef<char>;

static inline JStringRef jStringRef(const char* str) {
  return JStringRef(str, static_cast<pocods_rapidjson::SizeType>(strlen(str)));
}
static inline JStringRef jStringRef(const string& str) {
  return JStringRef(str.c_str(), static_cast<pocods_rapidjson::SizeType>(str.size()));
}
template <class T>
static inline void jParse(JDocument& document, const T& str) {
  document.Parse(str.data(), str.size());
}

/// Helper class to generate json messages using RapidJson.
/// Member names are passed as references: they must outlive the serialization.
struct JsonWrapper {
  explicit JsonWrapper(JDocument& doc) : value{doc}, alloc{doc.GetAllocator()} {
    doc.SetObject();
  }
  JsonWrapper(JValue& v, JDocument::AllocatorType& a) : value{v}, alloc{a} {}

  JValue& value;
  JDocument::AllocatorType& alloc;

  template <typename T>
  inline JValue jValue(const T& v) {
    return JValue(v);
  }

  template <typename T>
  inline JValue jValue(const vector<T>& vect) {
    JValue jv(pocods_rapidjson::kArrayType);
    jv.Reserve(static_cast<pocods_rapidjson::SizeType>(vect.size()), alloc);
    for (const auto& v : vect) {
      jv.PushBack(jValue(v), alloc);
    }
    return jv;
  }

  template <typename T>
  inline JValue jValue(const map<string, T>& amap) {
    JValue jv(pocods_rapidjson::kObjectType);
    for (const auto& element : amap) {
      jv.AddMember(jValue(element.first), jValue(element.second), alloc);
    }
    return jv;
  }

  template <typename JSTR>
  inline void addMember(const JSTR& name, JValue& v) {
    value.AddMember(jStringRef(name), v, alloc);
  }

  template <typename JSTR>
  inline void addMember(const JSTR& name, const char* str) {
    value.AddMember(jStringRef(name), jStringRef(str), alloc);
  }

  template <typename JSTR, typename T>
  inline void addMember(const JSTR& name, const T& v) {
    value.AddMember(jStringRef(name), jValue(v), alloc);
  }
};

template <>
inline JValue JsonWrapper::jValue<string>(const string& str) {
  JValue jstring;
  jstring.SetString(str.c_str(), static_cast<pocods_rapidjson::SizeType>(str.length()), alloc);
  return jstring;
}

inline bool getFromJValue(const JValue& value, string& outValue) {
  if (value.IsString()) {
    outValue.assign(value.GetString(), value.GetStringLength());
    return true;
  }
  return false;
}

inline bool getFromJValue(const JValue& value, int64_t& outValue) {
  if (value.IsInt64()) {
    outValue = value.GetInt64();
    return true;
  }
  return false;
}

inline bool getFromJValue(const JValue& value, uint64_t& outValue) {
  if (value.IsUint64()) {
    outValue = value.GetUint64();
    return true;
  }
  return false;
}

template <typename T>
inline bool getFromJValue(const JValue& value, vector<T>& outVector) {
  outVector.clear();
  if (!value.IsArray()) {
    return false;
  }
  outVector.reserve(value.Size());
  for (JValue::ConstValueIterator itr = value.Begin(); itr != value.End(); ++itr) {
    T element;
    if (!getFromJValue(*itr, element)) {
      return false;
    }
    outVector.push_back(std::move(element));
  }
  return true;
}

template <typename T, typename JSTR>
inline bool getJMap(map<string, T>& outMap, const JValue& piece, const JSTR& name) {
  outMap.clear();
  const JValue::ConstMemberIterator properties = piece.FindMember(name);
  if (properties != piece.MemberEnd() && properties->value.IsObject()) {
    for (JValue::ConstMemberIterator itr = properties->value.MemberBegin();
         itr != properties->value.MemberEnd();
         ++itr) {
      T value;
      if (getFromJValue(itr->value, value)) {
        outMap[itr->name.GetString()] = std::move(value);
      }
    }
    return true;
  }
  return false;
}

template <typename T, typename JSTR>
inline bool getJVector(vector<T>& outVector, const JValue& piece, const JSTR& name) {
  const JValue::ConstMemberIterator member = piece.FindMember(name);
  if (member != piece.MemberEnd()) {
    return getFromJValue(member->value, outVector);
  }
  outVector.clear();
  return false;
}

template <typename JSTR>
inline bool getJString(string& outString, const JValue& piece, const JSTR& name) {
  const JValue::ConstMemberIterator member = piece.FindMember(name);
  if (member != piece.MemberEnd() && member->value.IsString()) {
    outString = member->value.GetString();
    return true;
  }
  outString.clear();
  return false;
}

template <typename JSTR>
inline bool getJInt64(int64_t& outInt64, const JValue& piece, const JSTR& name) {
  const JValue::ConstMemberIterator member = piece.FindMember(name);
  if (member != piece.MemberEnd() && member->value.IsInt64()) {
    outInt64 = member->value.GetInt64();
    return true;
  }
  outInt64 = 0;
  return false;
}

template <typename JSTR>
inline bool getJUInt64(uint64_t& outUInt64, const JValue& piece, const JSTR& name) {
  const JValue::ConstMemberIterator member = piece.FindMember(name);
  if (member != piece.MemberEnd() && member->value.IsUint64()) {
    outUInt64 = member->value.GetUint64();
    return true;
  }
  outUInt64 = 0;
  return false;
}

inline string jDocumentToJsonStringPretty(const JDocument& document) {
  using namespace pocods_rapidjson;
  StringBuffer buffer;
  using JPrettyWriter =
      pocods_rapidjson::PrettyWriter<StringBuffer, JUtf8Encoding, JUtf8Encoding, JCrtAllocator>;
  JPrettyWriter prettyWriter(buffer);
  document.Accept(prettyWriter);
  return buffer.GetString();
}

} // namespace pocods
