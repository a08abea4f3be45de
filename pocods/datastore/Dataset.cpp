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


#include "Dataset.h"

#include <algorithm>

#define DEFAULT_LOG_CHANNEL "Dataset"
#include <logging/Log.h>

#include <pocods/DiskFile.h>
#include <pocods/ErrorCode.h>
#include <pocods/Reporter.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/helpers/Rapidjson.hpp>
#include <pocods/helpers/Strings.h>
#include <pocods/os/FileList.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/Compression.h>
#include <pocods/pocolog/Streams.h>
#include <pocods/roby/EventLog.h>
#include <pocods/utils/Sha256Digester.h>

using namespace std;

namespace pocods {
namespace datastore {

namespace {

const int kMaxDatasetDepth = 64;

const char* kLayoutVersionKey = "layout_version";
const char* kDigestKey = "digest";
const char* kIdentityKey = "identity";
const char* kStreamsKey = "streams";
const char* kPathKey = "path";
const char* kSizeKey = "size";
const char* kSha2Key = "sha2";
const char* kNameKey = "name";
const char* kTypeKey = "type";
const char* kSampleCountKey = "sample_count";
const char* kIntervalRtKey = "interval_rt";
const char* kIntervalLgKey = "interval_lg";
const char* kMetadataKey = "metadata";

bool isRobyEventLogName(const string& name) {
  const string prefix = "roby-events.";
  const string suffix = ".log";
  uint64_t number = 0;
  return name.size() > prefix.size() + suffix.size() &&
      name.compare(0, prefix.size(), prefix) == 0 &&
      name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0 &&
      helpers::readUInt64(
             name.substr(prefix.size(), name.size() - prefix.size() - suffix.size()), number);
}

bool getInterval(const JValue& piece, const char* name, pair<int64_t, int64_t>& outInterval) {
  vector<int64_t> values;
  if (getJVector(values, piece, name) && values.size() == 2) {
    outInterval = {values[0], values[1]};
    return true;
  }
  return false;
}

} // namespace

Dataset::Dataset(const string& corePath, const string& cachePath)
    : corePath_{corePath}, cachePath_{cachePath.empty() ? corePath : cachePath} {}

bool Dataset::isCacheInCore() const {
  return os::isSamePath(corePath_, cachePath_);
}

bool Dataset::isCacheArtifact(const string& relativePath) const {
  if (!isCacheInCore()) {
    return false;
  }
  const string pocologPrefix = string(kPocologDir) + '/';
  if (relativePath.compare(0, pocologPrefix.size(), pocologPrefix) == 0) {
    return helpers::endsWith(relativePath, ".idx") ||
        os::isFile(os::pathJoin(corePath_, relativePath + pocolog::kCompressedExtension));
  }
  return relativePath.find('/') == string::npos &&
      helpers::endsWith(relativePath, roby::kIndexSuffix);
}

vector<string> Dataset::getPocologFiles() const {
  vector<string> files;
  vector<string> pocologFiles;
  const string dir = os::pathJoin(corePath_, kPocologDir);
  if (!os::isDir(dir) || os::getFilesAndFolders(dir, files) != 0) {
    return pocologFiles;
  }
  for (string& file : files) {
    if ((helpers::endsWith(file, ".log") || helpers::endsWith(file, ".log.zst")) &&
        !isCacheArtifact(os::getRelativePath(file, corePath_))) {
      pocologFiles.push_back(std::move(file));
    }
  }
  return pocologFiles;
}

vector<string> Dataset::getRobyEventLogs() const {
  vector<string> files;
  vector<string> eventLogs;
  if (os::getFilesAndFolders(corePath_, files) != 0) {
    return eventLogs;
  }
  for (string& file : files) {
    if (isRobyEventLogName(os::getFilename(file))) {
      eventLogs.push_back(std::move(file));
    }
  }
  return eventLogs;
}

string Dataset::getPocologCachePath() const {
  return os::pathJoin(cachePath_, kPocologDir);
}

int Dataset::computeIdentity(
    vector<IdentityEntry>& outIdentity,
    const map<string, string>& knownSha2) const {
  outIdentity.clear();
  vector<string> files;
  IF_ERROR_LOG_AND_RETURN(os::getFileList(corePath_, files, kMaxDatasetDepth));
  for (const string& file : files) {
    IdentityEntry entry;
    entry.path = os::getRelativePath(file, corePath_);
    if (entry.path == kIdentityFilename || entry.path == kMetadataFilename ||
        isCacheArtifact(entry.path)) {
      continue;
    }
    int64_t size = os::getFileSize(file);
    if (size < 0) {
      PDS_LOGE("Can't get the size of {}", file);
      return FILE_NOT_FOUND;
    }
    entry.size = static_cast<uint64_t>(size);
    auto known = knownSha2.find(file);
    if (known != knownSha2.end()) {
      entry.sha2 = known->second;
    } else {
      IF_ERROR_LOG_AND_RETURN(utils::Sha256Digester::fileDigest(file, entry.sha2));
    }
    outIdentity.push_back(std::move(entry));
  }
  sort(outIdentity.begin(), outIdentity.end(), [](const IdentityEntry& a, const IdentityEntry& b) {
    return a.path < b.path;
  });
  return SUCCESS;
}

string Dataset::computeDigest(const vector<IdentityEntry>& identity) {
  utils::Sha256Digester digester;
  const char kZero = 0;
  for (const IdentityEntry& entry : identity) {
    digester.ingest(entry.path).ingest(&kZero, 1);
    digester.ingest(to_string(entry.size)).ingest(&kZero, 1);
    digester.ingest(entry.sha2).ingest("\n", 1);
  }
  return digester.digestToString();
}

int Dataset::computeStreams(Reporter& reporter) {
  streams_.clear();
  for (const string& file : getPocologFiles()) {
    string plainPath;
    if (!pocolog::findDecompressed(file, getPocologCachePath(), plainPath)) {
      reporter.warn(fmt::format("{} has not been decompressed, no stream information", file));
      continue;
    }
    pocolog::Streams streams;
    IF_ERROR_RETURN(streams.addFileGroup({plainPath}, reporter));
    for (const pocolog::Stream& stream : streams.getStreams()) {
      StreamEntry entry;
      entry.path = os::getRelativePath(file, corePath_);
      entry.name = stream.name;
      entry.typeName = stream.typeName;
      entry.sampleCount = stream.sampleCount;
      entry.intervalRt = {stream.rtFirst, stream.rtLast};
      entry.intervalLg = {stream.lgFirst, stream.lgLast};
      entry.metadata = stream.metadata;
      streams_.push_back(std::move(entry));
    }
  }
  return SUCCESS;
}

int Dataset::writeIdentityManifest(Reporter& reporter, const map<string, string>& knownSha2) {
  IF_ERROR_RETURN(computeIdentity(identity_, knownSha2));
  digest_ = computeDigest(identity_);
  IF_ERROR_RETURN(computeStreams(reporter));

  using namespace pocods_rapidjson;
  JDocument doc;
  JsonWrapper rj(doc);
  rj.addMember(kLayoutVersionKey, kLayoutVersion);
  rj.addMember(kDigestKey, digest_);
  JValue identity(kArrayType);
  for (const IdentityEntry& entry : identity_) {
    JValue jentry(kObjectType);
    JsonWrapper ej(jentry, rj.alloc);
    ej.addMember(kPathKey, entry.path);
    ej.addMember(kSizeKey, entry.size);
    ej.addMember(kSha2Key, entry.sha2);
    identity.PushBack(jentry, rj.alloc);
  }
  rj.addMember(kIdentityKey, identity);
  JValue streams(kArrayType);
  for (const StreamEntry& stream : streams_) {
    JValue jstream(kObjectType);
    JsonWrapper sj(jstream, rj.alloc);
    sj.addMember(kPathKey, stream.path);
    sj.addMember(kNameKey, stream.name);
    sj.addMember(kTypeKey, stream.typeName);
    sj.addMember(kSampleCountKey, stream.sampleCount);
    sj.addMember(
        kIntervalRtKey, vector<int64_t>{stream.intervalRt.first, stream.intervalRt.second});
    sj.addMember(
        kIntervalLgKey, vector<int64_t>{stream.intervalLg.first, stream.intervalLg.second});
    sj.addMember(kMetadataKey, stream.metadata);
    streams.PushBack(jstream, rj.alloc);
  }
  rj.addMember(kStreamsKey, streams);
  return DiskFile::writeTextFile(
      os::pathJoin(corePath_, kIdentityFilename), jDocumentToJsonStringPretty(doc));
}

int Dataset::readIdentityManifest() {
  string json;
  IF_ERROR_LOG_AND_RETURN(DiskFile::readTextFile(os::pathJoin(corePath_, kIdentityFilename), json));
  JDocument doc;
  jParse(doc, json);
  int64_t layoutVersion = 0;
  if (doc.HasParseError() || !doc.IsObject() || !getJInt64(layoutVersion, doc, kLayoutVersionKey)) {
    PDS_LOGE("{}: invalid identity manifest", corePath_);
    return INVALID_DATASET;
  }
  if (layoutVersion != kLayoutVersion) {
    PDS_LOGE("{}: unsupported dataset layout version {}", corePath_, layoutVersion);
    return INVALID_DATASET;
  }
  identity_.clear();
  streams_.clear();
  if (!getJString(digest_, doc, kDigestKey)) {
    return INVALID_DATASET;
  }
  const JValue::ConstMemberIterator identity = doc.FindMember(kIdentityKey);
  if (identity == doc.MemberEnd() || !identity->value.IsArray()) {
    return INVALID_DATASET;
  }
  for (const JValue& jentry : identity->value.GetArray()) {
    IdentityEntry entry;
    if (!jentry.IsObject() || !getJString(entry.path, jentry, kPathKey) ||
        !getJUInt64(entry.size, jentry, kSizeKey) || !getJString(entry.sha2, jentry, kSha2Key)) {
      return INVALID_DATASET;
    }
    identity_.push_back(std::move(entry));
  }
  const JValue::ConstMemberIterator streams = doc.FindMember(kStreamsKey);
  if (streams != doc.MemberEnd() && streams->value.IsArray()) {
    for (const JValue& jstream : streams->value.GetArray()) {
      StreamEntry entry;
      if (!jstream.IsObject() || !getJString(entry.path, jstream, kPathKey) ||
          !getJString(entry.name, jstream, kNameKey) ||
          !getJString(entry.typeName, jstream, kTypeKey) ||
          !getJUInt64(entry.sampleCount, jstream, kSampleCountKey) ||
          !getInterval(jstream, kIntervalRtKey, entry.intervalRt) ||
          !getInterval(jstream, kIntervalLgKey, entry.intervalLg)) {
        return INVALID_DATASET;
      }
      getJMap(entry.metadata, jstream, kMetadataKey);
      streams_.push_back(std::move(entry));
    }
  }
  return SUCCESS;
}

int Dataset::validateIdentity() const {
  vector<IdentityEntry> identity;
  IF_ERROR_RETURN(computeIdentity(identity));
  if (identity != identity_ || computeDigest(identity) != digest_) {
    PDS_LOGW("{}: files differ from the identity manifest", corePath_);
    return INVALID_DATASET;
  }
  return SUCCESS;
}

void Dataset::metadataAdd(const string& key, const string& value) {
  vector<string>& values = metadata_[key];
  if (find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

void Dataset::metadataSet(const string& key, const vector<string>& values) {
  vector<string>& newValues = metadata_[key];
  newValues.clear();
  for (const string& value : values) {
    metadataAdd(key, value);
  }
}

int Dataset::metadataWriteToFile() const {
  JDocument doc;
  JsonWrapper rj(doc);
  for (const auto& entry : metadata_) {
    doc.AddMember(rj.jValue(entry.first), rj.jValue(entry.second), rj.alloc);
  }
  return DiskFile::writeTextFile(
      os::pathJoin(corePath_, kMetadataFilename), jDocumentToJsonStringPretty(doc));
}

int Dataset::metadataReadFromFile() {
  metadata_.clear();
  const string path = os::pathJoin(corePath_, kMetadataFilename);
  if (!os::isFile(path)) {
    return SUCCESS;
  }
  string json;
  IF_ERROR_LOG_AND_RETURN(DiskFile::readTextFile(path, json));
  JDocument doc;
  jParse(doc, json);
  if (doc.HasParseError() || !doc.IsObject()) {
    PDS_LOGE("{}: invalid metadata file", path);
    return INVALID_DATASET;
  }
  for (const auto& member : doc.GetObject()) {
    vector<string> values;
    if (getFromJValue(member.value, values)) {
      metadataSet(member.name.GetString(), values);
    }
  }
  return SUCCESS;
}

} // namespace datastore
} // namespace pocods
