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

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pocods {

class Reporter;

namespace datastore {

using std::map;
using std::pair;
using std::string;
using std::vector;

/// One file of a dataset's identity.
struct IdentityEntry {
  string path; ///< relative to the dataset's core path, with '/' separators
  uint64_t size{};
  string sha2; ///< SHA-256 of the file's content, lowercase hex

  bool operator==(const IdentityEntry& rhs) const {
    return path == rhs.path && size == rhs.size && sha2 == rhs.sha2;
  }
};

/// Description of one normalized stream of a dataset.
struct StreamEntry {
  string path; ///< relative to the dataset's core path
  string name;
  string typeName;
  uint64_t sampleCount{};
  pair<int64_t, int64_t> intervalRt; ///< microseconds
  pair<int64_t, int64_t> intervalLg; ///< microseconds
  map<string, string> metadata;
};

/// \brief A normalized dataset: its canonical files in a core directory, and its rebuildable
/// artifacts (indexes & decompressed files) in a cache directory.
///
/// A dataset is identified by a digest computed from the path, size & content digest of all its
/// core files, manifests excluded.
/// The cache directory may be the core directory itself. Cache artifacts are then recognized by
/// their names, and left out of the dataset's identity & streams.
class Dataset {
 public:
  static constexpr uint32_t kLayoutVersion = 1;
  static constexpr const char* kIdentityFilename = "pocods-dataset.json";
  static constexpr const char* kMetadataFilename = "pocods-metadata.json";
  static constexpr const char* kPocologDir = "pocolog";
  static constexpr const char* kTextDir = "text";
  static constexpr const char* kIgnoredDir = "ignored";

  Dataset() = default;
  /// @param corePath: the dataset's directory.
  /// @param cachePath: the dataset's cache directory. Defaults to the core directory.
  explicit Dataset(const string& corePath, const string& cachePath = {});

  const string& getCorePath() const {
    return corePath_;
  }
  const string& getCachePath() const {
    return cachePath_;
  }
  /// Digest of the dataset, once computed or read from its identity manifest.
  const string& getDigest() const {
    return digest_;
  }
  const vector<IdentityEntry>& getIdentity() const {
    return identity_;
  }
  const vector<StreamEntry>& getStreams() const {
    return streams_;
  }

  /// Tell if the cache directory is the core directory.
  bool isCacheInCore() const;
  /// Tell if a file of the core directory is a cache artifact: an index, or the decompressed
  /// copy of a compressed pocolog file. Only possible when the cache is in the core directory.
  /// @param relativePath: path relative to the core directory, with '/' separators.
  bool isCacheArtifact(const string& relativePath) const;

  /// The normalized pocolog files, plain or compressed.
  vector<string> getPocologFiles() const;
  /// The Roby event logs, named roby-events.N.log.
  vector<string> getRobyEventLogs() const;
  string getPocologCachePath() const;

  /// Compute the identity entries of all the core files, manifests excluded, sorted by path.
  /// @param knownSha2: SHA-256 digests already computed, per absolute path, to avoid hashing
  /// these files again.
  int computeIdentity(
      vector<IdentityEntry>& outIdentity,
      const map<string, string>& knownSha2 = {}) const;
  /// Compute a dataset digest from identity entries.
  static string computeDigest(const vector<IdentityEntry>& identity);

  /// Compute the dataset's identity, digest & stream list, then write its identity manifest.
  /// Must only be called once all the core files are in their final state.
  int writeIdentityManifest(Reporter& reporter, const map<string, string>& knownSha2 = {});
  /// Read the dataset's identity, digest & stream list from its identity manifest.
  int readIdentityManifest();
  /// Verify that the core files still match the identity manifest.
  /// @return 0 if they do, INVALID_DATASET if not, or an error code.
  int validateIdentity() const;

  /// Add a value to a metadata key, unless the key has that value already.
  void metadataAdd(const string& key, const string& value);
  void metadataSet(const string& key, const vector<string>& values);
  const map<string, vector<string>>& getMetadata() const {
    return metadata_;
  }
  int metadataWriteToFile() const;
  int metadataReadFromFile();

 private:
  int computeStreams(Reporter& reporter);

  string corePath_;
  string cachePath_;
  string digest_;
  vector<IdentityEntry> identity_;
  vector<StreamEntry> streams_;
  map<string, vector<string>> metadata_;
};

} // namespace datastore
} // namespace pocods
