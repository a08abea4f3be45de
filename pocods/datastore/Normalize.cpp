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


#include "Normalize.h"

#include <memory>

#define DEFAULT_LOG_CHANNEL "Normalize"
#include <logging/Log.h>

#include <pocods/ErrorCode.h>
#include <pocods/Reporter.h>
#include <pocods/datastore/IndexCache.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/Compression.h>
#include <pocods/pocolog/LogFile.h>
#include <pocods/pocolog/Streams.h>
#include <pocods/utils/Sha256Digester.h>

using namespace std;

namespace pocods {
namespace datastore {

namespace {

struct NormalizedStream {
  string path;
  pocolog::StreamDeclaration declaration;
  pocolog::LogFileWriter writer;
};

class Normalizer {
 public:
  Normalizer(const string& outputDir, Reporter& reporter)
      : outputDir_{outputDir}, reporter_{reporter} {}

  int processFile(const string& path) {
    pocolog::LogFile file;
    IF_ERROR_LOG_AND_RETURN(file.open(path, &reporter_));
    map<uint16_t, NormalizedStream*> outputs;
    for (const pocolog::StreamDeclaration& declaration : file.getStreams()) {
      NormalizedStream* output = nullptr;
      IF_ERROR_RETURN(getOutput(path, declaration, output));
      outputs[declaration.index] = output;
    }
    vector<uint8_t> payload;
    uint64_t processed = 0;
    for (const pocolog::DataBlockInfo& block : file.getDataBlocks()) {
      IF_ERROR_LOG_AND_RETURN(file.readBlockPayload(block, payload));
      IF_ERROR_RETURN(outputs[block.streamIndex]->writer.writeBlockPayload(0, payload));
      const uint64_t blockSize = sizeof(pocolog::BlockHeader) + payload.size();
      reporter_.advanceProgress(blockSize);
      processed += blockSize;
    }
    // prologue, declarations & truncated tail
    const int64_t fileSize = os::getFileSize(path);
    if (fileSize > 0 && static_cast<uint64_t>(fileSize) > processed) {
      reporter_.advanceProgress(static_cast<uint64_t>(fileSize) - processed);
    }
    return SUCCESS;
  }

  int closeAll() {
    for (auto& output : streams_) {
      IF_ERROR_LOG_AND_RETURN(output.second->writer.close());
    }
    return SUCCESS;
  }

  vector<string> getOutputPaths() const {
    vector<string> paths;
    paths.reserve(streams_.size());
    for (const auto& output : streams_) {
      paths.push_back(output.second->path);
    }
    return paths;
  }

 private:
  int getOutput(
      const string& path,
      const pocolog::StreamDeclaration& declaration,
      NormalizedStream*& outOutput) {
    const string name = pocolog::normalizedFilename(declaration.name, declaration.metadata);
    auto iter = streams_.find(name);
    if (iter != streams_.end()) {
      if (!iter->second->declaration.sameDefinition(declaration)) {
        reporter_.error(fmt::format(
            "Stream {} in {} differs from the stream it continues in {}",
            declaration.name,
            path,
            iter->second->path));
        return INVALID_FOLLOWUP_STREAM;
      }
      outOutput = iter->second.get();
      return SUCCESS;
    }
    unique_ptr<NormalizedStream> output = make_unique<NormalizedStream>();
    output->path = os::pathJoin(outputDir_, name + ".0.log");
    output->declaration = declaration;
    IF_ERROR_RETURN(output->writer.create(output->path));
    uint16_t index = 0;
    IF_ERROR_RETURN(output->writer.declareStream(declaration, index));
    outOutput = output.get();
    streams_[name] = std::move(output);
    return SUCCESS;
  }

  const string outputDir_;
  Reporter& reporter_;
  map<string, unique_ptr<NormalizedStream>> streams_;
};

int normalizeFiles(
    vector<vector<string>>& groups,
    const string& outputDir,
    const string& indexDir,
    const string& decompressionDir,
    bool computeDigest,
    Reporter& reporter,
    map<string, string>* outDigests) {
  uint64_t totalBytes = 0;
  for (vector<string>& group : groups) {
    for (string& file : group) {
      string plainPath;
      IF_ERROR_RETURN(pocolog::decompressed(file, decompressionDir, plainPath));
      file = plainPath;
      totalBytes += static_cast<uint64_t>(os::getFileSize(file));
    }
  }

  reporter.resetProgress("Normalizing pocolog files", totalBytes);
  Normalizer normalizer(outputDir, reporter);
  int error = SUCCESS;
  for (const vector<string>& group : groups) {
    for (const string& file : group) {
      error = normalizer.processFile(file);
      if (error != 0) {
        break;
      }
    }
    if (error != 0) {
      break;
    }
  }
  int closeError = normalizer.closeAll();
  reporter.finishProgress();
  IF_ERROR_RETURN(error);
  IF_ERROR_RETURN(closeError);

  PocologIndexer indexer;
  for (const string& output : normalizer.getOutputPaths()) {
    string indexPath;
    IF_ERROR_RETURN(ensureIndexValid(indexer, output, indexDir, false, indexPath));
    if (computeDigest) {
      string digest;
      IF_ERROR_LOG_AND_RETURN(utils::Sha256Digester::fileDigest(output, digest));
      if (outDigests != nullptr) {
        (*outDigests)[output] = digest;
      }
    }
  }
  return SUCCESS;
}

} // namespace

int normalize(
    const vector<string>& files,
    const string& outputDir,
    const string& indexDir,
    bool computeDigest,
    Reporter& reporter,
    map<string, string>* outDigests) {
  if (outDigests != nullptr) {
    outDigests->clear();
  }
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(outputDir));
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(indexDir));

  vector<vector<string>> groups = pocolog::makeFileGroups(files);
  if (!os::isSamePath(outputDir, indexDir)) {
    return normalizeFiles(
        groups, outputDir, indexDir, indexDir, computeDigest, reporter, outDigests);
  }
  // Decompressed inputs would collide with the output files
  const string scratchDir =
      os::getUniquePath(os::pathJoin(os::getTempFolder(), "pocods-decompressed"));
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(scratchDir));
  int error =
      normalizeFiles(groups, outputDir, indexDir, scratchDir, computeDigest, reporter, outDigests);
  IF_ERROR_LOG(os::removeRecursively(scratchDir));
  return error;
}

} // namespace datastore
} // namespace pocods
