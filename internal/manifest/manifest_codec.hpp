#pragma once

#include <string>

#include "internal/model/chunk.hpp"
#include "recsync/uploader/v1.hpp"

namespace recsync::manifest {

inline constexpr uint32_t kManifestFormatVersion = 1;

recsync::uploader::v1::ManifestRecord ToRecord(const model::Manifest& manifest);
model::Manifest                       FromRecord(const recsync::uploader::v1::ManifestRecord& record);

recsync::uploader::v1::ChunkRecord ToRecord(const model::ChunkEntry& entry);
model::ChunkEntry                  FromRecord(const recsync::uploader::v1::ChunkRecord& record);

// Pretty-printed JSON with proto field names; every field is emitted.
std::string EncodeJson(const model::Manifest& manifest);

// Throws std::runtime_error on malformed JSON or unknown status strings.
model::Manifest DecodeJson(const std::string& json);

} // namespace recsync::manifest
