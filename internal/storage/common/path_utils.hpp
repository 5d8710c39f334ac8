#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace recsync::storage::common {

/*
  Recording ids become directory names, file name prefixes and key
  segments, so they are restricted to [A-Za-z0-9._-] and may not be
  a relative path component.
*/
inline void ValidateRecordingId(std::string_view recording_id) {
  if (recording_id.empty()) {
    throw std::invalid_argument("recording id must not be empty");
  }
  if (recording_id == "." || recording_id == "..") {
    throw std::invalid_argument("recording id must not be a relative path component");
  }
  for (char c : recording_id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    if (!ok) {
      throw std::invalid_argument("recording id contains invalid character: " + std::string(recording_id));
    }
  }
}

// <recording_id>_chunk_<NNN><ext>
inline std::string ChunkFileName(std::string_view recording_id, uint32_t index, std::string_view extension) {
  char suffix[32];
  std::snprintf(suffix, sizeof(suffix), "_chunk_%03u", index);
  return std::string(recording_id) + suffix + std::string(extension);
}

inline std::filesystem::path ManifestPath(const std::filesystem::path& root, std::string_view recording_id) {
  ValidateRecordingId(recording_id);
  return root / (std::string(recording_id) + ".json");
}

/*
  Remote key layout:

      <key_prefix>/raw-chunks/<recording_id>/part-<index + 1, 4 digits><ext>

  Deterministic per chunk so a re-upload overwrites the same object.
*/
inline std::string RemoteChunkKey(std::string_view key_prefix, std::string_view recording_id, uint32_t index, std::string_view extension) {
  ValidateRecordingId(recording_id);

  std::string key;
  if (!key_prefix.empty()) {
    key.append(key_prefix);
    while (!key.empty() && key.back() == '/') key.pop_back();
    if (!key.empty()) key.push_back('/');
  }

  char part[32];
  std::snprintf(part, sizeof(part), "part-%04u", index + 1);

  key.append("raw-chunks/");
  key.append(recording_id);
  key.push_back('/');
  key.append(part);
  key.append(extension);
  return key;
}

} // namespace recsync::storage::common
