#include "arrow_object_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/util/key_value_metadata.h>

#include <cstdio>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"
#include "internal/util/uuid.hpp"

namespace recsync::storage {

using common::UnwrapUpload;
using observability::StringField;

namespace {

std::shared_ptr<const arrow::KeyValueMetadata> ToKeyValueMetadata(const ObjectMetadata& metadata) {
  if (metadata.empty()) {
    return {};
  }
  std::vector<std::string> keys;
  std::vector<std::string> values;
  keys.reserve(metadata.size());
  values.reserve(metadata.size());
  for (const auto& [key, value] : metadata) {
    keys.push_back(key);
    values.push_back(value);
  }
  return arrow::key_value_metadata(std::move(keys), std::move(values));
}

std::string ParentOf(const std::string& path) {
  const auto slash = path.rfind('/');
  return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

void ValidateKey(const std::string& key) {
  if (key.empty() || key.front() == '/' || key.find("..") != std::string::npos) {
    throw util::StoreRejected("invalid object key: " + key);
  }
}

} // namespace

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), local_(fs_->type_name() == "local") {
  while (root_path_.size() > 1 && root_path_.back() == '/') {
    root_path_.pop_back();
  }
}

/*
  Object key layout:

      <root_path>/<key>
*/
std::string ArrowObjectStore::ObjectPath(const std::string& key) const {
  ValidateKey(key);
  if (root_path_.empty()) {
    return key;
  }
  return root_path_ + "/" + key;
}

std::string ArrowObjectStore::StagingRoot() const {
  return root_path_.empty() ? std::string(".multipart") : root_path_ + "/.multipart";
}

std::string ArrowObjectStore::StagingDir(const std::string& upload_id) const {
  return StagingRoot() + "/" + upload_id;
}

std::string ArrowObjectStore::PartPath(const std::string& upload_id, uint32_t part_number) const {
  char name[32];
  std::snprintf(name, sizeof(name), "/part-%05u", part_number);
  return StagingDir(upload_id) + name;
}

void ArrowObjectStore::EnsureParentDir(const std::string& path) {
  // object stores have no directories; creating markers would add stray keys
  if (!local_) {
    return;
  }
  const auto parent = ParentOf(path);
  if (!parent.empty()) {
    UnwrapUpload(fs_->CreateDir(parent, /*recursive=*/true), "create directory " + parent);
  }
}

void ArrowObjectStore::AbortPartial(arrow::io::OutputStream& out, const std::string& path) {
  if (auto status = out.Abort(); !status.ok()) {
    RECSYNC_LOG_WARN("abort of partial object failed", {StringField("path", path), StringField("error", status.ToString())});
  }
  // a local file survives Abort() with whatever was written
  if (local_) {
    if (auto status = fs_->DeleteFile(path); !status.ok()) {
      RECSYNC_LOG_WARN("removal of partial object failed", {StringField("path", path), StringField("error", status.ToString())});
    }
  }
}

ArrowObjectStore::Session ArrowObjectStore::FindSession(const std::string& key, const std::string& upload_id) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto                        it = sessions_.find(upload_id);
  if (it == sessions_.end()) {
    throw util::StoreRejected("NoSuchUpload: unknown upload id " + upload_id);
  }
  if (it->second.key != key) {
    throw util::StoreRejected("upload " + upload_id + " belongs to key " + it->second.key);
  }
  return it->second;
}

/*
  Upload buffer as one object.
*/
ObjectReceipt ArrowObjectStore::PutObject(const std::string& key, const std::shared_ptr<arrow::Buffer>& data, const ObjectMetadata& metadata) {
  const auto path = ObjectPath(key);
  EnsureParentDir(path);

  auto out = UnwrapUpload(fs_->OpenOutputStream(path, ToKeyValueMetadata(metadata)), "open " + path);
  try {
    UnwrapUpload(out->Write(data), "write " + path);
    UnwrapUpload(out->Close(), "close " + path);
  } catch (const std::exception&) {
    AbortPartial(*out, path);
    throw;
  }

  auto info = UnwrapUpload(fs_->GetFileInfo(path), "stat " + path);

  ObjectReceipt receipt;
  receipt.etag       = util::Sha256Hex(std::string_view(reinterpret_cast<const char*>(data->data()), data->size()));
  receipt.size_bytes = info.size();
  return receipt;
}

std::string ArrowObjectStore::CreateMultipartUpload(const std::string& key, const ObjectMetadata& metadata) {
  ValidateKey(key);

  const auto upload_id = util::GenerateUUIDString();
  if (local_) {
    UnwrapUpload(fs_->CreateDir(StagingDir(upload_id), /*recursive=*/true), "create staging area");
  }

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.emplace(upload_id, Session{key, metadata});
  return upload_id;
}

PartReceipt ArrowObjectStore::UploadPart(const std::string& key, const std::string& upload_id, uint32_t part_number,
                                         const std::shared_ptr<arrow::Buffer>& data) {
  if (part_number == 0) {
    throw util::StoreRejected("part numbers start at 1");
  }
  FindSession(key, upload_id);

  const auto path = PartPath(upload_id, part_number);
  auto       out  = UnwrapUpload(fs_->OpenOutputStream(path), "open part " + path);
  try {
    UnwrapUpload(out->Write(data), "write part " + path);
    UnwrapUpload(out->Close(), "close part " + path);
  } catch (const std::exception&) {
    AbortPartial(*out, path);
    throw;
  }

  PartReceipt receipt;
  receipt.part_number = part_number;
  receipt.etag        = util::Sha256Hex(std::string_view(reinterpret_cast<const char*>(data->data()), data->size()));
  receipt.size_bytes  = data->size();
  return receipt;
}

ObjectReceipt ArrowObjectStore::CompleteMultipartUpload(const std::string& key, const std::string& upload_id, const std::vector<PartReceipt>& parts) {
  const auto session = FindSession(key, upload_id);
  if (parts.empty()) {
    throw util::StoreRejected("InvalidRequest: multipart upload needs at least one part");
  }

  for (size_t i = 0; i < parts.size(); ++i) {
    if (parts[i].part_number != i + 1) {
      throw util::StoreRejected("InvalidPartOrder: expected part " + std::to_string(i + 1) + ", got " + std::to_string(parts[i].part_number));
    }
  }

  const auto path = ObjectPath(key);
  EnsureParentDir(path);

  util::Sha256 tag_hasher;
  auto         out = UnwrapUpload(fs_->OpenOutputStream(path, ToKeyValueMetadata(session.metadata)), "open " + path);
  try {
    for (const auto& part : parts) {
      const auto part_path = PartPath(upload_id, part.part_number);
      auto       input     = UnwrapUpload(fs_->OpenInputFile(part_path), "open part " + part_path);
      auto       size      = UnwrapUpload(input->GetSize(), "size part " + part_path);
      if (size != part.size_bytes) {
        throw util::StoreRejected("InvalidPart: part " + std::to_string(part.part_number) + " has " + std::to_string(size) +
                                  " bytes, receipt says " + std::to_string(part.size_bytes));
      }
      auto bytes = UnwrapUpload(input->Read(size), "read part " + part_path);
      UnwrapUpload(out->Write(bytes), "write " + path);
      tag_hasher.Update(part.etag);
    }
    UnwrapUpload(out->Close(), "close " + path);
  } catch (const std::exception&) {
    AbortPartial(*out, path);
    throw;
  }

  auto info = UnwrapUpload(fs_->GetFileInfo(path), "stat " + path);

  const auto staging = StagingDir(upload_id);
  if (auto status = fs_->DeleteDir(staging); !status.ok()) {
    RECSYNC_LOG_WARN("staging cleanup failed", {StringField("upload_id", upload_id), StringField("error", status.ToString())});
  }
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(upload_id);
  }

  ObjectReceipt receipt;
  receipt.etag       = tag_hasher.HexDigest() + "-" + std::to_string(parts.size());
  receipt.size_bytes = info.size();
  return receipt;
}

void ArrowObjectStore::AbortMultipartUpload(const std::string& key, const std::string& upload_id) {
  FindSession(key, upload_id);

  const auto staging = StagingDir(upload_id);
  auto       info    = UnwrapUpload(fs_->GetFileInfo(staging), "stat " + staging);
  if (info.type() != arrow::fs::FileType::NotFound) {
    UnwrapUpload(fs_->DeleteDir(staging), "delete " + staging);
  }

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.erase(upload_id);
}

size_t ArrowObjectStore::AbortStaleUploads() {
  arrow::fs::FileSelector selector;
  selector.base_dir        = StagingRoot();
  selector.allow_not_found = true;
  selector.recursive       = false;

  auto infos = UnwrapUpload(fs_->GetFileInfo(selector), "list " + selector.base_dir);

  size_t aborted = 0;
  for (const auto& info : infos) {
    if (info.type() != arrow::fs::FileType::Directory) {
      continue;
    }
    const auto upload_id = info.base_name();
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      if (sessions_.count(upload_id) > 0) {
        continue;
      }
    }

    UnwrapUpload(fs_->DeleteDir(info.path()), "delete " + info.path());
    ++aborted;
    RECSYNC_LOG_INFO("aborted stale multipart upload", {StringField("upload_id", upload_id)});
  }
  return aborted;
}

size_t ArrowObjectStore::OpenSessionCount() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

} // namespace recsync::storage
