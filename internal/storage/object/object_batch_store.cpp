#include "object_batch_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace vigil::storage {

using namespace vigil::storage::common;

ObjectBatchStore::ObjectBatchStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
  if (!root_path_.empty()) {
    Unwrap(fs_->CreateDir(root_path_, /*recursive=*/true));
  }
}

/*
  Object key layout:

      <root_path>/<source>/<session>/<batch>.ndjson.gz
*/
std::string ObjectBatchStore::ObjectPath(const std::string& key) const {
  if (key.empty() || key.front() == '/' || key.find("..") != std::string::npos) {
    throw util::InvalidArgument("invalid storage key: " + key);
  }
  if (root_path_.empty()) {
    return key;
  }
  if (root_path_.back() == '/') {
    return root_path_ + key;
  }
  return root_path_ + "/" + key;
}

/*
  Upload buffer as object.
*/
void ObjectBatchStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  const auto path   = ObjectPath(key);
  const auto parent = path.rfind('/');
  if (parent != std::string::npos && parent > 0) {
    Unwrap(fs_->CreateDir(path.substr(0, parent), /*recursive=*/true));
  }

  auto out = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(out->Write(buffer->data(), buffer->size()));
  Unwrap(out->Close());
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ObjectBatchStore::Get(const std::string& key) {
  const auto path = ObjectPath(key);
  if (!Exists(key)) {
    throw util::NotFound("batch object not found: " + key);
  }
  auto input = Unwrap(fs_->OpenInputFile(path));
  return ReadAll(input);
}

bool ObjectBatchStore::Exists(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  return info.type() == arrow::fs::FileType::File;
}

uint64_t ObjectBatchStore::Size(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("batch object not found: " + key);
  }
  return static_cast<uint64_t>(info.size());
}

void ObjectBatchStore::Remove(const std::string& key) {
  Unwrap(fs_->DeleteFile(ObjectPath(key)));
}

} // namespace vigil::storage
