#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>

#include "log.hpp"
#include "storage_service.hpp"

// Resumable chunk protocol over a local directory tree:
// <root>/<container>/<name> is written through a per-session "<name>.<hex>.part"
// file and linked into place when the last chunk lands. Same-name uploads get
// "<stem>-<id8><ext>" instead of overwriting. A "<name>.json" sidecar records
// the remote metadata.
class LocalStorageService : public StorageService {
public:
  LocalStorageService(std::filesystem::path root,
                      std::size_t chunk_size,
                      std::shared_ptr<Logger> logger = nullptr);

  std::unique_ptr<UploadSession> create_upload_session(const Credential& credential,
                                                       const UploadMetadata& metadata,
                                                       const std::filesystem::path& local_file) override;

  const std::filesystem::path& root() const { return root_; }
  std::size_t chunk_size() const { return chunk_size_; }

  static std::string mime_type_for(const std::filesystem::path& path);

private:
  std::filesystem::path root_;
  std::size_t chunk_size_;
  std::shared_ptr<Logger> logger_;
};
