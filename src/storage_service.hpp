#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

struct Credential {
  std::string access_token;
  int64_t expires_at = 0;   // epoch seconds, 0 = no expiry
};

class CredentialProvider {
public:
  virtual ~CredentialProvider() = default;
  // May be slow; nullopt when no usable credential exists.
  virtual std::optional<Credential> get_credential() = 0;
};

struct UploadMetadata {
  std::string name;
  std::string container_id;
  std::string mime_type;
};

// Result of one chunk request: progress so far, or the terminal remote file.
struct ChunkStatus {
  bool complete = false;
  uint64_t bytes_done = 0;
  uint64_t bytes_total = 0;
  std::string remote_id;
  std::string view_link;
};

class UploadSession {
public:
  virtual ~UploadSession() = default;
  // Transfers the next chunk. Throws on transfer errors.
  virtual ChunkStatus next_chunk() = 0;
  virtual uint64_t total_bytes() const = 0;
};

class StorageService {
public:
  virtual ~StorageService() = default;
  // Throws when the session cannot be opened (unreadable file, rejected credential).
  virtual std::unique_ptr<UploadSession> create_upload_session(const Credential& credential,
                                                               const UploadMetadata& metadata,
                                                               const std::filesystem::path& local_file) = 0;
};
