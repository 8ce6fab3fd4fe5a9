#pragma once

#include <filesystem>
#include <functional>
#include <memory>

#include "log.hpp"
#include "storage_service.hpp"

// Reads {"access_token": "...", "expires_at": <epoch seconds>} from disk.
// A corrupt token file is removed so that a fresh one can be provisioned.
class FileCredentialProvider : public CredentialProvider {
public:
  explicit FileCredentialProvider(std::filesystem::path token_file,
                                  std::shared_ptr<Logger> logger = nullptr);

  std::optional<Credential> get_credential() override;

  // Persists a credential obtained elsewhere.
  bool store(const Credential& credential, std::string& error);

  void set_clock(std::function<int64_t()> now_epoch_seconds) { now_ = std::move(now_epoch_seconds); }
  const std::filesystem::path& token_file() const { return token_file_; }

private:
  std::filesystem::path token_file_;
  std::shared_ptr<Logger> logger_;
  std::function<int64_t()> now_;
};
