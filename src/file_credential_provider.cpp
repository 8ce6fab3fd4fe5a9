#include "file_credential_provider.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>

namespace {

int64_t system_epoch_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

FileCredentialProvider::FileCredentialProvider(std::filesystem::path token_file,
                                               std::shared_ptr<Logger> logger)
  : token_file_(std::move(token_file)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("credentials")),
    now_(system_epoch_seconds) {}

std::optional<Credential> FileCredentialProvider::get_credential() {
  std::error_code ec;
  if(!std::filesystem::exists(token_file_, ec)) {
    logger_->warn("Credential file '{}' not found; authentication is required", token_file_.string());
    return std::nullopt;
  }

  Credential credential;
  try {
    std::ifstream in(token_file_);
    if(!in) {
      logger_->warn("Unable to open credential file '{}'", token_file_.string());
      return std::nullopt;
    }
    nlohmann::json data;
    in >> data;
    if(!data.is_object()) {
      throw std::runtime_error("expected a JSON object");
    }
    credential.access_token = data.value("access_token", std::string());
    credential.expires_at = data.value("expires_at", static_cast<int64_t>(0));
  } catch(const std::exception& e) {
    logger_->warn("Credential file '{}' is corrupt or invalid: {}. Authentication will be requested again.",
                  token_file_.string(), e.what());
    std::filesystem::remove(token_file_, ec);
    if(ec) {
      logger_->error("Unable to remove '{}': {}", token_file_.string(), ec.message());
    }
    return std::nullopt;
  }

  if(credential.access_token.empty()) {
    logger_->warn("Credential file '{}' holds no access token", token_file_.string());
    return std::nullopt;
  }
  if(credential.expires_at > 0 && credential.expires_at <= now_()) {
    logger_->warn("Access token in '{}' expired", token_file_.string());
    return std::nullopt;
  }
  return credential;
}

bool FileCredentialProvider::store(const Credential& credential, std::string& error) {
  std::error_code ec;
  if(token_file_.has_parent_path()) {
    std::filesystem::create_directories(token_file_.parent_path(), ec);
  }
  nlohmann::json data{{"access_token", credential.access_token}};
  if(credential.expires_at > 0) data["expires_at"] = credential.expires_at;

  std::ofstream out(token_file_, std::ios::trunc);
  if(!out) {
    error = "unable to write " + token_file_.string();
    return false;
  }
  out << data.dump(2);
  if(!out) {
    error = "write failed for " + token_file_.string();
    return false;
  }
  logger_->info("Credentials saved to '{}'", token_file_.string());
  return true;
}
