#include "local_storage_service.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "utils.hpp"

namespace {

class LocalUploadSession : public UploadSession {
public:
  LocalUploadSession(std::filesystem::path source,
                     std::filesystem::path destination,
                     UploadMetadata metadata,
                     std::size_t chunk_size,
                     std::shared_ptr<Logger> logger)
    : source_path_(std::move(source)),
      destination_(std::move(destination)),
      partial_(destination_.string() + "." + random_hex(8) + ".part"),
      metadata_(std::move(metadata)),
      chunk_size_(chunk_size),
      logger_(std::move(logger)) {
    in_.open(source_path_, std::ios::binary);
    if(!in_) {
      throw std::runtime_error("cannot open " + source_path_.string() + " for upload");
    }
    std::error_code ec;
    total_ = std::filesystem::file_size(source_path_, ec);
    if(ec) {
      throw std::runtime_error("cannot stat " + source_path_.string() + ": " + ec.message());
    }
    out_.open(partial_, std::ios::binary | std::ios::trunc);
    if(!out_) {
      throw std::runtime_error("cannot create " + partial_.string());
    }
    buffer_.resize(chunk_size_);
  }

  ~LocalUploadSession() override {
    if(!finished_) {
      out_.close();
      std::error_code ec;
      std::filesystem::remove(partial_, ec);
    }
  }

  ChunkStatus next_chunk() override {
    if(finished_) {
      throw std::logic_error("upload session already complete");
    }

    in_.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    const auto got = in_.gcount();
    if(got < 0 || (got == 0 && !in_.eof())) {
      throw std::runtime_error("read failed on " + source_path_.string());
    }
    if(got > 0) {
      out_.write(buffer_.data(), got);
      if(!out_) {
        throw std::runtime_error("write failed on " + partial_.string());
      }
      done_ += static_cast<uint64_t>(got);
    }

    ChunkStatus status;
    status.bytes_done = done_;
    status.bytes_total = total_;
    if(done_ < total_ && !in_.eof()) {
      return status;
    }
    return commit(status);
  }

  uint64_t total_bytes() const override { return total_; }

private:
  ChunkStatus commit(ChunkStatus status) {
    out_.close();
    if(!out_) {
      throw std::runtime_error("flush failed on " + partial_.string());
    }

    status.complete = true;
    status.remote_id = random_hex(16);
    destination_ = publish(status.remote_id);
    finished_ = true;
    status.view_link = "file://" + std::filesystem::absolute(destination_).string();

    nlohmann::json sidecar{
      {"id", status.remote_id},
      {"name", destination_.filename().string()},
      {"container", metadata_.container_id},
      {"size", done_},
      {"mime_type", metadata_.mime_type}
    };
    std::ofstream meta(destination_.string() + ".json", std::ios::trunc);
    if(meta) {
      meta << sidecar.dump(2);
    } else {
      logger_->warn("Unable to write metadata for {}", destination_.string());
    }
    logger_->info("Stored '{}' ({}) as {}", metadata_.name, human_readable_size(static_cast<double>(done_)), status.remote_id);
    return status;
  }

  // Links the partial file under the wanted name, or under "<stem>-<id8><ext>"
  // when another upload already holds that name. Never replaces a stored file.
  std::filesystem::path publish(const std::string& remote_id) {
    std::error_code ec;
    std::filesystem::create_hard_link(partial_, destination_, ec);
    auto published = destination_;
    if(ec == std::errc::file_exists) {
      published = destination_.parent_path() /
        (destination_.stem().string() + "-" + remote_id.substr(0, 8) + destination_.extension().string());
      logger_->info("'{}' already stored, keeping this upload as '{}'",
                    destination_.filename().string(), published.filename().string());
      ec.clear();
      std::filesystem::create_hard_link(partial_, published, ec);
    }
    if(ec) {
      throw std::runtime_error("cannot publish " + published.string() + ": " + ec.message());
    }
    if(!std::filesystem::remove(partial_, ec) || ec) {
      logger_->warn("Could not remove {}: {}", partial_.string(), ec ? ec.message() : "missing");
    }
    return published;
  }

  std::filesystem::path source_path_;
  std::filesystem::path destination_;
  std::filesystem::path partial_;
  UploadMetadata metadata_;
  std::size_t chunk_size_;
  std::shared_ptr<Logger> logger_;
  std::ifstream in_;
  std::ofstream out_;
  std::vector<char> buffer_;
  uint64_t total_ = 0;
  uint64_t done_ = 0;
  bool finished_ = false;
};

} // namespace

LocalStorageService::LocalStorageService(std::filesystem::path root,
                                         std::size_t chunk_size,
                                         std::shared_ptr<Logger> logger)
  : root_(std::move(root)),
    chunk_size_(chunk_size == 0 ? 5 * 1024 * 1024 : chunk_size),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("storage")) {}

std::string LocalStorageService::mime_type_for(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if(ext == ".mp4" || ext == ".m4v") return "video/mp4";
  if(ext == ".mkv") return "video/x-matroska";
  if(ext == ".webm") return "video/webm";
  if(ext == ".mp3") return "audio/mpeg";
  if(ext == ".m4a") return "audio/mp4";
  return "application/octet-stream";
}

std::unique_ptr<UploadSession> LocalStorageService::create_upload_session(const Credential& credential,
                                                                          const UploadMetadata& metadata,
                                                                          const std::filesystem::path& local_file) {
  if(credential.access_token.empty()) {
    throw std::runtime_error("storage rejected the session: missing access token");
  }
  if(metadata.name.empty() || metadata.name.find('/') != std::string::npos) {
    throw std::runtime_error("invalid remote name '" + metadata.name + "'");
  }

  auto container = root_ / (metadata.container_id.empty() ? std::string("default") : metadata.container_id);
  std::filesystem::create_directories(container);

  UploadMetadata effective = metadata;
  if(effective.mime_type.empty()) effective.mime_type = mime_type_for(local_file);

  logger_->debug("Opening upload session for '{}' into {}", effective.name, container.string());
  return std::make_unique<LocalUploadSession>(local_file,
                                              container / effective.name,
                                              effective,
                                              chunk_size_,
                                              logger_);
}
