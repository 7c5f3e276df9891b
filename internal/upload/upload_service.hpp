#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ack_coordinator.hpp"
#include "config/config.pb.h"
#include "transport.hpp"

namespace voicecode::upload {

enum class UploadItemStatus { kPending, kUploading, kCompleted, kFailed };

const char* ToString(UploadItemStatus status);

struct UploadItem {
  std::string id;
  std::string path;
  std::string filename;
  uint64_t    size_bytes = 0;

  UploadItemStatus status = UploadItemStatus::kPending;

  // set on completion
  std::string resolved_name;

  // set on failure
  std::string error;
  bool        retryable = false;
};

struct UploadProgress {
  std::size_t total     = 0;
  std::size_t uploading = 0;
  std::size_t completed = 0;
  std::size_t failed    = 0;
};

/*
  Caller side of file uploads.

  Validates files before anything is registered with the coordinator, keeps
  one UploadItem per file, and folds finished acknowledgments into item
  status on Poll(). Nothing is retried automatically; Retry() re-sends a
  failed item under its original key.
*/
class UploadService {
 public:
  UploadService(std::shared_ptr<Transport> transport, std::shared_ptr<AckCoordinator> coordinator,
                const voicecode::runtime::config::UploadConfig& config);

  // Empty when the transport is down or no storage location is configured;
  // LastError() says why.
  std::vector<std::string> UploadFiles(const std::vector<std::string>& paths);

  // Always returns an item id; the item is Failed if validation rejected it.
  std::string UploadFile(const std::string& path);

  // Folds finished acknowledgments into item status. Returns how many
  // items changed.
  std::size_t Poll();

  // Blocks until the item leaves Uploading or the wait elapses.
  std::optional<UploadItem> Wait(const std::string& upload_id, std::chrono::milliseconds wait);

  std::optional<UploadItem> Item(const std::string& upload_id) const;
  std::vector<UploadItem>   Items() const;
  UploadProgress            Progress() const;

  std::size_t ClearCompleted();
  std::size_t ClearFailed();

  // False unless the item is Failed and retryable.
  bool Retry(const std::string& upload_id);

  std::optional<std::string> LastError() const;

  std::chrono::milliseconds ConnectionTestTimeout() const {
    return connection_test_timeout_;
  }

  std::chrono::milliseconds Timeout() const {
    return timeout_;
  }

 private:
  struct Tracked {
    UploadItem                                       item;
    std::optional<std::shared_future<UploadOutcome>> future;
  };

  // Validates, reads and dispatches; updates `tracked` in place.
  void StartLocked(Tracked& tracked);

  // Throws util::FileNotFound or util::SizeLimitExceeded.
  static std::string ReadPayload(const std::string& path, uint64_t max_bytes, uint64_t* size_bytes);

  static void Fail(Tracked& tracked, std::string error, bool retryable);
  static void Apply(Tracked& tracked, const UploadOutcome& outcome);

  std::shared_ptr<Transport>      transport_;
  std::shared_ptr<AckCoordinator> coordinator_;

  std::chrono::milliseconds timeout_;
  std::chrono::milliseconds connection_test_timeout_;
  uint64_t                  max_payload_bytes_;
  std::string               storage_location_;

  mutable std::mutex             mutex_;
  std::map<std::string, Tracked> items_;
  std::vector<std::string>       order_;
  std::optional<std::string>     last_error_;
};

} // namespace voicecode::upload
