#include "upload_service.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace voicecode::upload {

using voicecode::observability::BoolField;
using voicecode::observability::IntField;
using voicecode::observability::StringField;

namespace fs = std::filesystem;

namespace {

constexpr const char* kNotConnected     = "Not connected to server";
constexpr const char* kNoStorage        = "No storage location configured";
constexpr const char* kFileNotFound     = "File not found";
constexpr const char* kFileTooLarge     = "File too large";
constexpr const char* kAlreadyUploading = "Upload already in progress";

} // namespace

const char* ToString(UploadItemStatus status) {
  switch (status) {
    case UploadItemStatus::kPending:   return "pending";
    case UploadItemStatus::kUploading: return "uploading";
    case UploadItemStatus::kCompleted: return "completed";
    case UploadItemStatus::kFailed:    return "failed";
  }
  return "unknown";
}

UploadService::UploadService(std::shared_ptr<Transport> transport, std::shared_ptr<AckCoordinator> coordinator,
                             const voicecode::runtime::config::UploadConfig& config)
    : transport_(std::move(transport)),
      coordinator_(std::move(coordinator)),
      timeout_(voicecode::util::FromProto(config.timeout())),
      connection_test_timeout_(voicecode::util::FromProto(config.connection_test_timeout())),
      max_payload_bytes_(config.max_payload_bytes()),
      storage_location_(config.storage_location()) {
  if (!transport_ || !coordinator_) {
    throw std::invalid_argument("UploadService requires a transport and a coordinator");
  }
  if (timeout_.count() <= 0 || max_payload_bytes_ == 0) {
    throw std::invalid_argument("upload config requires a positive timeout and payload limit");
  }
}

// ------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------

std::string UploadService::ReadPayload(const std::string& path, uint64_t max_bytes, uint64_t* size_bytes) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw voicecode::util::FileNotFound(path);
  }

  const auto size = fs::file_size(path, ec);
  if (ec) {
    throw voicecode::util::FileNotFound(path + ": " + ec.message());
  }
  *size_bytes = size;

  if (size > max_bytes) {
    throw voicecode::util::SizeLimitExceeded(path + ": " + std::to_string(size) + " bytes exceeds limit of " + std::to_string(max_bytes));
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw voicecode::util::FileNotFound(path);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void UploadService::Fail(Tracked& tracked, std::string error, bool retryable) {
  tracked.item.status    = UploadItemStatus::kFailed;
  tracked.item.error     = std::move(error);
  tracked.item.retryable = retryable;
  tracked.future.reset();
}

void UploadService::Apply(Tracked& tracked, const UploadOutcome& outcome) {
  switch (outcome.status) {
    case UploadStatus::kSucceeded:
      tracked.item.status        = UploadItemStatus::kCompleted;
      tracked.item.resolved_name = outcome.resolved_name;
      tracked.item.error.clear();
      tracked.item.retryable = false;
      tracked.future.reset();
      return;
    case UploadStatus::kRejected:
    case UploadStatus::kTimeout:
    case UploadStatus::kTransportFailure:
      Fail(tracked, outcome.message, true);
      return;
  }
}

void UploadService::StartLocked(Tracked& tracked) {
  auto& item = tracked.item;

  std::string content;
  try {
    content = ReadPayload(item.path, max_payload_bytes_, &item.size_bytes);
  } catch (const voicecode::util::FileNotFound& e) {
    VOICECODE_LOG_WARN("upload rejected, file not found", {StringField("upload_id", item.id), StringField("path", e.what())});
    Fail(tracked, kFileNotFound, false);
    return;
  } catch (const voicecode::util::SizeLimitExceeded& e) {
    VOICECODE_LOG_WARN("upload rejected, file too large", {StringField("upload_id", item.id), StringField("error", e.what())});
    Fail(tracked, kFileTooLarge, false);
    return;
  }

  voicecode::session::v1::UploadFile payload;
  payload.set_filename(item.filename);
  payload.set_content(std::move(content));
  payload.set_storage_location(storage_location_);

  item.status = UploadItemStatus::kUploading;
  item.error.clear();
  item.retryable = false;

  try {
    tracked.future = coordinator_->BeginRequest(item.filename, std::move(payload), timeout_).share();
  } catch (const voicecode::util::DuplicateKey& e) {
    VOICECODE_LOG_WARN("upload rejected, same file already uploading", {StringField("upload_id", item.id), StringField("error", e.what())});
    Fail(tracked, kAlreadyUploading, true);
  }
}

std::vector<std::string> UploadService::UploadFiles(const std::vector<std::string>& paths) {
  {
    std::lock_guard lock(mutex_);
    if (!transport_->IsConnected()) {
      last_error_ = kNotConnected;
      VOICECODE_LOG_WARN("upload refused", {StringField("reason", kNotConnected), IntField("files", static_cast<int64_t>(paths.size()))});
      return {};
    }
    if (storage_location_.empty()) {
      last_error_ = kNoStorage;
      VOICECODE_LOG_WARN("upload refused", {StringField("reason", kNoStorage), IntField("files", static_cast<int64_t>(paths.size()))});
      return {};
    }
    last_error_.reset();
  }

  std::vector<std::string> ids;
  ids.reserve(paths.size());
  for (const auto& path : paths) ids.push_back(UploadFile(path));
  return ids;
}

std::string UploadService::UploadFile(const std::string& path) {
  std::lock_guard lock(mutex_);

  Tracked tracked;
  tracked.item.id       = voicecode::util::GenerateUUIDString();
  tracked.item.path     = path;
  tracked.item.filename = fs::path(path).filename().string();

  StartLocked(tracked);

  VOICECODE_LOG_INFO("upload item created", {StringField("upload_id", tracked.item.id), StringField("filename", tracked.item.filename),
                                             StringField("status", ToString(tracked.item.status))});

  const auto id = tracked.item.id;
  items_.emplace(id, std::move(tracked));
  order_.push_back(id);
  return id;
}

bool UploadService::Retry(const std::string& upload_id) {
  std::lock_guard lock(mutex_);

  auto it = items_.find(upload_id);
  if (it == items_.end()) return false;

  auto& tracked = it->second;
  if (tracked.item.status != UploadItemStatus::kFailed || !tracked.item.retryable) {
    VOICECODE_LOG_DEBUG("upload not retryable", {StringField("upload_id", upload_id), StringField("status", ToString(tracked.item.status))});
    return false;
  }

  VOICECODE_LOG_INFO("retrying upload", {StringField("upload_id", upload_id), StringField("filename", tracked.item.filename)});
  StartLocked(tracked);
  return true;
}

// ------------------------------------------------------------
// Completion
// ------------------------------------------------------------

std::size_t UploadService::Poll() {
  std::lock_guard lock(mutex_);

  std::size_t changed = 0;
  for (auto& [id, tracked] : items_) {
    if (tracked.item.status != UploadItemStatus::kUploading || !tracked.future) continue;
    if (tracked.future->wait_for(std::chrono::seconds(0)) != std::future_status::ready) continue;

    try {
      Apply(tracked, tracked.future->get());
    } catch (const std::future_error& e) {
      Fail(tracked, e.what(), true);
    }

    VOICECODE_LOG_INFO("upload finished", {StringField("upload_id", id), StringField("status", ToString(tracked.item.status)),
                                           StringField("error", tracked.item.error), BoolField("retryable", tracked.item.retryable)});
    ++changed;
  }
  return changed;
}

std::optional<UploadItem> UploadService::Wait(const std::string& upload_id, std::chrono::milliseconds wait) {
  std::optional<std::shared_future<UploadOutcome>> future;
  {
    std::lock_guard lock(mutex_);
    auto it = items_.find(upload_id);
    if (it == items_.end()) return std::nullopt;
    future = it->second.future;
  }

  if (future) future->wait_for(wait);
  Poll();
  return Item(upload_id);
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::optional<UploadItem> UploadService::Item(const std::string& upload_id) const {
  std::lock_guard lock(mutex_);
  auto it = items_.find(upload_id);
  if (it == items_.end()) return std::nullopt;
  return it->second.item;
}

std::vector<UploadItem> UploadService::Items() const {
  std::lock_guard lock(mutex_);
  std::vector<UploadItem> out;
  out.reserve(order_.size());
  for (const auto& id : order_) out.push_back(items_.at(id).item);
  return out;
}

UploadProgress UploadService::Progress() const {
  std::lock_guard lock(mutex_);
  UploadProgress progress;
  progress.total = items_.size();
  for (const auto& [_, tracked] : items_) {
    switch (tracked.item.status) {
      case UploadItemStatus::kUploading: ++progress.uploading; break;
      case UploadItemStatus::kCompleted: ++progress.completed; break;
      case UploadItemStatus::kFailed:    ++progress.failed; break;
      case UploadItemStatus::kPending:   break;
    }
  }
  return progress;
}

std::size_t UploadService::ClearCompleted() {
  std::lock_guard lock(mutex_);
  std::size_t removed = 0;
  for (auto it = items_.begin(); it != items_.end();) {
    if (it->second.item.status != UploadItemStatus::kCompleted) {
      ++it;
      continue;
    }
    it = items_.erase(it);
    ++removed;
  }
  order_.erase(std::remove_if(order_.begin(), order_.end(), [&](const std::string& id) { return !items_.count(id); }), order_.end());
  return removed;
}

std::size_t UploadService::ClearFailed() {
  std::lock_guard lock(mutex_);
  std::size_t removed = 0;
  for (auto it = items_.begin(); it != items_.end();) {
    if (it->second.item.status != UploadItemStatus::kFailed) {
      ++it;
      continue;
    }
    it = items_.erase(it);
    ++removed;
  }
  order_.erase(std::remove_if(order_.begin(), order_.end(), [&](const std::string& id) { return !items_.count(id); }), order_.end());
  return removed;
}

std::optional<std::string> UploadService::LastError() const {
  std::lock_guard lock(mutex_);
  return last_error_;
}

} // namespace voicecode::upload
