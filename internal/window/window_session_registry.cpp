#include "window_session_registry.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace voicecode::window {

using voicecode::observability::IntField;
using voicecode::observability::StringField;

namespace {

int64_t AsInt(WindowId window) {
  return static_cast<int64_t>(window);
}

} // namespace

WindowSessionRegistry::WindowSessionRegistry(std::shared_ptr<WindowPresenter> presenter) : presenter_(std::move(presenter)) {
}

// ------------------------------------------------------------
// Detached set
// ------------------------------------------------------------

std::set<std::string> WindowSessionRegistry::ComputeDetachedLocked() const {
  std::set<std::string> detached;
  for (const auto& [session_id, window] : claims_) {
    if (!main_window_ || window != *main_window_) detached.insert(session_id);
  }
  return detached;
}

std::optional<WindowSessionRegistry::Publication> WindowSessionRegistry::CommitLocked() {
  auto detached = ComputeDetachedLocked();
  if (detached == detached_) return std::nullopt;

  detached_ = detached;
  return Publication{++version_, std::move(detached)};
}

void WindowSessionRegistry::Publish(std::optional<Publication> publication) {
  if (!publication || !presenter_) return;

  {
    std::lock_guard lock(notify_mutex_);
    // a later commit already went out or is queued; this one is stale
    if (publication->version <= delivered_version_) return;
    if (pending_ && pending_->version >= publication->version) return;

    pending_ = std::move(publication);
    if (draining_) return;
    draining_ = true;
  }

  for (;;) {
    Publication next;
    {
      std::lock_guard lock(notify_mutex_);
      if (!pending_) {
        draining_ = false;
        return;
      }
      next = std::move(*pending_);
      pending_.reset();
      delivered_version_ = next.version;
    }

    VOICECODE_LOG_DEBUG("detached sessions changed", {IntField("count", static_cast<int64_t>(next.detached.size()))});
    try {
      presenter_->OnDetachedSessionsChanged(next.detached);
    } catch (const std::exception& e) {
      VOICECODE_LOG_ERROR("detached sessions presenter failed", {IntField("version", static_cast<int64_t>(next.version)), StringField("error", e.what())});
    }
  }
}

// ------------------------------------------------------------
// Claims
// ------------------------------------------------------------

ClaimResult WindowSessionRegistry::Claim(const std::string& session_id, WindowId window) {
  ClaimResult                result{ClaimResult::Kind::kClaimed, window};
  std::optional<Publication> publication;
  {
    std::lock_guard lock(mutex_);

    auto it = claims_.find(session_id);
    if (it != claims_.end() && it->second != window) {
      VOICECODE_LOG_INFO("session claimed by another window, redirecting",
                         {StringField("session_id", session_id), IntField("window", AsInt(window)), IntField("holder", AsInt(it->second))});
      return {ClaimResult::Kind::kRedirected, it->second};
    }

    if (!main_window_) {
      main_window_ = window;
      VOICECODE_LOG_INFO("main window designated by first claim", {IntField("window", AsInt(window))});
    }

    claims_[session_id] = window;
    publication         = CommitLocked();

    VOICECODE_LOG_DEBUG("session claimed", {StringField("session_id", session_id), IntField("window", AsInt(window))});
  }

  Publish(std::move(publication));
  return result;
}

bool WindowSessionRegistry::TrySelect(const std::string& session_id, WindowId window) {
  const auto result = Claim(session_id, window);
  if (result.Claimed()) return true;

  if (presenter_) presenter_->BringToFront(result.holder);
  return false;
}

void WindowSessionRegistry::Release(const std::string& session_id) {
  std::optional<Publication> publication;
  {
    std::lock_guard lock(mutex_);
    if (claims_.erase(session_id) == 0) return;

    publication = CommitLocked();
    VOICECODE_LOG_DEBUG("session released", {StringField("session_id", session_id)});
  }
  Publish(std::move(publication));
}

std::size_t WindowSessionRegistry::ReleaseAll(WindowId window) {
  std::size_t                released = 0;
  std::optional<Publication> publication;
  {
    std::lock_guard lock(mutex_);

    for (auto it = claims_.begin(); it != claims_.end();) {
      if (it->second != window) {
        ++it;
        continue;
      }
      it = claims_.erase(it);
      ++released;
    }

    if (main_window_ && *main_window_ == window) {
      main_window_.reset();
      VOICECODE_LOG_INFO("main window closed", {IntField("window", AsInt(window))});
    }

    publication = CommitLocked();
    VOICECODE_LOG_INFO("window released its sessions", {IntField("window", AsInt(window)), IntField("released", static_cast<int64_t>(released))});
  }

  Publish(std::move(publication));
  return released;
}

void WindowSessionRegistry::SetMainWindow(WindowId window) {
  std::optional<Publication> publication;
  {
    std::lock_guard lock(mutex_);
    if (main_window_ && *main_window_ == window) return;

    main_window_ = window;
    publication  = CommitLocked();
    VOICECODE_LOG_INFO("main window set", {IntField("window", AsInt(window))});
  }
  Publish(std::move(publication));
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

bool WindowSessionRegistry::IsDetached(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  return detached_.count(session_id) != 0;
}

bool WindowSessionRegistry::IsClaimed(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  return claims_.count(session_id) != 0;
}

std::optional<WindowId> WindowSessionRegistry::WindowFor(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto it = claims_.find(session_id);
  if (it == claims_.end()) return std::nullopt;
  return it->second;
}

std::optional<WindowId> WindowSessionRegistry::MainWindow() const {
  std::lock_guard lock(mutex_);
  return main_window_;
}

std::vector<std::string> WindowSessionRegistry::ClaimedSessions() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> sessions;
  sessions.reserve(claims_.size());
  for (const auto& [session_id, _] : claims_) sessions.push_back(session_id);
  std::sort(sessions.begin(), sessions.end());
  return sessions;
}

std::set<std::string> WindowSessionRegistry::DetachedSessions() const {
  std::lock_guard lock(mutex_);
  return detached_;
}

} // namespace voicecode::window
