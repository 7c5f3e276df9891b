#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "window_presenter.hpp"

namespace voicecode::window {

struct ClaimResult {
  enum class Kind { kClaimed, kRedirected };

  Kind     kind;
  WindowId holder; // the claiming window on kClaimed

  bool Claimed() const {
    return kind == Kind::kClaimed;
  }
};

/*
  Which window shows which session.

  session -> window is a function: a session is claimed by at most one
  window. A conflicting claim is refused and redirected to the holder.
  Sessions claimed by a window other than the main window are "detached".

  Claims live for the process only and are never persisted.

  Presenter notifications arrive in commit order, one at a time. A commit
  made while another thread is delivering is delivered by that thread; a
  superseded set is skipped.
*/
class WindowSessionRegistry {
 public:
  explicit WindowSessionRegistry(std::shared_ptr<WindowPresenter> presenter = nullptr);

  ClaimResult Claim(const std::string& session_id, WindowId window);

  // Claim, and on redirect bring the holder forward. True if `window` now
  // holds the session.
  bool TrySelect(const std::string& session_id, WindowId window);

  void Release(const std::string& session_id);

  // Window closed. Clears the main designation if it was main.
  std::size_t ReleaseAll(WindowId window);

  void SetMainWindow(WindowId window);

  bool                    IsDetached(const std::string& session_id) const;
  bool                    IsClaimed(const std::string& session_id) const;
  std::optional<WindowId> WindowFor(const std::string& session_id) const;
  std::optional<WindowId> MainWindow() const;
  std::vector<std::string> ClaimedSessions() const;
  std::set<std::string>    DetachedSessions() const;

 private:
  struct Publication {
    uint64_t              version = 0;
    std::set<std::string> detached;
  };

  std::set<std::string> ComputeDetachedLocked() const;

  // Recomputes the detached set; returns it when it changed.
  std::optional<Publication> CommitLocked();

  // Hands the publication to whichever thread is already delivering, or
  // becomes that thread. The presenter is called with no lock held.
  void Publish(std::optional<Publication> publication);

  std::shared_ptr<WindowPresenter> presenter_;

  mutable std::mutex                        mutex_;
  std::unordered_map<std::string, WindowId> claims_;
  std::optional<WindowId>                   main_window_;
  std::set<std::string>                     detached_;
  uint64_t                                  version_ = 0;

  std::mutex                 notify_mutex_;
  std::optional<Publication> pending_;
  uint64_t                   delivered_version_ = 0;
  bool                       draining_          = false;
};

} // namespace voicecode::window
