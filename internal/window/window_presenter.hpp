#pragma once

#include <cstdint>
#include <set>
#include <string>

namespace voicecode::window {

// Opaque handle of a window owned by the UI layer. Never dereferenced here.
using WindowId = uint64_t;

/*
  UI-side collaborator of WindowSessionRegistry. Called without any
  registry lock held; implementations may call back into the registry.
*/
class WindowPresenter {
 public:
  virtual ~WindowPresenter() = default;

  virtual void BringToFront(WindowId window) = 0;

  virtual void OnDetachedSessionsChanged(const std::set<std::string>& detached) = 0;
};

} // namespace voicecode::window
