#include "bsld/services/open_document_tracker.hpp"

#include <algorithm>

namespace bsld::services {

auto OpenDocumentTracker::Add(const std::string& uri, int version) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  open_documents_.insert_or_assign(uri, version);
}

auto OpenDocumentTracker::Update(const std::string& uri, int version) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = open_documents_.find(uri);
  if (it != open_documents_.end()) {
    it->second = std::max(it->second, version);
  }
}

auto OpenDocumentTracker::Remove(const std::string& uri) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  open_documents_.erase(uri);
}

auto OpenDocumentTracker::Contains(const std::string& uri) const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_documents_.contains(uri);
}

auto OpenDocumentTracker::GetVersion(const std::string& uri) const
    -> std::optional<int> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = open_documents_.find(uri);
  if (it == open_documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto OpenDocumentTracker::GetOpenUris() const -> std::vector<std::string> {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> uris;
  uris.reserve(open_documents_.size());
  for (const auto& [uri, version] : open_documents_) {
    uris.push_back(uri);
  }
  std::ranges::sort(uris);
  return uris;
}

auto OpenDocumentTracker::Clear() -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  open_documents_.clear();
}

auto OpenDocumentTracker::Size() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_documents_.size();
}

}  // namespace bsld::services
