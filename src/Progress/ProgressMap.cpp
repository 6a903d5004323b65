#include "ProgressMap.hpp"

#include <algorithm>

namespace bucketdl {

void ProgressMap::set(const std::string& id, std::string status) {
  auto it = slots_.find(id);
  if (it == slots_.end()) {
    it = slots_.emplace(id, std::make_unique<Slot>()).first;
  }
  Slot& slot = *it->second;
  tbb::spin_mutex::scoped_lock lock(slot.mutex);
  slot.status = std::move(status);
}

std::optional<std::string> ProgressMap::get(const std::string& id) const {
  auto it = slots_.find(id);
  if (it == slots_.end()) return std::nullopt;
  const Slot& slot = *it->second;
  tbb::spin_mutex::scoped_lock lock(slot.mutex);
  return slot.status;
}

std::vector<ProgressMap::Entry> ProgressMap::snapshot() const {
  std::vector<Entry> entries;
  for (const auto& kv : slots_) {
    const Slot& slot = *kv.second;
    tbb::spin_mutex::scoped_lock lock(slot.mutex);
    entries.emplace_back(kv.first, slot.status);
  }
  std::sort(entries.begin(), entries.end());
  return entries;
}

}  // namespace bucketdl
