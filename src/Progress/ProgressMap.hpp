#ifndef BUCKETDL_PROGRESS_MAP_HPP_
#define BUCKETDL_PROGRESS_MAP_HPP_

#include <tbb/concurrent_unordered_map.h>
#include <tbb/spin_mutex.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bucketdl {

// Task id -> latest status line. Writers and the renderer may run
// concurrently; concurrent_unordered_map allows insertion during traversal
// and each slot carries its own lock for the string itself.
class ProgressMap {
 public:
  using Entry = std::pair<std::string, std::string>;

  ProgressMap() = default;
  ProgressMap(const ProgressMap&) = delete;
  ProgressMap& operator=(const ProgressMap&) = delete;

  void set(const std::string& id, std::string status);
  std::optional<std::string> get(const std::string& id) const;

  // Entries sorted by id.
  std::vector<Entry> snapshot() const;
  size_t size() const { return slots_.size(); }

 private:
  struct Slot {
    mutable tbb::spin_mutex mutex;
    std::string status;
  };

  tbb::concurrent_unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

}  // namespace bucketdl

#endif  // BUCKETDL_PROGRESS_MAP_HPP_
