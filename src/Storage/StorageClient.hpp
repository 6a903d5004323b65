#ifndef BUCKETDL_STORAGE_CLIENT_HPP_
#define BUCKETDL_STORAGE_CLIENT_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace bucketdl {

using TransferOptions = std::map<std::string, std::string>;

// Receives the number of bytes written since the previous call.
using ProgressCallback = std::function<void(uint64_t)>;

class StorageError : public std::runtime_error {
 public:
  enum class Kind { NotFound, Transport, Transfer, Config };

  StorageError(Kind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }
  const char* kindName() const {
    switch (kind_) {
      case Kind::NotFound:
        return "NotFound";
      case Kind::Transport:
        return "TransportError";
      case Kind::Transfer:
        return "TransferError";
      case Kind::Config:
        return "ConfigError";
    }
    return "StorageError";
  }

 private:
  Kind kind_;
};

// Handle to an object store. One instance is used by one thread at a time.
class StorageClient {
 public:
  virtual ~StorageClient() = default;

  // Content length of bucket/key. Throws StorageError (NotFound, Transport).
  virtual uint64_t headObject(const std::string& bucket,
                              const std::string& key) = 0;

  // Writes bucket/key to destination. Throws StorageError (Transfer).
  virtual void downloadFile(const std::string& bucket, const std::string& key,
                            const std::string& destination,
                            const TransferOptions& options,
                            const ProgressCallback& progress) = 0;
};

using ClientFactory = std::function<std::unique_ptr<StorageClient>()>;

}  // namespace bucketdl

#endif  // BUCKETDL_STORAGE_CLIENT_HPP_
