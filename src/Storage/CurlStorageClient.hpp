#ifndef BUCKETDL_CURL_STORAGE_CLIENT_HPP_
#define BUCKETDL_CURL_STORAGE_CLIENT_HPP_

#include <curl/curl.h>

#include <memory>
#include <string>

#include "Config/SpacesConfig.hpp"
#include "StorageClient.hpp"
#include "utils/logger.hpp"

namespace bucketdl {

// Initialises libcurl once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

/**
 * @brief StorageClient speaking the S3 REST API through one libcurl handle.
 *
 * URLs are path-style (endpoint/bucket/key). Requests are signed with
 * libcurl's AWS SigV4 support whenever ACCESS_KEY and SECRET_KEY are set.
 */
class CurlStorageClient : public StorageClient {
 public:
  CurlStorageClient(const SpacesConfig& config, utils::LoggerPtr logger);
  ~CurlStorageClient() override;

  CurlStorageClient(const CurlStorageClient&) = delete;
  CurlStorageClient& operator=(const CurlStorageClient&) = delete;

  uint64_t headObject(const std::string& bucket,
                      const std::string& key) override;

  void downloadFile(const std::string& bucket, const std::string& key,
                    const std::string& destination,
                    const TransferOptions& options,
                    const ProgressCallback& progress) override;

  std::string objectUrl(const std::string& bucket, const std::string& key,
                        const TransferOptions& options = {}) const;

 private:
  using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
  using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

  void prepare();
  HeaderList buildHeaders(const TransferOptions& options) const;

  std::string endpoint_;
  std::string region_;
  std::string accessKey_;
  std::string secretKey_;
  CurlHandle curl_;
  utils::LoggerPtr logger_;
};

}  // namespace bucketdl

#endif  // BUCKETDL_CURL_STORAGE_CLIENT_HPP_
