#include "CurlStorageClient.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace bucketdl {

namespace {

// Transfer options understood by downloadFile and the header they map to.
const std::map<std::string, std::string>& headerOptions() {
  static const std::map<std::string, std::string> options = {
      {"RequestPayer", "x-amz-request-payer"},
      {"SSECustomerAlgorithm",
       "x-amz-server-side-encryption-customer-algorithm"},
      {"SSECustomerKey", "x-amz-server-side-encryption-customer-key"},
      {"SSECustomerKeyMD5", "x-amz-server-side-encryption-customer-key-MD5"},
  };
  return options;
}

struct WriteContext {
  std::ofstream* out;
  const ProgressCallback* progress;
  uint64_t written;
  bool writeFailed;
  std::exception_ptr callbackError;
};

size_t writeData(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<WriteContext*>(userdata);
  const size_t total = size * nmemb;
  if (total == 0) return 0;

  ctx->out->write(ptr, static_cast<std::streamsize>(total));
  if (!*ctx->out) {
    ctx->writeFailed = true;
    return 0;
  }
  ctx->written += total;

  if (ctx->progress && *ctx->progress) {
    // never let an exception unwind through libcurl
    try {
      (*ctx->progress)(total);
    } catch (...) {
      ctx->callbackError = std::current_exception();
      return 0;
    }
  }
  return total;
}

std::string escapeSegment(CURL* curl, const std::string& segment) {
  char* escaped =
      curl_easy_escape(curl, segment.c_str(), static_cast<int>(segment.size()));
  if (!escaped) {
    throw StorageError(StorageError::Kind::Transport,
                       "Failed to escape key segment: " + segment);
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

}  // namespace

void ensureCurlInitialized() {
  static std::once_flag flag;
  std::call_once(flag, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("Failed to initialize libcurl");
    }
    std::atexit([] { curl_global_cleanup(); });
  });
}

CurlStorageClient::CurlStorageClient(const SpacesConfig& config,
                                     utils::LoggerPtr logger)
    : endpoint_(config.endpointUrl()),
      region_(config.regionName()),
      accessKey_(config.accessKey()),
      secretKey_(config.secretKey()),
      curl_(nullptr, &curl_easy_cleanup),
      logger_(std::move(logger)) {
  if (endpoint_.empty()) {
    throw StorageError(StorageError::Kind::Config,
                       "ENDPOINT is not configured");
  }
  while (!endpoint_.empty() && endpoint_.back() == '/') endpoint_.pop_back();
  if (endpoint_.find("://") == std::string::npos) {
    endpoint_ = "https://" + endpoint_;
  }
  if (region_.empty()) region_ = "us-east-1";

  try {
    ensureCurlInitialized();
  } catch (const std::runtime_error& e) {
    throw StorageError(StorageError::Kind::Config, e.what());
  }
  curl_.reset(curl_easy_init());
  if (!curl_) {
    throw StorageError(StorageError::Kind::Config, "curl_easy_init failed");
  }
  if (accessKey_.empty() || secretKey_.empty()) {
    LOG(logger_, WARN) << "[CurlStorageClient] No credentials configured, "
                          "requests to "
                       << endpoint_ << " will be unsigned";
  }
}

CurlStorageClient::~CurlStorageClient() = default;

std::string CurlStorageClient::objectUrl(const std::string& bucket,
                                         const std::string& key,
                                         const TransferOptions& options) const {
  std::string url = endpoint_ + "/" + escapeSegment(curl_.get(), bucket);
  size_t begin = 0;
  while (begin <= key.size()) {
    auto end = key.find('/', begin);
    if (end == std::string::npos) end = key.size();
    url += "/" + escapeSegment(curl_.get(), key.substr(begin, end - begin));
    begin = end + 1;
  }
  auto version = options.find("VersionId");
  if (version != options.end()) {
    url += "?versionId=" + escapeSegment(curl_.get(), version->second);
  }
  return url;
}

void CurlStorageClient::prepare() {
  CURL* curl = curl_.get();
  curl_easy_reset(curl);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  // worker threads must not receive SIGALRM from the resolver
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (!accessKey_.empty() && !secretKey_.empty()) {
    std::string provider = "aws:amz:" + region_ + ":s3";
    curl_easy_setopt(curl, CURLOPT_AWS_SIGV4, provider.c_str());
    curl_easy_setopt(curl, CURLOPT_USERNAME, accessKey_.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, secretKey_.c_str());
  }
}

CurlStorageClient::HeaderList CurlStorageClient::buildHeaders(
    const TransferOptions& options) const {
  HeaderList headers(nullptr, &curl_slist_free_all);
  for (const auto& option : options) {
    if (option.first == "VersionId") continue;
    auto it = headerOptions().find(option.first);
    if (it == headerOptions().end()) {
      LOG(logger_, WARN) << "[CurlStorageClient] Ignoring unsupported "
                            "transfer option: "
                         << option.first;
      continue;
    }
    std::string line = it->second + ": " + option.second;
    curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
    if (!appended) {
      throw StorageError(StorageError::Kind::Transfer,
                         "Failed to build request headers");
    }
    headers.release();
    headers.reset(appended);
  }
  return headers;
}

uint64_t CurlStorageClient::headObject(const std::string& bucket,
                                       const std::string& key) {
  prepare();
  CURL* curl = curl_.get();
  const std::string url = objectUrl(bucket, key);
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);

  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    throw StorageError(StorageError::Kind::Transport,
                       "HEAD " + url + " failed: " + curl_easy_strerror(res));
  }

  long code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
  if (code == 404) {
    throw StorageError(StorageError::Kind::NotFound,
                       "Object not found: " + bucket + "/" + key);
  }
  if (code < 200 || code >= 300) {
    throw StorageError(StorageError::Kind::Transport,
                       "HEAD " + url + " returned HTTP " +
                           std::to_string(code));
  }

  curl_off_t length = -1;
  curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
  if (length < 0) {
    throw StorageError(StorageError::Kind::Transport,
                       "No Content-Length for " + bucket + "/" + key);
  }
  return static_cast<uint64_t>(length);
}

void CurlStorageClient::downloadFile(const std::string& bucket,
                                     const std::string& key,
                                     const std::string& destination,
                                     const TransferOptions& options,
                                     const ProgressCallback& progress) {
  std::error_code ec;
  auto parent = std::filesystem::path(destination).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw StorageError(StorageError::Kind::Transfer,
                       "Cannot create directory " + parent.string() + ": " +
                           ec.message());
  }

  std::ofstream ofs(destination, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw StorageError(StorageError::Kind::Transfer,
                       "Cannot open destination file: " + destination);
  }

  prepare();
  CURL* curl = curl_.get();
  const std::string url = objectUrl(bucket, key, options);
  HeaderList headers = buildHeaders(options);
  WriteContext ctx{&ofs, &progress, 0, false, nullptr};

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &writeData);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
  if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

  LOG(logger_, DEBUG) << "[CurlStorageClient] GET " << url << " -> "
                      << destination;
  const CURLcode res = curl_easy_perform(curl);
  // the handle is reused; do not leave it pointing at our header list
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, static_cast<curl_slist*>(nullptr));
  ofs.close();

  if (ctx.callbackError) std::rethrow_exception(ctx.callbackError);
  if (ctx.writeFailed) {
    throw StorageError(StorageError::Kind::Transfer,
                       "Failed to write " + destination);
  }
  if (res != CURLE_OK) {
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    throw StorageError(StorageError::Kind::Transfer,
                       "GET " + url + " failed after " +
                           std::to_string(ctx.written) + " bytes: " +
                           curl_easy_strerror(res) + " (HTTP " +
                           std::to_string(code) + ")");
  }
}

}  // namespace bucketdl
