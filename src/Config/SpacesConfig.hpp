#ifndef BUCKETDL_SPACES_CONFIG_HPP_
#define BUCKETDL_SPACES_CONFIG_HPP_

#include <map>
#include <string>

#include "utils/logger.hpp"

namespace bucketdl {

// Connection settings for an S3-compatible endpoint, read from a KEY=VALUE
// file (SPACES_NAME, ACCESS_KEY, SECRET_KEY, REGION_NAME, ENDPOINT).
class SpacesConfig {
 public:
  SpacesConfig() = default;
  explicit SpacesConfig(std::map<std::string, std::string> values);

  // A missing file is logged and yields an empty configuration.
  static SpacesConfig load(const std::string& path,
                           const utils::LoggerPtr& logger);
  static SpacesConfig parse(const std::string& content,
                            const utils::LoggerPtr& logger);

  std::string get(const std::string& key) const;
  void set(const std::string& key, const std::string& value);
  bool empty() const { return values_.empty(); }

  std::string bucketName() const { return get("SPACES_NAME"); }
  std::string accessKey() const { return get("ACCESS_KEY"); }
  std::string secretKey() const { return get("SECRET_KEY"); }
  std::string regionName() const { return get("REGION_NAME"); }
  std::string endpointUrl() const { return get("ENDPOINT"); }

 private:
  std::map<std::string, std::string> values_;
};

}  // namespace bucketdl

#endif  // BUCKETDL_SPACES_CONFIG_HPP_
