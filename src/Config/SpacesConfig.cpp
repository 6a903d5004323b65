#include "SpacesConfig.hpp"

#include <fstream>
#include <sstream>

namespace bucketdl {

namespace {

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

}  // namespace

SpacesConfig::SpacesConfig(std::map<std::string, std::string> values)
    : values_(std::move(values)) {}

SpacesConfig SpacesConfig::load(const std::string& path,
                                const utils::LoggerPtr& logger) {
  std::ifstream ifs(path);
  if (!ifs) {
    LOG(logger, WARN) << "Config file missing: " << path
                      << ", continuing with an empty configuration";
    return SpacesConfig();
  }
  std::ostringstream content;
  content << ifs.rdbuf();
  SpacesConfig config = parse(content.str(), logger);
  LOG(logger, INFO) << "Loaded " << config.values_.size()
                    << " config entries from " << path;
  return config;
}

SpacesConfig SpacesConfig::parse(const std::string& content,
                                 const utils::LoggerPtr& logger) {
  std::map<std::string, std::string> values;
  std::istringstream ss(content);
  std::string line;
  int lineNo = 0;
  while (std::getline(ss, line)) {
    ++lineNo;
    std::string item = trim(line);
    if (item.empty() || item[0] == '#') continue;
    auto pos = item.find('=');
    if (pos == std::string::npos || pos == 0) {
      LOG(logger, WARN) << "Ignoring malformed config line " << lineNo << ": "
                        << item;
      continue;
    }
    // values may themselves contain '=' (base64 secrets)
    values[trim(item.substr(0, pos))] = trim(item.substr(pos + 1));
  }
  return SpacesConfig(std::move(values));
}

std::string SpacesConfig::get(const std::string& key) const {
  auto it = values_.find(key);
  return it == values_.end() ? std::string() : it->second;
}

void SpacesConfig::set(const std::string& key, const std::string& value) {
  values_[key] = value;
}

}  // namespace bucketdl
