#include "Contract.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace bucketdl {

namespace {

std::mutex rng_mutex;

std::mt19937_64& rng() {
  static std::mt19937_64 engine = [] {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

std::string generateContractId() {
  uint64_t hi;
  uint64_t lo;
  {
    std::lock_guard<std::mutex> lock(rng_mutex);
    hi = rng()();
    lo = rng()();
  }
  // version 4, RFC 4122 variant
  hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << hi << std::setw(16)
      << lo;
  return oss.str();
}

Contract::Contract(std::string bucket, std::string key,
                   std::string destination, TransferOptions options)
    : Contract(generateContractId(), std::move(bucket), std::move(key),
               std::move(destination), std::move(options)) {}

Contract::Contract(std::string id, std::string bucket, std::string key,
                   std::string destination, TransferOptions options)
    : id_(std::move(id)),
      bucket_(std::move(bucket)),
      key_(std::move(key)),
      destination_(std::move(destination)),
      options_(std::move(options)) {}

ContractFactory::ContractFactory(std::string bucket)
    : bucket_(std::move(bucket)) {}

Contract ContractFactory::newContract(const std::string& key,
                                      const std::string& destination,
                                      const TransferOptions& options) const {
  std::string target = destination;
  if (target.empty()) {
    target = std::filesystem::path(key).filename().string();
    if (target.empty()) target = key;
  }
  return Contract(bucket_, key, target, options);
}

}  // namespace bucketdl
