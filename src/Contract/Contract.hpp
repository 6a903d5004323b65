#ifndef BUCKETDL_CONTRACT_HPP_
#define BUCKETDL_CONTRACT_HPP_

#include <string>

#include "Storage/StorageClient.hpp"

namespace bucketdl {

/**
 * @brief Immutable request to fetch one object.
 *
 * id is a random 128-bit token rendered as 32 hex characters.
 */
class Contract {
 public:
  Contract(std::string bucket, std::string key, std::string destination,
           TransferOptions options = {});
  Contract(std::string id, std::string bucket, std::string key,
           std::string destination, TransferOptions options);

  const std::string& id() const { return id_; }
  const std::string& bucket() const { return bucket_; }
  const std::string& key() const { return key_; }
  const std::string& destination() const { return destination_; }
  const TransferOptions& options() const { return options_; }

 private:
  const std::string id_;
  const std::string bucket_;
  const std::string key_;
  const std::string destination_;
  const TransferOptions options_;
};

// Builds Contracts for a single bucket.
class ContractFactory {
 public:
  explicit ContractFactory(std::string bucket);

  // An empty destination stores the object under the key's file name.
  Contract newContract(const std::string& key,
                       const std::string& destination = "",
                       const TransferOptions& options = {}) const;

  const std::string& bucket() const { return bucket_; }

 private:
  std::string bucket_;
};

std::string generateContractId();

}  // namespace bucketdl

#endif  // BUCKETDL_CONTRACT_HPP_
