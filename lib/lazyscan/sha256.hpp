#ifndef SHA256_HPP
#define SHA256_HPP

#include "ihashcalculator.hpp"

/**
 * @brief SHA-256 digests through the OpenSSL EVP interface
 *
 * Used for backup integrity checks and for the policy fingerprint written
 * into every audit record. Digests are lowercase hex (64 characters).
 *
 * @note Inherits from IHashCalculator interface
 */
class Sha256 : public IHashCalculator {
public:
  std::string calculateHash(const std::string &filePath) const override;
  std::string calculateHashOfString(const std::string &data) const override;
};

#endif // SHA256_HPP
