#include "sha256.hpp"

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

#include <openssl/evp.h>

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext newContext() {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    ctx.reset();
  }
  return ctx;
}

std::string finish(EVP_MD_CTX *ctx) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx, digest, &length) != 1)
    return "";

  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < length; ++i) {
    ss << std::setw(2) << static_cast<unsigned int>(digest[i]);
  }
  return ss.str();
}

} // namespace

std::string Sha256::calculateHash(const std::string &filePath) const {
  std::ifstream file(filePath, std::ios::binary);
  if (!file)
    return "";

  DigestContext ctx = newContext();
  if (!ctx)
    return "";

  std::vector<char> buffer(64 * 1024);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize n = file.gcount();
    if (n > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
      return "";
    }
  }
  if (file.bad())
    return "";

  return finish(ctx.get());
}

std::string Sha256::calculateHashOfString(const std::string &data) const {
  DigestContext ctx = newContext();
  if (!ctx)
    return "";
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    return "";
  return finish(ctx.get());
}
