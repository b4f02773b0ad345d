#include "Digest.hpp"

#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

std::string Sha256Hex(const std::string& data) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash);
  std::ostringstream oss;
  for (auto byte : hash) {
    oss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
  }
  return oss.str();
}
