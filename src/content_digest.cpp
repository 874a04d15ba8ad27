#include <finrag/content_digest.h>

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace finrag {

std::string ContentDigest(std::string_view content) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_Digest(content.data(), content.size(), digest, &length, EVP_sha256(),
                 nullptr) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  std::ostringstream stream;
  for (unsigned int i = 0; i < length; ++i) {
    stream << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(digest[i]);
  }
  return stream.str();
}

} // namespace finrag
