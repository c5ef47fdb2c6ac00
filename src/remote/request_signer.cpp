#include "remote/request_signer.hpp"
#include "core/errors.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace chunkstream {
namespace remote {

RequestSigner::RequestSigner(std::string secret)
  : secret_(std::move(secret)) {}

std::string RequestSigner::sign(const std::string& method, const std::string& target,
                                const std::string& date) const {
  const std::string payload = method + "\n" + target + "\n" + date;

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  if (HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
           reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
           digest, &digest_len) == nullptr) {
    throw core::UpstreamError("failed to compute request signature");
  }

  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < digest_len; ++i) {
    ss << std::setw(2) << static_cast<int>(digest[i]);
  }
  return ss.str();
}

std::string RequestSigner::fingerprint(const std::string& value) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  if (EVP_Digest(value.data(), value.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    throw core::UpstreamError("failed to compute identity fingerprint");
  }

  std::ostringstream ss;
  ss << "id-" << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < 6 && i < digest_len; ++i) {
    ss << std::setw(2) << static_cast<int>(digest[i]);
  }
  return ss.str();
}

std::string RequestSigner::http_date() {
  std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);

  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  ss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
  return ss.str();
}

} // namespace remote
} // namespace chunkstream
