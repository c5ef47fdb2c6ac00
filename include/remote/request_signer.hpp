#ifndef CHUNKSTREAM_REMOTE_REQUEST_SIGNER_HPP
#define CHUNKSTREAM_REMOTE_REQUEST_SIGNER_HPP

#include <string>

namespace chunkstream {
namespace remote {

// Signs backend requests with HMAC-SHA256 over "METHOD\nTARGET\nDATE".
// An empty secret disables signing.
class RequestSigner {
public:
  explicit RequestSigner(std::string secret);

  bool enabled() const { return !secret_.empty(); }

  // Lowercase hex digest; throws core::UpstreamError if OpenSSL fails
  std::string sign(const std::string& method, const std::string& target, const std::string& date) const;

  // RFC 7231 IMF-fixdate of the current time
  static std::string http_date();

  // Short SHA-256 prefix, safe to log in place of a session token
  static std::string fingerprint(const std::string& value);

private:
  std::string secret_;
};

} // namespace remote
} // namespace chunkstream

#endif // CHUNKSTREAM_REMOTE_REQUEST_SIGNER_HPP
