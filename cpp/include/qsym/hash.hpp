// include/qsym/hash.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "qsym/ratfunc.hpp"
#include "qsym/rational.hpp"
#include "qsym/zeilberger.hpp"

namespace qsym {

// SHA-256 of the canonical text of a recurrence and its certificate. Two
// runs agree on the digest exactly when they agree on every coefficient.
struct ProofDigest {
  std::array<std::uint8_t, 32> bytes{};
};

// Incremental SHA-256.
class Sha256 {
public:
  Sha256() noexcept;
  void update(const void *data, std::size_t len) noexcept;
  void update(const std::string &s) noexcept { update(s.data(), s.size()); }
  // Pads and returns the digest; the object is spent afterwards.
  ProofDigest finish() noexcept;

private:
  void compress(const unsigned char *block) noexcept;

  std::uint32_t h_[8];
  unsigned char buf_[64];
  std::size_t buf_len_ = 0;
  std::uint64_t total_ = 0;
};

ProofDigest digest_bytes(const std::string &s) noexcept;

// Feeds "order=<d>;c=<c_0>,...;num=<...>;den=<...>;" into SHA-256, every
// rational in lowest terms.
ProofDigest digest(const std::vector<Rational> &coefficients, const RatFunc &certificate);
ProofDigest digest(const ZeilbergerResult &r);

std::string to_hex(const ProofDigest &d);

} // namespace qsym
