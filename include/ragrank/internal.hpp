#pragma once
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

namespace ragrank::internal {

// Monotonic timestamp helper for metrics/tracing (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// SHA-256 wrapper using OpenSSL's EVP API.
class Sha256 {
 public:
  static constexpr size_t kDigestBytes = 32;

  // Returns false if any EVP call fails; out is zeroed in that case.
  static bool Digest(std::string_view data, std::array<uint8_t, kDigestBytes>* out) {
    out->fill(0);
    unsigned int len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return false;
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) &&
              EVP_DigestUpdate(ctx, data.data(), data.size()) &&
              EVP_DigestFinal_ex(ctx, out->data(), &len);
    EVP_MD_CTX_free(ctx);
    return ok && len == kDigestBytes;
  }
};

inline std::string ToHex(const uint8_t* p, size_t n) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(n * 2);
  for (size_t i = 0; i < n; ++i) {
    out.push_back(kDigits[p[i] >> 4]);
    out.push_back(kDigits[p[i] & 0x0f]);
  }
  return out;
}

// Big-endian so document index keys sort by position.
inline std::string EncodeU32BE(uint32_t v) {
  std::string s(4, '\0');
  for (int i = 3; i >= 0; --i) {
    s[static_cast<size_t>(i)] = static_cast<char>(v & 0xffu);
    v >>= 8;
  }
  return s;
}

inline bool DecodeU32BE(std::string_view s, uint32_t* out) {
  if (s.size() != 4) return false;
  uint32_t v = 0;
  for (size_t i = 0; i < 4; ++i) {
    v = (v << 8) | static_cast<uint8_t>(s[i]);
  }
  *out = v;
  return true;
}

// ---------------------------------------------------------------------------
// Embedding utilities
// ---------------------------------------------------------------------------

// Serialize embedding vector to bytes (host-order floats)
inline std::string SerializeEmbedding(const std::vector<float>& embedding) {
  std::string out;
  out.resize(embedding.size() * sizeof(float));
  if (!out.empty()) std::memcpy(out.data(), embedding.data(), out.size());
  return out;
}

inline bool DeserializeEmbedding(std::string_view bytes, std::vector<float>* out) {
  if (bytes.size() % sizeof(float) != 0) return false;
  size_t count = bytes.size() / sizeof(float);
  out->resize(count);
  if (count > 0) std::memcpy(out->data(), bytes.data(), bytes.size());
  return true;
}

inline double DotProduct(const std::vector<float>& a, const std::vector<float>& b) {
  double dot = 0.0;
  for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
  }
  return dot;
}

// Returns value in [-1.0, 1.0]; 0.0 for empty or zero-length vectors.
inline double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) return 0.0;

  double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }

  double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
  if (denom < 1e-12) return 0.0;
  return dot / denom;
}

inline double L2Distance(const std::vector<float>& a, const std::vector<float>& b) {
  double sum = 0.0;
  for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
    double d = static_cast<double>(a[i]) - b[i];
    sum += d * d;
  }
  return std::sqrt(sum);
}

}  // namespace ragrank::internal
