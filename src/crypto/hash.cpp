#include <ibc/common/critical.hpp>
#include <ibc/crypto/hash.hpp>

#include <openssl/evp.h>

#include <memory>
#include <string>

namespace ibc::crypto {

namespace {

using evp_md_ptr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool run_digest(const EVP_MD* md,
                const ibc::schema::bytes_view_t& bytes,
                ibc::schema::bytes_t& out) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  out.resize(static_cast<size_t>(EVP_MD_get_size(md)));
  auto written = 0u;
  return EVP_DigestInit_ex(ctx.get(), md, nullptr) == 1 &&
         EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) == 1 &&
         EVP_DigestFinal_ex(ctx.get(), out.data(), &written) == 1 &&
         written == out.size();
}

}  // namespace

ibc::schema::hash32_t sha256(const ibc::schema::bytes_view_t& bytes) {
  auto out = ibc::schema::bytes_t{};
  if (!run_digest(EVP_sha256(), bytes, out)) {
    ibc::common::critical("OpenSSL sha256 digest failed");
  }
  auto hash = ibc::schema::hash32_t{};
  std::copy(std::begin(out), std::end(out), std::begin(hash));
  return hash;
}

std::optional<ibc::schema::bytes_t> digest(
    const std::string_view algorithm,
    const ibc::schema::bytes_view_t& bytes) {
  auto md = evp_md_ptr{
      EVP_MD_fetch(nullptr, std::string{algorithm}.c_str(), nullptr),
      EVP_MD_free};
  if (!md) {
    return std::nullopt;
  }
  auto out = ibc::schema::bytes_t{};
  if (!run_digest(md.get(), bytes, out)) {
    return std::nullopt;
  }
  return out;
}

}  // namespace ibc::crypto
