#include "checksum_engine.hpp"

#include <arrow/io/file.h>
#include <openssl/evp.h>

#include <stdexcept>

namespace datahub::checksum {

namespace {

std::string ToHex(const unsigned char* digest, unsigned int size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(size * 2);
  for (unsigned int i = 0; i < size; ++i) {
    out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

} // namespace

Md5Digest::Md5Digest() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) throw std::runtime_error("md5: EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    ctx_ = nullptr;
    throw std::runtime_error("md5: EVP_DigestInit_ex failed");
  }
}

Md5Digest::~Md5Digest() {
  if (ctx_) EVP_MD_CTX_free(ctx_);
}

void Md5Digest::Update(const uint8_t* data, size_t size) {
  if (size == 0) return;
  if (EVP_DigestUpdate(ctx_, data, size) != 1) {
    throw std::runtime_error("md5: EVP_DigestUpdate failed");
  }
}

std::string Md5Digest::FinishHex() {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_DigestFinal_ex(ctx_, digest, &digest_len) != 1) {
    throw std::runtime_error("md5: EVP_DigestFinal_ex failed");
  }
  return ToHex(digest, digest_len);
}

std::string Md5Hex(const uint8_t* data, size_t size) {
  Md5Digest digest;
  digest.Update(data, size);
  return digest.FinishHex();
}

std::string Md5Hex(const arrow::Buffer& buffer) {
  return Md5Hex(buffer.data(), static_cast<size_t>(buffer.size()));
}

std::string Md5Hex(const std::string& data) {
  return Md5Hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

arrow::Result<std::string> FileChecksum(const std::string& path, int64_t read_size) {
  if (read_size <= 0) return arrow::Status::Invalid("checksum read size must be positive");

  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(path));

  Md5Digest digest;
  for (;;) {
    ARROW_ASSIGN_OR_RAISE(auto chunk, file->Read(read_size));
    if (chunk->size() == 0) break;
    digest.Update(chunk->data(), static_cast<size_t>(chunk->size()));
  }
  ARROW_RETURN_NOT_OK(file->Close());
  return digest.FinishHex();
}

} // namespace datahub::checksum
