#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>

#include <cstdint>
#include <memory>
#include <string>

struct evp_md_ctx_st;

namespace datahub::checksum {

/*
  Content digests.

  MD5, rendered as 32 lowercase hex chars. The whole-file digest is the
  session identity; per-part digests guard each transfer.
*/

class Md5Digest {
 public:
  Md5Digest();
  ~Md5Digest();

  Md5Digest(const Md5Digest&)            = delete;
  Md5Digest& operator=(const Md5Digest&) = delete;

  void Update(const uint8_t* data, size_t size);

  // Finalizes the digest. The object must not be updated afterwards.
  std::string FinishHex();

 private:
  evp_md_ctx_st* ctx_ = nullptr;
};

std::string Md5Hex(const uint8_t* data, size_t size);
std::string Md5Hex(const arrow::Buffer& buffer);
std::string Md5Hex(const std::string& data);

/*
  Streams the file through MD5 in fixed-size reads; never holds the
  whole file in memory.
*/
arrow::Result<std::string> FileChecksum(const std::string& path, int64_t read_size = 10 * 1024 * 1024);

} // namespace datahub::checksum
