#include <gtest/gtest.h>
#include "crypto/sha256.hpp"
#include "test_utils.hpp"

using namespace ghostnet::crypto;

TEST(Sha256Test, KnownVectors) {
  EXPECT_EQ(Sha256::hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(Sha256::hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
  const std::string data = generate_random_data(100000);

  Sha256 sha;
  for (size_t offset = 0; offset < data.size(); offset += 4096) {
    sha.update(data.substr(offset, 4096));
  }
  EXPECT_EQ(sha.hex_digest(), Sha256::hex(data));
}

TEST(Sha256Test, UpdateAfterFinalizeThrows) {
  Sha256 sha;
  sha.update("abc");
  sha.digest();
  EXPECT_THROW(sha.update("more"), CryptoError);
}

TEST(Sha256Test, FileHash) {
  TempDir dir("sha256");
  const std::string data = generate_random_data(3 * 8192 + 17);
  write_file(dir / "data.bin", data);

  EXPECT_EQ(Sha256::file_hex(dir / "data.bin"), Sha256::hex(data));
  EXPECT_THROW(Sha256::file_hex(dir / "missing.bin"), CryptoError);
}
