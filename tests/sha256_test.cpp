#include <gtest/gtest.h>
#include "reposcope/sha256.h"

using reposcope::crypto::Sha256;
using reposcope::crypto::sha256_hex;

TEST(Sha256, KnownVectors) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, MillionAs) {
    EXPECT_EQ(sha256_hex(std::string(1000000, 'a')),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(Sha256, StreamingMatchesOneShot) {
    std::string data;
    for (int i = 0; i < 500; ++i) data += "line " + std::to_string(i) + "\n";

    Sha256 h;
    for (size_t pos = 0; pos < data.size(); pos += 37) h.update(std::string_view(data).substr(pos, 37));
    EXPECT_EQ(h.hex_digest(), sha256_hex(data));

    // hex_digest resets the state.
    h.update("abc");
    EXPECT_EQ(h.hex_digest(), sha256_hex("abc"));
}
