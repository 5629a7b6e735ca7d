#include "gtest/gtest.h"
#include "crypto/hasher.hpp"
#include "test_support.hpp"

#include <set>
#include <string>
#include <vector>

// Test Hasher::sha256(const std::vector<uint8_t>&)
TEST(HasherTest, Sha256Vector) {
    std::vector<uint8_t> data = {'a', 'b', 'c'};
    hash_t expected_hash = Hasher::hex_to_hash("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    ASSERT_EQ(Hasher::sha256(data), expected_hash);
}

// Test Hasher::sha256(const std::string&)
TEST(HasherTest, Sha256String) {
    std::string data = "Hello, World!";
    hash_t expected_hash = Hasher::hex_to_hash("dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
    ASSERT_EQ(Hasher::sha256(data), expected_hash);
}

TEST(HasherTest, HexConversion) {
    std::string hex_str = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    hash_t hash = Hasher::hex_to_hash(hex_str);
    ASSERT_EQ(Hasher::hash_to_hex(hash), hex_str);
    ASSERT_TRUE(Hasher::is_hex_hash(hex_str));
    ASSERT_FALSE(Hasher::is_hex_hash(hex_str.substr(1)));
    ASSERT_FALSE(Hasher::is_hex_hash(std::string(64, 'g')));
    ASSERT_THROW(Hasher::hex_to_hash("abc"), std::invalid_argument);
}

TEST(HasherTest, FileHashMatchesBufferHash) {
    TempDir dir;
    fs::path file = dir / "data.bin";
    write_file(file, 300 * 1024);
    std::string content = read_file(file);
    ASSERT_EQ(Hasher::sha256_file(file), Hasher::sha256(content));
    ASSERT_THROW(Hasher::sha256_file(dir / "missing.bin"), std::runtime_error);
}

TEST(HasherTest, TokensAreRandomHex) {
    std::string a = Hasher::random_token(32);
    std::string b = Hasher::random_token(32);
    ASSERT_EQ(a.size(), 64u);
    ASSERT_TRUE(Hasher::is_hex_hash(a));
    ASSERT_NE(a, b);
    ASSERT_EQ(Hasher::random_token(16).size(), 32u);
}

TEST(HasherTest, UuidIsVersionFour) {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        std::string id = Hasher::generate_uuid();
        ASSERT_EQ(id.size(), 36u);
        ASSERT_EQ(id[8], '-');
        ASSERT_EQ(id[13], '-');
        ASSERT_EQ(id[14], '4');
        ASSERT_EQ(id[18], '-');
        ASSERT_TRUE(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
        ASSERT_EQ(id[23], '-');
        seen.insert(id);
    }
    ASSERT_EQ(seen.size(), 50u);
}

TEST(HasherTest, PasswordHashUsesSalt) {
    std::string salt = Hasher::random_token(16);
    std::string hashed = Hasher::hash_password("hunter2", salt);
    ASSERT_EQ(hashed, Hasher::hash_to_hex(Hasher::sha256("hunter2" + salt)));
    ASSERT_NE(hashed, Hasher::hash_password("hunter2", Hasher::random_token(16)));
    ASSERT_NE(hashed, Hasher::hash_password("hunter3", salt));
}

TEST(HasherTest, ConstantTimeEquals) {
    ASSERT_TRUE(Hasher::constant_time_equals("abcdef", "abcdef"));
    ASSERT_FALSE(Hasher::constant_time_equals("abcdef", "abcdeg"));
    ASSERT_FALSE(Hasher::constant_time_equals("abcdef", "abcde"));
    ASSERT_TRUE(Hasher::constant_time_equals("", ""));
}
