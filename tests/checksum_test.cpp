#include "checksum.hpp"
#include "errors.hpp"

#include "pool_image_builder.hpp"

#include <gtest/gtest.h>

#include <string.h>

using namespace zfs_undelete;

TEST(checksum, fletcher4_sums_little_endian_words)
{
	const uint8_t data[16] = { 1, 0, 0, 0, 2, 0, 0, 0, 3, 0, 0, 0, 4, 0, 0, 0 };
	block_checksum c = compute_checksum(checksum_algorithm::fletcher_4, data, sizeof(data));
	EXPECT_EQ(10u, c.word[0]);
	EXPECT_EQ(20u, c.word[1]);
	EXPECT_EQ(35u, c.word[2]);
	EXPECT_EQ(56u, c.word[3]);
}

TEST(checksum, fletcher4_matches_reference_on_random_block)
{
	test::bytes data = test::random_bytes(4096, 17);
	EXPECT_EQ(test::fletcher4(data), compute_checksum(checksum_algorithm::fletcher_4, data.data(), data.size()));
}

TEST(checksum, fletcher4_detects_single_bit_flip)
{
	test::bytes data = test::random_bytes(4096, 18);
	block_checksum before = compute_checksum(checksum_algorithm::fletcher_4, data.data(), data.size());
	data[1000] ^= 0x10;
	EXPECT_NE(before, compute_checksum(checksum_algorithm::fletcher_4, data.data(), data.size()));
}

TEST(checksum, fletcher2_sums_64bit_word_pairs)
{
	uint8_t data[32] = {};
	const uint64_t words[4] = { 1, 2, 3, 4 };
	::memcpy(data, words, sizeof(words));
	block_checksum c = compute_checksum(checksum_algorithm::fletcher_2, data, sizeof(data));
	EXPECT_EQ(4u, c.word[0]);
	EXPECT_EQ(6u, c.word[1]);
	EXPECT_EQ(5u, c.word[2]);
	EXPECT_EQ(8u, c.word[3]);
}

TEST(checksum, sha256_words_are_big_endian)
{
	const char* abc = "abc";
	block_checksum c = compute_checksum(checksum_algorithm::sha256, reinterpret_cast<const uint8_t*>(abc), 3);
	EXPECT_EQ(0xba7816bf8f01cfeaULL, c.word[0]);
	EXPECT_EQ(0x414140de5dae2223ULL, c.word[1]);
	EXPECT_EQ(0xb00361a396177a9cULL, c.word[2]);
	EXPECT_EQ(0xb410ff61f20015adULL, c.word[3]);
}

TEST(checksum, aliases_resolve_to_the_function_that_runs)
{
	EXPECT_EQ(checksum_algorithm::fletcher_4, effective_checksum_algorithm(checksum_algorithm::on));
	EXPECT_EQ(checksum_algorithm::fletcher_4, effective_checksum_algorithm(checksum_algorithm::inherit));
	EXPECT_EQ(checksum_algorithm::sha256, effective_checksum_algorithm(checksum_algorithm::label));
	EXPECT_EQ(checksum_algorithm::sha256, effective_checksum_algorithm(checksum_algorithm::gang_header));
	EXPECT_EQ(checksum_algorithm::fletcher_2, effective_checksum_algorithm(checksum_algorithm::zilog));

	test::bytes data = test::random_bytes(1024, 3);
	EXPECT_EQ(compute_checksum(checksum_algorithm::fletcher_4, data.data(), data.size()),
		compute_checksum(checksum_algorithm::on, data.data(), data.size()));
}

TEST(checksum, unsupported_algorithm_throws)
{
	test::bytes data(512, 1);
	EXPECT_FALSE(is_checksum_supported(checksum_algorithm::skein));
	EXPECT_THROW(compute_checksum(checksum_algorithm::skein, data.data(), data.size()), unsupported_checksum);
	EXPECT_THROW(compute_checksum(checksum_algorithm::off, data.data(), data.size()), unsupported_checksum);
}

TEST(checksum, embedded_checksum_depends_on_the_verifier)
{
	test::bytes region = test::random_bytes(512, 9);
	test::seal_eck(region, 7, 8, 9);

	block_checksum verifier;
	verifier.word[0] = 7;
	verifier.word[1] = 8;
	verifier.word[2] = 9;
	EXPECT_TRUE(verify_embedded_checksum(checksum_algorithm::gang_header, region.data(), region.size(), verifier));

	verifier.word[2] = 10;
	EXPECT_FALSE(verify_embedded_checksum(checksum_algorithm::gang_header, region.data(), region.size(), verifier));

	verifier.word[2] = 9;
	region[100] ^= 1;
	EXPECT_FALSE(verify_embedded_checksum(checksum_algorithm::gang_header, region.data(), region.size(), verifier));
}

TEST(checksum, embedded_checksum_needs_the_magic)
{
	test::bytes region(512, 0);
	block_checksum verifier;
	EXPECT_FALSE(verify_embedded_checksum(checksum_algorithm::label, region.data(), region.size(), verifier));
	EXPECT_FALSE(verify_embedded_checksum(checksum_algorithm::label, region.data(), 16, verifier));
}
