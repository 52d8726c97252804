#include "zap.hpp"
#include "errors.hpp"

#include "pool_image_builder.hpp"

#include <gtest/gtest.h>

using namespace zfs_undelete;

namespace
{
	const uint64_t zbt_leaf = uint64_t(1) << 63;
	const uint64_t zbt_header = (uint64_t(1) << 63) + 1;
	const uint64_t zap_magic = 0x2F52AB2ABULL;
	const uint32_t zap_leaf_magic = 0x2AB1EAF;

	// 512 byte blocks: 16 hash entries, chunks of 24 bytes from offset 80
	const size_t chunk_table = 48 + 16 * 2;
	const size_t chunk_bytes = 24;

	void put_array_chunk(test::bytes& leaf, uint16_t idx, const test::bytes& payload, uint16_t next = 0xffff)
	{
		size_t pos = chunk_table + idx * chunk_bytes;
		leaf.at(pos) = 251;
		for (size_t i = 0; i != payload.size() && i != 21; ++i)
			leaf.at(pos + 1 + i) = payload[i];
		test::put_u16(leaf, pos + 22, next);
	}

	// one entry whose name is in chunk 1 and value in chunk 2
	test::bytes fat_leaf(const std::string& name, uint64_t value)
	{
		test::bytes leaf(512, 0);
		test::put_u64(leaf, 0, zbt_leaf);
		test::put_u32(leaf, 24, zap_leaf_magic);
		test::put_u16(leaf, 30, 1);

		size_t pos = chunk_table;
		leaf.at(pos) = 252;
		leaf.at(pos + 1) = 8;
		test::put_u16(leaf, pos + 2, 0xffff);
		test::put_u16(leaf, pos + 4, 1);
		test::put_u16(leaf, pos + 6, uint16_t(name.size() + 1));
		test::put_u16(leaf, pos + 8, 2);
		test::put_u16(leaf, pos + 10, 1);

		test::bytes name_bytes(name.begin(), name.end());
		name_bytes.push_back(0);
		put_array_chunk(leaf, 1, name_bytes);
		test::bytes value_bytes;
		test::append_be64(value_bytes, value);
		put_array_chunk(leaf, 2, value_bytes);
		return leaf;
	}

	test::bytes fat_header(unsigned shift, const std::vector<uint64_t>& table)
	{
		test::bytes header(512, 0);
		test::put_u64(header, 0, zbt_header);
		test::put_u64(header, 8, zap_magic);
		test::put_u64(header, 32, shift);
		for (size_t i = 0; i != table.size(); ++i)
			test::put_u64(header, 256 + i * 8, table[i]);
		return header;
	}
}

TEST(zap, micro_entries_and_dirent_types)
{
	test::bytes block = test::encode_microzap({
		{ "a.txt", test::dirent_value(3) },
		{ "sub", test::dirent_value(5, test::dirent_directory) } });

	EXPECT_TRUE(is_potential_zap_block(block.data(), block.size()));
	std::vector<zap_entry> entries = parse_zap(block.data(), block.size(), 512);
	ASSERT_EQ(2u, entries.size());
	EXPECT_EQ("a.txt", entries[0].name);
	EXPECT_EQ(3u, entries[0].get_object_id());
	EXPECT_EQ(test::dirent_regular, entries[0].get_dirent_type());
	EXPECT_EQ("sub", entries[1].name);
	EXPECT_EQ(5u, entries[1].get_object_id());
	EXPECT_EQ(test::dirent_directory, entries[1].get_dirent_type());
}

TEST(zap, micro_name_must_be_terminated)
{
	test::bytes block = test::encode_microzap({ { "x", 1 } });
	for (size_t i = 0; i != 50; ++i)
		block[64 + 14 + i] = 'n';
	EXPECT_THROW(parse_zap(block.data(), block.size(), 512), malformed_structure);
}

TEST(zap, block_size_must_be_a_power_of_two)
{
	test::bytes block = test::encode_microzap({ { "x", 1 } }, 1024);
	EXPECT_THROW(parse_zap(block.data(), block.size(), 1000), malformed_structure);
	EXPECT_THROW(parse_zap(block.data(), 512, 1024), malformed_structure);
}

TEST(zap, non_zap_block_is_rejected)
{
	test::bytes block = test::random_bytes(16384, 5);
	EXPECT_FALSE(is_potential_zap_block(block.data(), block.size()));
	EXPECT_THROW(parse_zap(block.data(), block.size(), 16384), malformed_structure);
}

TEST(zap, fat_zap_reads_leaf_entries)
{
	test::bytes object = fat_header(0, { 1 });
	test::bytes leaf = fat_leaf("readme", test::dirent_value(7));
	object.insert(object.end(), leaf.begin(), leaf.end());

	EXPECT_TRUE(is_potential_zap_block(object.data(), object.size()));
	std::vector<zap_entry> entries = parse_zap(object.data(), object.size(), 512);
	ASSERT_EQ(1u, entries.size());
	EXPECT_EQ("readme", entries[0].name);
	EXPECT_EQ(8u, entries[0].value.element_size());
	EXPECT_EQ(7u, entries[0].get_object_id());
	EXPECT_EQ(test::dirent_regular, entries[0].get_dirent_type());
}

TEST(zap, fat_zap_skips_unrecovered_leaves)
{
	test::bytes object = fat_header(1, { 1, 2 });
	test::bytes leaf = fat_leaf("kept", 9);
	object.insert(object.end(), leaf.begin(), leaf.end());
	object.resize(object.size() + 512, 0);

	std::vector<zap_entry> entries = parse_zap(object.data(), object.size(), 512);
	ASSERT_EQ(1u, entries.size());
	EXPECT_EQ("kept", entries[0].name);
	EXPECT_EQ(9u, entries[0].value.get(0));
}

TEST(zap, fat_zap_leaf_count_must_match)
{
	test::bytes object = fat_header(0, { 1 });
	test::bytes leaf = fat_leaf("entry", 1);
	test::put_u16(leaf, 30, 2);
	object.insert(object.end(), leaf.begin(), leaf.end());
	EXPECT_THROW(parse_zap(object.data(), object.size(), 512), malformed_structure);

	object = fat_header(0, { 5 });
	object.insert(object.end(), leaf.begin(), leaf.end());
	EXPECT_THROW(parse_zap(object.data(), object.size(), 512), malformed_structure);
}

TEST(zap, pointer_table_shift_is_checked_first)
{
	for (unsigned shift : { 32u, 64u, 200u })
	{
		test::bytes object = fat_header(shift, { 1 });
		test::bytes leaf = fat_leaf("entry", 1);
		object.insert(object.end(), leaf.begin(), leaf.end());
		EXPECT_THROW(parse_zap(object.data(), object.size(), 512), malformed_structure) << shift;
	}
}

TEST(zap, blocks_are_read_on_demand)
{
	const test::bytes header = fat_header(0, { 1 });
	const test::bytes leaf = fat_leaf("far", test::dirent_value(12));
	std::vector<uint64_t> requested;
	// a sparse object far larger than memory, only the header and the leaf are read
	std::vector<zap_entry> entries = parse_zap(uint64_t(1) << 40, 512, [&](uint64_t blk_id)
		{
			requested.push_back(blk_id);
			return blk_id == 0 ? header : blk_id == 1 ? leaf : test::bytes(512, 0);
		});
	ASSERT_EQ(1u, entries.size());
	EXPECT_EQ("far", entries[0].name);
	EXPECT_EQ(12u, entries[0].get_object_id());
	EXPECT_EQ((std::vector<uint64_t>{ 0, 1 }), requested);
}
