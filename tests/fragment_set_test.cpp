#include "fragment_set.hpp"
#include "checkpoint.hpp"
#include "errors.hpp"

#include "pool_image_builder.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <thread>

using namespace zfs_undelete;

namespace
{
	fragment leaf(const test::bytes& data, uint64_t offset, fragment_kind kind = fragment_kind::file_content)
	{
		fragment f;
		f.kind = kind;
		f.raw = data;
		f.hash = make_physical_hash(checksum_algorithm::fletcher_4, data.data(), data.size());
		f.block_hash = f.hash;
		f.location.address = dva_from_byte_offset(0, offset, data.size());
		return f;
	}

	fragment slot(const test::bytes& data, const content_hash& block_hash, uint64_t offset, uint32_t index)
	{
		fragment f;
		f.kind = fragment_kind::file_dnode;
		f.raw = data;
		f.hash = make_slot_hash(data.data(), data.size());
		f.block_hash = block_hash;
		f.location.address = dva_from_byte_offset(0, offset, 1024);
		f.location.slot = index;
		return f;
	}

	fragment_extent leaf_extent(const content_hash& hash, uint64_t length)
	{
		fragment_extent e;
		e.kind = fragment_extent::leaf;
		e.hash = hash;
		e.length = length;
		return e;
	}

	fragment_extent extent(fragment_extent::kind_t kind, uint64_t length)
	{
		fragment_extent e;
		e.kind = kind;
		e.length = length;
		return e;
	}

	fragment composite(const content_hash& origin, uint64_t size, std::vector<fragment_extent> extents)
	{
		fragment f;
		f.kind = fragment_kind::file_content;
		f.origin = origin;
		f.logical_size = size;
		f.extents = std::move(extents);
		seal_composite(f);
		return f;
	}
}

TEST(fragment_set, same_bytes_keep_the_lowest_location)
{
	fragment_set set(4);
	test::bytes data = test::make_text(1024, 1);
	fragment_set::insert_result first = set.insert(leaf(data, 0x9000));
	EXPECT_TRUE(first.inserted);
	EXPECT_FALSE(first.collision);

	fragment_set::insert_result second = set.insert(leaf(data, 0x3000));
	EXPECT_FALSE(second.inserted);
	EXPECT_FALSE(second.collision);
	EXPECT_EQ(0x3000u, second.stored->location.address.byte_offset());

	set.insert(leaf(data, 0x5000));
	ASSERT_EQ(1u, set.size());
	EXPECT_EQ(0x3000u, set.find(first.stored->hash)->location.address.byte_offset());
	EXPECT_FALSE(set.is_collision(first.stored->hash));
}

TEST(fragment_set, different_bytes_under_one_hash_are_a_collision)
{
	fragment_set set;
	fragment a = leaf(test::make_text(512, 2), 0x1000);
	fragment b = leaf(test::make_text(512, 3), 0x2000);
	b.hash = a.hash;
	set.insert(std::move(a));
	fragment_set::insert_result res = set.insert(std::move(b));
	EXPECT_TRUE(res.collision);
	EXPECT_TRUE(set.is_collision(res.stored->hash));
	EXPECT_EQ(1u, set.collisions().size());
	EXPECT_EQ(1u, set.size());
}

TEST(fragment_set, slots_are_indexed_by_their_block)
{
	fragment_set set;
	const content_hash block = make_physical_hash(checksum_algorithm::fletcher_4, test::fletcher4(test::make_text(1024, 4)));
	test::bytes dnode_a = test::make_text(512, 5);
	test::bytes dnode_b = test::make_text(512, 6);
	set.insert(slot(dnode_b, block, 0x4000, 1));
	set.insert(slot(dnode_a, block, 0x4000, 0));

	std::vector<slot_ref> slots = set.slots_in_block(block);
	ASSERT_EQ(2u, slots.size());
	EXPECT_EQ(0u, slots[0].slot);
	EXPECT_EQ(make_slot_hash(dnode_a.data(), dnode_a.size()), slots[0].hash);
	EXPECT_EQ(1u, slots[1].slot);
	EXPECT_FALSE(set.contains(block));
	// slots are not physical blocks of their own
	EXPECT_TRUE(set.at_location(dva_from_byte_offset(0, 0x4000, 0)).empty());
	EXPECT_EQ(2u, set.block_slots().size());
}

TEST(fragment_set, block_slots_are_published_together)
{
	const content_hash block = make_physical_hash(checksum_algorithm::fletcher_4, test::fletcher4(test::make_text(1024, 40)));
	for (int round = 0; round != 20; ++round)
	{
		fragment_set set;
		std::vector<fragment> slots;
		for (uint32_t i = 0; i != 32; ++i)
			slots.push_back(slot(test::make_text(512, 100 + i), block, 0x4000, i));

		std::atomic<bool> done{false};
		std::vector<size_t> seen;
		std::thread reader([&]()
			{
				while (!done)
					seen.push_back(set.slots_in_block(block).size());
			});
		std::vector<fragment_set::insert_result> results = set.insert_block(block, std::move(slots));
		done = true;
		reader.join();

		ASSERT_EQ(32u, results.size());
		EXPECT_TRUE(results[5].inserted);
		EXPECT_EQ(32u, set.slots_in_block(block).size());
		for (size_t n : seen)
			EXPECT_TRUE(n == 0 || n == 32) << n;
	}
}

TEST(fragment_set, placements_map_objects_to_dnodes)
{
	fragment_set set;
	const content_hash objset = make_physical_hash(checksum_algorithm::fletcher_4, test::fletcher4(test::make_text(512, 7)));
	const content_hash block = make_physical_hash(checksum_algorithm::fletcher_4, test::fletcher4(test::make_text(512, 8)));
	fragment_set::insert_result a = set.insert(slot(test::make_text(512, 9), block, 0x6000, 3));
	fragment_set::insert_result b = set.insert(slot(test::make_text(512, 10), block, 0x6000, 2));

	set.add_placement(object_placement{ objset, 35 }, a.stored->hash);
	set.add_placement(object_placement{ objset, 34 }, b.stored->hash);
	// the first dnode placed under an id stays
	set.add_placement(object_placement{ objset, 35 }, b.stored->hash);

	EXPECT_EQ(a.stored, set.find_object(object_placement{ objset, 35 }));
	EXPECT_EQ(nullptr, set.find_object(object_placement{ objset, 36 }));
	ASSERT_EQ(1u, set.placements_of(a.stored->hash).size());
	EXPECT_EQ(35u, set.placements_of(a.stored->hash)[0].object_id);

	std::vector<std::pair<uint64_t, content_hash>> objects = set.objects_of(objset);
	ASSERT_EQ(2u, objects.size());
	EXPECT_EQ(34u, objects[0].first);
	EXPECT_EQ(b.stored->hash, objects[0].second);
	EXPECT_EQ(2u, set.placements().size());
}

TEST(fragment_set, composite_is_found_by_origin)
{
	fragment_set set;
	fragment dnode = slot(test::make_text(512, 11), content_hash(), 0x7000, 0);
	const content_hash origin = dnode.hash;
	set.insert(std::move(dnode));

	test::bytes block_a = test::make_text(1024, 12);
	test::bytes block_b = test::make_text(1024, 13);
	fragment_set::insert_result a = set.insert(leaf(block_a, 0x10000));
	fragment_set::insert_result b = set.insert(leaf(block_b, 0x20000));

	fragment c = composite(origin, 2500, { leaf_extent(a.stored->hash, 1024), extent(fragment_extent::hole, 1024), leaf_extent(b.stored->hash, 1024) });
	EXPECT_EQ(hash_domain::composite, c.hash.domain);
	fragment_set::insert_result res = set.insert(std::move(c));
	ASSERT_TRUE(res.inserted);
	EXPECT_EQ(res.stored, set.composite_of(origin));
	EXPECT_EQ(nullptr, set.composite_of(a.stored->hash));

	bool complete = true;
	std::vector<uint8_t> content = assemble_content(set, *res.stored, complete);
	EXPECT_TRUE(complete);
	ASSERT_EQ(2500u, content.size());
	EXPECT_TRUE(std::equal(block_a.begin(), block_a.end(), content.begin()));
	EXPECT_EQ(std::vector<uint8_t>(1024, 0), std::vector<uint8_t>(content.begin() + 1024, content.begin() + 2048));
	EXPECT_TRUE(std::equal(content.begin() + 2048, content.end(), block_b.begin()));

	std::vector<fragment_set::fragment_ptr> at = set.at_location(dva_from_byte_offset(0, 0x20000, 0));
	ASSERT_EQ(1u, at.size());
	EXPECT_EQ(b.stored, at[0]);
}

TEST(fragment_set, assembly_flags_missing_pieces)
{
	fragment_set set;
	test::bytes block = test::make_text(1024, 14);
	fragment_set::insert_result present = set.insert(leaf(block, 0x10000));
	const content_hash absent = make_physical_hash(checksum_algorithm::fletcher_4, test::fletcher4(test::make_text(1024, 15)));

	fragment c = composite(content_hash(), 3072, { leaf_extent(present.stored->hash, 1024), leaf_extent(absent, 1024), extent(fragment_extent::missing, 1024) });
	bool complete = true;
	std::vector<uint8_t> content = assemble_content(set, c, complete);
	EXPECT_FALSE(complete);
	ASSERT_EQ(3072u, content.size());
	EXPECT_TRUE(std::equal(block.begin(), block.end(), content.begin()));
	EXPECT_EQ(std::vector<uint8_t>(2048, 0), std::vector<uint8_t>(content.begin() + 1024, content.end()));

	// content ends with the extents when they fall short of the size
	fragment short_one = composite(content_hash(), 2048, { leaf_extent(present.stored->hash, 1024) });
	complete = true;
	EXPECT_EQ(1024u, content_size(short_one));
	EXPECT_EQ(1024u, assemble_content(set, short_one, complete).size());
	EXPECT_FALSE(complete);
}

TEST(fragment_set, huge_sizes_are_bounded_by_the_extents)
{
	fragment_set set;
	test::bytes block = test::make_text(1024, 17);
	fragment_set::insert_result present = set.insert(leaf(block, 0x10000));

	fragment small = composite(content_hash(), uint64_t(1) << 40, { extent(fragment_extent::hole, 4096) });
	bool complete = true;
	EXPECT_EQ(4096u, content_size(small));
	EXPECT_EQ(std::vector<uint8_t>(4096, 0), assemble_content(set, small, complete));
	EXPECT_FALSE(complete);

	// a sparse tree of a terabyte can't be held in memory, but its pieces can be read
	const uint64_t terabyte = uint64_t(1) << 40;
	fragment sparse = composite(content_hash(), terabyte, { extent(fragment_extent::hole, terabyte - 1024), leaf_extent(present.stored->hash, 1024) });
	EXPECT_EQ(terabyte, content_size(sparse));
	complete = true;
	EXPECT_THROW(assemble_content(set, sparse, complete), malformed_structure);

	complete = true;
	EXPECT_EQ(block, read_content(set, sparse, terabyte - 1024, 4096, complete));
	EXPECT_EQ(std::vector<uint8_t>(512, 0), read_content(set, sparse, 4096, 512, complete));
	EXPECT_TRUE(complete);

	std::vector<uint64_t> offsets;
	visit_content(set, sparse, 0, terabyte, complete, [&](uint64_t offset, const uint8_t*, size_t size)
		{
			offsets.push_back(offset);
			EXPECT_EQ(1024u, size);
		});
	EXPECT_EQ(std::vector<uint64_t>{ terabyte - 1024 }, offsets);
}

TEST(fragment_set, composite_table_round_trips)
{
	fragment_extent embedded = extent(fragment_extent::embedded, 100);
	embedded.data = test::make_text(100, 16);
	fragment c = composite(make_slot_hash(embedded.data.data(), 10), 4096,
		{ embedded, extent(fragment_extent::hole, 2048), extent(fragment_extent::missing, 512) });

	fragment copy;
	copy.raw = c.raw;
	unseal_composite(copy);
	EXPECT_EQ(c.origin, copy.origin);
	EXPECT_EQ(4096u, copy.logical_size);
	ASSERT_EQ(3u, copy.extents.size());
	EXPECT_EQ(embedded.data, copy.extents[0].data);
	EXPECT_EQ(fragment_extent::missing, copy.extents[2].kind);

	copy.raw.resize(copy.raw.size() - 5);
	EXPECT_THROW(unseal_composite(copy), malformed_structure);
}

TEST(checkpoint, saves_and_loads_the_whole_set)
{
	test::temp_files files;
	const std::string path = files.path("set.fragments");

	fragment_set set;
	const content_hash objset = make_physical_hash(checksum_algorithm::fletcher_4, test::fletcher4(test::make_text(512, 17)));
	const content_hash block = make_physical_hash(checksum_algorithm::fletcher_4, test::fletcher4(test::make_text(1024, 18)));
	fragment_set::insert_result dnode = set.insert(slot(test::make_text(512, 19), block, 0x8000, 4));
	fragment_set::insert_result data = set.insert(leaf(test::make_text(2048, 20), 0x30000));
	fragment compressed = leaf(test::random_bytes(512, 21), 0x40000, fragment_kind::indirect_block);
	compressed.decoded = test::make_text(16384, 22);
	set.insert(std::move(compressed));
	set.insert(composite(dnode.stored->hash, 2000, { leaf_extent(data.stored->hash, 2048) }));
	set.add_placement(object_placement{ objset, 7 }, dnode.stored->hash);
	set.add_collision(data.stored->hash);

	save_fragment_set(set, path);

	fragment_set loaded(8);
	load_fragment_set(path, loaded);
	EXPECT_EQ(set.hashes(), loaded.hashes());
	EXPECT_EQ(set.collisions(), loaded.collisions());
	EXPECT_EQ(set.slots_in_block(block), loaded.slots_in_block(block));
	EXPECT_EQ(dnode.stored->hash, loaded.find_object(object_placement{ objset, 7 })->hash);
	ASSERT_NE(nullptr, loaded.composite_of(dnode.stored->hash));
	EXPECT_EQ(2000u, loaded.composite_of(dnode.stored->hash)->logical_size);

	for (const fragment_set::fragment_ptr& f : set.snapshot())
	{
		fragment_set::fragment_ptr g = loaded.find(f->hash);
		ASSERT_NE(nullptr, g);
		EXPECT_EQ(f->kind, g->kind);
		EXPECT_EQ(f->raw, g->raw);
		EXPECT_EQ(f->decoded, g->decoded);
		EXPECT_EQ(f->location, g->location);
		EXPECT_EQ(f->block_hash, g->block_hash);
	}
}

TEST(checkpoint, truncated_or_foreign_files_are_rejected)
{
	test::temp_files files;
	const std::string path = files.path("truncated.fragments");
	fragment_set set;
	set.insert(leaf(test::make_text(4096, 23), 0x1000));
	save_fragment_set(set, path);

	test::bytes content = test::read_file(path);
	ASSERT_GT(content.size(), 100u);
	{
		std::ofstream out(path, std::ios::binary | std::ios::trunc);
		out.write(reinterpret_cast<const char*>(content.data()), std::streamsize(content.size() - 100));
	}
	fragment_set loaded;
	EXPECT_THROW(load_fragment_set(path, loaded), malformed_structure);

	const std::string foreign = files.path("foreign.fragments");
	{
		std::ofstream out(foreign, std::ios::binary | std::ios::trunc);
		out << "this is not a checkpoint at all, just some text";
	}
	EXPECT_THROW(load_fragment_set(foreign, loaded), malformed_structure);

	EXPECT_THROW(load_fragment_set(files.path("missing.fragments"), loaded), image_io_failure);
}
