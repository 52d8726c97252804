#pragma once

// A small filesystem written into one pool image:
//   objset -> dnode block 1 { slot 2: directory "root", slot 3: file a.txt,
//                             slot 4: file b.bin (two levels), slot 5: directory "other" }
//   dnode block 2 { slot 5: file x } referenced by nothing
// "root" lists a.txt and b.bin, "other" lists a.txt as shared.txt.

#include "pool_image_builder.hpp"

namespace zfs_undelete
{
namespace test
{

	constexpr uint64_t sample_size_a = 3000;
	constexpr uint64_t sample_size_b = 10000;
	constexpr uint64_t sample_size_x = 1500;
	constexpr uint32_t sample_slot_root = 2;
	constexpr uint32_t sample_slot_a = 3;
	constexpr uint32_t sample_slot_b = 4;
	constexpr uint32_t sample_slot_other = 5;
	constexpr uint32_t sample_slot_x = 5;

	struct sample_pool
	{
		pool_writer writer;

		written_block data_a;
		std::vector<written_block> data_b;
		written_block data_x;
		written_block zap_root;
		written_block zap_other;
		written_block indirect_b;
		written_block dnode_block;
		written_block orphan_block;
		written_block objset;

		// slot bytes as stored in the dnode blocks
		bytes dnode_root;
		bytes dnode_a;
		bytes dnode_b;
		bytes dnode_other;
		bytes dnode_x;

		// file contents, truncated to the file sizes
		bytes content_a;
		bytes content_b;
		bytes content_x;
	};

	inline bytes truncated(bytes b, uint64_t size)
	{
		b.resize(size_t(size));
		return b;
	}

	inline bytes dnode_pointing_at(uint8_t type, uint16_t datablkszsec, uint64_t size, const written_block& block, uint8_t nlevels = 1, uint64_t maxblkid = 0)
	{
		dnode_spec dn;
		dn.type = type;
		dn.datablkszsec = datablkszsec;
		dn.nlevels = nlevels;
		dn.maxblkid = maxblkid;
		dn.blkptrs.push_back(block.pointer());
		dn.bonus = znode_bonus(size, type == directory_type ? 040755 : 0100644);
		return encode_dnode(dn);
	}

	inline void build_sample_pool(sample_pool& pool, bool with_other_directory = true)
	{
		pool_writer& w = pool.writer;

		pool.data_a = w.write_block(make_text(3072, 11), file_type, 0, false);
		pool.content_a = truncated(pool.data_a.logical, sample_size_a);

		bytes indirect(16384, 0);
		for (unsigned i = 0; i != 3; ++i)
		{
			pool.data_b.push_back(w.write_block(make_text(4096, 20 + i), file_type, 0, false));
			copy_into(indirect, i * 128, pool.data_b.back().pointer());
			pool.content_b.insert(pool.content_b.end(), pool.data_b.back().logical.begin(), pool.data_b.back().logical.end());
		}
		pool.content_b = truncated(pool.content_b, sample_size_b);
		pool.indirect_b = w.write_block(indirect, file_type, 1, true);

		pool.zap_root = w.write_block(encode_microzap({ { "a.txt", dirent_value(3) }, { "b.bin", dirent_value(4) } }), directory_type, 0, false);
		pool.zap_other = w.write_block(encode_microzap({ { "shared.txt", dirent_value(3) } }), directory_type, 0, false);

		pool.dnode_a = dnode_pointing_at(file_type, 6, sample_size_a, pool.data_a);
		pool.dnode_b = dnode_pointing_at(file_type, 8, sample_size_b, pool.indirect_b, 2, 2);
		pool.dnode_root = dnode_pointing_at(directory_type, 1, 2, pool.zap_root);
		pool.dnode_other = dnode_pointing_at(directory_type, 1, 1, pool.zap_other);

		bytes block(16384, 0);
		copy_into(block, sample_slot_root * 512, pool.dnode_root);
		copy_into(block, sample_slot_a * 512, pool.dnode_a);
		copy_into(block, sample_slot_b * 512, pool.dnode_b);
		if (with_other_directory)
			copy_into(block, sample_slot_other * 512, pool.dnode_other);
		pool.dnode_block = w.write_block(block, dnode_type, 0, true);

		pool.data_x = w.write_block(make_text(1536, 30), file_type, 0, false);
		pool.content_x = truncated(pool.data_x.logical, sample_size_x);
		pool.dnode_x = dnode_pointing_at(file_type, 3, sample_size_x, pool.data_x);
		bytes orphan(16384, 0);
		copy_into(orphan, sample_slot_x * 512, pool.dnode_x);
		pool.orphan_block = w.write_block(orphan, dnode_type, 0, true);

		dnode_spec meta;
		meta.type = dnode_type;
		meta.bonustype = 0;
		meta.datablkszsec = 32;
		meta.blkptrs.push_back(pool.dnode_block.pointer());
		pool.objset = w.write_block(encode_objset(encode_dnode(meta)), 11, 0, true);
	}

} // namespace test
} // namespace zfs_undelete
