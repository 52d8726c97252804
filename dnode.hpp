#pragma once

#include "block_pointer.hpp"

#include <stdint.h>
#include <stddef.h>
#include <iosfwd>
#include <vector>

namespace zfs_undelete
{

	static constexpr size_t dnode_slot_size = 512;
	static constexpr size_t dnode_max_slots = 32;
	static constexpr size_t dnode_core_size = 64;

	// dmu_objset_type_t
	enum : uint64_t
	{
		objset_type_none = 0,
		objset_type_meta = 1,
		objset_type_zfs = 2,
		objset_type_zvol = 3,
		objset_type_other = 4,
	};

	// Parsed copy of a dnode_phys_t
	struct dnode_info
	{
		uint8_t type = 0;
		uint8_t indblkshift = 0;
		uint8_t nlevels = 0;
		uint8_t nblkptr = 0;
		uint8_t bonustype = 0;
		uint8_t checksum = 0;
		uint8_t compress = 0;
		uint8_t flags = 0;
		uint16_t datablkszsec = 0;
		uint16_t bonuslen = 0;
		uint8_t extra_slots = 0;
		uint64_t maxblkid = 0;
		uint64_t used = 0;
		std::vector<block_pointer_info> blkptrs;
		bool has_spill = false;
		block_pointer_info spill;
		std::vector<uint8_t> bonus;

		size_t slot_count() const { return size_t(extra_slots) + 1; }
		uint64_t data_block_size() const { return uint64_t(datablkszsec) << 9; }
		uint64_t indirect_block_size() const { return uint64_t(1) << indblkshift; }
		// block pointers per indirect block
		uint64_t pointers_per_indirect_block() const { return indirect_block_size() / block_pointer_size; }
		bool is_plain_file() const { return type == object_type_plain_file_contents; }
		bool is_directory() const { return type == object_type_directory_contents; }
	};

	std::ostream& operator << (std::ostream& os, const dnode_info& dnode);

	// 'data' starts at the dnode slot, 'size' is the number of bytes available
	// from there (a dnode can span several slots).
	// Returns false for free slots (type zero) and anything failing the shape checks.
	bool try_parse_dnode(const pool_limits* limits, const uint8_t* data, size_t size, dnode_info& info);

	// File size from the bonus buffer (znode or system attributes),
	// or (maxblkid + 1) * data block size when the bonus buffer is not usable.
	uint64_t dnode_logical_size(const dnode_info& dnode);

	struct objset_info
	{
		dnode_info meta_dnode;
		uint64_t type = objset_type_none;
	};

	// Decoded objset_phys_t, 1K (V1), 2K or 4K
	bool try_parse_objset(const pool_limits* limits, const uint8_t* data, size_t size, objset_info& info);

} // namespace zfs_undelete
