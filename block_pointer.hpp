#pragma once

#include "address.hpp"
#include "checksum.hpp"
#include "zfs_decompress.hpp"

#include <stdint.h>
#include <stddef.h>
#include <iosfwd>
#include <vector>

namespace zfs_undelete
{

	static constexpr size_t block_pointer_size = 128;
	static constexpr size_t dvas_per_block_pointer = 3;
	static constexpr size_t embedded_payload_max_size = 112;

	// DMU object types the recovery walks through, see dmu_object_type_t
	enum : uint8_t
	{
		object_type_none = 0,
		object_type_object_directory = 1,
		object_type_dnode = 10,
		object_type_objset = 11,
		object_type_znode = 17,
		object_type_plain_file_contents = 19,
		object_type_directory_contents = 20,
		object_type_master_node = 21,
		object_type_sa = 44,
	};

	const char* object_type_name(uint8_t type);
	bool is_valid_object_type(uint8_t type);

	// Bounds used to reject block pointers pointing outside of the pool
	struct pool_limits
	{
		uint32_t max_top_level_vdev_id = 0;
		uint64_t max_valid_dva_offset = 0; // in sectors
	};

	struct block_pointer_info
	{
		static constexpr size_t ADDR_COUNT = dvas_per_block_pointer;
		zfs_data_address address[ADDR_COUNT] = {};
		bool address_gang_flag[ADDR_COUNT] = {};
		compression_algorithm compression = compression_algorithm::off;
		checksum_algorithm checksum = checksum_algorithm::off;
		block_checksum checksum_value;
		uint8_t level = 0;
		uint8_t type = 0;
		uint64_t logical_birth = 0;
		uint64_t physical_birth = 0;
		uint64_t fill_count = 0;
		uint64_t lsize = 0;
		uint64_t psize = 0;
		bool hole = false;
		bool embedded = false;
		uint8_t embedded_type = 0;
		std::vector<uint8_t> embedded_data; // payload as stored, still compressed

		bool has_address() const { return !hole && !embedded; }
	};

	std::ostream& operator << (std::ostream& os, const block_pointer_info& info);

	// returns -1 if the 128 bytes can't be a block pointer
	// returns number of valid DVAs in the block pointer (zero for holes and embedded pointers)
	// 'limits' can be null when the pool geometry is unknown
	int try_parse_block_pointer(const pool_limits* limits, const uint8_t* raw, block_pointer_info& info);

	// Every 128 byte entry is appended to 'results', holes included, so the position
	// of an entry is its block id relative to the indirect block.
	// On failure nothing is appended.
	bool try_parse_indirect_block(const pool_limits* limits, const uint8_t* data, size_t data_size, std::vector<block_pointer_info>& results);

} // namespace zfs_undelete
