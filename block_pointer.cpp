#include "block_pointer.hpp"

#include <ostream>
#include <iomanip>
#include <string.h>

#include "zfs_ondisk.hpp"

namespace zfs_undelete
{
	static_assert(sizeof(blkptr_t) == block_pointer_size, "");
	static_assert(SPA_DVAS_PER_BP == dvas_per_block_pointer, "");
	static_assert(object_type_dnode == DMU_OT_DNODE, "");
	static_assert(object_type_objset == DMU_OT_OBJSET, "");
	static_assert(object_type_znode == DMU_OT_ZNODE, "");
	static_assert(object_type_plain_file_contents == DMU_OT_PLAIN_FILE_CONTENTS, "");
	static_assert(object_type_directory_contents == DMU_OT_DIRECTORY_CONTENTS, "");
	static_assert(object_type_master_node == DMU_OT_MASTER_NODE, "");
	static_assert(object_type_sa == DMU_OT_SA, "");

	namespace
	{
		// word indexes inside blkptr_t
		constexpr size_t prop_word = 6;
		constexpr size_t physical_birth_word = 9;
		constexpr size_t logical_birth_word = 10;

		uint64_t bp_word(const blkptr_t& ptr, size_t idx)
		{
			uint64_t w;
			::memcpy(&w, reinterpret_cast<const uint8_t*>(&ptr) + idx * sizeof(uint64_t), sizeof(w));
			return w;
		}

		// see decode_embedded_bp_compressed
		void decode_embedded_payload(const blkptr_t& ptr, size_t psize, std::vector<uint8_t>& out)
		{
			out.resize(psize);
			size_t word_idx = 0;
			uint64_t w = 0;
			for (size_t i = 0; i != psize; ++i)
			{
				if (i % sizeof(uint64_t) == 0)
				{
					if (word_idx == prop_word || word_idx == logical_birth_word)
						++word_idx;
					w = bp_word(ptr, word_idx++);
				}
				out[i] = uint8_t(w >> ((i % sizeof(uint64_t)) * 8));
			}
		}

		bool is_dva_empty(const dva_t& dva)
		{
			return dva.dva_word[0] == 0 && dva.dva_word[1] == 0;
		}
	}

	const char* object_type_name(uint8_t type)
	{
		switch (type)
		{
			case object_type_none: return "unallocated";
			case object_type_object_directory: return "object directory";
			case object_type_dnode: return "DMU dnode";
			case object_type_objset: return "DMU objset";
			case object_type_znode: return "ZFS znode";
			case object_type_plain_file_contents: return "ZFS plain file";
			case object_type_directory_contents: return "ZFS directory";
			case object_type_master_node: return "ZFS master node";
			case object_type_sa: return "SA";
			default: return is_valid_object_type(type) ? "other" : "UNKNOWN";
		}
	}

	bool is_valid_object_type(uint8_t type)
	{
		if (type < DMU_OT_NUMTYPES)
			return true;
		return (type & DMU_OT_NEWTYPE) && ((type & DMU_OT_BYTESWAP_MASK) < DMU_BSWAP_NUMFUNCS);
	}

	std::ostream& operator << (std::ostream& os, const block_pointer_info& info)
	{
		os << "{" ;
		bool first = true;
		for (size_t i = 0; i != block_pointer_info::ADDR_COUNT; ++i)
			if (is_valid(info.address[i]))
			{
				if (!first)
					os << ", " ;
				first = false;
				os << "dva[" << info.address[i]
					<< ", gang=" << (info.address_gang_flag[i] ? 'Y' : 'N')
					<< "]";
			}
		if (info.hole)
			os << (first ? "" : ", ") << "HOLE";
		os << ", compr=" << compression_algorithm_name(info.compression);
		os << ", cksum=" << checksum_algorithm_name(info.checksum) << '[' << info.checksum_value << ']';
		os << ", level=" << (unsigned)info.level;
		os << ", type=" << object_type_name(info.type) << '[' << (unsigned)info.type << ']';
		os << ", birth=" << std::dec << info.logical_birth << '/' << info.physical_birth;
		os << ", fill_count=" << info.fill_count;
		os << ", embedded=" << (info.embedded ? "True" : "False");
		os << ", lsize=" << info.lsize << ", psize=" << info.psize;
		os << "}" ;
		return os;
	}

	int try_parse_block_pointer(const pool_limits* limits, const uint8_t* raw, block_pointer_info& info)
	{
		info = block_pointer_info();

		blkptr_t ptr;
		::memcpy(&ptr, raw, sizeof(ptr));

		static_assert(sizeof(blkptr_t)%8 == 0, "");
		bool all_zeroes = true;
		for (size_t i = 0; i != (sizeof(blkptr_t)/8); ++i)
			if (bp_word(ptr, i) != 0)
			{
				all_zeroes = false;
				break;
			}
		if (all_zeroes)
		{
			info.hole = true;
			return 0;
		}

		if (BP_GET_COMPRESS(&ptr) >= compression_algorithm_count
			|| !is_valid_object_type(BP_GET_TYPE(&ptr))
			|| BP_GET_LEVEL(&ptr) >= DN_MAX_LEVELS
			)
		{
			return -1;
		}

		info.compression = static_cast<compression_algorithm>(BP_GET_COMPRESS(&ptr));
		info.level = BP_GET_LEVEL(&ptr);
		info.type = BP_GET_TYPE(&ptr);
		info.logical_birth = bp_word(ptr, logical_birth_word);
		info.embedded = BP_IS_EMBEDDED(&ptr);

		if (info.embedded)
		{
			// embedded data lives in the pointer itself, it has no checksum and no DVAs
			if (BPE_GET_ETYPE(&ptr) != BP_EMBEDDED_TYPE_DATA || info.level != 0)
				return -1;
			info.embedded_type = BPE_GET_ETYPE(&ptr);
			info.lsize = BPE_GET_LSIZE(&ptr);
			info.psize = BPE_GET_PSIZE(&ptr);
			if (info.psize > embedded_payload_max_size || info.lsize > SPA_MAXBLOCKSIZE || info.psize > info.lsize)
				return -1;
			info.physical_birth = info.logical_birth;
			info.fill_count = 1;
			info.checksum = checksum_algorithm::off;
			decode_embedded_payload(ptr, info.psize, info.embedded_data);
			return 0;
		}

		if (BP_GET_CHECKSUM(&ptr) >= checksum_algorithm_count)
			return -1;
		info.checksum = static_cast<checksum_algorithm>(BP_GET_CHECKSUM(&ptr));
		for (size_t i = 0; i != 4; ++i)
			info.checksum_value.word[i] = ptr.blk_cksum.zc_word[i];
		info.lsize = BP_GET_LSIZE(&ptr);
		info.psize = BP_GET_PSIZE(&ptr);
		info.fill_count = ptr.blk_fill;
		info.physical_birth = bp_word(ptr, physical_birth_word);
		if (info.physical_birth == 0)
			info.physical_birth = info.logical_birth;

		if (is_dva_empty(ptr.blk_dva[0]))
		{
			// hole with a recorded birth time or size
			info.hole = true;
			return 0;
		}

		if (info.lsize > SPA_MAXBLOCKSIZE || info.psize > info.lsize)
			return -1;
		if (info.compression == compression_algorithm::off && info.psize != info.lsize)
			return -1;

		size_t valid_ptr_count = 0;
		for (size_t dva_idx = 0; dva_idx != SPA_DVAS_PER_BP; ++dva_idx)
		{
			const dva_t& dva = ptr.blk_dva[dva_idx];
			if (is_dva_empty(dva))
				continue;
			uint32_t vdev_id = DVA_GET_VDEV(&dva);
			uint64_t offset = (DVA_GET_OFFSET(&dva) >> SPA_MINBLOCKSHIFT);
			uint64_t size = DVA_GET_ASIZE(&dva);
			bool gang = DVA_GET_GANG(&dva);
			if (size == 0 || (!gang && size < info.psize))
				return -1;
			if (limits && (vdev_id > limits->max_top_level_vdev_id || offset + (size >> SPA_MINBLOCKSHIFT) > limits->max_valid_dva_offset))
				return -1;
			info.address[dva_idx].vdev_id = vdev_id;
			info.address[dva_idx].offset = offset;
			info.address[dva_idx].size = size;
			info.address_gang_flag[dva_idx] = gang;
			++valid_ptr_count;
		}
		return valid_ptr_count;
	}

	bool try_parse_indirect_block(const pool_limits* limits, const uint8_t* data, size_t data_size, std::vector<block_pointer_info>& results)
	{
		if (data_size < sizeof(blkptr_t) || data_size % sizeof(blkptr_t) != 0)
			return false;

		size_t results_initial_size = results.size();

		for (size_t blk_ptr_offset = 0; blk_ptr_offset + sizeof(blkptr_t) <= data_size; blk_ptr_offset += sizeof(blkptr_t))
		{
			block_pointer_info info;
			int parse_res = try_parse_block_pointer(limits, data + blk_ptr_offset, info);
			if (parse_res == -1)
			{
				results.resize(results_initial_size);
				return false;
			}
			results.push_back(std::move(info));
		}

		return true;
	}

} // namespace zfs_undelete
