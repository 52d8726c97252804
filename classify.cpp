#include "classify.hpp"
#include "dnode.hpp"
#include "pipeline_options.hpp"
#include "errors.hpp"

#include <algorithm>
#include <string.h>

#include "zfs_ondisk.hpp"

namespace zfs_undelete
{

	namespace
	{
		constexpr size_t gang_header_size = 512;
		constexpr uint64_t min_indirect_block_size = 1024;

		uint64_t round_up(uint64_t value, uint64_t alignment)
		{
			return (value + alignment - 1) / alignment * alignment;
		}

		bool is_power_of_two(uint64_t v)
		{
			return v != 0 && (v & (v - 1)) == 0;
		}

		bool is_zero_filled(const uint8_t* data, size_t size)
		{
			for (size_t i = 0; i != size; ++i)
				if (data[i] != 0)
					return false;
			return true;
		}

		uint64_t max_physical_size(const classify_options& options)
		{
			return std::max<uint64_t>(std::max(options.max_indirect_block_size, options.max_dnode_block_size), 4096);
		}

		// gang headers end with a zio_eck_t, they are not fragments of their own
		bool looks_like_gang_header(const uint8_t* window, size_t size)
		{
			if (size != gang_header_size)
				return false;
			uint64_t magic;
			::memcpy(&magic, window + gang_header_size - sizeof(zio_eck_t), sizeof(magic));
			return magic == ZEC_MAGIC;
		}

		bool embedded_payload_decodes(const block_pointer_info& bpi)
		{
			if (bpi.compression == compression_algorithm::off)
				return bpi.embedded_data.size() >= bpi.lsize;
			std::vector<uint8_t> out;
			try
			{
				decompress(bpi.compression, bpi.embedded_data.data(), bpi.embedded_data.size(), bpi.lsize, out);
			}
			catch (const decompression_failure&)
			{
				return false;
			}
			catch (const malformed_structure&)
			{
				return false;
			}
			return true;
		}

		bool pointers_decode(const std::vector<block_pointer_info>& blkptrs)
		{
			for (const block_pointer_info& bpi : blkptrs)
				if (bpi.embedded && !embedded_payload_decodes(bpi))
					return false;
			return true;
		}

		// Logical bytes of the window. The whole window must be used by the compressed
		// stream plus the zero fill up to the physical size.
		bool decode_window(const uint8_t* window, size_t size, const classify_options& options, std::vector<uint8_t>& decoded)
		{
			decoded.clear();
			decompression_error error;
			const uint64_t sector = uint64_t(1) << options.ashift;
			auto fills_window = [&](size_t used)
				{
					return used != 0 && used <= size
						&& (round_up(used, sector_size) == size || round_up(used, sector) == size)
						&& is_zero_filled(window + used, size - used);
				};

			switch (options.compression)
			{
				case compression_algorithm::off:
					return true;
				case compression_algorithm::lz4:
				{
					size_t length = lz4_framed_length(window, size);
					if (length == 0 || !fills_window(length + sizeof(uint32_t)))
						return false;
					if (lz4_decompress(window, size, decoded, 0, error) == 0)
						return false;
					// compression is only kept when it saves space
					return is_power_of_two(decoded.size()) && decoded.size() > size;
				}
				case compression_algorithm::lzjb:
				case compression_algorithm::zle:
				{
					// no length header, try every logical size larger than the window
					for (uint64_t lsize = round_up(size + 1, sector_size); lsize <= max_physical_size(options); lsize *= 2)
					{
						if (!is_power_of_two(lsize))
							continue;
						decoded.clear();
						size_t used = options.compression == compression_algorithm::lzjb
							? lzjb_decompress(window, size, decoded, size_t(lsize), error)
							: zle_decompress(window, size, decoded, size_t(lsize), error);
						if (fills_window(used))
							return true;
					}
					decoded.clear();
					return false;
				}
				default:
					return false;
			}
		}

		bool try_objset(const uint8_t* data, size_t size, const classify_options& options)
		{
			objset_info os;
			if (!try_parse_objset(options.limits, data, size, os))
				return false;
			size_t non_hole = 0;
			for (const block_pointer_info& bpi : os.meta_dnode.blkptrs)
			{
				if (bpi.hole)
					continue;
				++non_hole;
				// the meta dnode maps dnode blocks, indirect or not
				if (bpi.type != object_type_dnode)
					return false;
			}
			return non_hole != 0 && pointers_decode(os.meta_dnode.blkptrs);
		}

		bool try_indirect(const uint8_t* data, size_t size, const classify_options& options)
		{
			if (!is_power_of_two(size) || size < min_indirect_block_size || size > options.max_indirect_block_size)
				return false;
			std::vector<block_pointer_info> children;
			if (!try_parse_indirect_block(options.limits, data, size, children))
				return false;
			const block_pointer_info* first = nullptr;
			for (const block_pointer_info& bpi : children)
			{
				if (bpi.hole)
					continue;
				if (!first)
					first = &bpi;
				else if (bpi.level != first->level || bpi.type != first->type)
					return false;
				if (bpi.embedded)
				{
					if (!embedded_payload_decodes(bpi))
						return false;
				}
				else if (bpi.checksum == checksum_algorithm::off || bpi.checksum_value.is_zero())
					return false;
			}
			return first != nullptr;
		}

		void try_dnode_block(const uint8_t* data, size_t size, const classify_options& options, std::vector<fragment>& slots)
		{
			slots.clear();
			if (size == 0 || size % dnode_slot_size != 0 || size > options.max_dnode_block_size)
				return;
			std::vector<fragment> found;
			size_t slot = 0;
			const size_t slot_count = size / dnode_slot_size;
			while (slot < slot_count)
			{
				const uint8_t* ptr = data + slot * dnode_slot_size;
				if (ptr[0] == object_type_none)
				{
					// freed and never used slots are zeroed
					if (!is_zero_filled(ptr, dnode_slot_size))
						return;
					++slot;
					continue;
				}
				dnode_info dn;
				if (!try_parse_dnode(options.limits, ptr, size - slot * dnode_slot_size, dn))
					return;
				if (!pointers_decode(dn.blkptrs))
					return;
				if (dn.is_plain_file() || dn.is_directory())
				{
					if (dn.bonustype != object_type_znode && dn.bonustype != object_type_sa)
						return;
					fragment f;
					f.kind = dn.is_directory() ? fragment_kind::directory_dnode : fragment_kind::file_dnode;
					f.raw.assign(ptr, ptr + dn.slot_count() * dnode_slot_size);
					f.hash = make_slot_hash(f.raw.data(), f.raw.size());
					f.location.slot = uint32_t(slot);
					found.push_back(std::move(f));
				}
				slot += dn.slot_count();
			}
			slots = std::move(found);
		}
	}

	classify_options make_classify_options(const pipeline_options& options, const pool_limits* limits, uint32_t ashift)
	{
		classify_options result;
		result.limits = limits;
		result.ashift = ashift;
		result.compression = options.metadata_compression;
		result.headerless_sizes = options.headerless_sizes;
		result.max_indirect_block_size = options.max_indirect_block_size;
		result.max_dnode_block_size = options.max_dnode_block_size;
		return result;
	}

	std::vector<uint64_t> candidate_physical_sizes(const uint8_t* head, size_t head_size, const classify_options& options)
	{
		std::vector<uint64_t> sizes;
		const uint64_t max_size = max_physical_size(options);
		if (options.compression == compression_algorithm::lz4)
		{
			uint64_t used = lz4_framed_length(head, head_size);
			if (used == 0)
				return sizes;
			used += sizeof(uint32_t);
			// psize is rounded to the smallest allocation unit of the pool
			for (uint64_t alignment : { uint64_t(1) << options.ashift, uint64_t(sector_size) })
			{
				uint64_t size = round_up(used, alignment);
				if (size <= max_size && std::find(sizes.begin(), sizes.end(), size) == sizes.end())
					sizes.push_back(size);
			}
			return sizes;
		}
		if (options.compression == compression_algorithm::off
			|| options.compression == compression_algorithm::lzjb
			|| options.compression == compression_algorithm::zle)
		{
			for (uint64_t size : options.headerless_sizes)
				if (size != 0 && size % sector_size == 0 && size <= max_size && std::find(sizes.begin(), sizes.end(), size) == sizes.end())
					sizes.push_back(size);
		}
		return sizes;
	}

	std::vector<fragment> classify_window(const uint8_t* window, size_t size, const zfs_data_address& location, const classify_options& options)
	{
		std::vector<fragment> result;
		if (size == 0 || looks_like_gang_header(window, size))
			return result;

		std::vector<uint8_t> decoded;
		if (!decode_window(window, size, options, decoded))
			return result;
		const uint8_t* data = decoded.empty() ? window : decoded.data();
		const size_t data_size = decoded.empty() ? size : decoded.size();

		zfs_data_address address = location;
		address.size = size;
		const content_hash block_hash = make_physical_hash(default_metadata_checksum, window, size);

		fragment_kind kind;
		if (try_objset(data, data_size, options))
			kind = fragment_kind::objset_dnode;
		else if (try_indirect(data, data_size, options))
			kind = fragment_kind::indirect_block;
		else
		{
			try_dnode_block(data, data_size, options, result);
			for (fragment& f : result)
			{
				f.block_hash = block_hash;
				f.location.address = address;
			}
			return result;
		}

		fragment f;
		f.kind = kind;
		f.raw.assign(window, window + size);
		f.decoded = std::move(decoded);
		f.hash = block_hash;
		f.block_hash = block_hash;
		f.location.address = address;
		result.push_back(std::move(f));
		return result;
	}

} // namespace zfs_undelete
