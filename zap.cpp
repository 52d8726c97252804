#include "zap.hpp"
#include "errors.hpp"

#include <ostream>
#include <algorithm>
#include <set>
#include <utility>
#include <sstream>
#include <string.h>

#include "zfs_ondisk.hpp"

namespace zfs_undelete
{
	static_assert(sizeof(zap_leaf_phys_t::zap_leaf_header) == 48, "");

	namespace
	{
		constexpr uint16_t CHAIN_END = 0xffff;

		int high_bit(uint64_t some)
		{
			for (int i = 63; i >= 0; i--)
			{
				if (((uint64_t(1) << i) & some) != 0)
					return i;
			}
			throw malformed_structure("zero block size");
		}

		// Leaf geometry, see ZAP_LEAF_* macros
		struct leaf_layout
		{
			explicit leaf_layout(int block_shift)
				: block_size(size_t(1) << block_shift)
				, hash_entries(size_t(1) << (block_shift - 5))
				, chunk_table_offset(sizeof(zap_leaf_phys_t::zap_leaf_header) + hash_entries * sizeof(uint16_t))
				, chunk_count((block_size - 2 * hash_entries) / sizeof(zap_leaf_chunk_t) - 2)
			{}
			size_t block_size;
			size_t hash_entries;
			size_t chunk_table_offset;
			size_t chunk_count;
		};

		const zap_leaf_chunk_t& get_chunk(const uint8_t* leaf, const leaf_layout& layout, uint16_t idx)
		{
			if (idx >= layout.chunk_count)
				throw malformed_structure("ZAP chunk index out of range: " + std::to_string(idx));
			return get_mem_pod<zap_leaf_chunk_t>(leaf, layout.chunk_table_offset + sizeof(zap_leaf_chunk_t) * idx, layout.block_size);
		}

		void get_byte_array(const uint8_t* leaf, const leaf_layout& layout, uint16_t chunk_idx, size_t total_bytes, std::vector<uint8_t>& list)
		{
			// a chain can't be longer than the chunk table
			for (size_t hops = 0; total_bytes != 0; ++hops)
			{
				if (chunk_idx == CHAIN_END || hops == layout.chunk_count)
					throw malformed_structure("ZAP array chain ends early");
				const zap_leaf_chunk_t& chunk = get_chunk(leaf, layout, chunk_idx);
				if (chunk.l_array.la_type != ZAP_CHUNK_ARRAY)
					throw malformed_structure("Invalid zap chunk type, not ZAP_CHUNK_ARRAY");
				size_t to_read = total_bytes < ZAP_LEAF_ARRAY_BYTES ? total_bytes : ZAP_LEAF_ARRAY_BYTES;
				list.insert(list.end(), chunk.l_array.la_array, chunk.l_array.la_array + to_read);
				total_bytes -= to_read;
				chunk_idx = chunk.l_array.la_next;
			}
		}

		std::vector<zap_entry> parse_micro(const uint8_t* ptr, size_t length, uint64_t block_size)
		{
			std::vector<zap_entry> results;
			size_t chunk_count = block_size / sizeof(mzap_ent_phys_t) - 1;
			for (size_t i = 0; i != chunk_count; ++i)
			{
				const mzap_ent_phys_t& ent = get_mem_pod<mzap_ent_phys_t>(ptr, offsetof(mzap_phys_t, mz_chunk) + i * sizeof(mzap_ent_phys_t), length);
				if (ent.mze_name[0] == 0)
					continue;
				size_t name_len = ::strnlen(ent.mze_name, sizeof(ent.mze_name));
				if (name_len == sizeof(ent.mze_name))
					throw malformed_structure("microzap name is not terminated");
				IntegerArray value(IntegerArray::pod_type<uint64_t>(), 1);
				value.data<uint64_t>()[0] = ent.mze_value;
				results.emplace_back(std::string(ent.mze_name, name_len), std::move(value));
			}
			return results;
		}

		void parse_leaf(const uint8_t* leaf, const leaf_layout& layout, std::vector<zap_entry>& ret)
		{
			const zap_leaf_phys_t::zap_leaf_header& header = get_mem_pod<zap_leaf_phys_t::zap_leaf_header>(leaf, 0, layout.block_size);
			if (header.lh_magic != ZAP_LEAF_MAGIC)
				throw malformed_structure("wrong lh_magic");
			if (header.lh_block_type != ZBT_LEAF)
			{
				std::ostringstream err;
				err << "leaf.lh_block_type is not ZBT_LEAF, but " << std::hex << header.lh_block_type;
				throw malformed_structure(err.str());
			}

			size_t found = 0;
			for (size_t idx = 0; idx != layout.chunk_count; ++idx)
			{
				const zap_leaf_chunk_t& chunk = get_chunk(leaf, layout, uint16_t(idx));
				if (chunk.l_entry.le_type != ZAP_CHUNK_ENTRY)
					continue;
				const zap_leaf_chunk_t::zap_leaf_entry& entry = chunk.l_entry;
				std::vector<uint8_t> name_bytes;
				get_byte_array(leaf, layout, entry.le_name_chunk, entry.le_name_numints, name_bytes);
				size_t name_length = name_bytes.size();
				if (name_length != 0 && name_bytes[name_length - 1] == 0)
					--name_length;
				std::string name(reinterpret_cast<const char*>(name_bytes.data()), name_length);

				size_t intlen = entry.le_value_intlen;
				if (intlen != 1 && intlen != 2 && intlen != 4 && intlen != 8)
					throw malformed_structure("unknown ZAP value integer length " + std::to_string(intlen));
				std::vector<uint8_t> value_bytes;
				get_byte_array(leaf, layout, entry.le_value_chunk, intlen * entry.le_value_numints, value_bytes);
				ret.emplace_back(std::move(name), IntegerArray(intlen, std::move(value_bytes)));
				++found;
			}

			if (found != header.lh_nentries)
				throw malformed_structure("Did not find the correct number of entries in ZAP leaf: " + std::to_string(found) + " vs " + std::to_string(header.lh_nentries));
		}

		void read_pointer_table(const uint8_t* ptr, size_t length, uint64_t offset, uint64_t count, std::set<uint64_t>& blk_ids)
		{
			for (uint64_t i = 0; i != count; ++i)
				blk_ids.insert(get_mem_pod<uint64_t>(ptr, offset + i * sizeof(uint64_t), length));
		}
	}

	IntegerArray::IntegerArray(size_t element_size, std::vector<uint8_t>&& data)
		: data_(std::move(data))
		, element_size_(uint8_t(element_size))
	{
		if (element_size_ == 0 || data_.size() % element_size_ != 0)
			throw malformed_structure("IntegerArray, invalid data size");
		for (size_t i = 0, sz = size(); i != sz; ++i)
		{
			uint8_t* p = data_.data() + i * element_size_;
			for (size_t l = 0, r = element_size_ - 1; l < r; ++l, --r)
				std::swap(p[l], p[r]);
		}
	}

	uint64_t IntegerArray::get(size_t idx) const
	{
		if (idx >= size())
			throw malformed_structure("IntegerArray index out of range");
		const uint8_t* p = data_.data() + idx * element_size_;
		switch (element_size_)
		{
			case 1: return p[0];
			case 2: { uint16_t v; ::memcpy(&v, p, 2); return v; }
			case 4: { uint32_t v; ::memcpy(&v, p, 4); return v; }
			case 8: { uint64_t v; ::memcpy(&v, p, 8); return v; }
			default:
				throw malformed_structure("Unexpected IntegerArray element size");
		}
	}

	std::ostream& operator << (std::ostream& os, const zap_entry& ze)
	{
		os << "zap_entry{'" << ze.name << "', IntegerArray<" << (ze.value.element_size()*8) << "bit>{";
		for (size_t i = 0; i != ze.value.size(); ++i)
		{
			if (i != 0)
				os << ',';
			uint64_t value = ze.value.get(i);
			os << (ze.value.element_size() == 8 ? (value & ((uint64_t(1) << 48) - 1)) : value);
		}
		os << "}}";
		return os;
	}

	bool is_potential_zap_block(const uint8_t* data, size_t size)
	{
		if (size < sizeof(uint64_t) * 2)
			return false;
		uint64_t block_type;
		::memcpy(&block_type, data, sizeof(block_type));
		if (block_type == ZBT_MICRO)
			return size % sizeof(mzap_ent_phys_t) == 0;
		if (block_type != ZBT_HEADER)
			return false;
		uint64_t magic;
		::memcpy(&magic, data + sizeof(uint64_t), sizeof(magic));
		return magic == ZAP_MAGIC;
	}

	std::vector<zap_entry> parse_zap(uint64_t block_count, uint64_t block_size, const zap_block_reader& read_block)
	{
		if (block_size < 512 || (block_size & (block_size - 1)) != 0 || block_count == 0)
			throw malformed_structure("invalid ZAP block size " + std::to_string(block_size) + ", blocks=" + std::to_string(block_count));

		const std::vector<uint8_t> first = read_block(0);
		if (first.size() != block_size)
			throw malformed_structure("short ZAP header block");
		const uint8_t* ptr = first.data();
		const uint64_t block_type = get_mem_pod<uint64_t>(ptr, 0, block_size);
		if (block_type == ZBT_MICRO)
			return parse_micro(ptr, size_t(block_size), block_size);

		const zap_phys_t& header = get_mem_pod<zap_phys_t>(ptr, 0, block_size);
		if (header.zap_block_type != ZBT_HEADER)
			throw malformed_structure("not a header (zap_block_type is not ZBT_HEADER), blocks=" + std::to_string(block_count));
		if (header.zap_magic != ZAP_MAGIC)
			throw malformed_structure("Wrong magic");
		if (header.zap_ptrtbl.zt_shift >= 32)
			throw malformed_structure("ZAP pointer table too large");

		const int bs = high_bit(block_size);
		const uint64_t ptrtbl_entries = uint64_t(1) << header.zap_ptrtbl.zt_shift;

		std::set<uint64_t> blk_ids;
		if (header.zap_ptrtbl.zt_numblks == 0)
		{
			// the embedded block table is the second half of the first block
			uint64_t embedded_entries = block_size / 2 / sizeof(uint64_t);
			if (ptrtbl_entries > embedded_entries)
				throw malformed_structure("embedded ZAP pointer table overflows the header block");
			read_pointer_table(ptr, size_t(block_size), block_size / 2, ptrtbl_entries, blk_ids);
		}
		else
		{
			const uint64_t entries_per_block = block_size / sizeof(uint64_t);
			const uint64_t table_blocks = (ptrtbl_entries + entries_per_block - 1) / entries_per_block;
			if (header.zap_ptrtbl.zt_blk >= block_count || table_blocks > block_count - header.zap_ptrtbl.zt_blk)
				throw malformed_structure("ZAP pointer table outside of the object");
			for (uint64_t b = 0; b != table_blocks; ++b)
			{
				const std::vector<uint8_t> table = read_block(header.zap_ptrtbl.zt_blk + b);
				const uint64_t count = std::min(entries_per_block, ptrtbl_entries - b * entries_per_block);
				read_pointer_table(table.data(), table.size(), 0, count, blk_ids);
			}
		}
		if (blk_ids.empty())
			throw malformed_structure("ZAP pointer table is empty");

		// read the leaves
		std::vector<zap_entry> ret;
		const leaf_layout layout(bs);
		for (uint64_t blk_id : blk_ids)
		{
			if (blk_id == 0 || blk_id >= block_count)
				throw malformed_structure("ZAP leaf block id out of range: " + std::to_string(blk_id));
			const std::vector<uint8_t> leaf = read_block(blk_id);
			if (leaf.size() != block_size)
				throw malformed_structure("short ZAP leaf block " + std::to_string(blk_id));
			// unrecovered block
			if (get_mem_pod<uint64_t>(leaf.data(), 0, leaf.size()) == 0)
				continue;
			parse_leaf(leaf.data(), layout, ret);
		}
		return ret;
	}

	std::vector<zap_entry> parse_zap(const uint8_t* ptr, size_t length, uint64_t block_size)
	{
		if (block_size < 512 || (block_size & (block_size - 1)) != 0 || length < block_size)
			throw malformed_structure("invalid ZAP block size " + std::to_string(block_size) + ", length=" + std::to_string(length));
		return parse_zap(length / block_size, block_size, [&](uint64_t blk_id)
			{
				const uint8_t* block = ptr + blk_id * block_size;
				return std::vector<uint8_t>(block, block + block_size);
			});
	}

} // namespace zfs_undelete
