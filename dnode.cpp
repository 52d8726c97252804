#include "dnode.hpp"

#include <limits>
#include <ostream>
#include <string.h>

#include "zfs_ondisk.hpp"

namespace zfs_undelete
{
	static_assert(sizeof(dnode_phys_t) == dnode_slot_size, "");
	static_assert(offsetof(dnode_phys_t, dn_blkptr) == dnode_core_size, "");
	static_assert(offsetof(objset_phys_t, os_type) == 704, "");
	static_assert(objset_type_zfs == DMU_OST_ZFS, "");

	namespace
	{
		constexpr uint32_t sa_magic = 0x2F505A;
		constexpr size_t znode_size_offset = 80;
		// the ZPL layout starts with mode, then size
		constexpr size_t sa_size_attribute_offset = 8;

		uint64_t read_u64(const uint8_t* ptr)
		{
			uint64_t v;
			::memcpy(&v, ptr, sizeof(v));
			return v;
		}
	}

	std::ostream& operator << (std::ostream& os, const dnode_info& dnode)
	{
		os << "dnode{type: " << object_type_name(dnode.type) << "[" << (int)dnode.type << "]"
			<< ", indblkshift=" << (int)dnode.indblkshift
			<< ", nlevels=" << (int)dnode.nlevels
			<< ", nblkptr=" << (int)dnode.nblkptr
			<< ", bonustype=" << object_type_name(dnode.bonustype) << "[" << (int)dnode.bonustype << "]"
			<< ", checksum=" << (int)dnode.checksum
			<< ", compress=" << (int)dnode.compress
			<< ", flags=" << (int)dnode.flags
			<< ", datablkszsec=" << dnode.datablkszsec
			<< ", bonuslen=" << dnode.bonuslen
			<< ", extra_slots=" << (int)dnode.extra_slots
			<< ", maxblkid=" << dnode.maxblkid
			<< ", used=" << dnode.used
			<< "}";
		for (const block_pointer_info& bpi : dnode.blkptrs)
			os << bpi;
		if (dnode.has_spill)
			os << "spill" << dnode.spill;
		return os;
	}

	bool try_parse_dnode(const pool_limits* limits, const uint8_t* data, size_t size, dnode_info& info)
	{
		info = dnode_info();
		if (size < sizeof(dnode_phys_t))
			return false;

		dnode_phys_t dn;
		::memcpy(&dn, data, sizeof(dn));

		if (dn.dn_type == DMU_OT_NONE || !is_valid_object_type(dn.dn_type))
			return false;
		if (dn.dn_nblkptr < 1 || dn.dn_nblkptr > DN_MAX_NBLKPTR)
			return false;
		if (dn.dn_nlevels < 1 || dn.dn_nlevels > DN_MAX_LEVELS)
			return false;
		if (dn.dn_indblkshift < DN_MIN_INDBLKSHIFT || dn.dn_indblkshift > DN_MAX_INDBLKSHIFT)
			return false;
		if (dn.dn_datablkszsec == 0 || (uint64_t(dn.dn_datablkszsec) << SPA_MINBLOCKSHIFT) > SPA_MAXBLOCKSIZE)
			return false;
		if (dn.dn_checksum >= checksum_algorithm_count || dn.dn_compress >= compression_algorithm_count)
			return false;
		if (dn.dn_bonustype != DMU_OT_NONE && !is_valid_object_type(dn.dn_bonustype))
			return false;

		// nblkptr pointers, nlevels deep, address no more level-0 blocks than this
		uint64_t capacity = dn.dn_nblkptr;
		for (unsigned level = 1; level < dn.dn_nlevels; ++level)
			capacity *= (uint64_t(1) << dn.dn_indblkshift) / block_pointer_size;
		if (dn.dn_maxblkid >= capacity)
			return false;

		size_t slots = size_t(dn.dn_extra_slots) + 1;
		if (slots > dnode_max_slots || slots * dnode_slot_size > size)
			return false;
		size_t dnode_size = slots * dnode_slot_size;
		bool has_spill = (dn.dn_flags & DNODE_FLAG_SPILL_BLKPTR) != 0;
		size_t bonus_offset = dnode_core_size + size_t(dn.dn_nblkptr) * block_pointer_size;
		size_t bonus_end = dnode_size - (has_spill ? block_pointer_size : 0);
		if (bonus_offset > bonus_end || dn.dn_bonuslen > bonus_end - bonus_offset)
			return false;

		info.type = dn.dn_type;
		info.indblkshift = dn.dn_indblkshift;
		info.nlevels = dn.dn_nlevels;
		info.nblkptr = dn.dn_nblkptr;
		info.bonustype = dn.dn_bonustype;
		info.checksum = dn.dn_checksum;
		info.compress = dn.dn_compress;
		info.flags = dn.dn_flags;
		info.datablkszsec = dn.dn_datablkszsec;
		info.bonuslen = dn.dn_bonuslen;
		info.extra_slots = dn.dn_extra_slots;
		info.maxblkid = dn.dn_maxblkid;
		info.used = dn.dn_used;

		info.blkptrs.resize(dn.dn_nblkptr);
		for (size_t i = 0; i != dn.dn_nblkptr; ++i)
		{
			if (try_parse_block_pointer(limits, data + dnode_core_size + i * block_pointer_size, info.blkptrs[i]) == -1)
				return false;
			// every pointer of a dnode describes the dnode's own tree
			const block_pointer_info& bpi = info.blkptrs[i];
			if (!bpi.hole && bpi.level + 1 != dn.dn_nlevels)
				return false;
		}
		if (has_spill)
		{
			info.has_spill = true;
			if (try_parse_block_pointer(limits, data + dnode_size - block_pointer_size, info.spill) == -1)
				return false;
		}
		info.bonus.assign(data + bonus_offset, data + bonus_offset + dn.dn_bonuslen);
		return true;
	}

	uint64_t dnode_logical_size(const dnode_info& dnode)
	{
		const uint64_t block_size = dnode.data_block_size();
		const uint64_t allocated_size = dnode.maxblkid >= std::numeric_limits<uint64_t>::max() / block_size
			? std::numeric_limits<uint64_t>::max()
			: (dnode.maxblkid + 1) * block_size;
		uint64_t size = allocated_size;
		if (dnode.bonustype == DMU_OT_ZNODE && dnode.bonus.size() >= znode_size_offset + sizeof(uint64_t))
		{
			size = read_u64(dnode.bonus.data() + znode_size_offset);
		}
		else if (dnode.bonustype == DMU_OT_SA && dnode.bonus.size() >= sizeof(uint32_t) + sizeof(uint16_t))
		{
			uint32_t magic;
			uint16_t layout_info;
			::memcpy(&magic, dnode.bonus.data(), sizeof(magic));
			::memcpy(&layout_info, dnode.bonus.data() + sizeof(magic), sizeof(layout_info));
			size_t header_size = size_t((layout_info >> 10) & 0x3f) * 8;
			if (magic == sa_magic && header_size != 0 && dnode.bonus.size() >= header_size + sa_size_attribute_offset + sizeof(uint64_t))
				size = read_u64(dnode.bonus.data() + header_size + sa_size_attribute_offset);
		}
		// a size from a stale or foreign bonus buffer can't exceed the blocks the dnode maps
		if (size > allocated_size)
			size = allocated_size;
		return size;
	}

	bool try_parse_objset(const pool_limits* limits, const uint8_t* data, size_t size, objset_info& info)
	{
		info = objset_info();
		if (size != 1024 && size != 2048 && size != 4096)
			return false;
		if (!try_parse_dnode(limits, data, size, info.meta_dnode))
			return false;
		if (info.meta_dnode.type != DMU_OT_DNODE || info.meta_dnode.extra_slots != 0)
			return false;
		info.type = read_u64(data + offsetof(objset_phys_t, os_type));
		if (info.type <= objset_type_none || info.type > objset_type_other)
			return false;
		return true;
	}

} // namespace zfs_undelete
