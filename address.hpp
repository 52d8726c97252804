#pragma once

#include <stdint.h>
#include <stddef.h>
#include <iosfwd>
#include <string>

namespace zfs_undelete
{

	// data area of every leaf device starts after two labels and the boot block
	static constexpr uint64_t vdev_data_start = 0x400000;
	static constexpr uint64_t sector_size = 512;
	static constexpr unsigned sector_shift = 9;

	inline uint64_t dva_offset_to_physical_offset(uint64_t dva_offset)
	{
		// dva_offset is in 512b sectors
		return (dva_offset << sector_shift) + vdev_data_start;
	}

	inline uint64_t physical_offset_to_dva_offset(uint64_t physical_offset)
	{
		return (physical_offset - vdev_data_start) >> sector_shift;
	}

	// ZFS Data Virtual Address
	struct zfs_data_address
	{
		uint32_t vdev_id = 0;
		uint64_t offset = 0; // in sectors (512 bytes), starting from ZFS data start, see dva_offset_to_physical_offset function
		uint64_t size = 0; // in bytes

		uint64_t byte_offset() const { return offset << sector_shift; }

		bool operator == (const zfs_data_address& rhs) const
		{
			// size is not part of the identity of an address
			return vdev_id == rhs.vdev_id && offset == rhs.offset;
		}
		bool operator != (const zfs_data_address& rhs) const { return !(*this == rhs); }
		bool operator < (const zfs_data_address& rhs) const
		{
			return vdev_id != rhs.vdev_id ? vdev_id < rhs.vdev_id : offset < rhs.offset;
		}
	};

	// zdb notation: hex vdev:offset:size, offset in bytes
	std::ostream& operator << (std::ostream& os, const zfs_data_address& addr);

	std::string to_string(const zfs_data_address& addr);

	inline bool is_valid(const zfs_data_address& addr) { return addr.size != 0 || addr.offset != 0; }
	inline bool is_zero(const zfs_data_address& addr) { return addr.size == 0 && addr.offset == 0 && addr.vdev_id == 0; }

	// parses zdb style "vdev:offset:size" (all hex, offset in bytes)
	zfs_data_address parse_zfs_data_addr_string(const char* str, const char* str_end);
	zfs_data_address parse_zfs_data_addr_string(const std::string& str);

	// offset and size in bytes
	zfs_data_address dva_from_byte_offset(uint32_t vdev_id, uint64_t offset, uint64_t size);

} // namespace zfs_undelete
