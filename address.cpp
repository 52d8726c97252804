#include "address.hpp"
#include "errors.hpp"

#include <ostream>
#include <sstream>

namespace zfs_undelete
{

	namespace
	{
		template<typename UnsignedInt>
		UnsignedInt hex_str_to_int(const char* str, const char* str_end)
		{
			if (str == str_end)
				throw malformed_structure("Trying to hex parse an empty string");
			if (str_end - str > static_cast<ptrdiff_t>(sizeof(UnsignedInt) * 2))
				throw malformed_structure("hex value too large: " + std::string(str, str_end));
			UnsignedInt value = 0;
			for (const char* s = str; s != str_end; ++s)
			{
				char ch = *s;
				if ('0' <= ch && ch <= '9')
					value = (value << 4) + uint8_t(ch - '0');
				else if ('A' <= ch && ch <= 'F')
					value = (value << 4) + (uint8_t(ch - 'A') + 10);
				else if ('a' <= ch && ch <= 'f')
					value = (value << 4) + (uint8_t(ch - 'a') + 10);
				else
					throw malformed_structure("invalid hex string: " + std::string(str, str_end));
			}
			return value;
		}
	}

	std::ostream& operator << (std::ostream& os, const zfs_data_address& addr)
	{
		os << std::hex << addr.vdev_id << ':' << addr.byte_offset() << ':' << addr.size << std::dec;
		return os;
	}

	std::string to_string(const zfs_data_address& addr)
	{
		std::ostringstream s;
		s << addr;
		return s.str();
	}

	zfs_data_address parse_zfs_data_addr_string(const char* str, const char* str_end)
	{
		const char* separators[2] = {};
		size_t separator_count = 0;
		for (const char* s = str; s != str_end; ++s)
		{
			if (*s == ':')
			{
				if (separator_count == 2)
					throw malformed_structure("Error parsing ZFS data address: " + std::string(str, str_end));
				separators[separator_count++] = s;
			}
		}
		if (separator_count != 2)
			throw malformed_structure("Error parsing ZFS data address: " + std::string(str, str_end));
		uint32_t vdev_id = hex_str_to_int<uint32_t>(str, separators[0]);
		uint64_t offset = hex_str_to_int<uint64_t>(separators[0] + 1, separators[1]);
		uint64_t size = hex_str_to_int<uint64_t>(separators[1] + 1, str_end);
		return dva_from_byte_offset(vdev_id, offset, size);
	}

	zfs_data_address parse_zfs_data_addr_string(const std::string& str)
	{
		return parse_zfs_data_addr_string(str.c_str(), str.c_str() + str.size());
	}

	zfs_data_address dva_from_byte_offset(uint32_t vdev_id, uint64_t offset, uint64_t size)
	{
		if (offset % sector_size != 0)
			throw malformed_structure("Invalid offset in ZFS DVA, must be divisible by 512");
		return zfs_data_address{ vdev_id, offset >> sector_shift, size };
	}

} // namespace zfs_undelete
