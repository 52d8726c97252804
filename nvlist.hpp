#pragma once

#include <stdint.h>
#include <stddef.h>
#include <iosfwd>
#include <string>
#include <vector>
#include <utility>

namespace zfs_undelete
{

	struct nvlist;

	struct nvpair_value
	{
		// subset of data_type_t the vdev labels use
		enum kind_t
		{
			boolean,
			uint64,
			string,
			list,
			list_array,
			uint64_array,
			other,
		};

		kind_t kind = other;
		uint32_t data_type = 0;
		uint64_t u64 = 0;
		std::string str;
		std::vector<uint64_t> u64_array;
		std::vector<nvlist> lists; // one element for kind 'list'
	};

	struct nvlist
	{
		std::vector<std::pair<std::string, nvpair_value>> pairs;

		const nvpair_value* find(const std::string& name) const;
		bool get_uint64(const std::string& name, uint64_t& value) const;
		const std::string* get_string(const std::string& name) const;
		const nvlist* get_nvlist(const std::string& name) const;
		const std::vector<nvlist>* get_nvlist_array(const std::string& name) const;
	};

	std::ostream& operator << (std::ostream& os, const nvlist& list);

	// Decodes a packed nvlist in XDR encoding (the 4 byte nvs header included).
	// Throws malformed_structure.
	nvlist parse_xdr_nvlist(const uint8_t* data, size_t size);

} // namespace zfs_undelete
