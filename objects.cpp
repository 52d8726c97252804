#include "objects.hpp"
#include "errors.hpp"

namespace zfs_undelete
{

	bool try_parse_dnode_fragment(const fragment& f, dnode_info& dnode)
	{
		if (f.kind != fragment_kind::file_dnode && f.kind != fragment_kind::directory_dnode)
			return false;
		return try_parse_dnode(nullptr, f.raw.data(), f.raw.size(), dnode);
	}

	std::vector<uint8_t> object_content(const fragment_set& set, const fragment& dnode_fragment, bool& complete)
	{
		dnode_info dnode;
		if (!try_parse_dnode_fragment(dnode_fragment, dnode))
		{
			complete = false;
			return {};
		}
		// without a composite only a single level-0 block can be looked up directly
		if (dnode.nlevels != 1 || dnode.maxblkid != 0 || dnode.blkptrs.empty())
		{
			complete = false;
			return {};
		}
		const block_pointer_info& bpi = dnode.blkptrs[0];
		if (bpi.hole)
			return std::vector<uint8_t>(size_t(dnode.data_block_size()), 0);
		if (bpi.embedded)
		{
			std::vector<uint8_t> out;
			if (bpi.compression == compression_algorithm::off)
				out = bpi.embedded_data;
			else
				decompress(bpi.compression, bpi.embedded_data.data(), bpi.embedded_data.size(), bpi.lsize, out);
			return out;
		}
		if (bpi.checksum != checksum_algorithm::off)
			if (fragment_set::fragment_ptr leaf = set.find(make_physical_hash(bpi.checksum, bpi.checksum_value)))
				return leaf->logical();
		complete = false;
		return {};
	}

	std::vector<zap_entry> directory_entries(const fragment_set& set, const fragment& directory)
	{
		dnode_info dnode;
		if (directory.kind != fragment_kind::directory_dnode || !try_parse_dnode_fragment(directory, dnode))
			return {};
		const uint64_t block_size = dnode.data_block_size();
		bool complete = true;
		if (fragment_set::fragment_ptr composite = set.composite_of(directory.hash))
		{
			const uint64_t size = content_size(*composite);
			if (size == 0)
				return {};
			return parse_zap(size / block_size, block_size, [&](uint64_t blk_id)
				{
					return read_content(set, *composite, blk_id * block_size, block_size, complete);
				});
		}
		std::vector<uint8_t> content = object_content(set, directory, complete);
		if (content.empty())
			return {};
		return parse_zap(content.data(), content.size(), block_size);
	}

} // namespace zfs_undelete
