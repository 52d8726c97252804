#pragma once

#include "dnode.hpp"
#include "fragment_set.hpp"
#include "zap.hpp"

#include <stdint.h>
#include <vector>

namespace zfs_undelete
{

	// the dnode held by a FileDNode or DirectoryDNode fragment
	bool try_parse_dnode_fragment(const fragment& f, dnode_info& dnode);

	// Bytes of a dnode fragment's object before it is expanded, when its only data block is
	// in the set. 'complete' is cleared otherwise.
	std::vector<uint8_t> object_content(const fragment_set& set, const fragment& dnode_fragment, bool& complete);

	// Entries of a directory dnode fragment, read block by block from its composite
	// or from its only data block. Empty when its ZAP is not in the set.
	// Throws malformed_structure or decompression_failure.
	std::vector<zap_entry> directory_entries(const fragment_set& set, const fragment& directory);

} // namespace zfs_undelete
