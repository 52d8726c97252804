#pragma once

#include "fragment.hpp"
#include "block_pointer.hpp"
#include "zfs_decompress.hpp"

#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace zfs_undelete
{

	struct pipeline_options;

	struct classify_options
	{
		const pool_limits* limits = nullptr; // null when the pool geometry is unknown
		uint32_t ashift = 9;
		compression_algorithm compression = default_metadata_compression;
		std::vector<uint64_t> headerless_sizes;
		uint64_t max_indirect_block_size = 128 * 1024;
		uint64_t max_dnode_block_size = 16 * 1024;
	};

	classify_options make_classify_options(const pipeline_options& options, const pool_limits* limits, uint32_t ashift);

	// Physical sizes worth reading at a candidate offset, in the order they are tried.
	// 'head' is the start of the window, a few bytes are enough for framed compression.
	std::vector<uint64_t> candidate_physical_sizes(const uint8_t* head, size_t head_size, const classify_options& options);

	// Tests one window of exactly one candidate physical size.
	// Returns the basic fragments found in it: one ObjsetDNode, one IndirectBlock,
	// or one FileDNode/DirectoryDNode per slot of a dnode block. Empty means rejected.
	// Pure function, no IO.
	std::vector<fragment> classify_window(const uint8_t* window, size_t size, const zfs_data_address& location, const classify_options& options);

} // namespace zfs_undelete
