#pragma once

#include "zfs_decompress.hpp"

#include <stdint.h>
#include <stddef.h>
#include <iosfwd>
#include <string>
#include <vector>

namespace zfs_undelete
{

	struct pipeline_options
	{
		size_t threads = 0; // zero means one per core
		std::ostream* log = nullptr; // per candidate and per reference diagnostics

		// Stage 1
		uint64_t scan_step = 512;
		uint64_t scan_start = 0; // DVA byte offset
		uint64_t scan_end = 0; // zero means the end of each vdev
		uint64_t scan_range_size = 16 * 1024 * 1024; // bytes per worker task
		std::vector<uint32_t> vdev_ids; // empty means every top-level vdev
		bool progress = true;
		compression_algorithm metadata_compression = default_metadata_compression;
		// physical sizes tried for algorithms without a length header
		std::vector<uint64_t> headerless_sizes{ 1024, 2048, 4096, 16384, 131072 };
		uint64_t max_indirect_block_size = 128 * 1024;
		uint64_t max_dnode_block_size = 16 * 1024;

		// resume from a saved fragment set, Stage 1 is skipped
		bool skip_scan = false;

		std::string output_dir; // empty means no export
		std::string checkpoint_dir; // empty means no checkpoints
	};

} // namespace zfs_undelete
