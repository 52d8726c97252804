#pragma once

#include "fragment_set.hpp"
#include "pipeline_options.hpp"
#include "pipeline_stats.hpp"
#include "pool.hpp"

#include <stdint.h>
#include <vector>

namespace zfs_undelete
{

	// byte range of one top-level vdev's DVA space
	struct scan_range
	{
		uint32_t vdev_id = 0;
		uint64_t begin = 0;
		uint64_t end = 0;
	};

	// Splits the scanned part of every selected vdev into worker sized ranges
	std::vector<scan_range> make_scan_ranges(const zfs_pool& pool, const pipeline_options& options);

	// Stage 1. Classifies a window at every 'scan_step' offset and inserts the
	// basic fragments found into 'set'. Throws image_io_failure.
	void scan_pool(const zfs_pool& pool, fragment_set& set, const pipeline_options& options, pipeline_stats& stats);

} // namespace zfs_undelete
