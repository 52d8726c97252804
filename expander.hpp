#pragma once

#include "dependency_graph.hpp"
#include "fragment_set.hpp"
#include "pipeline_options.hpp"
#include "pipeline_stats.hpp"
#include "pool.hpp"

namespace zfs_undelete
{

	// Stage 3. Walks every root of 'graph' through the pool and adds what it finds to 'set':
	// indirect blocks, leaf data blocks, dnode slots with their objset placements, and one
	// composite per expanded object. Errors inside a branch are counted and leave a missing
	// extent behind. Throws image_io_failure.
	void expand_roots(const zfs_pool& pool, fragment_set& set, const dependency_graph& graph, const pipeline_options& options, pipeline_stats& stats);

} // namespace zfs_undelete
