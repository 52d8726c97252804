#pragma once

#include "fragment_set.hpp"
#include "pipeline_options.hpp"
#include "pipeline_stats.hpp"
#include "pool.hpp"
#include "reporter.hpp"

#include <stddef.h>
#include <vector>

namespace zfs_undelete
{

	struct pipeline_result
	{
		std::vector<content_hash> basic_fragments; // set content after Stage 1, ordered
		size_t stage2_roots = 0;
		size_t stage2_edges = 0;
		size_t expanded_fragments = 0; // set size after Stage 3
		size_t stage4_roots = 0;
		size_t stage4_edges = 0;
		std::vector<root_report> reports;
	};

	// checkpoint file names inside pipeline_options::checkpoint_dir
	extern const char* const scan_checkpoint_name;
	extern const char* const expansion_checkpoint_name;

	// Runs the five stages over 'set', which may already hold a loaded checkpoint
	// (pipeline_options::skip_scan). Reports are exported when output_dir is set.
	// Throws image_io_failure.
	pipeline_result run_undelete_pipeline(const zfs_pool& pool, fragment_set& set, const pipeline_options& options, pipeline_stats& stats);

} // namespace zfs_undelete
