#include "pipeline.hpp"
#include "checkpoint.hpp"
#include "dependency_graph.hpp"
#include "expander.hpp"
#include "file.hpp"
#include "scanner.hpp"

#include <iostream>

namespace zfs_undelete
{

	const char* const scan_checkpoint_name = "stage1.fragments";
	const char* const expansion_checkpoint_name = "stage3.fragments";

	namespace
	{
		void save_checkpoint(const fragment_set& set, const pipeline_options& options, const char* name)
		{
			if (options.checkpoint_dir.empty())
				return;
			make_directory(options.checkpoint_dir);
			std::string path = options.checkpoint_dir + "/" + name;
			save_fragment_set(set, path);
			std::cout << "Saved " << set.size() << " fragments to " << path << std::endl ;
		}
	}

	pipeline_result run_undelete_pipeline(const zfs_pool& pool, fragment_set& set, const pipeline_options& options, pipeline_stats& stats)
	{
		pipeline_result result;

		if (options.skip_scan)
			std::cout << "Step 1. Skipped, resuming from " << set.size() << " fragments" << std::endl ;
		else
		{
			std::cout << "Step 1. Gathering basic fragments" << std::endl ;
			scan_pool(pool, set, options, stats);
			std::cout << "Found " << set.size() << " basic fragments" << std::endl ;
			save_checkpoint(set, options, scan_checkpoint_name);
		}
		result.basic_fragments = set.hashes();

		std::cout << "Step 2. Building dependency graph" << std::endl ;
		{
			dependency_graph graph = build_dependency_graph(set, options, stats);
			result.stage2_edges = graph.edge_count();
			result.stage2_roots = graph.roots().size();
			std::cout << graph.node_count() << " nodes, " << result.stage2_edges << " edges, " << result.stage2_roots << " roots" << std::endl ;

			std::cout << "Step 3. Expanding root fragments" << std::endl ;
			expand_roots(pool, set, graph, options, stats);
		}
		result.expanded_fragments = set.size();
		std::cout << "Set holds " << result.expanded_fragments << " fragments" << std::endl ;
		save_checkpoint(set, options, expansion_checkpoint_name);

		std::cout << "Step 4. Rebuilding dependency graph" << std::endl ;
		dependency_graph graph = build_dependency_graph(set, options, stats);
		result.stage4_edges = graph.edge_count();
		result.stage4_roots = graph.roots().size();
		std::cout << graph.node_count() << " nodes, " << result.stage4_edges << " edges, " << result.stage4_roots << " roots" << std::endl ;

		std::cout << "Step 5. Reporting root fragments" << std::endl ;
		result.reports = report_roots(set, graph);
		if (!options.output_dir.empty())
		{
			export_reports(set, result.reports, options.output_dir, &stats);
			std::cout << result.reports.size() << " roots exported to " << options.output_dir << std::endl ;
		}
		return result;
	}

} // namespace zfs_undelete
