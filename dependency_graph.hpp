#pragma once

#include "fragment_set.hpp"
#include "pipeline_options.hpp"
#include "pipeline_stats.hpp"

#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace zfs_undelete
{

	// Directed graph over fragment hashes. Edges can be added from several threads,
	// finalize() sorts the adjacency lists before the graph is read.
	class dependency_graph
	{
	public:
		explicit dependency_graph(size_t shard_count = fragment_set::default_shard_count);
		dependency_graph(dependency_graph&&) = default;

		void add_node(const content_hash& node);
		// adds missing ends as nodes
		void add_edge(const content_hash& parent, const content_hash& child);
		void add_anomaly(const content_hash& node, uint32_t anomalies);

		// sorts and deduplicates the edge lists
		void finalize();

		bool contains(const content_hash& node) const;
		std::vector<content_hash> nodes() const;
		std::vector<content_hash> children(const content_hash& node) const;
		std::vector<content_hash> parents(const content_hash& node) const;
		bool has_edge(const content_hash& parent, const content_hash& child) const;
		size_t node_count() const { return edges_.size(); }
		size_t edge_count() const;
		uint32_t anomalies(const content_hash& node) const;

		// nodes without parents, ordered by hash
		std::vector<content_hash> roots() const;

	private:
		struct node_edges
		{
			std::vector<content_hash> children;
			std::vector<content_hash> parents;
			uint32_t anomalies = 0;
		};

		sharded_map<content_hash, node_edges, content_hash_hasher> edges_;
	};

	// Flags every node on a cycle with anomaly_cycle. Returns the number of back edges found.
	size_t find_cycles(dependency_graph& graph);

	// Stages 2 and 4. Links every fragment of the set to the fragments its content references.
	// Pure function of the set.
	dependency_graph build_dependency_graph(const fragment_set& set, const pipeline_options& options, pipeline_stats& stats);

} // namespace zfs_undelete
