#include "dependency_graph.hpp"
#include "objects.hpp"
#include "worker_pool.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_map>

namespace zfs_undelete
{

	namespace
	{
		void sort_unique(std::vector<content_hash>& v)
		{
			std::sort(v.begin(), v.end());
			v.erase(std::unique(v.begin(), v.end()), v.end());
		}

		class graph_linker
		{
		public:
			graph_linker(const fragment_set& set, dependency_graph& graph, const pipeline_options& options, pipeline_stats& stats)
				: set_(set), graph_(graph), options_(options), stats_(stats)
			{
			}

			void link(const fragment& f)
			{
				switch (f.kind)
				{
					case fragment_kind::file_dnode:
					case fragment_kind::directory_dnode:
					{
						dnode_info dnode;
						if (!try_parse_dnode_fragment(f, dnode))
							return;
						for (const block_pointer_info& bpi : dnode.blkptrs)
							link_pointer(f, bpi);
						if (dnode.has_spill)
							link_pointer(f, dnode.spill);
						if (f.kind == fragment_kind::directory_dnode)
							link_directory(f);
						return;
					}
					case fragment_kind::indirect_block:
					{
						const std::vector<uint8_t>& data = f.logical();
						std::vector<block_pointer_info> children;
						if (!try_parse_indirect_block(nullptr, data.data(), data.size(), children))
							return;
						for (const block_pointer_info& bpi : children)
							link_pointer(f, bpi);
						return;
					}
					case fragment_kind::objset_dnode:
					{
						const std::vector<uint8_t>& data = f.logical();
						objset_info os;
						if (!try_parse_objset(nullptr, data.data(), data.size(), os))
							return;
						for (const block_pointer_info& bpi : os.meta_dnode.blkptrs)
							link_pointer(f, bpi);
						return;
					}
					case fragment_kind::file_content:
					case fragment_kind::objset_content:
						if (f.composite)
							link_composite(f);
						return;
				}
			}

		private:
			void link_pointer(const fragment& parent, const block_pointer_info& bpi)
			{
				if (bpi.hole || bpi.embedded)
					return;
				if (bpi.checksum == checksum_algorithm::off || bpi.checksum_value.is_zero() || !is_checksum_supported(bpi.checksum))
				{
					++stats_.references_unresolved;
					return;
				}
				const content_hash target = make_physical_hash(bpi.checksum, bpi.checksum_value);
				if (set_.is_collision(target))
				{
					// distinct blocks share the digest, no edge can be trusted
					++stats_.collisions;
					if (options_.log)
					{
						std::ostringstream line;
						line << "reference to colliding hash " << target << " from " << parent.hash;
						log_line(options_.log, line.str());
					}
					return;
				}

				bool linked = false;
				if (fragment_set::fragment_ptr child = set_.find(target))
					if (child->location.address.size == bpi.psize)
					{
						graph_.add_edge(parent.hash, target);
						linked = true;
					}
				for (const slot_ref& slot : set_.slots_in_block(target))
					if (set_.contains(slot.hash))
					{
						graph_.add_edge(parent.hash, slot.hash);
						linked = true;
					}
				if (!linked && effective_checksum_algorithm(bpi.checksum) != default_metadata_checksum)
					linked = link_by_location(parent, bpi);

				if (linked)
					++stats_.references_resolved;
				else
					++stats_.references_unresolved;
			}

			// Scanned blocks are keyed by fletcher4. A pointer using another algorithm
			// is matched against the blocks found at its addresses.
			bool link_by_location(const fragment& parent, const block_pointer_info& bpi)
			{
				bool linked = false;
				for (size_t i = 0; i != block_pointer_info::ADDR_COUNT; ++i)
				{
					if (!is_valid(bpi.address[i]) || bpi.address_gang_flag[i])
						continue;
					for (const fragment_set::fragment_ptr& candidate : set_.at_location(bpi.address[i]))
					{
						if (candidate->raw.size() != bpi.psize)
							continue;
						if (compute_checksum(bpi.checksum, candidate->raw.data(), candidate->raw.size()) == bpi.checksum_value)
						{
							graph_.add_edge(parent.hash, candidate->hash);
							linked = true;
						}
					}
				}
				return linked;
			}

			void link_directory(const fragment& directory)
			{
				std::vector<object_placement> placements = set_.placements_of(directory.hash);
				if (placements.empty())
					return;
				std::vector<zap_entry> entries;
				if (!count_block_errors(stats_, options_.log, [&]() { entries = directory_entries(set_, directory); }))
					return;
				for (const object_placement& placement : placements)
					for (const zap_entry& entry : entries)
					{
						fragment_set::fragment_ptr child = set_.find_object(object_placement{ placement.objset, entry.get_object_id() });
						if (child)
						{
							graph_.add_edge(directory.hash, child->hash);
							++stats_.references_resolved;
						}
						else
							++stats_.references_unresolved;
					}
			}

			void link_composite(const fragment& composite)
			{
				if (set_.contains(composite.origin))
					graph_.add_edge(composite.origin, composite.hash);
				for (const fragment_extent& e : composite.extents)
					if (e.kind == fragment_extent::leaf && set_.contains(e.hash))
						graph_.add_edge(composite.hash, e.hash);
			}

			const fragment_set& set_;
			dependency_graph& graph_;
			const pipeline_options& options_;
			pipeline_stats& stats_;
		};
	}

	dependency_graph::dependency_graph(size_t shard_count) : edges_(shard_count)
	{
	}

	void dependency_graph::add_node(const content_hash& node)
	{
		edges_.with(node, [&](decltype(edges_)::map_type& m)
			{
				if (m.find(node) == m.end())
					m[node] = node_edges();
			});
	}

	void dependency_graph::add_edge(const content_hash& parent, const content_hash& child)
	{
		// one shard lock at a time
		edges_.with(parent, [&](decltype(edges_)::map_type& m)
			{
				m[parent].children.push_back(child);
			});
		edges_.with(child, [&](decltype(edges_)::map_type& m)
			{
				m[child].parents.push_back(parent);
			});
	}

	void dependency_graph::add_anomaly(const content_hash& node, uint32_t anomalies)
	{
		edges_.with(node, [&](decltype(edges_)::map_type& m)
			{
				m[node].anomalies |= anomalies;
			});
	}

	void dependency_graph::finalize()
	{
		for (const content_hash& node : nodes())
			edges_.with(node, [&](decltype(edges_)::map_type& m)
				{
					node_edges& e = m[node];
					sort_unique(e.children);
					sort_unique(e.parents);
				});
	}

	bool dependency_graph::contains(const content_hash& node) const
	{
		return edges_.with(node, [&](const decltype(edges_)::map_type& m)
			{
				return m.find(node) != m.end();
			});
	}

	std::vector<content_hash> dependency_graph::nodes() const
	{
		std::vector<content_hash> result;
		edges_.for_each([&result](const content_hash& node, const node_edges&)
			{
				result.push_back(node);
			});
		std::sort(result.begin(), result.end());
		return result;
	}

	std::vector<content_hash> dependency_graph::children(const content_hash& node) const
	{
		return edges_.with(node, [&](const decltype(edges_)::map_type& m)
			{
				auto it = m.find(node);
				return it == m.end() ? std::vector<content_hash>() : it->second.children;
			});
	}

	std::vector<content_hash> dependency_graph::parents(const content_hash& node) const
	{
		return edges_.with(node, [&](const decltype(edges_)::map_type& m)
			{
				auto it = m.find(node);
				return it == m.end() ? std::vector<content_hash>() : it->second.parents;
			});
	}

	bool dependency_graph::has_edge(const content_hash& parent, const content_hash& child) const
	{
		std::vector<content_hash> c = children(parent);
		return std::find(c.begin(), c.end(), child) != c.end();
	}

	size_t dependency_graph::edge_count() const
	{
		size_t result = 0;
		edges_.for_each([&result](const content_hash&, const node_edges& e)
			{
				result += e.children.size();
			});
		return result;
	}

	uint32_t dependency_graph::anomalies(const content_hash& node) const
	{
		return edges_.with(node, [&](const decltype(edges_)::map_type& m)
			{
				auto it = m.find(node);
				return it == m.end() ? uint32_t(0) : it->second.anomalies;
			});
	}

	std::vector<content_hash> dependency_graph::roots() const
	{
		std::vector<content_hash> result;
		edges_.for_each([&result](const content_hash& node, const node_edges& e)
			{
				if (e.parents.empty())
					result.push_back(node);
			});
		std::sort(result.begin(), result.end());
		return result;
	}

	size_t find_cycles(dependency_graph& graph)
	{
		enum color_t : uint8_t { white = 0, gray = 1, black = 2 };
		std::unordered_map<content_hash, color_t, content_hash_hasher> color;
		std::vector<content_hash> flagged;
		size_t back_edges = 0;

		struct frame
		{
			content_hash node;
			std::vector<content_hash> children;
			size_t next = 0;
		};

		for (const content_hash& start : graph.nodes())
		{
			if (color[start] != white)
				continue;
			std::vector<frame> stack;
			color[start] = gray;
			stack.push_back(frame{ start, graph.children(start), 0 });
			while (!stack.empty())
			{
				frame& top = stack.back();
				if (top.next == top.children.size())
				{
					color[top.node] = black;
					stack.pop_back();
					continue;
				}
				const content_hash child = top.children[top.next++];
				color_t& c = color[child];
				if (c == white)
				{
					c = gray;
					stack.push_back(frame{ child, graph.children(child), 0 });
				}
				else if (c == gray)
				{
					// every node on the stack from 'child' up is on the cycle
					++back_edges;
					for (size_t i = stack.size(); i-- != 0; )
					{
						flagged.push_back(stack[i].node);
						if (stack[i].node == child)
							break;
					}
				}
			}
		}
		for (const content_hash& node : flagged)
			graph.add_anomaly(node, anomaly_cycle);
		return back_edges;
	}

	dependency_graph build_dependency_graph(const fragment_set& set, const pipeline_options& options, pipeline_stats& stats)
	{
		dependency_graph graph;
		std::vector<fragment_set::fragment_ptr> fragments = set.snapshot();
		for (const fragment_set::fragment_ptr& f : fragments)
			graph.add_node(f->hash);

		graph_linker linker(set, graph, options, stats);
		parallel_for(fragments.size(), options.threads, [&](size_t idx)
			{
				linker.link(*fragments[idx]);
			});
		graph.finalize();

		stats.cycles_detected += find_cycles(graph);
		return graph;
	}

} // namespace zfs_undelete
