#include "expander.hpp"
#include "dnode.hpp"
#include "objects.hpp"
#include "worker_pool.hpp"
#include "errors.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <set>
#include <sstream>

namespace zfs_undelete
{

	namespace
	{
		constexpr uint64_t max_u64 = std::numeric_limits<uint64_t>::max();

		uint64_t saturating_add(uint64_t a, uint64_t b)
		{
			return b > max_u64 - a ? max_u64 : a + b;
		}

		uint64_t saturating_mul(uint64_t a, uint64_t b)
		{
			if (a != 0 && b > max_u64 / a)
				return max_u64;
			return a * b;
		}

		uint64_t saturating_pow(uint64_t base, unsigned exp)
		{
			uint64_t result = 1;
			for (unsigned i = 0; i != exp; ++i)
				result = saturating_mul(result, base);
			return result;
		}

		fragment_extent make_extent(fragment_extent::kind_t kind, uint64_t length)
		{
			fragment_extent e;
			e.kind = kind;
			e.length = length;
			return e;
		}

		fragment_extent make_leaf_extent(const content_hash& hash, uint64_t length)
		{
			fragment_extent e = make_extent(fragment_extent::leaf, length);
			e.hash = hash;
			return e;
		}

		// block tree of one object
		struct object_tree
		{
			uint64_t data_block_size = 0;
			uint64_t pointers_per_block = 0;
			uint64_t max_blkid = 0;
		};

		object_tree make_tree(const dnode_info& dnode)
		{
			object_tree tree;
			tree.data_block_size = dnode.data_block_size();
			tree.pointers_per_block = dnode.pointers_per_indirect_block();
			tree.max_blkid = dnode.maxblkid;
			return tree;
		}

		// level-0 blocks from 'first' a pointer spanning 'span' blocks covers inside the tree
		uint64_t block_count(const object_tree& tree, uint64_t first, uint64_t span)
		{
			if (span == 0 || first > tree.max_blkid)
				return 0;
			uint64_t remaining = tree.max_blkid - first;
			return span - 1 < remaining ? span : saturating_add(remaining, 1);
		}

		struct walk_state
		{
			std::set<content_hash> path; // indirect blocks being walked
			std::set<content_hash> expanded; // dnodes already expanded by this walk
		};

		typedef std::function<fragment_extent(const block_pointer_info& bpi, uint64_t blkid, uint64_t length)> leaf_handler;

		class root_expander
		{
		public:
			root_expander(const zfs_pool& pool, fragment_set& set, const pipeline_options& options, pipeline_stats& stats)
				: pool_(pool), set_(set), options_(options), stats_(stats)
			{
			}

			void expand(const fragment& root)
			{
				if (options_.log)
				{
					std::ostringstream line;
					line << "expanding " << root;
					log_line(options_.log, line.str());
				}
				walk_state state;
				switch (root.kind)
				{
					case fragment_kind::objset_dnode:
						expand_objset(root, state);
						break;
					case fragment_kind::file_dnode:
					case fragment_kind::directory_dnode:
						expand_dnode(root, nullptr, state);
						break;
					case fragment_kind::indirect_block:
						expand_indirect_root(root, state);
						break;
					case fragment_kind::file_content:
					case fragment_kind::objset_content:
						break;
				}
			}

		private:
			void note_malformed(const std::string& what)
			{
				++stats_.malformed_structures;
				log_line(options_.log, "malformed structure: " + what);
			}

			// The block behind 'bpi', from the set when a block with its checksum is known,
			// read from the pool otherwise. Throws what read_block throws.
			fragment_set::fragment_ptr fetch_block(const block_pointer_info& bpi, fragment_kind kind)
			{
				const bool keyed = bpi.checksum != checksum_algorithm::off && is_checksum_supported(bpi.checksum);
				content_hash hash;
				if (keyed)
				{
					hash = make_physical_hash(bpi.checksum, bpi.checksum_value);
					if (!set_.is_collision(hash))
						if (fragment_set::fragment_ptr known = set_.find(hash))
							if (!known->composite && known->location.address.size == bpi.psize)
								return known;
				}

				block_data block = pool_.read_block(bpi);
				++stats_.blocks_read;
				fragment f;
				f.kind = kind;
				f.raw = std::move(block.raw);
				f.decoded = std::move(block.decoded);
				f.hash = keyed ? hash : make_physical_hash(default_metadata_checksum, f.raw.data(), f.raw.size());
				f.block_hash = f.hash;
				f.location.address = block.address;
				f.location.address.size = bpi.psize;
				fragment_set::insert_result res = set_.insert(std::move(f));
				if (res.collision)
					++stats_.collisions;
				return res.stored;
			}

			void walk_children(const object_tree& tree, const std::vector<block_pointer_info>& pointers, unsigned level, uint64_t first_blkid,
				walk_state& state, const leaf_handler& leaf, std::vector<fragment_extent>& extents)
			{
				// level-0 blocks under one pointer of this level
				const uint64_t span = saturating_pow(tree.pointers_per_block, level);
				for (size_t i = 0; i != pointers.size(); ++i)
				{
					uint64_t first = saturating_add(first_blkid, saturating_mul(i, span));
					uint64_t count = block_count(tree, first, span);
					if (count == 0)
						break;
					walk_pointer(tree, pointers[i], level, first, saturating_mul(count, tree.data_block_size), state, leaf, extents);
				}
			}

			void walk_pointer(const object_tree& tree, const block_pointer_info& bpi, unsigned level, uint64_t first_blkid, uint64_t length,
				walk_state& state, const leaf_handler& leaf, std::vector<fragment_extent>& extents)
			{
				if (bpi.hole)
				{
					extents.push_back(make_extent(fragment_extent::hole, length));
					return;
				}
				if (bpi.level != level)
				{
					note_malformed("block pointer level " + std::to_string(bpi.level) + " where " + std::to_string(level) + " is expected");
					extents.push_back(make_extent(fragment_extent::missing, length));
					return;
				}
				if (level == 0)
				{
					if (bpi.embedded)
					{
						fragment_extent e = make_extent(fragment_extent::embedded, length);
						if (!count_block_errors(stats_, options_.log, [&]() { e.data = pool_.read_block(bpi).logical(); }))
							e = make_extent(fragment_extent::missing, length);
						extents.push_back(std::move(e));
					}
					else
						extents.push_back(leaf(bpi, first_blkid, length));
					return;
				}

				fragment_set::fragment_ptr indirect;
				if (!count_block_errors(stats_, options_.log, [&]() { indirect = fetch_block(bpi, fragment_kind::indirect_block); }))
				{
					extents.push_back(make_extent(fragment_extent::missing, length));
					return;
				}
				if (!state.path.insert(indirect->hash).second)
				{
					note_malformed("indirect block references itself");
					extents.push_back(make_extent(fragment_extent::missing, length));
					return;
				}
				std::vector<block_pointer_info> children;
				const std::vector<uint8_t>& data = indirect->logical();
				if (try_parse_indirect_block(&pool_.limits(), data.data(), data.size(), children) && children.size() == tree.pointers_per_block)
					walk_children(tree, children, level - 1, first_blkid, state, leaf, extents);
				else
				{
					note_malformed("unreadable indirect block at " + to_string(indirect->location.address));
					extents.push_back(make_extent(fragment_extent::missing, length));
				}
				state.path.erase(indirect->hash);
			}

			fragment_extent fetch_leaf(const block_pointer_info& bpi, uint64_t length)
			{
				fragment_set::fragment_ptr leaf;
				if (!count_block_errors(stats_, options_.log, [&]() { leaf = fetch_block(bpi, fragment_kind::file_content); }))
					return make_extent(fragment_extent::missing, length);
				return make_leaf_extent(leaf->hash, length);
			}

			// Adds the file and directory dnodes of one dnode block to the set, placing them
			// into 'objset' when it is known. Blocks whose slots were found by the scan are not read again.
			fragment_extent materialize_dnode_block(const block_pointer_info& bpi, uint64_t blkid, uint64_t length,
				const content_hash* objset, std::vector<content_hash>& found)
			{
				const uint64_t slots_per_block = length / dnode_slot_size;
				const bool keyed = bpi.checksum != checksum_algorithm::off && is_checksum_supported(bpi.checksum);
				content_hash block_hash;
				if (keyed)
				{
					block_hash = make_physical_hash(bpi.checksum, bpi.checksum_value);
					std::vector<slot_ref> known = set_.is_collision(block_hash) ? std::vector<slot_ref>() : set_.slots_in_block(block_hash);
					if (!known.empty())
					{
						for (const slot_ref& slot : known)
							place(slot.hash, slot.slot, blkid, slots_per_block, objset, found);
						return make_leaf_extent(block_hash, length);
					}
				}

				block_data block;
				if (!count_block_errors(stats_, options_.log, [&]() { block = pool_.read_block(bpi); }))
					return make_extent(fragment_extent::missing, length);
				++stats_.blocks_read;
				if (!keyed)
					block_hash = make_physical_hash(default_metadata_checksum, block.raw.data(), block.raw.size());

				const std::vector<uint8_t>& data = block.logical();
				std::vector<fragment> slots;
				size_t slot = 0;
				const size_t slot_count = data.size() / dnode_slot_size;
				while (slot < slot_count)
				{
					const uint8_t* ptr = data.data() + slot * dnode_slot_size;
					dnode_info dn;
					if (ptr[0] == object_type_none || !try_parse_dnode(&pool_.limits(), ptr, data.size() - slot * dnode_slot_size, dn))
					{
						++slot;
						continue;
					}
					if (dn.is_plain_file() || dn.is_directory())
					{
						fragment f;
						f.kind = dn.is_directory() ? fragment_kind::directory_dnode : fragment_kind::file_dnode;
						f.raw.assign(ptr, ptr + dn.slot_count() * dnode_slot_size);
						f.hash = make_slot_hash(f.raw.data(), f.raw.size());
						f.block_hash = block_hash;
						f.location.address = block.address;
						f.location.address.size = bpi.psize;
						f.location.slot = uint32_t(slot);
						slots.push_back(std::move(f));
					}
					slot += dn.slot_count();
				}

				// other walks sharing the block see all of its slots or none
				std::vector<uint32_t> indexes;
				for (const fragment& f : slots)
					indexes.push_back(f.location.slot);
				std::vector<fragment_set::insert_result> results = set_.insert_block(block_hash, std::move(slots));
				for (size_t i = 0; i != results.size(); ++i)
				{
					if (results[i].collision)
						++stats_.collisions;
					place(results[i].stored->hash, indexes[i], blkid, slots_per_block, objset, found);
				}
				return make_leaf_extent(block_hash, length);
			}

			void place(const content_hash& dnode, uint32_t slot, uint64_t blkid, uint64_t slots_per_block, const content_hash* objset, std::vector<content_hash>& found)
			{
				found.push_back(dnode);
				if (objset)
					set_.add_placement(object_placement{ *objset, blkid * slots_per_block + slot }, dnode);
			}

			void insert_composite(fragment&& composite)
			{
				seal_composite(composite);
				if (options_.log)
				{
					std::ostringstream line;
					line << "composite " << composite;
					log_line(options_.log, line.str());
				}
				fragment_set::insert_result res = set_.insert(std::move(composite));
				if (res.inserted)
					++stats_.composites_built;
				if (res.collision)
					++stats_.collisions;
			}

			void expand_objset(const fragment& objset, walk_state& state)
			{
				const std::vector<uint8_t>& data = objset.logical();
				objset_info os;
				if (!try_parse_objset(&pool_.limits(), data.data(), data.size(), os))
				{
					note_malformed("unreadable objset at " + to_string(objset.location.address));
					return;
				}
				const dnode_info& meta = os.meta_dnode;
				const object_tree tree = make_tree(meta);

				// first place every object, directories need the whole index to resolve entries
				std::vector<content_hash> found;
				std::vector<fragment_extent> extents;
				leaf_handler dnode_blocks = [&](const block_pointer_info& bpi, uint64_t blkid, uint64_t length)
					{
						return materialize_dnode_block(bpi, blkid, length, &objset.hash, found);
					};
				walk_children(tree, meta.blkptrs, unsigned(meta.nlevels - 1), 0, state, dnode_blocks, extents);

				fragment composite;
				composite.kind = fragment_kind::objset_content;
				composite.origin = objset.hash;
				composite.location = objset.location;
				composite.logical_size = saturating_mul(saturating_add(meta.maxblkid, 1), meta.data_block_size());
				composite.extents = std::move(extents);
				insert_composite(std::move(composite));

				for (const std::pair<uint64_t, content_hash>& object : set_.objects_of(objset.hash))
					if (fragment_set::fragment_ptr f = set_.find(object.second))
						expand_dnode(*f, &objset.hash, state);
			}

			void expand_dnode(const fragment& dnode_fragment, const content_hash* objset, walk_state& state)
			{
				if (!state.expanded.insert(dnode_fragment.hash).second)
					return;
				dnode_info dn;
				if (!try_parse_dnode_fragment(dnode_fragment, dn))
					return;

				const object_tree tree = make_tree(dn);
				std::vector<fragment_extent> extents;
				leaf_handler data_blocks = [&](const block_pointer_info& bpi, uint64_t, uint64_t length)
					{
						return fetch_leaf(bpi, length);
					};
				walk_children(tree, dn.blkptrs, unsigned(dn.nlevels - 1), 0, state, data_blocks, extents);
				if (dn.has_spill && dn.spill.has_address())
					fetch_leaf(dn.spill, dn.spill.lsize);

				fragment composite;
				composite.kind = fragment_kind::file_content;
				composite.origin = dnode_fragment.hash;
				composite.location = dnode_fragment.location;
				// a directory's znode size counts entries, its ZAP spans every block
				composite.logical_size = dn.is_directory()
					? saturating_mul(saturating_add(dn.maxblkid, 1), dn.data_block_size())
					: dnode_logical_size(dn);
				composite.extents = std::move(extents);
				insert_composite(std::move(composite));

				if (dn.is_directory())
					expand_directory(dnode_fragment, objset, state);
			}

			void expand_directory(const fragment& directory, const content_hash* objset, walk_state& state)
			{
				std::vector<zap_entry> entries;
				if (!count_block_errors(stats_, options_.log, [&]() { entries = directory_entries(set_, directory); }))
					return;

				std::vector<content_hash> objsets;
				if (objset)
					objsets.push_back(*objset);
				else
					for (const object_placement& placement : set_.placements_of(directory.hash))
						objsets.push_back(placement.objset);

				for (const content_hash& os : objsets)
					for (const zap_entry& entry : entries)
					{
						fragment_set::fragment_ptr child = set_.find_object(object_placement{ os, entry.get_object_id() });
						if (child)
							expand_dnode(*child, &os, state);
						else
							log_line(options_.log, "directory entry '" + entry.name + "' has no recovered dnode");
					}
			}

			// An indirect block without its dnode. DNODE blocks below it only yield slots,
			// data blocks give a composite whose size ends with the last block found.
			void expand_indirect_root(const fragment& root, walk_state& state)
			{
				const std::vector<uint8_t>& data = root.logical();
				std::vector<block_pointer_info> children;
				if (!try_parse_indirect_block(&pool_.limits(), data.data(), data.size(), children))
				{
					note_malformed("unreadable indirect block at " + to_string(root.location.address));
					return;
				}
				const block_pointer_info* first = nullptr;
				for (const block_pointer_info& bpi : children)
					if (!bpi.hole)
					{
						first = &bpi;
						break;
					}
				if (!first)
					return;

				const unsigned child_level = first->level;
				object_tree tree;
				tree.pointers_per_block = children.size();
				if (!find_data_block_size(*first, tree.data_block_size) || tree.data_block_size == 0)
					return;
				tree.max_blkid = saturating_pow(tree.pointers_per_block, child_level + 1) - 1;
				state.path.insert(root.hash);

				if (first->type == object_type_dnode)
				{
					std::vector<content_hash> found;
					std::vector<fragment_extent> extents;
					leaf_handler dnode_blocks = [&](const block_pointer_info& bpi, uint64_t blkid, uint64_t length)
						{
							return materialize_dnode_block(bpi, blkid, length, nullptr, found);
						};
					walk_children(tree, children, child_level, 0, state, dnode_blocks, extents);
					std::sort(found.begin(), found.end());
					found.erase(std::unique(found.begin(), found.end()), found.end());
					for (const content_hash& h : found)
						if (fragment_set::fragment_ptr f = set_.find(h))
							expand_dnode(*f, nullptr, state);
					return;
				}
				if (first->type != object_type_plain_file_contents && first->type != object_type_directory_contents)
					return;

				std::vector<fragment_extent> extents;
				leaf_handler data_blocks = [&](const block_pointer_info& bpi, uint64_t, uint64_t length)
					{
						return fetch_leaf(bpi, length);
					};
				walk_children(tree, children, child_level, 0, state, data_blocks, extents);

				// without a dnode the size ends with the last block holding data
				uint64_t size = 0;
				size_t used = 0;
				uint64_t offset = 0;
				for (size_t i = 0; i != extents.size(); ++i)
				{
					offset = saturating_add(offset, extents[i].length);
					if (extents[i].kind == fragment_extent::leaf || extents[i].kind == fragment_extent::embedded)
					{
						size = offset;
						used = i + 1;
					}
				}
				extents.resize(used);

				fragment composite;
				composite.kind = fragment_kind::file_content;
				composite.origin = root.hash;
				composite.location = root.location;
				composite.logical_size = size;
				composite.extents = std::move(extents);
				insert_composite(std::move(composite));
			}

			// data block size of the object, from the first level-0 pointer under 'bpi'
			bool find_data_block_size(const block_pointer_info& bpi, uint64_t& size)
			{
				if (bpi.level == 0)
				{
					size = bpi.lsize;
					return true;
				}
				fragment_set::fragment_ptr indirect;
				if (!count_block_errors(stats_, options_.log, [&]() { indirect = fetch_block(bpi, fragment_kind::indirect_block); }))
					return false;
				const std::vector<uint8_t>& data = indirect->logical();
				std::vector<block_pointer_info> children;
				if (!try_parse_indirect_block(&pool_.limits(), data.data(), data.size(), children))
					return false;
				for (const block_pointer_info& child : children)
					if (!child.hole && child.level + 1 == bpi.level)
						return find_data_block_size(child, size);
				return false;
			}

			const zfs_pool& pool_;
			fragment_set& set_;
			const pipeline_options& options_;
			pipeline_stats& stats_;
		};
	}

	void expand_roots(const zfs_pool& pool, fragment_set& set, const dependency_graph& graph, const pipeline_options& options, pipeline_stats& stats)
	{
		std::vector<fragment_set::fragment_ptr> roots;
		for (const content_hash& h : graph.roots())
			if (fragment_set::fragment_ptr f = set.find(h))
				roots.push_back(f);

		root_expander expander(pool, set, options, stats);
		parallel_for(roots.size(), options.threads, [&](size_t idx)
			{
				expander.expand(*roots[idx]);
			});
	}

} // namespace zfs_undelete
