#include "fragment_set.hpp"
#include "errors.hpp"

#include <algorithm>
#include <limits>
#include <string.h>

namespace zfs_undelete
{

	constexpr size_t fragment_set::default_shard_count;

	namespace
	{
		template<class T>
		void add_unique(std::vector<T>& v, const T& item)
		{
			if (std::find(v.begin(), v.end(), item) == v.end())
				v.push_back(item);
		}
	}

	fragment_set::fragment_set(size_t shard_count)
		: fragments_(shard_count)
		, collisions_(shard_count)
		, block_slots_(shard_count)
		, objects_(shard_count)
		, placements_(shard_count)
		, objset_objects_(shard_count)
		, composites_(shard_count)
		, locations_(shard_count)
	{
	}

	fragment_set::insert_result fragment_set::insert(fragment&& f)
	{
		return insert_fragment(std::move(f), true);
	}

	std::vector<fragment_set::insert_result> fragment_set::insert_block(const content_hash& block_hash, std::vector<fragment>&& slots)
	{
		std::vector<insert_result> results;
		std::vector<slot_ref> refs;
		for (fragment& f : slots)
		{
			refs.push_back(slot_ref{ f.location.slot, f.hash });
			results.push_back(insert_fragment(std::move(f), false));
		}
		if (refs.empty())
			return results;
		block_slots_.with(block_hash, [&](decltype(block_slots_)::map_type& m)
			{
				std::vector<slot_ref>& known = m[block_hash];
				for (const slot_ref& ref : refs)
					add_unique(known, ref);
			});
		return results;
	}

	fragment_set::insert_result fragment_set::insert_fragment(fragment&& f, bool index_slot)
	{
		const content_hash hash = f.hash;
		fragment_ptr incoming = std::make_shared<const fragment>(std::move(f));
		insert_result result;
		fragments_.with(hash, [&](decltype(fragments_)::map_type& m)
			{
				auto it = m.find(hash);
				if (it == m.end())
				{
					m[hash] = incoming;
					result.stored = incoming;
					result.inserted = true;
					return;
				}
				if (it->second->raw != incoming->raw)
					result.collision = true;
				// the lowest location wins whatever the insert order
				if (incoming->location < it->second->location)
					it->second = incoming;
				result.stored = it->second;
			});
		if (result.collision)
			add_collision(hash);

		if (index_slot && incoming->location.has_slot())
			add_block_slot(incoming->block_hash, slot_ref{ incoming->location.slot, hash });
		if (incoming->composite)
		{
			composites_.with(incoming->origin, [&](decltype(composites_)::map_type& m)
				{
					auto it = m.find(incoming->origin);
					if (it == m.end() || hash < it->second)
						m[incoming->origin] = hash;
				});
		}
		else if (!incoming->location.has_slot() && is_valid(incoming->location.address))
		{
			uint64_t key = location_key(incoming->location.address);
			locations_.with(key, [&](decltype(locations_)::map_type& m)
				{
					add_unique(m[key], hash);
				});
		}
		return result;
	}

	fragment_set::fragment_ptr fragment_set::find(const content_hash& hash) const
	{
		return fragments_.with(hash, [&](const decltype(fragments_)::map_type& m)
			{
				auto it = m.find(hash);
				return it == m.end() ? fragment_ptr() : it->second;
			});
	}

	std::vector<fragment_set::fragment_ptr> fragment_set::snapshot() const
	{
		std::vector<fragment_ptr> result;
		fragments_.for_each([&result](const content_hash&, const fragment_ptr& f)
			{
				result.push_back(f);
			});
		std::sort(result.begin(), result.end(), [](const fragment_ptr& lhs, const fragment_ptr& rhs) { return lhs->hash < rhs->hash; });
		return result;
	}

	std::vector<content_hash> fragment_set::hashes() const
	{
		std::vector<content_hash> result;
		fragments_.for_each([&result](const content_hash& h, const fragment_ptr&)
			{
				result.push_back(h);
			});
		std::sort(result.begin(), result.end());
		return result;
	}

	void fragment_set::add_collision(const content_hash& hash)
	{
		collisions_.with(hash, [&](decltype(collisions_)::map_type& m)
			{
				m[hash] = true;
			});
	}

	bool fragment_set::is_collision(const content_hash& hash) const
	{
		return collisions_.with(hash, [&](const decltype(collisions_)::map_type& m)
			{
				return m.find(hash) != m.end();
			});
	}

	std::vector<content_hash> fragment_set::collisions() const
	{
		std::vector<content_hash> result;
		collisions_.for_each([&result](const content_hash& h, bool)
			{
				result.push_back(h);
			});
		std::sort(result.begin(), result.end());
		return result;
	}

	void fragment_set::add_block_slot(const content_hash& block_hash, const slot_ref& slot)
	{
		block_slots_.with(block_hash, [&](decltype(block_slots_)::map_type& m)
			{
				add_unique(m[block_hash], slot);
			});
	}

	std::vector<slot_ref> fragment_set::slots_in_block(const content_hash& block_hash) const
	{
		std::vector<slot_ref> result = block_slots_.with(block_hash, [&](const decltype(block_slots_)::map_type& m)
			{
				auto it = m.find(block_hash);
				return it == m.end() ? std::vector<slot_ref>() : it->second;
			});
		std::sort(result.begin(), result.end());
		return result;
	}

	std::vector<std::pair<content_hash, slot_ref>> fragment_set::block_slots() const
	{
		std::vector<std::pair<content_hash, slot_ref>> result;
		block_slots_.for_each([&result](const content_hash& block_hash, const std::vector<slot_ref>& slots)
			{
				for (const slot_ref& slot : slots)
					result.emplace_back(block_hash, slot);
			});
		std::sort(result.begin(), result.end(), [](const std::pair<content_hash, slot_ref>& lhs, const std::pair<content_hash, slot_ref>& rhs)
			{
				return lhs.first != rhs.first ? lhs.first < rhs.first : lhs.second < rhs.second;
			});
		return result;
	}

	void fragment_set::add_placement(const object_placement& placement, const content_hash& dnode)
	{
		bool added = objects_.with(placement, [&](decltype(objects_)::map_type& m)
			{
				// one objset maps an object id to one dnode
				if (m.find(placement) != m.end())
					return false;
				m[placement] = dnode;
				return true;
			});
		if (!added)
			return;
		placements_.with(dnode, [&](decltype(placements_)::map_type& m)
			{
				add_unique(m[dnode], placement);
			});
		objset_objects_.with(placement.objset, [&](decltype(objset_objects_)::map_type& m)
			{
				m[placement.objset].emplace_back(placement.object_id, dnode);
			});
	}

	fragment_set::fragment_ptr fragment_set::find_object(const object_placement& placement) const
	{
		content_hash dnode;
		bool found = objects_.with(placement, [&](const decltype(objects_)::map_type& m)
			{
				auto it = m.find(placement);
				if (it == m.end())
					return false;
				dnode = it->second;
				return true;
			});
		return found ? find(dnode) : fragment_ptr();
	}

	std::vector<object_placement> fragment_set::placements_of(const content_hash& dnode) const
	{
		std::vector<object_placement> result = placements_.with(dnode, [&](const decltype(placements_)::map_type& m)
			{
				auto it = m.find(dnode);
				return it == m.end() ? std::vector<object_placement>() : it->second;
			});
		std::sort(result.begin(), result.end());
		return result;
	}

	std::vector<std::pair<uint64_t, content_hash>> fragment_set::objects_of(const content_hash& objset) const
	{
		std::vector<std::pair<uint64_t, content_hash>> result = objset_objects_.with(objset, [&](const decltype(objset_objects_)::map_type& m)
			{
				auto it = m.find(objset);
				return it == m.end() ? std::vector<std::pair<uint64_t, content_hash>>() : it->second;
			});
		std::sort(result.begin(), result.end());
		return result;
	}

	std::vector<std::pair<object_placement, content_hash>> fragment_set::placements() const
	{
		std::vector<std::pair<object_placement, content_hash>> result;
		objects_.for_each([&result](const object_placement& placement, const content_hash& dnode)
			{
				result.emplace_back(placement, dnode);
			});
		std::sort(result.begin(), result.end(), [](const std::pair<object_placement, content_hash>& lhs, const std::pair<object_placement, content_hash>& rhs)
			{
				return lhs.first < rhs.first;
			});
		return result;
	}

	fragment_set::fragment_ptr fragment_set::composite_of(const content_hash& origin) const
	{
		content_hash composite;
		bool found = composites_.with(origin, [&](const decltype(composites_)::map_type& m)
			{
				auto it = m.find(origin);
				if (it == m.end())
					return false;
				composite = it->second;
				return true;
			});
		return found ? find(composite) : fragment_ptr();
	}

	std::vector<fragment_set::fragment_ptr> fragment_set::at_location(const zfs_data_address& address) const
	{
		uint64_t key = location_key(address);
		std::vector<content_hash> hashes = locations_.with(key, [&](const decltype(locations_)::map_type& m)
			{
				auto it = m.find(key);
				return it == m.end() ? std::vector<content_hash>() : it->second;
			});
		std::sort(hashes.begin(), hashes.end());
		std::vector<fragment_ptr> result;
		for (const content_hash& h : hashes)
			if (fragment_ptr f = find(h))
				result.push_back(f);
		return result;
	}

	uint64_t content_size(const fragment& f)
	{
		if (!f.composite)
			return f.logical().size();
		uint64_t total = 0;
		for (const fragment_extent& e : f.extents)
		{
			if (e.length >= f.logical_size - total)
				return f.logical_size;
			total += e.length;
		}
		return total;
	}

	namespace
	{
		// composites nest one level (objset -> dnode block), deeper chains are damage
		constexpr unsigned max_composite_depth = 8;

		void visit_range(const fragment_set& set, const fragment& f, uint64_t begin, uint64_t end, unsigned depth, bool& complete, const content_visitor& visit)
		{
			if (!f.composite)
			{
				const std::vector<uint8_t>& bytes = f.logical();
				end = std::min<uint64_t>(end, bytes.size());
				if (begin < end)
					visit(begin, bytes.data() + begin, size_t(end - begin));
				return;
			}

			if ((f.anomalies & anomaly_incomplete) || depth > max_composite_depth)
				complete = false;
			if (depth > max_composite_depth)
				return;
			const uint64_t size = content_size(f);
			// extents end before the logical size
			if (size < f.logical_size)
				complete = false;
			end = std::min(end, size);

			uint64_t pos = 0;
			for (const fragment_extent& e : f.extents)
			{
				if (pos >= end)
					break;
				const uint64_t extent_end = pos + std::min(e.length, size - pos);
				if (extent_end > begin)
				{
					const uint64_t from = std::max(begin, pos) - pos;
					const uint64_t to = std::min(end, extent_end) - pos;
					switch (e.kind)
					{
						case fragment_extent::leaf:
						{
							fragment_set::fragment_ptr leaf = set.find(e.hash);
							if (!leaf)
							{
								complete = false;
								break;
							}
							const uint64_t base = pos;
							visit_range(set, *leaf, from, to, depth + 1, complete, [&](uint64_t offset, const uint8_t* data, size_t n)
								{
									visit(base + offset, data, n);
								});
							break;
						}
						case fragment_extent::embedded:
							if (from < e.data.size())
								visit(pos + from, e.data.data() + from, size_t(std::min<uint64_t>(to, e.data.size()) - from));
							break;
						case fragment_extent::missing:
							complete = false;
							break;
						case fragment_extent::hole:
							break;
					}
				}
				pos = extent_end;
			}
		}
	}

	void visit_content(const fragment_set& set, const fragment& f, uint64_t offset, uint64_t length, bool& complete, const content_visitor& visit)
	{
		const uint64_t end = length > std::numeric_limits<uint64_t>::max() - offset ? std::numeric_limits<uint64_t>::max() : offset + length;
		visit_range(set, f, offset, end, 0, complete, visit);
	}

	std::vector<uint8_t> read_content(const fragment_set& set, const fragment& f, uint64_t offset, uint64_t length, bool& complete)
	{
		const uint64_t size = content_size(f);
		if (offset >= size)
			return {};
		length = std::min(length, size - offset);
		if (length > max_assembled_size)
			throw malformed_structure("content range of " + std::to_string(length) + " bytes is too large to read");

		std::vector<uint8_t> out(size_t(length), 0);
		visit_content(set, f, offset, length, complete, [&](uint64_t pos, const uint8_t* data, size_t n)
			{
				::memcpy(out.data() + (pos - offset), data, n);
			});
		return out;
	}

	std::vector<uint8_t> assemble_content(const fragment_set& set, const fragment& f, bool& complete)
	{
		if (!f.composite)
			return f.logical();
		return read_content(set, f, 0, content_size(f), complete);
	}

} // namespace zfs_undelete
