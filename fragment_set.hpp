#pragma once

#include "fragment.hpp"

#include <sparsehash/sparse_hash_map>

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace zfs_undelete
{

	// Hash map split into shards, each behind its own mutex.
	// Functions passed to with() run under the lock of the key's shard.
	template<class Key, class Value, class Hasher>
	class sharded_map
	{
	public:
		typedef google::sparse_hash_map<Key, Value, Hasher> map_type;

		explicit sharded_map(size_t shard_count) : shards_(shard_count == 0 ? 1 : shard_count) {}
		sharded_map(const sharded_map&) = delete;
		sharded_map& operator=(const sharded_map&) = delete;
		sharded_map(sharded_map&&) = default;

		template<class Fn>
		auto with(const Key& key, Fn&& fn)
		{
			shard& s = shards_[Hasher()(key) % shards_.size()];
			std::lock_guard<std::mutex> lock(s.mutex);
			return fn(s.map);
		}

		template<class Fn>
		auto with(const Key& key, Fn&& fn) const
		{
			const shard& s = shards_[Hasher()(key) % shards_.size()];
			std::lock_guard<std::mutex> lock(s.mutex);
			return fn(static_cast<const map_type&>(s.map));
		}

		template<class Fn>
		void for_each(Fn&& fn) const
		{
			for (const shard& s : shards_)
			{
				std::lock_guard<std::mutex> lock(s.mutex);
				for (const auto& item : s.map)
					fn(item.first, item.second);
			}
		}

		size_t size() const
		{
			size_t result = 0;
			for (const shard& s : shards_)
			{
				std::lock_guard<std::mutex> lock(s.mutex);
				result += s.map.size();
			}
			return result;
		}

	private:
		struct shard
		{
			mutable std::mutex mutex;
			map_type map;
		};
		std::vector<shard> shards_;
	};

	struct slot_ref
	{
		uint32_t slot = 0;
		content_hash hash;
	};

	inline bool operator == (const slot_ref& lhs, const slot_ref& rhs) { return lhs.slot == rhs.slot && lhs.hash == rhs.hash; }
	inline bool operator < (const slot_ref& lhs, const slot_ref& rhs) { return lhs.slot != rhs.slot ? lhs.slot < rhs.slot : lhs.hash < rhs.hash; }

	// object 'object_id' of the objset with hash 'objset'
	struct object_placement
	{
		content_hash objset;
		uint64_t object_id = 0;
	};

	inline bool operator == (const object_placement& lhs, const object_placement& rhs) { return lhs.objset == rhs.objset && lhs.object_id == rhs.object_id; }
	inline bool operator < (const object_placement& lhs, const object_placement& rhs)
	{
		return lhs.objset != rhs.objset ? lhs.objset < rhs.objset : lhs.object_id < rhs.object_id;
	}

	struct object_placement_hasher
	{
		size_t operator()(const object_placement& p) const { return content_hash_hasher()(p.objset) ^ size_t(p.object_id * 0x9E3779B97F4A7C15ULL); }
	};

	// Deduplicating store of fragments keyed by content hash.
	// Inserting the same bytes twice keeps the fragment with the lowest location;
	// the same hash with different bytes is recorded as a collision.
	class fragment_set
	{
	public:
		typedef std::shared_ptr<const fragment> fragment_ptr;

		static constexpr size_t default_shard_count = 64;

		struct insert_result
		{
			fragment_ptr stored;
			bool inserted = false;
			bool collision = false;
		};

		explicit fragment_set(size_t shard_count = default_shard_count);
		fragment_set(const fragment_set&) = delete;
		fragment_set& operator=(const fragment_set&) = delete;

		insert_result insert(fragment&& f);

		// Inserts the dnode slots decoded from one physical block. The block's slot list is
		// published once every slot is stored, slots_in_block never returns part of it.
		std::vector<insert_result> insert_block(const content_hash& block_hash, std::vector<fragment>&& slots);

		fragment_ptr find(const content_hash& hash) const;
		bool contains(const content_hash& hash) const { return find(hash) != nullptr; }
		size_t size() const { return fragments_.size(); }

		// every fragment, ordered by hash
		std::vector<fragment_ptr> snapshot() const;
		std::vector<content_hash> hashes() const;

		void add_collision(const content_hash& hash);
		bool is_collision(const content_hash& hash) const;
		std::vector<content_hash> collisions() const;

		// dnode slots held by the physical block with hash 'block_hash'
		void add_block_slot(const content_hash& block_hash, const slot_ref& slot);
		std::vector<slot_ref> slots_in_block(const content_hash& block_hash) const;
		std::vector<std::pair<content_hash, slot_ref>> block_slots() const;

		void add_placement(const object_placement& placement, const content_hash& dnode);
		fragment_ptr find_object(const object_placement& placement) const;
		std::vector<object_placement> placements_of(const content_hash& dnode) const;
		// object id and dnode hash of every object placed in the objset, by object id
		std::vector<std::pair<uint64_t, content_hash>> objects_of(const content_hash& objset) const;
		std::vector<std::pair<object_placement, content_hash>> placements() const;

		// the composite expanded from 'origin'
		fragment_ptr composite_of(const content_hash& origin) const;

		// physical block fragments read from the address
		std::vector<fragment_ptr> at_location(const zfs_data_address& address) const;

	private:
		insert_result insert_fragment(fragment&& f, bool index_slot);

		static uint64_t location_key(const zfs_data_address& address) { return (static_cast<uint64_t>(address.vdev_id) << 56) + address.offset; }

		sharded_map<content_hash, fragment_ptr, content_hash_hasher> fragments_;
		sharded_map<content_hash, bool, content_hash_hasher> collisions_;
		sharded_map<content_hash, std::vector<slot_ref>, content_hash_hasher> block_slots_;
		sharded_map<object_placement, content_hash, object_placement_hasher> objects_;
		sharded_map<content_hash, std::vector<object_placement>, content_hash_hasher> placements_;
		sharded_map<content_hash, std::vector<std::pair<uint64_t, content_hash>>, content_hash_hasher> objset_objects_;
		sharded_map<content_hash, content_hash, content_hash_hasher> composites_;
		sharded_map<uint64_t, std::vector<content_hash>, std::hash<uint64_t>> locations_;
	};

	// Bytes a fragment assembles to: the content of a leaf, or a composite's logical size
	// bounded by the extents it has.
	uint64_t content_size(const fragment& f);

	typedef std::function<void(uint64_t offset, const uint8_t* data, size_t size)> content_visitor;

	// Calls 'visit' in offset order for the data inside [offset, offset + length) of the
	// fragment's content. Holes and missing ranges are not visited, they read as zeros.
	// 'complete' is cleared when a leaf is not in the set or an extent is missing.
	void visit_content(const fragment_set& set, const fragment& f, uint64_t offset, uint64_t length, bool& complete, const content_visitor& visit);

	// 'length' bytes of the content from 'offset', zero filled, shorter only past the content's end
	std::vector<uint8_t> read_content(const fragment_set& set, const fragment& f, uint64_t offset, uint64_t length, bool& complete);

	// The whole content in memory. Throws malformed_structure when it is larger than max_assembled_size.
	static constexpr uint64_t max_assembled_size = uint64_t(1) << 30;
	std::vector<uint8_t> assemble_content(const fragment_set& set, const fragment& f, bool& complete);

} // namespace zfs_undelete
