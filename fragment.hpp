#pragma once

#include "address.hpp"
#include "checksum.hpp"

#include <stdint.h>
#include <stddef.h>
#include <iosfwd>
#include <string>
#include <vector>

namespace zfs_undelete
{

	// Separate key spaces, equal bytes in different roles never merge
	enum class hash_domain : uint8_t
	{
		physical_block = 0, // raw bytes of one block as stored
		slot = 1, // one dnode out of a decoded dnode block
		composite = 2, // serialized extent table of a composite fragment
	};

	struct content_hash
	{
		hash_domain domain = hash_domain::physical_block;
		checksum_algorithm algorithm = checksum_algorithm::off;
		block_checksum value;
	};

	inline bool operator == (const content_hash& lhs, const content_hash& rhs)
	{
		return lhs.domain == rhs.domain && lhs.algorithm == rhs.algorithm && lhs.value == rhs.value;
	}
	inline bool operator != (const content_hash& lhs, const content_hash& rhs) { return !(lhs == rhs); }
	inline bool operator < (const content_hash& lhs, const content_hash& rhs)
	{
		if (lhs.domain != rhs.domain)
			return lhs.domain < rhs.domain;
		if (lhs.algorithm != rhs.algorithm)
			return lhs.algorithm < rhs.algorithm;
		return lhs.value < rhs.value;
	}

	struct content_hash_hasher
	{
		size_t operator()(const content_hash& h) const
		{
			// the words are checksums already
			return size_t(h.value.word[0] ^ (h.value.word[1] << 1) ^ h.value.word[3] ^ (uint64_t(h.domain) << 62));
		}
	};

	std::ostream& operator << (std::ostream& os, const content_hash& h);

	// 64 hex digits, used in exported file names
	std::string to_hex(const content_hash& h);

	// digest of a block as referenced by a block pointer using 'algorithm'
	content_hash make_physical_hash(checksum_algorithm algorithm, const uint8_t* data, size_t size);
	content_hash make_physical_hash(checksum_algorithm algorithm, const block_checksum& value);
	content_hash make_slot_hash(const uint8_t* data, size_t size);
	content_hash make_composite_hash(const uint8_t* data, size_t size);

	enum class fragment_kind : uint8_t
	{
		file_dnode = 0,
		directory_dnode = 1,
		objset_dnode = 2,
		indirect_block = 3,
		file_content = 4,
		objset_content = 5,
	};

	const char* fragment_kind_name(fragment_kind kind);

	bool is_file_like(fragment_kind kind);

	// anomaly flags
	enum : uint32_t
	{
		anomaly_checksum_collision = 1,
		anomaly_incomplete = 2,
		anomaly_cycle = 4,
	};

	std::string anomaly_names(uint32_t anomalies);

	struct physical_location
	{
		static constexpr uint32_t no_slot = 0xFFFFFFFF;

		zfs_data_address address; // size is the physical size of the block
		uint32_t slot = no_slot; // dnode slot inside the block

		bool has_slot() const { return slot != no_slot; }
	};

	inline bool operator == (const physical_location& lhs, const physical_location& rhs)
	{
		return lhs.address == rhs.address && lhs.address.size == rhs.address.size && lhs.slot == rhs.slot;
	}
	inline bool operator != (const physical_location& lhs, const physical_location& rhs) { return !(lhs == rhs); }
	inline bool operator < (const physical_location& lhs, const physical_location& rhs)
	{
		if (lhs.address != rhs.address)
			return lhs.address < rhs.address;
		if (lhs.address.size != rhs.address.size)
			return lhs.address.size < rhs.address.size;
		return lhs.slot < rhs.slot;
	}

	std::ostream& operator << (std::ostream& os, const physical_location& location);

	// One logical range of a composite fragment
	struct fragment_extent
	{
		enum kind_t : uint8_t
		{
			leaf = 0, // content of a leaf fragment
			hole = 1, // zero fill
			embedded = 2, // bytes stored in the block pointer
			missing = 3, // branch could not be read, zero fill
		};

		kind_t kind = hole;
		uint64_t length = 0;
		content_hash hash; // leaf
		std::vector<uint8_t> data; // embedded, decoded
	};

	struct fragment
	{
		content_hash hash;
		// hash of the containing physical block, same as 'hash' for physical block fragments
		content_hash block_hash;
		physical_location location;
		fragment_kind kind = fragment_kind::file_content;
		bool composite = false;
		uint32_t anomalies = 0;
		std::vector<uint8_t> raw;
		std::vector<uint8_t> decoded; // empty when stored uncompressed

		// composites only
		content_hash origin; // fragment the composite was expanded from
		uint64_t logical_size = 0;
		std::vector<fragment_extent> extents;

		const std::vector<uint8_t>& logical() const { return decoded.empty() ? raw : decoded; }
	};

	std::ostream& operator << (std::ostream& os, const fragment& f);

	// Fills 'raw' and 'hash' of a composite from its origin, kind, size and extents
	void seal_composite(fragment& f);

	// Rebuilds origin, kind, size and extents of a composite from its 'raw' table.
	// Throws malformed_structure.
	void unseal_composite(fragment& f);

} // namespace zfs_undelete
