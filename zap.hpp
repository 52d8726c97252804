#pragma once

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>
#include <stdexcept>

namespace zfs_undelete
{

	// Integers of one width, stored host endian. Fat ZAP values are big endian on disk.
	struct IntegerArray
	{
		template<class POD>
		struct pod_type {};

		template<class POD>
		explicit IntegerArray(const pod_type<POD>&, size_t size) : element_size_(sizeof(POD)) { data_.resize(size * sizeof(POD)); }

		// from big endian bytes
		IntegerArray(size_t element_size, std::vector<uint8_t>&& data);

		size_t size() const { return data_.size() / element_size_; }

		size_t element_size() const { return element_size_; }

		// value widened to 64 bits
		uint64_t get(size_t idx) const;

		template<class POD>
		POD* data()
		{
			if (sizeof(POD) != element_size_)
				throw std::logic_error("POD Array element size error");
			return reinterpret_cast<POD*>(data_.data());
		}

	private:
		std::vector<uint8_t> data_;
		uint8_t element_size_;
	};

	struct zap_entry
	{
		zap_entry(std::string&& n, IntegerArray&& i) : name(std::move(n)), value(std::move(i)) {}
		std::string name;
		IntegerArray value;

		// directory entries pack the object number in the low 48 bits, see ZFS_DIRENT_OBJ
		uint64_t get_object_id() const { return value.size() == 0 ? 0 : (value.get(0) & ((uint64_t(1) << 48) - 1)); }
		// see ZFS_DIRENT_TYPE, same values as the IFTODT macro
		uint8_t get_dirent_type() const { return value.size() == 0 ? 0 : uint8_t(value.get(0) >> 60); }
	};

	std::ostream& operator << (std::ostream& os, const zap_entry& ze);

	bool is_potential_zap_block(const uint8_t* data, size_t size);

	// Parses a micro or fat ZAP object. 'data' is the logical content of the object,
	// 'block_size' the object's data block size. Blocks that could not be recovered are
	// expected to be zero filled; leaves in them are skipped.
	// Throws malformed_structure.
	std::vector<zap_entry> parse_zap(const uint8_t* data, size_t length, uint64_t block_size);

	// returns block 'blk_id' of a ZAP object, zero filled where it was not recovered
	typedef std::function<std::vector<uint8_t>(uint64_t blk_id)> zap_block_reader;

	// Same, reading the 'block_count' blocks of the object one at a time
	std::vector<zap_entry> parse_zap(uint64_t block_count, uint64_t block_size, const zap_block_reader& read_block);

} // namespace zfs_undelete
