#pragma once

#include <stdint.h>
#include <stddef.h>
#include <iosfwd>

namespace zfs_undelete
{

	// on-disk checksum function ids, see enum zio_checksum
	enum class checksum_algorithm : uint8_t
	{
		inherit = 0,
		on = 1,
		off = 2,
		label = 3,
		gang_header = 4,
		zilog = 5,
		fletcher_2 = 6,
		fletcher_4 = 7,
		sha256 = 8,
		zilog2 = 9,
		noparity = 10,
		sha512 = 11,
		skein = 12,
		edonr = 13,
		blake3 = 14,
	};

	static constexpr uint8_t checksum_algorithm_count = 15;

	// the algorithm used for metadata when nothing else is known
	static constexpr checksum_algorithm default_metadata_checksum = checksum_algorithm::fletcher_4;

	// 256 bit digest, same word layout as zio_cksum_t
	struct block_checksum
	{
		uint64_t word[4] = {};

		bool is_zero() const { return (word[0] | word[1] | word[2] | word[3]) == 0; }
	};

	inline bool operator == (const block_checksum& lhs, const block_checksum& rhs)
	{
		return lhs.word[0] == rhs.word[0] && lhs.word[1] == rhs.word[1] && lhs.word[2] == rhs.word[2] && lhs.word[3] == rhs.word[3];
	}
	inline bool operator != (const block_checksum& lhs, const block_checksum& rhs) { return !(lhs == rhs); }
	inline bool operator < (const block_checksum& lhs, const block_checksum& rhs)
	{
		for (size_t i = 0; i != 4; ++i)
			if (lhs.word[i] != rhs.word[i])
				return lhs.word[i] < rhs.word[i];
		return false;
	}

	std::ostream& operator << (std::ostream& os, const block_checksum& cksum);

	const char* checksum_algorithm_name(checksum_algorithm algorithm);

	// maps aliases (on, inherit, zilog, ...) to the function that actually runs
	checksum_algorithm effective_checksum_algorithm(checksum_algorithm algorithm);

	bool is_checksum_supported(checksum_algorithm algorithm);

	// Digest bit-compatible with blk_cksum. Throws unsupported_checksum.
	block_checksum compute_checksum(checksum_algorithm algorithm, const uint8_t* data, size_t size);

	// Checks a block carrying its checksum in a trailing zio_eck_t (gang headers, labels).
	// The stored checksum is replaced by 'verifier' while the digest is computed.
	bool verify_embedded_checksum(checksum_algorithm algorithm, const uint8_t* data, size_t size, const block_checksum& verifier);

} // namespace zfs_undelete
