#pragma once

#include <stdint.h>
#include <stddef.h>
#include <vector>
#include <string>

namespace zfs_undelete
{

	// on-disk compression function ids, see enum zio_compress
	enum class compression_algorithm : uint8_t
	{
		inherit = 0,
		on = 1,
		off = 2,
		lzjb = 3,
		empty = 4,
		gzip_1 = 5,
		gzip_9 = 13,
		zle = 14,
		lz4 = 15,
		zstd = 16,
	};

	static constexpr uint8_t compression_algorithm_count = 17;

	static constexpr compression_algorithm default_metadata_compression = compression_algorithm::lz4;

	const char* compression_algorithm_name(compression_algorithm algorithm);

	struct decompression_error
	{
		const char* msg = nullptr;
		size_t src_pos = 0;
		size_t dest_pos = 0;
		size_t offset = 0;
		size_t length = 0;
		std::string to_string() const;
	};

	// All *_decompress functions append to 'out' and return the size of input data used,
	// zero means failure and 'error' describes it.
	// 'expected_size' is the logical size of the block; zero means decode until
	// the input is consumed.

	size_t lzjb_decompress(const uint8_t* src, size_t size, std::vector<uint8_t>& out, size_t expected_size, decompression_error& error);

	size_t zle_decompress(const uint8_t* src, size_t size, std::vector<uint8_t>& out, size_t expected_size, decompression_error& error);

	// ZFS framing: 32 bit big endian length of the LZ4 block, then the block
	size_t lz4_decompress(const uint8_t* src, size_t size, std::vector<uint8_t>& out, size_t expected_size, decompression_error& error);

	// length of the LZ4 block declared by the ZFS framing, or zero
	size_t lz4_framed_length(const uint8_t* src, size_t size);

	// Decodes a block of 'lsize' bytes. Output size must match exactly.
	// Throws decompression_failure or unsupported_compression.
	void decompress(compression_algorithm algorithm, const uint8_t* src, size_t size, size_t lsize, std::vector<uint8_t>& out);

} // namespace zfs_undelete
