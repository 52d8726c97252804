#include "zfs_decompress.hpp"
#include "errors.hpp"

#include <sstream>

#include "zfs_ondisk.hpp"

namespace zfs_undelete
{
	static_assert(static_cast<int>(compression_algorithm::off) == ZIO_COMPRESS_OFF, "");
	static_assert(static_cast<int>(compression_algorithm::lzjb) == ZIO_COMPRESS_LZJB, "");
	static_assert(static_cast<int>(compression_algorithm::empty) == ZIO_COMPRESS_EMPTY, "");
	static_assert(static_cast<int>(compression_algorithm::zle) == ZIO_COMPRESS_ZLE, "");
	static_assert(static_cast<int>(compression_algorithm::lz4) == ZIO_COMPRESS_LZ4, "");

	// no single metadata block decodes to more than this
	static constexpr size_t max_unbounded_output = SPA_MAXBLOCKSIZE;

	const char* compression_algorithm_name(compression_algorithm algorithm)
	{
		static const char* const names[compression_algorithm_count] = {
			"inherit", "on", "off", "lzjb", "empty",
			"gzip-1", "gzip-2", "gzip-3", "gzip-4", "gzip-5", "gzip-6", "gzip-7", "gzip-8", "gzip-9",
			"zle", "lz4", "zstd"
		};
		uint8_t idx = static_cast<uint8_t>(algorithm);
		return idx < compression_algorithm_count ? names[idx] : "INVALID";
	}

	std::string decompression_error::to_string() const
	{
		std::ostringstream s;
		s << (msg ? msg : "unknown error") << ", src_pos=" << src_pos << ", dest_pos=" << dest_pos << ", offset=" << offset << ", length=" << length;
		return s.str();
	}

// returns size of input data used
size_t lzjb_decompress(const uint8_t* const src, size_t size, std::vector<uint8_t>& out, size_t expected_size, decompression_error& error)
{
	static constexpr int MATCH_BITS = 6;
	static constexpr int OFFSET_MASK = ((1 << (16 - MATCH_BITS)) - 1);
	static constexpr int MATCH_MIN = 3;
	static constexpr int bits_in_a_byte = 8;

	const size_t out_initial_size = out.size();
	const size_t out_limit = expected_size != 0 ? expected_size : max_unbounded_output;
	out.reserve(out_initial_size + out_limit);

	unsigned int copymap = 0;
	unsigned int copymask = 1 << (bits_in_a_byte - 1);

	size_t src_pos = 0;
	while (out.size() - out_initial_size < out_limit)
	{
		copymask <<= 1;
		if (copymask == (1 << bits_in_a_byte))
		{
			copymask = 1;
			if (src_pos == size)
				break;
			copymap = src[src_pos++];
		}
		if (src_pos == size)
			break;
		if (copymap & copymask)
		{
			if (src_pos + 1 >= size)
			{
				error.msg = "truncated match";
				error.src_pos = src_pos;
				return 0;
			}
			size_t mlen = (src[src_pos] >> (bits_in_a_byte - MATCH_BITS)) + MATCH_MIN;
			size_t offset = ((size_t(src[src_pos]) << bits_in_a_byte) | size_t(src[src_pos+1])) & OFFSET_MASK;
			src_pos += 2;
			size_t produced = out.size() - out_initial_size;
			if (offset == 0 || offset > produced)
			{
				error.msg = "offset > out.size() or offset is zero";
				error.src_pos = src_pos;
				error.dest_pos = produced;
				error.offset = offset;
				return 0;
			}
			if (mlen > out_limit - produced)
				mlen = out_limit - produced;
			size_t cpy_from_offset = out.size() - offset;
			for (size_t i = 0; i != mlen; ++i)
				out.push_back(out[cpy_from_offset++]);
		}
		else
		{
			out.push_back(src[src_pos++]);
		}
	}
	if (expected_size != 0 && out.size() - out_initial_size != expected_size)
	{
		error.msg = "input exhausted before the expected size was produced";
		error.src_pos = src_pos;
		error.dest_pos = out.size() - out_initial_size;
		error.length = expected_size;
		return 0;
	}
	return src_pos;
}

// returns size of input data used
size_t zle_decompress(const uint8_t* const src, size_t size, std::vector<uint8_t>& out, size_t expected_size, decompression_error& error)
{
	static constexpr size_t level = 64;

	const size_t out_initial_size = out.size();
	const size_t out_limit = expected_size != 0 ? expected_size : max_unbounded_output;

	size_t src_pos = 0;
	while (src_pos != size && out.size() - out_initial_size < out_limit)
	{
		size_t len = size_t(1) + src[src_pos];
		++src_pos;
		size_t produced = out.size() - out_initial_size;
		if (len <= level)
		{
			if (len > size - src_pos || len > out_limit - produced)
			{
				error.msg = "literal run past the end of input or output";
				error.src_pos = src_pos;
				error.dest_pos = produced;
				error.length = len;
				return 0;
			}
			out.insert(out.end(), src + src_pos, src + src_pos + len);
			src_pos += len;
		}
		else
		{
			len -= level;
			if (len > out_limit - produced)
			{
				error.msg = "zero run past the end of output";
				error.src_pos = src_pos;
				error.dest_pos = produced;
				error.length = len;
				return 0;
			}
			out.insert(out.end(), len, 0);
		}
	}
	if (expected_size != 0 && out.size() - out_initial_size != expected_size)
	{
		error.msg = "output size differs from the expected size";
		error.src_pos = src_pos;
		error.dest_pos = out.size() - out_initial_size;
		error.length = expected_size;
		return 0;
	}
	return src_pos;
}

size_t lz4_framed_length(const uint8_t* src, size_t size)
{
	if (size < sizeof(uint32_t))
		return 0;
	return (size_t(src[0]) << 24) | (size_t(src[1]) << 16) | (size_t(src[2]) << 8) | size_t(src[3]);
}

// returns size of input data used
size_t lz4_decompress(const uint8_t* const src, size_t size, std::vector<uint8_t>& out, size_t expected_size, decompression_error& error)
{
	// https://github.com/lz4/lz4/blob/dev/doc/lz4_Block_format.md

	static constexpr int ML_BITS = 4;
	static constexpr unsigned ML_MASK = ((1U<<ML_BITS)-1);
	static constexpr unsigned RUN_MASK = ((1U<<(8-ML_BITS))-1);
	static constexpr size_t MIN_MATCH = 4;

	if (size < sizeof(uint32_t))
	{
		error.msg = "src_size < sizeof(uint32_t)";
		return 0;
	}
	const size_t input_size = lz4_framed_length(src, size);

	if (input_size == 0 || size - sizeof(uint32_t) < input_size)
	{
		error.msg = "src_size < sizeof(uint32_t) + input_size";
		error.offset = input_size;
		return 0;
	}

	const uint8_t* ip = src + sizeof(uint32_t);
	const uint8_t* const iend = ip + input_size;

	const size_t out_initial_size = out.size();
	const size_t out_limit = expected_size != 0 ? expected_size : max_unbounded_output;
	out.reserve(out_initial_size + (expected_size != 0 ? expected_size : input_size * 2));

	auto fail = [&](const char* msg, size_t offset)
		{
			error.msg = msg;
			error.src_pos = ip - src;
			error.dest_pos = out.size() - out_initial_size;
			error.offset = offset;
			return size_t(0);
		};

	while (ip < iend)
	{
		// get runlength
		unsigned int token = *ip++;
		size_t length = (token >> ML_BITS);
		if (length == RUN_MASK)
		{
			uint8_t s = 0;
			do
			{
				if (ip == iend)
					return fail("truncated literal length", length);
				s = *ip++;
				length += s;
			} while (s == 0xFF);
		}
		if (length > size_t(iend - ip))
			return fail("literals past the end of input", length);
		if (length > out_limit - (out.size() - out_initial_size))
			return fail("literals past the end of output", length);

		out.insert(out.end(), ip, ip + length);
		ip += length;
		// LZ4 format requires the last sequence to consist of literals only
		if (ip == iend)
			break;

		// get offset - read little endian 16
		if (iend - ip < 2)
			return fail("truncated match offset", 0);
		size_t ref_offset = size_t(ip[0]) | (size_t(ip[1]) << 8);
		ip += 2;
		if (ref_offset == 0 || ref_offset > (out.size() - out_initial_size))
			return fail("ref_offset is invalid", ref_offset);

		// get matchlength
		size_t ref_length = token & ML_MASK;
		if (ref_length == ML_MASK)
		{
			uint8_t s = 0;
			do
			{
				if (ip == iend)
					return fail("truncated match length", ref_length);
				s = *ip++;
				ref_length += s;
			} while (s == 0xFF);
		}
		ref_length += MIN_MATCH;
		if (ref_length > out_limit - (out.size() - out_initial_size))
			return fail("match past the end of output", ref_length);
		size_t ref_idx = out.size() - ref_offset;
		for (size_t i = 0; i != ref_length; ++i)
			out.push_back(out[ref_idx + i]);
	}

	if (expected_size != 0 && out.size() - out_initial_size != expected_size)
		return fail("output size differs from the expected size", expected_size);

	return input_size + sizeof(uint32_t);
}

void decompress(compression_algorithm algorithm, const uint8_t* const src, size_t size, size_t lsize, std::vector<uint8_t>& out)
{
	decompression_error error;
	size_t used = 0;
	switch (algorithm)
	{
		case compression_algorithm::off:
			if (size < lsize)
				throw decompression_failure("uncompressed block shorter than its logical size: " + std::to_string(size) + " < " + std::to_string(lsize));
			out.insert(out.end(), src, src + lsize);
			return;
		case compression_algorithm::empty:
			out.insert(out.end(), lsize, 0);
			return;
		case compression_algorithm::lzjb:
			used = lzjb_decompress(src, size, out, lsize, error);
			if (used == 0)
				throw decompression_failure("LZJB error: " + error.to_string());
			return;
		case compression_algorithm::zle:
			used = zle_decompress(src, size, out, lsize, error);
			if (used == 0)
				throw decompression_failure("ZLE error: " + error.to_string());
			return;
		case compression_algorithm::lz4:
			used = lz4_decompress(src, size, out, lsize, error);
			if (used == 0)
				throw decompression_failure("LZ4 error: " + error.to_string());
			return;
		default:
			throw unsupported_compression("Unsupported compression method " + std::string(compression_algorithm_name(algorithm)));
	}
}

} // namespace zfs_undelete
