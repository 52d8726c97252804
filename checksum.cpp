#include "checksum.hpp"
#include "errors.hpp"

#include <ostream>
#include <iomanip>
#include <vector>
#include <string>

#include <openssl/evp.h>

#include "zfs_ondisk.hpp"

namespace zfs_undelete
{
	static_assert(static_cast<int>(checksum_algorithm::off) == ZIO_CHECKSUM_OFF, "");
	static_assert(static_cast<int>(checksum_algorithm::label) == ZIO_CHECKSUM_LABEL, "");
	static_assert(static_cast<int>(checksum_algorithm::gang_header) == ZIO_CHECKSUM_GANG_HEADER, "");
	static_assert(static_cast<int>(checksum_algorithm::fletcher_2) == ZIO_CHECKSUM_FLETCHER_2, "");
	static_assert(static_cast<int>(checksum_algorithm::fletcher_4) == ZIO_CHECKSUM_FLETCHER_4, "");
	static_assert(static_cast<int>(checksum_algorithm::sha256) == ZIO_CHECKSUM_SHA256, "");
	static_assert(static_cast<int>(checksum_algorithm::skein) == ZIO_CHECKSUM_SKEIN, "");

	namespace
	{
		block_checksum from_zio_cksum(const zio_cksum_t& cksum)
		{
			block_checksum result;
			for (size_t i = 0; i != 4; ++i)
				result.word[i] = cksum.zc_word[i];
			return result;
		}

		// stored as big endian words, see zio_checksum_SHA256
		block_checksum sha256(const uint8_t* data, size_t size)
		{
			unsigned char digest[EVP_MAX_MD_SIZE];
			unsigned int digest_size = 0;
			if (EVP_Digest(data, size, digest, &digest_size, EVP_sha256(), nullptr) != 1 || digest_size != 32)
				throw recovery_error("EVP_Digest(sha256) failed");
			block_checksum result;
			for (size_t i = 0; i != 4; ++i)
			{
				uint64_t w = 0;
				for (size_t b = 0; b != 8; ++b)
					w = (w << 8) | digest[i*8 + b];
				result.word[i] = w;
			}
			return result;
		}
	}

	std::ostream& operator << (std::ostream& os, const block_checksum& cksum)
	{
		std::ios_base::fmtflags flags = os.flags();
		os << std::hex;
		for (size_t i = 0; i != 4; ++i)
			os << (i == 0 ? "" : ":") << cksum.word[i];
		os.flags(flags);
		return os;
	}

	const char* checksum_algorithm_name(checksum_algorithm algorithm)
	{
		static const char* const names[checksum_algorithm_count] = {
			"inherit", "on", "off", "label", "gang_header", "zilog", "fletcher2", "fletcher4",
			"sha256", "zilog2", "noparity", "sha512", "skein", "edonr", "blake3"
		};
		uint8_t idx = static_cast<uint8_t>(algorithm);
		return idx < checksum_algorithm_count ? names[idx] : "INVALID";
	}

	checksum_algorithm effective_checksum_algorithm(checksum_algorithm algorithm)
	{
		switch (algorithm)
		{
			case checksum_algorithm::inherit:
			case checksum_algorithm::on:
			case checksum_algorithm::zilog2:
			case checksum_algorithm::noparity:
				return checksum_algorithm::fletcher_4;
			case checksum_algorithm::zilog:
				return checksum_algorithm::fletcher_2;
			case checksum_algorithm::label:
			case checksum_algorithm::gang_header:
				return checksum_algorithm::sha256;
			default:
				return algorithm;
		}
	}

	bool is_checksum_supported(checksum_algorithm algorithm)
	{
		checksum_algorithm effective = effective_checksum_algorithm(algorithm);
		return effective == checksum_algorithm::fletcher_2
			|| effective == checksum_algorithm::fletcher_4
			|| effective == checksum_algorithm::sha256;
	}

	block_checksum compute_checksum(checksum_algorithm algorithm, const uint8_t* data, size_t size)
	{
		zio_cksum_t cksum;
		switch (effective_checksum_algorithm(algorithm))
		{
			case checksum_algorithm::fletcher_2:
				// fletcher2 consumes 16 byte chunks, a partial tail is not part of the sum
				fletcher_2_native(data, size - size % 16, nullptr, &cksum);
				return from_zio_cksum(cksum);
			case checksum_algorithm::fletcher_4:
				fletcher_4_native_varsize(data, size, &cksum);
				return from_zio_cksum(cksum);
			case checksum_algorithm::sha256:
				return sha256(data, size);
			default:
				throw unsupported_checksum(std::string("Unsupported checksum algorithm ") + checksum_algorithm_name(algorithm));
		}
	}

	bool verify_embedded_checksum(checksum_algorithm algorithm, const uint8_t* data, size_t size, const block_checksum& verifier)
	{
		if (size < sizeof(zio_eck_t))
			return false;
		std::vector<uint8_t> copy(data, data + size);
		zio_eck_t* eck = reinterpret_cast<zio_eck_t*>(copy.data() + size - sizeof(zio_eck_t));
		if (eck->zec_magic != ZEC_MAGIC)
			return false;
		block_checksum expected = from_zio_cksum(eck->zec_cksum);
		for (size_t i = 0; i != 4; ++i)
			eck->zec_cksum.zc_word[i] = verifier.word[i];
		return compute_checksum(algorithm, copy.data(), copy.size()) == expected;
	}

} // namespace zfs_undelete
