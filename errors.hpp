#pragma once

#include <stdexcept>
#include <string>

namespace zfs_undelete
{

	// Base of every error raised while reading pool images.
	// Scan noise is not reported through exceptions, see try_parse_* functions.
	class recovery_error : public std::runtime_error
	{
	public:
		explicit recovery_error(const std::string& msg) : std::runtime_error(msg) {}
	};

	// recomputed digest disagrees with the checksum declared by the block pointer
	class checksum_mismatch : public recovery_error
	{
	public:
		explicit checksum_mismatch(const std::string& msg) : recovery_error(msg) {}
	};

	class decompression_failure : public recovery_error
	{
	public:
		explicit decompression_failure(const std::string& msg) : recovery_error(msg) {}
	};

	// fields outside of valid ranges or enums
	class malformed_structure : public recovery_error
	{
	public:
		explicit malformed_structure(const std::string& msg) : recovery_error(msg) {}
	};

	class unsupported_checksum : public malformed_structure
	{
	public:
		explicit unsupported_checksum(const std::string& msg) : malformed_structure(msg) {}
	};

	class unsupported_compression : public malformed_structure
	{
	public:
		explicit unsupported_compression(const std::string& msg) : malformed_structure(msg) {}
	};

	class address_out_of_bounds : public recovery_error
	{
	public:
		explicit address_out_of_bounds(const std::string& msg) : recovery_error(msg) {}
	};

	// missing or unreadable image, aborts the run
	class image_io_failure : public recovery_error
	{
	public:
		explicit image_io_failure(const std::string& msg) : recovery_error(msg) {}
	};

} // namespace zfs_undelete
