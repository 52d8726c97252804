#pragma once

#include "address.hpp"
#include "block_pointer.hpp"
#include "zfs_config.hpp"
#include "file.hpp"

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

namespace zfs_undelete
{

	// one contiguous run of bytes on a pool member image
	struct physical_extent
	{
		const Device* device = nullptr;
		uint32_t child = 0;
		uint64_t offset = 0; // from the start of the image
		uint64_t length = 0;
	};

	// Top-level vdev. Offsets are DVA byte offsets, relative to the start of the data area.
	class vdev
	{
	public:
		virtual ~vdev() = default;

		virtual uint32_t ashift() const = 0;
		// true when consecutive DVA bytes are consecutive on the images,
		// so a long range can be read once and cut into blocks
		virtual bool contiguous() const = 0;
		// bytes of DVA address space
		virtual uint64_t asize() const = 0;
		virtual std::vector<physical_extent> resolve(uint64_t offset, uint64_t size) const = 0;
		// Throws address_out_of_bounds when a column lies past the end of an image.
		virtual void read(uint64_t offset, uint64_t size, uint8_t* dest) const = 0;
	};

	class leaf_vdev : public vdev
	{
	public:
		leaf_vdev(std::unique_ptr<Device> device, uint32_t ashift);

		uint32_t ashift() const override { return ashift_; }
		bool contiguous() const override { return true; }
		uint64_t asize() const override;
		std::vector<physical_extent> resolve(uint64_t offset, uint64_t size) const override;
		void read(uint64_t offset, uint64_t size, uint8_t* dest) const override;

	private:
		std::unique_ptr<Device> device_;
		uint32_t ashift_;
	};

	// Reads from the first child that has the data. Define ZFS_UNDELETE_MIRROR_MATCHING
	// to require all children to hold identical bytes.
	class mirror_vdev : public vdev
	{
	public:
		mirror_vdev(std::vector<std::unique_ptr<Device>> children, uint32_t ashift);

		uint32_t ashift() const override { return ashift_; }
		bool contiguous() const override { return true; }
		uint64_t asize() const override;
		std::vector<physical_extent> resolve(uint64_t offset, uint64_t size) const override;
		void read(uint64_t offset, uint64_t size, uint8_t* dest) const override;

	private:
		std::vector<std::unique_ptr<Device>> children_; // null for missing children
		uint32_t ashift_;
	};

	class raidz_vdev : public vdev
	{
	public:
		struct column
		{
			uint32_t child = 0;
			uint64_t offset = 0; // on the child, relative to the data area
			uint64_t size = 0;
		};

		// Column layout of one block, see vdev_raidz_map_alloc.
		// The first 'nparity' columns hold parity.
		static std::vector<column> map_columns(uint64_t offset, uint64_t size, uint32_t ashift, uint32_t dcols, uint32_t nparity);

		raidz_vdev(std::vector<std::unique_ptr<Device>> children, uint32_t nparity, uint32_t ashift);

		uint32_t ashift() const override { return ashift_; }
		bool contiguous() const override { return false; }
		uint64_t asize() const override;
		uint32_t nparity() const { return nparity_; }
		std::vector<physical_extent> resolve(uint64_t offset, uint64_t size) const override;
		// A single missing child of a raidz1 is rebuilt from parity.
		void read(uint64_t offset, uint64_t size, uint8_t* dest) const override;

	private:
		std::vector<std::unique_ptr<Device>> children_; // null for missing children
		uint32_t nparity_;
		uint32_t ashift_;
	};

	// bytes of one block as stored and after decompression
	struct block_data
	{
		zfs_data_address address; // the DVA the data came from
		std::vector<uint8_t> raw;
		std::vector<uint8_t> decoded; // empty when stored uncompressed
		bool gang = false;
		bool embedded = false;

		const std::vector<uint8_t>& logical() const { return decoded.empty() ? raw : decoded; }
	};

	class zfs_pool
	{
	public:
		explicit zfs_pool(const pool_layout& layout);

		const pool_layout& layout() const { return layout_; }
		const pool_limits& limits() const { return limits_; }

		size_t top_level_vdev_count() const { return vdevs_.size(); }
		const vdev& top_level_vdev(uint32_t vdev_id) const;

		std::vector<physical_extent> resolve(const zfs_data_address& address, uint64_t size) const;
		std::vector<physical_extent> resolve(const zfs_data_address& address) const { return resolve(address, address.size); }

		// 'size' bytes at the address, rounded up to the vdev sector internally
		std::vector<uint8_t> read(const zfs_data_address& address, uint64_t size) const;
		std::vector<uint8_t> read(const zfs_data_address& address) const { return read(address, address.size); }

		// Tries each DVA in order, assembles gang blocks, verifies the checksum and decompresses.
		// Throws checksum_mismatch, decompression_failure, address_out_of_bounds or malformed_structure
		// (the error of the first DVA when all fail).
		block_data read_block(const block_pointer_info& bpi) const;

	private:
		block_data read_block(const block_pointer_info& bpi, unsigned gang_depth) const;
		std::vector<uint8_t> read_gang(const block_pointer_info& bpi, size_t dva_idx, unsigned gang_depth) const;

		pool_layout layout_;
		pool_limits limits_;
		std::vector<std::unique_ptr<vdev>> vdevs_;
	};

} // namespace zfs_undelete
