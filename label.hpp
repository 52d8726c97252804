#pragma once

#include "block_pointer.hpp"
#include "nvlist.hpp"
#include "zfs_config.hpp"

#include <stdint.h>
#include <iosfwd>
#include <string>
#include <vector>

namespace zfs_undelete
{

	class Device;

	static constexpr uint64_t vdev_label_size = 256 * 1024;
	static constexpr unsigned vdev_label_count = 4;
	static constexpr uint64_t vdev_phys_offset = 16 * 1024;
	static constexpr uint64_t vdev_phys_size = 112 * 1024;
	static constexpr uint64_t uberblock_ring_offset = 128 * 1024;
	static constexpr uint64_t uberblock_ring_size = 128 * 1024;
	static constexpr uint64_t uberblock_magic = 0x00bab10c;

	// Labels 0 and 1 are at the start of the device, 2 and 3 at its end
	uint64_t vdev_label_offset(uint64_t device_size, unsigned index);

	struct vdev_label
	{
		unsigned index = 0;
		nvlist config;
		uint64_t txg = 0;
		uint64_t pool_guid = 0;
		uint64_t guid = 0;
		uint64_t top_guid = 0;
		std::string pool_name;
	};

	// false when the label is absent or its checksum does not verify
	bool read_vdev_label(const Device& device, unsigned index, vdev_label& label, std::ostream* error_log = nullptr);

	struct uberblock_info
	{
		uint64_t version = 0;
		uint64_t txg = 0;
		uint64_t guid_sum = 0;
		uint64_t timestamp = 0;
		block_pointer_info rootbp;
		unsigned label = 0;
		unsigned slot = 0;
	};

	std::ostream& operator << (std::ostream& os, const uberblock_info& ub);

	// highest txg uberblock in all four labels
	bool find_best_uberblock(const Device& device, unsigned ashift, uberblock_info& best);

	// One line per image of 'layout' naming its best uberblock: txg, timestamp and root block address.
	// Throws image_io_failure when an image can't be opened.
	void print_uberblocks(std::ostream& os, const pool_layout& layout);

	// Reads the labels of every image and places each into its slot of the vdev tree,
	// whatever the order of 'image_paths'. Throws malformed_structure if an image has
	// no valid label or the images belong to different pools.
	pool_layout discover_pool_layout(const std::vector<std::string>& image_paths, std::ostream* log = nullptr);

} // namespace zfs_undelete
