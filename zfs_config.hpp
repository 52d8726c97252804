#pragma once

#include <stdint.h>
#include <iosfwd>
#include <string>
#include <vector>

namespace zfs_undelete
{

	// Geometry of the pool: top-level vdevs by id, and the images behind them
	struct pool_layout
	{
		struct top_level_vdev
		{
			uint32_t id = 0;
			std::string type; // "disk", "file", "mirror" or "raidz"
			uint32_t nparity = 0;
			uint32_t ashift = 9;
			// image paths in child order, an empty path is a missing child
			std::vector<std::string> children;
		};

		std::vector<top_level_vdev> vdevs; // index is the top-level id
	};

	std::ostream& operator << (std::ostream& os, const pool_layout& layout);

	// Pool description file.
	//   # comment
	//   <image path>:<child id>:<top level id>
	//   vdev:<top level id>:<type>:<nparity>:<ashift>
	// Without a vdev line a top-level vdev with one image is a disk, with more a mirror.
	class zfs_config
	{
	public:
		struct device_t
		{
			std::string name;
			unsigned int device_id = 0;
			unsigned int top_level_id = 0;
		};

		struct vdev_t
		{
			unsigned int top_level_id = 0;
			std::string type;
			unsigned int nparity = 0;
			unsigned int ashift = 9;
		};

		explicit zfs_config(const std::string& filename);
		explicit zfs_config(std::istream& in);

		const std::vector<device_t>& devices() const { return devices_; }
		const std::vector<device_t>& devices_with_top_level_id(uint32_t top_level_id) const;
		const std::vector<vdev_t>& vdevs() const { return vdevs_; }

		pool_layout layout() const;

	private:
		void parse(std::istream& in);

		std::vector<device_t> devices_;
		std::vector<std::vector<device_t>> devices_by_top_level_id_;
		std::vector<vdev_t> vdevs_;
	};

} // namespace zfs_undelete
