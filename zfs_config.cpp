#include "zfs_config.hpp"
#include "errors.hpp"

#include <fstream>
#include <ostream>
#include <ctype.h>

namespace zfs_undelete
{

	namespace
	{
		unsigned int parse_uint(const std::string& str, const char* what, const std::string& line)
		{
			size_t next_idx = 0;
			unsigned long value = 0;
			try
			{
				value = std::stoul(str, &next_idx);
			}
			catch (const std::logic_error&)
			{
				next_idx = std::string::npos;
			}
			if (next_idx != str.size())
				throw malformed_structure(std::string("Invalid ") + what + " '" + str + "' in line '" + line + "'");
			return static_cast<unsigned int>(value);
		}

		std::vector<std::string> split(const std::string& line, char sep)
		{
			std::vector<std::string> parts;
			size_t start = 0;
			while (true)
			{
				size_t pos = line.find(sep, start);
				parts.push_back(line.substr(start, pos - start));
				if (pos == std::string::npos)
					break;
				start = pos + 1;
			}
			return parts;
		}
	}

	zfs_config::zfs_config(const std::string& filename)
	{
		std::ifstream f(filename);
		if (!f)
			throw image_io_failure("Can't open config file " + filename);
		parse(f);
	}

	zfs_config::zfs_config(std::istream& in)
	{
		parse(in);
	}

	void zfs_config::parse(std::istream& in)
	{
		std::string line;
		while (std::getline(in, line))
		{
			while (!line.empty() && ::isspace(static_cast<unsigned char>(line[0])))
				line.erase(line.begin());
			while (!line.empty() && ::isspace(static_cast<unsigned char>(line.back())))
				line.pop_back();
			if (line.empty() || line[0] == '#')
				continue;
			if (line.compare(0, 5, "vdev:") == 0)
			{
				std::vector<std::string> parts = split(line, ':');
				if (parts.size() != 5)
					throw malformed_structure("Invalid vdev line '" + line + "'");
				vdev_t vdev;
				vdev.top_level_id = parse_uint(parts[1], "top level id", line);
				vdev.type = parts[2];
				if (vdev.type != "disk" && vdev.type != "file" && vdev.type != "mirror" && vdev.type != "raidz")
					throw malformed_structure("Unsupported vdev type '" + vdev.type + "' in line '" + line + "'");
				vdev.nparity = parse_uint(parts[3], "parity", line);
				vdev.ashift = parse_uint(parts[4], "ashift", line);
				if (vdev.ashift < 9 || vdev.ashift > 16)
					throw malformed_structure("Invalid ashift in line '" + line + "'");
				if (vdev.type == "raidz" && (vdev.nparity < 1 || vdev.nparity > 3))
					throw malformed_structure("Invalid raidz parity in line '" + line + "'");
				vdevs_.push_back(vdev);
				continue;
			}
			// device names may contain ':', ids are the last two fields
			size_t sep_2 = line.rfind(':');
			size_t sep_1 = sep_2 == std::string::npos || sep_2 == 0 ? std::string::npos : line.rfind(':', sep_2 - 1);
			if (sep_1 == std::string::npos)
				throw malformed_structure("Invalid config line '" + line + "'");
			device_t device;
			device.name = line.substr(0, sep_1);
			device.device_id = parse_uint(line.substr(sep_1+1, sep_2-sep_1-1), "device id", line);
			device.top_level_id = parse_uint(line.substr(sep_2+1), "parent id", line);
			devices_.push_back(device);
			if (devices_by_top_level_id_.size() <= device.top_level_id)
				devices_by_top_level_id_.resize(device.top_level_id+1);
			devices_by_top_level_id_[device.top_level_id].push_back(device);
		}
		if (devices_.empty())
			throw malformed_structure("No devices in config");
	}

	const std::vector<zfs_config::device_t>& zfs_config::devices_with_top_level_id(uint32_t top_level_id) const
	{
		if (top_level_id >= devices_by_top_level_id_.size())
			throw malformed_structure("Invalid parent id " + std::to_string(top_level_id) + ", max allowed: " + std::to_string(devices_by_top_level_id_.size()));
		return devices_by_top_level_id_[top_level_id];
	}

	pool_layout zfs_config::layout() const
	{
		pool_layout layout;
		layout.vdevs.resize(devices_by_top_level_id_.size());
		for (size_t id = 0; id != layout.vdevs.size(); ++id)
		{
			pool_layout::top_level_vdev& tlv = layout.vdevs[id];
			tlv.id = uint32_t(id);
			const std::vector<device_t>& devices = devices_by_top_level_id_[id];
			if (devices.empty())
				throw malformed_structure("No devices for top level vdev " + std::to_string(id));
			tlv.type = devices.size() == 1 ? "disk" : "mirror";
			for (const vdev_t& vdev : vdevs_)
				if (vdev.top_level_id == id)
				{
					tlv.type = vdev.type;
					tlv.nparity = vdev.nparity;
					tlv.ashift = vdev.ashift;
				}
			for (const device_t& device : devices)
			{
				if (tlv.children.size() <= device.device_id)
					tlv.children.resize(device.device_id + 1);
				if (!tlv.children[device.device_id].empty())
					throw malformed_structure("Duplicate device id " + std::to_string(device.device_id) + " in top level vdev " + std::to_string(id));
				tlv.children[device.device_id] = device.name;
			}
			if ((tlv.type == "disk" || tlv.type == "file") && tlv.children.size() != 1)
				throw malformed_structure("Top level vdev " + std::to_string(id) + " of type " + tlv.type + " must have exactly one device");
			if (tlv.type == "raidz" && tlv.children.size() <= tlv.nparity)
				throw malformed_structure("Top level vdev " + std::to_string(id) + " has fewer devices than parity + 1");
		}
		return layout;
	}

	std::ostream& operator << (std::ostream& os, const pool_layout& layout)
	{
		for (const pool_layout::top_level_vdev& tlv : layout.vdevs)
		{
			os << "vdev " << tlv.id << ": " << tlv.type;
			if (tlv.type == "raidz")
				os << tlv.nparity;
			os << ", ashift=" << tlv.ashift << '\n';
			for (size_t i = 0; i != tlv.children.size(); ++i)
				os << "    [" << i << "] " << (tlv.children[i].empty() ? "<missing>" : tlv.children[i]) << '\n';
		}
		return os;
	}

} // namespace zfs_undelete
