#include "label.hpp"
#include "file.hpp"
#include "errors.hpp"

#include <ostream>
#include <map>
#include <string.h>

namespace zfs_undelete
{

	namespace
	{
		uint64_t read_u64(const uint8_t* ptr)
		{
			uint64_t v;
			::memcpy(&v, ptr, sizeof(v));
			return v;
		}

		// see VDEV_UBERBLOCK_SHIFT
		uint64_t uberblock_slot_size(unsigned ashift)
		{
			unsigned shift = ashift < 10 ? 10 : (ashift > 13 ? 13 : ashift);
			return uint64_t(1) << shift;
		}

		bool verify_label_part(const uint8_t* data, size_t size, uint64_t offset)
		{
			block_checksum verifier;
			verifier.word[0] = offset;
			return verify_embedded_checksum(checksum_algorithm::label, data, size, verifier);
		}

		struct image_label
		{
			std::string path;
			vdev_label label;
		};
	}

	uint64_t vdev_label_offset(uint64_t device_size, unsigned index)
	{
		// the device size is used in whole labels
		uint64_t psize = device_size - device_size % vdev_label_size;
		return uint64_t(index) * vdev_label_size + (index < vdev_label_count / 2 ? 0 : psize - vdev_label_count * vdev_label_size);
	}

	bool read_vdev_label(const Device& device, unsigned index, vdev_label& label, std::ostream* error_log)
	{
		if (index >= vdev_label_count)
			throw malformed_structure("Invalid label index " + std::to_string(index));
		if (device.size() < vdev_label_count * vdev_label_size)
		{
			if (error_log)
				*error_log << device.filename() << ": too small for vdev labels" << std::endl;
			return false;
		}
		uint64_t phys_offset = vdev_label_offset(device.size(), index) + vdev_phys_offset;
		std::vector<uint8_t> data(vdev_phys_size);
		device.read(phys_offset, data.data(), data.size());
		if (!verify_label_part(data.data(), data.size(), phys_offset))
		{
			if (error_log)
				*error_log << device.filename() << ": label " << index << " checksum mismatch" << std::endl;
			return false;
		}
		label = vdev_label();
		label.index = index;
		try
		{
			label.config = parse_xdr_nvlist(data.data(), data.size());
		}
		catch (const malformed_structure& e)
		{
			if (error_log)
				*error_log << device.filename() << ": label " << index << " - " << e.what() << std::endl;
			return false;
		}
		label.config.get_uint64("txg", label.txg);
		label.config.get_uint64("pool_guid", label.pool_guid);
		label.config.get_uint64("guid", label.guid);
		label.config.get_uint64("top_guid", label.top_guid);
		if (const std::string* name = label.config.get_string("name"))
			label.pool_name = *name;
		return true;
	}

	std::ostream& operator << (std::ostream& os, const uberblock_info& ub)
	{
		os << "uberblock{label=" << ub.label << ", slot=" << ub.slot << ", version=" << ub.version
			<< ", txg=" << ub.txg << ", guid_sum=" << ub.guid_sum << ", timestamp=" << ub.timestamp
			<< ", rootbp=" << ub.rootbp << "}";
		return os;
	}

	bool find_best_uberblock(const Device& device, unsigned ashift, uberblock_info& best)
	{
		if (device.size() < vdev_label_count * vdev_label_size)
			return false;
		const uint64_t slot_size = uberblock_slot_size(ashift);
		std::vector<uint8_t> slot(slot_size);
		bool found = false;
		for (unsigned l = 0; l != vdev_label_count; ++l)
		{
			uint64_t ring_offset = vdev_label_offset(device.size(), l) + uberblock_ring_offset;
			for (unsigned s = 0; s != uberblock_ring_size / slot_size; ++s)
			{
				uint64_t offset = ring_offset + s * slot_size;
				device.read(offset, slot.data(), slot.size());
				if (read_u64(slot.data()) != uberblock_magic)
					continue;
				if (!verify_label_part(slot.data(), slot.size(), offset))
					continue;
				uberblock_info ub;
				ub.version = read_u64(slot.data() + 8);
				ub.txg = read_u64(slot.data() + 16);
				ub.guid_sum = read_u64(slot.data() + 24);
				ub.timestamp = read_u64(slot.data() + 32);
				if (try_parse_block_pointer(nullptr, slot.data() + 40, ub.rootbp) <= 0)
					continue;
				ub.label = l;
				ub.slot = s;
				if (!found || ub.txg > best.txg)
				{
					best = ub;
					found = true;
				}
			}
		}
		return found;
	}

	void print_uberblocks(std::ostream& os, const pool_layout& layout)
	{
		for (const pool_layout::top_level_vdev& tlv : layout.vdevs)
			for (const std::string& path : tlv.children)
			{
				// missing raidz child
				if (path.empty())
					continue;
				Device device(path);
				uberblock_info best;
				os << path << ": ";
				if (find_best_uberblock(device, tlv.ashift, best))
					os << "uberblock txg=" << best.txg << ", timestamp=" << best.timestamp << ", rootbp=" << best.rootbp.address[0];
				else
					os << "no valid uberblock";
				os << "\n";
			}
	}

	pool_layout discover_pool_layout(const std::vector<std::string>& image_paths, std::ostream* log)
	{
		if (image_paths.empty())
			throw malformed_structure("No images to discover the pool from");

		std::vector<image_label> images;
		for (const std::string& path : image_paths)
		{
			Device device(path);
			image_label best;
			best.path = path;
			bool found = false;
			for (unsigned l = 0; l != vdev_label_count; ++l)
			{
				vdev_label label;
				if (read_vdev_label(device, l, label, log) && (!found || label.txg > best.label.txg))
				{
					best.label = std::move(label);
					found = true;
				}
			}
			if (!found)
				throw malformed_structure("No valid vdev label found on " + path);
			if (!images.empty() && images.front().label.pool_guid != best.label.pool_guid)
				throw malformed_structure("Image " + path + " belongs to a different pool");
			if (log)
				*log << path << ": pool '" << best.label.pool_name << "', guid=" << best.label.guid << ", txg=" << best.label.txg << std::endl;
			images.push_back(std::move(best));
		}

		std::map<uint64_t, pool_layout::top_level_vdev> vdevs;
		for (const image_label& image : images)
		{
			const nvlist* tree = image.label.config.get_nvlist("vdev_tree");
			if (!tree)
				throw malformed_structure("Label of " + image.path + " has no vdev_tree");
			const std::string* type = tree->get_string("type");
			uint64_t id = 0;
			uint64_t ashift = 9;
			uint64_t nparity = 0;
			uint64_t top_guid = 0;
			if (!type || !tree->get_uint64("id", id))
				throw malformed_structure("Incomplete vdev_tree in label of " + image.path);
			tree->get_uint64("ashift", ashift);
			tree->get_uint64("nparity", nparity);
			tree->get_uint64("guid", top_guid);

			pool_layout::top_level_vdev& tlv = vdevs[id];
			tlv.id = uint32_t(id);
			tlv.type = *type;
			tlv.ashift = uint32_t(ashift);
			tlv.nparity = uint32_t(nparity);

			if (*type == "disk" || *type == "file")
			{
				if (top_guid != image.label.guid)
					throw malformed_structure("Leaf vdev guid mismatch on " + image.path);
				tlv.children.resize(1);
				tlv.children[0] = image.path;
				continue;
			}
			if (*type != "mirror" && *type != "raidz")
				throw malformed_structure("Unsupported vdev type '" + *type + "' on " + image.path);
			const std::vector<nvlist>* children = tree->get_nvlist_array("children");
			if (!children || children->empty())
				throw malformed_structure("vdev_tree without children on " + image.path);
			tlv.children.resize(children->size());
			bool placed = false;
			for (size_t c = 0; c != children->size(); ++c)
			{
				uint64_t child_guid = 0;
				uint64_t child_id = c;
				(*children)[c].get_uint64("guid", child_guid);
				(*children)[c].get_uint64("id", child_id);
				if (child_guid == image.label.guid)
				{
					if (child_id >= tlv.children.size())
						throw malformed_structure("Invalid child id in vdev_tree of " + image.path);
					tlv.children[child_id] = image.path;
					placed = true;
				}
			}
			if (!placed)
				throw malformed_structure("Image " + image.path + " is not a child of its vdev_tree");
		}

		pool_layout layout;
		for (auto& entry : vdevs)
		{
			if (entry.first != layout.vdevs.size())
				throw malformed_structure("Top level vdev " + std::to_string(layout.vdevs.size()) + " has no image");
			layout.vdevs.push_back(std::move(entry.second));
		}
		return layout;
	}

} // namespace zfs_undelete
