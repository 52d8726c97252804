#include "pool.hpp"
#include "label.hpp"
#include "checksum.hpp"
#include "zfs_decompress.hpp"
#include "errors.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <string.h>

namespace zfs_undelete
{

	namespace
	{
		// two labels at the end of each leaf device
		constexpr uint64_t vdev_label_end_size = vdev_label_count / 2 * vdev_label_size;
		constexpr uint64_t gang_header_size = 512;
		constexpr size_t gang_header_pointers = 3;
		constexpr unsigned max_gang_depth = 4;

		uint64_t device_asize(const Device& device)
		{
			// the device is used in whole labels, see vdev_open
			uint64_t psize = device.size() - device.size() % vdev_label_size;
			uint64_t overhead = vdev_data_start + vdev_label_end_size;
			return psize > overhead ? psize - overhead : 0;
		}

		uint64_t round_up(uint64_t value, uint64_t alignment)
		{
			return (value + alignment - 1) / alignment * alignment;
		}

		void check_range(uint64_t offset, uint64_t size, uint64_t asize)
		{
			if (offset > asize || size > asize - offset)
				throw address_out_of_bounds("DVA range " + std::to_string(offset) + "+" + std::to_string(size) + " is outside of vdev of size " + std::to_string(asize));
		}
	}

	leaf_vdev::leaf_vdev(std::unique_ptr<Device> device, uint32_t ashift)
		: device_(std::move(device)), ashift_(ashift)
	{
	}

	uint64_t leaf_vdev::asize() const
	{
		return device_asize(*device_);
	}

	std::vector<physical_extent> leaf_vdev::resolve(uint64_t offset, uint64_t size) const
	{
		return { physical_extent{ device_.get(), 0, vdev_data_start + offset, size } };
	}

	void leaf_vdev::read(uint64_t offset, uint64_t size, uint8_t* dest) const
	{
		device_->read(vdev_data_start + offset, dest, size);
	}

	mirror_vdev::mirror_vdev(std::vector<std::unique_ptr<Device>> children, uint32_t ashift)
		: children_(std::move(children)), ashift_(ashift)
	{
	}

	uint64_t mirror_vdev::asize() const
	{
		uint64_t result = 0;
		bool first = true;
		for (const std::unique_ptr<Device>& child : children_)
			if (child)
			{
				uint64_t child_asize = device_asize(*child);
				result = first ? child_asize : std::min(result, child_asize);
				first = false;
			}
		return result;
	}

	std::vector<physical_extent> mirror_vdev::resolve(uint64_t offset, uint64_t size) const
	{
		for (size_t c = 0; c != children_.size(); ++c)
			if (children_[c])
				return { physical_extent{ children_[c].get(), uint32_t(c), vdev_data_start + offset, size } };
		return {};
	}

	void mirror_vdev::read(uint64_t offset, uint64_t size, uint8_t* dest) const
	{
		const Device* first = nullptr;
		for (const std::unique_ptr<Device>& child : children_)
		{
			if (!child)
				continue;
			if (!first)
			{
				child->read(vdev_data_start + offset, dest, size);
				first = child.get();
				continue;
			}
#ifdef ZFS_UNDELETE_MIRROR_MATCHING
			std::vector<uint8_t> other(size);
			child->read(vdev_data_start + offset, other.data(), size);
			if (::memcmp(dest, other.data(), size) != 0)
				throw checksum_mismatch("Mismatch reading data, " + first->filename() + " vs " + child->filename());
#else
			break;
#endif
		}
	}

	std::vector<raidz_vdev::column> raidz_vdev::map_columns(uint64_t offset, uint64_t size, uint32_t ashift, uint32_t dcols, uint32_t nparity)
	{
		std::vector<column> cols;
		if (size == 0)
			return cols;
		const uint64_t b = offset >> ashift;
		const uint64_t s = size >> ashift;
		const uint64_t f = b % dcols;
		const uint64_t o = (b / dcols) << ashift;
		const uint64_t q = s / (dcols - nparity);
		const uint64_t r = s - q * (dcols - nparity);
		const uint64_t bc = (r == 0 ? 0 : r + nparity);
		const uint64_t acols = (q == 0 ? bc : dcols);

		for (uint64_t c = 0; c != acols; ++c)
		{
			uint64_t col = f + c;
			uint64_t coff = o;
			if (col >= dcols)
			{
				col -= dcols;
				coff += uint64_t(1) << ashift;
			}
			cols.push_back(column{ uint32_t(col), coff, (c < bc ? q + 1 : q) << ashift });
		}

		// raidz1 alternates parity placement every 1MB, see vdev_raidz_map_alloc
		if (nparity == 1 && cols.size() >= 2 && (offset & (uint64_t(1) << 20)))
		{
			std::swap(cols[0].child, cols[1].child);
			std::swap(cols[0].offset, cols[1].offset);
		}
		return cols;
	}

	raidz_vdev::raidz_vdev(std::vector<std::unique_ptr<Device>> children, uint32_t nparity, uint32_t ashift)
		: children_(std::move(children)), nparity_(nparity), ashift_(ashift)
	{
	}

	uint64_t raidz_vdev::asize() const
	{
		uint64_t child_asize = 0;
		bool first = true;
		for (const std::unique_ptr<Device>& child : children_)
			if (child)
			{
				child_asize = first ? device_asize(*child) : std::min(child_asize, device_asize(*child));
				first = false;
			}
		return child_asize * children_.size();
	}

	std::vector<physical_extent> raidz_vdev::resolve(uint64_t offset, uint64_t size) const
	{
		std::vector<physical_extent> result;
		uint64_t remaining = size;
		uint64_t asize = round_up(size, uint64_t(1) << ashift_);
		std::vector<column> cols = map_columns(offset, asize, ashift_, uint32_t(children_.size()), nparity_);
		for (size_t c = nparity_; c < cols.size() && remaining != 0; ++c)
		{
			uint64_t length = std::min(remaining, cols[c].size);
			result.push_back(physical_extent{ children_[cols[c].child].get(), cols[c].child, vdev_data_start + cols[c].offset, length });
			remaining -= length;
		}
		return result;
	}

	void raidz_vdev::read(uint64_t offset, uint64_t size, uint8_t* dest) const
	{
		const uint64_t asize = round_up(size, uint64_t(1) << ashift_);
		std::vector<column> cols = map_columns(offset, asize, ashift_, uint32_t(children_.size()), nparity_);

		std::vector<std::vector<uint8_t>> data(cols.size());
		size_t missing = cols.size();
		for (size_t c = 0; c != cols.size(); ++c)
		{
			data[c].resize(cols[c].size);
			const Device* device = children_[cols[c].child].get();
			if (device)
				device->read(vdev_data_start + cols[c].offset, data[c].data(), data[c].size());
			else if (c >= nparity_)
				missing = c;
		}

		if (missing != cols.size())
		{
			// P parity is the XOR of all data columns, shorter columns count as zero padded
			if (!children_[cols[0].child])
				throw image_io_failure("Can't reconstruct raidz column, parity is missing too");
			std::vector<uint8_t> rebuilt(data[0]);
			for (size_t c = nparity_; c != cols.size(); ++c)
				if (c != missing)
					for (size_t i = 0; i != data[c].size(); ++i)
						rebuilt[i] ^= data[c][i];
			rebuilt.resize(cols[missing].size);
			data[missing] = std::move(rebuilt);
		}

		uint64_t remaining = size;
		for (size_t c = nparity_; c < cols.size() && remaining != 0; ++c)
		{
			uint64_t length = std::min<uint64_t>(remaining, data[c].size());
			::memcpy(dest, data[c].data(), length);
			dest += length;
			remaining -= length;
		}
	}

	zfs_pool::zfs_pool(const pool_layout& layout) : layout_(layout)
	{
		for (const pool_layout::top_level_vdev& tlv : layout_.vdevs)
		{
			std::vector<std::unique_ptr<Device>> children;
			size_t missing = 0;
			for (const std::string& path : tlv.children)
			{
				if (path.empty())
				{
					children.emplace_back();
					++missing;
				}
				else
					children.emplace_back(new Device(path));
			}
			if (tlv.type == "disk" || tlv.type == "file")
			{
				if (children.size() != 1 || !children[0])
					throw image_io_failure("Missing image for top level vdev " + std::to_string(tlv.id));
				vdevs_.emplace_back(new leaf_vdev(std::move(children[0]), tlv.ashift));
			}
			else if (tlv.type == "mirror")
			{
				if (missing == children.size())
					throw image_io_failure("All images of mirror " + std::to_string(tlv.id) + " are missing");
				vdevs_.emplace_back(new mirror_vdev(std::move(children), tlv.ashift));
			}
			else if (tlv.type == "raidz")
			{
				if (missing > 1)
					throw image_io_failure("More than one image of raidz " + std::to_string(tlv.id) + " is missing");
				if (tlv.nparity < 1 || tlv.nparity >= children.size())
					throw malformed_structure("Invalid raidz parity for top level vdev " + std::to_string(tlv.id));
				vdevs_.emplace_back(new raidz_vdev(std::move(children), tlv.nparity, tlv.ashift));
			}
			else
				throw malformed_structure("Unsupported vdev type '" + tlv.type + "'");

			uint64_t max_valid_vdev_dva_offset = vdevs_.back()->asize() >> sector_shift; // dva offset is in 512 byte sectors
			if (limits_.max_valid_dva_offset < max_valid_vdev_dva_offset)
				limits_.max_valid_dva_offset = max_valid_vdev_dva_offset;
		}
		if (vdevs_.empty())
			throw malformed_structure("Pool without vdevs");
		limits_.max_top_level_vdev_id = uint32_t(vdevs_.size() - 1);
	}

	const vdev& zfs_pool::top_level_vdev(uint32_t vdev_id) const
	{
		if (vdev_id >= vdevs_.size())
			throw address_out_of_bounds("Invalid top level vdev id " + std::to_string(vdev_id) + ", max allowed: " + std::to_string(vdevs_.size()-1));
		return *vdevs_[vdev_id];
	}

	std::vector<physical_extent> zfs_pool::resolve(const zfs_data_address& address, uint64_t size) const
	{
		const vdev& v = top_level_vdev(address.vdev_id);
		check_range(address.byte_offset(), size, v.asize());
		return v.resolve(address.byte_offset(), size);
	}

	std::vector<uint8_t> zfs_pool::read(const zfs_data_address& address, uint64_t size) const
	{
		const vdev& v = top_level_vdev(address.vdev_id);
		check_range(address.byte_offset(), size, v.asize());
		std::vector<uint8_t> data(size);
		v.read(address.byte_offset(), size, data.data());
		return data;
	}

	block_data zfs_pool::read_block(const block_pointer_info& bpi) const
	{
		return read_block(bpi, 0);
	}

	block_data zfs_pool::read_block(const block_pointer_info& bpi, unsigned gang_depth) const
	{
		block_data result;
		if (bpi.embedded)
		{
			result.embedded = true;
			result.raw = bpi.embedded_data;
			if (bpi.compression != compression_algorithm::off)
				decompress(bpi.compression, result.raw.data(), result.raw.size(), bpi.lsize, result.decoded);
			return result;
		}
		if (bpi.hole)
		{
			result.decoded.assign(bpi.lsize, 0);
			return result;
		}

		std::exception_ptr first_error;
		for (size_t dva_idx = 0; dva_idx != block_pointer_info::ADDR_COUNT; ++dva_idx)
		{
			if (!is_valid(bpi.address[dva_idx]))
				continue;
			try
			{
				result = block_data();
				result.address = bpi.address[dva_idx];
				result.gang = bpi.address_gang_flag[dva_idx];
				result.raw = result.gang ? read_gang(bpi, dva_idx, gang_depth) : read(bpi.address[dva_idx], bpi.psize);
				if (bpi.checksum != checksum_algorithm::off)
				{
					block_checksum actual = compute_checksum(bpi.checksum, result.raw.data(), result.raw.size());
					if (actual != bpi.checksum_value)
					{
						std::ostringstream err;
						err << "checksum mismatch at " << bpi.address[dva_idx] << ", expected " << bpi.checksum_value << ", got " << actual;
						throw checksum_mismatch(err.str());
					}
				}
				if (bpi.compression != compression_algorithm::off)
					decompress(bpi.compression, result.raw.data(), result.raw.size(), bpi.lsize, result.decoded);
				return result;
			}
			catch (const checksum_mismatch&)
			{
				if (!first_error)
					first_error = std::current_exception();
			}
			catch (const decompression_failure&)
			{
				if (!first_error)
					first_error = std::current_exception();
			}
			catch (const address_out_of_bounds&)
			{
				if (!first_error)
					first_error = std::current_exception();
			}
			catch (const malformed_structure&)
			{
				if (!first_error)
					first_error = std::current_exception();
			}
		}
		if (first_error)
			std::rethrow_exception(first_error);
		throw malformed_structure("block pointer without a valid DVA");
	}

	std::vector<uint8_t> zfs_pool::read_gang(const block_pointer_info& bpi, size_t dva_idx, unsigned gang_depth) const
	{
		if (gang_depth >= max_gang_depth)
			throw malformed_structure("gang blocks nested too deep");
		const zfs_data_address& addr = bpi.address[dva_idx];
		std::vector<uint8_t> header = read(addr, gang_header_size);
		// see zio_checksum_gang_verifier
		block_checksum verifier;
		verifier.word[0] = addr.vdev_id;
		verifier.word[1] = addr.byte_offset();
		verifier.word[2] = bpi.physical_birth;
		if (!verify_embedded_checksum(checksum_algorithm::gang_header, header.data(), header.size(), verifier))
		{
			std::ostringstream err;
			err << "gang header checksum mismatch at " << addr;
			throw checksum_mismatch(err.str());
		}
		std::vector<uint8_t> data;
		for (size_t g = 0; g != gang_header_pointers; ++g)
		{
			block_pointer_info child;
			if (try_parse_block_pointer(&limits_, header.data() + g * block_pointer_size, child) == -1)
				throw malformed_structure("invalid block pointer in gang header");
			if (child.hole)
				continue;
			block_data piece = read_block(child, gang_depth + 1);
			const std::vector<uint8_t>& bytes = piece.logical();
			data.insert(data.end(), bytes.begin(), bytes.end());
		}
		if (data.size() < bpi.psize)
			throw malformed_structure("gang members hold fewer bytes than the block");
		data.resize(bpi.psize);
		return data;
	}

} // namespace zfs_undelete
