#include "pool.hpp"
#include "label.hpp"
#include "checksum.hpp"
#include "zfs_decompress.hpp"
#include "block_pointer.hpp"
#include "file.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{
	using namespace zfs_undelete;

	compression_algorithm parse_compression_name(const std::string& name)
	{
		for (uint8_t i = 0; i != compression_algorithm_count; ++i)
			if (name == compression_algorithm_name(static_cast<compression_algorithm>(i)))
				return static_cast<compression_algorithm>(i);
		throw std::runtime_error("Unknown compression '" + name + "'");
	}

	void write_bytes(const std::string& filename, const std::vector<uint8_t>& data)
	{
		RWFile out(filename, RWFile::ALWAYS_CREATE_EMPTY_NEW);
		if (!data.empty())
			out.write(data.data(), data.size());
	}
}

int main(int argc, const char** argv)
{
	try
	{
		namespace po = boost::program_options;
		using namespace zfs_undelete;

		po::positional_options_description p;
		p.add("images", -1);

		std::string zfs_config_filename;
		std::vector<std::string> images;
		std::string address_str;
		uint32_t vdev_id = 0;
		uint64_t offset = 0;
		uint64_t psize = 0;
		uint64_t lsize = 0;
		std::string compression = compression_algorithm_name(default_metadata_compression);
		std::string output_filename = "dva-data-raw.bin";
		std::string decompressed_filename;
		bool parse_bps = false;

		po::options_description desc("Allowed options");
		desc.add_options()
			("help", "produce help message")
			("zfs-cfg", po::value(&zfs_config_filename), "file with zfs configuration, pool members are discovered from their labels if omitted")
			("images", po::value(&images)->multitoken(), "pool member images")
			("address", po::value(&address_str), "address in zdb form vdev:offset:size, hex")
			("vdev", po::value(&vdev_id), "top level vdev id")
			("offset", po::value(&offset), "DVA byte offset")
			("psize", po::value(&psize), "physical size in bytes")
			("lsize", po::value(&lsize), "logical size in bytes, decompresses the data")
			("compression", po::value(&compression), "compression used with --lsize")
			("output", po::value(&output_filename), "file to write the raw bytes to")
			("decompressed", po::value(&decompressed_filename), "file to write the decompressed bytes to")
			("parse-bps", po::value(&parse_bps)->implicit_value(true)->zero_tokens(), "parse the (decompressed) data as block pointers")
			;

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);
		po::notify(vm);

		if (vm.count("help"))
		{
			std::cout << desc << "\n";
			return 1;
		}

		zfs_data_address addr;
		if (!address_str.empty())
			addr = parse_zfs_data_addr_string(address_str);
		else if (vm.count("offset") && vm.count("psize"))
		{
			if (offset % sector_size != 0)
				throw std::runtime_error("--offset must be a multiple of " + std::to_string(sector_size));
			addr.vdev_id = vdev_id;
			addr.offset = offset >> sector_shift;
			addr.size = psize;
		}
		else
			throw std::runtime_error("either --address or --offset and --psize are required");
		if (addr.size == 0)
			throw std::runtime_error("size of " + to_string(addr) + " is zero");

		pool_layout layout;
		if (!zfs_config_filename.empty())
			layout = zfs_config(zfs_config_filename).layout();
		else if (!images.empty())
			layout = discover_pool_layout(images, &std::cerr);
		else
			throw std::runtime_error("--zfs-cfg or images are required");

		print_uberblocks(std::cout, layout);
		zfs_pool pool(layout);
		std::cout << "Reading from: " << addr << std::endl ;
		std::vector<uint8_t> data = pool.read(addr);
		write_bytes(output_filename, data);
		std::cout << "fletcher4: " << compute_checksum(checksum_algorithm::fletcher_4, data.data(), data.size()) << std::endl ;

		const std::vector<uint8_t>* parsed = &data;
		std::vector<uint8_t> decompressed;
		if (lsize != 0)
		{
			decompress(parse_compression_name(compression), data.data(), data.size(), lsize, decompressed);
			parsed = &decompressed;
			if (!decompressed_filename.empty())
				write_bytes(decompressed_filename, decompressed);
		}

		if (parse_bps)
		{
			std::vector<block_pointer_info> bps;
			if (!try_parse_indirect_block(&pool.limits(), parsed->data(), parsed->size(), bps))
				std::cout << "Data is not an array of block pointers" << std::endl ;
			for (size_t i = 0; i != bps.size(); ++i)
				if (!bps[i].hole)
					std::cout << "[" << i << "] " << bps[i] << std::endl ;
		}
		return 0;
	}
	catch(const std::exception& e)
	{
		std::cerr << "Fatal error: " << e.what() << std::endl ;
		return 1;
	}
}
