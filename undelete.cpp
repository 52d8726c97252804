#include "pipeline.hpp"
#include "checkpoint.hpp"
#include "label.hpp"
#include "file.hpp"

#include <boost/program_options.hpp>

#include <iostream>
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
}

int main(int argc, const char** argv)
{
	try
	{
		namespace po = boost::program_options;
		using namespace zfs_undelete;

		po::positional_options_description p;
		p.add("images", -1);

		pipeline_options options;
		std::string zfs_config_filename;
		std::vector<std::string> images;
		std::string resume_from;
		std::string target;
		std::string compression = compression_algorithm_name(options.metadata_compression);
		bool verbose = false;
		bool print_stats = true;

		po::options_description desc("Allowed options");
		desc.add_options()
			("help", "produce help message")
			("zfs-cfg", po::value(&zfs_config_filename), "file with zfs configuration, pool members are discovered from their labels if omitted")
			("images", po::value(&images)->multitoken(), "pool member images")
			("vdev-ids", po::value(&options.vdev_ids)->multitoken(), "only scan specified vdevs")
			("threads", po::value(&options.threads), "worker threads, one per core if omitted")
			("scan-step", po::value(&options.scan_step)->default_value(options.scan_step), "scan step in bytes, a multiple of 512")
			("scan-start", po::value(&options.scan_start), "first DVA byte offset to scan")
			("scan-end", po::value(&options.scan_end), "DVA byte offset to stop scanning at")
			("headerless-sizes", po::value(&options.headerless_sizes)->multitoken(), "physical sizes tried for compressions without a length header")
			("max-indirect-block-size", po::value(&options.max_indirect_block_size)->default_value(options.max_indirect_block_size), "largest indirect block accepted by the scan")
			("compression", po::value(&compression), "compression of scanned metadata")
			("output-dir", po::value(&options.output_dir), "directory to export recovered roots to")
			("checkpoint-dir", po::value(&options.checkpoint_dir), "directory to save the fragment set to after the scan and the expansion")
			("resume-from", po::value(&resume_from), "load a saved fragment set and skip the scan")
			("target", po::value(&target), "only read the block at vdev:offset:size (hex) into dva_data_ours.raw")
			("no-progress", "do not print scan progress")
			("no-stats", "do not print the statistics")
			("verbose", po::value(&verbose)->implicit_value(true)->zero_tokens(), "print per candidate and per reference diagnostics")
			;

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);
		po::notify(vm);

		if (vm.count("help"))
		{
			std::cout << desc << "\n";
			return 1;
		}

		options.metadata_compression = parse_compression_name(compression);
		options.progress = vm.count("no-progress") == 0;
		print_stats = vm.count("no-stats") == 0;
		if (verbose)
			options.log = &std::cout;

		pool_layout layout;
		if (!zfs_config_filename.empty())
			layout = zfs_config(zfs_config_filename).layout();
		else if (!images.empty())
			layout = discover_pool_layout(images, options.log);
		else
			throw std::runtime_error("--zfs-cfg or images are required");
		std::cout << layout;
		print_uberblocks(std::cout, layout);

		zfs_pool pool(layout);

		if (!target.empty())
		{
			zfs_data_address addr = parse_zfs_data_addr_string(target);
			std::cout << "Reading from: " << addr << std::endl ;
			std::vector<uint8_t> data = pool.read(addr);
			RWFile out("dva_data_ours.raw", RWFile::ALWAYS_CREATE_EMPTY_NEW);
			if (!data.empty())
				out.write(data.data(), data.size());
			return 0;
		}

		fragment_set set;
		if (!resume_from.empty())
		{
			load_fragment_set(resume_from, set);
			std::cout << "Loaded " << set.size() << " fragments from " << resume_from << std::endl ;
			options.skip_scan = true;
		}

		pipeline_stats stats;
		pipeline_result result = run_undelete_pipeline(pool, set, options, stats);

		if (options.output_dir.empty())
			for (const root_report& r : result.reports)
				std::cout << r << std::endl ;
		if (print_stats)
			std::cout << stats;
		return 0;
	}
	catch(const std::exception& e)
	{
		std::cerr << "Fatal error: " << e.what() << std::endl ;
		return 1;
	}
}
