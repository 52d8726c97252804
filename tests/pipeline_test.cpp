#include "pipeline.hpp"
#include "checkpoint.hpp"
#include "classify.hpp"
#include "dependency_graph.hpp"
#include "expander.hpp"
#include "scanner.hpp"

#include "sample_pool.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using namespace zfs_undelete;

namespace
{
	class pipeline_test : public ::testing::Test
	{
	protected:
		pipeline_test()
		{
			test::build_sample_pool(sample_);
			image_ = files_.path("pool.img");
			sample_.writer.save(image_);
			layout_.vdevs.resize(1);
			layout_.vdevs[0].type = "disk";
			layout_.vdevs[0].children.push_back(image_);
			options_.threads = 1;
			options_.progress = false;
		}

		pipeline_result run(fragment_set& set, const pipeline_options& options)
		{
			pipeline_stats stats;
			return run(set, options, stats);
		}

		pipeline_result run(fragment_set& set, const pipeline_options& options, pipeline_stats& stats)
		{
			zfs_pool pool(layout_);
			return run_undelete_pipeline(pool, set, options, stats);
		}

		// the image is saved again after changes to the sample
		void save_image()
		{
			sample_.writer.save(image_);
		}

		fragment scanned(const test::written_block& block) const
		{
			pool_limits limits;
			limits.max_top_level_vdev_id = 0;
			limits.max_valid_dva_offset = test::leaf_asize(test::default_image_size) >> 9;
			classify_options options;
			options.limits = &limits;
			std::vector<fragment> found = classify_window(block.physical.data(), block.physical.size(), dva_from_byte_offset(0, block.bp.offset, block.physical.size()), options);
			if (found.size() != 1)
				throw std::runtime_error("expected one fragment in the block");
			return std::move(found[0]);
		}

		static content_hash slot_hash(const test::bytes& dnode)
		{
			return make_slot_hash(dnode.data(), dnode.size());
		}

		static content_hash block_hash(const test::written_block& block)
		{
			return make_physical_hash(checksum_algorithm::fletcher_4, block.bp.cksum);
		}

		// registers what exporting 'reports' writes into 'dir' for removal
		void track_export(const std::string& dir, const std::vector<root_report>& reports)
		{
			files_.add(dir + "/summary.txt");
			for (const root_report& r : reports)
			{
				const std::string base = dir + "/" + report_base_name(r);
				switch (r.kind)
				{
					case fragment_kind::directory_dnode:
						files_.add(base);
						files_.add(base + ".dir");
						break;
					case fragment_kind::objset_dnode:
					case fragment_kind::objset_content:
						files_.add(base + ".objset");
						break;
					default:
						files_.add(base + ".bin");
						break;
				}
			}
		}

		static std::vector<uint8_t> content_of(const fragment_set& set, const content_hash& dnode, bool& complete)
		{
			fragment_set::fragment_ptr composite = set.composite_of(dnode);
			if (!composite)
			{
				complete = false;
				return {};
			}
			return assemble_content(set, *composite, complete);
		}

		test::temp_files files_;
		test::sample_pool sample_;
		std::string image_;
		pool_layout layout_;
		pipeline_options options_;
	};
}

TEST_F(pipeline_test, recovers_the_filesystem_and_the_orphan)
{
	fragment_set set;
	pipeline_result result = run(set, options_);

	const content_hash objset = block_hash(sample_.objset);
	const content_hash dir_root = slot_hash(sample_.dnode_root);
	const content_hash dir_other = slot_hash(sample_.dnode_other);
	const content_hash file_a = slot_hash(sample_.dnode_a);
	const content_hash file_b = slot_hash(sample_.dnode_b);
	const content_hash file_x = slot_hash(sample_.dnode_x);

	EXPECT_EQ(7u, result.basic_fragments.size());
	EXPECT_EQ(2u, result.stage2_roots);
	EXPECT_EQ(5u, result.stage2_edges);
	EXPECT_GT(result.expanded_fragments, result.basic_fragments.size());
	EXPECT_EQ(set.size(), result.expanded_fragments);
	EXPECT_EQ(2u, result.stage4_roots);
	EXPECT_GT(result.stage4_edges, result.stage2_edges);

	// objects are numbered by their slot in the objset's dnode array
	EXPECT_EQ(dir_root, set.find_object(object_placement{ objset, 2 })->hash);
	EXPECT_EQ(file_a, set.find_object(object_placement{ objset, 3 })->hash);
	EXPECT_EQ(file_b, set.find_object(object_placement{ objset, 4 })->hash);
	EXPECT_EQ(dir_other, set.find_object(object_placement{ objset, 5 })->hash);

	bool complete = true;
	EXPECT_EQ(sample_.content_a, content_of(set, file_a, complete));
	EXPECT_EQ(sample_.content_b, content_of(set, file_b, complete));
	EXPECT_EQ(sample_.content_x, content_of(set, file_x, complete));
	EXPECT_TRUE(complete);

	// a file listed by two directories has three parents
	pipeline_stats stats;
	dependency_graph graph = build_dependency_graph(set, options_, stats);
	EXPECT_TRUE(graph.has_edge(objset, file_a));
	EXPECT_TRUE(graph.has_edge(dir_root, file_a));
	EXPECT_TRUE(graph.has_edge(dir_other, file_a));
	EXPECT_TRUE(graph.has_edge(dir_root, file_b));
	EXPECT_FALSE(graph.has_edge(dir_other, file_b));
	EXPECT_TRUE(graph.has_edge(file_b, block_hash(sample_.indirect_b)));

	ASSERT_EQ(2u, result.reports.size());
	const root_report& orphan = result.reports[0];
	EXPECT_EQ(fragment_kind::file_dnode, orphan.kind);
	EXPECT_EQ(file_x, orphan.hash);
	EXPECT_EQ(test::sample_slot_x, orphan.location.slot);
	EXPECT_TRUE(orphan.complete);
	EXPECT_EQ(test::sample_size_x, orphan.logical_size);
	EXPECT_EQ(sample_.content_x, report_content(set, orphan));

	const root_report& os = result.reports[1];
	EXPECT_EQ(fragment_kind::objset_dnode, os.kind);
	EXPECT_EQ(objset, os.hash);
	EXPECT_TRUE(os.complete);
	ASSERT_EQ(4u, os.entries.size());
	EXPECT_EQ("2", os.entries[0].name);
	ASSERT_NE(nullptr, os.entries[0].report);
	EXPECT_EQ(fragment_kind::directory_dnode, os.entries[0].report->kind);
	EXPECT_EQ(3u, os.entries[1].object_id);
	ASSERT_NE(nullptr, os.entries[1].report);
	EXPECT_EQ(test::sample_size_a, os.entries[1].report->logical_size);
}

TEST_F(pipeline_test, directories_without_their_objset)
{
	// the objset block is written last, stop the scan before it
	options_.scan_end = sample_.objset.bp.offset;
	fragment_set set;
	pipeline_result result = run(set, options_);

	EXPECT_EQ(6u, result.basic_fragments.size());
	ASSERT_EQ(5u, result.reports.size());
	EXPECT_EQ(slot_hash(sample_.dnode_a), result.reports[0].hash);
	EXPECT_EQ(sample_.content_a, report_content(set, result.reports[0]));
	EXPECT_TRUE(result.reports[0].complete);
	EXPECT_EQ(slot_hash(sample_.dnode_b), result.reports[1].hash);
	EXPECT_EQ(sample_.content_b, report_content(set, result.reports[1]));
	EXPECT_EQ(slot_hash(sample_.dnode_x), result.reports[2].hash);

	// entries name objects no objset places
	const root_report& root = result.reports[3];
	EXPECT_EQ(fragment_kind::directory_dnode, root.kind);
	EXPECT_EQ(slot_hash(sample_.dnode_root), root.hash);
	EXPECT_FALSE(root.complete);
	ASSERT_EQ(2u, root.entries.size());
	EXPECT_EQ("a.txt", root.entries[0].name);
	EXPECT_EQ(3u, root.entries[0].object_id);
	EXPECT_EQ(nullptr, root.entries[0].report);
	EXPECT_EQ("b.bin", root.entries[1].name);
	EXPECT_EQ(fragment_kind::directory_dnode, result.reports[4].kind);
}

TEST_F(pipeline_test, thread_count_does_not_change_the_result)
{
	fragment_set single;
	pipeline_result one = run(single, options_);

	options_.threads = 4;
	options_.scan_range_size = 64 * 1024;
	fragment_set parallel;
	pipeline_result four = run(parallel, options_);

	EXPECT_EQ(one.basic_fragments, four.basic_fragments);
	EXPECT_EQ(single.hashes(), parallel.hashes());
	EXPECT_EQ(one.stage4_edges, four.stage4_edges);
	ASSERT_EQ(one.reports.size(), four.reports.size());
	for (size_t i = 0; i != one.reports.size(); ++i)
	{
		EXPECT_EQ(one.reports[i].hash, four.reports[i].hash);
		EXPECT_EQ(one.reports[i].location, four.reports[i].location);
		EXPECT_EQ(report_content(single, one.reports[i]), report_content(parallel, four.reports[i]));
	}
}

TEST_F(pipeline_test, basic_fragments_survive_expansion)
{
	fragment_set set;
	pipeline_result result = run(set, options_);
	for (const content_hash& h : result.basic_fragments)
		EXPECT_TRUE(set.contains(h)) << h;
}

TEST_F(pipeline_test, resumes_from_the_scan_checkpoint)
{
	const std::string dir = files_.path("checkpoints");
	const std::string scan_file = files_.add(dir + "/" + scan_checkpoint_name);
	files_.add(dir + "/" + expansion_checkpoint_name);
	options_.checkpoint_dir = dir;
	fragment_set first;
	pipeline_result full = run(first, options_);

	fragment_set resumed;
	load_fragment_set(scan_file, resumed);
	EXPECT_EQ(full.basic_fragments, resumed.hashes());

	options_.checkpoint_dir.clear();
	options_.skip_scan = true;
	pipeline_result second = run(resumed, options_);
	EXPECT_EQ(full.basic_fragments, second.basic_fragments);
	EXPECT_EQ(first.hashes(), resumed.hashes());
	ASSERT_EQ(full.reports.size(), second.reports.size());
	EXPECT_EQ(report_content(first, full.reports[0]), report_content(resumed, second.reports[0]));
}

TEST_F(pipeline_test, exports_reports_and_summary)
{
	fragment_set set;
	pipeline_result first = run(set, options_);
	ASSERT_EQ(2u, first.reports.size());

	const std::string dir = files_.path("export");
	const std::string summary = files_.add(dir + "/summary.txt");
	const std::string orphan = files_.add(dir + "/" + report_base_name(first.reports[0]) + ".bin");
	const std::string listing = files_.add(dir + "/" + report_base_name(first.reports[1]) + ".objset");
	options_.output_dir = dir;
	fragment_set exported;
	run(exported, options_);

	EXPECT_EQ(sample_.content_x, test::read_file(orphan));
	test::bytes text = test::read_file(summary);
	const std::string summary_text(text.begin(), text.end());
	EXPECT_EQ(0u, summary_text.find("roots: 2\n"));
	EXPECT_NE(std::string::npos, summary_text.find("windows scanned"));
	test::bytes objects = test::read_file(listing);
	EXPECT_EQ(4, std::count(objects.begin(), objects.end(), '\n'));
}

TEST_F(pipeline_test, scan_ranges_split_every_vdev)
{
	zfs_pool pool(layout_);
	const uint64_t asize = pool.top_level_vdev(0).asize();
	options_.scan_range_size = 1024 * 1024;
	std::vector<scan_range> ranges = make_scan_ranges(pool, options_);
	ASSERT_EQ((asize + options_.scan_range_size - 1) / options_.scan_range_size, ranges.size());
	EXPECT_EQ(0u, ranges.front().begin);
	EXPECT_EQ(asize, ranges.back().end);
	for (size_t i = 1; i != ranges.size(); ++i)
		EXPECT_EQ(ranges[i - 1].end, ranges[i].begin);

	options_.scan_start = 0x1000;
	options_.scan_end = 0x3000;
	ranges = make_scan_ranges(pool, options_);
	ASSERT_EQ(1u, ranges.size());
	EXPECT_EQ(0x1000u, ranges[0].begin);
	EXPECT_EQ(0x3000u, ranges[0].end);

	options_.scan_step = 100;
	EXPECT_THROW(make_scan_ranges(pool, options_), std::invalid_argument);
	options_.scan_step = 0;
	EXPECT_THROW(make_scan_ranges(pool, options_), std::invalid_argument);
}

TEST_F(pipeline_test, damaged_data_block_leaves_a_zero_filled_gap)
{
	// the middle block of b.bin no longer matches its checksum
	const test::written_block& damaged = sample_.data_b[1];
	sample_.writer.image().data()[test::data_area_start + damaged.bp.offset + 10] ^= 0xFF;
	save_image();

	const std::string dir = files_.path("damaged_export");
	options_.scan_end = sample_.objset.bp.offset;
	options_.output_dir = dir;
	fragment_set set;
	pipeline_stats stats;
	pipeline_result result = run(set, options_, stats);
	track_export(dir, result.reports);

	EXPECT_LE(1u, stats.checksum_mismatches.load());
	ASSERT_EQ(5u, result.reports.size());
	const root_report& b = result.reports[1];
	EXPECT_EQ(slot_hash(sample_.dnode_b), b.hash);
	EXPECT_FALSE(b.complete);
	EXPECT_NE(0u, b.anomalies & anomaly_incomplete);
	EXPECT_EQ(test::sample_size_b, b.logical_size);

	test::bytes expected = sample_.content_b;
	std::fill(expected.begin() + 4096, expected.begin() + 8192, 0);
	EXPECT_EQ(expected, report_content(set, b));
	EXPECT_EQ(expected, test::read_file(dir + "/" + report_base_name(b) + ".bin"));

	// the files around it are whole
	const root_report& a = result.reports[0];
	EXPECT_EQ(slot_hash(sample_.dnode_a), a.hash);
	EXPECT_TRUE(a.complete);
	EXPECT_EQ(sample_.content_a, test::read_file(dir + "/" + report_base_name(a) + ".bin"));
	const root_report& x = result.reports[2];
	EXPECT_EQ(slot_hash(sample_.dnode_x), x.hash);
	EXPECT_TRUE(x.complete);
	EXPECT_EQ(sample_.content_x, test::read_file(dir + "/" + report_base_name(x) + ".bin"));
}

TEST_F(pipeline_test, directory_claiming_a_huge_tree_is_skipped)
{
	// one hole pointer six levels up, maxblkid at the end of what it can address
	test::dnode_spec dn;
	dn.type = test::directory_type;
	dn.indblkshift = 17;
	dn.nlevels = 6;
	dn.datablkszsec = 256;
	dn.maxblkid = (uint64_t(1) << 50) - 1;
	dn.bonus = test::znode_bonus(2, 040755);
	const test::bytes huge = test::encode_dnode(dn);
	test::bytes block(16384, 0);
	test::copy_into(block, 0, huge);
	sample_.writer.write_block(block, test::dnode_type, 0, true);
	save_image();

	fragment_set set;
	pipeline_stats stats;
	pipeline_result result = run(set, options_, stats);

	EXPECT_LE(1u, stats.malformed_structures.load());
	ASSERT_EQ(3u, result.reports.size());
	EXPECT_EQ(slot_hash(sample_.dnode_x), result.reports[0].hash);
	EXPECT_EQ(sample_.content_x, report_content(set, result.reports[0]));
	const root_report& directory = result.reports[1];
	EXPECT_EQ(fragment_kind::directory_dnode, directory.kind);
	EXPECT_EQ(slot_hash(huge), directory.hash);
	EXPECT_FALSE(directory.complete);
	EXPECT_TRUE(directory.entries.empty());
	EXPECT_THROW(report_content(set, directory), malformed_structure);
	EXPECT_EQ(fragment_kind::objset_dnode, result.reports[2].kind);
}

TEST_F(pipeline_test, objsets_sharing_a_dnode_block_place_every_object)
{
	// a snapshot's objset maps the same dnode block, which no scan found
	test::dnode_spec meta;
	meta.type = test::dnode_type;
	meta.bonustype = 0;
	meta.datablkszsec = 32;
	meta.used = 1024;
	meta.blkptrs.push_back(sample_.dnode_block.pointer());
	const test::written_block snapshot = sample_.writer.write_block(test::encode_objset(test::encode_dnode(meta)), 11, 0, true);
	save_image();
	const content_hash objsets[] = { block_hash(sample_.objset), block_hash(snapshot) };

	std::vector<std::pair<object_placement, content_hash>> single;
	for (size_t threads : { 1, 4, 4, 4, 8, 8, 8, 8 })
	{
		fragment_set set;
		set.insert(scanned(sample_.objset));
		set.insert(scanned(snapshot));
		pipeline_options options = options_;
		options.threads = threads;
		pipeline_stats stats;
		zfs_pool pool(layout_);
		dependency_graph graph = build_dependency_graph(set, options, stats);
		ASSERT_EQ(2u, graph.roots().size());
		expand_roots(pool, set, graph, options, stats);

		for (const content_hash& os : objsets)
		{
			std::vector<std::pair<uint64_t, content_hash>> objects = set.objects_of(os);
			ASSERT_EQ(4u, objects.size()) << threads << " threads";
			EXPECT_EQ(2u, objects[0].first);
			EXPECT_EQ(slot_hash(sample_.dnode_root), objects[0].second);
			EXPECT_EQ(5u, objects[3].first);
			EXPECT_EQ(slot_hash(sample_.dnode_other), objects[3].second);
		}
		EXPECT_EQ(4u, set.slots_in_block(block_hash(sample_.dnode_block)).size());
		if (threads == 1)
			single = set.placements();
		else
			EXPECT_EQ(single, set.placements()) << threads << " threads";
	}
}
