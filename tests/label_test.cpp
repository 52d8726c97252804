#include "label.hpp"
#include "zfs_config.hpp"
#include "file.hpp"
#include "errors.hpp"

#include "pool_image_builder.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace zfs_undelete;

namespace
{
	test::bytes objset_pointer(uint64_t offset)
	{
		test::bp_spec bp;
		bp.offset = offset;
		bp.asize = 2048;
		bp.lsize = 2048;
		bp.psize = 2048;
		bp.type = 11;
		return test::encode_bp(bp);
	}

	class label_test : public ::testing::Test
	{
	protected:
		std::string save(const test::disk_image& image, const std::string& name)
		{
			std::string path = files_.path(name);
			image.save(path);
			return path;
		}

	private:
		test::temp_files files_;
	};
}

TEST(zfs_config, devices_and_vdev_lines)
{
	std::istringstream in(
		"# two top level vdevs\n"
		"/images/a.img:0:0\n"
		"  /images/b.img:1:0  \n"
		"\n"
		"/images/c:d.img:0:1\n"
		"/images/e.img:1:1\n"
		"/images/f.img:2:1\n"
		"vdev:1:raidz:1:12\n");
	zfs_config config(in);
	ASSERT_EQ(5u, config.devices().size());
	EXPECT_EQ("/images/c:d.img", config.devices()[2].name);
	EXPECT_EQ(2u, config.devices_with_top_level_id(0).size());
	EXPECT_THROW(config.devices_with_top_level_id(2), malformed_structure);

	pool_layout layout = config.layout();
	ASSERT_EQ(2u, layout.vdevs.size());
	EXPECT_EQ("mirror", layout.vdevs[0].type);
	EXPECT_EQ("raidz", layout.vdevs[1].type);
	EXPECT_EQ(1u, layout.vdevs[1].nparity);
	EXPECT_EQ(12u, layout.vdevs[1].ashift);
	ASSERT_EQ(3u, layout.vdevs[1].children.size());
	EXPECT_EQ("/images/f.img", layout.vdevs[1].children[2]);
}

TEST(zfs_config, single_image_is_a_disk)
{
	std::istringstream in("pool.img:0:0\n");
	pool_layout layout = zfs_config(in).layout();
	ASSERT_EQ(1u, layout.vdevs.size());
	EXPECT_EQ("disk", layout.vdevs[0].type);
	EXPECT_EQ(9u, layout.vdevs[0].ashift);
}

TEST(zfs_config, invalid_lines_throw)
{
	std::istringstream no_ids("pool.img\n");
	EXPECT_THROW(zfs_config config(no_ids), malformed_structure);
	std::istringstream empty("# nothing\n");
	EXPECT_THROW(zfs_config config(empty), malformed_structure);
	std::istringstream bad_type("a.img:0:0\nvdev:0:draid:1:9\n");
	EXPECT_THROW(zfs_config config(bad_type), malformed_structure);
	std::istringstream duplicate("a.img:0:0\nb.img:0:0\n");
	EXPECT_THROW(zfs_config(duplicate).layout(), malformed_structure);
	std::istringstream small_raidz("a.img:0:0\nvdev:0:raidz:1:9\n");
	EXPECT_THROW(zfs_config(small_raidz).layout(), malformed_structure);
}

TEST(label, offsets_of_the_four_labels)
{
	const uint64_t size = 10 * 1024 * 1024 + 1000;
	EXPECT_EQ(0u, vdev_label_offset(size, 0));
	EXPECT_EQ(256u * 1024, vdev_label_offset(size, 1));
	EXPECT_EQ(10u * 1024 * 1024 - 512 * 1024, vdev_label_offset(size, 2));
	EXPECT_EQ(10u * 1024 * 1024 - 256 * 1024, vdev_label_offset(size, 3));
}

TEST_F(label_test, reads_config_and_best_uberblock)
{
	test::disk_image image;
	test::label_identity id;
	image.write_labels(test::label_config(id, test::disk_vdev_tree(id.guid)).packed());
	image.write_uberblock(0, 3, 70, objset_pointer(0x10000));
	image.write_uberblock(1, 5, 90, objset_pointer(0x20000));
	image.write_uberblock(2, 0, 80, objset_pointer(0x30000));
	// a newer uberblock with a broken checksum is ignored
	image.write_uberblock(3, 7, 120, objset_pointer(0x40000));
	image.data()[image.label_offset(3) + 128 * 1024 + 7 * 1024 + 100] ^= 1;
	const std::string path = save(image, "labels.img");

	Device device(path);
	vdev_label label;
	ASSERT_TRUE(read_vdev_label(device, 2, label));
	EXPECT_EQ("testpool", label.pool_name);
	EXPECT_EQ(id.pool_guid, label.pool_guid);
	EXPECT_EQ(id.guid, label.guid);
	EXPECT_EQ(50u, label.txg);
	ASSERT_NE(nullptr, label.config.get_nvlist("vdev_tree"));

	uberblock_info best;
	ASSERT_TRUE(find_best_uberblock(device, 9, best));
	EXPECT_EQ(90u, best.txg);
	EXPECT_EQ(1u, best.label);
	EXPECT_EQ(5u, best.slot);
	EXPECT_EQ(5000u, best.version);
	EXPECT_EQ(0x20000u, best.rootbp.address[0].byte_offset());
	EXPECT_EQ(11u, best.rootbp.type);
}

TEST_F(label_test, uberblock_summary_names_the_latest_root)
{
	test::disk_image image;
	test::label_identity id;
	image.write_labels(test::label_config(id, test::disk_vdev_tree(id.guid)).packed());
	image.write_uberblock(0, 3, 70, objset_pointer(0x10000));
	image.write_uberblock(2, 9, 95, objset_pointer(0x20000));
	const std::string path = save(image, "summary.img");
	const std::string blank = save(test::disk_image(), "summary_blank.img");

	pool_layout layout;
	layout.vdevs.resize(2);
	layout.vdevs[0].type = "disk";
	layout.vdevs[0].children.push_back(path);
	layout.vdevs[1].id = 1;
	layout.vdevs[1].type = "disk";
	layout.vdevs[1].children.push_back(blank);

	std::ostringstream out;
	print_uberblocks(out, layout);
	const std::string text = out.str();
	EXPECT_NE(std::string::npos, text.find(path + ": uberblock txg=95, "));
	EXPECT_NE(std::string::npos, text.find("rootbp=0:20000:"));
	EXPECT_NE(std::string::npos, text.find(blank + ": no valid uberblock\n"));

	layout.vdevs[1].children[0] = path + ".absent";
	EXPECT_THROW(print_uberblocks(out, layout), image_io_failure);
}

TEST_F(label_test, damaged_label_is_skipped)
{
	test::disk_image image;
	test::label_identity id;
	image.write_labels(test::label_config(id, test::disk_vdev_tree(id.guid)).packed());
	image.data()[image.label_offset(0) + 16 * 1024 + 10] ^= 0x40;
	const std::string path = save(image, "damaged.img");

	Device device(path);
	vdev_label label;
	std::ostringstream log;
	EXPECT_FALSE(read_vdev_label(device, 0, label, &log));
	EXPECT_FALSE(log.str().empty());
	EXPECT_TRUE(read_vdev_label(device, 1, label));

	uberblock_info best;
	EXPECT_FALSE(find_best_uberblock(device, 9, best));
}

TEST_F(label_test, discovers_single_disk)
{
	test::disk_image image;
	test::label_identity id;
	image.write_labels(test::label_config(id, test::disk_vdev_tree(id.guid)).packed());
	const std::string path = save(image, "disk.img");

	pool_layout layout = discover_pool_layout({ path });
	ASSERT_EQ(1u, layout.vdevs.size());
	EXPECT_EQ("disk", layout.vdevs[0].type);
	ASSERT_EQ(1u, layout.vdevs[0].children.size());
	EXPECT_EQ(path, layout.vdevs[0].children[0]);

	// same layout as an explicit config naming the image
	std::istringstream in(path + ":0:0\n");
	pool_layout configured = zfs_config(in).layout();
	ASSERT_EQ(1u, configured.vdevs.size());
	EXPECT_EQ(configured.vdevs[0].type, layout.vdevs[0].type);
	EXPECT_EQ(configured.vdevs[0].ashift, layout.vdevs[0].ashift);
	EXPECT_EQ(configured.vdevs[0].nparity, layout.vdevs[0].nparity);
	EXPECT_EQ(configured.vdevs[0].children, layout.vdevs[0].children);
}

TEST_F(label_test, discovers_raidz_children_in_any_order)
{
	const std::vector<uint64_t> guids{ 0x501, 0x502, 0x503 };
	std::vector<std::string> paths;
	for (size_t c = 0; c != guids.size(); ++c)
	{
		test::disk_image image;
		test::label_identity id;
		id.guid = guids[c];
		id.top_guid = 0x500;
		image.write_labels(test::label_config(id, test::raidz_vdev_tree(0x500, guids)).packed());
		paths.push_back(save(image, "raidz" + std::to_string(c) + ".img"));
	}

	pool_layout layout = discover_pool_layout({ paths[2], paths[0], paths[1] });
	ASSERT_EQ(1u, layout.vdevs.size());
	EXPECT_EQ("raidz", layout.vdevs[0].type);
	EXPECT_EQ(1u, layout.vdevs[0].nparity);
	EXPECT_EQ(paths, layout.vdevs[0].children);
}

TEST_F(label_test, discovery_rejects_foreign_and_blank_images)
{
	test::disk_image a, b;
	test::label_identity id_a, id_b;
	id_b.pool_guid = 0x9999;
	a.write_labels(test::label_config(id_a, test::disk_vdev_tree(id_a.guid, 0)).packed());
	b.write_labels(test::label_config(id_b, test::disk_vdev_tree(id_b.guid, 1)).packed());
	const std::string path_a = save(a, "pool_a.img");
	const std::string path_b = save(b, "pool_b.img");
	EXPECT_THROW((discover_pool_layout({ path_a, path_b })), malformed_structure);

	const std::string blank = save(test::disk_image(), "blank.img");
	EXPECT_THROW(discover_pool_layout({ blank }), malformed_structure);

	test::disk_image wrong_guid;
	test::label_identity id;
	wrong_guid.write_labels(test::label_config(id, test::disk_vdev_tree(0x7777)).packed());
	EXPECT_THROW(discover_pool_layout({ save(wrong_guid, "wrong_guid.img") }), malformed_structure);
}
