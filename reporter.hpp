#pragma once

#include "dependency_graph.hpp"
#include "fragment_set.hpp"
#include "pipeline_stats.hpp"

#include <stdint.h>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace zfs_undelete
{

	struct root_report;

	struct report_entry
	{
		std::string name; // directory entry name, or the object id for objset listings
		uint64_t object_id = 0;
		std::shared_ptr<const root_report> report; // null when the object was not recovered
	};

	struct root_report
	{
		fragment_kind kind = fragment_kind::file_content;
		content_hash hash;
		physical_location location;
		bool complete = true;
		uint32_t anomalies = 0;
		uint64_t logical_size = 0;
		// fragment holding the object's bytes, the root itself for content fragments
		content_hash content;
		bool has_content = false;
		std::vector<report_entry> entries; // directories and objsets
	};

	std::ostream& operator << (std::ostream& os, const root_report& report);

	// Stage 5. One report per root of 'graph', ordered by kind, location and hash.
	std::vector<root_report> report_roots(const fragment_set& set, const dependency_graph& graph);

	// Bytes of the object a report describes, assembled in memory.
	// Throws malformed_structure when it is larger than max_assembled_size.
	std::vector<uint8_t> report_content(const fragment_set& set, const root_report& report);

	// <hash>_<vdev>-<offset> base name of a report's files
	std::string report_base_name(const root_report& report);

	// Writes the reports and summary.txt into 'dir', created if missing. Throws image_io_failure.
	// File contents are assembled one at a time while writing.
	// Directory roots are also extracted as a tree beneath <base name>/.
	void export_reports(const fragment_set& set, const std::vector<root_report>& reports, const std::string& dir, const pipeline_stats* stats);

} // namespace zfs_undelete
