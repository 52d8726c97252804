#include "reporter.hpp"
#include "objects.hpp"
#include "file.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>

namespace zfs_undelete
{

	namespace
	{
		// composites nest one level (objset -> dnode block), deeper chains are damage
		constexpr unsigned max_composite_depth = 8;

		bool composite_complete(const fragment_set& set, const fragment& f, unsigned depth = 0)
		{
			if (!f.composite)
				return true;
			if ((f.anomalies & anomaly_incomplete) || depth > max_composite_depth)
				return false;
			for (const fragment_extent& e : f.extents)
			{
				if (e.kind == fragment_extent::missing)
					return false;
				if (e.kind != fragment_extent::leaf)
					continue;
				fragment_set::fragment_ptr leaf = set.find(e.hash);
				if (!leaf)
				{
					// dnode blocks are kept as their slots
					if (set.slots_in_block(e.hash).empty())
						return false;
					continue;
				}
				if (!composite_complete(set, *leaf, depth + 1))
					return false;
			}
			return content_size(f) == f.logical_size;
		}

		class report_builder
		{
		public:
			report_builder(const fragment_set& set, const dependency_graph& graph) : set_(set), graph_(graph) {}

			std::shared_ptr<root_report> build(const fragment& f, bool recurse, std::set<content_hash>& path)
			{
				std::shared_ptr<root_report> r = std::make_shared<root_report>();
				r->kind = f.kind;
				r->hash = f.hash;
				r->location = f.location;
				r->anomalies = f.anomalies | graph_.anomalies(f.hash);
				if (set_.is_collision(f.hash))
					r->anomalies |= anomaly_checksum_collision;

				switch (f.kind)
				{
					case fragment_kind::file_dnode:
					case fragment_kind::indirect_block:
						set_content(*r, set_.composite_of(f.hash));
						break;
					case fragment_kind::file_content:
					case fragment_kind::objset_content:
						set_content(*r, set_.find(f.hash));
						break;
					case fragment_kind::directory_dnode:
						set_content(*r, set_.composite_of(f.hash));
						if (recurse)
							add_directory_entries(f, *r, path);
						break;
					case fragment_kind::objset_dnode:
						set_content(*r, set_.composite_of(f.hash));
						add_objset_entries(f, *r, path);
						break;
				}

				if (!r->complete)
					r->anomalies |= anomaly_incomplete;
				return r;
			}

		private:
			void set_content(root_report& r, const fragment_set::fragment_ptr& content)
			{
				if (!content)
				{
					r.complete = false;
					return;
				}
				r.content = content->hash;
				r.has_content = true;
				r.logical_size = content->composite ? content->logical_size : content->logical().size();
				if (!composite_complete(set_, *content))
					r.complete = false;
			}

			void add_directory_entries(const fragment& directory, root_report& r, std::set<content_hash>& path)
			{
				if (!path.insert(directory.hash).second)
				{
					r.anomalies |= anomaly_cycle;
					return;
				}
				std::vector<zap_entry> entries;
				try
				{
					entries = directory_entries(set_, directory);
				}
				catch (const malformed_structure&)
				{
					r.complete = false;
				}
				catch (const decompression_failure&)
				{
					r.complete = false;
				}

				std::vector<object_placement> placements = set_.placements_of(directory.hash);
				for (const zap_entry& entry : entries)
				{
					report_entry e;
					e.name = entry.name;
					e.object_id = entry.get_object_id();
					// the lowest objset placing the directory resolves its entries
					fragment_set::fragment_ptr child = placements.empty() ? nullptr : set_.find_object(object_placement{ placements.front().objset, e.object_id });
					if (child)
					{
						e.report = build(*child, true, path);
						if (!e.report->complete)
							r.complete = false;
					}
					else
						r.complete = false;
					r.entries.push_back(std::move(e));
				}
				std::sort(r.entries.begin(), r.entries.end(), [](const report_entry& lhs, const report_entry& rhs) { return lhs.name < rhs.name; });
				path.erase(directory.hash);
			}

			void add_objset_entries(const fragment& objset, root_report& r, std::set<content_hash>& path)
			{
				for (const std::pair<uint64_t, content_hash>& object : set_.objects_of(objset.hash))
				{
					report_entry e;
					e.name = std::to_string(object.first);
					e.object_id = object.first;
					if (fragment_set::fragment_ptr child = set_.find(object.second))
						e.report = build(*child, false, path);
					r.entries.push_back(std::move(e));
				}
			}

			const fragment_set& set_;
			const dependency_graph& graph_;
		};

		std::string sanitize_name(const std::string& name)
		{
			if (name.empty() || name == "." || name == "..")
				return "_" + name;
			std::string result = name;
			for (char& c : result)
				if (c == '/' || c == '\0')
					c = '_';
			return result;
		}

		std::string join_path(const std::string& dir, const std::string& name)
		{
			std::string path = dir;
			if (path.empty() || path.back() != '/')
				path += '/';
			return path + name;
		}

		void write_file(const std::string& path, const uint8_t* data, size_t size)
		{
			RWFile out(path, RWFile::ALWAYS_CREATE_EMPTY_NEW);
			if (size != 0)
				out.write(data, size);
		}

		void write_file(const std::string& path, const std::string& text)
		{
			write_file(path, reinterpret_cast<const uint8_t*>(text.data()), text.size());
		}

		void describe(std::ostream& os, const root_report& r)
		{
			os << fragment_kind_name(r.kind) << '\t' << to_hex(r.hash) << '\t' << r.location
				<< "\tsize=" << std::dec << r.logical_size
				<< "\tcomplete=" << (r.complete ? "yes" : "no");
			if (r.anomalies)
				os << "\tanomalies=" << anomaly_names(r.anomalies);
		}

		std::string entry_listing(const root_report& r)
		{
			std::ostringstream s;
			for (const report_entry& e : r.entries)
			{
				s << e.name << '\t' << std::dec << e.object_id << '\t';
				if (e.report)
					describe(s, *e.report);
				else
					s << "not recovered";
				s << '\n';
			}
			return s.str();
		}

		// Streams the object's bytes into 'path'. Holes and missing blocks are left sparse.
		void write_content(const fragment_set& set, const root_report& r, const std::string& path)
		{
			RWFile out(path, RWFile::ALWAYS_CREATE_EMPTY_NEW);
			fragment_set::fragment_ptr content = r.has_content ? set.find(r.content) : fragment_set::fragment_ptr();
			if (!content)
				return;
			bool complete = true;
			const uint64_t size = content_size(*content);
			visit_content(set, *content, 0, size, complete, [&out](uint64_t offset, const uint8_t* data, size_t length)
				{
					out.set_position(size_t(offset));
					out.write(data, length);
				});
			try
			{
				out.resize(size_t(size));
			}
			catch (const image_io_failure& e)
			{
				// sizes from damaged dnodes can exceed what the output filesystem holds
				std::cerr << "Error extending " << path << " to " << size << " bytes - " << e.what() << std::endl;
			}
		}

		void extract_directory(const fragment_set& set, const root_report& dir, const std::string& dest_path, std::set<content_hash>& path)
		{
			if (!path.insert(dir.hash).second)
				return;
			make_directory(dest_path);
			for (const report_entry& e : dir.entries)
			{
				std::string entry_path = join_path(dest_path, sanitize_name(e.name));
				if (!e.report)
				{
					std::cerr << "Error extracting filesystem entry " << entry_path << " - object " << e.object_id << " not recovered" << std::endl;
					continue;
				}
				if (e.report->kind == fragment_kind::directory_dnode)
					extract_directory(set, *e.report, entry_path, path);
				else
					write_content(set, *e.report, entry_path);
			}
			path.erase(dir.hash);
		}
	}

	std::ostream& operator << (std::ostream& os, const root_report& report)
	{
		os << "{kind=" << fragment_kind_name(report.kind)
			<< ", hash=" << report.hash
			<< ", location=" << report.location
			<< ", size=" << std::dec << report.logical_size
			<< ", complete=" << (report.complete ? 'Y' : 'N');
		if (report.anomalies)
			os << ", anomalies=" << anomaly_names(report.anomalies);
		if (!report.entries.empty())
			os << ", entries=" << report.entries.size();
		os << "}";
		return os;
	}

	std::vector<root_report> report_roots(const fragment_set& set, const dependency_graph& graph)
	{
		report_builder builder(set, graph);
		std::vector<root_report> reports;
		for (const content_hash& h : graph.roots())
		{
			fragment_set::fragment_ptr f = set.find(h);
			if (!f)
				continue;
			std::set<content_hash> path;
			reports.push_back(*builder.build(*f, true, path));
		}
		std::sort(reports.begin(), reports.end(), [](const root_report& lhs, const root_report& rhs)
			{
				if (lhs.kind != rhs.kind)
					return lhs.kind < rhs.kind;
				if (lhs.location != rhs.location)
					return lhs.location < rhs.location;
				return lhs.hash < rhs.hash;
			});
		return reports;
	}

	std::vector<uint8_t> report_content(const fragment_set& set, const root_report& report)
	{
		fragment_set::fragment_ptr content = report.has_content ? set.find(report.content) : fragment_set::fragment_ptr();
		if (!content)
			return {};
		bool complete = true;
		return assemble_content(set, *content, complete);
	}

	std::string report_base_name(const root_report& report)
	{
		std::ostringstream s;
		s << to_hex(report.hash) << '_' << std::dec << report.location.address.vdev_id << '-' << std::hex << report.location.address.byte_offset();
		return s.str();
	}

	void export_reports(const fragment_set& set, const std::vector<root_report>& reports, const std::string& dir, const pipeline_stats* stats)
	{
		make_directory(dir);
		std::ostringstream summary;
		summary << "roots: " << reports.size() << "\n";
		for (const root_report& r : reports)
		{
			const std::string base = join_path(dir, report_base_name(r));
			switch (r.kind)
			{
				case fragment_kind::directory_dnode:
				{
					write_file(base + ".dir", entry_listing(r));
					std::set<content_hash> path;
					extract_directory(set, r, base, path);
					break;
				}
				case fragment_kind::objset_dnode:
				case fragment_kind::objset_content:
					write_file(base + ".objset", entry_listing(r));
					break;
				case fragment_kind::file_dnode:
				case fragment_kind::file_content:
				case fragment_kind::indirect_block:
					write_content(set, r, base + ".bin");
					break;
			}
			describe(summary, r);
			summary << '\n';
		}
		if (stats)
			summary << "\n" << *stats;
		write_file(join_path(dir, "summary.txt"), summary.str());
	}

} // namespace zfs_undelete
