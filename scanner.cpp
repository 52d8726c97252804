#include "scanner.hpp"
#include "classify.hpp"
#include "worker_pool.hpp"
#include "errors.hpp"

#include <stdio.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace zfs_undelete
{

	namespace
	{
		// bytes read ahead of a candidate offset to learn its physical sizes
		constexpr uint64_t head_size = 512;

		class progress_reporter
		{
		public:
			progress_reporter(const std::vector<scan_range>& ranges, bool enabled) : enabled_(enabled)
			{
				for (const scan_range& r : ranges)
				{
					if (r.vdev_id >= totals_.size())
					{
						totals_.resize(r.vdev_id + 1, 0);
						done_.resize(r.vdev_id + 1, 0);
						percent_.resize(r.vdev_id + 1, 0);
					}
					totals_[r.vdev_id] += r.end - r.begin;
				}
			}

			void range_done(const scan_range& r)
			{
				std::lock_guard<std::mutex> lock(mutex_);
				done_[r.vdev_id] += r.end - r.begin;
				unsigned percent = totals_[r.vdev_id] == 0 ? 100 : unsigned(done_[r.vdev_id] * 100 / totals_[r.vdev_id]);
				if (enabled_ && percent != percent_[r.vdev_id])
				{
					percent_[r.vdev_id] = percent;
					printf("[vdev=%u]->%u %% complete\n", r.vdev_id, percent);
					fflush(stdout);
				}
			}

		private:
			bool enabled_;
			std::mutex mutex_;
			std::vector<uint64_t> totals_;
			std::vector<uint64_t> done_;
			std::vector<unsigned> percent_;
		};

		class range_scanner
		{
		public:
			range_scanner(const zfs_pool& pool, fragment_set& set, const pipeline_options& options, pipeline_stats& stats)
				: pool_(pool), set_(set), options_(options), stats_(stats)
			{
			}

			void scan(const scan_range& range)
			{
				const vdev& v = pool_.top_level_vdev(range.vdev_id);
				classify_options copt = make_classify_options(options_, &pool_.limits(), v.ashift());
				if (v.contiguous())
					scan_contiguous(range, v, copt);
				else
					scan_by_window(range, v, copt);
			}

		private:
			// one read covers the range and the longest block starting in it
			void scan_contiguous(const scan_range& range, const vdev& v, const classify_options& copt)
			{
				const uint64_t read_end = std::min(v.asize(), range.end + max_window(copt));
				std::vector<uint8_t> chunk;
				try
				{
					chunk = pool_.read(dva_from_byte_offset(range.vdev_id, range.begin, 0), read_end - range.begin);
				}
				catch (const address_out_of_bounds& e)
				{
					++stats_.out_of_bounds_reads;
					log_line(options_.log, std::string("scan range skipped: ") + e.what());
					return;
				}
				for (uint64_t offset = range.begin; offset < range.end; offset += options_.scan_step)
				{
					++stats_.windows_scanned;
					const uint8_t* head = chunk.data() + (offset - range.begin);
					const size_t available = size_t(read_end - offset);
					bool accepted = false;
					for (uint64_t size : candidate_physical_sizes(head, available, copt))
					{
						if (size > available)
							continue;
						if (accept(classify_window(head, size_t(size), dva_from_byte_offset(range.vdev_id, offset, size), copt)))
						{
							accepted = true;
							break;
						}
					}
					if (!accepted)
						++stats_.candidates_rejected;
				}
			}

			// raidz columns interleave blocks, every candidate size is read on its own
			void scan_by_window(const scan_range& range, const vdev& v, const classify_options& copt)
			{
				const uint64_t asize = v.asize();
				for (uint64_t offset = range.begin; offset < range.end; offset += options_.scan_step)
				{
					++stats_.windows_scanned;
					bool accepted = false;
					try
					{
						std::vector<uint8_t> head = pool_.read(dva_from_byte_offset(range.vdev_id, offset, 0), std::min(head_size, asize - offset));
						for (uint64_t size : candidate_physical_sizes(head.data(), head.size(), copt))
						{
							if (size > asize - offset)
								continue;
							zfs_data_address address = dva_from_byte_offset(range.vdev_id, offset, size);
							std::vector<uint8_t> window = pool_.read(address, size);
							if (accept(classify_window(window.data(), window.size(), address, copt)))
							{
								accepted = true;
								break;
							}
						}
					}
					catch (const address_out_of_bounds& e)
					{
						// a shorter member image ends the range
						++stats_.out_of_bounds_reads;
						log_line(options_.log, std::string("scan stopped: ") + e.what());
						return;
					}
					if (!accepted)
						++stats_.candidates_rejected;
				}
			}

			static uint64_t max_window(const classify_options& copt)
			{
				uint64_t result = std::max(copt.max_indirect_block_size, copt.max_dnode_block_size);
				for (uint64_t size : copt.headerless_sizes)
					result = std::max(result, size);
				return result;
			}

			bool accept(std::vector<fragment>&& fragments)
			{
				if (fragments.empty())
					return false;
				for (fragment& f : fragments)
				{
					if (options_.log)
					{
						std::ostringstream line;
						line << "accepted " << f;
						log_line(options_.log, line.str());
					}
					fragment_set::insert_result res = set_.insert(std::move(f));
					if (res.inserted)
						++stats_.fragments_accepted;
					if (res.collision)
						++stats_.collisions;
				}
				return true;
			}

			const zfs_pool& pool_;
			fragment_set& set_;
			const pipeline_options& options_;
			pipeline_stats& stats_;
		};
	}

	std::vector<scan_range> make_scan_ranges(const zfs_pool& pool, const pipeline_options& options)
	{
		if (options.scan_step == 0 || options.scan_step % sector_size != 0)
			throw std::invalid_argument("scan step must be a non-zero multiple of 512");
		std::vector<uint32_t> vdev_ids = options.vdev_ids;
		if (vdev_ids.empty())
			for (uint32_t id = 0; id != pool.top_level_vdev_count(); ++id)
				vdev_ids.push_back(id);

		// ranges start on a step boundary so splitting doesn't change the offsets visited
		uint64_t range_size = std::max(options.scan_range_size, options.scan_step);
		range_size -= range_size % options.scan_step;

		std::vector<scan_range> ranges;
		for (uint32_t vdev_id : vdev_ids)
		{
			const uint64_t asize = pool.top_level_vdev(vdev_id).asize();
			uint64_t begin = options.scan_start - options.scan_start % sector_size;
			uint64_t end = options.scan_end == 0 ? asize : std::min(options.scan_end, asize);
			for (uint64_t r = begin; r < end; r += range_size)
				ranges.push_back(scan_range{ vdev_id, r, std::min(end, r + range_size) });
		}
		return ranges;
	}

	void scan_pool(const zfs_pool& pool, fragment_set& set, const pipeline_options& options, pipeline_stats& stats)
	{
		std::vector<scan_range> ranges = make_scan_ranges(pool, options);
		progress_reporter progress(ranges, options.progress);
		range_scanner scanner(pool, set, options, stats);

		parallel_for(ranges.size(), options.threads, [&](size_t idx)
			{
				scanner.scan(ranges[idx]);
				progress.range_done(ranges[idx]);
			});
	}

} // namespace zfs_undelete
