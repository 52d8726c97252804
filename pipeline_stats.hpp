#pragma once

#include "errors.hpp"

#include <stdint.h>
#include <atomic>
#include <ostream>
#include <string>

namespace zfs_undelete
{

	// Counters shared by all stages, updated from worker threads
	struct pipeline_stats
	{
		std::atomic<uint64_t> windows_scanned{0};
		std::atomic<uint64_t> candidates_rejected{0};
		std::atomic<uint64_t> fragments_accepted{0};
		std::atomic<uint64_t> references_resolved{0};
		std::atomic<uint64_t> references_unresolved{0};
		std::atomic<uint64_t> checksum_mismatches{0};
		std::atomic<uint64_t> decompression_failures{0};
		std::atomic<uint64_t> out_of_bounds_reads{0};
		std::atomic<uint64_t> malformed_structures{0};
		std::atomic<uint64_t> collisions{0};
		std::atomic<uint64_t> cycles_detected{0};
		std::atomic<uint64_t> blocks_read{0};
		std::atomic<uint64_t> composites_built{0};
	};

	inline std::ostream& operator << (std::ostream& os, const pipeline_stats& stats)
	{
		os << "windows scanned: " << stats.windows_scanned << "\n"
			<< "candidates rejected: " << stats.candidates_rejected << "\n"
			<< "fragments accepted: " << stats.fragments_accepted << "\n"
			<< "references resolved: " << stats.references_resolved << "\n"
			<< "references unresolved: " << stats.references_unresolved << "\n"
			<< "checksum mismatches: " << stats.checksum_mismatches << "\n"
			<< "decompression failures: " << stats.decompression_failures << "\n"
			<< "out of bounds reads: " << stats.out_of_bounds_reads << "\n"
			<< "malformed structures: " << stats.malformed_structures << "\n"
			<< "collisions: " << stats.collisions << "\n"
			<< "cycles detected: " << stats.cycles_detected << "\n"
			<< "blocks read: " << stats.blocks_read << "\n"
			<< "composites built: " << stats.composites_built << "\n";
		return os;
	}

	// Writes one line to 'log' under a process wide lock. Does nothing for a null log.
	void log_line(std::ostream* log, const std::string& line);

	// Runs 'fn' and counts the errors a single damaged block can raise.
	// Returns false if one was caught; image_io_failure and anything else propagates.
	template<class Fn>
	bool count_block_errors(pipeline_stats& stats, std::ostream* log, Fn&& fn)
	{
		try
		{
			fn();
			return true;
		}
		catch (const checksum_mismatch& e)
		{
			++stats.checksum_mismatches;
			log_line(log, std::string("checksum mismatch: ") + e.what());
		}
		catch (const decompression_failure& e)
		{
			++stats.decompression_failures;
			log_line(log, std::string("decompression failure: ") + e.what());
		}
		catch (const address_out_of_bounds& e)
		{
			++stats.out_of_bounds_reads;
			log_line(log, std::string("out of bounds: ") + e.what());
		}
		catch (const malformed_structure& e)
		{
			++stats.malformed_structures;
			log_line(log, std::string("malformed structure: ") + e.what());
		}
		return false;
	}

} // namespace zfs_undelete
