#include "pipeline_stats.hpp"

#include <mutex>

namespace zfs_undelete
{

	void log_line(std::ostream* log, const std::string& line)
	{
		if (!log)
			return;
		static std::mutex log_mutex;
		std::lock_guard<std::mutex> lock(log_mutex);
		*log << line << std::endl;
	}

} // namespace zfs_undelete
