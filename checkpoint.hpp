#pragma once

#include "fragment_set.hpp"

#include <string>

namespace zfs_undelete
{

	// Writes every fragment of the set together with its block slots, object placements
	// and collisions. Throws image_io_failure.
	void save_fragment_set(const fragment_set& set, const std::string& path);

	// Adds the content of a checkpoint written by save_fragment_set to 'set'.
	// Throws image_io_failure, malformed_structure.
	void load_fragment_set(const std::string& path, fragment_set& set);

} // namespace zfs_undelete
