#pragma once

// OpenZFS on-disk structures and accessor macros.
// Include this header after every standard and third-party header of a
// source file: the userland ZFS headers define macros (MIN, MAX, ASSERT,
// likely, ...) that must not leak into them.

#include "errors.hpp"

#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <pthread.h>

#define private private_non_keyword
#define class class_non_keyword
#include <sys/spa.h>
#include <sys/zio.h>
#include <sys/zio_checksum.h>
#include <sys/zio_compress.h>
#include <sys/dmu.h>
#include <sys/dnode.h>
#include <sys/dmu_objset.h>
#include <sys/blkptr.h>
#include <sys/zap_impl.h>
#include <sys/zap_leaf.h>
#include <sys/vdev_impl.h>
#include <sys/uberblock_impl.h>
#include <zfs_fletcher.h>
#undef class
#undef private

namespace zfs_undelete
{
	template<class T>
	const T& get_mem_pod(const uint8_t* ptr, size_t offset, size_t data_length)
	{
		if (offset > data_length || sizeof(T) > data_length - offset)
			throw malformed_structure("out of bounds in get_mem_pod");
		return *reinterpret_cast<const T*>(ptr + offset);
	}

	static_assert(sizeof(blkptr_t) == 128, "");
	static_assert(sizeof(dnode_phys_t) == 512, "");
	static_assert(sizeof(mzap_ent_phys_t) == 64, "");
	static_assert(sizeof(zap_leaf_chunk_t) == 24, "");
} // namespace zfs_undelete
