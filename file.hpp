#pragma once

#include "errors.hpp"

#include <vector>
#include <string>
#include <stdint.h>
#include <string.h>

#include <linux/fs.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

namespace zfs_undelete
{

	class ROFile
	{
	public:
		explicit ROFile(const std::string& filename) : ROFile(filename, O_RDONLY) {}
		ROFile() = default;
		ROFile(const ROFile&) = delete;
		ROFile& operator=(const ROFile&) = delete;
		ROFile(ROFile&& rhs) : handle_(rhs.handle_), filename_(std::move(rhs.filename_)) { rhs.handle_ = -1; }
		~ROFile() { if (handle_ != -1) ::close(handle_); }

		size_t size() const
		{
			struct stat st;
			int res = ::fstat(handle_, &st);
			if (res != 0)
				throw image_io_failure("Error calling fstat on " + filename_);

			uint64_t size = st.st_size;
			if (size == 0 && S_ISBLK(st.st_mode))
			{
				if (::ioctl(handle_, BLKGETSIZE64, &size) != 0)
					throw image_io_failure("Error getting block device size of " + filename_);
			}

			return size;
		}

		void set_position(size_t pos)
		{
			off64_t ret = ::lseek64(handle_, pos, SEEK_SET);
			if (ret == -1)
				throw image_io_failure("Error setting file '" + filename_ + "' position to " + std::to_string(pos));
		}

		void read(void* dest, size_t size)
		{
			ssize_t res = ::read(handle_, dest, size);
			if (res < 0 || static_cast<size_t>(res) != size)
				throw image_io_failure("Error reading " + std::to_string(size) + " bytes from file '" + filename_ + "'");
		}

		std::vector<uint8_t> read()
		{
			std::vector<uint8_t> v(size());
			read(v.data(), v.size());
			return v;
		}

		const std::string& filename() const { return filename_; }

	protected:
		explicit ROFile(const std::string& filename, int flags) : filename_(filename)
		{
			handle_ = ::open(filename.c_str(), flags,  S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
			if (handle_ == -1)
				throw image_io_failure("Error opening file " + filename);
		}

		int handle_ = -1;
		std::string filename_;
		friend class MMROFileView;
	};

	class RWFile : public ROFile
	{
	public:
		enum flags_t { DEFAULT = 0, CREATE_IF_NOT_EXISTS = 1, ALWAYS_CREATE_EMPTY_NEW = 2 };
		RWFile(const std::string& filename, flags_t flags)
			: ROFile(
				filename,
				(
					O_RDWR
					| (flags==flags_t::CREATE_IF_NOT_EXISTS ? O_CREAT : 0)
					| (flags==flags_t::ALWAYS_CREATE_EMPTY_NEW ? (O_CREAT | O_TRUNC) : 0)
				))
		{
		}
		void write(const void* src, size_t size)
		{
			ssize_t res = ::write(handle_, src, size);
			if (res < 0 || static_cast<size_t>(res) != size)
				throw image_io_failure("Error writing " + std::to_string(size) + " bytes to file '" + filename_ + "'");
		}

		// grows the file with a hole, or truncates it
		void resize(size_t size)
		{
			int res = ::ftruncate(handle_, size);
			if (res == -1)
				throw image_io_failure("Error resizing file '" + filename_ + "' to " + std::to_string(size) + " bytes");
		}
	};

	// creates one directory level, an existing directory is fine
	inline void make_directory(const std::string& path)
	{
		if (::mkdir(path.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) != 0 && errno != EEXIST)
			throw image_io_failure("Error creating directory " + path);
	}

	// Read-only mapping of a whole file. Images are never written to.
	class MMROFileView
	{
	public:
		explicit MMROFileView(const ROFile& file)
			: file_(&file)
		{
			size_ = file_->size();
			if (size_ == 0)
				return;
			void* addr = ::mmap(0, size_, PROT_READ, MAP_SHARED, file_->handle_, 0);
			if (addr == MAP_FAILED)
				throw image_io_failure("mmap failed with: " + file_->filename());
			mapping_addr_ = static_cast<uint8_t*>(addr);

			::madvise(mapping_addr_, size_, MADV_SEQUENTIAL);
		}
		~MMROFileView()
		{
			if (mapping_addr_)
				::munmap(mapping_addr_, size_);
		}

		MMROFileView(const MMROFileView&) = delete;
		MMROFileView& operator=(const MMROFileView&) = delete;
		MMROFileView(MMROFileView&& rhs) : mapping_addr_(rhs.mapping_addr_), file_(rhs.file_), size_(rhs.size_)
		{
			rhs.mapping_addr_ = nullptr;
			rhs.size_ = 0;
		}

		size_t size() const { return size_; }
		const uint8_t* data() const { return mapping_addr_; }

	protected:
		uint8_t* mapping_addr_ = nullptr;
	private:
		const ROFile* file_;
		size_t size_ = 0;
	};

	class DeviceImpl { protected: ROFile file; DeviceImpl(const std::string& filename) : file(filename) {} };

	// A pool member image opened read-only and mapped into memory
	class Device : private DeviceImpl, public MMROFileView
	{
	public:
		explicit Device(const std::string& filename)
			: DeviceImpl(filename), MMROFileView(file)
		{
		}
		Device(const Device&) = delete;
		Device& operator=(const Device&) = delete;

		const std::string& filename() const { return file.filename(); }

		void read(uint64_t offset, void* dest, size_t length) const
		{
			if (offset > size() || length > size() - offset)
				throw address_out_of_bounds("Device " + filename() + " size=" + std::to_string(size()) + " but trying to read " + std::to_string(length) + " from offset " + std::to_string(offset));
			::memcpy(dest, data() + offset, length);
		}
	};

} // namespace zfs_undelete
