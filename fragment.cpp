#include "fragment.hpp"
#include "errors.hpp"

#include <ostream>
#include <iomanip>
#include <sstream>
#include <string.h>

namespace zfs_undelete
{

	namespace
	{
		void put_u8(std::vector<uint8_t>& out, uint8_t v)
		{
			out.push_back(v);
		}

		void put_u64(std::vector<uint8_t>& out, uint64_t v)
		{
			for (size_t i = 0; i != 8; ++i)
				out.push_back(uint8_t(v >> (i * 8)));
		}

		void put_hash(std::vector<uint8_t>& out, const content_hash& h)
		{
			put_u8(out, static_cast<uint8_t>(h.domain));
			put_u8(out, static_cast<uint8_t>(h.algorithm));
			for (size_t i = 0; i != 4; ++i)
				put_u64(out, h.value.word[i]);
		}

		class table_reader
		{
		public:
			table_reader(const std::vector<uint8_t>& data) : data_(data) {}

			uint8_t u8()
			{
				need(1);
				return data_[pos_++];
			}

			uint64_t u64()
			{
				need(8);
				uint64_t v = 0;
				for (size_t i = 0; i != 8; ++i)
					v |= uint64_t(data_[pos_ + i]) << (i * 8);
				pos_ += 8;
				return v;
			}

			content_hash hash()
			{
				content_hash h;
				uint8_t domain = u8();
				if (domain > static_cast<uint8_t>(hash_domain::composite))
					throw malformed_structure("invalid hash domain in extent table");
				h.domain = static_cast<hash_domain>(domain);
				h.algorithm = static_cast<checksum_algorithm>(u8());
				for (size_t i = 0; i != 4; ++i)
					h.value.word[i] = u64();
				return h;
			}

			void bytes(std::vector<uint8_t>& out, size_t size)
			{
				need(size);
				out.assign(data_.begin() + pos_, data_.begin() + pos_ + size);
				pos_ += size;
			}

			bool at_end() const { return pos_ == data_.size(); }

		private:
			void need(size_t n) const
			{
				if (n > data_.size() - pos_)
					throw malformed_structure("truncated extent table");
			}

			const std::vector<uint8_t>& data_;
			size_t pos_ = 0;
		};
	}

	constexpr uint32_t physical_location::no_slot;

	std::ostream& operator << (std::ostream& os, const content_hash& h)
	{
		static const char* const domains[] = { "block", "slot", "composite" };
		uint8_t domain = static_cast<uint8_t>(h.domain);
		os << (domain < 3 ? domains[domain] : "?") << '/' << checksum_algorithm_name(h.algorithm) << '[' << h.value << ']';
		return os;
	}

	std::string to_hex(const content_hash& h)
	{
		std::ostringstream s;
		s << std::hex << std::setfill('0');
		for (size_t i = 0; i != 4; ++i)
			s << std::setw(16) << h.value.word[i];
		return s.str();
	}

	content_hash make_physical_hash(checksum_algorithm algorithm, const block_checksum& value)
	{
		content_hash h;
		h.domain = hash_domain::physical_block;
		h.algorithm = effective_checksum_algorithm(algorithm);
		h.value = value;
		return h;
	}

	content_hash make_physical_hash(checksum_algorithm algorithm, const uint8_t* data, size_t size)
	{
		return make_physical_hash(algorithm, compute_checksum(algorithm, data, size));
	}

	content_hash make_slot_hash(const uint8_t* data, size_t size)
	{
		content_hash h;
		h.domain = hash_domain::slot;
		h.algorithm = default_metadata_checksum;
		h.value = compute_checksum(default_metadata_checksum, data, size);
		return h;
	}

	content_hash make_composite_hash(const uint8_t* data, size_t size)
	{
		content_hash h;
		h.domain = hash_domain::composite;
		h.algorithm = checksum_algorithm::sha256;
		h.value = compute_checksum(checksum_algorithm::sha256, data, size);
		return h;
	}

	const char* fragment_kind_name(fragment_kind kind)
	{
		switch (kind)
		{
			case fragment_kind::file_dnode: return "FileDNode";
			case fragment_kind::directory_dnode: return "DirectoryDNode";
			case fragment_kind::objset_dnode: return "ObjsetDNode";
			case fragment_kind::indirect_block: return "IndirectBlock";
			case fragment_kind::file_content: return "FileContentFragment";
			case fragment_kind::objset_content: return "ObjsetFragment";
		}
		return "UNKNOWN";
	}

	bool is_file_like(fragment_kind kind)
	{
		return kind == fragment_kind::file_dnode || kind == fragment_kind::file_content || kind == fragment_kind::indirect_block;
	}

	std::string anomaly_names(uint32_t anomalies)
	{
		std::string result;
		auto add = [&result](const char* name)
			{
				if (!result.empty())
					result += ',';
				result += name;
			};
		if (anomalies & anomaly_checksum_collision)
			add("checksum_collision");
		if (anomalies & anomaly_incomplete)
			add("incomplete");
		if (anomalies & anomaly_cycle)
			add("cycle");
		return result;
	}

	std::ostream& operator << (std::ostream& os, const physical_location& location)
	{
		os << location.address;
		if (location.has_slot())
			os << '#' << std::dec << location.slot;
		return os;
	}

	std::ostream& operator << (std::ostream& os, const fragment& f)
	{
		os << "{kind=" << fragment_kind_name(f.kind)
			<< ", hash=" << f.hash
			<< ", location=" << f.location
			<< ", raw=" << f.raw.size()
			<< ", decoded=" << f.decoded.size();
		if (f.composite)
			os << ", origin=" << f.origin << ", logical_size=" << f.logical_size << ", extents=" << f.extents.size();
		if (f.anomalies)
			os << ", anomalies=" << anomaly_names(f.anomalies);
		os << "}";
		return os;
	}

	void seal_composite(fragment& f)
	{
		f.composite = true;
		f.raw.clear();
		f.decoded.clear();
		put_hash(f.raw, f.origin);
		put_u8(f.raw, static_cast<uint8_t>(f.kind));
		put_u64(f.raw, f.logical_size);
		put_u64(f.raw, f.extents.size());
		for (const fragment_extent& e : f.extents)
		{
			put_u8(f.raw, e.kind);
			put_u64(f.raw, e.length);
			if (e.kind == fragment_extent::leaf)
				put_hash(f.raw, e.hash);
			else if (e.kind == fragment_extent::embedded)
			{
				put_u64(f.raw, e.data.size());
				f.raw.insert(f.raw.end(), e.data.begin(), e.data.end());
			}
			if (e.kind == fragment_extent::missing)
				f.anomalies |= anomaly_incomplete;
		}
		f.hash = make_composite_hash(f.raw.data(), f.raw.size());
		f.block_hash = f.hash;
	}

	void unseal_composite(fragment& f)
	{
		table_reader in(f.raw);
		f.origin = in.hash();
		uint8_t kind = in.u8();
		if (kind > static_cast<uint8_t>(fragment_kind::objset_content))
			throw malformed_structure("invalid composite kind");
		f.kind = static_cast<fragment_kind>(kind);
		f.logical_size = in.u64();
		uint64_t count = in.u64();
		if (count > f.raw.size())
			throw malformed_structure("invalid extent count");
		f.extents.clear();
		f.extents.reserve(count);
		for (uint64_t i = 0; i != count; ++i)
		{
			fragment_extent e;
			uint8_t extent_kind = in.u8();
			if (extent_kind > fragment_extent::missing)
				throw malformed_structure("invalid extent kind");
			e.kind = static_cast<fragment_extent::kind_t>(extent_kind);
			e.length = in.u64();
			if (e.kind == fragment_extent::leaf)
				e.hash = in.hash();
			else if (e.kind == fragment_extent::embedded)
			{
				uint64_t size = in.u64();
				if (size > f.raw.size())
					throw malformed_structure("invalid embedded extent size");
				in.bytes(e.data, size_t(size));
			}
			f.extents.push_back(std::move(e));
		}
		if (!in.at_end())
			throw malformed_structure("trailing bytes after extent table");
		f.composite = true;
	}

} // namespace zfs_undelete
