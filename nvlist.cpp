#include "nvlist.hpp"
#include "errors.hpp"

#include <ostream>

namespace zfs_undelete
{

	namespace
	{
		// data_type_t values
		enum : uint32_t
		{
			DATA_TYPE_BOOLEAN = 1,
			DATA_TYPE_INT64 = 7,
			DATA_TYPE_UINT64 = 8,
			DATA_TYPE_STRING = 9,
			DATA_TYPE_UINT64_ARRAY = 16,
			DATA_TYPE_HRTIME = 18,
			DATA_TYPE_NVLIST = 19,
			DATA_TYPE_NVLIST_ARRAY = 20,
		};

		constexpr uint8_t NV_ENCODE_XDR = 1;
		constexpr size_t max_nesting = 64;

		class xdr_reader
		{
		public:
			xdr_reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

			uint32_t read_u32()
			{
				need(4);
				uint32_t v = (uint32_t(data_[pos_]) << 24) | (uint32_t(data_[pos_+1]) << 16) | (uint32_t(data_[pos_+2]) << 8) | uint32_t(data_[pos_+3]);
				pos_ += 4;
				return v;
			}

			uint64_t read_u64()
			{
				uint64_t hi = read_u32();
				return (hi << 32) | read_u32();
			}

			std::string read_string()
			{
				uint32_t len = read_u32();
				need(len);
				std::string s(reinterpret_cast<const char*>(data_ + pos_), len);
				pos_ += len;
				skip((4 - len % 4) % 4);
				return s;
			}

			void skip(size_t n) { need(n); pos_ += n; }

			size_t position() const { return pos_; }
			void set_position(size_t pos)
			{
				if (pos > size_)
					throw malformed_structure("nvlist position out of range");
				pos_ = pos;
			}

		private:
			void need(size_t n) const
			{
				if (n > size_ - pos_)
					throw malformed_structure("truncated nvlist");
			}

			const uint8_t* data_;
			size_t size_;
			size_t pos_ = 0;
		};

		nvlist read_nvlist(xdr_reader& in, size_t depth);

		void read_value(xdr_reader& in, uint32_t type, uint32_t nelem, nvpair_value& value, size_t depth)
		{
			value.data_type = type;
			switch (type)
			{
				case DATA_TYPE_BOOLEAN:
					value.kind = nvpair_value::boolean;
					value.u64 = 1;
					break;
				case DATA_TYPE_UINT64:
				case DATA_TYPE_INT64:
				case DATA_TYPE_HRTIME:
					value.kind = nvpair_value::uint64;
					value.u64 = in.read_u64();
					break;
				case DATA_TYPE_STRING:
					value.kind = nvpair_value::string;
					value.str = in.read_string();
					break;
				case DATA_TYPE_UINT64_ARRAY:
					value.kind = nvpair_value::uint64_array;
					// xdr_array repeats the element count
					if (in.read_u32() != nelem)
						throw malformed_structure("nvpair array count mismatch");
					for (uint32_t i = 0; i != nelem; ++i)
						value.u64_array.push_back(in.read_u64());
					break;
				case DATA_TYPE_NVLIST:
					value.kind = nvpair_value::list;
					value.lists.push_back(read_nvlist(in, depth + 1));
					break;
				case DATA_TYPE_NVLIST_ARRAY:
					value.kind = nvpair_value::list_array;
					for (uint32_t i = 0; i != nelem; ++i)
						value.lists.push_back(read_nvlist(in, depth + 1));
					break;
				default:
					value.kind = nvpair_value::other;
					break;
			}
		}

		nvlist read_nvlist(xdr_reader& in, size_t depth)
		{
			if (depth > max_nesting)
				throw malformed_structure("nvlist nested too deep");
			nvlist result;
			in.read_u32(); // nvl_version
			in.read_u32(); // nvl_nvflag
			while (true)
			{
				size_t pair_start = in.position();
				uint32_t encode_size = in.read_u32();
				uint32_t decode_size = in.read_u32();
				if (encode_size == 0 && decode_size == 0)
					break;
				std::string name = in.read_string();
				uint32_t type = in.read_u32();
				uint32_t nelem = in.read_u32();
				nvpair_value value;
				read_value(in, type, nelem, value, depth);
				// the embedded lists of nvlist pairs follow the pair header, other values are inside it
				if (value.kind == nvpair_value::other)
					in.set_position(pair_start + encode_size);
				else if (value.kind != nvpair_value::list && value.kind != nvpair_value::list_array && in.position() != pair_start + encode_size)
					throw malformed_structure("nvpair '" + name + "' size mismatch");
				result.pairs.emplace_back(std::move(name), std::move(value));
			}
			return result;
		}

		void print(std::ostream& os, const nvlist& list, size_t indent)
		{
			for (const auto& pair : list.pairs)
			{
				os << std::string(indent, ' ') << pair.first << ": ";
				const nvpair_value& v = pair.second;
				switch (v.kind)
				{
					case nvpair_value::boolean: os << "true\n"; break;
					case nvpair_value::uint64: os << v.u64 << '\n'; break;
					case nvpair_value::string: os << '\'' << v.str << "'\n"; break;
					case nvpair_value::uint64_array:
						for (uint64_t x : v.u64_array)
							os << x << ' ';
						os << '\n';
						break;
					case nvpair_value::list:
					case nvpair_value::list_array:
						os << '\n';
						for (const nvlist& child : v.lists)
							print(os, child, indent + 4);
						break;
					default:
						os << "<type " << v.data_type << ">\n";
				}
			}
		}
	}

	const nvpair_value* nvlist::find(const std::string& name) const
	{
		for (const auto& pair : pairs)
			if (pair.first == name)
				return &pair.second;
		return nullptr;
	}

	bool nvlist::get_uint64(const std::string& name, uint64_t& value) const
	{
		const nvpair_value* v = find(name);
		if (!v || v->kind != nvpair_value::uint64)
			return false;
		value = v->u64;
		return true;
	}

	const std::string* nvlist::get_string(const std::string& name) const
	{
		const nvpair_value* v = find(name);
		return (v && v->kind == nvpair_value::string) ? &v->str : nullptr;
	}

	const nvlist* nvlist::get_nvlist(const std::string& name) const
	{
		const nvpair_value* v = find(name);
		return (v && v->kind == nvpair_value::list && !v->lists.empty()) ? &v->lists.front() : nullptr;
	}

	const std::vector<nvlist>* nvlist::get_nvlist_array(const std::string& name) const
	{
		const nvpair_value* v = find(name);
		return (v && v->kind == nvpair_value::list_array) ? &v->lists : nullptr;
	}

	std::ostream& operator << (std::ostream& os, const nvlist& list)
	{
		print(os, list, 0);
		return os;
	}

	nvlist parse_xdr_nvlist(const uint8_t* data, size_t size)
	{
		if (size < 4)
			throw malformed_structure("nvlist too short");
		// nvs_header_t: encoding, endian, reserved
		if (data[0] != NV_ENCODE_XDR)
			throw malformed_structure("nvlist is not XDR encoded, encoding=" + std::to_string(data[0]));
		xdr_reader in(data + 4, size - 4);
		return read_nvlist(in, 0);
	}

} // namespace zfs_undelete
