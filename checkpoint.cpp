#include "checkpoint.hpp"
#include "file.hpp"
#include "errors.hpp"

namespace zfs_undelete
{

	namespace
	{
		constexpr uint64_t checkpoint_magic = 0x74706b6370756466ULL; // "fdupckpt"
		constexpr uint32_t checkpoint_version = 1;

		enum record_type : uint8_t
		{
			record_fragment = 1,
			record_block_slot = 2,
			record_placement = 3,
			record_collision = 4,
			record_end = 0xFF,
		};

		struct __attribute__((packed)) serialized_checkpoint_header
		{
			uint64_t magic = checkpoint_magic;
			uint32_t version = checkpoint_version;
			uint32_t reserved = 0;
		};

		struct __attribute__((packed)) serialized_hash
		{
			serialized_hash() = default;
			serialized_hash(const content_hash& h)
				: domain(static_cast<uint8_t>(h.domain))
				, algorithm(static_cast<uint8_t>(h.algorithm))
				, value{ h.value.word[0], h.value.word[1], h.value.word[2], h.value.word[3] }
			{
			}
			uint8_t domain = 0;
			uint8_t algorithm = 0;
			uint64_t value[4] = {};

			content_hash unserialize() const
			{
				if (domain > static_cast<uint8_t>(hash_domain::composite))
					throw malformed_structure("invalid hash domain in checkpoint");
				content_hash h;
				h.domain = static_cast<hash_domain>(domain);
				h.algorithm = static_cast<checksum_algorithm>(algorithm);
				for (size_t i = 0; i != 4; ++i)
					h.value.word[i] = value[i];
				return h;
			}
		};

		struct __attribute__((packed)) serialized_fragment
		{
			serialized_fragment() = default;
			serialized_fragment(const fragment& f)
				: hash(f.hash)
				, block_hash(f.block_hash)
				, vdev_id(f.location.address.vdev_id)
				, offset(f.location.address.offset)
				, size(f.location.address.size)
				, slot(f.location.slot)
				, kind(static_cast<uint8_t>(f.kind))
				, composite(f.composite ? 1 : 0)
				, anomalies(f.anomalies)
				, raw_size(f.raw.size())
				, decoded_size(f.decoded.size())
			{
			}
			serialized_hash hash;
			serialized_hash block_hash;
			uint32_t vdev_id = 0;
			uint64_t offset = 0;
			uint64_t size = 0;
			uint32_t slot = physical_location::no_slot;
			uint8_t kind = 0;
			uint8_t composite = 0;
			uint32_t anomalies = 0;
			uint64_t raw_size = 0;
			uint64_t decoded_size = 0;
		};

		struct __attribute__((packed)) serialized_block_slot
		{
			serialized_hash block_hash;
			uint32_t slot = 0;
			serialized_hash hash;
		};

		struct __attribute__((packed)) serialized_placement
		{
			serialized_hash objset;
			uint64_t object_id = 0;
			serialized_hash dnode;
		};

		class checkpoint_reader
		{
		public:
			explicit checkpoint_reader(ROFile& in) : in_(in), remaining_(in.size()) {}

			template<class T>
			void read(T& dest)
			{
				read_bytes(&dest, sizeof(T));
			}

			void read_bytes(void* dest, size_t size)
			{
				if (size > remaining_)
					throw malformed_structure("Truncated checkpoint '" + in_.filename() + "'");
				if (size != 0)
					in_.read(dest, size);
				remaining_ -= size;
			}

			size_t remaining() const { return remaining_; }

		private:
			ROFile& in_;
			size_t remaining_;
		};

		void write_fragment(RWFile& out, const fragment& f)
		{
			uint8_t type = record_fragment;
			out.write(&type, sizeof(type));
			serialized_fragment sf(f);
			out.write(&sf, sizeof(sf));
			if (!f.raw.empty())
				out.write(f.raw.data(), f.raw.size());
			if (!f.decoded.empty())
				out.write(f.decoded.data(), f.decoded.size());
		}

		fragment read_fragment(checkpoint_reader& in)
		{
			serialized_fragment sf;
			in.read(sf);
			if (sf.kind > static_cast<uint8_t>(fragment_kind::objset_content))
				throw malformed_structure("invalid fragment kind in checkpoint");
			if (sf.raw_size > in.remaining() || sf.decoded_size > in.remaining() - sf.raw_size)
				throw malformed_structure("Truncated checkpoint fragment");

			fragment f;
			f.hash = sf.hash.unserialize();
			f.block_hash = sf.block_hash.unserialize();
			f.location.address.vdev_id = sf.vdev_id;
			f.location.address.offset = sf.offset;
			f.location.address.size = sf.size;
			f.location.slot = sf.slot;
			f.kind = static_cast<fragment_kind>(sf.kind);
			f.anomalies = sf.anomalies;
			f.raw.resize(size_t(sf.raw_size));
			in.read_bytes(f.raw.data(), f.raw.size());
			f.decoded.resize(size_t(sf.decoded_size));
			in.read_bytes(f.decoded.data(), f.decoded.size());
			if (sf.composite)
			{
				unseal_composite(f);
				if (f.hash.domain != hash_domain::composite || make_composite_hash(f.raw.data(), f.raw.size()) != f.hash)
					throw malformed_structure("composite table does not match its hash");
			}
			return f;
		}
	}

	void save_fragment_set(const fragment_set& set, const std::string& path)
	{
		RWFile out(path, RWFile::ALWAYS_CREATE_EMPTY_NEW);
		serialized_checkpoint_header header;
		out.write(&header, sizeof(header));

		for (const fragment_set::fragment_ptr& f : set.snapshot())
			write_fragment(out, *f);

		for (const std::pair<content_hash, slot_ref>& item : set.block_slots())
		{
			uint8_t type = record_block_slot;
			out.write(&type, sizeof(type));
			serialized_block_slot s;
			s.block_hash = item.first;
			s.slot = item.second.slot;
			s.hash = item.second.hash;
			out.write(&s, sizeof(s));
		}

		for (const std::pair<object_placement, content_hash>& item : set.placements())
		{
			uint8_t type = record_placement;
			out.write(&type, sizeof(type));
			serialized_placement p;
			p.objset = item.first.objset;
			p.object_id = item.first.object_id;
			p.dnode = item.second;
			out.write(&p, sizeof(p));
		}

		for (const content_hash& h : set.collisions())
		{
			uint8_t type = record_collision;
			out.write(&type, sizeof(type));
			serialized_hash sh(h);
			out.write(&sh, sizeof(sh));
		}

		uint8_t end = record_end;
		out.write(&end, sizeof(end));
	}

	void load_fragment_set(const std::string& path, fragment_set& set)
	{
		ROFile file(path);
		checkpoint_reader in(file);

		serialized_checkpoint_header header;
		in.read(header);
		if (header.magic != checkpoint_magic)
			throw malformed_structure("'" + path + "' is not a checkpoint");
		if (header.version != checkpoint_version)
			throw malformed_structure("Unsupported checkpoint version " + std::to_string(header.version) + " in '" + path + "'");

		for (;;)
		{
			uint8_t type = 0;
			in.read(type);
			switch (type)
			{
				case record_fragment:
					set.insert(read_fragment(in));
					break;
				case record_block_slot:
				{
					serialized_block_slot s;
					in.read(s);
					set.add_block_slot(s.block_hash.unserialize(), slot_ref{ s.slot, s.hash.unserialize() });
					break;
				}
				case record_placement:
				{
					serialized_placement p;
					in.read(p);
					set.add_placement(object_placement{ p.objset.unserialize(), p.object_id }, p.dnode.unserialize());
					break;
				}
				case record_collision:
				{
					serialized_hash h;
					in.read(h);
					set.add_collision(h.unserialize());
					break;
				}
				case record_end:
					if (in.remaining() != 0)
						throw malformed_structure("Trailing bytes after the end of checkpoint '" + path + "'");
					return;
				default:
					throw malformed_structure("Unknown record type " + std::to_string(type) + " in checkpoint '" + path + "'");
			}
		}
	}

} // namespace zfs_undelete
