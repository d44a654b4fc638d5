#ifndef SSHC_CORE_PACKET_SER_IMPL_HEADER
#define SSHC_CORE_PACKET_SER_IMPL_HEADER

#include "packet_ser.hpp"
#include "ssh_binary_util.hpp"
#include "protocol_helpers.hpp"

#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace securepath::sshc::ser {

template<typename Type, std::size_t MinSize>
struct fixed_field {
	using type = Type;
	type data{};

	fixed_field() = default;
	fixed_field(type t) : data(t) {}

	static constexpr std::size_t static_size = MinSize;

	bool read(ssh_bf_reader& r) {
		return r.read(data);
	}

	bool write(ssh_bf_writer& w) const {
		return w.write(data);
	}

	type& view() {
		return data;
	}
};

struct boolean : fixed_field<bool, 1> {
	using fixed_field::fixed_field;
	std::size_t size() const { return static_size; }
};

struct byte : fixed_field<std::byte, 1> {
	using fixed_field::fixed_field;
	std::size_t size() const { return static_size; }
};

struct uint32 : fixed_field<std::uint32_t, 4> {
	using fixed_field::fixed_field;
	std::size_t size() const { return static_size; }
};

struct uint64 : fixed_field<std::uint64_t, 8> {
	using fixed_field::fixed_field;
	std::size_t size() const { return static_size; }
};

struct mpint : fixed_field<const_mpint_span, 4> {
	using fixed_field::fixed_field;
	std::size_t size() const { return encoded_size(data); }
};

struct string : fixed_field<std::string_view, 4> {
	using fixed_field::fixed_field;
	std::size_t size() const { return static_size + data.size(); }
};

struct name_list {
	using type = name_list_t;

	name_list() = default;
	name_list(type const& t) : valid(to_string_list(t, data)) {}

	type value{};
	std::string data{};
	bool valid{true};

	static constexpr std::size_t static_size = 4;
	std::size_t size() const {
		return static_size + data.size();
	}

	bool read(ssh_bf_reader& r) {
		std::string_view in;
		return r.read(in) && parse_string_list(in, value);
	}

	bool write(ssh_bf_writer& w) const {
		return valid && w.write(std::string_view(data));
	}

	type& view() {
		return value;
	}
};

template<std::size_t Size>
struct bytes {
	using type = std::span<std::byte const, Size>;

	// constant size span is not default constructible
	std::optional<type> data{};

	bytes() = default;
	bytes(type t) : data(t) {}

	static constexpr std::size_t static_size = Size;
	std::size_t size() const { return Size; }

	bool read(ssh_bf_reader& r) {
		return r.read(data);
	}

	bool write(ssh_bf_writer& w) const {
		SSHC_ASSERT(data, "invalid state");
		return w.write(*data);
	}

	type& view() {
		SSHC_ASSERT(data, "invalid state");
		return *data;
	}
};

// marker to recognise nested packets in make_packet_saver
struct packet_saver_tag {};

template<std::uint8_t Type, typename... TypeTags>
class packet_saver : public packet_saver_tag {
public:
	using fields = std::tuple<TypeTags...>;

	template<typename... Args>
	packet_saver(Args&&... args)
	: fields_{std::forward<Args>(args)...}
	{
		static_assert(sizeof...(Args) == sizeof...(TypeTags), "wrong number of packet fields");
	}

	bool write(ssh_bf_writer& writer) {
		auto const start = writer.used_size();
		bool ret = writer.write(std::uint8_t(Type))
			&& std::apply([&](auto const&... f) { return (f.write(writer) && ...); }, fields_);

		if(ret) {
			size_ = writer.used_size() - start;
		}
		return ret;
	}

	bool write(span out) {
		ssh_bf_writer writer(out);
		return write(writer);
	}

	/// Upper bound of the serialised size, used to allocate the buffer for write()
	std::size_t size() const {
		return byte::static_size + std::apply([](auto const&... f) { return (f.size() + ... + 0); }, fields_);
	}

	/// Actual size after write()
	std::size_t serialised_size() const {
		return size_;
	}

private:
	fields const fields_;
	std::size_t size_{};
};

struct match_type_tag {} constexpr match_type_t;

template<std::uint8_t Type, typename... TypeTags>
class packet_loader {
public:
	using fields = std::tuple<TypeTags...>;

	/// payload starts with the message number, which must match Type
	packet_loader(match_type_tag, const_span in_data)
	: reader_(in_data)
	{
		std::uint8_t tag{};
		if(reader_.read(tag) && tag == Type) {
			load();
		}
	}

	/// message number already consumed by caller
	packet_loader(const_span in_data)
	: reader_(in_data)
	{
		load();
	}

	explicit operator bool() const {
		return ok_;
	}

	template<std::size_t Index>
	auto&& get() {
		return std::get<Index>(fields_).view();
	}

	/// Reader positioned after the fields, for method specific trailing data
	ssh_bf_reader& reader() {
		return reader_;
	}

	std::size_t size() const {
		return size_;
	}

private:
	void load() {
		ok_ = std::apply([&](auto&... f) { return (f.read(reader_) && ...); }, fields_);
		if(ok_) {
			size_ = reader_.used_size();
		}
	}

	fields fields_;
	ssh_bf_reader reader_;
	bool ok_{};
	std::size_t size_{};
};

template<std::uint8_t Type, typename... TypeTags>
struct ssh_packet_ser {
	/*
		if(disconnect::save(code, desc, "").write(out_span)) {...}
	*/
	using save = packet_saver<Type, TypeTags...>;

	/*
		disconnect::load packet(payload);
		if(packet) {
			auto& [code, desc, lang] = packet;
		}
	*/
	using load = packet_loader<Type, TypeTags...>;

	using members = std::tuple<TypeTags...>;
	static constexpr std::uint8_t packet_type = Type;
};

/// Writes nested packet as ssh string
template<typename Packet>
struct packet_string_adaptor {
	packet_string_adaptor(Packet& p) : packet_(p) {}

	Packet& packet_;

	static constexpr std::size_t static_size = 4;
	std::size_t size() const {
		return static_size + packet_.size();
	}

	bool write(ssh_bf_writer& w) const {
		auto const len_pos = w.used_size();
		return w.jump_over(4)
			&& packet_.write(w)
			&& (u32ton(std::uint32_t(packet_.serialised_size()), w.total_span().data()+len_pos), true);
	}
};

template<typename>
struct saver_for;

template<std::uint8_t Type, typename... TypeTags>
struct saver_for<ssh_packet_ser<Type, TypeTags...>> {
	template<typename Arg, typename Tag>
	using field_t = std::conditional_t<
			std::is_base_of_v<packet_saver_tag, std::decay_t<Arg>> && std::is_same_v<Tag, string>,
			packet_string_adaptor<std::decay_t<Arg>>,
			Tag>;

	template<typename... Args>
	static auto make(Args&&... args) {
		return packet_saver<Type, field_t<Args, TypeTags>...>{std::forward<Args>(args)...};
	}
};

/// Creates saver where string fields can be given as nested packet savers
template<typename Packet, typename... Args>
auto make_packet_saver(Args&&... args) {
	return saver_for<Packet>::make(std::forward<Args>(args)...);
}

}

namespace std {
	template<uint8_t Type, typename... Tags>
	struct tuple_size<::securepath::sshc::ser::packet_loader<Type, Tags...>> {
		static constexpr std::size_t value = sizeof...(Tags);
	};

	template<size_t Index, uint8_t Type, typename... Tags>
	struct tuple_element<Index, ::securepath::sshc::ser::packet_loader<Type, Tags...>> {
		static_assert(Index < sizeof...(Tags), "Index out of bounds");
		using type = typename std::tuple_element_t<Index, std::tuple<Tags...>>::type;
	};
}

#endif
