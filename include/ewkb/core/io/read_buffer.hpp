#pragma once
#include "ewkb/common.hpp"
#include "ewkb/core/geometry/geometry_type.hpp"

namespace ewkb {

namespace core {

// A bounded read buffer in front of a ReadStream.
// Fixed-size fields must be made available with Ensure() before they are read.
class ReadBuffer {
public:
	static constexpr const idx_t MINIMUM_SIZE = 64;
	static constexpr const idx_t DEFAULT_SIZE = 8192;

private:
	ReadStream &source;
	// Bytes still unread in the source
	idx_t source_remaining;
	unique_ptr<data_t[]> data;
	idx_t capacity;
	// Read position and end of the valid data inside the buffer
	idx_t read_pos;
	idx_t filled;
	// Bytes consumed before the current buffer contents
	idx_t consumed;

public:
	ReadBuffer(ReadStream &source, idx_t source_length, idx_t capacity = DEFAULT_SIZE);

	// Make sure at least "bytes" unread bytes are buffered, pulling from the source if needed
	void Ensure(idx_t bytes);

	idx_t Available() const {
		return filled - read_pos;
	}

	// Bytes left in the buffer and the source combined
	idx_t Remaining() const {
		return Available() + source_remaining;
	}

	idx_t Position() const {
		return consumed + read_pos;
	}

	idx_t Capacity() const {
		return capacity;
	}

	uint8_t ReadByte() {
		return Read<uint8_t>();
	}

	uint32_t ReadUInt32(ByteOrder order) {
		return order == ByteOrder::NDR ? Read<uint32_t>() : ReadBigEndian<uint32_t>();
	}

	int32_t ReadInt32(ByteOrder order) {
		return order == ByteOrder::NDR ? Read<int32_t>() : ReadBigEndian<int32_t>();
	}

	double ReadDouble(ByteOrder order) {
		return order == ByteOrder::NDR ? Read<double>() : ReadBigEndian<double>();
	}

	// Skip or copy out bytes, refilling as many times as needed
	void Skip(idx_t bytes);
	void ReadBytes(data_ptr_t dst, idx_t bytes);

private:
	void Fill();

	template <class T>
	T Read() {
		static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
		if (read_pos + sizeof(T) > filled) {
			throw SerializationException("Trying to read past end of buffer");
		}
		auto result = Load<T>(data.get() + read_pos);
		read_pos += sizeof(T);
		return result;
	}

	template <class T>
	T ReadBigEndian() {
		static_assert(std::is_floating_point<T>::value || std::is_integral<T>::value,
		              "T must be a floating point or integral type");
		if (read_pos + sizeof(T) > filled) {
			throw SerializationException("Trying to read past end of buffer");
		}

		uint8_t in[sizeof(T)];
		uint8_t out[sizeof(T)];
		memcpy(in, data.get() + read_pos, sizeof(T));
		read_pos += sizeof(T);

		for (size_t i = 0; i < sizeof(T); i++) {
			out[i] = in[sizeof(T) - i - 1];
		}
		T swapped = 0;
		memcpy(&swapped, out, sizeof(T));
		return swapped;
	}
};

} // namespace core

} // namespace ewkb
