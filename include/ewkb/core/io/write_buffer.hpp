#pragma once
#include "ewkb/common.hpp"

namespace ewkb {

namespace core {

// A bounded write buffer in front of a WriteStream. Multi-byte fields are always written big-endian.
// Callers check WriteSpaceLeft() and Flush() before appending a field that does not fit.
class WriteBuffer {
public:
	static constexpr const idx_t MINIMUM_SIZE = 64;
	static constexpr const idx_t DEFAULT_SIZE = 8192;

private:
	WriteStream &sink;
	unique_ptr<data_t[]> data;
	idx_t capacity;
	idx_t write_pos;
	// Bytes already handed to the sink
	idx_t flushed;

public:
	WriteBuffer(WriteStream &sink, idx_t capacity = DEFAULT_SIZE);

	idx_t WriteSpaceLeft() const {
		return capacity - write_pos;
	}

	idx_t Position() const {
		return flushed + write_pos;
	}

	idx_t Capacity() const {
		return capacity;
	}

	// Hand all buffered bytes to the sink
	void Flush();

	void WriteByte(uint8_t value) {
		Write<uint8_t>(value);
	}

	void WriteUInt32(uint32_t value) {
		WriteBigEndian<uint32_t>(value);
	}

	void WriteInt32(int32_t value) {
		WriteBigEndian<int32_t>(value);
	}

	void WriteDouble(double value) {
		WriteBigEndian<double>(value);
	}

	// Copy in bytes, flushing as many times as needed
	void WriteBytes(const_data_ptr_t src, idx_t bytes);

private:
	template <class T>
	void Write(T value) {
		static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
		if (write_pos + sizeof(T) > capacity) {
			throw SerializationException("Trying to write past end of buffer");
		}
		Store<T>(value, data.get() + write_pos);
		write_pos += sizeof(T);
	}

	template <class T>
	void WriteBigEndian(T value) {
		static_assert(std::is_floating_point<T>::value || std::is_integral<T>::value,
		              "T must be a floating point or integral type");
		if (write_pos + sizeof(T) > capacity) {
			throw SerializationException("Trying to write past end of buffer");
		}

		uint8_t in[sizeof(T)];
		uint8_t out[sizeof(T)];
		memcpy(in, &value, sizeof(T));
		for (size_t i = 0; i < sizeof(T); i++) {
			out[i] = in[sizeof(T) - i - 1];
		}
		memcpy(data.get() + write_pos, out, sizeof(T));
		write_pos += sizeof(T);
	}
};

} // namespace core

} // namespace ewkb
