#include "ewkb/common.hpp"
#include "ewkb/core/io/write_buffer.hpp"

namespace ewkb {

namespace core {

constexpr const idx_t WriteBuffer::MINIMUM_SIZE;
constexpr const idx_t WriteBuffer::DEFAULT_SIZE;

WriteBuffer::WriteBuffer(WriteStream &sink_p, idx_t capacity_p)
    : sink(sink_p), capacity(capacity_p), write_pos(0), flushed(0) {
	if (capacity < MINIMUM_SIZE) {
		throw InvalidInputException("WriteBuffer: capacity must be at least %d bytes, got %d",
		                            static_cast<int64_t>(MINIMUM_SIZE), static_cast<int64_t>(capacity));
	}
	data = make_uniq_array<data_t>(capacity);
}

void WriteBuffer::Flush() {
	if (write_pos == 0) {
		return;
	}
	sink.WriteData(data.get(), write_pos);
	flushed += write_pos;
	write_pos = 0;
}

void WriteBuffer::WriteBytes(const_data_ptr_t src, idx_t bytes) {
	while (bytes > 0) {
		if (WriteSpaceLeft() == 0) {
			Flush();
		}
		auto step = MinValue<idx_t>(bytes, WriteSpaceLeft());
		memcpy(data.get() + write_pos, src, step);
		write_pos += step;
		src += step;
		bytes -= step;
	}
}

} // namespace core

} // namespace ewkb
