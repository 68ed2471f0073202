#include "ewkb/common.hpp"
#include "ewkb/core/io/read_buffer.hpp"

namespace ewkb {

namespace core {

constexpr const idx_t ReadBuffer::MINIMUM_SIZE;
constexpr const idx_t ReadBuffer::DEFAULT_SIZE;

ReadBuffer::ReadBuffer(ReadStream &source_p, idx_t source_length, idx_t capacity_p)
    : source(source_p), source_remaining(source_length), capacity(capacity_p), read_pos(0), filled(0), consumed(0) {
	if (capacity < MINIMUM_SIZE) {
		throw InvalidInputException("ReadBuffer: capacity must be at least %d bytes, got %d",
		                            static_cast<int64_t>(MINIMUM_SIZE), static_cast<int64_t>(capacity));
	}
	data = make_uniq_array<data_t>(capacity);
}

void ReadBuffer::Fill() {
	// Move the unread tail to the front
	auto unread = Available();
	if (read_pos > 0) {
		if (unread > 0) {
			memmove(data.get(), data.get() + read_pos, unread);
		}
		consumed += read_pos;
		read_pos = 0;
		filled = unread;
	}
	auto to_read = MinValue<idx_t>(capacity - filled, source_remaining);
	if (to_read == 0) {
		return;
	}
	source.ReadData(data.get() + filled, to_read);
	filled += to_read;
	source_remaining -= to_read;
}

void ReadBuffer::Ensure(idx_t bytes) {
	if (Available() >= bytes) {
		return;
	}
	if (bytes > capacity) {
		throw InternalException("ReadBuffer: cannot ensure %d bytes in a buffer of %d bytes",
		                        static_cast<int64_t>(bytes), static_cast<int64_t>(capacity));
	}
	if (Remaining() < bytes) {
		throw SerializationException("ReadBuffer: value truncated, needed %d more bytes but only %d remain",
		                             static_cast<int64_t>(bytes), static_cast<int64_t>(Remaining()));
	}
	Fill();
	D_ASSERT(Available() >= bytes);
}

void ReadBuffer::Skip(idx_t bytes) {
	if (Remaining() < bytes) {
		throw SerializationException("ReadBuffer: cannot skip %d bytes, only %d remain", static_cast<int64_t>(bytes),
		                             static_cast<int64_t>(Remaining()));
	}
	while (bytes > 0) {
		if (Available() == 0) {
			Fill();
		}
		auto step = MinValue<idx_t>(bytes, Available());
		read_pos += step;
		bytes -= step;
	}
}

void ReadBuffer::ReadBytes(data_ptr_t dst, idx_t bytes) {
	if (Remaining() < bytes) {
		throw SerializationException("ReadBuffer: cannot read %d bytes, only %d remain", static_cast<int64_t>(bytes),
		                             static_cast<int64_t>(Remaining()));
	}
	while (bytes > 0) {
		if (Available() == 0) {
			Fill();
		}
		auto step = MinValue<idx_t>(bytes, Available());
		memcpy(dst, data.get() + read_pos, step);
		read_pos += step;
		dst += step;
		bytes -= step;
	}
}

} // namespace core

} // namespace ewkb
