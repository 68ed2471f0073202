// =============================================================================
// Concurrent Decode Tests
// =============================================================================

#include "test_helpers.hpp"
#include "ewkb/core/handler/geometry_handler.hpp"

#include <atomic>
#include <thread>

using namespace ewkb;
using namespace ewkb::core;
using namespace ewkb::test;

class ConcurrencyTest : public ::testing::Test {};

// A handler holds no per-call state, one instance serves many threads each with their own buffers
TEST_F(ConcurrencyTest, SharedHandlerAcrossThreads) {
	CodecOptions options;
	options.log_level = LogLevel::NONE;
	const GeometryHandler handler(options);

	vector<Geometry> inputs;
	vector<vector<data_t>> encoded;
	for (bool has_z : {false, true}) {
		for (auto &geom : MakeAllShapes(has_z)) {
			geom.SetSRID(has_z ? 4326 : 0);
			encoded.push_back(Encode(geom));
			inputs.push_back(std::move(geom));
		}
	}

	std::atomic<idx_t> failures(0);
	vector<std::thread> threads;
	for (idx_t t = 0; t < 8; t++) {
		threads.emplace_back([&]() {
			for (idx_t round = 0; round < 50; round++) {
				for (idx_t i = 0; i < encoded.size(); i++) {
					auto &bytes = encoded[i];
					duckdb::MemoryStream stream(const_cast<data_ptr_t>(bytes.data()), bytes.size());
					ReadBuffer buffer(stream, bytes.size(), ReadBuffer::MINIMUM_SIZE);
					auto geom = handler.Read(buffer, static_cast<int32_t>(bytes.size()));
					if (geom != inputs[i]) {
						failures++;
					}
				}
			}
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}
	EXPECT_EQ(failures.load(), 0u);
}
