#include "gtest/gtest.h"
#include "streamup/upload/UploadEngine.hpp"

#include "MockHttpClient.hpp"
#include "MockTimer.hpp"

#include <charconv>

using namespace streamup;
using namespace streamup::upload;

struct EngineDelegate;
using Engine = UploadEngine<EngineDelegate, MockHttpClient, MockTimer>;

struct EngineDelegate {
	std::vector<uint64_t> uploaded;
	std::vector<UploadResponse> completions;
	std::vector<core::UploadError> errors;

	void did_upload_chunk(Engine&, PendingChunk const& chunk) {
		uploaded.push_back(chunk.offset);
	}

	void did_complete(Engine&, UploadResponse&& response) {
		completions.push_back(std::move(response));
	}

	void did_fail(Engine&, core::UploadError const& error) {
		errors.push_back(error);
	}
};

static std::vector<uint8_t> fragment(uint64_t offset, size_t size) {
	std::vector<uint8_t> bytes(size);
	for(size_t i = 0; i < size; i++) {
		bytes[i] = (uint8_t)((offset + i) % 251);
	}
	return bytes;
}

static uint64_t range_start(std::string const& content_range) {
	// "bytes <start>-<end>/<total>"
	auto begin = content_range.data() + 6;
	uint64_t start = 0;
	std::from_chars(begin, content_range.data() + content_range.size(), start);
	return start;
}

class UploadEngineTest : public ::testing::Test {
protected:
	EngineDelegate delegate;
	EngineConfig config;

	void SetUp() override {
		MockNetwork::get().reset();
		MockClock::get().reset();

		config.instance_id = 7;
		config.initial_buffer_capacity = 4096;
		config.aligner = core::AlignerConfig { 262144, 0 };
		config.session.destination_url = "https://upload.example.com/session/3";
		config.session.base_backoff_ms = 10;
	}

	/// Feeds fragments of the given sizes, the last one marked as such
	std::vector<uint8_t> feed(Engine& engine, std::vector<size_t> const& sizes) {
		std::vector<uint8_t> all;
		for(size_t i = 0; i < sizes.size(); i++) {
			auto bytes = fragment(all.size(), sizes[i]);
			all.insert(all.end(), bytes.begin(), bytes.end());
			EXPECT_EQ(engine.ingest(bytes.data(), bytes.size(), i + 1 == sizes.size()), 0);
		}
		return all;
	}

	void accept_all() {
		while(MockNetwork::get().respond(200, {}, R"({"id":"video"})")) {}
	}
};

TEST_F(UploadEngineTest, ScenarioThreeFragments) {
	Engine engine(&delegate, config);
	auto& network = MockNetwork::get();

	std::vector<uint8_t> first = fragment(0, 300000);
	EXPECT_EQ(engine.ingest(first.data(), first.size(), false), 0);

	ASSERT_EQ(network.sent.size(), 1u);
	EXPECT_EQ(network.last().header("Content-Range"), "bytes 0-262143/*");
	EXPECT_EQ(engine.get_buffer().used_bytes(), 300000u - 262144u);

	auto second = fragment(300000, 300000);
	EXPECT_EQ(engine.ingest(second.data(), second.size(), false), 0);
	auto third = fragment(600000, 500000);
	EXPECT_EQ(engine.ingest(third.data(), third.size(), true), 0);

	EXPECT_EQ(engine.get_state(), Engine::State::Finalized);
	EXPECT_EQ(engine.chunks_enqueued(), 3u);
	EXPECT_EQ(engine.get_buffer().used_bytes(), 0u);

	accept_all();

	ASSERT_EQ(network.sent.size(), 3u);
	EXPECT_EQ(network.sent[0].header("Content-Length"), "262144");
	EXPECT_EQ(network.sent[1].header("Content-Length"), "262144");
	EXPECT_EQ(network.sent[1].header("Content-Range"), "bytes 262144-524287/*");
	EXPECT_EQ(network.sent[2].header("Content-Length"), "575712");
	EXPECT_EQ(network.sent[2].header("Content-Range"), "bytes 524288-1099999/1100000");

	ASSERT_EQ(delegate.completions.size(), 1u);
	EXPECT_EQ(delegate.completions[0].total_bytes, 1100000u);
	EXPECT_EQ(delegate.completions[0].get_string("id"), "video");
	EXPECT_EQ(delegate.uploaded, (std::vector<uint64_t>{0, 262144}));
	EXPECT_TRUE(delegate.errors.empty());
	EXPECT_EQ(engine.get_state(), Engine::State::Completed);
}

TEST_F(UploadEngineTest, ConservesAlignsAndOrdersBytes) {
	config.aligner = core::AlignerConfig { 1000, 0 };
	Engine engine(&delegate, config);

	auto all = feed(engine, {37, 1500, 999, 1, 2600, 4000, 0, 333, 12});
	accept_all();

	ASSERT_EQ(delegate.completions.size(), 1u);

	auto& sent = MockNetwork::get().sent;
	std::string uploaded;
	uint64_t expected_start = 0;
	for(size_t i = 0; i < sent.size(); i++) {
		auto range = sent[i].header("Content-Range");
		EXPECT_EQ(range_start(range), expected_start);
		expected_start += sent[i].body.size();

		if(i + 1 < sent.size()) {
			EXPECT_EQ(sent[i].body.size() % 1000, 0u) << range;
			EXPECT_EQ(range.back(), '*');
		}
		uploaded += sent[i].body;
	}

	EXPECT_EQ(uploaded.size(), all.size());
	EXPECT_EQ(uploaded, std::string(all.begin(), all.end()));
	EXPECT_EQ(sent.back().header("Content-Range").substr(sent.back().header("Content-Range").rfind('/') + 1),
		std::to_string(all.size()));
}

TEST_F(UploadEngineTest, BoundedAlignerCapsChunks) {
	config.aligner = core::AlignerConfig { 100, 200 };
	Engine engine(&delegate, config);

	auto bytes = fragment(0, 950);
	EXPECT_EQ(engine.ingest(bytes.data(), bytes.size(), false), 0);
	EXPECT_EQ(engine.chunks_enqueued(), 5u);
	EXPECT_EQ(engine.get_buffer().used_bytes(), 50u);

	EXPECT_EQ(engine.finalize(), 0);
	accept_all();

	std::vector<std::string> lengths;
	for(auto& req : MockNetwork::get().sent) {
		lengths.push_back(req.header("Content-Length"));
	}
	EXPECT_EQ(lengths, (std::vector<std::string>{"200", "200", "200", "200", "100", "50"}));
	EXPECT_EQ(delegate.completions.size(), 1u);
}

TEST_F(UploadEngineTest, FinalizeWithoutDataFails) {
	Engine engine(&delegate, config);

	EXPECT_EQ(engine.finalize(), -1);

	ASSERT_EQ(delegate.errors.size(), 1u);
	EXPECT_EQ(delegate.errors[0].code, core::ErrorCode::NoDataToUpload);
	EXPECT_EQ(engine.get_state(), Engine::State::Failed);
	ASSERT_TRUE(engine.error().has_value());
	EXPECT_EQ(engine.error()->code, core::ErrorCode::NoDataToUpload);
	EXPECT_TRUE(MockNetwork::get().sent.empty());

	EXPECT_EQ(engine.finalize(), -1);
	EXPECT_EQ(delegate.errors.size(), 1u);
}

TEST_F(UploadEngineTest, EmptyLastFragmentWithoutDataFails) {
	Engine engine(&delegate, config);

	EXPECT_EQ(engine.ingest(nullptr, 0, true), -1);

	ASSERT_EQ(delegate.errors.size(), 1u);
	EXPECT_EQ(delegate.errors[0].code, core::ErrorCode::NoDataToUpload);
}

TEST_F(UploadEngineTest, AlignedTotalFinalizesWithStatusQuery) {
	config.aligner = core::AlignerConfig { 100, 0 };
	Engine engine(&delegate, config);
	auto& network = MockNetwork::get();

	auto bytes = fragment(0, 200);
	EXPECT_EQ(engine.ingest(bytes.data(), bytes.size(), false), 0);
	EXPECT_EQ(engine.finalize(), 0);
	EXPECT_EQ(engine.chunks_enqueued(), 2u);

	network.respond(200);
	EXPECT_EQ(network.last().header("Content-Range"), "bytes */200");
	EXPECT_EQ(network.last().header("Content-Length"), "0");

	network.respond(200, {}, R"({"id":"aligned"})");

	ASSERT_EQ(delegate.completions.size(), 1u);
	EXPECT_EQ(delegate.completions[0].total_bytes, 200u);
}

TEST_F(UploadEngineTest, CompletesExactlyOnceAndRejectsAfter) {
	config.aligner = core::AlignerConfig { 100, 0 };
	Engine engine(&delegate, config);

	feed(engine, {50});
	accept_all();

	EXPECT_EQ(delegate.completions.size(), 1u);
	EXPECT_EQ(engine.get_state(), Engine::State::Completed);

	auto more = fragment(50, 10);
	EXPECT_EQ(engine.ingest(more.data(), more.size(), false), -1);
	EXPECT_EQ(engine.finalize(), -1);

	EXPECT_EQ(delegate.completions.size(), 1u);
	EXPECT_TRUE(delegate.errors.empty());
	EXPECT_EQ(MockNetwork::get().sent.size(), 1u);
}

TEST_F(UploadEngineTest, SecondFinalizeRejected) {
	config.aligner = core::AlignerConfig { 100, 0 };
	Engine engine(&delegate, config);

	auto bytes = fragment(0, 150);
	EXPECT_EQ(engine.ingest(bytes.data(), bytes.size(), false), 0);
	EXPECT_EQ(engine.finalize(), 0);
	EXPECT_EQ(engine.finalize(), -1);

	EXPECT_EQ(engine.get_state(), Engine::State::Finalized);
	EXPECT_EQ(engine.chunks_enqueued(), 2u);
	EXPECT_TRUE(delegate.errors.empty());
}

TEST_F(UploadEngineTest, FailsOnceAndRejectsAfter) {
	config.aligner = core::AlignerConfig { 100, 0 };
	Engine engine(&delegate, config);
	auto& network = MockNetwork::get();

	auto bytes = fragment(0, 250);
	EXPECT_EQ(engine.ingest(bytes.data(), bytes.size(), false), 0);
	network.respond(410, {}, "Upload session expired");

	ASSERT_EQ(delegate.errors.size(), 1u);
	EXPECT_EQ(delegate.errors[0].code, core::ErrorCode::DestinationRejected);
	EXPECT_EQ(delegate.errors[0].status, 410);
	EXPECT_EQ(delegate.errors[0].message, "Upload session expired");
	EXPECT_EQ(engine.get_state(), Engine::State::Failed);

	auto more = fragment(250, 100);
	EXPECT_EQ(engine.ingest(more.data(), more.size(), false), -1);
	EXPECT_EQ(engine.finalize(), -1);

	EXPECT_EQ(delegate.errors.size(), 1u);
	EXPECT_TRUE(delegate.completions.empty());
	EXPECT_EQ(network.sent.size(), 1u);
	EXPECT_TRUE(network.pending.empty());
}

TEST_F(UploadEngineTest, RetriesExhaustedSurfacesOnce) {
	config.aligner = core::AlignerConfig { 100, 0 };
	config.session.max_attempts = 2;
	Engine engine(&delegate, config);
	auto& network = MockNetwork::get();

	feed(engine, {100, 100, 30});

	network.fail();
	MockClock::get().fire_next();
	network.fail();

	ASSERT_EQ(delegate.errors.size(), 1u);
	EXPECT_EQ(delegate.errors[0].code, core::ErrorCode::RetriesExhausted);
	EXPECT_EQ(engine.get_queue().size(), 3u);
	EXPECT_EQ(engine.start_byte(), 0u);
}

TEST_F(UploadEngineTest, KeepsBufferingDuringBackoff) {
	config.aligner = core::AlignerConfig { 1000, 0 };
	config.initial_buffer_capacity = 1024;
	Engine engine(&delegate, config);
	auto& network = MockNetwork::get();

	auto first = fragment(0, 1000);
	EXPECT_EQ(engine.ingest(first.data(), first.size(), false), 0);
	network.fail();

	auto second = fragment(1000, 3500);
	EXPECT_EQ(engine.ingest(second.data(), second.size(), false), 0);

	EXPECT_GE(engine.get_buffer().capacity(), 3500u);
	EXPECT_EQ(engine.get_queue().size(), 2u);
	EXPECT_EQ(engine.get_buffer().used_bytes(), 500u);
	EXPECT_EQ(network.sent.size(), 1u);

	MockClock::get().fire_next();
	EXPECT_EQ(network.last().header("Content-Range"), "bytes 0-999/*");

	network.respond(200);
	EXPECT_EQ(network.last().header("Content-Range"), "bytes 1000-3999/*");
	EXPECT_EQ(delegate.uploaded, (std::vector<uint64_t>{0}));
}

TEST_F(UploadEngineTest, ResumesFromKnownOffset) {
	config.aligner = core::AlignerConfig { 100, 0 };
	config.session.start_byte = 1000;
	Engine engine(&delegate, config);

	feed(engine, {150});
	EXPECT_EQ(engine.finalize(), -1);

	auto& sent = MockNetwork::get().sent;
	ASSERT_EQ(sent.size(), 1u);
	EXPECT_EQ(sent[0].header("Content-Range"), "bytes 1000-1149/1150");
}

TEST_F(UploadEngineTest, PartialResyncKeepsStreamContiguous) {
	config.aligner = core::AlignerConfig { 1000, 0 };
	Engine engine(&delegate, config);
	auto& network = MockNetwork::get();

	feed(engine, {2000, 100});

	network.respond(308, {{"Range", "bytes=0-1499"}});
	EXPECT_EQ(engine.start_byte(), 1500u);
	EXPECT_EQ(network.last().header("Content-Range"), "bytes 1500-1999/*");
	EXPECT_EQ(network.last().body, std::string((char const*)fragment(1500, 500).data(), 500));

	accept_all();

	EXPECT_EQ(network.sent.back().header("Content-Range"), "bytes 2000-2099/2100");
	ASSERT_EQ(delegate.completions.size(), 1u);
	EXPECT_EQ(delegate.completions[0].total_bytes, 2100u);
}
