#include <streamup/asyncio/core/EventLoop.hpp>
#include <streamup/asyncio/core/Timer.hpp>
#include <streamup/upload/UploadEngine.hpp>

#include <algorithm>
#include <fstream>
#include <structopt/app.hpp>

using namespace streamup;

struct CliOptions {
	std::optional<std::string> url;
	std::optional<std::string> file;
	std::optional<std::string> mime_type;
	std::optional<uint64_t> fragment_size;
	std::optional<uint64_t> timeslice_ms;
	std::optional<uint64_t> chunk_size;
	std::optional<uint64_t> max_chunk_size;
	std::optional<uint32_t> max_attempts;
	std::optional<uint64_t> backoff_ms;
	std::optional<bool> verbose = false;
};
STRUCTOPT(CliOptions, url, file, mime_type, fragment_size, timeslice_ms, chunk_size, max_chunk_size, max_attempts, backoff_ms, verbose);


// Replays a file as a live recording, one fragment per timeslice
class Recorder {
public:
	using Engine = upload::UploadEngine<Recorder>;

private:
	std::ifstream input;
	std::vector<uint8_t> fragment;
	Engine engine;
	asyncio::Timer timer;

public:
	int exit_code = 1;

	Recorder(
		std::string const& path,
		size_t fragment_size,
		upload::EngineConfig const& config
	) : input(path, std::ios::binary), fragment(fragment_size), engine(this, config), timer(this) {}

	int start(uint64_t timeslice_ms) {
		if(!input.is_open()) {
			return -1;
		}

		timer.start<Recorder, &Recorder::timer_cb>(0, timeslice_ms);
		return 0;
	}

	void timer_cb() {
		input.read((char*)fragment.data(), fragment.size());
		auto size = (size_t)input.gcount();
		auto is_last = input.eof() || input.peek() == std::ifstream::traits_type::eof();

		if(input.bad()) {
			SPDLOG_ERROR("Read error, finalizing");
			is_last = true;
		}

		auto res = engine.ingest(fragment.data(), size, is_last);
		if(res < 0 || is_last) {
			timer.stop();
		}
	}

	void did_upload_chunk(Engine& engine, upload::PendingChunk const& chunk) {
		SPDLOG_INFO(
			"Chunk {}-{} uploaded, destination holds {} bytes",
			chunk.offset,
			chunk.end_offset(),
			engine.start_byte()
		);
	}

	void did_complete(Engine&, upload::UploadResponse&& response) {
		SPDLOG_INFO("Upload complete: {} bytes, status {}", response.total_bytes, response.status);
		if(!response.body.empty()) {
			SPDLOG_INFO("Response: {}", response.body);
		}
		exit_code = 0;
	}

	void did_fail(Engine&, core::UploadError const& error) {
		SPDLOG_ERROR("Upload failed: {}", error.to_string());
		timer.stop();
		exit_code = 1;
	}
};

int main(int argc, char** argv) {
	try {
		auto options = structopt::app("upload").parse<CliOptions>(argc, argv);
		if(!options.url.has_value() || !options.file.has_value()) {
			SPDLOG_ERROR("--url and --file are required");
			return 1;
		}

		if(options.verbose.value_or(false)) {
			spdlog::set_level(spdlog::level::debug);
		}

		upload::EngineConfig config;
		config.aligner.chunk_size = options.chunk_size.value_or(config.aligner.chunk_size);
		config.aligner.max_chunk_size = options.max_chunk_size.value_or(0);
		config.session.destination_url = *options.url;
		config.session.mime_type = options.mime_type.value_or(config.session.mime_type);
		config.session.max_attempts = options.max_attempts.value_or(config.session.max_attempts);
		config.session.base_backoff_ms = options.backoff_ms.value_or(config.session.base_backoff_ms);
		config.debug_buffer_status = options.verbose.value_or(false);

		auto fragment_size = std::max<uint64_t>(options.fragment_size.value_or(64 * 1024), 1);
		auto timeslice_ms = std::max<uint64_t>(options.timeslice_ms.value_or(100), 1);

		SPDLOG_INFO(
			"Uploading {} to {} in {} byte fragments every {} ms",
			*options.file,
			config.session.destination_url,
			fragment_size,
			timeslice_ms
		);

		Recorder recorder(*options.file, fragment_size, config);
		if(recorder.start(timeslice_ms) < 0) {
			SPDLOG_ERROR("Could not open {}", *options.file);
			return 1;
		}

		asyncio::EventLoop::run();

		return recorder.exit_code;
	} catch (structopt::exception& e) {
		SPDLOG_ERROR("{}", e.what());
		SPDLOG_ERROR("{}", e.help());
	}

	return -1;
}
