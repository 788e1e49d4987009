#include <streamup/asyncio/core/EventLoop.hpp>
#include <streamup/upload/UploadWorker.hpp>

#include <chrono>
#include <fstream>
#include <thread>
#include <structopt/app.hpp>

using namespace streamup;

struct CliOptions {
	std::optional<std::string> url;
	std::optional<std::string> file;
	std::optional<std::string> mime_type;
	std::optional<uint32_t> instance_id;
	std::optional<uint64_t> fragment_size;
	std::optional<uint64_t> timeslice_ms;
	std::optional<uint64_t> chunk_size;
	std::optional<bool> verbose = false;
};
STRUCTOPT(CliOptions, url, file, mime_type, instance_id, fragment_size, timeslice_ms, chunk_size, verbose);


struct WorkerDelegate {
	using Worker = upload::UploadWorker<WorkerDelegate>;

	int exit_code = 1;

	void did_post(Worker& worker, upload::msg::Outbound&& message) {
		if(auto* success = std::get_if<upload::msg::UploadSuccess>(&message)) {
			if(!success->is_final) {
				SPDLOG_INFO("Instance {}: {} bytes uploaded", success->instance_id, success->start_byte);
				return;
			}

			SPDLOG_INFO(
				"Instance {}: Upload complete: {}",
				success->instance_id,
				success->video_upload_response.has_value() ? success->video_upload_response->body : ""
			);
			exit_code = 0;
		} else {
			auto& error = std::get<upload::msg::UploadError>(message);
			SPDLOG_ERROR("Instance {}: {}", error.instance_id, error.error.to_string());
			exit_code = 1;
		}

		// Single recording, nothing left to wait for
		worker.close();
	}
};

int main(int argc, char** argv) {
	try {
		auto options = structopt::app("worker").parse<CliOptions>(argc, argv);
		if(!options.url.has_value() || !options.file.has_value()) {
			SPDLOG_ERROR("--url and --file are required");
			return 1;
		}

		if(options.verbose.value_or(false)) {
			spdlog::set_level(spdlog::level::debug);
		}

		upload::EngineConfig defaults;
		defaults.aligner.chunk_size = options.chunk_size.value_or(defaults.aligner.chunk_size);

		auto instance_id = options.instance_id.value_or(1);
		auto fragment_size = std::max<uint64_t>(options.fragment_size.value_or(64 * 1024), 1);
		auto timeslice = std::chrono::milliseconds(options.timeslice_ms.value_or(100));

		std::ifstream input(*options.file, std::ios::binary);
		if(!input.is_open()) {
			SPDLOG_ERROR("Could not open {}", *options.file);
			return 1;
		}

		WorkerDelegate delegate;
		WorkerDelegate::Worker worker(&delegate, defaults);

		worker.post(upload::msg::Initialize {
			instance_id,
			*options.url,
			options.mime_type
		});

		// Capture context, talks to the worker only through messages
		std::thread capture([&]() {
			while(true) {
				core::Buffer fragment(fragment_size);
				input.read((char*)fragment.data(), fragment_size);
				fragment.truncate_unsafe(fragment_size - input.gcount());
				auto is_last = !input.good() || input.peek() == std::ifstream::traits_type::eof();

				if(worker.post(upload::msg::BufferChunk { instance_id, std::move(fragment), is_last }) < 0 || is_last) {
					return;
				}

				std::this_thread::sleep_for(timeslice);
			}
		});

		asyncio::EventLoop::run();
		capture.join();

		return delegate.exit_code;
	} catch (structopt::exception& e) {
		SPDLOG_ERROR("{}", e.what());
		SPDLOG_ERROR("{}", e.help());
	}

	return -1;
}
