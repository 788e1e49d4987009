#include "streamup/core/Aligner.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace streamup {
namespace core {

Aligner::Aligner(AlignerConfig const& config) :
granularity(std::max<uint64_t>(config.chunk_size, 1)),
bound(config.max_chunk_size) {
	if(config.chunk_size == 0) {
		SPDLOG_WARN("Aligner: Zero chunk size, using 1");
	}

	// Round the bound down to the granularity, but never below one unit
	if(bound != 0) {
		bound = std::max(bound - bound % granularity, granularity);
	}
}

std::optional<size_t> Aligner::next_extraction(size_t used_bytes, bool is_last) const {
	if(is_last) {
		if(used_bytes == 0) {
			return std::nullopt;
		}
		return used_bytes;
	}

	if(used_bytes < granularity) {
		return std::nullopt;
	}

	uint64_t aligned = used_bytes - used_bytes % granularity;
	if(bound != 0) {
		aligned = std::min(aligned, bound);
	}

	return (size_t)aligned;
}

} // namespace core
} // namespace streamup
