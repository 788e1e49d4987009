/*! \file Aligner.hpp
	\brief Decides how many buffered bytes to carve into the next upload chunk
*/

#ifndef STREAMUP_CORE_ALIGNER_HPP
#define STREAMUP_CORE_ALIGNER_HPP

#include <stdint.h>
#include <cstddef>
#include <optional>

namespace streamup {
namespace core {

struct AlignerConfig {
	/// Alignment granularity, every non final chunk is a multiple of this
	uint64_t chunk_size = 4 * 1024 * 1024;
	/// Upper bound on a single non final extraction, 0 for unbounded
	uint64_t max_chunk_size = 0;
};

/// @brief Chunk sizing policy
/// @headerfile Aligner.hpp <streamup/core/Aligner.hpp>
///
/// Non final extractions are always whole multiples of chunk_size. Once the last
/// fragment has been ingested everything left goes out as one final chunk.
class Aligner {
public:
	explicit Aligner(AlignerConfig const& config = AlignerConfig());

	/// Size of the next extraction given the bytes currently held, nullopt for none yet
	std::optional<size_t> next_extraction(size_t used_bytes, bool is_last) const;

	uint64_t chunk_size() const {
		return granularity;
	}

	uint64_t max_chunk_size() const {
		return bound;
	}

private:
	uint64_t granularity;
	uint64_t bound;
};

} // namespace core
} // namespace streamup

#endif // STREAMUP_CORE_ALIGNER_HPP
