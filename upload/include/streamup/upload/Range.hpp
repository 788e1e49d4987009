/*! \file Range.hpp
	\brief Content-Range formatting and Range parsing for resumable PUTs
*/

#ifndef STREAMUP_UPLOAD_RANGE_HPP
#define STREAMUP_UPLOAD_RANGE_HPP

#include <stdint.h>
#include <optional>
#include <string>
#include <string_view>

namespace streamup {
namespace upload {

/// Content-Range value for length bytes starting at start.
/// total is written as "*" when unknown. A zero length range is the "bytes */total"
/// status query which finalizes an upload whose bytes have all been sent.
std::string content_range(uint64_t start, uint64_t length, std::optional<uint64_t> total);

/// Last received byte (inclusive) from a "<unit> 0-<n>" or "<unit>=0-<n>" Range header
std::optional<uint64_t> parse_range_end(std::string_view header);

} // namespace upload
} // namespace streamup

#endif // STREAMUP_UPLOAD_RANGE_HPP
