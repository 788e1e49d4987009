#include "streamup/upload/Range.hpp"

#include <cctype>
#include <charconv>
#include <spdlog/fmt/fmt.h>

namespace streamup {
namespace upload {

std::string content_range(uint64_t start, uint64_t length, std::optional<uint64_t> total) {
	auto total_str = total.has_value() ? std::to_string(*total) : std::string("*");

	if(length == 0) {
		return fmt::format("bytes */{}", total_str);
	}

	return fmt::format("bytes {}-{}/{}", start, start + length - 1, total_str);
}

std::optional<uint64_t> parse_range_end(std::string_view header) {
	auto dash = header.rfind('-');
	if(dash == std::string_view::npos) {
		return std::nullopt;
	}

	auto digits = header.substr(dash + 1);
	while(!digits.empty() && std::isspace((unsigned char)digits.back())) {
		digits.remove_suffix(1);
	}

	uint64_t end = 0;
	auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), end);
	if(ec != std::errc() || ptr == digits.data()) {
		return std::nullopt;
	}

	return end;
}

} // namespace upload
} // namespace streamup
