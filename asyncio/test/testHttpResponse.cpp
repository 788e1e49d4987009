#include "gtest/gtest.h"
#include "streamup/asyncio/http/HttpResponse.hpp"

using namespace streamup::asyncio;

TEST(HttpResponse, OkIsTwoHundreds) {
	HttpResponse response;

	response.status = 200;
	EXPECT_TRUE(response.ok());
	response.status = 299;
	EXPECT_TRUE(response.ok());
	response.status = 308;
	EXPECT_FALSE(response.ok());
	response.status = 404;
	EXPECT_FALSE(response.ok());
}

TEST(HttpResponse, ParsesHeaderLines) {
	HttpResponse response;
	response.add_header_line("HTTP/1.1 308 Resume Incomplete\r\n");
	response.add_header_line("Range: bytes=0-1499\r\n");
	response.add_header_line("X-GUploader-UploadID:   abc  \r\n");
	response.add_header_line("\r\n");

	ASSERT_EQ(response.headers.size(), 2u);
	EXPECT_EQ(response.header("Range"), "bytes=0-1499");
	EXPECT_EQ(response.header("x-guploader-uploadid"), "abc");
	EXPECT_FALSE(response.header("Location").has_value());
}

TEST(HttpResponse, HeaderLookupIgnoresCase) {
	HttpResponse response;
	response.headers.emplace_back("range", "bytes 0-9");

	EXPECT_EQ(response.header("RANGE"), "bytes 0-9");
}

TEST(HttpResponse, StatusLineResetsHeaders) {
	HttpResponse response;
	response.add_header_line("HTTP/1.1 100 Continue");
	response.add_header_line("Server: interim");
	response.add_header_line("HTTP/1.1 200 OK");
	response.add_header_line("Content-Type: application/json");

	ASSERT_EQ(response.headers.size(), 1u);
	EXPECT_FALSE(response.header("Server").has_value());
	EXPECT_EQ(response.header("Content-Type"), "application/json");
}

TEST(HttpResponse, IgnoresLinesWithoutColon) {
	HttpResponse response;
	response.add_header_line("garbage");

	EXPECT_TRUE(response.headers.empty());
}
