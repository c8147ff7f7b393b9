#include <test_common.hpp>

namespace rigkit::test {
namespace {
TEST(Logger, BufferDropsOldestEntries) {
	auto instance = logger::Instance{4, 2};
	for (int i = 0; i < 7; ++i) { logger::info("entry {}", i); }
	auto log = LogCapture::take();
	ASSERT_EQ(log.entries.size(), 5U);
	EXPECT_NE(log.entries.front().message.find("entry 2"), std::string::npos);
	EXPECT_TRUE(log.contains("entry 6", logger::Level::eInfo));
}

TEST(Logger, ErrorsAreTagged) {
	auto instance = logger::Instance{};
	logger::error("broken {}", 42);
	logger::warn("careful");
	auto const log = LogCapture::take();
	ASSERT_EQ(log.entries.size(), 2U);
	EXPECT_EQ(log.entries[0].level, logger::Level::eError);
	EXPECT_NE(log.entries[0].message.find("[E] broken 42"), std::string::npos);
	EXPECT_NE(log.entries[1].message.find("[W] careful"), std::string::npos);
}

TEST(Logger, NoBufferWithoutInstance) {
	logger::info("unbuffered");
	EXPECT_TRUE(LogCapture::take().entries.empty());
}
} // namespace
} // namespace rigkit::test
