#include <rigkit/util/cmd_args.hpp>
#include <test_common.hpp>
#include <vector>

namespace rigkit::test {
namespace {
struct Recorder : CmdArgs::Parser {
	std::vector<std::pair<std::string, std::string>> options{};

	void opt(CmdArgs::Key key, CmdArgs::Value value) final {
		options.emplace_back(key.full.empty() ? std::string(1, key.single) : std::string{key.full}, std::string{value});
	}
};

CmdArgs::Spec make_spec() {
	auto ret = CmdArgs::Spec{};
	ret.options = {
		CmdArgs::Opt{.key = {.full = "flatten", .single = 'f'}, .help = "Flatten"},
		CmdArgs::Opt{.key = {.full = "input", .single = 'i'}, .value = "PATH", .help = "Input"},
		CmdArgs::Opt{.key = {.full = "level"}, .value = "N", .is_optional_value = true, .help = "Level"},
	};
	ret.version = "v1.2.3";
	return ret;
}

CmdArgs::Result parse(Recorder& out, std::vector<char const*> args) {
	args.insert(args.begin(), "rigkit");
	return CmdArgs::parse(make_spec(), &out, static_cast<int>(args.size()), args.data());
}

TEST(CmdArgs, ParsesFlagsAndValues) {
	auto recorder = Recorder{};
	ASSERT_EQ(parse(recorder, {"-f", "--input", "scene.json", "--level=3"}), CmdArgs::Result::eContinue);
	ASSERT_EQ(recorder.options.size(), 3U);
	EXPECT_EQ(recorder.options[0], (std::pair<std::string, std::string>{"flatten", ""}));
	EXPECT_EQ(recorder.options[1], (std::pair<std::string, std::string>{"input", "scene.json"}));
	EXPECT_EQ(recorder.options[2], (std::pair<std::string, std::string>{"level", "3"}));
}

TEST(CmdArgs, OptionalValueMayBeOmitted) {
	auto recorder = Recorder{};
	ASSERT_EQ(parse(recorder, {"--level", "-f"}), CmdArgs::Result::eContinue);
	ASSERT_EQ(recorder.options.size(), 2U);
	EXPECT_EQ(recorder.options[0].second, "");
}

TEST(CmdArgs, RejectsInvalidInput) {
	auto logger_instance = logger::Instance{};
	auto recorder = Recorder{};
	EXPECT_EQ(parse(recorder, {"--bogus"}), CmdArgs::Result::eExitFailure);
	EXPECT_EQ(parse(recorder, {"-i"}), CmdArgs::Result::eExitFailure);
	EXPECT_EQ(parse(recorder, {"--flatten=yes"}), CmdArgs::Result::eExitFailure);
	EXPECT_EQ(parse(recorder, {"stray"}), CmdArgs::Result::eExitFailure);
	EXPECT_TRUE(LogCapture::take().contains("Unknown option: [--bogus]", logger::Level::eError));
}

TEST(CmdArgs, HelpAndVersionExit) {
	auto recorder = Recorder{};
	EXPECT_EQ(parse(recorder, {"--help"}), CmdArgs::Result::eExitSuccess);
	EXPECT_EQ(parse(recorder, {"--version"}), CmdArgs::Result::eExitSuccess);
	EXPECT_TRUE(recorder.options.empty());
}

TEST(CmdArgs, UsageListsOptions) {
	auto const usage = CmdArgs::usage(make_spec());
	EXPECT_NE(usage.find("-f, --flatten"), std::string::npos);
	EXPECT_NE(usage.find("-i, --input <PATH>"), std::string::npos);
	EXPECT_NE(usage.find("--level[=N]"), std::string::npos);
}
} // namespace
} // namespace rigkit::test
