#include <fmt/format.h>
#include <rigkit/util/cmd_args.hpp>
#include <rigkit/util/logger.hpp>
#include <algorithm>
#include <optional>
#include <span>

namespace rigkit {
namespace {
using Opt = CmdArgs::Opt;

constexpr bool is_flag(Opt const& opt) { return opt.value.empty(); }

Opt const* find_full(std::span<Opt const> options, std::string_view const full) {
	auto const it = std::find_if(options.begin(), options.end(), [full](Opt const& o) { return !o.key.full.empty() && o.key.full == full; });
	return it == options.end() ? nullptr : &*it;
}

Opt const* find_single(std::span<Opt const> options, char const single) {
	auto const it = std::find_if(options.begin(), options.end(), [single](Opt const& o) { return o.key.single != '\0' && o.key.single == single; });
	return it == options.end() ? nullptr : &*it;
}

struct Walker {
	CmdArgs::Spec const& spec;
	Ptr<CmdArgs::Parser> out;
	std::span<char const* const> args;
	std::size_t index{};

	std::string_view next() { return index < args.size() ? std::string_view{args[index++]} : std::string_view{}; }
	bool has_next() const { return index < args.size(); }
	bool next_is_value() const { return has_next() && !std::string_view{args[index]}.starts_with('-'); }

	CmdArgs::Result take(Opt const& opt, std::string_view const name, std::optional<std::string_view> inline_value) {
		if (is_flag(opt)) {
			if (inline_value) {
				logger::error("Option [{}] does not take a value", name);
				return CmdArgs::Result::eExitFailure;
			}
			if (out) { out->opt(opt.key, {}); }
			return CmdArgs::Result::eContinue;
		}
		auto value = CmdArgs::Value{};
		if (inline_value) {
			value = *inline_value;
		} else if (next_is_value()) {
			value = next();
		} else if (!opt.is_optional_value) {
			logger::error("Option [{}] requires a value ({})", name, opt.value);
			return CmdArgs::Result::eExitFailure;
		}
		if (out) { out->opt(opt.key, value); }
		return CmdArgs::Result::eContinue;
	}

	CmdArgs::Result full(std::string_view arg) {
		auto inline_value = std::optional<std::string_view>{};
		if (auto const eq = arg.find('='); eq != std::string_view::npos) {
			inline_value = arg.substr(eq + 1);
			arg = arg.substr(0, eq);
		}
		if (arg == "help") {
			fmt::print("{}", CmdArgs::usage(spec));
			return CmdArgs::Result::eExitSuccess;
		}
		if (arg == "version") {
			fmt::print("{} {}\n", spec.name, spec.version);
			return CmdArgs::Result::eExitSuccess;
		}
		auto const* opt = find_full(spec.options, arg);
		if (!opt) {
			logger::error("Unknown option: [--{}]", arg);
			return CmdArgs::Result::eExitFailure;
		}
		return take(*opt, arg, inline_value);
	}

	CmdArgs::Result single(std::string_view const arg) {
		if (arg.size() != 1) {
			logger::error("Invalid option: [-{}]", arg);
			return CmdArgs::Result::eExitFailure;
		}
		if (arg[0] == 'h') {
			fmt::print("{}", CmdArgs::usage(spec));
			return CmdArgs::Result::eExitSuccess;
		}
		auto const* opt = find_single(spec.options, arg[0]);
		if (!opt) {
			logger::error("Unknown option: [-{}]", arg);
			return CmdArgs::Result::eExitFailure;
		}
		return take(*opt, arg, {});
	}

	CmdArgs::Result operator()() {
		while (has_next()) {
			auto const arg = next();
			auto result = CmdArgs::Result::eContinue;
			if (arg.starts_with("--")) {
				result = full(arg.substr(2));
			} else if (arg.starts_with('-') && arg.size() > 1) {
				result = single(arg.substr(1));
			} else {
				logger::error("Unexpected argument: [{}]", arg);
				result = CmdArgs::Result::eExitFailure;
			}
			if (result != CmdArgs::Result::eContinue) { return result; }
		}
		return CmdArgs::Result::eContinue;
	}
};
} // namespace

CmdArgs::Result CmdArgs::parse(Spec spec, Ptr<Parser> out, int argc, char const* const* argv) {
	if (argc < 1 || !argv) { return Result::eContinue; }
	auto const args = std::span{argv, static_cast<std::size_t>(argc)}.subspan(1);
	return Walker{spec, out, args}();
}

CmdArgs::Result CmdArgs::parse(std::string_view version, int argc, char const* const* argv) {
	auto spec = Spec{};
	spec.version = version;
	return parse(std::move(spec), {}, argc, argv);
}

std::string CmdArgs::usage(Spec const& spec) {
	auto ret = fmt::format("Usage: {} [OPTIONS]\n\nOptions:\n", spec.name);
	auto const key_str = [](Opt const& opt) {
		auto str = std::string{};
		if (opt.key.single != '\0') { str += fmt::format("-{}", opt.key.single); }
		if (!opt.key.full.empty()) { str += fmt::format("{}--{}", str.empty() ? "" : ", ", opt.key.full); }
		if (is_flag(opt)) { return str; }
		if (opt.is_optional_value) { return str + fmt::format("[={}]", opt.value); }
		return str + fmt::format(" <{}>", opt.value);
	};
	for (auto const& opt : spec.options) {
		if (!opt.key.valid()) { continue; }
		ret += fmt::format("  {:<32} {}\n", key_str(opt), opt.help);
	}
	ret += fmt::format("  {:<32} {}\n", "-h, --help", "Show this help text");
	ret += fmt::format("  {:<32} {}\n", "--version", "Show version");
	return ret;
}
} // namespace rigkit
