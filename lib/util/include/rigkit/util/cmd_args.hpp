#pragma once
#include <rigkit/util/ptr.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace rigkit {
struct CmdArgs {
	enum class Result { eContinue, eExitFailure, eExitSuccess };

	struct Key {
		std::string_view full{};
		char single{};

		constexpr bool valid() const { return !full.empty() || single != '\0'; }
	};

	using Value = std::string_view;

	///
	/// \brief Option description.
	///
	/// An empty value marks a flag (takes no argument); otherwise value is the placeholder shown in help.
	///
	struct Opt {
		Key key{};
		Value value{};
		bool is_optional_value{};
		std::string_view help{};
	};

	struct Parser {
		virtual void opt(Key key, Value value) = 0;
	};

	struct Spec {
		std::vector<Opt> options{};
		std::string_view version{"(unknown)"};
		std::string_view name{"rigkit"};
	};

	///
	/// \brief Parse argv against spec, forwarding each recognized option to out.
	/// \returns eExitSuccess for --help / --version, eExitFailure on invalid input, eContinue otherwise
	///
	static Result parse(Spec spec, Ptr<Parser> out, int argc, char const* const* argv);
	static Result parse(std::string_view version, int argc, char const* const* argv);

	static std::string usage(Spec const& spec);
};
} // namespace rigkit
