#include <rigkit/defines.hpp>

#include <rigkit/util/cmd_args.hpp>
#include <rigkit/util/error.hpp>
#include <rigkit/util/logger.hpp>

#include <rigkit/scene/scene.hpp>
#include <rigkit/scene/scene_io.hpp>

#include <rigkit/rig/canonicalizer.hpp>
#include <rigkit/rig/flattener.hpp>
#include <rigkit/rig/rig_builder.hpp>

#include <config/config.hpp>

#include <chrono>
#include <ctime>

using namespace rigkit;

namespace {
std::string_view version_string() {
	static auto const ret = fmt::format("v{}.{}.{}", version_v.major, version_v.minor, version_v.patch);
	return ret;
}

void log_prologue() {
	auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	char buf[32]{};
	std::strftime(buf, sizeof(buf), "%F %Z", std::localtime(&now));
	logger::info("rigkit {} | {} |", version_string(), buf);
}

struct AppOpts {
	std::string input{};
	std::string output{};
	std::string config{"rigkit.conf"};
	bool generate{};
	bool flatten{};
	bool canonicalize{};
	bool strip_root_joint{};
	bool write_config{};

	bool has_operation() const { return generate || flatten || canonicalize; }
};

bool run(AppOpts const& opts) {
	auto config = Config::load(opts.config.c_str());
	if (opts.strip_root_joint) { config.flatten.strip_root_joint = true; }
	if (opts.write_config && !config.save(opts.config.c_str())) { return false; }
	if (!opts.has_operation()) {
		if (opts.write_config) { return true; }
		logger::error("No operation requested (see --help)");
		return false;
	}
	if (!opts.generate && opts.input.empty()) {
		logger::error("--flatten / --canonicalize require an input scene (--input)");
		return false;
	}

	log_prologue();
	auto scene = opts.input.empty() ? Scene{} : io::load_scene_file(opts.input.c_str());

	if (opts.generate) {
		logger::info("== Generating rig and animations ==");
		build_rig_and_animations(scene, config.rig_info());
	}
	if (opts.flatten) {
		logger::info("== Flattening hierarchy ==");
		if (!flatten(scene, config.flatten_info())) { return false; }
	}
	if (opts.canonicalize) {
		logger::info("== Canonicalizing bone names ==");
		canonicalize(scene, config.canonicalize_info());
	}

	if (!opts.output.empty()) { return io::save_scene_file(scene, opts.output.c_str()); }
	return true;
}
} // namespace

int main(int argc, char** argv) {
	try {
		auto logger_instance = logger::Instance{};
		struct Parser : CmdArgs::Parser {
			AppOpts app_opts{};

			void opt(CmdArgs::Key key, CmdArgs::Value value) final {
				switch (key.single) {
				case 'i': app_opts.input = value; return;
				case 'o': app_opts.output = value; return;
				case 'c': app_opts.config = value; return;
				case 'g': app_opts.generate = true; return;
				case 'f': app_opts.flatten = true; return;
				case 'n': app_opts.canonicalize = true; return;
				default: break;
				}
				if (key.full == "strip-root-joint") {
					app_opts.strip_root_joint = true;
				} else if (key.full == "write-config") {
					app_opts.write_config = true;
				}
			}
		};
		auto spec = CmdArgs::Spec{};
		spec.options = {
			CmdArgs::Opt{.key = {.full = "generate", .single = 'g'}, .help = "Replace the scene with a generated Mixamo rig and clips"},
			CmdArgs::Opt{.key = {.full = "flatten", .single = 'f'}, .help = "Move the armature to the scene root and delete wrappers"},
			CmdArgs::Opt{.key = {.full = "canonicalize", .single = 'n'}, .help = "Strip numeric suffixes from Mixamo bone names"},
			CmdArgs::Opt{.key = {.full = "input", .single = 'i'}, .value = "PATH", .help = "Scene document to load"},
			CmdArgs::Opt{.key = {.full = "output", .single = 'o'}, .value = "PATH", .help = "Scene document to save"},
			CmdArgs::Opt{.key = {.full = "config", .single = 'c'}, .value = "PATH", .help = "Config file (default: rigkit.conf)"},
			CmdArgs::Opt{.key = {.full = "strip-root-joint"}, .help = "Remove the importer's root joint while flattening"},
			CmdArgs::Opt{.key = {.full = "write-config"}, .help = "Save the effective config"},
		};
		spec.version = version_string();
		auto parser = Parser{};
		switch (CmdArgs::parse(std::move(spec), &parser, argc, argv)) {
		case CmdArgs::Result::eExitSuccess: return EXIT_SUCCESS;
		case CmdArgs::Result::eExitFailure: return EXIT_FAILURE;
		case CmdArgs::Result::eContinue: break;
		}
		try {
			if (!run(parser.app_opts)) { return EXIT_FAILURE; }
		} catch (SceneError const& e) {
			logger::error("Scene error: {}", e.what());
			return EXIT_FAILURE;
		} catch (Error const& e) {
			logger::error("Runtime error: {}", e.what());
			return EXIT_FAILURE;
		} catch (std::exception const& e) {
			logger::error("Fatal error: {}", e.what());
			return EXIT_FAILURE;
		}
	} catch (std::exception const& e) {
		logger::error("Fatal error: {}", e.what());
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
