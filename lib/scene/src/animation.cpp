#include <rigkit/scene/animation.hpp>

namespace rigkit {
Channel& Clip::channel(std::string_view bone) {
	for (auto& channel : channels) {
		if (channel.bone == bone) { return channel; }
	}
	return channels.emplace_back(Channel{.bone = std::string{bone}});
}

Channel const* Clip::find(std::string_view bone) const {
	for (auto const& channel : channels) {
		if (channel.bone == bone) { return &channel; }
	}
	return nullptr;
}
} // namespace rigkit
