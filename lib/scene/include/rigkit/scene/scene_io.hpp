#pragma once
#include <rigkit/scene/scene.hpp>

namespace dj {
class Json;
}

namespace rigkit::io {
///
/// \brief Build a Scene from a JSON scene document.
///
/// Node, armature, bone and clip references are array indices within the document.
/// Throws SceneError on dangling references or parent cycles.
///
Scene load_scene(dj::Json const& json) noexcept(false);
///
/// \brief Serialize a Scene into a JSON scene document.
///
void to_json(dj::Json& out, Scene const& scene);

///
/// \brief Load a scene document from a file.
///
/// Throws SceneError if path is not a readable file.
///
Scene load_scene_file(char const* path) noexcept(false);
///
/// \brief Save a scene document to a file.
/// \returns false if the file could not be written
///
bool save_scene_file(Scene const& scene, char const* path);
} // namespace rigkit::io
