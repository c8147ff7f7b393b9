#pragma once
#include <stdexcept>

namespace rigkit {
///
/// \brief Base rigkit exception.
///
struct Error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

///
/// \brief Malformed configuration file.
///
struct ConfigError : Error {
	using Error::Error;
};

///
/// \brief Invalid scene handle, document, or bone table.
///
struct SceneError : Error {
	using Error::Error;
};
} // namespace rigkit
