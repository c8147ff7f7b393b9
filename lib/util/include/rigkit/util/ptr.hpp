#pragma once

namespace rigkit {
///
/// \brief Alias for a nullable, non-owning pointer.
///
template <typename Type>
using Ptr = Type*;
} // namespace rigkit
