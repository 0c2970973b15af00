// include/arbor/version.hpp
#pragma once

/// @brief Returns the Arbor version string.
/// @invariant The returned pointer is non-null and points to a null-terminated string.
/// @ownership The returned string has static storage duration and must not be freed.
namespace arbor
{
const char *arbor_version() noexcept;
} // namespace arbor
