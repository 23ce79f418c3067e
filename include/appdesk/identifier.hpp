#pragma once

#include <string>

namespace appdesk {

// ============================================================================
// Identifier Derivation
// ============================================================================
//
// A bundle file "Foo-1.2.AppImage" has the full base name "Foo-1.2" and the
// short identifier "Foo". The identifier names the bundle's descriptor
// ("{prefix}-Foo.desktop") and is the key used for reconciliation and lookup.
//
// Separator policy: the identifier ends at the first hyphen or underscore.
// Every caller goes through derive_identifier(); nothing re-implements it.

// True for the characters that terminate a short identifier ('-' and '_').
bool is_identifier_separator(char c);

// Filename with its last extension removed ("a.b.c" -> "a.b").
// Names without a dot, and dotfiles such as ".hidden", are returned unchanged.
std::string strip_extension(const std::string& filename);

// Full base name of a bundle path or filename: the filename component with
// its last extension removed.
std::string full_base_name(const std::string& path_or_filename);

// Short identifier for a bundle path or filename.
// Returns an empty string when the base name starts with a separator; callers
// treat that as an ambiguous filename rather than an error.
std::string derive_identifier(const std::string& path_or_filename);

} // namespace appdesk
