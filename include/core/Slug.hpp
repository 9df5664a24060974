#pragma once

#include <string>

namespace toolkit {

/**
 * Build a URL slug: lowercase, every run of characters outside [a-z0-9]
 * collapsed to a single '-', leading and trailing '-' removed.
 * Only ASCII letters and digits survive; other bytes act as separators.
 * @throws ToolkitError EmptyInput for "", EmptyResult when nothing survives
 */
std::string slugify(const std::string& text);

// Replace runs of characters outside [A-Za-z0-9-] with '_' and trim '_' from both ends.
// With lowercase set, ASCII letters are lowered first.
std::string normalizeFileName(const std::string& name, bool lowercase);

} // namespace toolkit
