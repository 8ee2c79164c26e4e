#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace arcget
{
  // Broad content categories for archive files.
  //
  // Declaration order is the resolution priority: an extension listed under
  // several categories (xml is both data and metadata, log is both data and
  // metadata, etc) belongs to the first one here.
  //
  enum class format_category
  {
    metadata,
    web,
    software,
    data,
    archives,
    documents,
    images,
    audio,
    video
  };

  const char*
  to_string (format_category) noexcept;

  inline std::ostream&
  operator<< (std::ostream& os, format_category c)
  {
    return os << to_string (c);
  }

  // Parse a category name ("documents", "Images", ...). Return nullopt if
  // the name is not a category.
  //
  std::optional<format_category>
  to_format_category (const std::string&);

  // All categories in priority order.
  //
  const std::vector<format_category>&
  format_categories ();

  // Extensions listed under the category, including ones that resolve to a
  // higher-priority category.
  //
  const std::vector<std::string>&
  category_extensions (format_category);

  // The category an extension (lower-case, no leading dot) resolves to.
  //
  std::optional<format_category>
  find_category (const std::string& extension);
}
