#pragma once

#include "types.hpp"

#include <cstddef>
#include <string>

constexpr std::size_t kMaxFileNameLength = 100;

// Replaces characters that are unsafe in file names, trims, caps at 100 chars.
std::string sanitize_filename(const std::string& name);

// Left-pads the integer part of a chapter label to 4 digits ("7.5" -> "0007.5").
std::string pad_chapter(const std::string& label);

// "Ch.0001 - Title", capped at 150 chars before sanitizing.
std::string chapter_dir_name(const ChapterRef& chapter);

// "001.jpg"; the extension comes from the URL path, "jpg" when absent.
std::string page_file_name(int ordinal, const std::string& url);

// First UUID found in the input (a bare id or a catalog URL), else the trimmed input.
std::string extract_uuid(const std::string& input);

std::string trim_copy(const std::string& s);
