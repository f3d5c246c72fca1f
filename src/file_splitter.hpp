#pragma once

#include "errors.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Cuts a file into sequential chunkBytes-sized parts (the last may be
// shorter), written as "<stem>.part001", "<stem>.part002", ... under outDir.
CallResult<std::vector<std::string>> split_file(const std::string& path,
                                                std::uint64_t chunkBytes,
                                                const std::string& outDir);

std::uint64_t part_count(std::uint64_t sizeBytes, std::uint64_t chunkBytes);
