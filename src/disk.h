#pragma once

#include <cstdint>
#include <string>
#include <filesystem>

#include "config.h"

void create_disk(const std::filesystem::path& path, uint64_t size, const std::string& format, const Config& config);
// independent full copy, never a backing-file reference
void clone_disk(const std::filesystem::path& src, const std::filesystem::path& dst, const std::string& format, const Config& config);
void delete_disk(const std::filesystem::path& path);
