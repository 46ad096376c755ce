#pragma once
/*
 * FileIO
 *
 * Purpose: whole-file read via mmap and crash-safe whole-file write
 *          (write .tmp -> fdatasync -> atomic rename).
 * Usage: both return false and fill msg on failure; msg also carries the success note.
 */
#include <filesystem>
#include <string>

bool read_file_bytes(const std::filesystem::path& path, std::string& out, std::string& msg);
bool write_file_atomic(const std::filesystem::path& path, const std::string& data, std::string& msg);
