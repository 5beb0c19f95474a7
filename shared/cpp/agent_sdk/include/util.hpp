#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

std::string getenv_or(const char* key, const std::string& def);
int getenv_int_or(const char* key, int def);
std::string sha1_file(const std::filesystem::path& p);
std::string read_text_file(const std::filesystem::path& p);
void write_text_file(const std::filesystem::path& p, const std::string& text);

// Loads KEY=VALUE lines into the process environment (existing variables win
// unless overwrite is set). Returns the parsed pairs; a missing file yields {}.
std::map<std::string, std::string> load_env_file(const std::filesystem::path& p, bool overwrite = false);

std::string format_utc(std::chrono::system_clock::time_point tp);         // 2024-05-01T12:00:00Z
std::string format_compact(std::chrono::system_clock::time_point tp);     // 20240501-120000
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& s, char sep);

// Non-empty and limited to [A-Za-z0-9_-]; safe as a single file name component.
bool is_safe_name(const std::string& s);
