#pragma once

#include <cstdint>
#include <string>
#include <vector>

int64_t now_ms();
int64_t steady_now_ms();

bool save_binary_file(const std::string & path, const std::string & data, std::string & err);
bool load_binary_file(const std::string & path, std::vector<char> & out, std::string & err);

bool parse_i32(const char * s, int32_t & out);
bool parse_i64(const char * s, int64_t & out);
bool parse_f32(const char * s, float & out);
bool parse_on_off_bool(const char * s, bool & out);

std::string trim_copy(const std::string & in);
std::string to_lower_ascii(std::string s);
bool parse_csv_list(const std::string & raw, std::vector<std::string> & out);

// Lower-case extension without the dot, or "" if there is none.
std::string file_extension_lower(const std::string & filename);

int resolve_threads(int n_threads);
