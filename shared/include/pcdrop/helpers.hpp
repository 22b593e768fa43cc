#pragma once

#include <cstddef>
#include <ctime>
#include <string>
#include <vector>

namespace pcdrop {

constexpr size_t TMP_BUFF_SIZE = 64 * 1024; // 64 KB buffer size

// string helpers
const std::vector<std::string> split(const std::string &str, const char &delim);
std::string trim(const std::string &str);
std::string to_lower(std::string str);
bool iequals(const std::string &a, const std::string &b);
std::string url_decode(const std::string &str, const bool &plus_as_space = false);
std::string url_encode(const std::string &str);
std::string format_time(const std::time_t &t, const char *format = "%Y-%m-%d %H:%M:%S");

// socket helpers; recv_some returns 0 on orderly shutdown by the peer
size_t recv_some(const int &fd, char *buf, const size_t &len);
void send_all(const int &fd, const char *data, const size_t &len);
void send_all(const int &fd, const std::string &data);

} // namespace pcdrop
