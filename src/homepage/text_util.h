#pragma once

#include <ctime>
#include <filesystem>
#include <string>

namespace homepage
{

std::string trim(const std::string& s);

// 安全 HTML 转义（标题/链接/任意拼进页面的值）
std::string html_escape(const std::string& in);

// 简易替换
void replace_all(std::string& s, const std::string& from, const std::string& to);

void strip_utf8_bom(std::string& s);
std::string to_lf(const std::string& s);

bool read_text_file(const std::filesystem::path& path, std::string& out);

// time_t -> "YYYY-MM-DDTHH:MM:SS.000Z"；超出 gmtime 范围时返回空串
std::string to_iso(std::time_t t);
// "YYYY-MM-DDTHH:MM:SS[.fff]Z" -> time_t
bool parse_iso_utc(const std::string& s, std::time_t& out);
// 当前 UTC 时间，带毫秒
std::string now_iso_z();

// 标题锚点：英文按 slug 规则；非 ASCII 原样保留；空白/标点 -> '-'
std::string slugify(const std::string& in);

} // namespace homepage
