#include "text_util.h"

#include <cctype>
#include <cstdio>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace homepage
{

std::string trim(const std::string& s)
{
	size_t a = s.find_first_not_of(" \t\r\n");
	if (a == std::string::npos) return "";
	size_t b = s.find_last_not_of(" \t\r\n");
	return s.substr(a, b - a + 1);
}

std::string html_escape(const std::string& in)
{
	std::string out; out.reserve(in.size() + in.size() / 8);
	for (char c : in)
	{
		switch (c)
		{
		case '&': out += "&amp;"; break;
		case '<': out += "&lt;"; break;
		case '>': out += "&gt;"; break;
		case '"': out += "&quot;"; break;
		case '\'': out += "&#39;"; break;
		default: out.push_back(c);
		}
	}
	return out;
}

void replace_all(std::string& s, const std::string& from, const std::string& to)
{
	if (from.empty()) return;
	size_t pos = 0;
	while ((pos = s.find(from, pos)) != std::string::npos)
	{
		s.replace(pos, from.size(), to);
		pos += to.size();
	}
}

void strip_utf8_bom(std::string& s)
{
	if (s.size() >= 3 && (unsigned char)s[0] == 0xEF && (unsigned char)s[1] == 0xBB && (unsigned char)s[2] == 0xBF)
		s.erase(0, 3);
}

std::string to_lf(const std::string& s)
{
	std::string out; out.reserve(s.size());
	for (size_t i = 0; i < s.size(); ++i)
	{
		if (s[i] == '\r') { if (i + 1 < s.size() && s[i + 1] == '\n') continue; else out.push_back('\n'); }
		else out.push_back(s[i]);
	}
	return out;
}

bool read_text_file(const std::filesystem::path& path, std::string& out)
{
	std::ifstream ifs(path, std::ios::binary);
	if (!ifs) return false;
	std::ostringstream ss; ss << ifs.rdbuf();
	out = std::move(ss).str();
	return true;
}

std::string to_iso(std::time_t t)
{
	std::tm tm{};
#ifdef _WIN32
	if (gmtime_s(&tm, &t) != 0) return std::string();
#else
	if (!gmtime_r(&t, &tm)) return std::string();
#endif
	char buf[64];
	if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S.000Z", &tm) == 0) return std::string();
	return std::string(buf);
}

bool parse_iso_utc(const std::string& s, std::time_t& out)
{
	// YYYY-MM-DDTHH:MM:SS[.fff]Z
	int Y, M, D, h, m, sec, n = 0;
	if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &Y, &M, &D, &h, &m, &sec, &n) != 6 || n != 19)
		return false;
	size_t i = (size_t)n;
	if (i < s.size() && s[i] == '.')
	{
		++i;
		size_t digits = 0;
		while (i < s.size() && std::isdigit((unsigned char)s[i])) { ++i; ++digits; }
		if (digits == 0) return false;
	}
	if (i + 1 != s.size() || s[i] != 'Z') return false;
	if (M < 1 || M > 12 || D < 1 || D > 31 || h > 23 || m > 59 || sec > 60) return false;

	std::tm tm{};
	tm.tm_year = Y - 1900;
	tm.tm_mon = M - 1;
	tm.tm_mday = D;
	tm.tm_hour = h;
	tm.tm_min = m;
	tm.tm_sec = sec;
#ifdef _WIN32
	out = _mkgmtime(&tm);
#else
	out = timegm(&tm);
#endif
	return out != (std::time_t)-1;
}

std::string now_iso_z()
{
	using namespace std::chrono;
	const auto now = system_clock::now();
	const auto t = system_clock::to_time_t(now);
	const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

	std::tm tm{};
#ifdef _WIN32
	gmtime_s(&tm, &t);
#else
	gmtime_r(&t, &tm);
#endif
	std::ostringstream oss;
	oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "."
		<< std::setw(3) << std::setfill('0') << ms.count() << "Z";
	return oss.str();
}

// UTF-8 首字节 -> 码点字节数
static inline size_t utf8_len(unsigned char c)
{
	if ((c & 0xE0) == 0xC0) return 2;
	if ((c & 0xF0) == 0xE0) return 3;
	if ((c & 0xF8) == 0xF0) return 4;
	return 1;
}

std::string slugify(const std::string& in)
{
	std::string out; out.reserve(in.size());
	bool lastDash = false;
	for (size_t i = 0; i < in.size();)
	{
		unsigned char c = (unsigned char)in[i];
		if (c >= 128)
		{
			// 复制一个完整的 UTF-8 代码点
			size_t len = utf8_len(c);
			out.append(in, i, len);
			i += len;
			lastDash = false;
			continue;
		}
		bool alnum = (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
		if (alnum)
		{
			out.push_back((char)std::tolower(c));
			lastDash = false;
		}
		else if (!lastDash)
		{
			// 其它 ASCII（空白/标点/下划线）统一成分隔符，并合并
			out.push_back('-');
			lastDash = true;
		}
		++i;
	}
	while (!out.empty() && out.front() == '-') out.erase(out.begin());
	while (!out.empty() && out.back() == '-') out.pop_back();
	if (out.empty()) out = "section";
	return out;
}

} // namespace homepage
