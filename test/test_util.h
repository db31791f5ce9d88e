#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace homepage::test
{

// 每个测试一个临时目录，析构时删除
class TempDir
{
public:
	TempDir()
	{
		std::random_device rd;
		auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
		path_ = std::filesystem::temp_directory_path() /
			("homepage-test-" + std::to_string(stamp) + "-" + std::to_string(rd()));
		std::filesystem::create_directories(path_);
	}
	~TempDir()
	{
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}
	TempDir(const TempDir&) = delete;
	TempDir& operator=(const TempDir&) = delete;

	const std::filesystem::path& path() const { return path_; }

	std::filesystem::path write(const std::string& rel, const std::string& content) const
	{
		auto p = path_ / rel;
		std::filesystem::create_directories(p.parent_path());
		std::ofstream out(p, std::ios::binary | std::ios::trunc);
		out << content;
		return p;
	}

private:
	std::filesystem::path path_;
};

} // namespace homepage::test
