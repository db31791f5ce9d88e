#pragma once

#include "reading_list.h"

#include <trantor/utils/Logger.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace homepage
{

enum class ReadingSourceKind
{
	File,
	Bookmarks,
	Remote,
	None,
};

struct SiteConfig
{
	// 监听
	std::string bindAddr{ "0.0.0.0" };
	uint16_t port{ 3000 };
	size_t threads{ 1 };
	trantor::Logger::LogLevel logLevel{ trantor::Logger::kInfo };

	// 内容
	std::string postsDir;   // 为空时按 kDefaultPostRoots 依次找
	std::string templatesDir{ "templates" };
	std::string staticDir{ "static" };
	bool allowRawHtml{ false };

	// 阅读列表
	ReadingSourceKind readingSource{ ReadingSourceKind::File };
	std::string readingListPath{ "static/data/reading_list.json" };
	std::string bookmarksPath;
	std::string readingListUrl{ "http://127.0.0.1:8000/api/reading-list" };

	// 页面
	std::string siteName{ "jambonne" };
	std::string siteSubtitle{ "notes, posts and things worth reading" };
	std::string author{ "jambonne" };
	std::string authorDesc{ "software, reading, writing" };

	std::vector<std::filesystem::path> post_roots() const;
};

using EnvLookup = std::function<const char*(const char*)>;

// 默认值 + 环境变量覆盖；非法值回落默认并打 WARN
SiteConfig load_site_config(const EnvLookup& env = [](const char* k) { return std::getenv(k); });

std::unique_ptr<ReadingSource> make_reading_source(const SiteConfig& cfg);

const char* to_string(ReadingSourceKind k);

} // namespace homepage
