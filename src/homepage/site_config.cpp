#include "site_config.h"
#include "text_util.h"

#include <algorithm>
#include <cstdlib>

namespace homepage
{

static const char* const kDefaultPostRoots[] = { "posts", "/app/posts" };

std::vector<std::filesystem::path> SiteConfig::post_roots() const
{
	if (!postsDir.empty()) return { postsDir };
	return { std::begin(kDefaultPostRoots), std::end(kDefaultPostRoots) };
}

const char* to_string(ReadingSourceKind k)
{
	switch (k)
	{
	case ReadingSourceKind::File: return "file";
	case ReadingSourceKind::Bookmarks: return "bookmarks";
	case ReadingSourceKind::Remote: return "remote";
	case ReadingSourceKind::None: return "none";
	}
	return "file";
}

static inline std::string lower_ascii(std::string s)
{
	for (auto& c : s) if (c >= 'A' && c <= 'Z') c = char(c - 'A' + 'a');
	return s;
}

static bool parse_log_level(const std::string& v, trantor::Logger::LogLevel& out)
{
	const std::string s = lower_ascii(trim(v));
	if (s == "trace") out = trantor::Logger::kTrace;
	else if (s == "debug") out = trantor::Logger::kDebug;
	else if (s == "info") out = trantor::Logger::kInfo;
	else if (s == "warn" || s == "warning") out = trantor::Logger::kWarn;
	else if (s == "error") out = trantor::Logger::kError;
	else return false;
	return true;
}

static bool parse_uint(const std::string& v, unsigned long max, unsigned long& out)
{
	const std::string s = trim(v);
	if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return c >= '0' && c <= '9'; }))
		return false;
	try
	{
		unsigned long n = std::stoul(s);
		if (n == 0 || n > max) return false;
		out = n;
		return true;
	}
	catch (const std::exception&)
	{
		return false;
	}
}

SiteConfig load_site_config(const EnvLookup& env)
{
	SiteConfig cfg;

	auto get = [&env](const char* key, std::string& out) -> bool
		{
			const char* v = env(key);
			if (!v || !*v) return false;
			out = v;
			return true;
		};

	std::string v;
	if (get("PORT", v))
	{
		unsigned long n = 0;
		if (parse_uint(v, 65535, n)) cfg.port = (uint16_t)n;
		else LOG_WARN << "invalid PORT '" << v << "', using " << cfg.port;
	}
	if (get("BIND_ADDR", v)) cfg.bindAddr = v;
	if (get("THREADS", v))
	{
		unsigned long n = 0;
		if (parse_uint(v, 256, n)) cfg.threads = n;
		else LOG_WARN << "invalid THREADS '" << v << "', using " << cfg.threads;
	}
	if (get("LOG_LEVEL", v) && !parse_log_level(v, cfg.logLevel))
		LOG_WARN << "unknown LOG_LEVEL '" << v << "', using info";

	get("POSTS_DIR", cfg.postsDir);
	get("TEMPLATES_DIR", cfg.templatesDir);
	get("STATIC_DIR", cfg.staticDir);
	if (get("ALLOW_RAW_HTML", v))
	{
		const std::string s = lower_ascii(trim(v));
		cfg.allowRawHtml = (s == "1" || s == "true" || s == "yes" || s == "on");
	}

	if (get("READING_LIST_SOURCE", v))
	{
		const std::string s = lower_ascii(trim(v));
		if (s == "file") cfg.readingSource = ReadingSourceKind::File;
		else if (s == "bookmarks" || s == "safari") cfg.readingSource = ReadingSourceKind::Bookmarks;
		else if (s == "remote") cfg.readingSource = ReadingSourceKind::Remote;
		else if (s == "none") cfg.readingSource = ReadingSourceKind::None;
		else LOG_WARN << "unknown READING_LIST_SOURCE '" << v << "', using file";
	}
	get("READING_LIST_PATH", cfg.readingListPath);
	get("READING_LIST_URL", cfg.readingListUrl);
	if (!get("BOOKMARKS_PATH", cfg.bookmarksPath))
	{
		std::string home = "~";
		get("HOME", home);
		cfg.bookmarksPath = home + "/Library/Safari/Bookmarks.plist";
	}

	get("SITE_NAME", cfg.siteName);
	get("SITE_SUBTITLE", cfg.siteSubtitle);
	get("AUTHOR_NAME", cfg.author);
	get("AUTHOR_DESC", cfg.authorDesc);
	return cfg;
}

std::unique_ptr<ReadingSource> make_reading_source(const SiteConfig& cfg)
{
	switch (cfg.readingSource)
	{
	case ReadingSourceKind::Bookmarks: return std::make_unique<BookmarkStoreSource>(cfg.bookmarksPath);
	case ReadingSourceKind::Remote: return std::make_unique<RemoteSource>(cfg.readingListUrl);
	case ReadingSourceKind::None: return std::make_unique<EmptySource>();
	case ReadingSourceKind::File: break;
	}
	return std::make_unique<JsonFileSource>(cfg.readingListPath);
}

} // namespace homepage
