// homepage: landing page, blog, CV and reading list
#include <drogon/drogon.h>

#include "handlers.h"
#include "post_catalog.h"
#include "reading_list.h"
#include "site_config.h"

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using namespace drogon;
using namespace homepage;

int main()
{
	const SiteConfig cfg = load_site_config();
	app().setLogLevel(cfg.logLevel);

	LOG_INFO << "Starting homepage on " << cfg.bindAddr << ":" << cfg.port;

	// 阅读列表：启动时只读一次，之后只读共享
	std::unique_ptr<ReadingSource> source = make_reading_source(cfg);
	const ReadingListPtr readingList = load_reading_list(*source);

	auto catalog = std::make_shared<const PostCatalog>(cfg.post_roots(), MarkdownOptions{ cfg.allowRawHtml });
	for (const auto& root : catalog->roots())
		LOG_INFO << "post root candidate: " << root.string();

	// 静态资源：/static/... 直接映射到 staticDir
	std::error_code ec;
	const std::string staticRoot = fs::absolute(cfg.staticDir, ec).string();
	if (ec || !fs::is_directory(staticRoot, ec))
		LOG_WARN << "static directory not found: " << cfg.staticDir;
	app().setDocumentRoot(staticRoot);
	app().addALocation("/static", "", staticRoot);

	app().registerHandler(
		"/",
		[cfg](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& cb) { cb(landing_page(cfg)); },
		{ Get });

	app().registerHandler(
		"/cv",
		[cfg](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& cb) { cb(cv_page(cfg)); },
		{ Get });

	app().registerHandler(
		"/blog",
		[cfg, catalog](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& cb) { cb(blog_index(cfg, *catalog)); },
		{ Get });

	app().registerHandler(
		"/blog/{1}",
		[cfg, catalog](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& cb, const std::string& slug)
		{
			cb(blog_post(cfg, *catalog, slug));
		},
		{ Get });

	app().registerHandler(
		"/reading",
		[cfg, readingList](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& cb) { cb(reading_page(cfg, *readingList)); },
		{ Get });

	app().registerHandler(
		"/api/reading-list",
		[readingList](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& cb) { cb(reading_list_api(*readingList)); },
		{ Get });

	app().registerHandler(
		"/api/mindmap",
		[readingList](const HttpRequestPtr&, std::function<void(const HttpResponsePtr&)>&& cb) { cb(mindmap_api(*readingList)); },
		{ Get });

	app().addListener(cfg.bindAddr, cfg.port)
		.setThreadNum(cfg.threads)
		.run();
	return 0;
}
