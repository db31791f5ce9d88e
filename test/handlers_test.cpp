#include "handlers.h"
#include "test_util.h"

#include <gtest/gtest.h>

using namespace drogon;
using namespace homepage;
using homepage::test::TempDir;

namespace
{

std::string body_of(const HttpResponsePtr& r)
{
	return std::string(r->getBody());
}

// 模板和文章都放在临时目录里
struct SiteFixture
{
	TempDir dir;
	SiteConfig cfg;
	PostCatalog catalog{ { dir.path() / "posts" } };

	SiteFixture()
	{
		cfg.templatesDir = (dir.path() / "templates").string();
		dir.write("posts/hello.md", "# Hello World\nBody text\n");
	}

	void add_templates()
	{
		dir.write("templates/index.html", "<h1>{{SITENAME}}</h1>");
		dir.write("templates/cv.html", "<h1>CV {{AUTHOR_NAME}}</h1>");
		dir.write("templates/blog.html", "{{POSTS_HTML}}");
		dir.write("templates/article.html", "<h1>{{TITLE}}</h1>{{CONTENT}}");
		dir.write("templates/reading.html", "{{ERROR_HTML}}{{ITEMS_HTML}}");
	}
};

} // namespace

TEST(Handlers, PostStatusMapping)
{
	EXPECT_EQ(status_for(PostStatus::Ok), k200OK);
	EXPECT_EQ(status_for(PostStatus::InvalidSlug), k400BadRequest);
	EXPECT_EQ(status_for(PostStatus::NotFound), k404NotFound);
}

TEST(Handlers, TraversalSlugIsAClientError)
{
	SiteFixture site;
	site.add_templates();
	for (const std::string slug : { "../../etc/passwd", "..", "a/b", "hello.md" })
	{
		auto r = blog_post(site.cfg, site.catalog, slug);
		EXPECT_EQ(r->getStatusCode(), k400BadRequest) << slug;
		EXPECT_EQ(body_of(r), "invalid slug");
	}
}

TEST(Handlers, MissingPostIs404)
{
	SiteFixture site;
	site.add_templates();
	auto r = blog_post(site.cfg, site.catalog, "nonexistent-post");
	EXPECT_EQ(r->getStatusCode(), k404NotFound);
	EXPECT_EQ(body_of(r), "not found");
}

TEST(Handlers, ExistingPostRendersArticle)
{
	SiteFixture site;
	site.add_templates();
	auto r = blog_post(site.cfg, site.catalog, "hello");
	EXPECT_EQ(r->getStatusCode(), k200OK);
	const std::string html = body_of(r);
	EXPECT_NE(html.find("<h1>Hello World</h1>"), std::string::npos);
	EXPECT_NE(html.find("<p>Body text</p>"), std::string::npos);
}

TEST(Handlers, MissingTemplatesAre500)
{
	SiteFixture site;
	EXPECT_EQ(landing_page(site.cfg)->getStatusCode(), k500InternalServerError);
	EXPECT_EQ(cv_page(site.cfg)->getStatusCode(), k500InternalServerError);
	EXPECT_EQ(blog_index(site.cfg, site.catalog)->getStatusCode(), k500InternalServerError);
	EXPECT_EQ(reading_page(site.cfg, ReadingList{})->getStatusCode(), k500InternalServerError);

	auto post = blog_post(site.cfg, site.catalog, "hello");
	EXPECT_EQ(post->getStatusCode(), k500InternalServerError);
	EXPECT_EQ(body_of(post), "template error");

	// 校验和查找先于模板：即使模板缺失，坏 slug 仍是 400
	EXPECT_EQ(blog_post(site.cfg, site.catalog, "../x")->getStatusCode(), k400BadRequest);
	EXPECT_EQ(blog_post(site.cfg, site.catalog, "gone")->getStatusCode(), k404NotFound);
}

TEST(Handlers, PagesAnswer200)
{
	SiteFixture site;
	site.add_templates();
	EXPECT_EQ(body_of(landing_page(site.cfg)), "<h1>jambonne</h1>");
	EXPECT_EQ(cv_page(site.cfg)->getStatusCode(), k200OK);

	auto blog = blog_index(site.cfg, site.catalog);
	EXPECT_EQ(blog->getStatusCode(), k200OK);
	EXPECT_NE(body_of(blog).find("<a href=\"/blog/hello\">Hello World</a>"), std::string::npos);

	auto reading = reading_page(site.cfg, ReadingList{});
	EXPECT_EQ(reading->getStatusCode(), k200OK);
	EXPECT_EQ(body_of(reading), "<p class=\"error\">No reading list items found</p>");
}

TEST(Handlers, JsonEndpoints)
{
	ReadingList list;
	list.source = "file";
	list.items = { ReadingItem{ "A", "https://a.example", "2024-01-01T00:00:00.000Z" } };

	Json::Value doc;
	std::string errs;
	ASSERT_TRUE(parse_json_loose(body_of(reading_list_api(list)), doc, errs));
	EXPECT_EQ(doc["total_count"].asUInt64(), 1u);
	EXPECT_EQ(doc["entries"][0]["url"].asString(), "https://a.example");

	ASSERT_TRUE(parse_json_loose(body_of(mindmap_api(list)), doc, errs));
	EXPECT_EQ(doc["reading"]["nodes"][0]["id"].asString(), "0");

	ASSERT_TRUE(parse_json_loose(body_of(mindmap_api(ReadingList{})), doc, errs));
	EXPECT_TRUE(doc["reading"].isNull());
}
