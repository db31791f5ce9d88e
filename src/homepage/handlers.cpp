#include "handlers.h"
#include "pages.h"

#include <trantor/utils/Logger.h>

#include <filesystem>

using namespace drogon;

namespace homepage
{

HttpStatusCode status_for(PostStatus s)
{
	switch (s)
	{
	case PostStatus::Ok: return k200OK;
	case PostStatus::InvalidSlug: return k400BadRequest;
	case PostStatus::NotFound: return k404NotFound;
	}
	return k500InternalServerError;
}

HttpResponsePtr html_response(std::string body)
{
	auto r = HttpResponse::newHttpResponse();
	r->setStatusCode(k200OK);
	r->setContentTypeString("text/html; charset=utf-8");
	r->setBody(std::move(body));
	return r;
}

HttpResponsePtr text_response(HttpStatusCode code, const std::string& body)
{
	auto r = HttpResponse::newHttpResponse();
	r->setStatusCode(code);
	r->setContentTypeCode(CT_TEXT_PLAIN);
	r->setBody(body);
	return r;
}

HttpResponsePtr json_response(const Json::Value& v)
{
	Json::StreamWriterBuilder builder;
	builder["emitUTF8"] = true;
	auto r = HttpResponse::newHttpResponse();
	r->setStatusCode(k200OK);
	r->setContentTypeString("application/json; charset=utf-8");
	r->setBody(Json::writeString(builder, v));
	return r;
}

static HttpResponsePtr template_error(const SiteConfig& cfg, const std::string& name)
{
	LOG_ERROR << "template missing or unreadable: " << (std::filesystem::path(cfg.templatesDir) / name).string();
	return text_response(k500InternalServerError, "template error");
}

static HttpResponsePtr static_page(const SiteConfig& cfg, const std::string& name)
{
	std::string tpl;
	if (!load_template(cfg, name, tpl)) return template_error(cfg, name);
	return html_response(render_static_page(std::move(tpl), cfg));
}

HttpResponsePtr landing_page(const SiteConfig& cfg)
{
	LOG_INFO << "Handling landing page request";
	return static_page(cfg, "index.html");
}

HttpResponsePtr cv_page(const SiteConfig& cfg)
{
	LOG_INFO << "Handling CV page request";
	return static_page(cfg, "cv.html");
}

HttpResponsePtr blog_index(const SiteConfig& cfg, const PostCatalog& catalog)
{
	LOG_INFO << "Handling blog page request";
	std::string tpl;
	if (!load_template(cfg, "blog.html", tpl)) return template_error(cfg, "blog.html");
	return html_response(render_blog_index(std::move(tpl), cfg, catalog.list_posts()));
}

HttpResponsePtr blog_post(const SiteConfig& cfg, const PostCatalog& catalog, const std::string& slug)
{
	LOG_INFO << "Handling blog post request: " << slug;
	RenderedPost post;
	const PostStatus st = catalog.get_post(slug, post);
	if (st != PostStatus::Ok)
	{
		if (st == PostStatus::InvalidSlug) LOG_WARN << "rejected slug: " << slug;
		return text_response(status_for(st), to_string(st));
	}

	std::string tpl;
	if (!load_template(cfg, "article.html", tpl)) return template_error(cfg, "article.html");
	return html_response(render_article(std::move(tpl), cfg, post));
}

HttpResponsePtr reading_page(const SiteConfig& cfg, const ReadingList& list)
{
	LOG_INFO << "Handling reading list page request";
	std::string tpl;
	if (!load_template(cfg, "reading.html", tpl)) return template_error(cfg, "reading.html");
	return html_response(render_reading(std::move(tpl), cfg, build_view(list)));
}

HttpResponsePtr reading_list_api(const ReadingList& list)
{
	return json_response(to_json(list));
}

HttpResponsePtr mindmap_api(const ReadingList& list)
{
	return json_response(to_json(build_view(list)));
}

} // namespace homepage
