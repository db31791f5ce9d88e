#pragma once

#include "post_catalog.h"
#include "reading_list.h"
#include "site_config.h"

#include <drogon/HttpResponse.h>

#include <string>

namespace homepage
{

// PostStatus -> HTTP：InvalidSlug 400，NotFound 404
drogon::HttpStatusCode status_for(PostStatus s);

drogon::HttpResponsePtr html_response(std::string body);
drogon::HttpResponsePtr text_response(drogon::HttpStatusCode code, const std::string& body);
drogon::HttpResponsePtr json_response(const Json::Value& v);

// 各路由的响应；模板缺失或不可读时 500
drogon::HttpResponsePtr landing_page(const SiteConfig& cfg);
drogon::HttpResponsePtr cv_page(const SiteConfig& cfg);
drogon::HttpResponsePtr blog_index(const SiteConfig& cfg, const PostCatalog& catalog);
drogon::HttpResponsePtr blog_post(const SiteConfig& cfg, const PostCatalog& catalog, const std::string& slug);
drogon::HttpResponsePtr reading_page(const SiteConfig& cfg, const ReadingList& list);
drogon::HttpResponsePtr reading_list_api(const ReadingList& list);
drogon::HttpResponsePtr mindmap_api(const ReadingList& list);

} // namespace homepage
