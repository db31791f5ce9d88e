#pragma once

#include "post_catalog.h"
#include "reading_list.h"
#include "site_config.h"

#include <json/json.h>

#include <string>
#include <vector>

namespace homepage
{

// 读 templatesDir/name；失败返回 false
bool load_template(const SiteConfig& cfg, const std::string& name, std::string& out);

// {{SITENAME}} {{SITE_SUBTITLE}} {{AUTHOR_NAME}} {{AUTHOR_DESC}} {{YEAR}}
void fill_site_fields(std::string& html, const SiteConfig& cfg);

std::string render_static_page(std::string tpl, const SiteConfig& cfg);
std::string render_blog_index(std::string tpl, const SiteConfig& cfg, const std::vector<PostMeta>& posts);
std::string render_article(std::string tpl, const SiteConfig& cfg, const RenderedPost& post);
std::string render_reading(std::string tpl, const SiteConfig& cfg, const ReadingListView& view);

// 紧凑 JSON，"</" 写成 "<\/"，可以直接嵌进 <script>
std::string script_safe_json(const Json::Value& v);

} // namespace homepage
