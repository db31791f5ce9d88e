#include "pages.h"
#include "text_util.h"

#include <ctime>
#include <utility>
#include <vector>

namespace homepage
{

bool load_template(const SiteConfig& cfg, const std::string& name, std::string& out)
{
	return read_text_file(std::filesystem::path(cfg.templatesDir) / name, out);
}

static std::string current_year()
{
	return to_iso(std::time(nullptr)).substr(0, 4);
}

void fill_site_fields(std::string& html, const SiteConfig& cfg)
{
	replace_all(html, "{{SITENAME}}", html_escape(cfg.siteName));
	replace_all(html, "{{SITE_SUBTITLE}}", html_escape(cfg.siteSubtitle));
	replace_all(html, "{{AUTHOR_NAME}}", html_escape(cfg.author));
	replace_all(html, "{{AUTHOR_DESC}}", html_escape(cfg.authorDesc));
	replace_all(html, "{{YEAR}}", current_year());
}

using Fields = std::vector<std::pair<std::string, std::string>>;

// 一次扫描替换多个 {{KEY}}；已插入的值不再被扫描
static void fill_fields(std::string& tpl, const Fields& fields)
{
	std::string out; out.reserve(tpl.size());
	size_t last = 0, pos = 0;
	while ((pos = tpl.find("{{", pos)) != std::string::npos)
	{
		const std::pair<std::string, std::string>* hit = nullptr;
		for (const auto& f : fields)
		{
			if (tpl.compare(pos, f.first.size(), f.first) == 0) { hit = &f; break; }
		}
		if (!hit) { pos += 2; continue; }
		out.append(tpl, last, pos - last);
		out += hit->second;
		pos += hit->first.size();
		last = pos;
	}
	out.append(tpl, last, std::string::npos);
	tpl.swap(out);
}

std::string render_static_page(std::string tpl, const SiteConfig& cfg)
{
	fill_site_fields(tpl, cfg);
	return tpl;
}

std::string render_blog_index(std::string tpl, const SiteConfig& cfg, const std::vector<PostMeta>& posts)
{
	std::string list;
	if (posts.empty())
	{
		list = "<p class=\"empty\">No posts yet.</p>";
	}
	else
	{
		list += "<ul class=\"post-list\">";
		for (const auto& p : posts)
		{
			list += "<li><a href=\"/blog/" + html_escape(p.slug) + "\">" + html_escape(p.title) + "</a></li>";
		}
		list += "</ul>";
	}

	fill_site_fields(tpl, cfg);
	fill_fields(tpl, { { "{{COUNT_POSTS}}", std::to_string(posts.size()) }, { "{{POSTS_HTML}}", list } });
	return tpl;
}

std::string render_article(std::string tpl, const SiteConfig& cfg, const RenderedPost& post)
{
	fill_site_fields(tpl, cfg);
	// 目录和正文里出现的 {{...}} 保持原样
	fill_fields(tpl, {
		{ "{{TITLE}}", html_escape(post.title) },
		{ "{{TOC_HTML}}", post.toc_html },
		{ "{{CONTENT}}", post.html },
	});
	return tpl;
}

static bool is_web_url(const std::string& url)
{
	return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

std::string render_reading(std::string tpl, const SiteConfig& cfg, const ReadingListView& view)
{
	std::string items, error;
	if (!view.has_data)
	{
		error = "<p class=\"error\">" + html_escape(view.error) + "</p>";
	}
	else
	{
		items += "<ol class=\"reading-items\">";
		for (const auto& n : view.data.nodes)
		{
			items += "<li>";
			// 书签里可能有 javascript: 之类，只给 http(s) 生成链接
			if (is_web_url(n.url))
				items += "<a href=\"" + html_escape(n.url) + "\" rel=\"noopener noreferrer\">" + html_escape(n.title) + "</a>";
			else
				items += "<span>" + html_escape(n.title) + "</span>";
			if (!n.date_added.empty())
				items += " <time datetime=\"" + html_escape(n.date_added) + "\">" + html_escape(n.date_added.substr(0, 10)) + "</time>";
			items += "</li>";
		}
		items += "</ol>";
	}

	fill_site_fields(tpl, cfg);
	fill_fields(tpl, {
		{ "{{ERROR_HTML}}", error },
		{ "{{ITEMS_HTML}}", items },
		{ "{{READING_JSON}}", script_safe_json(to_json(view)) },
	});
	return tpl;
}

std::string script_safe_json(const Json::Value& v)
{
	Json::StreamWriterBuilder b;
	b["indentation"] = "";
	b["emitUTF8"] = true;
	std::string s = Json::writeString(b, v);
	replace_all(s, "</", "<\\/");
	return s;
}

} // namespace homepage
