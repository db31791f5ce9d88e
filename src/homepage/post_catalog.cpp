#include "post_catalog.h"
#include "text_util.h"

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <regex>

namespace fs = std::filesystem;

namespace homepage
{

const char* to_string(PostStatus s)
{
	switch (s)
	{
	case PostStatus::Ok: return "ok";
	case PostStatus::InvalidSlug: return "invalid slug";
	case PostStatus::NotFound: return "not found";
	}
	return "unknown";
}

bool is_valid_slug(const std::string& slug)
{
	static const std::regex re("^[A-Za-z0-9_-]{1,128}$");
	return std::regex_match(slug, re);
}

void split_post_source(const std::string& raw, std::string& title, std::string& body)
{
	std::string src = raw;
	strip_utf8_bom(src);
	src = to_lf(src);

	size_t nl = src.find('\n');
	std::string first = nl == std::string::npos ? src : src.substr(0, nl);
	body = nl == std::string::npos ? std::string() : src.substr(nl + 1);

	size_t i = 0;
	while (i < first.size() && first[i] == '#') ++i;
	title = trim(first.substr(i));
	if (title.empty()) title = "Untitled";
}

PostCatalog::PostCatalog(std::vector<fs::path> roots, MarkdownOptions options)
	: roots_(std::move(roots)), options_(options)
{
}

std::vector<PostMeta> PostCatalog::list_posts() const
{
	std::vector<PostMeta> posts;

	for (const auto& root : roots_)
	{
		std::error_code ec;
		fs::directory_iterator it(root, ec);
		if (ec) continue;   // 目录不存在/不可读：换下一个候选

		for (fs::directory_iterator end; it != end; it.increment(ec))
		{
			const auto& e = *it;
			std::error_code fec;
			if (!e.is_regular_file(fec)) continue;
			if (e.path().extension() != ".md") continue;

			PostMeta meta;
			meta.slug = e.path().stem().string();

			std::string raw, body;
			if (!read_text_file(e.path(), raw))
				LOG_WARN << "cannot read " << e.path();
			split_post_source(raw, meta.title, body);
			posts.push_back(std::move(meta));
		}
		if (ec)
			LOG_WARN << "error while scanning " << root << ": " << ec.message();
		break; // 找到目录即停止，不合并
	}

	std::sort(posts.begin(), posts.end(),
		[](const PostMeta& a, const PostMeta& b) { return a.slug > b.slug; });
	return posts;
}

PostStatus PostCatalog::get_post(const std::string& slug, RenderedPost& out) const
{
	// 先校验再拼路径：挡住 ../ 和 /
	if (!is_valid_slug(slug))
		return PostStatus::InvalidSlug;

	for (const auto& root : roots_)
	{
		const fs::path p = root / (slug + ".md");
		std::error_code ec;
		if (!fs::is_regular_file(p, ec)) continue;

		std::string raw;
		if (!read_text_file(p, raw))
		{
			LOG_ERROR << "post exists but cannot be read: " << p;
			return PostStatus::NotFound;
		}

		std::string body;
		split_post_source(raw, out.title, body);
		RenderedMarkdown md = render_markdown(body, options_);
		out.html = std::move(md.html);
		out.toc_html = std::move(md.toc_html);
		return PostStatus::Ok;
	}
	return PostStatus::NotFound;
}

} // namespace homepage
