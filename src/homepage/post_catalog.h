#pragma once

#include "markdown.h"

#include <filesystem>
#include <string>
#include <vector>

namespace homepage
{

struct PostMeta
{
	std::string slug;    // 文件名去掉 .md
	std::string title;   // 首行去掉 '#'
};

struct RenderedPost
{
	std::string title;
	std::string html;
	std::string toc_html;
};

enum class PostStatus
{
	Ok,
	InvalidSlug,   // 不符合 [A-Za-z0-9_-]{1,128}，不会碰文件系统
	NotFound,
};

const char* to_string(PostStatus s);

// 只允许 A-Za-z0-9_-，长度 1..128
bool is_valid_slug(const std::string& slug);

// 首行 -> 标题；其余行 -> 正文
void split_post_source(const std::string& raw, std::string& title, std::string& body);

/// Markdown posts found in the first existing directory of an ordered list of
/// candidate roots. Holds no state besides the roots; every call rescans disk,
/// so a single instance can be shared by all request threads.
class PostCatalog
{
public:
	explicit PostCatalog(std::vector<std::filesystem::path> roots, MarkdownOptions options = {});

	/// Slug-descending listing of the first root that exists. Missing or
	/// unreadable roots give an empty list.
	std::vector<PostMeta> list_posts() const;

	/// Validates the slug, then resolves `{slug}.md` against each root in order.
	/// `out` is only written on PostStatus::Ok.
	PostStatus get_post(const std::string& slug, RenderedPost& out) const;

	const std::vector<std::filesystem::path>& roots() const { return roots_; }

private:
	std::vector<std::filesystem::path> roots_;
	MarkdownOptions options_;
};

} // namespace homepage
