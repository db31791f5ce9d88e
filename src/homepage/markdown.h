#pragma once

#include <string>

namespace homepage
{

struct MarkdownOptions
{
	bool allow_raw_html{ false };   // false: 源文中的 HTML 块/行内标签按文本转义输出
};

struct RenderedMarkdown
{
	std::string html;       // 正文 HTML（标题已补 id）
	std::string toc_html;   // 目录；没有标题时为空
};

// Markdown -> HTML (md4c)，附带脚注、代码块 class 兜底、标题锚点和目录
// 脚注：[^id] 引用 + 行首 "[^id]: 文本" 定义，定义汇总到文末 <section class="footnotes">
RenderedMarkdown render_markdown(const std::string& md, const MarkdownOptions& options = {});

} // namespace homepage
