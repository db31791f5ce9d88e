#include "markdown.h"
#include "text_util.h"

#include <md4c-html.h>
#include <trantor/utils/Logger.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace homepage
{

// 脚注引用在 md4c 渲染期间的占位符：\x1F<编号>\x1F
static const char kFootnoteMark = '\x1F';

static void md4c_out(const MD_CHAR* data, MD_SIZE size, void* ud)
{
	auto* out = static_cast<std::string*>(ud);
	out->append(data, size);
}

static unsigned parser_flags(const MarkdownOptions& options)
{
	unsigned pf = MD_FLAG_TABLES
		| MD_FLAG_STRIKETHROUGH
		| MD_FLAG_TASKLISTS
		| MD_FLAG_PERMISSIVEAUTOLINKS
		| MD_FLAG_LATEXMATHSPANS;
	if (!options.allow_raw_html)
		pf |= MD_FLAG_NOHTML;
	return pf;
}

static bool md_to_html(const std::string& md, const MarkdownOptions& options, std::string& out)
{
	return md_html(md.c_str(), (MD_SIZE)md.size(), md4c_out, &out, parser_flags(options), MD_HTML_FLAG_SKIP_UTF8_BOM) == 0;
}

// ================== 脚注 ==================

struct Footnotes
{
	std::unordered_map<std::string, std::string> defs;   // id -> 定义（Markdown）
	std::vector<std::string> defOrder;                   // 定义出现顺序
	std::vector<std::string> refOrder;                   // 首次引用顺序，下标+1 即编号
	std::unordered_map<std::string, size_t> number;
};

static size_t indent_of(const std::string& line)
{
	size_t n = 0;
	for (char c : line)
	{
		if (c == ' ') ++n;
		else if (c == '\t') n += 4;
		else break;
	}
	return n;
}

static bool is_blank(const std::string& line)
{
	return line.find_first_not_of(" \t") == std::string::npos;
}

// ``` / ~~~ 围栏；返回围栏字符和长度
static bool fence_of(const std::string& line, char& ch, size_t& len)
{
	size_t i = 0;
	while (i < line.size() && i < 3 && line[i] == ' ') ++i;
	if (i >= line.size() || (line[i] != '`' && line[i] != '~')) return false;
	ch = line[i];
	len = 0;
	while (i + len < line.size() && line[i + len] == ch) ++len;
	return len >= 3;
}

// "[^id]: text"（最多 3 个前导空格）
static bool footnote_def(const std::string& line, std::string& id, std::string& text)
{
	size_t i = 0;
	while (i < line.size() && i < 3 && line[i] == ' ') ++i;
	if (line.compare(i, 2, "[^") != 0) return false;
	size_t close = line.find(']', i + 2);
	if (close == std::string::npos || close == i + 2) return false;
	if (close + 1 >= line.size() || line[close + 1] != ':') return false;
	id = line.substr(i + 2, close - i - 2);
	if (id.find_first_of(" \t[") != std::string::npos) return false;
	text = trim(line.substr(close + 2));
	return true;
}

// 正文行里的 [^id] -> 占位符；跳过行内代码
static std::string mark_refs(const std::string& line, Footnotes& fn)
{
	std::string out; out.reserve(line.size());
	size_t i = 0;
	while (i < line.size())
	{
		if (line[i] == '`')
		{
			size_t run = 0;
			while (i + run < line.size() && line[i + run] == '`') ++run;
			const std::string ticks(run, '`');
			size_t end = line.find(ticks, i + run);
			// 找到同长度的收尾反引号才算代码段
			while (end != std::string::npos && end + run < line.size() && line[end + run] == '`')
				end = line.find(ticks, end + run + 1);
			size_t stop = end == std::string::npos ? i + run : end + run;
			out.append(line, i, stop - i);
			i = stop;
			continue;
		}
		if (line.compare(i, 2, "[^") == 0)
		{
			size_t close = line.find(']', i + 2);
			if (close != std::string::npos && close > i + 2)
			{
				std::string id = line.substr(i + 2, close - i - 2);
				if (id.find_first_of(" \t[") == std::string::npos && fn.defs.count(id))
				{
					auto it = fn.number.find(id);
					if (it == fn.number.end())
					{
						fn.refOrder.push_back(id);
						it = fn.number.emplace(id, fn.refOrder.size()).first;
					}
					out += kFootnoteMark;
					out += std::to_string(it->second);
					out += kFootnoteMark;
					i = close + 1;
					continue;
				}
			}
		}
		out.push_back(line[i++]);
	}
	return out;
}

// 取出脚注定义，正文中的引用换成占位符
static std::string extract_footnotes(const std::string& md, Footnotes& fn)
{
	enum class Kind { Text, Code, Removed };
	std::vector<std::pair<std::string, Kind>> lines;

	bool inFence = false;
	char fenceCh = 0;
	size_t fenceLen = 0;
	bool prevBlank = true, prevIndentCode = false;
	std::string currentDef;

	size_t start = 0;
	while (start <= md.size())
	{
		size_t nl = md.find('\n', start);
		std::string line = md.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
		start = nl == std::string::npos ? md.size() + 1 : nl + 1;

		if (inFence)
		{
			char ch; size_t len;
			if (fence_of(line, ch, len) && ch == fenceCh && len >= fenceLen && is_blank(line.substr(line.find(ch) + len)))
				inFence = false;
			lines.emplace_back(line, Kind::Code);
			continue;
		}

		if (!currentDef.empty())
		{
			if (is_blank(line))
			{
				fn.defs[currentDef] += "\n";
				lines.emplace_back(std::string(), Kind::Removed);
				continue;
			}
			if (indent_of(line) >= 4)
			{
				size_t cut = line[0] == '\t' ? 1 : std::min<size_t>(4, line.find_first_not_of(' '));
				fn.defs[currentDef] += "\n" + line.substr(cut);
				lines.emplace_back(std::string(), Kind::Removed);
				continue;
			}
			currentDef.clear();
		}

		std::string id, text;
		if (fence_of(line, fenceCh, fenceLen))
		{
			inFence = true;
			lines.emplace_back(line, Kind::Code);
		}
		else if (footnote_def(line, id, text))
		{
			if (!fn.defs.count(id))
			{
				fn.defs.emplace(id, text);
				fn.defOrder.push_back(id);
				currentDef = id;
			}
			lines.emplace_back(std::string(), Kind::Removed);
		}
		else if (indent_of(line) >= 4 && (prevBlank || prevIndentCode) && !is_blank(line))
		{
			lines.emplace_back(line, Kind::Code);
			prevIndentCode = true;
			prevBlank = false;
			continue;
		}
		else
		{
			lines.emplace_back(line, Kind::Text);
		}
		prevBlank = is_blank(line);
		prevIndentCode = false;
	}

	std::string out; out.reserve(md.size());
	bool first = true;
	for (auto& l : lines)
	{
		if (l.second == Kind::Removed) continue;
		if (!first) out.push_back('\n');
		first = false;
		out += l.second == Kind::Text && !fn.defs.empty() ? mark_refs(l.first, fn) : l.first;
	}
	return out;
}

// 占位符 -> <sup> 链接；落在标签属性里的还原成字面文本
static void link_footnote_refs(std::string& html, const Footnotes& fn)
{
	if (fn.refOrder.empty()) return;

	std::vector<bool> seen(fn.refOrder.size() + 1, false);
	std::string out; out.reserve(html.size() + fn.refOrder.size() * 80);
	bool inTag = false;
	for (size_t i = 0; i < html.size(); ++i)
	{
		char c = html[i];
		if (c == '<') inTag = true;
		else if (c == '>') inTag = false;

		if (c != kFootnoteMark)
		{
			out.push_back(c);
			continue;
		}
		size_t end = html.find(kFootnoteMark, i + 1);
		if (end == std::string::npos)
		{
			out.append(html, i + 1, std::string::npos);
			break;
		}
		size_t n = 0;
		try { n = std::stoul(html.substr(i + 1, end - i - 1)); }
		catch (const std::exception&) { n = 0; }
		i = end;
		if (n == 0 || n > fn.refOrder.size()) continue;

		const std::string id = html_escape(fn.refOrder[n - 1]);
		if (inTag)
		{
			out += "[^" + id + "]";
			continue;
		}
		out += "<sup class=\"footnote-ref\"><a href=\"#fn-" + id + "\"";
		if (!seen[n]) out += " id=\"fnref-" + id + "\"";
		seen[n] = true;
		out += ">" + std::to_string(n) + "</a></sup>";
	}
	html.swap(out);
}

static std::string footnote_section(const Footnotes& fn, const MarkdownOptions& options)
{
	if (fn.defOrder.empty()) return std::string();

	// 先按引用编号，再补上没被引用的定义
	std::vector<std::string> order = fn.refOrder;
	for (const auto& id : fn.defOrder)
		if (!fn.number.count(id)) order.push_back(id);

	std::string out = "<section class=\"footnotes\">\n<ol>\n";
	for (const auto& rawId : order)
	{
		const std::string id = html_escape(rawId);
		std::string body;
		if (!md_to_html(fn.defs.at(rawId), options, body))
			body = "<p>" + html_escape(fn.defs.at(rawId)) + "</p>\n";

		if (fn.number.count(rawId))
		{
			const std::string back = " <a href=\"#fnref-" + id + "\" class=\"footnote-backref\">&#8617;</a>";
			size_t p = body.rfind("</p>");
			if (p != std::string::npos) body.insert(p, back);
			else body += back;
		}
		out += "<li id=\"fn-" + id + "\">" + body + "</li>\n";
	}
	out += "</ol>\n</section>\n";
	return out;
}

// ================== HTML 后处理 ==================

// 给没有 class 的 <pre><code> 补上 language-plaintext
static void ensure_code_class(std::string& html)
{
	std::string out;
	out.reserve(html.size() + 64);

	size_t last = 0, pos = 0;
	while ((pos = html.find("<pre", pos)) != std::string::npos)
	{
		size_t preEnd = html.find('>', pos);
		if (preEnd == std::string::npos) break;
		size_t code = html.find_first_not_of(" \t\r\n", preEnd + 1);
		if (code == std::string::npos || html.compare(code, 5, "<code") != 0)
		{
			pos = preEnd + 1;
			continue;
		}
		size_t codeEnd = html.find('>', code);
		if (codeEnd == std::string::npos) break;
		if (html.find("class=", code) > codeEnd)
		{
			out.append(html, last, code + 5 - last);
			out += " class=\"language-plaintext\"";
			last = code + 5;
		}
		pos = codeEnd + 1;
	}
	out.append(html, last, std::string::npos);
	html.swap(out);
}

// 去标签取纯文本（实体保持原样）
static std::string strip_tags(const std::string& s)
{
	std::string out; out.reserve(s.size());
	bool inTag = false;
	for (char c : s)
	{
		if (c == '<') inTag = true;
		else if (c == '>') inTag = false;
		else if (!inTag) out.push_back(c);
	}
	return out;
}

// attrs 中 id="..." 的值
static bool find_id_attr(const std::string& attrs, std::string& id)
{
	size_t p = 0;
	while ((p = attrs.find("id=\"", p)) != std::string::npos)
	{
		if (p == 0 || attrs[p - 1] == ' ' || attrs[p - 1] == '\t' || attrs[p - 1] == '\n')
		{
			size_t end = attrs.find('"', p + 4);
			if (end == std::string::npos) return false;
			id = attrs.substr(p + 4, end - p - 4);
			return true;
		}
		p += 4;
	}
	return false;
}

struct TocItem { int level; std::string text; std::string id; };

// 给 <h1~h6> 补唯一 id，同时生成扁平编号目录
static void generate_toc(std::string& html, std::string& toc_html)
{
	std::vector<TocItem> items;
	std::unordered_set<std::string> assigned;
	std::unordered_map<std::string, int> nextSuffix;

	std::string out; out.reserve(html.size() + html.size() / 10);
	size_t last = 0, pos = 0;

	while ((pos = html.find("<h", pos)) != std::string::npos)
	{
		if (pos + 3 >= html.size() || html[pos + 2] < '1' || html[pos + 2] > '6' ||
			(html[pos + 3] != '>' && html[pos + 3] != ' '))
		{
			pos += 2;
			continue;
		}
		const int lvl = html[pos + 2] - '0';
		size_t openEnd = html.find('>', pos);
		const std::string closeTag = "</h" + std::to_string(lvl) + ">";
		size_t close = openEnd == std::string::npos ? std::string::npos : html.find(closeTag, openEnd);
		if (close == std::string::npos) break;

		std::string attrs = html.substr(pos + 3, openEnd - pos - 3);
		std::string inner = html.substr(openEnd + 1, close - openEnd - 1);
		std::string text = trim(strip_tags(inner));

		std::string id;
		if (find_id_attr(attrs, id))
		{
			assigned.insert(id);
		}
		else
		{
			const std::string base = slugify(text);
			id = base;
			int& n = nextSuffix[base];
			while (assigned.count(id))
				id = base + "-" + std::to_string(++n);
			assigned.insert(id);
			attrs += " id=\"" + id + "\"";
		}

		items.push_back(TocItem{ lvl, text, id });

		out.append(html, last, pos - last);
		out += "<h" + std::to_string(lvl) + attrs + ">";
		out += inner;
		out += closeTag;
		last = pos = close + closeTag.size();
	}
	out.append(html, last, std::string::npos);
	html.swap(out);

	if (items.empty()) { toc_html.clear(); return; }

	// 编号从最顶层（最小级别）开始
	int base = items[0].level;
	for (auto& it : items) if (it.level < base) base = it.level;

	int counters[7] = { 0 }; // 1..6 有效
	auto make_number = [&](int L)
		{
			counters[L]++;
			for (int j = L + 1; j <= 6; ++j)
				counters[j] = 0;

			std::string num;
			for (int j = base; j <= L; ++j)
			{
				if (counters[j] == 0) continue;
				if (!num.empty()) num.push_back('.');
				num += std::to_string(counters[j]);
			}
			return num + ".";
		};

	std::string toc; toc.reserve(items.size() * 80);
	toc += "<ol class=\"toc\">";
	for (auto& it : items)
	{
		toc += "<li class=\"toc-item toc-level-" + std::to_string(it.level) + "\">";
		toc += "<a class=\"toc-link\" href=\"#" + html_escape(it.id) + "\">";
		toc += "<span class=\"toc-number\">" + make_number(it.level) + "</span> ";
		toc += "<span class=\"toc-text\">" + it.text + "</span>";
		toc += "</a></li>";
	}
	toc += "</ol>";
	toc_html.swap(toc);
}

RenderedMarkdown render_markdown(const std::string& md, const MarkdownOptions& options)
{
	RenderedMarkdown r;

	std::string src = md;
	src.erase(std::remove(src.begin(), src.end(), kFootnoteMark), src.end());

	Footnotes fn;
	if (src.find("[^") != std::string::npos)
		src = extract_footnotes(src, fn);

	if (!md_to_html(src, options, r.html))
	{
		// 渲染失败降级为纯文本
		LOG_WARN << "markdown render failed, falling back to <pre> (" << md.size() << " bytes)";
		r.html = "<pre>" + html_escape(md) + "</pre>";
		return r;
	}

	link_footnote_refs(r.html, fn);
	r.html += footnote_section(fn, options);
	ensure_code_class(r.html);
	generate_toc(r.html, r.toc_html);
	return r;
}

} // namespace homepage
