#pragma once

#include <json/json.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace homepage
{

struct ReadingItem
{
	std::string title;
	std::string url;
	std::string date_added;   // ISO-8601
};

using ReadingItems = std::vector<ReadingItem>;

/// The reading list as loaded at startup. Never modified after publication.
struct ReadingList
{
	std::string source;   // 来源名（file/bookmarks/remote/none）
	bool available{ true };
	std::string error;    // available == false 时的原因
	ReadingItems items;
};

using ReadingListPtr = std::shared_ptr<const ReadingList>;

/// One backend for the reading list. fetch() is called exactly once per
/// process; returning false means the source is unavailable and `error`
/// says why.
class ReadingSource
{
public:
	virtual ~ReadingSource() = default;
	virtual std::string name() const = 0;
	virtual bool fetch(ReadingItems& items, std::string& error) = 0;
};

// 本地 JSON 文件：[{title, url, date_added}, ...]
class JsonFileSource : public ReadingSource
{
public:
	explicit JsonFileSource(std::filesystem::path path) : path_(std::move(path)) {}
	std::string name() const override { return "file"; }
	bool fetch(ReadingItems& items, std::string& error) override;

private:
	std::filesystem::path path_;
};

// Safari Bookmarks.plist 里的 com.apple.ReadingList 容器
class BookmarkStoreSource : public ReadingSource
{
public:
	explicit BookmarkStoreSource(std::filesystem::path path) : path_(std::move(path)) {}
	std::string name() const override { return "bookmarks"; }
	bool fetch(ReadingItems& items, std::string& error) override;

private:
	std::filesystem::path path_;
};

// mindmap 服务的 /api/reading-list
class RemoteSource : public ReadingSource
{
public:
	explicit RemoteSource(std::string url, double timeoutSec = 10.0)
		: url_(std::move(url)), timeoutSec_(timeoutSec) {}
	std::string name() const override { return "remote"; }
	bool fetch(ReadingItems& items, std::string& error) override;

private:
	std::string url_;
	double timeoutSec_;
};

// "http://host:port/path?q" -> ("http://host:port", "/path?q")；没有路径时为 "/"
void split_url(const std::string& url, std::string& host, std::string& path);

class EmptySource : public ReadingSource
{
public:
	std::string name() const override { return "none"; }
	bool fetch(ReadingItems& items, std::string&) override { items.clear(); return true; }
};

extern const char* const kReadingListSentinel;   // "com.apple.ReadingList"
extern const char* const kNoReadingItems;        // "No reading list items found"

// 书签树（plist 转出的 Json::Value）-> 阅读列表；结构不对返回 false
bool extract_reading_list(const Json::Value& root, ReadingItems& items, std::string& error);

bool parse_json_loose(const std::string& s, Json::Value& out, std::string& errs);

// [{title,url,date_added}] 或 {entries:[...]}；任何一条不合法都算整体失败
bool parse_reading_items(const Json::Value& doc, ReadingItems& items, std::string& error);

/// Runs the source once and publishes the result. Failures are logged here and
/// degrade to an empty list; nothing is thrown.
ReadingListPtr load_reading_list(ReadingSource& source);

// ===== 视图（mind map 兼容结构） =====

struct MindMapNode
{
	std::string id;
	std::string title;
	std::string url;
	std::string date_added;
	int cluster{ 0 };
	double x{ 0.0 };
	double y{ 0.0 };
	std::vector<std::string> keywords;
	std::string content_preview;
};

struct ReadingData
{
	std::string id;
	std::vector<MindMapNode> nodes;
	Json::Value metadata{ Json::objectValue };
	std::string created_at;
};

struct ReadingListView
{
	bool has_data{ false };
	std::string error;
	ReadingData data;
};

ReadingListView build_view(const ReadingList& list);

// 视图 -> mind map JSON（edges/clusters 恒为空数组；无数据时 reading 为 null）
Json::Value to_json(const ReadingListView& view);
Json::Value to_json(const ReadingList& list);

} // namespace homepage
