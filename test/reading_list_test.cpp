#include "reading_list.h"
#include "bplist_builder.h"
#include "test_util.h"

#include <gtest/gtest.h>

#include <regex>

using namespace homepage;
using homepage::test::BplistBuilder;
using homepage::test::TempDir;

namespace
{

// 每次 fetch 都计数，用来确认只读一次
class CountingSource : public ReadingSource
{
public:
	CountingSource(bool ok, ReadingItems items) : ok_(ok), items_(std::move(items)) {}
	std::string name() const override { return "counting"; }
	bool fetch(ReadingItems& items, std::string& error) override
	{
		++calls;
		if (!ok_) { error = "backend down"; return false; }
		items = items_;
		return true;
	}
	int calls{ 0 };

private:
	bool ok_;
	ReadingItems items_;
};

class ThrowingSource : public ReadingSource
{
public:
	std::string name() const override { return "throwing"; }
	bool fetch(ReadingItems&, std::string&) override { throw std::runtime_error("boom"); }
};

const std::regex kIsoRe(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z$)");

} // namespace

TEST(JsonFileSource, ZeroEntriesGiveEmptyViewWithMessage)
{
	TempDir dir;
	JsonFileSource src(dir.write("reading_list.json", "[]"));
	auto list = load_reading_list(src);
	EXPECT_TRUE(list->available);
	EXPECT_TRUE(list->items.empty());

	auto view = build_view(*list);
	EXPECT_FALSE(view.has_data);
	EXPECT_EQ(view.error, "No reading list items found");
	EXPECT_TRUE(view.data.nodes.empty());
}

TEST(JsonFileSource, EntriesBecomeNumberedNodesInSourceOrder)
{
	TempDir dir;
	JsonFileSource src(dir.write("reading_list.json", R"([
		{"title": "Zeta", "url": "https://z.example", "date_added": "2024-03-01T00:00:00Z"},
		{"title": "Alpha", "url": "https://a.example", "date_added": "2023-01-01T00:00:00Z"},
		{"title": "Mid", "url": "https://m.example", "date_added": "2023-06-01T00:00:00Z"}
	])"));
	auto list = load_reading_list(src);
	ASSERT_EQ(list->items.size(), 3u);
	EXPECT_EQ(list->source, "file");

	auto view = build_view(*list);
	ASSERT_TRUE(view.has_data);
	EXPECT_TRUE(view.error.empty());
	ASSERT_EQ(view.data.nodes.size(), 3u);
	const char* titles[] = { "Zeta", "Alpha", "Mid" };
	for (size_t i = 0; i < 3; ++i)
	{
		const auto& n = view.data.nodes[i];
		EXPECT_EQ(n.id, std::to_string(i));
		EXPECT_EQ(n.title, titles[i]);
		EXPECT_EQ(n.cluster, 0);
		EXPECT_EQ(n.x, 0.0);
		EXPECT_EQ(n.y, 0.0);
		EXPECT_TRUE(n.keywords.empty());
		EXPECT_TRUE(n.content_preview.empty());
	}
	EXPECT_EQ(view.data.id, "reading-list");
	EXPECT_TRUE(std::regex_match(view.data.created_at, kIsoRe));
	EXPECT_EQ(view.data.metadata["total_count"].asUInt64(), 3u);
}

TEST(JsonFileSource, MissingFileDegradesToEmptyList)
{
	TempDir dir;
	JsonFileSource src(dir.path() / "absent.json");
	auto list = load_reading_list(src);
	EXPECT_FALSE(list->available);
	EXPECT_FALSE(list->error.empty());
	EXPECT_TRUE(list->items.empty());

	auto view = build_view(*list);
	EXPECT_FALSE(view.has_data);
	EXPECT_EQ(view.error, kNoReadingItems);
}

TEST(JsonFileSource, MalformedDocumentsAreUnavailable)
{
	TempDir dir;
	const char* bad[] = {
		"[{\"title\": \"x\"",                                       // 语法错误
		"{\"title\": \"x\", \"url\": \"u\", \"date_added\": \"d\"}", // 不是数组
		"[{\"title\": \"x\", \"url\": \"u\"}]",                     // 缺字段
		"[{\"title\": 1, \"url\": \"u\", \"date_added\": \"d\"}]",  // 类型不对
		"[\"just a string\"]",
	};
	for (const char* body : bad)
	{
		JsonFileSource src(dir.write("bad.json", body));
		ReadingItems items{ ReadingItem{ "keep", "keep", "keep" } };
		std::string error;
		EXPECT_FALSE(src.fetch(items, error)) << body;
		EXPECT_FALSE(error.empty()) << body;

		auto list = load_reading_list(src);
		EXPECT_TRUE(list->items.empty()) << body;
		EXPECT_FALSE(list->available) << body;
	}
}

TEST(ReadingItems, AcceptsServiceEnvelope)
{
	Json::Value doc;
	std::string errs;
	ASSERT_TRUE(parse_json_loose(R"({"entries": [{"title": "t", "url": "u", "date_added": "d"}], "total_count": 1})", doc, errs));
	ReadingItems items;
	std::string error;
	ASSERT_TRUE(parse_reading_items(doc, items, error));
	ASSERT_EQ(items.size(), 1u);
	EXPECT_EQ(items[0].url, "u");
}

TEST(ReadingListLoader, FetchesExactlyOnce)
{
	CountingSource src(true, { ReadingItem{ "t", "u", "d" } });
	auto list = load_reading_list(src);
	EXPECT_EQ(src.calls, 1);

	auto v1 = build_view(*list);
	auto v2 = build_view(*list);
	EXPECT_EQ(src.calls, 1);
	EXPECT_EQ(v1.data.nodes.size(), 1u);
	EXPECT_EQ(v2.data.nodes.size(), 1u);
	EXPECT_EQ(list->items.size(), 1u);
}

TEST(ReadingListLoader, FailuresNeverPropagate)
{
	CountingSource down(false, {});
	auto a = load_reading_list(down);
	EXPECT_FALSE(a->available);
	EXPECT_EQ(a->error, "backend down");

	ThrowingSource throwing;
	auto b = load_reading_list(throwing);
	EXPECT_FALSE(b->available);
	EXPECT_EQ(b->error, "boom");
	EXPECT_TRUE(b->items.empty());

	EmptySource none;
	auto c = load_reading_list(none);
	EXPECT_TRUE(c->available);
	EXPECT_TRUE(c->items.empty());
}

static const char* kBookmarksXml = R"(<?xml version="1.0" encoding="UTF-8"?>
<plist version="1.0">
<dict>
	<key>Children</key>
	<array>
		<dict>
			<key>Title</key>
			<string>BookmarksBar</string>
			<key>Children</key>
			<array>
				<dict><key>URLString</key><string>https://not-reading.example</string></dict>
			</array>
		</dict>
		<dict>
			<key>Title</key>
			<string>com.apple.ReadingList</string>
			<key>Children</key>
			<array>
				<dict>
					<key>URLString</key>
					<string>https://one.example/post</string>
					<key>URIDictionary</key>
					<dict><key>title</key><string>One</string></dict>
					<key>DateAdded</key>
					<date>2024-01-15T10:00:00Z</date>
				</dict>
				<dict>
					<key>URLString</key>
					<string>https://two.example/</string>
				</dict>
				<dict>
					<key>URIDictionary</key>
					<dict><key>title</key><string>No link</string></dict>
				</dict>
			</array>
		</dict>
	</array>
</dict>
</plist>
)";

TEST(BookmarkStoreSource, ExtractsReadingListContainerFromXml)
{
	TempDir dir;
	BookmarkStoreSource src(dir.write("Bookmarks.plist", kBookmarksXml));
	auto list = load_reading_list(src);
	ASSERT_TRUE(list->available);
	EXPECT_EQ(list->source, "bookmarks");
	ASSERT_EQ(list->items.size(), 3u);

	EXPECT_EQ(list->items[0].title, "One");
	EXPECT_EQ(list->items[0].url, "https://one.example/post");
	EXPECT_EQ(list->items[0].date_added, "2024-01-15T10:00:00.000Z");

	// 无标题 -> 用 URL；无日期 -> 当前时间
	EXPECT_EQ(list->items[1].title, "https://two.example/");
	EXPECT_TRUE(std::regex_match(list->items[1].date_added, kIsoRe));

	// 无 URL -> 占位
	EXPECT_EQ(list->items[2].url, "No URL");
	EXPECT_EQ(list->items[2].title, "No link");
}

TEST(BookmarkStoreSource, ExtractsReadingListContainerFromBinary)
{
	BplistBuilder b;
	auto kChildren = b.ascii("Children");
	auto kTitle = b.ascii("Title");
	auto kUrl = b.ascii("URLString");
	auto kUri = b.ascii("URIDictionary");
	auto kTitleLower = b.ascii("title");
	auto kDate = b.ascii("DateAdded");

	auto entry = b.dict({
		{ kUrl, b.ascii("https://bin.example/a") },
		{ kUri, b.dict({ { kTitleLower, b.utf16(u"Bin é") } }) },
		{ kDate, b.date(86400.0) },
	});
	auto container = b.dict({
		{ kTitle, b.ascii("com.apple.ReadingList") },
		{ kChildren, b.array({ entry }) },
	});
	auto root = b.dict({ { kChildren, b.array({ container }) } });

	TempDir dir;
	BookmarkStoreSource src(dir.write("Bookmarks.plist", b.build(root)));
	auto list = load_reading_list(src);
	ASSERT_TRUE(list->available) << list->error;
	ASSERT_EQ(list->items.size(), 1u);
	EXPECT_EQ(list->items[0].url, "https://bin.example/a");
	EXPECT_EQ(list->items[0].title, "Bin \xC3\xA9");
	EXPECT_EQ(list->items[0].date_added, "2001-01-02T00:00:00.000Z");
}

TEST(BookmarkStoreSource, StructuralFailures)
{
	TempDir dir;

	BookmarkStoreSource missing(dir.path() / "nope.plist");
	EXPECT_FALSE(load_reading_list(missing)->available);

	BookmarkStoreSource garbage(dir.write("garbage.plist", "bplist00 truncated"));
	EXPECT_FALSE(load_reading_list(garbage)->available);

	BookmarkStoreSource noChildren(dir.write("nochildren.plist",
		"<plist><dict><key>Title</key><string>x</string></dict></plist>"));
	EXPECT_FALSE(load_reading_list(noChildren)->available);

	BookmarkStoreSource arrayRoot(dir.write("array.plist", "<plist><array/></plist>"));
	EXPECT_FALSE(load_reading_list(arrayRoot)->available);

	// 有 Children 但没有阅读列表容器：可用但为空
	BookmarkStoreSource noSentinel(dir.write("nosentinel.plist",
		"<plist><dict><key>Children</key><array/></dict></plist>"));
	auto list = load_reading_list(noSentinel);
	EXPECT_TRUE(list->available);
	EXPECT_TRUE(list->items.empty());
}

TEST(ReadingListJson, ViewAndEntriesShapes)
{
	ReadingList list;
	list.source = "file";
	list.items = { ReadingItem{ "A", "https://a", "2024-01-01" }, ReadingItem{ "B", "https://b", "2024-01-02" } };

	Json::Value entries = to_json(list);
	EXPECT_EQ(entries["total_count"].asUInt64(), 2u);
	EXPECT_EQ(entries["entries"][1]["title"].asString(), "B");

	Json::Value doc = to_json(build_view(list));
	EXPECT_TRUE(doc["error"].isNull());
	const Json::Value& reading = doc["reading"];
	EXPECT_EQ(reading["id"].asString(), "reading-list");
	EXPECT_EQ(reading["nodes"].size(), 2u);
	EXPECT_EQ(reading["nodes"][1]["id"].asString(), "1");
	EXPECT_EQ(reading["nodes"][0]["position"]["x"].asDouble(), 0.0);
	EXPECT_TRUE(reading["edges"].isArray());
	EXPECT_EQ(reading["edges"].size(), 0u);
	EXPECT_TRUE(reading["clusters"].isArray());
	EXPECT_EQ(reading["clusters"].size(), 0u);
	EXPECT_EQ(reading["metadata"]["source"].asString(), "file");

	Json::Value empty = to_json(build_view(ReadingList{}));
	EXPECT_TRUE(empty["reading"].isNull());
	EXPECT_EQ(empty["error"].asString(), "No reading list items found");
}

TEST(BookmarkStoreSource, UnrepresentableDateFallsBackToNow)
{
	BplistBuilder b;
	auto kChildren = b.ascii("Children");
	auto kTitle = b.ascii("Title");
	auto kUrl = b.ascii("URLString");
	auto kDate = b.ascii("DateAdded");

	auto entry = b.dict({ { kUrl, b.ascii("https://far.example/") }, { kDate, b.date(1e300) } });
	auto container = b.dict({ { kTitle, b.ascii("com.apple.ReadingList") }, { kChildren, b.array({ entry }) } });
	auto root = b.dict({ { kChildren, b.array({ container }) } });

	TempDir dir;
	BookmarkStoreSource src(dir.write("Bookmarks.plist", b.build(root)));
	auto list = load_reading_list(src);
	ASSERT_TRUE(list->available) << list->error;
	ASSERT_EQ(list->items.size(), 1u);
	EXPECT_TRUE(std::regex_match(list->items[0].date_added, kIsoRe));
	EXPECT_NE(list->items[0].date_added.substr(0, 1), "-");
}
