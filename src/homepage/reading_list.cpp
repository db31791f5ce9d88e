#include "reading_list.h"
#include "plist.h"
#include "text_util.h"

#include <trantor/utils/Logger.h>

namespace homepage
{

const char* const kReadingListSentinel = "com.apple.ReadingList";
const char* const kNoReadingItems = "No reading list items found";

bool parse_json_loose(const std::string& s, Json::Value& out, std::string& errs)
{
	Json::CharReaderBuilder b; b["collectComments"] = false;
	std::unique_ptr<Json::CharReader> r(b.newCharReader());
	return r->parse(s.data(), s.data() + s.size(), &out, &errs);
}

bool parse_reading_items(const Json::Value& doc, ReadingItems& items, std::string& error)
{
	// mindmap 服务返回 {entries: [...], total_count}，导出文件是裸数组
	const Json::Value* arr = &doc;
	if (doc.isObject() && doc.isMember("entries"))
		arr = &doc["entries"];
	if (!arr->isArray())
	{
		error = "reading list is not a JSON array";
		return false;
	}

	ReadingItems out;
	out.reserve(arr->size());
	Json::ArrayIndex i = 0;
	for (const auto& rec : *arr)
	{
		if (!rec.isObject())
		{
			error = "entry " + std::to_string(i) + " is not an object";
			return false;
		}
		for (const char* key : { "title", "url", "date_added" })
		{
			if (!rec.isMember(key) || !rec[key].isString())
			{
				error = "entry " + std::to_string(i) + ": missing string field '" + key + "'";
				return false;
			}
		}
		out.push_back(ReadingItem{ rec["title"].asString(), rec["url"].asString(), rec["date_added"].asString() });
		++i;
	}
	items.swap(out);
	return true;
}

bool JsonFileSource::fetch(ReadingItems& items, std::string& error)
{
	std::string body;
	if (!read_text_file(path_, body))
	{
		error = "cannot open " + path_.string();
		return false;
	}
	Json::Value doc;
	std::string errs;
	if (!parse_json_loose(body, doc, errs))
	{
		error = "malformed JSON in " + path_.string() + ": " + trim(errs);
		return false;
	}
	return parse_reading_items(doc, items, error);
}

bool extract_reading_list(const Json::Value& root, ReadingItems& items, std::string& error)
{
	if (!root.isObject())
	{
		error = "bookmark store root is not a dictionary";
		return false;
	}
	const Json::Value& children = root["Children"];
	if (!children.isArray())
	{
		error = "no Children found in bookmark store";
		return false;
	}

	ReadingItems out;
	for (const auto& child : children)
	{
		if (!child.isObject()) continue;
		const Json::Value& title = child["Title"];
		if (!title.isString() || title.asString() != kReadingListSentinel) continue;

		const Json::Value& entries = child["Children"];
		if (entries.isArray())
		{
			for (const auto& entry : entries)
			{
				if (!entry.isObject()) continue;

				ReadingItem it;
				const Json::Value& url = entry["URLString"];
				it.url = url.isString() ? url.asString() : "No URL";

				const Json::Value& uri = entry["URIDictionary"];
				if (uri.isObject() && uri["title"].isString())
					it.title = uri["title"].asString();
				else
					it.title = it.url;

				const Json::Value& added = entry["DateAdded"];
				it.date_added = added.isString() ? added.asString() : now_iso_z();

				out.push_back(std::move(it));
			}
		}
		break;
	}
	items.swap(out);
	return true;
}

bool BookmarkStoreSource::fetch(ReadingItems& items, std::string& error)
{
	std::error_code ec;
	if (!std::filesystem::exists(path_, ec))
	{
		error = "bookmark store not found at " + path_.string();
		return false;
	}
	try
	{
		return extract_reading_list(parse_plist_file(path_), items, error);
	}
	catch (const std::exception& e)
	{
		error = std::string("error reading bookmark store: ") + e.what();
		return false;
	}
}

ReadingListPtr load_reading_list(ReadingSource& source)
{
	auto list = std::make_shared<ReadingList>();
	list->source = source.name();

	std::string error;
	bool ok = false;
	try
	{
		ok = source.fetch(list->items, error);
	}
	catch (const std::exception& e)
	{
		error = e.what();
	}

	if (!ok)
	{
		LOG_ERROR << "Failed to load reading list (" << list->source << "): " << error;
		list->available = false;
		list->error = error;
		list->items.clear();
	}
	else
	{
		LOG_INFO << "Reading list loaded from " << list->source << ": " << list->items.size() << " items";
	}
	return list;
}

ReadingListView build_view(const ReadingList& list)
{
	ReadingListView view;
	if (list.items.empty())
	{
		view.error = kNoReadingItems;
		return view;
	}

	view.has_data = true;
	view.data.id = "reading-list";
	view.data.nodes.reserve(list.items.size());
	for (size_t i = 0; i < list.items.size(); ++i)
	{
		const ReadingItem& it = list.items[i];
		MindMapNode n;
		n.id = std::to_string(i);
		n.title = it.title;
		n.url = it.url;
		n.date_added = it.date_added;
		view.data.nodes.push_back(std::move(n));
	}
	view.data.metadata["source"] = list.source;
	view.data.metadata["total_count"] = (Json::UInt64)list.items.size();
	view.data.created_at = now_iso_z();
	return view;
}

Json::Value to_json(const ReadingListView& view)
{
	Json::Value root(Json::objectValue);
	if (!view.has_data)
	{
		root["reading"] = Json::Value(Json::nullValue);
		root["error"] = view.error;
		return root;
	}

	const ReadingData& d = view.data;
	Json::Value reading(Json::objectValue);
	reading["id"] = d.id;

	Json::Value nodes(Json::arrayValue);
	for (const auto& n : d.nodes)
	{
		Json::Value j(Json::objectValue);
		j["id"] = n.id;
		j["title"] = n.title;
		j["url"] = n.url;
		j["date_added"] = n.date_added;
		j["cluster"] = n.cluster;
		j["position"]["x"] = n.x;
		j["position"]["y"] = n.y;
		j["keywords"] = Json::Value(Json::arrayValue);
		for (const auto& k : n.keywords) j["keywords"].append(k);
		j["content_preview"] = n.content_preview;
		nodes.append(j);
	}
	reading["nodes"] = nodes;
	reading["edges"] = Json::Value(Json::arrayValue);
	reading["clusters"] = Json::Value(Json::arrayValue);
	reading["metadata"] = d.metadata;
	reading["created_at"] = d.created_at;

	root["reading"] = reading;
	root["error"] = Json::Value(Json::nullValue);
	return root;
}

Json::Value to_json(const ReadingList& list)
{
	Json::Value root(Json::objectValue);
	Json::Value entries(Json::arrayValue);
	for (const auto& it : list.items)
	{
		Json::Value e(Json::objectValue);
		e["title"] = it.title;
		e["url"] = it.url;
		e["date_added"] = it.date_added;
		entries.append(e);
	}
	root["entries"] = entries;
	root["total_count"] = (Json::UInt64)list.items.size();
	return root;
}

} // namespace homepage
