#include "reading_list.h"

#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>

namespace homepage
{

// "http://host:port/path" -> ("http://host:port", "/path")
void split_url(const std::string& url, std::string& host, std::string& path)
{
	auto scheme = url.find("://");
	auto slash = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
	if (slash == std::string::npos)
	{
		host = url;
		path = "/";
	}
	else
	{
		host = url.substr(0, slash);
		path = url.substr(slash);
	}
}

bool RemoteSource::fetch(ReadingItems& items, std::string& error)
{
	std::string host, path;
	split_url(url_, host, path);

	// 启动阶段 app() 的事件循环还没跑，单独起一个给 client 用
	trantor::EventLoopThread loopThread("ReadingListFetch");
	loopThread.run();

	auto client = drogon::HttpClient::newHttpClient(host, loopThread.getLoop());
	auto req = drogon::HttpRequest::newHttpRequest();
	req->setMethod(drogon::Get);
	req->setPath(path);
	req->addHeader("Accept", "application/json");

	auto [result, resp] = client->sendRequest(req, timeoutSec_);
	if (result != drogon::ReqResult::Ok || !resp)
	{
		error = "request to " + url_ + " failed (ReqResult=" + std::to_string(static_cast<int>(result)) + ")";
		return false;
	}
	if (resp->getStatusCode() != drogon::k200OK)
	{
		error = url_ + " answered HTTP " + std::to_string(static_cast<int>(resp->getStatusCode()));
		return false;
	}

	Json::Value doc;
	std::string errs;
	if (!parse_json_loose(std::string(resp->body()), doc, errs))
	{
		error = "malformed JSON from " + url_ + ": " + errs;
		return false;
	}
	return parse_reading_items(doc, items, error);
}

} // namespace homepage
