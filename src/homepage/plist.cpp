#include "plist.h"
#include "text_util.h"

#include <pugixml.hpp>

#include <cmath>
#include <cstdint>
#include <cstring>

namespace homepage
{

static const int kMaxDepth = 64;
// 共享引用可能让对象图指数展开，限制总访问次数
static const uint64_t kMaxVisits = 1000000;

// 2001-01-01T00:00:00Z 与 Unix 纪元之差（秒）
static const double kAppleEpochOffset = 978307200.0;

static void append_utf8(std::string& out, uint32_t cp)
{
	if (cp < 0x80)
	{
		out.push_back((char)cp);
	}
	else if (cp < 0x800)
	{
		out.push_back((char)(0xC0 | (cp >> 6)));
		out.push_back((char)(0x80 | (cp & 0x3F)));
	}
	else if (cp < 0x10000)
	{
		out.push_back((char)(0xE0 | (cp >> 12)));
		out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back((char)(0x80 | (cp & 0x3F)));
	}
	else
	{
		out.push_back((char)(0xF0 | (cp >> 18)));
		out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back((char)(0x80 | (cp & 0x3F)));
	}
}

// 0001-01-01 .. 9999-12-31，超出范围（或 NaN）的日期按缺失处理
static const double kMinUnixTime = -62135596800.0;
static const double kMaxUnixTime = 253402300799.0;

static Json::Value apple_time_to_iso(double seconds)
{
	const double unixTime = std::floor(seconds + kAppleEpochOffset);
	if (!std::isfinite(unixTime) || unixTime < kMinUnixTime || unixTime > kMaxUnixTime)
		return Json::Value(Json::nullValue);
	std::string iso = to_iso((std::time_t)unixTime);
	if (iso.empty()) return Json::Value(Json::nullValue);
	return Json::Value(iso);
}

// XML 的 <date> 统一成与二进制相同的 .000Z 格式；无法解析时原样保留
static Json::Value xml_date(const std::string& text)
{
	std::time_t t = 0;
	if (!parse_iso_utc(trim(text), t)) return Json::Value(text);
	std::string iso = to_iso(t);
	return iso.empty() ? Json::Value(text) : Json::Value(iso);
}

// ================== bplist00 ==================

class BinaryPlistReader
{
public:
	explicit BinaryPlistReader(const std::string& data) : data_(data) {}

	Json::Value read()
	{
		if (data_.size() < 8 + 32 || data_.compare(0, 8, "bplist00") != 0)
			throw PlistError("not a bplist00 document");

		const size_t t = data_.size() - 32;
		offsetSize_ = (uint8_t)data_[t + 6];
		refSize_ = (uint8_t)data_[t + 7];
		numObjects_ = be(t + 8, 8);
		const uint64_t top = be(t + 16, 8);
		tableOffset_ = be(t + 24, 8);
		objectsEnd_ = t;

		if (offsetSize_ < 1 || offsetSize_ > 8 || refSize_ < 1 || refSize_ > 8)
			throw PlistError("bad bplist trailer");
		if (numObjects_ == 0 || top >= numObjects_)
			throw PlistError("bad bplist object count");
		if (tableOffset_ < 8 || tableOffset_ > objectsEnd_ ||
			numObjects_ > (objectsEnd_ - tableOffset_) / offsetSize_)
			throw PlistError("bplist offset table out of range");

		return object(top, 0);
	}

private:
	void need(uint64_t off, uint64_t n) const
	{
		if (off > objectsEnd_ || n > objectsEnd_ - off)
			throw PlistError("bplist object out of range");
	}

	uint64_t be(size_t off, size_t n) const
	{
		uint64_t v = 0;
		for (size_t i = 0; i < n; ++i) v = (v << 8) | (uint8_t)data_[off + i];
		return v;
	}

	uint64_t offset_of(uint64_t ref) const
	{
		if (ref >= numObjects_) throw PlistError("bplist reference out of range");
		uint64_t off = be((size_t)(tableOffset_ + ref * offsetSize_), offsetSize_);
		need(off, 1);
		return off;
	}

	// 低 4 位为 0xF 时，长度放在紧随其后的 int 对象里
	uint64_t count(uint64_t& pos, uint8_t info) const
	{
		if (info != 0x0F) return info;
		need(pos, 1);
		uint8_t m = (uint8_t)data_[pos];
		if ((m >> 4) != 0x1) throw PlistError("bplist length is not an integer");
		uint64_t n = 1ull << (m & 0x0F);
		if (n > 8) throw PlistError("bplist length too wide");
		need(pos + 1, n);
		uint64_t v = be((size_t)pos + 1, (size_t)n);
		pos += 1 + n;
		return v;
	}

	double real_at(uint64_t pos, uint64_t n) const
	{
		need(pos, n);
		if (n == 4)
		{
			uint32_t bits = (uint32_t)be((size_t)pos, 4);
			float f; std::memcpy(&f, &bits, sizeof(f));
			return f;
		}
		if (n == 8)
		{
			uint64_t bits = be((size_t)pos, 8);
			double d; std::memcpy(&d, &bits, sizeof(d));
			return d;
		}
		throw PlistError("unsupported bplist real width");
	}

	std::string key_string(uint64_t ref, int depth)
	{
		Json::Value k = object(ref, depth);
		if (!k.isString()) throw PlistError("bplist dict key is not a string");
		return k.asString();
	}

	Json::Value object(uint64_t ref, int depth)
	{
		if (depth > kMaxDepth) throw PlistError("bplist nesting too deep");
		if (++visits_ > kMaxVisits) throw PlistError("bplist object graph too large");

		uint64_t pos = offset_of(ref);
		const uint8_t marker = (uint8_t)data_[pos++];
		const uint8_t type = marker >> 4;
		const uint8_t info = marker & 0x0F;

		switch (type)
		{
		case 0x0:
			if (marker == 0x08) return Json::Value(false);
			if (marker == 0x09) return Json::Value(true);
			return Json::Value(Json::nullValue);
		case 0x1:
		{
			uint64_t n = 1ull << info;
			need(pos, n);
			if (n > 8) return Json::Value((Json::UInt64)be((size_t)(pos + n - 8), 8));   // 128 位取低 64 位
			uint64_t v = be((size_t)pos, (size_t)n);
			if (n == 8) return Json::Value((Json::Int64)v);
			return Json::Value((Json::UInt64)v);
		}
		case 0x2:
			return Json::Value(real_at(pos, 1ull << info));
		case 0x3:
			return apple_time_to_iso(real_at(pos, 8));
		case 0x4:
		{
			uint64_t n = count(pos, info);
			need(pos, n);
			return Json::Value(Json::nullValue);
		}
		case 0x5:
		{
			uint64_t n = count(pos, info);
			need(pos, n);
			return Json::Value(data_.substr((size_t)pos, (size_t)n));
		}
		case 0x6:
		{
			uint64_t n = count(pos, info);
			if (n > (objectsEnd_ / 2)) throw PlistError("bplist string too long");
			need(pos, n * 2);
			std::string out; out.reserve((size_t)n);
			for (uint64_t i = 0; i < n; ++i)
			{
				uint32_t cu = (uint32_t)be((size_t)(pos + i * 2), 2);
				if (cu >= 0xD800 && cu <= 0xDBFF && i + 1 < n)
				{
					uint32_t lo = (uint32_t)be((size_t)(pos + (i + 1) * 2), 2);
					if (lo >= 0xDC00 && lo <= 0xDFFF)
					{
						append_utf8(out, 0x10000 + ((cu - 0xD800) << 10) + (lo - 0xDC00));
						++i;
						continue;
					}
				}
				append_utf8(out, cu);
			}
			return Json::Value(out);
		}
		case 0x8:
			need(pos, info + 1u);
			return Json::Value((Json::UInt64)be((size_t)pos, info + 1u));
		case 0xA:
		case 0xC:
		{
			uint64_t n = count(pos, info);
			if (n > objectsEnd_ / refSize_) throw PlistError("bplist array too long");
			need(pos, n * refSize_);
			Json::Value arr(Json::arrayValue);
			for (uint64_t i = 0; i < n; ++i)
				arr.append(object(be((size_t)(pos + i * refSize_), refSize_), depth + 1));
			return arr;
		}
		case 0xD:
		{
			uint64_t n = count(pos, info);
			if (n > objectsEnd_ / (2ull * refSize_)) throw PlistError("bplist dict too long");
			need(pos, n * 2 * refSize_);
			Json::Value obj(Json::objectValue);
			for (uint64_t i = 0; i < n; ++i)
			{
				uint64_t kref = be((size_t)(pos + i * refSize_), refSize_);
				uint64_t vref = be((size_t)(pos + (n + i) * refSize_), refSize_);
				std::string key = key_string(kref, depth + 1);
				obj[key] = object(vref, depth + 1);
			}
			return obj;
		}
		default:
			throw PlistError("unknown bplist marker " + std::to_string(marker));
		}
	}

	const std::string& data_;
	uint8_t offsetSize_{ 0 };
	uint8_t refSize_{ 0 };
	uint64_t numObjects_{ 0 };
	uint64_t tableOffset_{ 0 };
	uint64_t objectsEnd_{ 0 };
	uint64_t visits_{ 0 };
};

// ================== XML plist ==================

static Json::Value xml_value(const pugi::xml_node& node, int depth)
{
	if (depth > kMaxDepth) throw PlistError("plist nesting too deep");

	const std::string name = node.name();
	if (name == "dict")
	{
		Json::Value obj(Json::objectValue);
		std::string key;
		bool haveKey = false;
		for (pugi::xml_node c = node.first_child(); c; c = c.next_sibling())
		{
			if (c.type() != pugi::node_element) continue;
			if (!haveKey)
			{
				if (std::strcmp(c.name(), "key") != 0) throw PlistError("plist dict entry without <key>");
				key = c.text().get();
				haveKey = true;
			}
			else
			{
				obj[key] = xml_value(c, depth + 1);
				haveKey = false;
			}
		}
		if (haveKey) throw PlistError("plist dict key without value: " + key);
		return obj;
	}
	if (name == "array")
	{
		Json::Value arr(Json::arrayValue);
		for (pugi::xml_node c = node.first_child(); c; c = c.next_sibling())
			if (c.type() == pugi::node_element) arr.append(xml_value(c, depth + 1));
		return arr;
	}
	if (name == "string")
		return Json::Value(std::string(node.text().get()));
	if (name == "date")
		return xml_date(node.text().get());
	if (name == "integer")
	{
		try { return Json::Value((Json::Int64)std::stoll(trim(node.text().get()))); }
		catch (const std::exception&) { throw PlistError("bad plist integer"); }
	}
	if (name == "real")
	{
		try { return Json::Value(std::stod(trim(node.text().get()))); }
		catch (const std::exception&) { throw PlistError("bad plist real"); }
	}
	if (name == "true") return Json::Value(true);
	if (name == "false") return Json::Value(false);
	if (name == "data") return Json::Value(Json::nullValue);
	throw PlistError("unknown plist element <" + name + ">");
}

static Json::Value parse_xml_plist(const std::string& bytes)
{
	pugi::xml_document doc;
	pugi::xml_parse_result result = doc.load_buffer(bytes.data(), bytes.size());
	if (!result)
		throw PlistError(std::string("plist XML parse error: ") + result.description());

	pugi::xml_node plist = doc.child("plist");
	if (!plist) throw PlistError("missing <plist> element");

	for (pugi::xml_node c = plist.first_child(); c; c = c.next_sibling())
		if (c.type() == pugi::node_element) return xml_value(c, 0);
	throw PlistError("empty <plist>");
}

Json::Value parse_plist(const std::string& bytes)
{
	if (bytes.compare(0, 6, "bplist") == 0)
		return BinaryPlistReader(bytes).read();
	if (bytes.find("<plist") != std::string::npos)
		return parse_xml_plist(bytes);
	throw PlistError("unrecognized property list format");
}

Json::Value parse_plist_file(const std::filesystem::path& path)
{
	std::string bytes;
	if (!read_text_file(path, bytes))
		throw PlistError("cannot read " + path.string());
	return parse_plist(bytes);
}

} // namespace homepage
