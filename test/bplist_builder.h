#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace homepage::test
{

// 测试用的最小 bplist00 编码器：1 字节引用、2 字节偏移
class BplistBuilder
{
public:
	using Ref = size_t;

	Ref ascii(const std::string& s)
	{
		std::string b = marker(0x5, s.size());
		b += s;
		return add(b);
	}

	Ref utf16(const std::u16string& s)
	{
		std::string b = marker(0x6, s.size());
		for (char16_t c : s)
		{
			b.push_back((char)((c >> 8) & 0xFF));
			b.push_back((char)(c & 0xFF));
		}
		return add(b);
	}

	Ref integer(uint8_t v)
	{
		std::string b;
		b.push_back((char)0x10);
		b.push_back((char)v);
		return add(b);
	}

	Ref boolean(bool v) { return add(std::string(1, (char)(v ? 0x09 : 0x08))); }

	// 相对 2001-01-01 的秒数
	Ref date(double seconds)
	{
		std::string b(1, (char)0x33);
		uint64_t bits; std::memcpy(&bits, &seconds, sizeof(bits));
		for (int i = 7; i >= 0; --i) b.push_back((char)((bits >> (i * 8)) & 0xFF));
		return add(b);
	}

	Ref array(const std::vector<Ref>& refs)
	{
		std::string b = marker(0xA, refs.size());
		for (Ref r : refs) b.push_back((char)r);
		return add(b);
	}

	Ref dict(const std::vector<std::pair<Ref, Ref>>& kv)
	{
		std::string b = marker(0xD, kv.size());
		for (auto& p : kv) b.push_back((char)p.first);
		for (auto& p : kv) b.push_back((char)p.second);
		return add(b);
	}

	// 先占位，之后用 set_array 回填（用来造自引用）
	Ref placeholder() { return add(std::string()); }
	void set_array(Ref at, const std::vector<Ref>& refs)
	{
		std::string b = marker(0xA, refs.size());
		for (Ref r : refs) b.push_back((char)r);
		objects_[at] = b;
	}

	std::string build(Ref top) const
	{
		std::string out = "bplist00";
		std::vector<size_t> offsets;
		for (const auto& o : objects_)
		{
			offsets.push_back(out.size());
			out += o;
		}
		const uint64_t tableOffset = out.size();
		for (size_t off : offsets)
		{
			out.push_back((char)((off >> 8) & 0xFF));
			out.push_back((char)(off & 0xFF));
		}
		std::string trailer(6, '\0');
		trailer.push_back((char)2);   // offset int size
		trailer.push_back((char)1);   // object ref size
		append_be64(trailer, objects_.size());
		append_be64(trailer, top);
		append_be64(trailer, tableOffset);
		return out + trailer;
	}

private:
	static std::string marker(uint8_t type, size_t count)
	{
		std::string b;
		if (count < 15)
		{
			b.push_back((char)((type << 4) | count));
		}
		else
		{
			b.push_back((char)((type << 4) | 0x0F));
			b.push_back((char)0x10);
			b.push_back((char)count);
		}
		return b;
	}

	static void append_be64(std::string& s, uint64_t v)
	{
		for (int i = 7; i >= 0; --i) s.push_back((char)((v >> (i * 8)) & 0xFF));
	}

	Ref add(const std::string& bytes)
	{
		objects_.push_back(bytes);
		return objects_.size() - 1;
	}

	std::vector<std::string> objects_;
};

} // namespace homepage::test
