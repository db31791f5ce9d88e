#pragma once

#include <json/json.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace homepage
{

class PlistError : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};

// 属性列表 -> Json::Value
//   dict -> object, array/set -> array, string -> string, integer -> Int64,
//   real -> double, bool -> bool, date -> "YYYY-MM-DDTHH:MM:SS.000Z"（越界为 null）,
//   data -> null
// 支持 XML 形式和二进制 bplist00；结构错误抛 PlistError
Json::Value parse_plist(const std::string& bytes);
Json::Value parse_plist_file(const std::filesystem::path& path);

} // namespace homepage
