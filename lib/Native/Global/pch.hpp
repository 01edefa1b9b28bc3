#pragma once

#include <boost/describe.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>

#include "nlohmann/json.hpp"
using Json = nlohmann::json;
using Ordered_Json = nlohmann::ordered_json;

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

// Enum name through boost::describe. Falls back to "<unknown>" for values
// missing from the description.
template <typename E>
	requires std::is_enum_v<E>
inline std::string EnumToString(E value)
{
	return boost::describe::enum_to_string(value, "<unknown>");
}
