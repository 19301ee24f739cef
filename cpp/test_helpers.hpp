#pragma once

#include <sstream>
#include <string>

#include <catch2/catch.hpp>

#include "decode_error.hpp"
#include "decode_result.hpp"
#include "matching.hpp"

// Segment and Path are std aliases, so Catch cannot reach their inserters.
namespace Catch
{
	template<>
	struct StringMaker<Segment>
	{
		static std::string convert(const Segment& segment)
		{
			std::ostringstream o;
			::operator<<(o, segment);
			return o.str();
		}
	};

	template<>
	struct StringMaker<Path>
	{
		static std::string convert(const Path& path)
		{
			return format_path(path);
		}
	};
}

#define OK(T, result, expected_value) \
	match(result, \
		[&](T&& actual){ \
			CHECK(actual == expected_value); \
		}, \
		[&](DecodeError&& actual_error){ \
			CAPTURE(actual_error); \
			CHECK(false); \
		})

#define FAILS(T, result, expected_error) \
	match(result, \
		[&](T&& actual){ \
			CAPTURE(actual); \
			CHECK(false); \
		}, \
		[&](DecodeError&& actual_error){ \
			CHECK(actual_error == expected_error); \
		})
