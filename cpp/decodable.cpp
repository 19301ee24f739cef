#include <cmath>
#include <limits>
#include <sstream>

#include "decodable.hpp"
#include "matching.hpp"

auto describe(const Number& num) -> std::string
{
	std::ostringstream o;
	o << "number " << num;
	return o.str();
}

auto decode_integer(const Value& value) -> Result<Number>
{
	return flat_map(as_number(value), [](Number&& num){
		return match(num.value,
			[&](double d){
				if (not std::isfinite(d) or std::trunc(d) != d)
				{
					return err<Number>(type_mismatch("integer", describe(num)));
				}
				// 2^63 and 2^64: both bounds are exact doubles.
				constexpr auto long_end = static_cast<double>(std::numeric_limits<long>::max());
				constexpr auto unsigned_end = static_cast<double>(std::numeric_limits<unsigned long>::max());
				if (d >= -long_end and d < long_end) return ok(Number{static_cast<long>(d)});
				if (d >= 0 and d < unsigned_end) return ok(Number{static_cast<unsigned long>(d)});
				return ok(num);
			},
			[&](auto){
				return ok(num);
			});
	});
}

auto decode_real(const Value& value) -> Result<double>
{
	return map_result(as_number(value), [](Number&& num){
		return match(num.value,
			[](auto n){
				return static_cast<double>(n);
			});
	});
}

auto out_of_range(std::string expected, const Number& num) -> DecodeError
{
	return type_mismatch(std::move(expected), describe(num));
}

auto Decoder<bool>::decode(const Value& value) -> Result<bool>
{
	return as_bool(value);
}

auto Decoder<std::string>::decode(const Value& value) -> Result<std::string>
{
	return map_result(as_string(value), [](const std::string& s){
		return s;
	});
}
