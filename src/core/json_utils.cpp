// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
//    this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

#include <kcenon/federation_gateway/core/json_utils.h>

#include <kcenon/federation_gateway/core/federation_error.h>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>

namespace federation_gateway
{

namespace
{

constexpr const char* MODULE = "json";

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t year, unsigned month, unsigned day)
{
	year -= month <= 2 ? 1 : 0;
	const int64_t era = (year >= 0 ? year : year - 399) / 400;
	const auto yoe = static_cast<unsigned>(year - era * 400);
	const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // namespace

kcenon::common::Result<Json::Value> parse_json(const std::string& text)
{
	Json::CharReaderBuilder builder;
	builder["collectComments"] = false;
	std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

	Json::Value value;
	std::string errors;
	if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors))
	{
		return make_validation_error(MODULE, "body", "invalid JSON: " + errors);
	}
	return value;
}

std::string write_json(const Json::Value& value, bool pretty)
{
	Json::StreamWriterBuilder builder;
	builder["indentation"] = pretty ? "  " : "";
	builder["commentStyle"] = "None";
	return Json::writeString(builder, value);
}

std::string format_timestamp(std::chrono::system_clock::time_point time)
{
	auto time_t = std::chrono::system_clock::to_time_t(time);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch())
			  % 1000;
	if (ms.count() < 0)
	{
		ms += std::chrono::milliseconds(1000);
	}

	std::tm tm_buf{};
	gmtime_r(&time_t, &tm_buf);

	std::ostringstream oss;
	oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
		<< std::setw(3) << ms.count() << 'Z';
	return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text)
{
	int year = 0;
	unsigned month = 0;
	unsigned day = 0;
	unsigned hour = 0;
	unsigned minute = 0;
	unsigned second = 0;
	int consumed = 0;

	if (std::sscanf(text.c_str(), "%4d-%2u-%2uT%2u:%2u:%2u%n", &year, &month, &day, &hour,
					&minute, &second, &consumed)
			!= 6
		|| consumed != 19)
	{
		return std::nullopt;
	}
	if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59
		|| second > 60)
	{
		return std::nullopt;
	}

	size_t pos = static_cast<size_t>(consumed);
	int64_t millis = 0;
	if (pos < text.size() && text[pos] == '.')
	{
		++pos;
		int digits = 0;
		while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
		{
			if (digits < 3)
			{
				millis = millis * 10 + (text[pos] - '0');
			}
			++digits;
			++pos;
		}
		if (digits == 0)
		{
			return std::nullopt;
		}
		for (; digits < 3; ++digits)
		{
			millis *= 10;
		}
	}

	if (pos + 1 != text.size() || text[pos] != 'Z')
	{
		return std::nullopt;
	}

	auto days = days_from_civil(year, month, day);
	auto seconds = days * 86400 + static_cast<int64_t>(hour) * 3600
				   + static_cast<int64_t>(minute) * 60 + second;

	return std::chrono::system_clock::time_point(
		std::chrono::duration_cast<std::chrono::system_clock::duration>(
			std::chrono::seconds(seconds) + std::chrono::milliseconds(millis)));
}

} // namespace federation_gateway
