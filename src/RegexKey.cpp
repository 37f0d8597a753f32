#include "LoreComposer/RegexKey.h"

#include "LoreComposer/TextUtil.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace LoreComposer
{
	CompiledRegexKey::CompiledRegexKey(std::regex a_regex, std::string a_source, std::size_t a_maxWindowBytes) :
		_regex(std::move(a_regex)),
		_source(std::move(a_source)),
		_maxWindowBytes(a_maxWindowBytes)
	{}

	std::optional<CompiledRegexKey> CompiledRegexKey::Compile(
		std::string_view a_key,
		bool a_caseSensitive,
		const RegexLimits& a_limits,
		RegexKeyError& a_outError)
	{
		const auto spec = SplitRegexKey(a_key);
		a_outError = PrecheckRegexPattern(spec.pattern, a_limits);
		if (a_outError != RegexKeyError::kNone) {
			return std::nullopt;
		}

		auto flags = std::regex::ECMAScript | std::regex::optimize;
		if (!a_caseSensitive || spec.forceIgnoreCase) {
			flags |= std::regex::icase;
		}

		try {
			std::regex compiled(spec.pattern.begin(), spec.pattern.end(), flags);
			return CompiledRegexKey(std::move(compiled), std::string(a_key), a_limits.maxWindowBytes);
		} catch (const std::regex_error&) {
			a_outError = RegexKeyError::kSyntax;
			return std::nullopt;
		}
	}

	bool CompiledRegexKey::Search(std::string_view a_window) const
	{
		if (_maxWindowBytes > 0 && a_window.size() > _maxWindowBytes) {
			// Start on a code point boundary so the trimmed window stays valid UTF-8.
			auto start = a_window.size() - _maxWindowBytes;
			while (start < a_window.size() && TextUtil::IsUtf8Continuation(a_window[start])) {
				++start;
			}
			a_window.remove_prefix(start);
		}

		try {
			return std::regex_search(a_window.begin(), a_window.end(), _regex);
		} catch (const std::regex_error& e) {
			spdlog::warn(
				"LoreComposer: regex key '{}' failed during search ({}); treating as no match.",
				_source,
				e.what());
			return false;
		}
	}

	RegexKeyError CheckRegexKey(std::string_view a_key, const RegexLimits& a_limits)
	{
		RegexKeyError error = RegexKeyError::kNone;
		const auto compiled = CompiledRegexKey::Compile(a_key, true, a_limits, error);
		return compiled.has_value() ? RegexKeyError::kNone : error;
	}
}
