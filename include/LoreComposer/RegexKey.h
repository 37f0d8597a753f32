#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace LoreComposer
{
	// Bounds applied to user-supplied regex keys. std::regex backtracks, so evaluation time is
	// kept in check by refusing pattern shapes with super-linear blowup and by capping the
	// amount of window text a single search may touch.
	// libstdc++ matches repetitions recursively, one or more frames per consumed character, so
	// the window cap is also what bounds stack depth.
	struct RegexLimits
	{
		std::size_t maxPatternLength{ 512 };
		std::size_t maxWindowBytes{ 4 * 1024 };
	};

	enum class RegexKeyError : std::uint8_t
	{
		kNone = 0,
		kEmpty,
		kTooLong,
		kBackreference,
		kNestedQuantifier,
		kRepeatedAlternation,
		kSyntax,
	};

	[[nodiscard]] constexpr std::string_view RegexKeyErrorName(RegexKeyError a_error) noexcept
	{
		switch (a_error) {
		case RegexKeyError::kNone:
			return "none";
		case RegexKeyError::kEmpty:
			return "empty pattern";
		case RegexKeyError::kTooLong:
			return "pattern too long";
		case RegexKeyError::kBackreference:
			return "backreferences are not allowed";
		case RegexKeyError::kNestedQuantifier:
			return "nested quantifiers are not allowed";
		case RegexKeyError::kRepeatedAlternation:
			return "repeated alternation is not allowed";
		case RegexKeyError::kSyntax:
			return "syntax error";
		}
		return "unknown";
	}

	struct RegexKeySpec
	{
		std::string_view pattern{};
		bool forceIgnoreCase{ false };
	};

	// Accepts a bare pattern or the "/pattern/flags" lorebook form. Only the 'i' flag has an
	// effect; other flags are ignored.
	[[nodiscard]] constexpr RegexKeySpec SplitRegexKey(std::string_view a_key) noexcept
	{
		if (a_key.size() >= 2 && a_key.front() == '/') {
			const auto close = a_key.rfind('/');
			if (close != std::string_view::npos && close > 0) {
				const auto flags = a_key.substr(close + 1);
				bool onlyLetters = true;
				for (const char c : flags) {
					if (c < 'a' || c > 'z') {
						onlyLetters = false;
						break;
					}
				}
				if (onlyLetters) {
					return RegexKeySpec{
						.pattern = a_key.substr(1, close - 1),
						.forceIgnoreCase = flags.find('i') != std::string_view::npos
					};
				}
			}
		}
		return RegexKeySpec{ .pattern = a_key, .forceIgnoreCase = false };
	}

	namespace detail
	{
		[[nodiscard]] constexpr bool IsAsciiDigit(char a_char) noexcept
		{
			return a_char >= '0' && a_char <= '9';
		}

		[[nodiscard]] constexpr bool HasRegexBackreference(std::string_view a_pattern) noexcept
		{
			bool inClass = false;
			for (std::size_t i = 0; i < a_pattern.size(); ++i) {
				const char c = a_pattern[i];
				if (c == '\\') {
					if (i + 1 < a_pattern.size()) {
						const char next = a_pattern[i + 1];
						if (!inClass && ((next >= '1' && next <= '9') || next == 'k')) {
							return true;
						}
					}
					++i;
					continue;
				}
				if (c == '[') {
					inClass = true;
				} else if (c == ']') {
					inClass = false;
				}
			}
			return false;
		}

		// Unbounded repetition token at a_pos: '*', '+' or "{n,}".
		[[nodiscard]] constexpr bool IsUnboundedQuantifierAt(std::string_view a_pattern, std::size_t a_pos) noexcept
		{
			if (a_pos >= a_pattern.size()) {
				return false;
			}
			const char c = a_pattern[a_pos];
			if (c == '*' || c == '+') {
				return true;
			}
			if (c != '{') {
				return false;
			}

			std::size_t i = a_pos + 1;
			bool sawDigit = false;
			while (i < a_pattern.size() && IsAsciiDigit(a_pattern[i])) {
				sawDigit = true;
				++i;
			}
			if (!sawDigit || i >= a_pattern.size() || a_pattern[i] != ',') {
				return false;
			}
			++i;
			return i < a_pattern.size() && a_pattern[i] == '}';
		}

		[[nodiscard]] constexpr bool IsQuantifierAt(std::string_view a_pattern, std::size_t a_pos) noexcept
		{
			if (a_pos >= a_pattern.size()) {
				return false;
			}
			const char c = a_pattern[a_pos];
			return c == '*' || c == '+' || c == '?' || (c == '{' && a_pos + 1 < a_pattern.size() && IsAsciiDigit(a_pattern[a_pos + 1]));
		}

		// Flags a group that contains a repetition and is itself repeated without bound,
		// e.g. "(a+)+", "(\\w*)*", "((ab)+){2,}". Too-deep nesting is reported as nested too.
		[[nodiscard]] constexpr bool HasNestedQuantifier(std::string_view a_pattern) noexcept
		{
			constexpr std::size_t kMaxDepth = 32;
			std::array<bool, kMaxDepth> groupHasQuantifier{};
			std::size_t depth = 0;
			bool inClass = false;

			for (std::size_t i = 0; i < a_pattern.size(); ++i) {
				const char c = a_pattern[i];
				if (c == '\\') {
					++i;
					if (depth > 0 && IsQuantifierAt(a_pattern, i + 1)) {
						groupHasQuantifier[depth - 1] = true;
					}
					continue;
				}
				if (inClass) {
					if (c == ']') {
						inClass = false;
						if (depth > 0 && IsQuantifierAt(a_pattern, i + 1)) {
							groupHasQuantifier[depth - 1] = true;
						}
					}
					continue;
				}

				if (c == '[') {
					inClass = true;
					continue;
				}
				if (c == '(') {
					if (depth >= kMaxDepth) {
						return true;
					}
					groupHasQuantifier[depth] = false;
					++depth;
					continue;
				}
				if (c == ')') {
					if (depth == 0) {
						continue;
					}
					--depth;
					const bool innerRepeats = groupHasQuantifier[depth];
					if (innerRepeats && IsUnboundedQuantifierAt(a_pattern, i + 1)) {
						return true;
					}
					if (depth > 0 && (innerRepeats || IsQuantifierAt(a_pattern, i + 1))) {
						groupHasQuantifier[depth - 1] = true;
					}
					continue;
				}
				if (depth > 0 && (c == '*' || c == '+' || c == '{')) {
					groupHasQuantifier[depth - 1] = true;
				}
			}
			return false;
		}

		// Flags a group holding an alternation that is repeated by anything other than '?',
		// e.g. "(x|y)*", "(a|aa)+", "((a|b)c){2}". Such keys backtrack exponentially when the
		// branches overlap and recurse once per repetition otherwise.
		[[nodiscard]] constexpr bool HasRepeatedAlternation(std::string_view a_pattern) noexcept
		{
			constexpr std::size_t kMaxDepth = 32;
			std::array<bool, kMaxDepth> groupHasAlternation{};
			std::size_t depth = 0;
			bool inClass = false;

			for (std::size_t i = 0; i < a_pattern.size(); ++i) {
				const char c = a_pattern[i];
				if (c == '\\') {
					++i;
					continue;
				}
				if (inClass) {
					if (c == ']') {
						inClass = false;
					}
					continue;
				}

				if (c == '[') {
					inClass = true;
				} else if (c == '(') {
					if (depth >= kMaxDepth) {
						return true;
					}
					groupHasAlternation[depth] = false;
					++depth;
				} else if (c == ')') {
					if (depth == 0) {
						continue;
					}
					--depth;
					if (!groupHasAlternation[depth]) {
						continue;
					}
					if (IsQuantifierAt(a_pattern, i + 1) && a_pattern[i + 1] != '?') {
						return true;
					}
					if (depth > 0) {
						groupHasAlternation[depth - 1] = true;
					}
				} else if (c == '|' && depth > 0) {
					groupHasAlternation[depth - 1] = true;
				}
			}
			return false;
		}
	}

	// Structural check only; does not compile the pattern.
	[[nodiscard]] constexpr RegexKeyError PrecheckRegexPattern(std::string_view a_pattern, const RegexLimits& a_limits) noexcept
	{
		if (a_pattern.empty()) {
			return RegexKeyError::kEmpty;
		}
		if (a_limits.maxPatternLength > 0 && a_pattern.size() > a_limits.maxPatternLength) {
			return RegexKeyError::kTooLong;
		}
		if (detail::HasRegexBackreference(a_pattern)) {
			return RegexKeyError::kBackreference;
		}
		if (detail::HasNestedQuantifier(a_pattern)) {
			return RegexKeyError::kNestedQuantifier;
		}
		if (detail::HasRepeatedAlternation(a_pattern)) {
			return RegexKeyError::kRepeatedAlternation;
		}
		return RegexKeyError::kNone;
	}

	class CompiledRegexKey
	{
	public:
		// Returns nullopt and sets a_outError when the key is rejected or fails to compile.
		[[nodiscard]] static std::optional<CompiledRegexKey> Compile(
			std::string_view a_key,
			bool a_caseSensitive,
			const RegexLimits& a_limits,
			RegexKeyError& a_outError);

		// Searches the trailing maxWindowBytes of a_window. A runtime regex failure counts as
		// no match and is logged.
		[[nodiscard]] bool Search(std::string_view a_window) const;

	private:
		CompiledRegexKey(std::regex a_regex, std::string a_source, std::size_t a_maxWindowBytes);

		std::regex _regex;
		std::string _source;
		std::size_t _maxWindowBytes{ 0 };
	};

	// Full check used by validation: structural precheck plus compilation.
	[[nodiscard]] RegexKeyError CheckRegexKey(std::string_view a_key, const RegexLimits& a_limits);
}
