#pragma once

#include "LoreComposer/LoreBook.h"

#include <cstddef>
#include <string_view>

namespace LoreComposer::detail
{
	[[nodiscard]] constexpr char ToLowerAscii(char a_char) noexcept
	{
		return (a_char >= 'A' && a_char <= 'Z') ? static_cast<char>(a_char + ('a' - 'A')) : a_char;
	}

	[[nodiscard]] constexpr bool ContainsCaseInsensitiveAscii(std::string_view a_text, std::string_view a_pattern) noexcept
	{
		if (a_pattern.empty() || a_text.size() < a_pattern.size()) {
			return false;
		}

		for (std::size_t i = 0; i + a_pattern.size() <= a_text.size(); ++i) {
			bool matched = true;
			for (std::size_t j = 0; j < a_pattern.size(); ++j) {
				if (ToLowerAscii(a_text[i + j]) != ToLowerAscii(a_pattern[j])) {
					matched = false;
					break;
				}
			}
			if (matched) {
				return true;
			}
		}

		return false;
	}

	// Literal key test. Empty keys never match.
	[[nodiscard]] constexpr bool ContainsLiteralKey(
		std::string_view a_window,
		std::string_view a_key,
		bool a_caseSensitive) noexcept
	{
		if (a_key.empty()) {
			return false;
		}
		if (a_caseSensitive) {
			return a_window.find(a_key) != std::string_view::npos;
		}
		return ContainsCaseInsensitiveAscii(a_window, a_key);
	}

	// Secondary-key gate applied after a primary key matched.
	// - no secondary keys, or kNone: the primary match alone suffices
	// - kAnd: at least one secondary key must be present
	// - kNot: no secondary key may be present
	[[nodiscard]] constexpr bool PassesSelectiveLogic(
		SelectiveLogic a_logic,
		bool a_hasSecondaryKeys,
		bool a_anySecondaryMatched) noexcept
	{
		if (!a_hasSecondaryKeys) {
			return true;
		}

		switch (a_logic) {
		case SelectiveLogic::kAnd:
			return a_anySecondaryMatched;
		case SelectiveLogic::kNot:
			return !a_anySecondaryMatched;
		case SelectiveLogic::kNone:
			break;
		}
		return true;
	}
}
