#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace LoreComposer::TextUtil
{
	[[nodiscard]] constexpr bool IsAsciiWhitespace(char a_char) noexcept
	{
		return a_char == ' ' || a_char == '\t' || a_char == '\r' || a_char == '\n' || a_char == '\f' || a_char == '\v';
	}

	[[nodiscard]] constexpr std::string_view Trim(std::string_view a_text) noexcept
	{
		while (!a_text.empty() && IsAsciiWhitespace(a_text.front())) {
			a_text.remove_prefix(1);
		}
		while (!a_text.empty() && IsAsciiWhitespace(a_text.back())) {
			a_text.remove_suffix(1);
		}
		return a_text;
	}

	[[nodiscard]] constexpr bool IsUtf8Continuation(char a_char) noexcept
	{
		return (static_cast<unsigned char>(a_char) & 0xC0u) == 0x80u;
	}

	[[nodiscard]] constexpr std::size_t CountUtf8CodePoints(std::string_view a_text) noexcept
	{
		std::size_t count = 0;
		for (const char c : a_text) {
			if (!IsUtf8Continuation(c)) {
				++count;
			}
		}
		return count;
	}

	[[nodiscard]] constexpr std::size_t CountWhitespaceSeparatedWords(std::string_view a_text) noexcept
	{
		std::size_t words = 0;
		bool inWord = false;
		for (const char c : a_text) {
			if (IsAsciiWhitespace(c)) {
				inWord = false;
			} else if (!inWord) {
				inWord = true;
				++words;
			}
		}
		return words;
	}

	// Largest prefix length <= a_length that does not split a UTF-8 sequence.
	[[nodiscard]] constexpr std::size_t FloorUtf8Boundary(std::string_view a_text, std::size_t a_length) noexcept
	{
		if (a_length >= a_text.size()) {
			return a_text.size();
		}
		while (a_length > 0 && IsUtf8Continuation(a_text[a_length])) {
			--a_length;
		}
		return a_length;
	}

	[[nodiscard]] inline std::string Join(const std::vector<std::string>& a_parts, std::string_view a_separator)
	{
		std::string out;
		for (std::size_t i = 0; i < a_parts.size(); ++i) {
			if (i > 0) {
				out.append(a_separator);
			}
			out.append(a_parts[i]);
		}
		return out;
	}
}
