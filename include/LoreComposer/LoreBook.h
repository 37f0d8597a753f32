#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LoreComposer
{
	enum class SelectiveLogic : std::uint8_t
	{
		kNone,
		kAnd,
		kNot,
	};

	enum class LorePosition : std::uint8_t
	{
		kBeforeChar,
		kAfterChar,
	};

	inline constexpr std::int32_t kMaxProbability = 100;

	struct LoreEntry
	{
		std::int64_t id{ 0 };
		std::vector<std::string> keys{};
		std::vector<std::string> secondaryKeys{};
		SelectiveLogic selectiveLogic{ SelectiveLogic::kNone };
		std::string content{};
		bool enabled{ true };
		std::int32_t insertionOrder{ 0 };
		std::int32_t priority{ 0 };
		bool caseSensitive{ false };
		bool useRegex{ false };
		bool constant{ false };
		LorePosition position{ LorePosition::kBeforeChar };
		std::int32_t probability{ kMaxProbability };
		// Injection depth and scan frequency hints. Carried for callers, not used for matching.
		std::optional<std::int32_t> depth{};
		std::optional<std::int32_t> scanFrequency{};
		std::string name{};
		std::string comment{};
	};

	struct LoreBook
	{
		std::string name{};
		std::vector<LoreEntry> entries{};
		std::optional<std::uint32_t> scanDepth{};
		std::optional<std::uint32_t> tokenBudget{};
		bool recursiveScanning{ false };
	};

	[[nodiscard]] constexpr std::optional<SelectiveLogic> ParseSelectiveLogic(std::string_view a_text) noexcept
	{
		if (a_text == "AND" || a_text == "and") {
			return SelectiveLogic::kAnd;
		}
		if (a_text == "NOT" || a_text == "not") {
			return SelectiveLogic::kNot;
		}
		if (a_text.empty()) {
			return SelectiveLogic::kNone;
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr std::string_view SelectiveLogicName(SelectiveLogic a_logic) noexcept
	{
		switch (a_logic) {
		case SelectiveLogic::kAnd:
			return "AND";
		case SelectiveLogic::kNot:
			return "NOT";
		case SelectiveLogic::kNone:
			break;
		}
		return "";
	}

	[[nodiscard]] constexpr std::optional<LorePosition> ParseLorePosition(std::string_view a_text) noexcept
	{
		if (a_text == "before_char") {
			return LorePosition::kBeforeChar;
		}
		if (a_text == "after_char") {
			return LorePosition::kAfterChar;
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr std::string_view LorePositionName(LorePosition a_position) noexcept
	{
		return a_position == LorePosition::kAfterChar ? "after_char" : "before_char";
	}

	[[nodiscard]] constexpr std::int32_t ClampProbability(std::int32_t a_probability) noexcept
	{
		if (a_probability < 0) {
			return 0;
		}
		return a_probability > kMaxProbability ? kMaxProbability : a_probability;
	}

	// Label used for prompt segments and diagnostics: "lore:<name>" or "lore:#<id>".
	[[nodiscard]] inline std::string MakeLoreSegmentName(const LoreEntry& a_entry)
	{
		if (!a_entry.name.empty()) {
			return "lore:" + a_entry.name;
		}
		return "lore:#" + std::to_string(a_entry.id);
	}
}
