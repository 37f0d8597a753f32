#pragma once

#include "LoreComposer/LoreBook.h"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace LoreComposer
{
	inline constexpr std::string_view kSpecTagV2 = "chara_card_v2";
	inline constexpr std::string_view kSpecTagV3 = "chara_card_v3";

	// Card fields shared by every supported layout. Text fields are optional so that a
	// missing field stays distinguishable from an empty one until normalization.
	struct CardData
	{
		std::optional<std::string> name{};
		std::optional<std::string> description{};
		std::optional<std::string> personality{};
		std::optional<std::string> scenario{};
		std::optional<std::string> firstMes{};
		std::optional<std::string> mesExample{};
		std::optional<std::string> systemPrompt{};
		std::optional<std::string> postHistoryInstructions{};
		std::optional<std::string> creatorNotes{};
		std::vector<std::string> alternateGreetings{};
		std::vector<std::string> groupOnlyGreetings{};
		std::vector<std::string> tags{};
		std::string creator{};
		std::string characterVersion{};
		std::optional<LoreBook> characterBook{};
	};

	// Flat v2 layout: every field at the top level, no spec tag.
	struct LegacyCard
	{
		CardData data{};
	};

	// Spec-tagged wrapper holding a nested data object (chara_card_v2 or chara_card_v3).
	struct TaggedCard
	{
		std::string spec{ kSpecTagV3 };
		std::string specVersion{ "3.0" };
		CardData data{};
	};

	using CharacterProfile = std::variant<LegacyCard, TaggedCard>;

	[[nodiscard]] constexpr bool IsSupportedSpecTag(std::string_view a_spec) noexcept
	{
		return a_spec == kSpecTagV2 || a_spec == kSpecTagV3;
	}
}
