#pragma once

#include "LoreComposer/CharacterProfile.h"
#include "LoreComposer/OperationResult.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LoreComposer
{
	namespace Fields
	{
		inline constexpr std::string_view kName = "name";
		inline constexpr std::string_view kDescription = "description";
		inline constexpr std::string_view kPersonality = "personality";
		inline constexpr std::string_view kScenario = "scenario";
		inline constexpr std::string_view kFirstMes = "first_mes";
		inline constexpr std::string_view kMesExample = "mes_example";
		inline constexpr std::string_view kSystemPrompt = "system_prompt";
		inline constexpr std::string_view kPostHistoryInstructions = "post_history_instructions";
		inline constexpr std::string_view kCreatorNotes = "creator_notes";
		inline constexpr std::string_view kAlternateGreetings = "alternate_greetings";
		inline constexpr std::string_view kGroupOnlyGreetings = "group_only_greetings";

		// Card-definition order; NormalizeProfile always yields exactly these, in this order.
		inline constexpr std::array<std::string_view, 11> kCanonicalOrder{
			kName,
			kDescription,
			kPersonality,
			kScenario,
			kFirstMes,
			kMesExample,
			kSystemPrompt,
			kPostHistoryInstructions,
			kCreatorNotes,
			kAlternateGreetings,
			kGroupOnlyGreetings
		};

		inline constexpr std::string_view kGreetingSeparator = "\n\n";
	}

	struct NamedField
	{
		std::string name{};
		std::string text{};
	};

	[[nodiscard]] constexpr std::optional<std::size_t> FindCanonicalFieldIndex(std::string_view a_fieldName) noexcept
	{
		for (std::size_t i = 0; i < Fields::kCanonicalOrder.size(); ++i) {
			if (Fields::kCanonicalOrder[i] == a_fieldName) {
				return i;
			}
		}
		return std::nullopt;
	}

	[[nodiscard]] const CardData& GetCardData(const CharacterProfile& a_profile) noexcept;
	[[nodiscard]] const LoreBook* GetLoreBook(const CharacterProfile& a_profile) noexcept;

	// Fails with kInvalidProfile when the card has no usable name.
	[[nodiscard]] OperationResult NormalizeProfile(
		const CharacterProfile& a_profile,
		std::vector<NamedField>& a_outFields);

	// Returns a modified copy; a_profile is never touched. Greeting lists are replaced by a
	// single greeting (or cleared when a_value is empty).
	[[nodiscard]] OperationResult SetField(
		const CharacterProfile& a_profile,
		std::string_view a_fieldName,
		std::string a_value,
		CharacterProfile& a_outProfile);
}
